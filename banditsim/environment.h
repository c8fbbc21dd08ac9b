// Copyright 2019 DeepMind Technologies Ltd. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BANDITSIM_ENVIRONMENT_H_
#define BANDITSIM_ENVIRONMENT_H_

#include <random>
#include <vector>

#include "banditsim/banditsim_utils.h"

// A stationary Bernoulli multi-armed bandit.
//
// Each of the `K` arms pays a reward of 1 with a fixed success probability
// and 0 otherwise. The probabilities are set once at construction and never
// change. They are hidden from the policies: a policy only ever sees the
// rewards returned by Step(). The solver reads them to account for regret.

namespace banditsim {

class BernoulliEnvironment {
 public:
  // Draws `num_arms` success probabilities uniformly from [0, 1) using `rng`.
  // The same engine is then used to draw the rewards of Step(). The engine
  // is not owned and must outlive the environment.
  BernoulliEnvironment(int num_arms, std::mt19937* rng);

  // Uses the given success probabilities. Every value must lie in [0, 1].
  BernoulliEnvironment(std::vector<double> success_probabilities,
                       std::mt19937* rng);

  // Pulls arm `arm` and returns the reward, 1 or 0.
  int Step(int arm) const;

  int num_arms() const {
    return static_cast<int>(success_probabilities_.size());
  }
  int best_arm() const { return best_arm_; }
  double best_probability() const { return best_probability_; }
  double success_probability(int arm) const {
    BANDITSIM_DCHECK_GE(arm, 0);
    BANDITSIM_DCHECK_LT(arm, num_arms());
    return success_probabilities_[arm];
  }
  const std::vector<double>& success_probabilities() const {
    return success_probabilities_;
  }

 private:
  void CacheBestArm();

  std::vector<double> success_probabilities_;
  int best_arm_ = 0;
  double best_probability_ = 0.;
  std::mt19937* rng_;
};

}  // namespace banditsim

#endif  // BANDITSIM_ENVIRONMENT_H_
