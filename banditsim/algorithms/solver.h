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

#ifndef BANDITSIM_ALGORITHMS_SOLVER_H_
#define BANDITSIM_ALGORITHMS_SOLVER_H_

#include <memory>
#include <string>
#include <vector>

#include "banditsim/algorithms/bandits.h"
#include "banditsim/environment.h"

namespace banditsim {
namespace algorithms {

// Runs a policy against an environment and records what happened.
//
// After any number of completed steps
//   actions().size() == regrets().size() == sum(pull_counts()).
// The regret of a step is `best_probability - success_probability(k)` for
// the pulled arm `k`, so regrets() never decreases.
class Solver {
 public:
  // The environment is not owned and must outlive the solver. The policy
  // must have as many arms as the environment.
  Solver(const BernoulliEnvironment* environment,
         std::unique_ptr<Policy> policy);

  // Performs `num_steps` steps. A negative value is fatal and leaves the
  // solver untouched.
  void Run(int num_steps);

  // Forget all steps and reset the policy.
  void Reset();

  const BernoulliEnvironment& environment() const { return *environment_; }
  const Policy& policy() const { return *policy_; }
  Policy* mutable_policy() { return policy_.get(); }

  const std::vector<int>& pull_counts() const { return pull_counts_; }
  double cumulative_regret() const { return cumulative_regret_; }
  const std::vector<int>& actions() const { return actions_; }
  const std::vector<double>& regrets() const { return regrets_; }
  int num_steps() const { return static_cast<int>(actions_.size()); }

 private:
  void UpdateRegret(int arm);

  const BernoulliEnvironment* environment_;
  std::unique_ptr<Policy> policy_;
  std::vector<int> pull_counts_;
  double cumulative_regret_ = 0.;
  std::vector<int> actions_;
  std::vector<double> regrets_;
};

}  // namespace algorithms
}  // namespace banditsim

#endif  // BANDITSIM_ALGORITHMS_SOLVER_H_
