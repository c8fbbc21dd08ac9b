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

#include "banditsim/environment.h"

#include <utility>

#include "absl/random/distributions.h"

namespace banditsim {

BernoulliEnvironment::BernoulliEnvironment(int num_arms, std::mt19937* rng)
    : rng_(rng) {
  BANDITSIM_CHECK_GT(num_arms, 0);
  BANDITSIM_CHECK_TRUE(rng_ != nullptr);
  success_probabilities_.reserve(num_arms);
  for (int i = 0; i < num_arms; ++i) {
    success_probabilities_.push_back(absl::Uniform(*rng_, 0., 1.));
  }
  CacheBestArm();
}

BernoulliEnvironment::BernoulliEnvironment(
    std::vector<double> success_probabilities, std::mt19937* rng)
    : success_probabilities_(std::move(success_probabilities)), rng_(rng) {
  BANDITSIM_CHECK_FALSE(success_probabilities_.empty());
  BANDITSIM_CHECK_TRUE(rng_ != nullptr);
  for (double probability : success_probabilities_) {
    BANDITSIM_CHECK_GE(probability, 0.);
    BANDITSIM_CHECK_LE(probability, 1.);
  }
  CacheBestArm();
}

void BernoulliEnvironment::CacheBestArm() {
  // Strict comparison keeps the lowest index among equal probabilities.
  best_arm_ = 0;
  for (int i = 1; i < num_arms(); ++i) {
    if (success_probabilities_[i] > success_probabilities_[best_arm_]) {
      best_arm_ = i;
    }
  }
  best_probability_ = success_probabilities_[best_arm_];
}

int BernoulliEnvironment::Step(int arm) const {
  BANDITSIM_DCHECK_GE(arm, 0);
  BANDITSIM_DCHECK_LT(arm, num_arms());
  return absl::Uniform(*rng_, 0., 1.) < success_probabilities_[arm] ? 1 : 0;
}

}  // namespace banditsim
