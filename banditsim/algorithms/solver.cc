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

#include "banditsim/algorithms/solver.h"

#include <algorithm>
#include <utility>

#include "banditsim/banditsim_utils.h"

namespace banditsim {
namespace algorithms {

Solver::Solver(const BernoulliEnvironment* environment,
               std::unique_ptr<Policy> policy)
    : environment_(environment), policy_(std::move(policy)) {
  BANDITSIM_CHECK_TRUE(environment_ != nullptr);
  BANDITSIM_CHECK_TRUE(policy_ != nullptr);
  BANDITSIM_CHECK_EQ(policy_->num_arms(), environment_->num_arms());
  pull_counts_.assign(environment_->num_arms(), 0);
}

void Solver::Run(int num_steps) {
  BANDITSIM_CHECK_GE(num_steps, 0);
  for (int step = 0; step < num_steps; ++step) {
    const int arm = policy_->RunOneStep(*environment_, pull_counts_);
    BANDITSIM_DCHECK_GE(arm, 0);
    BANDITSIM_DCHECK_LT(arm, environment_->num_arms());
    ++pull_counts_[arm];
    actions_.push_back(arm);
    UpdateRegret(arm);
  }
}

void Solver::UpdateRegret(int arm) {
  cumulative_regret_ += environment_->best_probability() -
                        environment_->success_probability(arm);
  regrets_.push_back(cumulative_regret_);
}

void Solver::Reset() {
  std::fill(pull_counts_.begin(), pull_counts_.end(), 0);
  cumulative_regret_ = 0.;
  actions_.clear();
  regrets_.clear();
  policy_->Reset();
}

}  // namespace algorithms
}  // namespace banditsim
