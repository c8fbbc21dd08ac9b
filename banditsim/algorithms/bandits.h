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

#ifndef BANDITSIM_ALGORITHMS_BANDITS_H_
#define BANDITSIM_ALGORITHMS_BANDITS_H_

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "banditsim/banditsim_utils.h"
#include "banditsim/environment.h"

// This file contains the action-selection policies of the stochastic
// Bernoulli bandit.
//
// At each time `t` a policy with `K` arms
//
// 1. chooses an arm `k_t` from the statistics it has accumulated so far,
// 2. pulls `k_t` on the environment exactly once and observes the reward
//    `r_t ∈ {0, 1}`,
// 3. updates its statistics of `k_t` from `r_t`.
//
// The policy is owned by a Solver (see solver.h), which keeps the pull
// counts of all arms and accounts for the regret of every choice.

namespace banditsim {
namespace algorithms {

class Policy {
 protected:
  const int num_arms_;
 public:
  explicit Policy(int num_arms) : num_arms_(num_arms) {
    BANDITSIM_CHECK_GT(num_arms_, 0);
  }
  virtual ~Policy() = default;
  // Return the positive number of arms available to the policy.
  int num_arms() const { return num_arms_; }

  // Choose an arm, pull it on `environment` and learn from the reward.
  // Returns the pulled arm.
  //
  // `pull_counts` holds the number of times each arm was pulled before this
  // step. The caller increments the count of the returned arm afterwards, so
  // the updates below see the count of the arm before the current pull.
  virtual int RunOneStep(const BernoulliEnvironment& environment,
                         absl::Span<const int> pull_counts) = 0;

  // Reset the policy to the same state as when it was constructed.
  virtual void Reset() = 0;

  // Short human-readable description, e.g. for experiment reports.
  virtual std::string ToString() const = 0;
};

// Picks a uniformly random arm with probability `epsilon` and the arm with
// the highest reward estimate otherwise.
class EpsilonGreedy final : public Policy {
  std::vector<double> reward_estimates_;
  const double initial_estimate_;
  const double epsilon_;
  std::mt19937* rng_;
 public:
  EpsilonGreedy(int num_arms, double epsilon, std::mt19937* rng,
                double initial_estimate = 1.);

  int RunOneStep(const BernoulliEnvironment& environment,
                 absl::Span<const int> pull_counts) override;
  void Reset() override;
  std::string ToString() const override;

  double epsilon() const { return epsilon_; }
  const std::vector<double>& reward_estimates() const {
    return reward_estimates_;
  }
  // Overwrites the current estimates. Reset() goes back to the initial
  // estimate of the constructor.
  void set_reward_estimates(std::vector<double> reward_estimates);
};

// Epsilon-greedy whose exploration probability at step `t` is `1 / t`.
// The first step always explores.
class DecayingEpsilonGreedy final : public Policy {
  std::vector<double> reward_estimates_;
  const double initial_estimate_;
  int64_t total_steps_ = 0;
  std::mt19937* rng_;
 public:
  DecayingEpsilonGreedy(int num_arms, std::mt19937* rng,
                        double initial_estimate = 1.);

  int RunOneStep(const BernoulliEnvironment& environment,
                 absl::Span<const int> pull_counts) override;
  void Reset() override;
  std::string ToString() const override;

  int64_t total_steps() const { return total_steps_; }
  // The exploration probability the next call of RunOneStep() will use.
  double next_epsilon() const { return 1. / (total_steps_ + 1); }
  const std::vector<double>& reward_estimates() const {
    return reward_estimates_;
  }
  void set_reward_estimates(std::vector<double> reward_estimates);
};

// UCB with the bonus `c * sqrt(ln(t) / (2 * (n_i + 1)))`, see
// UpperConfidenceBound() below.
//
// Finite-time Analysis of the Multiarmed Bandit Problem
// Peter Auer, Nicolò Cesa-Bianchi, Paul Fischer
// https://link.springer.com/article/10.1023/A:1013689704352
class UpperConfidenceBounds final : public Policy {
  std::vector<double> reward_estimates_;
  const double initial_estimate_;
  const double exploration_coefficient_;
  int64_t total_steps_ = 0;
 public:
  UpperConfidenceBounds(int num_arms, double exploration_coefficient,
                        double initial_estimate = 1.);

  int RunOneStep(const BernoulliEnvironment& environment,
                 absl::Span<const int> pull_counts) override;
  void Reset() override;
  std::string ToString() const override;

  int64_t total_steps() const { return total_steps_; }
  double exploration_coefficient() const { return exploration_coefficient_; }
  const std::vector<double>& reward_estimates() const {
    return reward_estimates_;
  }
};

// Thompson sampling with a Beta(1, 1) prior on every arm.
//
// On the Likelihood that One Unknown Probability Exceeds Another in View of
// the Evidence of Two Samples
// William R. Thompson
// https://www.jstor.org/stable/2332286
class ThompsonSampling final : public Policy {
  std::vector<double> alpha_params_;
  std::vector<double> beta_params_;
  std::mt19937* rng_;
 public:
  ThompsonSampling(int num_arms, std::mt19937* rng);

  int RunOneStep(const BernoulliEnvironment& environment,
                 absl::Span<const int> pull_counts) override;
  void Reset() override;
  std::string ToString() const override;

  const std::vector<double>& alpha_params() const { return alpha_params_; }
  const std::vector<double>& beta_params() const { return beta_params_; }
};

// -- Numeric helpers shared by the policies ----------------------------------

// Index of the largest value. Ties resolve to the lowest index.
int ArgMax(absl::Span<const double> values);

// Sample mean of `previous_count + 1` rewards, given the mean `estimate` of
// the first `previous_count` ones and the newest `reward`.
double IncrementalMean(double estimate, double reward, int previous_count);

// `estimate + exploration_coefficient * sqrt(ln(total_steps) /
//                                            (2 * (pull_count + 1)))`
double UpperConfidenceBound(double estimate, double exploration_coefficient,
                            int64_t total_steps, int pull_count);

// One draw from Beta(alpha, beta).
double SampleBeta(double alpha, double beta, std::mt19937* rng);

// -- Construction by name ----------------------------------------------------

struct PolicyParameters {
  // Exploration probability of "epsilon_greedy".
  double epsilon = 0.01;
  // Initial reward estimate of the epsilon-greedy policies and UCB.
  double initial_estimate = 1.;
  // The constant `c` of "ucb".
  double exploration_coefficient = 1.;
};

// Names accepted by MakePolicy().
std::vector<std::string> PolicyNames();

// Creates the policy registered under `name`. Unknown names are fatal.
std::unique_ptr<Policy> MakePolicy(absl::string_view name, int num_arms,
                                   const PolicyParameters& params,
                                   std::mt19937* rng);

}  // namespace algorithms
}  // namespace banditsim

#endif  // BANDITSIM_ALGORITHMS_BANDITS_H_
