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

#include "banditsim/algorithms/bandits.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include "absl/random/distributions.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace banditsim {
namespace algorithms {
namespace {

// Explores with probability `epsilon`, exploits otherwise. No random number
// is drawn when `epsilon` is zero.
int SelectEpsilonGreedy(absl::Span<const double> reward_estimates,
                        double epsilon, std::mt19937* rng) {
  if (epsilon > 0. && absl::Uniform(*rng, 0., 1.) < epsilon) {
    return absl::Uniform(*rng, 0, static_cast<int>(reward_estimates.size()));
  }
  return ArgMax(reward_estimates);
}

void CheckEstimates(const std::vector<double>& reward_estimates,
                    int num_arms) {
  BANDITSIM_CHECK_EQ(reward_estimates.size(),
                     static_cast<size_t>(num_arms));
}

}  // namespace

// -- EpsilonGreedy ------------------------------------------------------------

EpsilonGreedy::EpsilonGreedy(int num_arms, double epsilon, std::mt19937* rng,
                             double initial_estimate)
    : Policy(num_arms),
      reward_estimates_(num_arms, initial_estimate),
      initial_estimate_(initial_estimate),
      epsilon_(epsilon),
      rng_(rng) {
  BANDITSIM_CHECK_GE(epsilon_, 0.);
  BANDITSIM_CHECK_LE(epsilon_, 1.);
  BANDITSIM_CHECK_TRUE(std::isfinite(initial_estimate_));
  BANDITSIM_CHECK_TRUE(rng_ != nullptr);
}

int EpsilonGreedy::RunOneStep(const BernoulliEnvironment& environment,
                              absl::Span<const int> pull_counts) {
  const int arm = SelectEpsilonGreedy(reward_estimates_, epsilon_, rng_);
  const int reward = environment.Step(arm);
  reward_estimates_[arm] =
      IncrementalMean(reward_estimates_[arm], reward, pull_counts[arm]);
  return arm;
}

void EpsilonGreedy::Reset() {
  std::fill(reward_estimates_.begin(), reward_estimates_.end(),
            initial_estimate_);
}

std::string EpsilonGreedy::ToString() const {
  return absl::StrCat("EpsilonGreedy(epsilon=", epsilon_, ")");
}

void EpsilonGreedy::set_reward_estimates(
    std::vector<double> reward_estimates) {
  CheckEstimates(reward_estimates, num_arms_);
  reward_estimates_ = std::move(reward_estimates);
}

// -- DecayingEpsilonGreedy ----------------------------------------------------

DecayingEpsilonGreedy::DecayingEpsilonGreedy(int num_arms, std::mt19937* rng,
                                             double initial_estimate)
    : Policy(num_arms),
      reward_estimates_(num_arms, initial_estimate),
      initial_estimate_(initial_estimate),
      rng_(rng) {
  BANDITSIM_CHECK_TRUE(std::isfinite(initial_estimate_));
  BANDITSIM_CHECK_TRUE(rng_ != nullptr);
}

int DecayingEpsilonGreedy::RunOneStep(const BernoulliEnvironment& environment,
                                      absl::Span<const int> pull_counts) {
  ++total_steps_;
  const int arm =
      SelectEpsilonGreedy(reward_estimates_, 1. / total_steps_, rng_);
  const int reward = environment.Step(arm);
  reward_estimates_[arm] =
      IncrementalMean(reward_estimates_[arm], reward, pull_counts[arm]);
  return arm;
}

void DecayingEpsilonGreedy::Reset() {
  std::fill(reward_estimates_.begin(), reward_estimates_.end(),
            initial_estimate_);
  total_steps_ = 0;
}

std::string DecayingEpsilonGreedy::ToString() const {
  return "DecayingEpsilonGreedy";
}

void DecayingEpsilonGreedy::set_reward_estimates(
    std::vector<double> reward_estimates) {
  CheckEstimates(reward_estimates, num_arms_);
  reward_estimates_ = std::move(reward_estimates);
}

// -- UpperConfidenceBounds ----------------------------------------------------

UpperConfidenceBounds::UpperConfidenceBounds(int num_arms,
                                             double exploration_coefficient,
                                             double initial_estimate)
    : Policy(num_arms),
      reward_estimates_(num_arms, initial_estimate),
      initial_estimate_(initial_estimate),
      exploration_coefficient_(exploration_coefficient) {
  BANDITSIM_CHECK_GE(exploration_coefficient_, 0.);
  BANDITSIM_CHECK_TRUE(std::isfinite(exploration_coefficient_));
  BANDITSIM_CHECK_TRUE(std::isfinite(initial_estimate_));
}

int UpperConfidenceBounds::RunOneStep(const BernoulliEnvironment& environment,
                                      absl::Span<const int> pull_counts) {
  BANDITSIM_DCHECK_EQ(pull_counts.size(), static_cast<size_t>(num_arms_));
  ++total_steps_;
  std::vector<double> bounds(num_arms_);
  for (int i = 0; i < num_arms_; ++i) {
    bounds[i] = UpperConfidenceBound(reward_estimates_[i],
                                     exploration_coefficient_, total_steps_,
                                     pull_counts[i]);
  }
  const int arm = ArgMax(bounds);
  const int reward = environment.Step(arm);
  reward_estimates_[arm] =
      IncrementalMean(reward_estimates_[arm], reward, pull_counts[arm]);
  return arm;
}

void UpperConfidenceBounds::Reset() {
  std::fill(reward_estimates_.begin(), reward_estimates_.end(),
            initial_estimate_);
  total_steps_ = 0;
}

std::string UpperConfidenceBounds::ToString() const {
  return absl::StrCat("UCB(c=", exploration_coefficient_, ")");
}

// -- ThompsonSampling ---------------------------------------------------------

ThompsonSampling::ThompsonSampling(int num_arms, std::mt19937* rng)
    : Policy(num_arms),
      alpha_params_(num_arms, 1.),
      beta_params_(num_arms, 1.),
      rng_(rng) {
  BANDITSIM_CHECK_TRUE(rng_ != nullptr);
}

int ThompsonSampling::RunOneStep(const BernoulliEnvironment& environment,
                                 absl::Span<const int> /*pull_counts*/) {
  std::vector<double> samples(num_arms_);
  for (int i = 0; i < num_arms_; ++i) {
    samples[i] = SampleBeta(alpha_params_[i], beta_params_[i], rng_);
  }
  const int arm = ArgMax(samples);
  const int reward = environment.Step(arm);
  alpha_params_[arm] += reward;
  beta_params_[arm] += 1 - reward;
  return arm;
}

void ThompsonSampling::Reset() {
  std::fill(alpha_params_.begin(), alpha_params_.end(), 1.);
  std::fill(beta_params_.begin(), beta_params_.end(), 1.);
}

std::string ThompsonSampling::ToString() const { return "ThompsonSampling"; }

// -- Numeric helpers ----------------------------------------------------------

int ArgMax(absl::Span<const double> values) {
  BANDITSIM_DCHECK_FALSE(values.empty());
  return static_cast<int>(std::distance(
      values.begin(), std::max_element(values.begin(), values.end())));
}

double IncrementalMean(double estimate, double reward, int previous_count) {
  BANDITSIM_DCHECK_GE(previous_count, 0);
  return estimate + 1. / (previous_count + 1) * (reward - estimate);
}

double UpperConfidenceBound(double estimate, double exploration_coefficient,
                            int64_t total_steps, int pull_count) {
  BANDITSIM_DCHECK_GT(total_steps, 0);
  BANDITSIM_DCHECK_GE(pull_count, 0);
  return estimate +
         exploration_coefficient *
             std::sqrt(std::log(static_cast<double>(total_steps)) / (2. * (pull_count + 1)));
}

double SampleBeta(double alpha, double beta, std::mt19937* rng) {
  BANDITSIM_DCHECK_GT(alpha, 0.);
  BANDITSIM_DCHECK_GT(beta, 0.);
  return absl::Beta<double>(*rng, alpha, beta);
}

// -- Construction by name -----------------------------------------------------

std::vector<std::string> PolicyNames() {
  return {"epsilon_greedy", "decaying_epsilon_greedy", "ucb",
          "thompson_sampling"};
}

std::unique_ptr<Policy> MakePolicy(absl::string_view name, int num_arms,
                                   const PolicyParameters& params,
                                   std::mt19937* rng) {
  if (name == "epsilon_greedy") {
    return std::make_unique<EpsilonGreedy>(num_arms, params.epsilon, rng,
                                           params.initial_estimate);
  } else if (name == "decaying_epsilon_greedy") {
    return std::make_unique<DecayingEpsilonGreedy>(num_arms, rng,
                                                   params.initial_estimate);
  } else if (name == "ucb") {
    return std::make_unique<UpperConfidenceBounds>(
        num_arms, params.exploration_coefficient, params.initial_estimate);
  } else if (name == "thompson_sampling") {
    return std::make_unique<ThompsonSampling>(num_arms, rng);
  }
  BanditSimFatalError(absl::StrCat("Unknown policy '", name,
                                   "'. Known policies: ",
                                   absl::StrJoin(PolicyNames(), ", ")));
}

}  // namespace algorithms
}  // namespace banditsim
