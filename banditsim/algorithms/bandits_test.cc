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

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/random/distributions.h"
#include "banditsim/banditsim_utils.h"
#include "banditsim/environment.h"
#include "banditsim/tests/test_utils.h"

namespace banditsim {
namespace algorithms {
namespace {

void TestArgMax() {
  BANDITSIM_CHECK_EQ(ArgMax(std::vector<double>{0.1, 0.9, 0.5}), 1);
  BANDITSIM_CHECK_EQ(ArgMax(std::vector<double>{0.3, 0.9, 0.9}), 1);
  BANDITSIM_CHECK_EQ(ArgMax(std::vector<double>{1., 1., 1.}), 0);
  BANDITSIM_CHECK_EQ(ArgMax(std::vector<double>{-2.}), 0);
}

void TestIncrementalMean() {
  BANDITSIM_CHECK_FLOAT_EQ(IncrementalMean(1., 0., 0), 0.);
  BANDITSIM_CHECK_FLOAT_EQ(IncrementalMean(0.5, 1., 1), 0.75);

  const std::vector<double> rewards = {1., 0., 0., 1., 1., 1., 0.};
  double mean = 123.;  // Overwritten by the first update.
  double sum = 0.;
  for (int i = 0; i < static_cast<int>(rewards.size()); ++i) {
    mean = IncrementalMean(mean, rewards[i], i);
    sum += rewards[i];
    BANDITSIM_CHECK_FLOAT_NEAR(mean, sum / (i + 1), 1e-12);
  }
}

void TestUpperConfidenceBoundDecreasesWithPulls() {
  constexpr int kTotalSteps = 10;
  double previous = UpperConfidenceBound(0.5, 1., kTotalSteps, 0);
  for (int pulls = 1; pulls <= 20; ++pulls) {
    const double bound = UpperConfidenceBound(0.5, 1., kTotalSteps, pulls);
    BANDITSIM_CHECK_LT(bound, previous);
    BANDITSIM_CHECK_GT(bound, 0.5);
    previous = bound;
  }
  // Two arms with equal estimates: the less pulled one is more optimistic.
  BANDITSIM_CHECK_GT(UpperConfidenceBound(0.4, 2., 50, 3),
                     UpperConfidenceBound(0.4, 2., 50, 9));
  // ln(1) = 0: no bonus on the very first step.
  BANDITSIM_CHECK_FLOAT_EQ(UpperConfidenceBound(0.25, 1., 1, 0), 0.25);
  BANDITSIM_CHECK_FLOAT_EQ(UpperConfidenceBound(0.5, 1., 10, 1),
                           0.5 + std::sqrt(std::log(10.) / 4.));
}

void TestStepCountersAreSixtyFourBit() {
  static_assert(std::is_same<decltype(std::declval<DecayingEpsilonGreedy>()
                                          .total_steps()),
                             int64_t>::value,
                "step counter must not overflow after INT_MAX steps");
  static_assert(std::is_same<decltype(std::declval<UpperConfidenceBounds>()
                                          .total_steps()),
                             int64_t>::value,
                "step counter must not overflow after INT_MAX steps");
  const int64_t total_steps =
      static_cast<int64_t>(std::numeric_limits<int>::max()) + 10;
  const double bound = UpperConfidenceBound(0.5, 1., total_steps, 100);
  BANDITSIM_CHECK_TRUE(std::isfinite(bound));
  BANDITSIM_CHECK_FLOAT_NEAR(
      bound, 0.5 + std::sqrt(std::log(static_cast<double>(total_steps)) / 202.),
      1e-12);
}

void TestSampleBeta() {
  std::mt19937 rng(11);
  constexpr int kNumSamples = 5000;
  double sum = 0.;
  for (int i = 0; i < kNumSamples; ++i) {
    const double sample = SampleBeta(2., 5., &rng);
    BANDITSIM_CHECK_GE(sample, 0.);
    BANDITSIM_CHECK_LE(sample, 1.);
    sum += sample;
  }
  BANDITSIM_CHECK_FLOAT_NEAR(sum / kNumSamples, 2. / 7., 0.02);
}

void TestEpsilonGreedyExploitsWithZeroEpsilon() {
  std::mt19937 rng(5);
  BernoulliEnvironment environment(std::vector<double>{0.5, 0.5, 0.5}, &rng);
  EpsilonGreedy policy(/*num_arms=*/3, /*epsilon=*/0., &rng);
  policy.set_reward_estimates({0.1, 0.9, 0.5});

  std::mt19937 expected_rng = rng;
  const std::vector<int> pull_counts = {0, 0, 0};
  BANDITSIM_CHECK_EQ(policy.RunOneStep(environment, pull_counts), 1);

  // The reward draw of the environment is the only random number consumed.
  const double reward_draw = absl::Uniform(expected_rng, 0., 1.);
  BANDITSIM_CHECK_LT(reward_draw, 1.);
  BANDITSIM_CHECK_TRUE(rng == expected_rng);

  // First pull of arm 1: the estimate becomes the observed reward.
  const double estimate = policy.reward_estimates()[1];
  BANDITSIM_CHECK_TRUE(estimate == 0. || estimate == 1.);
  BANDITSIM_CHECK_FLOAT_EQ(policy.reward_estimates()[0], 0.1);
  BANDITSIM_CHECK_FLOAT_EQ(policy.reward_estimates()[2], 0.5);
}

void TestEpsilonGreedyExploresWithFullEpsilon() {
  std::mt19937 rng(9);
  BernoulliEnvironment environment(std::vector<double>{0., 0., 0., 1.}, &rng);
  EpsilonGreedy policy(/*num_arms=*/4, /*epsilon=*/1., &rng,
                       /*initial_estimate=*/0.);
  std::vector<int> pull_counts(4, 0);
  for (int step = 0; step < 200; ++step) {
    ++pull_counts[policy.RunOneStep(environment, pull_counts)];
  }
  for (int pulls : pull_counts) BANDITSIM_CHECK_GT(pulls, 0);
}

void TestDecayingEpsilonGreedyExploresOnFirstStep() {
  constexpr int kNumArms = 10;
  std::vector<double> estimates(kNumArms, 0.);
  estimates[0] = 1.;

  std::set<int> first_arms;
  for (int seed = 0; seed < 64; ++seed) {
    std::mt19937 rng(seed);
    BernoulliEnvironment environment(kNumArms, &rng);
    DecayingEpsilonGreedy policy(kNumArms, &rng);
    policy.set_reward_estimates(estimates);
    BANDITSIM_CHECK_EQ(policy.next_epsilon(), 1.);
    const std::vector<int> pull_counts(kNumArms, 0);
    first_arms.insert(policy.RunOneStep(environment, pull_counts));
    BANDITSIM_CHECK_EQ(policy.total_steps(), 1);
    BANDITSIM_CHECK_FLOAT_EQ(policy.next_epsilon(), 0.5);
  }
  // Exploiting would always pick arm 0.
  BANDITSIM_CHECK_GT(static_cast<int>(first_arms.size()), 1);
}

void TestDecayingEpsilonGreedyReset() {
  std::mt19937 rng(2);
  BernoulliEnvironment environment(std::vector<double>{0., 0.}, &rng);
  DecayingEpsilonGreedy policy(/*num_arms=*/2, &rng, /*initial_estimate=*/0.7);
  std::vector<int> pull_counts(2, 0);
  for (int step = 0; step < 5; ++step) {
    ++pull_counts[policy.RunOneStep(environment, pull_counts)];
  }
  BANDITSIM_CHECK_EQ(policy.total_steps(), 5);
  policy.Reset();
  BANDITSIM_CHECK_EQ(policy.total_steps(), 0);
  BANDITSIM_CHECK_TRUE(policy.reward_estimates() ==
                       std::vector<double>(2, 0.7));
}

void TestUpperConfidenceBoundsSelection() {
  std::mt19937 rng(0);
  // No arm ever pays, so every pulled arm's estimate drops to zero and the
  // untried arms keep their optimistic initial estimate.
  BernoulliEnvironment environment(std::vector<double>{0., 0., 0.}, &rng);
  UpperConfidenceBounds policy(/*num_arms=*/3,
                               /*exploration_coefficient=*/1.);
  std::vector<int> pull_counts(3, 0);
  std::vector<int> arms;
  for (int step = 0; step < 3; ++step) {
    const int arm = policy.RunOneStep(environment, pull_counts);
    ++pull_counts[arm];
    arms.push_back(arm);
  }
  BANDITSIM_CHECK_TRUE(arms == std::vector<int>({0, 1, 2}));
  BANDITSIM_CHECK_EQ(policy.total_steps(), 3);
  BANDITSIM_CHECK_TRUE(policy.reward_estimates() ==
                       std::vector<double>(3, 0.));

  policy.Reset();
  BANDITSIM_CHECK_EQ(policy.total_steps(), 0);
  BANDITSIM_CHECK_TRUE(policy.reward_estimates() ==
                       std::vector<double>(3, 1.));
}

void TestThompsonSamplingPosteriorUpdate() {
  {
    std::mt19937 rng(1);
    BernoulliEnvironment always_pays(std::vector<double>{1.}, &rng);
    ThompsonSampling policy(/*num_arms=*/1, &rng);
    BANDITSIM_CHECK_EQ(policy.RunOneStep(always_pays, std::vector<int>{0}),
                       0);
    BANDITSIM_CHECK_FLOAT_EQ(policy.alpha_params()[0], 2.);
    BANDITSIM_CHECK_FLOAT_EQ(policy.beta_params()[0], 1.);
  }
  {
    std::mt19937 rng(1);
    BernoulliEnvironment never_pays(std::vector<double>{0.}, &rng);
    ThompsonSampling policy(/*num_arms=*/1, &rng);
    BANDITSIM_CHECK_EQ(policy.RunOneStep(never_pays, std::vector<int>{0}), 0);
    BANDITSIM_CHECK_FLOAT_EQ(policy.alpha_params()[0], 1.);
    BANDITSIM_CHECK_FLOAT_EQ(policy.beta_params()[0], 2.);
  }
  {
    // Only the pulled arm's posterior moves, by exactly one observation.
    std::mt19937 rng(4);
    BernoulliEnvironment environment(std::vector<double>{0.2, 0.6, 0.9},
                                     &rng);
    ThompsonSampling policy(/*num_arms=*/3, &rng);
    std::vector<int> pull_counts(3, 0);
    for (int step = 0; step < 100; ++step) {
      const std::vector<double> alpha = policy.alpha_params();
      const std::vector<double> beta = policy.beta_params();
      const int arm = policy.RunOneStep(environment, pull_counts);
      ++pull_counts[arm];
      for (int i = 0; i < 3; ++i) {
        const double alpha_delta = policy.alpha_params()[i] - alpha[i];
        const double beta_delta = policy.beta_params()[i] - beta[i];
        if (i == arm) {
          BANDITSIM_CHECK_FLOAT_EQ(alpha_delta + beta_delta, 1.);
          BANDITSIM_CHECK_TRUE(alpha_delta == 0. || alpha_delta == 1.);
        } else {
          BANDITSIM_CHECK_FLOAT_EQ(alpha_delta, 0.);
          BANDITSIM_CHECK_FLOAT_EQ(beta_delta, 0.);
        }
      }
    }
    policy.Reset();
    BANDITSIM_CHECK_TRUE(policy.alpha_params() == std::vector<double>(3, 1.));
    BANDITSIM_CHECK_TRUE(policy.beta_params() == std::vector<double>(3, 1.));
  }
}

void TestMakePolicy() {
  std::mt19937 rng(0);
  PolicyParameters params;
  for (const std::string& name : PolicyNames()) {
    std::unique_ptr<Policy> policy = MakePolicy(name, 4, params, &rng);
    BANDITSIM_CHECK_TRUE(policy != nullptr);
    BANDITSIM_CHECK_EQ(policy->num_arms(), 4);
    BANDITSIM_CHECK_FALSE(policy->ToString().empty());
  }
  params.epsilon = 0.25;
  BANDITSIM_CHECK_EQ(MakePolicy("epsilon_greedy", 2, params, &rng)->ToString(),
                     "EpsilonGreedy(epsilon=0.25)");
}

void TestInvalidPoliciesAreFatal() {
  std::mt19937 rng(0);
  PolicyParameters params;
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { MakePolicy("softmax", 3, params, &rng); }));
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { EpsilonGreedy policy(0, 0.1, &rng); }));
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { EpsilonGreedy policy(3, 1.5, &rng); }));
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { EpsilonGreedy policy(3, -0.1, &rng); }));
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { UpperConfidenceBounds policy(3, -1.); }));
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { ThompsonSampling policy(3, nullptr); }));
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError([&]() {
    EpsilonGreedy policy(3, 0.1, &rng);
    policy.set_reward_estimates({0.5, 0.5});
  }));

  // Non-finite initial estimates would turn every update into NaN.
  const double inf = std::numeric_limits<double>::infinity();
  const double nan = std::numeric_limits<double>::quiet_NaN();
  for (double initial_estimate : {inf, -inf, nan}) {
    BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
        [&]() { EpsilonGreedy policy(3, 0.1, &rng, initial_estimate); }));
    BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
        [&]() { DecayingEpsilonGreedy policy(3, &rng, initial_estimate); }));
    BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
        [&]() { UpperConfidenceBounds policy(3, 1., initial_estimate); }));
    params.initial_estimate = initial_estimate;
    BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
        [&]() { MakePolicy("ucb", 3, params, &rng); }));
  }
  BANDITSIM_CHECK_TRUE(testing::RaisesFatalError(
      [&]() { UpperConfidenceBounds policy(3, inf); }));
}

}  // namespace
}  // namespace algorithms
}  // namespace banditsim

int main(int argc, char** argv) {
  banditsim::algorithms::TestArgMax();
  banditsim::algorithms::TestIncrementalMean();
  banditsim::algorithms::TestUpperConfidenceBoundDecreasesWithPulls();
  banditsim::algorithms::TestStepCountersAreSixtyFourBit();
  banditsim::algorithms::TestSampleBeta();
  banditsim::algorithms::TestEpsilonGreedyExploitsWithZeroEpsilon();
  banditsim::algorithms::TestEpsilonGreedyExploresWithFullEpsilon();
  banditsim::algorithms::TestDecayingEpsilonGreedyExploresOnFirstStep();
  banditsim::algorithms::TestDecayingEpsilonGreedyReset();
  banditsim::algorithms::TestUpperConfidenceBoundsSelection();
  banditsim::algorithms::TestThompsonSamplingPosteriorUpdate();
  banditsim::algorithms::TestMakePolicy();
  banditsim::algorithms::TestInvalidPoliciesAreFatal();
}
