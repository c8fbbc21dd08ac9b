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

// Runs bandit policies against a randomly generated Bernoulli bandit and
// prints the cumulative regret of each, e.g.
//
//   bandit_experiment --num_arms=10 --num_steps=5000 --seed=1 \
//       --epsilon_sweep=0.0001,0.01,0.1,0.25,0.5 --report_every=1000

#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "banditsim/algorithms/bandits.h"
#include "banditsim/algorithms/solver.h"
#include "banditsim/banditsim_utils.h"
#include "banditsim/environment.h"

ABSL_FLAG(int, num_arms, 10, "Number of arms of the bandit.");
ABSL_FLAG(int, num_steps, 5000, "Number of steps every solver runs.");
ABSL_FLAG(int, seed, 1, "Seed of the environment and of every solver.");
ABSL_FLAG(std::string, policies,
          "epsilon_greedy,decaying_epsilon_greedy,ucb,thompson_sampling",
          "Comma separated policies to run.");
ABSL_FLAG(double, epsilon, 0.01, "Exploration probability of epsilon_greedy.");
ABSL_FLAG(double, initial_estimate, 1.,
          "Initial reward estimate of the epsilon-greedy policies and ucb.");
ABSL_FLAG(double, ucb_coefficient, 1., "Exploration coefficient of ucb.");
ABSL_FLAG(std::string, epsilon_sweep, "",
          "Comma separated epsilons; runs one extra epsilon_greedy solver "
          "per value.");
ABSL_FLAG(int, report_every, 0,
          "If positive, print the cumulative regrets every that many steps.");

namespace banditsim {
namespace {

// One solver together with the environment and engine it draws from. Every
// solver gets its own reward stream so that runs do not interleave draws.
struct Experiment {
  std::string label;
  std::unique_ptr<std::mt19937> rng;
  std::unique_ptr<BernoulliEnvironment> environment;
  std::unique_ptr<algorithms::Solver> solver;
};

Experiment MakeExperiment(const BernoulliEnvironment& arms,
                          const std::string& policy_name,
                          const algorithms::PolicyParameters& params,
                          int seed) {
  Experiment experiment;
  experiment.rng = std::make_unique<std::mt19937>(seed);
  experiment.environment = std::make_unique<BernoulliEnvironment>(
      arms.success_probabilities(), experiment.rng.get());
  experiment.solver = std::make_unique<algorithms::Solver>(
      experiment.environment.get(),
      algorithms::MakePolicy(policy_name, arms.num_arms(), params,
                             experiment.rng.get()));
  experiment.label = experiment.solver->policy().ToString();
  return experiment;
}

std::vector<double> ParseEpsilons(const std::string& sweep) {
  std::vector<double> epsilons;
  for (absl::string_view token :
       absl::StrSplit(sweep, ',', absl::SkipWhitespace())) {
    double epsilon;
    if (!absl::SimpleAtod(token, &epsilon)) {
      BanditSimFatalError(
          absl::StrCat("Could not parse epsilon '", token, "'."));
    }
    epsilons.push_back(epsilon);
  }
  return epsilons;
}

void PrintEnvironment(const BernoulliEnvironment& environment) {
  std::cout << absl::StrFormat(
                   "Generated a %d-armed Bernoulli bandit. Best arm: %d "
                   "with success probability %.4f",
                   environment.num_arms(), environment.best_arm(),
                   environment.best_probability())
            << std::endl;
  std::vector<std::string> probabilities;
  for (double probability : environment.success_probabilities()) {
    probabilities.push_back(absl::StrFormat("%.4f", probability));
  }
  std::cout << "Success probabilities: ["
            << absl::StrJoin(probabilities, ", ") << "]" << std::endl;
}

void PrintSummary(const Experiment& experiment) {
  const algorithms::Solver& solver = *experiment.solver;
  const int best_arm = solver.environment().best_arm();
  const int best_pulls = solver.pull_counts()[best_arm];
  const double share =
      solver.num_steps() > 0
          ? static_cast<double>(best_pulls) / solver.num_steps()
          : 0.;
  std::cout << absl::StrFormat(
                   "%-28s cumulative regret %10.4f, best arm pulled %d "
                   "times (%.1f%%)",
                   experiment.label, solver.cumulative_regret(), best_pulls,
                   100. * share)
            << std::endl;
}

void RunExperiments() {
  const int num_arms = absl::GetFlag(FLAGS_num_arms);
  const int num_steps = absl::GetFlag(FLAGS_num_steps);
  const int seed = absl::GetFlag(FLAGS_seed);
  const int report_every = absl::GetFlag(FLAGS_report_every);
  BANDITSIM_CHECK_GT(num_arms, 0);
  BANDITSIM_CHECK_GE(num_steps, 0);
  BANDITSIM_CHECK_GE(report_every, 0);

  std::mt19937 setup_rng(seed);
  const BernoulliEnvironment arms(num_arms, &setup_rng);
  PrintEnvironment(arms);

  algorithms::PolicyParameters params;
  params.epsilon = absl::GetFlag(FLAGS_epsilon);
  params.initial_estimate = absl::GetFlag(FLAGS_initial_estimate);
  params.exploration_coefficient = absl::GetFlag(FLAGS_ucb_coefficient);

  std::vector<Experiment> experiments;
  for (absl::string_view name : absl::StrSplit(
           absl::GetFlag(FLAGS_policies), ',', absl::SkipWhitespace())) {
    experiments.push_back(
        MakeExperiment(arms, std::string(name), params, seed));
  }
  for (double epsilon : ParseEpsilons(absl::GetFlag(FLAGS_epsilon_sweep))) {
    algorithms::PolicyParameters sweep_params = params;
    sweep_params.epsilon = epsilon;
    Experiment experiment =
        MakeExperiment(arms, "epsilon_greedy", sweep_params, seed);
    experiment.label = absl::StrCat("sweep ", experiment.label);
    experiments.push_back(std::move(experiment));
  }
  if (experiments.empty()) {
    BanditSimFatalError("No policy to run, set --policies or --epsilon_sweep.");
  }

  // Without a report interval every solver runs all steps at once.
  const int chunk = report_every > 0 ? report_every : num_steps;
  int steps_done = 0;
  while (steps_done < num_steps) {
    const int steps = std::min(chunk, num_steps - steps_done);
    for (Experiment& experiment : experiments) experiment.solver->Run(steps);
    steps_done += steps;
    if (report_every > 0) {
      std::vector<std::string> regrets;
      for (const Experiment& experiment : experiments) {
        regrets.push_back(absl::StrFormat(
            "%s=%.2f", experiment.label,
            experiment.solver->cumulative_regret()));
      }
      std::cout << absl::StrCat("step ", steps_done, ": ",
                                absl::StrJoin(regrets, " "))
                << std::endl;
    }
  }

  std::cout << absl::StrCat("Results after ", num_steps, " steps:")
            << std::endl;
  for (const Experiment& experiment : experiments) PrintSummary(experiment);
}

}  // namespace
}  // namespace banditsim

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  banditsim::RunExperiments();
}
