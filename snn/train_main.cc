// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include <stdint.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/strings/str_cat.h"
#include "common/util.h"
#include "snn/config.h"
#include "snn/network.h"
#include "snn/problem.h"
#include "snn/trainer.h"

ABSL_FLAG(std::string, config, "", "file of `key = value` network options");
ABSL_FLAG(std::string, network_size, "",
          "input shape followed by comma separated layer tags");
ABSL_FLAG(std::string, target_type, "", "count, train or latency");
ABSL_FLAG(std::string, lrule, "", "Activation, Timing or ANTLR");
ABSL_FLAG(std::string, decay_style, "", "RNN, SRM or SLAYER");
ABSL_FLAG(int64_t, time_length, 0, "number of time steps, 0 keeps the config");
ABSL_FLAG(double, lr, 0.001, "learning rate");
ABSL_FLAG(bool, sgd, false, "use plain gradient descent instead of ADAM");
ABSL_FLAG(int64_t, n_epochs, 10, "number of training epochs");
ABSL_FLAG(int64_t, batch_size, 16, "batch size");
ABSL_FLAG(int64_t, n_train, 1000, "number of training examples");
ABSL_FLAG(int64_t, n_validation, 100, "number of validation examples");
ABSL_FLAG(int64_t, n_test, 100, "number of test examples");
ABSL_FLAG(double, max_input_rate, 0.2, "maximum input firing probability");
ABSL_FLAG(int64_t, target_period, 10,
          "steps between target spikes of train/count targets");

namespace spikegrad {

constexpr char kDefaultNetworkSize[] = "20,fc30,fc2";

absl::StatusOr<SnnConfig> ConfigFromFlags() {
  SnnConfig config;
  const std::string config_file = absl::GetFlag(FLAGS_config);
  if (!config_file.empty()) {
    absl::StatusOr<SnnConfig> loaded = LoadConfigFile(config_file);
    if (!loaded.ok()) return loaded.status();
    config = *loaded;
  }
  std::string network_size = absl::GetFlag(FLAGS_network_size);
  if (network_size.empty() && config_file.empty()) {
    network_size = kDefaultNetworkSize;
  }
  // Command-line values take precedence over the file.
  const std::pair<const char *, std::string> overrides[] = {
      {"network_size", network_size},
      {"target_type", absl::GetFlag(FLAGS_target_type)},
      {"lrule", absl::GetFlag(FLAGS_lrule)},
      {"decay_style", absl::GetFlag(FLAGS_decay_style)},
      {"time_length", absl::GetFlag(FLAGS_time_length) > 0
                          ? absl::StrCat(absl::GetFlag(FLAGS_time_length))
                          : ""},
  };
  for (const auto &entry : overrides) {
    if (entry.second.empty()) continue;
    absl::Status status = SetConfigValue(entry.first, entry.second, &config);
    if (!status.ok()) return status;
  }
  return config;
}

int TrainMain() {
  absl::StatusOr<SnnConfig> config = ConfigFromFlags();
  if (!config.ok()) {
    SPIKEGRAD_LOG(LogSeverity::ERROR, config.status().ToString());
    return 1;
  }
  absl::StatusOr<std::unique_ptr<SpikingNetwork>> network =
      SpikingNetwork::Create(*config);
  if (!network.ok()) {
    SPIKEGRAD_LOG(LogSeverity::ERROR, network.status().ToString());
    return 1;
  }

  const Topology &topology = (*network)->topology();
  RatePatternProblem::Options options;
  options.input_shape = topology.input_shape;
  options.num_classes = NumElements(topology.output_layer().output_shape);
  options.time_length = config->time_length;
  options.target_type = config->target_type;
  options.max_input_rate = absl::GetFlag(FLAGS_max_input_rate);
  options.target_period = absl::GetFlag(FLAGS_target_period);
  options.n_train = absl::GetFlag(FLAGS_n_train);
  options.n_validation = absl::GetFlag(FLAGS_n_validation);
  options.n_test = absl::GetFlag(FLAGS_n_test);
  RatePatternProblem problem(options);
  std::vector<uint32_t> training, validation, test;
  problem.Split(config->seed, &training, &validation, &test);
  SPIKEGRAD_LOG(LogSeverity::INFO,
                absl::StrCat(problem.Name(), ": ", training.size(), " train, ",
                             validation.size(), " validation, ", test.size(),
                             " test examples"));

  LearningParams learning_params;
  learning_params.learning_rate = absl::GetFlag(FLAGS_lr);
  learning_params.num_epochs = absl::GetFlag(FLAGS_n_epochs);
  learning_params.batch_size = absl::GetFlag(FLAGS_batch_size);
  learning_params.optimizer =
      absl::GetFlag(FLAGS_sgd) ? OptimizerKind::kSgd : OptimizerKind::kAdam;
  StderrTrainCallback train_callback;
  absl::StatusOr<TrainingOutcome> outcome =
      TrainNetwork(learning_params, problem, training, validation,
                   network->get(), &train_callback);
  if (!outcome.ok()) {
    SPIKEGRAD_LOG(LogSeverity::ERROR, outcome.status().ToString());
    return 1;
  }

  (*network)->params() = outcome->best_params;
  StderrTestCallback test_callback;
  absl::StatusOr<TestOutcome> test_outcome =
      TestNetwork(problem, test, learning_params.batch_size, network->get(),
                  &test_callback);
  if (!test_outcome.ok()) {
    SPIKEGRAD_LOG(LogSeverity::ERROR, test_outcome.status().ToString());
    return 1;
  }
  return 0;
}

}  // namespace spikegrad

int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);
  return spikegrad::TrainMain();
}
