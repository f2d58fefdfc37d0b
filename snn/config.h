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

#ifndef SPIKEGRAD_SNN_CONFIG_H_
#define SPIKEGRAD_SNN_CONFIG_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace spikegrad {

// Loss formulation; also decides the shape of targets.
enum class LossKind {
  // Per-timestep target spike train, compared after alpha-kernel smoothing.
  kTrain,
  // Target spike counts (given as a spike train, only the total matters).
  kCount,
  // Target class index; cross-entropy over first-spike latencies.
  kLatency,
};

enum class LearningRule { kActivation, kTiming, kAntlr };

// How the voltage-to-current leak of the activation rule is carried across
// time steps.
enum class DecayStyle { kRnn, kSrm, kSlayer };

absl::StatusOr<LossKind> ParseLossKind(absl::string_view name);
absl::StatusOr<LearningRule> ParseLearningRule(absl::string_view name);
absl::StatusOr<DecayStyle> ParseDecayStyle(absl::string_view name);

std::string LossKindName(LossKind kind);
std::string LearningRuleName(LearningRule rule);
std::string DecayStyleName(DecayStyle style);

struct SnnConfig {
  // Input shape followed by layer tags, e.g. {"1x28x28", "conv8c3", "apool2",
  // "flatten", "fc10"} or {"100", "fc50", "fc10"}.
  std::vector<std::string> network_size;

  // Number of simulated time steps.
  int time_length = 100;

  // Decay of synaptic current, membrane potential and of the alpha kernel
  // used to smooth spike-train differences.
  double alpha_i = 0.9;
  double alpha_v = 0.9;
  double alpha_exp = 0.9;

  // Normalization constants. With `beta_auto` they are derived from the
  // epsilon kernel so the peak post-synaptic response is 1.
  bool beta_auto = true;
  double beta_i = 1.0;
  double beta_v = 1.0;
  double beta_bias = 1.0;

  LossKind target_type = LossKind::kCount;
  LearningRule lrule = LearningRule::kAntlr;
  DecayStyle decay_style = DecayStyle::kSrm;

  // Surrogate derivative: surr_alpha * exp(-surr_beta * |V - 1|).
  double surr_alpha = 1.0;
  double surr_beta = 5.0;

  // Gradients are clamped to [-|c|, |c|]. With multiple models the list is
  // distributed over the models; its length must divide num_models.
  std::vector<double> grad_clip = {100.0};

  bool multi_model = false;
  int num_models = 1;

  // Latency loss.
  double softmax_beta = 1.0;
  double lambda_nospike = 1.0;

  // Penalty applied by the timing rule to fc neurons that never spiked.
  double timing_penalty = 0.0;

  // Mixing coefficients of the ANTLR rule.
  double lambda_act = 1.0;
  double lambda_timing = 1.0;

  // Weight initialization.
  bool normal_weight_init = false;
  double weight_init_std = 1.0;
  double weight_bias = 0.0;
  int seed = 42;
};

// Checks value ranges and cross-field constraints that do not depend on the
// topology.
absl::Status ValidateConfig(const SnnConfig &config);

// Parses `key = value` lines into a config. Empty lines and lines starting
// with '#' are skipped. Unknown keys and malformed values are rejected with
// kInvalidArgument. Keys not present keep their default value.
absl::StatusOr<SnnConfig> ParseConfig(absl::string_view text);

// Applies a single `key`/`value` pair to `config`.
absl::Status SetConfigValue(absl::string_view key, absl::string_view value,
                            SnnConfig *config);

// Reads a whole config file and parses it with ParseConfig.
absl::StatusOr<SnnConfig> LoadConfigFile(const std::string &filename);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_CONFIG_H_
