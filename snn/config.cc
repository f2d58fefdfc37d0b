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

#include "snn/config.h"

#include <fstream>
#include <sstream>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace spikegrad {

namespace {

absl::Status ParseDouble(absl::string_view key, absl::string_view value,
                         double *out) {
  if (!absl::SimpleAtod(value, out)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid number for '", key, "': '", value, "'"));
  }
  return absl::OkStatus();
}

absl::Status ParseInt(absl::string_view key, absl::string_view value,
                      int *out) {
  if (!absl::SimpleAtoi(value, out)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid integer for '", key, "': '", value, "'"));
  }
  return absl::OkStatus();
}

absl::Status ParseBool(absl::string_view key, absl::string_view value,
                       bool *out) {
  if (!absl::SimpleAtob(value, out)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid boolean for '", key, "': '", value, "'"));
  }
  return absl::OkStatus();
}

std::vector<std::string> SplitList(absl::string_view value) {
  std::vector<std::string> items;
  for (absl::string_view item :
       absl::StrSplit(value, ',', absl::SkipWhitespace())) {
    items.emplace_back(absl::StripAsciiWhitespace(item));
  }
  return items;
}

}  // namespace

absl::StatusOr<LossKind> ParseLossKind(absl::string_view name) {
  if (name == "train") return LossKind::kTrain;
  if (name == "count") return LossKind::kCount;
  if (name == "latency") return LossKind::kLatency;
  return absl::InvalidArgumentError(absl::StrCat(
      "invalid target type '", name, "', valid types are [count, train, "
      "latency]"));
}

absl::StatusOr<LearningRule> ParseLearningRule(absl::string_view name) {
  if (name == "Activation") return LearningRule::kActivation;
  if (name == "Timing") return LearningRule::kTiming;
  if (name == "ANTLR") return LearningRule::kAntlr;
  return absl::InvalidArgumentError(
      absl::StrCat("invalid learning rule: '", name, "'"));
}

absl::StatusOr<DecayStyle> ParseDecayStyle(absl::string_view name) {
  if (name == "RNN") return DecayStyle::kRnn;
  if (name == "SRM") return DecayStyle::kSrm;
  if (name == "SLAYER") return DecayStyle::kSlayer;
  return absl::InvalidArgumentError(
      absl::StrCat("invalid decay style: '", name, "'"));
}

std::string LossKindName(LossKind kind) {
  switch (kind) {
    case LossKind::kTrain:
      return "train";
    case LossKind::kCount:
      return "count";
    case LossKind::kLatency:
      return "latency";
  }
  return "unknown";
}

std::string LearningRuleName(LearningRule rule) {
  switch (rule) {
    case LearningRule::kActivation:
      return "Activation";
    case LearningRule::kTiming:
      return "Timing";
    case LearningRule::kAntlr:
      return "ANTLR";
  }
  return "unknown";
}

std::string DecayStyleName(DecayStyle style) {
  switch (style) {
    case DecayStyle::kRnn:
      return "RNN";
    case DecayStyle::kSrm:
      return "SRM";
    case DecayStyle::kSlayer:
      return "SLAYER";
  }
  return "unknown";
}

absl::Status ValidateConfig(const SnnConfig &config) {
  if (config.network_size.size() < 2) {
    return absl::InvalidArgumentError(
        "network_size needs an input shape and at least one layer");
  }
  if (config.time_length <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("time_length must be positive, got ", config.time_length));
  }
  if (config.num_models < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("num_models must be positive, got ", config.num_models));
  }
  if (!config.multi_model && config.num_models != 1) {
    return absl::InvalidArgumentError(
        "must set multi_model when num_models > 1");
  }
  if (config.grad_clip.empty()) {
    return absl::InvalidArgumentError("grad_clip must not be empty");
  }
  if (config.multi_model && config.num_models % config.grad_clip.size() != 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "len(grad_clip) must be a factor of num_models (were ",
        config.grad_clip.size(), " and ", config.num_models, ")"));
  }
  if (!config.beta_auto &&
      (config.beta_i <= 0 || config.beta_v <= 0 || config.beta_bias < 0)) {
    return absl::InvalidArgumentError(
        "beta constants must be positive when beta_auto is false");
  }
  if (config.alpha_exp <= 0) {
    return absl::InvalidArgumentError("alpha_exp must be positive");
  }
  if (config.weight_init_std < 0) {
    return absl::InvalidArgumentError("weight_init_std must be non-negative");
  }
  return absl::OkStatus();
}

absl::Status SetConfigValue(absl::string_view key, absl::string_view value,
                            SnnConfig *config) {
  if (key == "network_size") {
    config->network_size = SplitList(value);
    return absl::OkStatus();
  }
  if (key == "grad_clip") {
    config->grad_clip.clear();
    for (const std::string &item : SplitList(value)) {
      double clip;
      absl::Status status = ParseDouble(key, item, &clip);
      if (!status.ok()) return status;
      config->grad_clip.push_back(clip);
    }
    return absl::OkStatus();
  }
  if (key == "target_type") {
    absl::StatusOr<LossKind> kind = ParseLossKind(value);
    if (!kind.ok()) return kind.status();
    config->target_type = *kind;
    return absl::OkStatus();
  }
  if (key == "lrule") {
    absl::StatusOr<LearningRule> rule = ParseLearningRule(value);
    if (!rule.ok()) return rule.status();
    config->lrule = *rule;
    return absl::OkStatus();
  }
  if (key == "decay_style") {
    absl::StatusOr<DecayStyle> style = ParseDecayStyle(value);
    if (!style.ok()) return style.status();
    config->decay_style = *style;
    return absl::OkStatus();
  }
  if (key == "time_length") return ParseInt(key, value, &config->time_length);
  if (key == "num_models") return ParseInt(key, value, &config->num_models);
  if (key == "seed") return ParseInt(key, value, &config->seed);
  if (key == "beta_auto") return ParseBool(key, value, &config->beta_auto);
  if (key == "multi_model") return ParseBool(key, value, &config->multi_model);
  if (key == "normal_weight_init") {
    return ParseBool(key, value, &config->normal_weight_init);
  }

  struct DoubleField {
    const char *name;
    double *field;
  };
  const DoubleField double_fields[] = {
      {"alpha_i", &config->alpha_i},
      {"alpha_v", &config->alpha_v},
      {"alpha_exp", &config->alpha_exp},
      {"beta_i", &config->beta_i},
      {"beta_v", &config->beta_v},
      {"beta_bias", &config->beta_bias},
      {"surr_alpha", &config->surr_alpha},
      {"surr_beta", &config->surr_beta},
      {"softmax_beta", &config->softmax_beta},
      {"lambda_nospike", &config->lambda_nospike},
      {"timing_penalty", &config->timing_penalty},
      {"lambda_act", &config->lambda_act},
      {"lambda_timing", &config->lambda_timing},
      {"weight_init_std", &config->weight_init_std},
      {"weight_bias", &config->weight_bias},
  };
  for (const DoubleField &f : double_fields) {
    if (key == f.name) return ParseDouble(key, value, f.field);
  }
  return absl::InvalidArgumentError(
      absl::StrCat("unknown configuration key '", key, "'"));
}

absl::StatusOr<SnnConfig> ParseConfig(absl::string_view text) {
  SnnConfig config;
  int line_number = 0;
  for (absl::string_view line_raw : absl::StrSplit(text, '\n')) {
    ++line_number;
    absl::string_view line = absl::StripAsciiWhitespace(line_raw);
    if (line.empty() || line.front() == '#') continue;
    std::vector<absl::string_view> parts =
        absl::StrSplit(line, absl::MaxSplits('=', 1));
    if (parts.size() != 2) {
      return absl::InvalidArgumentError(absl::StrCat(
          "line ", line_number, ": expected 'key = value', got '", line, "'"));
    }
    absl::Status status =
        SetConfigValue(absl::StripAsciiWhitespace(parts[0]),
                       absl::StripAsciiWhitespace(parts[1]), &config);
    if (!status.ok()) {
      return absl::InvalidArgumentError(
          absl::StrCat("line ", line_number, ": ", status.message()));
    }
  }
  return config;
}

absl::StatusOr<SnnConfig> LoadConfigFile(const std::string &filename) {
  std::ifstream in(filename);
  if (!in) {
    return absl::NotFoundError(
        absl::StrCat("cannot open config file '", filename, "'"));
  }
  std::stringstream contents;
  contents << in.rdbuf();
  return ParseConfig(contents.str());
}

}  // namespace spikegrad
