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

#include "snn/layers.h"

#include <cmath>
#include <random>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "common/util.h"

namespace spikegrad {

namespace {

absl::StatusOr<size_t> ParsePositive(absl::string_view text,
                                     absl::string_view what) {
  int value;
  if (!absl::SimpleAtoi(text, &value) || value <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid ", what, ": '", text, "'"));
  }
  return static_cast<size_t>(value);
}

absl::Status InvalidLayer(absl::string_view tag, absl::string_view reason) {
  return absl::InvalidArgumentError(
      absl::StrCat("layer '", tag, "': ", reason));
}

}  // namespace

std::string LayerKindName(LayerKind kind) {
  switch (kind) {
    case LayerKind::kConv:
      return "conv";
    case LayerKind::kFc:
      return "fc";
    case LayerKind::kAvgPool:
      return "apool";
    case LayerKind::kMaxPool:
      return "mpool";
    case LayerKind::kFlatten:
      return "flatten";
  }
  return "unknown";
}

absl::StatusOr<Shape> ParseInputShape(absl::string_view text) {
  std::vector<absl::string_view> parts = absl::StrSplit(text, 'x');
  if (parts.size() != 1 && parts.size() != 3) {
    return absl::InvalidArgumentError(absl::StrCat(
        "input shape must be <C> or <C>x<H>x<W>, got '", text, "'"));
  }
  Shape shape;
  for (absl::string_view part : parts) {
    absl::StatusOr<size_t> dim = ParsePositive(part, "input dimension");
    if (!dim.ok()) return dim.status();
    shape.push_back(*dim);
  }
  return shape;
}

absl::StatusOr<LayerSpec> ParseLayerSpec(absl::string_view tag) {
  LayerSpec spec;
  absl::string_view rest = tag;
  if (tag == "flatten") {
    spec.kind = LayerKind::kFlatten;
    return spec;
  }
  if (absl::ConsumePrefix(&rest, "conv")) {
    std::vector<absl::string_view> parts = absl::StrSplit(rest, 'c');
    if (parts.size() != 2) {
      return InvalidLayer(tag, "expected conv<channels>c<kernel>");
    }
    absl::StatusOr<size_t> channels = ParsePositive(parts[0], "channel count");
    if (!channels.ok()) return channels.status();
    absl::StatusOr<size_t> kernel = ParsePositive(parts[1], "kernel size");
    if (!kernel.ok()) return kernel.status();
    spec.kind = LayerKind::kConv;
    spec.out_channels = *channels;
    spec.kernel_size = *kernel;
    return spec;
  }
  if (absl::ConsumePrefix(&rest, "fc")) {
    absl::StatusOr<size_t> features = ParsePositive(rest, "feature count");
    if (!features.ok()) return features.status();
    spec.kind = LayerKind::kFc;
    spec.out_features = *features;
    return spec;
  }
  const bool avg = absl::ConsumePrefix(&rest, "apool");
  if (avg || absl::ConsumePrefix(&rest, "mpool")) {
    absl::StatusOr<size_t> kernel = ParsePositive(rest, "pooling size");
    if (!kernel.ok()) return kernel.status();
    spec.kind = avg ? LayerKind::kAvgPool : LayerKind::kMaxPool;
    spec.kernel_size = *kernel;
    return spec;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("unknown layer type '", tag, "'"));
}

Shape LayerDescriptor::weight_shape() const {
  switch (kind) {
    case LayerKind::kConv:
      return {output_shape[0], input_shape[0], kernel_size, kernel_size};
    case LayerKind::kFc:
      return {output_shape[0], input_shape[0]};
    default:
      return {};
  }
}

Shape LayerDescriptor::bias_shape() const {
  if (!trainable()) return {};
  return {output_shape[0]};
}

size_t LayerDescriptor::fan_in() const {
  switch (kind) {
    case LayerKind::kConv:
      return input_shape[0] * kernel_size * kernel_size;
    case LayerKind::kFc:
      return input_shape[0];
    default:
      return 0;
  }
}

absl::StatusOr<Topology> BuildTopology(
    const std::vector<std::string> &network_size, bool multi_model) {
  if (network_size.size() < 2) {
    return absl::InvalidArgumentError(
        "network_size needs an input shape and at least one layer");
  }
  Topology topology;
  absl::StatusOr<Shape> input_shape = ParseInputShape(network_size[0]);
  if (!input_shape.ok()) return input_shape.status();
  topology.input_shape = *input_shape;

  Shape shape = topology.input_shape;
  for (size_t i = 1; i < network_size.size(); ++i) {
    const std::string &tag = network_size[i];
    absl::StatusOr<LayerSpec> spec = ParseLayerSpec(tag);
    if (!spec.ok()) return spec.status();

    LayerDescriptor layer;
    layer.kind = spec->kind;
    layer.input_shape = shape;
    layer.kernel_size = spec->kernel_size;

    if (multi_model && (layer.kind == LayerKind::kConv ||
                        layer.kind == LayerKind::kAvgPool ||
                        layer.kind == LayerKind::kMaxPool)) {
      return InvalidLayer(tag, "not supported with multi_model");
    }

    switch (layer.kind) {
      case LayerKind::kConv:
        if (shape.size() != 3) {
          return InvalidLayer(tag, "convolution needs a [C, H, W] input");
        }
        if (layer.kernel_size % 2 == 0) {
          return InvalidLayer(tag, "convolution kernel size must be odd");
        }
        layer.padding = layer.kernel_size / 2;
        layer.output_shape = {spec->out_channels, shape[1], shape[2]};
        break;
      case LayerKind::kFc:
        if (shape.size() != 1) {
          return InvalidLayer(
              tag, absl::StrCat("fully connected layer needs a 1-D input, got ",
                                ShapeToString(shape), " (missing flatten?)"));
        }
        layer.output_shape = {spec->out_features};
        break;
      case LayerKind::kAvgPool:
      case LayerKind::kMaxPool:
        if (shape.size() != 3) {
          return InvalidLayer(tag, "pooling needs a [C, H, W] input");
        }
        if (shape[1] < layer.kernel_size || shape[2] < layer.kernel_size) {
          return InvalidLayer(tag, absl::StrCat("pooling size exceeds input ",
                                                ShapeToString(shape)));
        }
        layer.output_shape = {shape[0], shape[1] / layer.kernel_size,
                              shape[2] / layer.kernel_size};
        break;
      case LayerKind::kFlatten:
        layer.output_shape = {NumElements(shape)};
        break;
    }
    shape = layer.output_shape;
    topology.layers.push_back(layer);
  }

  if (topology.output_layer().output_shape.size() != 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("the last layer must produce a 1-D output, got ",
                     ShapeToString(topology.output_layer().output_shape)));
  }
  return topology;
}

ParameterArena::ParameterArena(const Topology &topology, size_t num_models)
    : num_layers_(topology.num_layers()),
      num_models_(num_models),
      params_(num_layers_ * num_models_) {
  for (size_t l = 0; l < num_layers_; ++l) {
    const LayerDescriptor &layer = topology.layers[l];
    if (!layer.trainable()) continue;
    for (size_t m = 0; m < num_models_; ++m) {
      LayerParams &p = at(l, m);
      p.weight = Tensor(layer.weight_shape());
      p.bias = Tensor(layer.bias_shape());
      p.weight_grad = Tensor(layer.weight_shape());
      p.bias_grad = Tensor(layer.bias_shape());
    }
  }
}

LayerParams &ParameterArena::at(size_t layer, size_t model) {
  SPIKEGRAD_CHECK(layer < num_layers_ && model < num_models_);
  return params_[layer * num_models_ + model];
}

const LayerParams &ParameterArena::at(size_t layer, size_t model) const {
  SPIKEGRAD_CHECK(layer < num_layers_ && model < num_models_);
  return params_[layer * num_models_ + model];
}

void ParameterArena::Initialize(const Topology &topology,
                                const SnnConfig &config) {
  SPIKEGRAD_CHECK(topology.num_layers() == num_layers_);
  std::mt19937 generator(config.seed);
  for (size_t l = 0; l < num_layers_; ++l) {
    const LayerDescriptor &layer = topology.layers[l];
    if (!layer.trainable()) continue;
    const double bound = 1.0 / std::sqrt(static_cast<double>(layer.fan_in()));
    std::uniform_real_distribution<double> uniform(-bound, bound);
    std::normal_distribution<double> normal(0.0, config.weight_init_std);
    for (size_t m = 0; m < num_models_; ++m) {
      LayerParams &p = at(l, m);
      for (size_t i = 0; i < p.weight.size(); ++i) {
        double w = config.normal_weight_init ? normal(generator)
                                             : uniform(generator);
        p.weight[i] = w + config.weight_bias;
      }
      p.bias.Fill(0.0);
    }
  }
  ZeroGrad();
}

void ParameterArena::ZeroGrad() {
  for (LayerParams &p : params_) {
    p.weight_grad.Fill(0.0);
    p.bias_grad.Fill(0.0);
  }
}

}  // namespace spikegrad
