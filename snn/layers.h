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

#ifndef SPIKEGRAD_SNN_LAYERS_H_
#define SPIKEGRAD_SNN_LAYERS_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "common/tensor.h"
#include "snn/config.h"

namespace spikegrad {

enum class LayerKind { kConv, kFc, kAvgPool, kMaxPool, kFlatten };

std::string LayerKindName(LayerKind kind);

// A single entry of the network description, e.g. "conv16c3" or "fc10".
struct LayerSpec {
  LayerKind kind = LayerKind::kFc;
  size_t out_channels = 0;  // conv
  size_t out_features = 0;  // fc
  size_t kernel_size = 0;   // conv, apool, mpool
};

// Parses "<C>" or "<C>x<H>x<W>".
absl::StatusOr<Shape> ParseInputShape(absl::string_view text);

// Parses one of "conv<C>c<K>", "fc<N>", "apool<K>", "mpool<K>", "flatten".
absl::StatusOr<LayerSpec> ParseLayerSpec(absl::string_view tag);

// Resolved layer, shared by all model replicas. Shapes exclude the batch
// dimension: [C, H, W] for spatial maps and [N] for vectors.
struct LayerDescriptor {
  LayerKind kind = LayerKind::kFc;
  Shape input_shape;
  Shape output_shape;
  size_t kernel_size = 0;
  size_t padding = 0;

  bool trainable() const {
    return kind == LayerKind::kConv || kind == LayerKind::kFc;
  }
  // [out, in] for fc, [out_c, in_c, k, k] for conv, empty otherwise.
  Shape weight_shape() const;
  Shape bias_shape() const;
  size_t fan_in() const;
};

struct Topology {
  Shape input_shape;
  std::vector<LayerDescriptor> layers;

  size_t num_layers() const { return layers.size(); }
  const LayerDescriptor &output_layer() const { return layers.back(); }
};

// Walks `network_size` (input shape followed by layer tags) and threads the
// feature-map shape through every layer. Any inconsistency is reported as
// kInvalidArgument.
absl::StatusOr<Topology> BuildTopology(
    const std::vector<std::string> &network_size, bool multi_model);

// Trainable state of one layer replica. All tensors are empty for pooling
// and flatten layers.
struct LayerParams {
  Tensor weight;
  Tensor bias;
  Tensor weight_grad;
  Tensor bias_grad;
};

// Parameters of every (layer, model) pair.
class ParameterArena {
 public:
  ParameterArena() = default;
  ParameterArena(const Topology &topology, size_t num_models);

  size_t num_layers() const { return num_layers_; }
  size_t num_models() const { return num_models_; }

  LayerParams &at(size_t layer, size_t model);
  const LayerParams &at(size_t layer, size_t model) const;

  // Draws all weights from `config`'s initializer and zeroes biases and
  // gradients. Replicas are initialized layer by layer, model by model.
  void Initialize(const Topology &topology, const SnnConfig &config);

  void ZeroGrad();

 private:
  size_t num_layers_ = 0;
  size_t num_models_ = 0;
  std::vector<LayerParams> params_;
};

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_LAYERS_H_
