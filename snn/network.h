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

#ifndef SPIKEGRAD_SNN_NETWORK_H_
#define SPIKEGRAD_SNN_NETWORK_H_

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/tensor.h"
#include "snn/config.h"
#include "snn/kernels.h"
#include "snn/layers.h"
#include "snn/loss.h"
#include "snn/simulator.h"

namespace spikegrad {

// A feed-forward spiking network together with its loss and learning rule.
//
// Typical use, once per training step:
//   auto output = network->Forward(input);
//   auto loss = network->ComputeLoss(target);
//   network->Backward(target);       // Fills params() gradients.
//   ... update params() ...
//
// Forward retains the simulation trace until Backward or ResetState. Calls
// on one instance must be serialized by the caller.
class SpikingNetwork {
 public:
  // Validates `config`, builds kernels and topology and initializes the
  // weights. Configuration problems are reported as kInvalidArgument.
  static absl::StatusOr<std::unique_ptr<SpikingNetwork>> Create(
      const SnnConfig &config);

  // Simulates `input` ([B, T, features...], or [M, B, T, features...] with
  // multiple models). Returns the output spike train [B, term, N] (or
  // [M, B, term, N]).
  absl::StatusOr<Tensor> Forward(const Tensor &input);

  // Loss of the retained output against `target`. Train and count targets
  // have the output's shape with the full time horizon; latency targets are
  // [B] (or [M, B]) class indices.
  absl::StatusOr<LossValue> ComputeLoss(const Tensor &target);

  // Computes the gradients of every trainable parameter for `target` and
  // releases the retained trace, whether or not it succeeds.
  absl::Status Backward(const Tensor &target);

  // Releases the retained trace.
  void ResetState();

  // Fraction of examples of the retained output classified correctly.
  absl::StatusOr<double> FracCorrect(const Tensor &target) const;

  ParameterArena &params() { return params_; }
  const ParameterArena &params() const { return params_; }
  const SnnConfig &config() const { return config_; }
  const Topology &topology() const { return topology_; }
  const Kernels &kernels() const { return kernels_; }
  size_t num_models() const { return params_.num_models(); }

  // Statistics and term length of the most recent Forward.
  const SpikeStats &spike_stats() const { return stats_; }
  size_t term_length() const { return term_length_; }
  bool has_trace() const { return trace_ != nullptr; }

 private:
  explicit SpikingNetwork(const SnnConfig &config) : config_(config) {}

  // Collapses a [M, B, ...] target of a multi-model network to [M * B, ...].
  absl::StatusOr<Tensor> CollapseTarget(const Tensor &target) const;

  SnnConfig config_;
  Kernels kernels_;
  Topology topology_;
  ParameterArena params_;
  std::unique_ptr<LossFunction> loss_;

  std::unique_ptr<SimulationTrace> trace_;
  SpikeStats stats_;
  size_t term_length_ = 0;
};

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_NETWORK_H_
