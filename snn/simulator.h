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

#ifndef SPIKEGRAD_SNN_SIMULATOR_H_
#define SPIKEGRAD_SNN_SIMULATOR_H_

#include <vector>

#include "absl/status/statusor.h"
#include "common/tensor.h"
#include "snn/config.h"
#include "snn/kernels.h"
#include "snn/layers.h"

namespace spikegrad {

// Lower bound of the voltage slope used by the timing rule.
constexpr double kMinVoltagePrime = 0.01;

// Firing threshold of every neuron.
constexpr double kFiringThreshold = 1.0;

// Spike counts and first output spike times of the last simulation.
struct SpikeStats {
  // [model][k] for the k-th conv/fc layer.
  std::vector<std::vector<double>> num_spike_total;
  // As above, only counting spikes at or before the row's first output spike.
  std::vector<std::vector<double>> num_spike_necessary;
  // Per row; equals the term length for rows whose output never spiked.
  VectorXd first_spike_time;
  // Per model.
  VectorXd first_spike_time_min;
  VectorXd first_spike_time_mean;
};

// Everything the backward pass needs from one forward run. Per-layer state is
// indexed as [layer][t] and every entry is a [rows, features...] tensor.
// Pooling and flatten layers only fill `spikes` (their transformed output).
struct SimulationTrace {
  // [rows, T, input features...]; rows are model-major.
  Tensor input;
  size_t num_models = 1;
  size_t batch_size = 0;  // Rows per model.
  size_t term_length = 0;

  std::vector<std::vector<Tensor>> current;
  std::vector<std::vector<Tensor>> voltage;
  std::vector<std::vector<Tensor>> voltage_prime;
  std::vector<std::vector<Tensor>> spikes;
  // Max-pool argmax offsets, [layer][t]; empty for other layers.
  std::vector<std::vector<std::vector<size_t>>> max_indices;

  // [rows, term_length, N].
  Tensor output;
  SpikeStats stats;

  size_t rows() const { return num_models * batch_size; }
  // Input of layer `l` at step `t`: the input slice or the previous layer's
  // output.
  Tensor LayerInput(size_t l, size_t t) const;
};

// Runs the network for `config.time_length` steps on `input`, which is
// [B, T, features...] or, for several models, [M, B, T, features...]. With a
// latency target the run stops as soon as every output neuron of every row
// has spiked once.
absl::StatusOr<SimulationTrace> Simulate(const SnnConfig &config,
                                         const Kernels &kernels,
                                         const Topology &topology,
                                         const ParameterArena &params,
                                         const Tensor &input);

// Fills `trace->stats` from the recorded spikes.
void ComputeSpikeStats(const Topology &topology, SimulationTrace *trace);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_SIMULATOR_H_
