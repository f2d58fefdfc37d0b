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

#include "snn/simulator.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "common/util.h"
#include "snn/ops.h"

namespace spikegrad {

namespace {

absl::Status CheckInputShape(const SnnConfig &config, const Topology &topology,
                             const Tensor &input) {
  const size_t lead = config.multi_model ? 2 : 1;
  const Shape &shape = input.shape();
  Shape expected_features = topology.input_shape;
  bool ok = shape.size() == lead + 1 + expected_features.size();
  if (ok) {
    Shape features(shape.begin() + lead + 1, shape.end());
    ok = features == expected_features &&
         shape[lead] == static_cast<size_t>(config.time_length);
  }
  if (ok && config.multi_model) {
    ok = shape[0] == static_cast<size_t>(config.num_models);
  }
  if (!ok) {
    Shape expected;
    if (config.multi_model) expected.push_back(config.num_models);
    expected.push_back(0);
    expected.push_back(config.time_length);
    expected.insert(expected.end(), expected_features.begin(),
                    expected_features.end());
    return absl::InvalidArgumentError(
        absl::StrCat("input shape ", input.ShapeString(), " does not match ",
                     ShapeToString(expected), " (0 = any batch size)"));
  }
  if (shape[lead - 1] == 0) {
    return absl::InvalidArgumentError("input batch is empty");
  }
  return absl::OkStatus();
}

// Applies the leaky integrate-and-fire update of a conv/fc layer at step `t`
// given the weighted input `drive` (before beta_i scaling).
void UpdateNeurons(const SnnConfig &config, const Kernels &kernels,
                   const LayerDescriptor &layer, const ParameterArena &params,
                   size_t l, size_t t, const Tensor &drive,
                   SimulationTrace *trace) {
  const size_t rows = drive.rows();
  const size_t row_size = drive.row_size();
  // Elements sharing one bias entry: a whole feature map for conv.
  const size_t bias_stride =
      layer.kind == LayerKind::kConv ? row_size / layer.output_shape[0] : 1;

  Tensor current(drive.shape());
  Tensor voltage(drive.shape());
  Tensor voltage_prime(drive.shape());
  Tensor spikes(drive.shape());
  const Tensor *prev_i = t > 0 ? &trace->current[l][t - 1] : nullptr;
  const Tensor *prev_v = t > 0 ? &trace->voltage[l][t - 1] : nullptr;
  const Tensor *prev_s = t > 0 ? &trace->spikes[l][t - 1] : nullptr;

  for (size_t r = 0; r < rows; ++r) {
    const Tensor &bias = params.at(l, r / trace->batch_size).bias;
    for (size_t e = 0; e < row_size; ++e) {
      const size_t i = r * row_size + e;
      double cur = kernels.beta_i * drive[i];
      if (prev_i) cur += config.alpha_i * (*prev_i)[i] * (1 - (*prev_s)[i]);
      double v = kernels.beta_bias * bias[e / bias_stride] +
                 kernels.beta_v * cur;
      double v_prime = v;
      if (prev_v) {
        v += config.alpha_v * (*prev_v)[i] * (1 - (*prev_s)[i]);
        v_prime = v - (*prev_v)[i] * (1 - (*prev_s)[i]);
      }
      current[i] = cur;
      voltage[i] = v;
      voltage_prime[i] = std::max(v_prime, kMinVoltagePrime);
      spikes[i] = v >= kFiringThreshold ? 1.0 : 0.0;
    }
  }
  trace->current[l].push_back(std::move(current));
  trace->voltage[l].push_back(std::move(voltage));
  trace->voltage_prime[l].push_back(std::move(voltage_prime));
  trace->spikes[l].push_back(std::move(spikes));
}

void Step(const SnnConfig &config, const Kernels &kernels,
          const Topology &topology, const ParameterArena &params, size_t t,
          SimulationTrace *trace) {
  for (size_t l = 0; l < topology.num_layers(); ++l) {
    const LayerDescriptor &layer = topology.layers[l];
    const Tensor x = trace->LayerInput(l, t);
    switch (layer.kind) {
      case LayerKind::kFc: {
        Tensor drive({x.rows(), layer.output_shape[0]});
        for (size_t m = 0; m < trace->num_models; ++m) {
          LinearForward(x, params.at(l, m).weight, m * trace->batch_size,
                        (m + 1) * trace->batch_size, &drive);
        }
        UpdateNeurons(config, kernels, layer, params, l, t, drive, trace);
        break;
      }
      case LayerKind::kConv: {
        Tensor drive =
            Conv2dForward(x, params.at(l, 0).weight, layer.padding);
        UpdateNeurons(config, kernels, layer, params, l, t, drive, trace);
        break;
      }
      case LayerKind::kAvgPool:
        trace->spikes[l].push_back(AvgPoolForward(x, layer.kernel_size));
        break;
      case LayerKind::kMaxPool: {
        std::vector<size_t> argmax;
        trace->spikes[l].push_back(
            MaxPoolForward(x, layer.kernel_size, &argmax));
        trace->max_indices[l].push_back(std::move(argmax));
        break;
      }
      case LayerKind::kFlatten:
        trace->spikes[l].push_back(x.Reshaped({x.rows(), x.row_size()}));
        break;
    }
  }
}

}  // namespace

Tensor SimulationTrace::LayerInput(size_t l, size_t t) const {
  Tensor x = l == 0 ? input.TimeSlice(t) : spikes[l - 1][t];
  SPIKEGRAD_CHECK(x.rank() == 2 || x.rank() == 4,
                  "Expected a state of rank 2 or 4, got ", x.ShapeString());
  return x;
}

absl::StatusOr<SimulationTrace> Simulate(const SnnConfig &config,
                                         const Kernels &kernels,
                                         const Topology &topology,
                                         const ParameterArena &params,
                                         const Tensor &input) {
  absl::Status status = CheckInputShape(config, topology, input);
  if (!status.ok()) return status;

  SimulationTrace trace;
  trace.num_models = config.multi_model ? config.num_models : 1;
  SPIKEGRAD_CHECK(params.num_models() == trace.num_models);
  const size_t lead = config.multi_model ? 2 : 1;
  trace.batch_size = input.dim(lead - 1);
  Shape collapsed = {trace.rows()};
  collapsed.insert(collapsed.end(), input.shape().begin() + lead,
                   input.shape().end());
  trace.input = input.Reshaped(collapsed);

  const size_t num_layers = topology.num_layers();
  trace.current.resize(num_layers);
  trace.voltage.resize(num_layers);
  trace.voltage_prime.resize(num_layers);
  trace.spikes.resize(num_layers);
  trace.max_indices.resize(num_layers);

  const size_t time_length = config.time_length;
  const bool early_exit = config.target_type == LossKind::kLatency;
  Tensor cumulative_output;
  if (early_exit) {
    cumulative_output =
        Tensor({trace.rows(), topology.output_layer().output_shape[0]});
  }

  trace.term_length = time_length;
  for (size_t t = 0; t < time_length; ++t) {
    Step(config, kernels, topology, params, t, &trace);
    if (!early_exit) continue;
    const Tensor &out = trace.spikes[num_layers - 1][t];
    bool all_spiked = true;
    for (size_t i = 0; i < out.size(); ++i) {
      cumulative_output[i] += out[i];
      if (cumulative_output[i] <= 0) all_spiked = false;
    }
    if (all_spiked) {
      trace.term_length = t + 1;
      break;
    }
  }

  trace.output = Tensor::StackTime(trace.spikes[num_layers - 1]);
  ComputeSpikeStats(topology, &trace);
  return trace;
}

void ComputeSpikeStats(const Topology &topology, SimulationTrace *trace) {
  const size_t term = trace->term_length;
  const size_t rows = trace->rows();
  const size_t batch = trace->batch_size;
  const Tensor &output = trace->output;
  const size_t n_out = output.dim(2);
  SpikeStats &stats = trace->stats;

  stats.first_spike_time.assign(rows, 0.0);
  for (size_t r = 0; r < rows; ++r) {
    double latest = 0.0;
    for (size_t t = 0; t < term; ++t) {
      for (size_t n = 0; n < n_out; ++n) {
        latest = std::max(latest, (term - t) * output.at({r, t, n}));
      }
    }
    stats.first_spike_time[r] = term - latest;
  }

  stats.first_spike_time_min.assign(trace->num_models, 0.0);
  stats.first_spike_time_mean.assign(trace->num_models, 0.0);
  for (size_t m = 0; m < trace->num_models; ++m) {
    auto begin = stats.first_spike_time.begin() + m * batch;
    stats.first_spike_time_min[m] = *std::min_element(begin, begin + batch);
    double sum = 0.0;
    for (auto it = begin; it != begin + batch; ++it) sum += *it;
    stats.first_spike_time_mean[m] = sum / batch;
  }

  stats.num_spike_total.assign(trace->num_models, std::vector<double>());
  stats.num_spike_necessary.assign(trace->num_models, std::vector<double>());
  for (size_t l = 0; l < topology.num_layers(); ++l) {
    if (!topology.layers[l].trainable()) continue;
    for (size_t m = 0; m < trace->num_models; ++m) {
      double total = 0.0;
      double necessary = 0.0;
      for (size_t t = 0; t < term; ++t) {
        const Tensor &spikes = trace->spikes[l][t];
        for (size_t r = m * batch; r < (m + 1) * batch; ++r) {
          const double *s = spikes.row(r);
          double count = 0.0;
          for (size_t e = 0; e < spikes.row_size(); ++e) count += s[e];
          total += count;
          if (t <= stats.first_spike_time[r]) necessary += count;
        }
      }
      stats.num_spike_total[m].push_back(total);
      stats.num_spike_necessary[m].push_back(necessary);
    }
  }
}

}  // namespace spikegrad
