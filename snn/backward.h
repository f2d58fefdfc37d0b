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

#ifndef SPIKEGRAD_SNN_BACKWARD_H_
#define SPIKEGRAD_SNN_BACKWARD_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/tensor.h"
#include "snn/config.h"
#include "snn/kernels.h"
#include "snn/layers.h"
#include "snn/loss.h"
#include "snn/simulator.h"

namespace spikegrad {

// Gradient state indexed as [layer][t], each entry shaped like the matching
// SimulationTrace state. Entries of non-trainable layers stay empty where the
// quantity does not exist for them.
typedef std::vector<std::vector<Tensor>> LayerTimeTensors;

// dL/dV, the decayed dL/dV (SRM and SLAYER styles) and dL/dI.
struct MembraneGradients {
  LayerTimeTensors voltage;
  LayerTimeTensors voltage_dep;
  LayerTimeTensors current;
};

// dL/dT and the two eligibility traces that carry it through the
// post-synaptic kernel.
struct TimingGradients {
  LayerTimeTensors time;
  LayerTimeTensors ef1;
  LayerTimeTensors ef2;
};

struct ActivationGradientTrace {
  MembraneGradients membrane;
  LayerTimeTensors spike;  // dL/dS
};

struct TimingGradientTrace {
  MembraneGradients membrane;
  TimingGradients timing;
};

struct AntlrGradientTrace {
  MembraneGradients membrane;
  LayerTimeTensors spike;
  TimingGradients timing;
};

// Network state and constants shared by all learning rules.
struct BackwardContext {
  const SnnConfig &config;
  const Kernels &kernels;
  const Topology &topology;
  const SimulationTrace &trace;
  const ParameterArena &params;
};

// surr_alpha * exp(-surr_beta * |v - 1|), the pseudo-derivative of the
// spike nonlinearity.
double Surrogate(double voltage, double surr_alpha, double surr_beta);

// Runs the recurrences of each rule backwards over time and layers.
void BackpropActivation(const BackwardContext &context, DecayStyle style,
                        const LossResult &seeds,
                        ActivationGradientTrace *gradients);
void BackpropTiming(const BackwardContext &context, const LossResult &seeds,
                    TimingGradientTrace *gradients);
void BackpropAntlr(const BackwardContext &context, const LossResult &seeds,
                   AntlrGradientTrace *gradients);

// Overwrites weight_grad and bias_grad of every trainable (layer, model) pair
// from dL/dI and the (decayed) dL/dV. With `timing_penalty`, fc weights of
// neurons that never fired are additionally pushed up.
void AccumulateParameterGradients(const BackwardContext &context,
                                  DecayStyle style,
                                  const MembraneGradients &membrane,
                                  bool timing_penalty, ParameterArena *params);

// Replaces every NaN of `tensor` by zero and returns how many were found.
size_t ReplaceNaNWithZero(Tensor *tensor);

// Clip bound of model `model` out of `num_models`. A list longer than one is
// spread evenly over the models; its length must divide `num_models`.
absl::StatusOr<double> GradClipForModel(const std::vector<double> &grad_clip,
                                        size_t model, size_t num_models);

// Clamps all gradients of model m to [-|c_m|, |c_m|].
absl::Status ClipGradients(const std::vector<double> &grad_clip,
                           ParameterArena *params);

// Full backward pass: runs the configured rule, writes the parameter
// gradients (NaNs zeroed with a warning) and clips them.
absl::Status RunBackward(const BackwardContext &context,
                         const LossResult &seeds, ParameterArena *params);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_BACKWARD_H_
