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

#include "snn/network.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "common/util.h"
#include "snn/backward.h"

namespace spikegrad {

absl::StatusOr<std::unique_ptr<SpikingNetwork>> SpikingNetwork::Create(
    const SnnConfig &config) {
  absl::Status status = ValidateConfig(config);
  if (!status.ok()) return status;
  absl::StatusOr<Topology> topology =
      BuildTopology(config.network_size, config.multi_model);
  if (!topology.ok()) return topology.status();

  std::unique_ptr<SpikingNetwork> network(new SpikingNetwork(config));
  network->topology_ = *std::move(topology);
  network->kernels_ = InitKernels(config);
  network->params_ = ParameterArena(network->topology_, config.num_models);
  network->params_.Initialize(network->topology_, config);
  network->loss_ = MakeLossFunction(config, network->kernels_);
  return network;
}

absl::StatusOr<Tensor> SpikingNetwork::Forward(const Tensor &input) {
  ResetState();
  absl::StatusOr<SimulationTrace> trace =
      Simulate(config_, kernels_, topology_, params_, input);
  if (!trace.ok()) return trace.status();
  trace_.reset(new SimulationTrace(*std::move(trace)));
  stats_ = trace_->stats;
  term_length_ = trace_->term_length;

  if (!config_.multi_model) return trace_->output;
  Shape shape = trace_->output.shape();
  shape[0] = trace_->batch_size;
  shape.insert(shape.begin(), trace_->num_models);
  return trace_->output.Reshaped(shape);
}

absl::StatusOr<Tensor> SpikingNetwork::CollapseTarget(
    const Tensor &target) const {
  if (!config_.multi_model) return target;
  if (target.rank() < 2 ||
      target.dim(0) != static_cast<size_t>(config_.num_models)) {
    return absl::FailedPreconditionError(
        absl::StrCat("multi-model target must be [", config_.num_models,
                     ", B, ...], got ", target.ShapeString()));
  }
  Shape shape(target.shape().begin() + 1, target.shape().end());
  shape[0] *= target.dim(0);
  return target.Reshaped(shape);
}

absl::StatusOr<LossValue> SpikingNetwork::ComputeLoss(const Tensor &target) {
  if (!trace_) {
    return absl::FailedPreconditionError("ComputeLoss called before Forward");
  }
  absl::StatusOr<Tensor> collapsed = CollapseTarget(target);
  if (!collapsed.ok()) return collapsed.status();
  absl::StatusOr<LossResult> result =
      loss_->LossDerivative(trace_->output, *collapsed, trace_->num_models);
  if (!result.ok()) return result.status();
  return result->value;
}

absl::Status SpikingNetwork::Backward(const Tensor &target) {
  // Owning the trace locally releases it on every return path.
  std::unique_ptr<SimulationTrace> trace = std::move(trace_);
  if (!trace) {
    return absl::FailedPreconditionError("Backward called before Forward");
  }
  absl::StatusOr<Tensor> collapsed = CollapseTarget(target);
  if (!collapsed.ok()) return collapsed.status();
  absl::StatusOr<LossResult> seeds =
      loss_->LossDerivative(trace->output, *collapsed, trace->num_models);
  if (!seeds.ok()) return seeds.status();

  BackwardContext context{config_, kernels_, topology_, *trace, params_};
  return RunBackward(context, *seeds, &params_);
}

void SpikingNetwork::ResetState() { trace_.reset(); }

absl::StatusOr<double> SpikingNetwork::FracCorrect(const Tensor &target) const {
  if (!trace_) {
    return absl::FailedPreconditionError("FracCorrect called before Forward");
  }
  absl::StatusOr<Tensor> collapsed = CollapseTarget(target);
  if (!collapsed.ok()) return collapsed.status();
  absl::Status status = loss_->CheckTarget(trace_->output, *collapsed);
  if (!status.ok()) return status;
  return loss_->FracCorrect(trace_->output, *collapsed);
}

}  // namespace spikegrad
