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

#ifndef SPIKEGRAD_SNN_LOSS_H_
#define SPIKEGRAD_SNN_LOSS_H_

#include <algorithm>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/tensor.h"
#include "snn/config.h"
#include "snn/kernels.h"

namespace spikegrad {

struct LossValue {
  // Sum of the per-model losses.
  double total = 0.0;
  VectorXd per_model;
};

// Loss and the gradients that seed the backward pass. Seeds are time-major:
// one [rows, N] tensor per simulated step.
struct LossResult {
  LossValue value;
  std::vector<Tensor> dl_ds;
  std::vector<Tensor> dl_dt;
};

// All losses work on the collapsed output spike train ([rows, term, N]) of
// `num_models` models owning equal, consecutive row ranges, and normalize by
// the per-model batch size.
class LossFunction {
 public:
  virtual ~LossFunction() = default;

  // Checks that `target` fits `output`. A mismatching shape is reported as
  // kFailedPrecondition.
  virtual absl::Status CheckTarget(const Tensor &output,
                                   const Tensor &target) const = 0;

  virtual absl::StatusOr<LossResult> LossDerivative(
      const Tensor &output, const Tensor &target, size_t num_models) const = 0;

  // Fraction of rows whose predicted class matches the target.
  virtual double FracCorrect(const Tensor &output,
                             const Tensor &target) const = 0;
};

// Squared distance between the alpha-kernel smoothed output and target spike
// trains; target is [rows, T, N].
class SpikeTrainLoss : public LossFunction {
 public:
  SpikeTrainLoss(const Kernels &kernels, int time_length)
      : alpha_(kernels.alpha),
        alpha_prime_(kernels.alpha_prime),
        length_(std::min<size_t>(time_length + kernels.alpha_extend,
                                 time_length + kernels.alpha.size() - 1)) {}

  absl::Status CheckTarget(const Tensor &output,
                           const Tensor &target) const override;
  absl::StatusOr<LossResult> LossDerivative(const Tensor &output,
                                            const Tensor &target,
                                            size_t num_models) const override;
  double FracCorrect(const Tensor &output,
                     const Tensor &target) const override;

 protected:
  // Smoothed difference between output and target of one row and neuron.
  VectorXd Difference(const Tensor &output, const Tensor &target, size_t row,
                      size_t neuron) const;

  VectorXd alpha_;
  VectorXd alpha_prime_;
  size_t length_;
};

// Squared difference of the spike counts, i.e. of the last entry of the
// smoothed difference with a flat kernel. Target is a [rows, T, N] spike
// train of which only the totals matter.
class SpikeCountLoss : public SpikeTrainLoss {
 public:
  SpikeCountLoss(const Kernels &kernels, int time_length)
      : SpikeTrainLoss(kernels, time_length) {}

  absl::StatusOr<LossResult> LossDerivative(const Tensor &output,
                                            const Tensor &target,
                                            size_t num_models) const override;
};

// Cross-entropy over softmax_beta * (term - first spike time), plus a penalty
// for rows whose target neuron never fired. Target is [rows] of class
// indices.
class LatencyLoss : public LossFunction {
 public:
  LatencyLoss(double softmax_beta, double lambda_nospike)
      : softmax_beta_(softmax_beta), lambda_nospike_(lambda_nospike) {}

  absl::Status CheckTarget(const Tensor &output,
                           const Tensor &target) const override;
  absl::StatusOr<LossResult> LossDerivative(const Tensor &output,
                                            const Tensor &target,
                                            size_t num_models) const override;
  double FracCorrect(const Tensor &output,
                     const Tensor &target) const override;

 private:
  double softmax_beta_;
  double lambda_nospike_;
};

std::unique_ptr<LossFunction> MakeLossFunction(const SnnConfig &config,
                                                const Kernels &kernels);

// Full convolution of `signal` with `kernel`, truncated to `length` entries:
// result[n] = sum_j kernel[j] * signal[n - j].
VectorXd ConvolveTruncated(const VectorXd &signal, const VectorXd &kernel,
                           size_t length);

// Cross-entropy of softmax(`logits`) against `label`. Fills `d_logits` with
// softmax(logits) - onehot(label).
double SoftmaxCrossEntropy(const VectorXd &logits, size_t label,
                           VectorXd *d_logits);

// Per row and neuron: max_t(output[r, t, n] * (term - t)), which is zero for
// neurons that never fired.
Tensor LatencyScores(const Tensor &output);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_LOSS_H_
