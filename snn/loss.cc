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

#include "snn/loss.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"
#include "common/util.h"

namespace spikegrad {

namespace {

// Index of the first largest entry of `values`.
size_t ArgMax(const VectorXd &values) {
  size_t best = 0;
  for (size_t i = 1; i < values.size(); i++) {
    if (values[i] > values[best]) best = i;
  }
  return best;
}

// Per-neuron spike totals of row `r` of a [rows, T, N] spike train.
VectorXd SpikeCounts(const Tensor &train, size_t r) {
  VectorXd counts(train.dim(2), 0.0);
  for (size_t t = 0; t < train.dim(1); t++) {
    for (size_t n = 0; n < train.dim(2); n++) counts[n] += train.at({r, t, n});
  }
  return counts;
}

// Empty seeds: `steps` tensors of shape [rows, N].
std::vector<Tensor> ZeroSeeds(size_t steps, size_t rows, size_t n) {
  return std::vector<Tensor>(steps, Tensor({rows, n}));
}

size_t BatchPerModel(const Tensor &output, size_t num_models) {
  SPIKEGRAD_CHECK(num_models > 0 && output.rows() % num_models == 0,
                  "Cannot split ", output.rows(), " rows into ", num_models,
                  " models");
  return output.rows() / num_models;
}

void SumPerModel(LossValue *value) {
  value->total = 0.0;
  for (double l : value->per_model) value->total += l;
}

}  // namespace

VectorXd ConvolveTruncated(const VectorXd &signal, const VectorXd &kernel,
                           size_t length) {
  VectorXd result(length, 0.0);
  for (size_t n = 0; n < length; n++) {
    double sum = 0.0;
    for (size_t j = 0; j < kernel.size() && j <= n; j++) {
      if (n - j < signal.size()) sum += kernel[j] * signal[n - j];
    }
    result[n] = sum;
  }
  return result;
}

double SoftmaxCrossEntropy(const VectorXd &logits, size_t label,
                           VectorXd *d_logits) {
  SPIKEGRAD_CHECK(label < logits.size());
  double max_logit = logits[0];
  for (double z : logits) max_logit = std::max(max_logit, z);
  double exp_sum = 0.0;
  d_logits->resize(logits.size());
  for (size_t i = 0; i < logits.size(); i++) {
    (*d_logits)[i] = std::exp(logits[i] - max_logit);
    exp_sum += (*d_logits)[i];
  }
  for (size_t i = 0; i < logits.size(); i++) {
    (*d_logits)[i] /= exp_sum;
    if (i == label) (*d_logits)[i] -= 1.0;
  }
  return max_logit + std::log(exp_sum) - logits[label];
}

Tensor LatencyScores(const Tensor &output) {
  SPIKEGRAD_CHECK(output.rank() == 3);
  const size_t rows = output.dim(0);
  const size_t term = output.dim(1);
  const size_t n_out = output.dim(2);
  Tensor scores({rows, n_out});
  for (size_t r = 0; r < rows; r++) {
    for (size_t t = 0; t < term; t++) {
      for (size_t n = 0; n < n_out; n++) {
        const double s = output.at({r, t, n}) * (term - t);
        if (s > scores[r * n_out + n]) scores[r * n_out + n] = s;
      }
    }
  }
  return scores;
}

absl::Status SpikeTrainLoss::CheckTarget(const Tensor &output,
                                         const Tensor &target) const {
  if (output.shape() != target.shape()) {
    return absl::FailedPreconditionError(
        absl::StrCat("output/target shape mismatch: ", output.ShapeString(),
                     " vs ", target.ShapeString()));
  }
  return absl::OkStatus();
}

VectorXd SpikeTrainLoss::Difference(const Tensor &output, const Tensor &target,
                                    size_t row, size_t neuron) const {
  const size_t steps = output.dim(1);
  VectorXd delta(steps);
  for (size_t t = 0; t < steps; t++) {
    delta[t] = output.at({row, t, neuron}) - target.at({row, t, neuron});
  }
  return ConvolveTruncated(delta, alpha_, length_);
}

absl::StatusOr<LossResult> SpikeTrainLoss::LossDerivative(
    const Tensor &output, const Tensor &target, size_t num_models) const {
  absl::Status status = CheckTarget(output, target);
  if (!status.ok()) return status;
  const size_t batch = BatchPerModel(output, num_models);
  const size_t rows = output.dim(0);
  const size_t steps = output.dim(1);
  const size_t n_out = output.dim(2);
  const double scale = 1.0 / (steps * batch);

  LossResult result;
  result.value.per_model.assign(num_models, 0.0);
  result.dl_ds = ZeroSeeds(steps, rows, n_out);
  result.dl_dt = ZeroSeeds(steps, rows, n_out);
  for (size_t r = 0; r < rows; r++) {
    for (size_t n = 0; n < n_out; n++) {
      const VectorXd diff = Difference(output, target, r, n);
      double squared = 0.0;
      for (double d : diff) squared += d * d;
      result.value.per_model[r / batch] += squared * scale;

      for (size_t t = 0; t < steps; t++) {
        double ds = 0.0;
        for (size_t k = 0; k < alpha_.size() && t + k < diff.size(); k++) {
          ds += diff[t + k] * alpha_[k];
        }
        result.dl_ds[t][r * n_out + n] = 2 * scale * ds;

        const double spike = output.at({r, t, n});
        if (spike == 0.0) continue;
        // Shifting a spike moves the smoothed train by the kernel's slope.
        double dt = 0.0;
        for (size_t k = 0; k < alpha_prime_.size(); k++) {
          if (t + k == 0 || t + k - 1 >= diff.size()) continue;
          dt += diff[t + k - 1] * alpha_prime_[k];
        }
        result.dl_dt[t][r * n_out + n] = spike * (-2 * scale) * dt;
      }
    }
  }
  SumPerModel(&result.value);
  return result;
}

double SpikeTrainLoss::FracCorrect(const Tensor &output,
                                   const Tensor &target) const {
  SPIKEGRAD_CHECK(output.shape() == target.shape());
  if (output.rows() == 0) return 0.0;
  double correct = 0;
  for (size_t r = 0; r < output.rows(); r++) {
    correct += ArgMax(SpikeCounts(output, r)) == ArgMax(SpikeCounts(target, r));
  }
  return correct / output.rows();
}

absl::StatusOr<LossResult> SpikeCountLoss::LossDerivative(
    const Tensor &output, const Tensor &target, size_t num_models) const {
  absl::Status status = CheckTarget(output, target);
  if (!status.ok()) return status;
  const size_t batch = BatchPerModel(output, num_models);
  const size_t rows = output.dim(0);
  const size_t steps = output.dim(1);
  const size_t n_out = output.dim(2);
  const double scale = 1.0 / (steps * batch);

  LossResult result;
  result.value.per_model.assign(num_models, 0.0);
  result.dl_ds = ZeroSeeds(steps, rows, n_out);
  result.dl_dt = ZeroSeeds(steps, rows, n_out);
  for (size_t r = 0; r < rows; r++) {
    for (size_t n = 0; n < n_out; n++) {
      const double last = Difference(output, target, r, n).back();
      result.value.per_model[r / batch] += last * last * scale;
      for (size_t t = 0; t < steps; t++) {
        result.dl_ds[t][r * n_out + n] = 2 * scale * last;
      }
    }
  }
  SumPerModel(&result.value);
  return result;
}

absl::Status LatencyLoss::CheckTarget(const Tensor &output,
                                      const Tensor &target) const {
  if (target.rank() != 1 || target.dim(0) != output.rows()) {
    return absl::FailedPreconditionError(
        absl::StrCat("output/target shape mismatch: ", output.ShapeString(),
                     " vs ", target.ShapeString()));
  }
  return absl::OkStatus();
}

absl::StatusOr<LossResult> LatencyLoss::LossDerivative(
    const Tensor &output, const Tensor &target, size_t num_models) const {
  absl::Status status = CheckTarget(output, target);
  if (!status.ok()) return status;
  const size_t batch = BatchPerModel(output, num_models);
  const size_t rows = output.dim(0);
  const size_t term = output.dim(1);
  const size_t n_out = output.dim(2);

  std::vector<size_t> labels(rows);
  for (size_t r = 0; r < rows; r++) {
    const double label = target[r];
    if (label < 0 || label >= n_out || label != std::floor(label)) {
      return absl::InvalidArgumentError(
          absl::StrCat("invalid class index ", label, " for ", n_out,
                       " outputs"));
    }
    labels[r] = static_cast<size_t>(label);
  }

  const Tensor scores = LatencyScores(output);
  LossResult result;
  result.value.per_model.assign(num_models, 0.0);
  result.dl_ds = ZeroSeeds(term, rows, n_out);
  result.dl_dt = ZeroSeeds(term, rows, n_out);
  VectorXd logits(n_out);
  VectorXd d_logits;
  for (size_t r = 0; r < rows; r++) {
    const double *score = scores.row(r);
    for (size_t n = 0; n < n_out; n++) logits[n] = softmax_beta_ * score[n];
    const double cross_entropy =
        SoftmaxCrossEntropy(logits, labels[r], &d_logits);
    const double no_spike = score[labels[r]] == 0.0 ? 1.0 : 0.0;
    result.value.per_model[r / batch] +=
        cross_entropy / batch + lambda_nospike_ * no_spike / batch;

    // A silent target neuron is pushed to fire at every step.
    for (size_t t = 0; t < term; t++) {
      result.dl_ds[t][r * n_out + labels[r]] =
          -lambda_nospike_ * no_spike / batch;
    }
    // The cross-entropy gradient lands on each neuron's first spike.
    for (size_t n = 0; n < n_out; n++) {
      if (score[n] == 0.0) continue;
      const double first = std::min(std::max(term - score[n], 0.0),
                                    static_cast<double>(term - 1));
      const size_t t_first = static_cast<size_t>(first);
      result.dl_dt[t_first][r * n_out + n] =
          -softmax_beta_ * d_logits[n] / batch;
    }
  }
  SumPerModel(&result.value);
  return result;
}

double LatencyLoss::FracCorrect(const Tensor &output,
                                const Tensor &target) const {
  SPIKEGRAD_CHECK(target.rank() == 1 && target.dim(0) == output.rows());
  if (output.rows() == 0) return 0.0;
  const Tensor scores = LatencyScores(output);
  const size_t n_out = scores.dim(1);
  double correct = 0;
  for (size_t r = 0; r < output.rows(); r++) {
    VectorXd row(scores.row(r), scores.row(r) + n_out);
    const size_t predicted = ArgMax(row);
    correct += row[predicted] > 0 && predicted == target[r];
  }
  return correct / output.rows();
}

std::unique_ptr<LossFunction> MakeLossFunction(const SnnConfig &config,
                                                const Kernels &kernels) {
  switch (config.target_type) {
    case LossKind::kTrain:
      return std::unique_ptr<LossFunction>(
          new SpikeTrainLoss(kernels, config.time_length));
    case LossKind::kCount:
      return std::unique_ptr<LossFunction>(
          new SpikeCountLoss(kernels, config.time_length));
    case LossKind::kLatency:
      return std::unique_ptr<LossFunction>(
          new LatencyLoss(config.softmax_beta, config.lambda_nospike));
  }
  SPIKEGRAD_LOG(LogSeverity::FATAL, "unknown loss kind");
  return nullptr;
}

}  // namespace spikegrad
