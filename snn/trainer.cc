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


#include "snn/trainer.h"

#include <algorithm>
#include <functional>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "common/util.h"
#include "snn/optimizer.h"

namespace spikegrad {

namespace {

// Stacks `copies` copies of `batch` into a [copies, B, ...] tensor.
Tensor Replicate(const Tensor &batch, size_t copies) {
  std::vector<Tensor> parts(copies, batch);
  Shape shape = batch.shape();
  shape.insert(shape.begin(), copies);
  return Tensor::ConcatRows(parts).Reshaped(shape);
}

double Percentage(double correct, size_t total) {
  return total == 0 ? 0.0 : 100.0 * correct / total;
}

// Runs examples [begin, end) through the network, adding the per-model loss
// to `loss` and the number of correctly classified examples to `correct`.
// The trace is kept for a following Backward.
absl::Status RunBatch(const Problem &problem, const std::vector<uint32_t> &ids,
                      size_t begin, size_t end, SpikingNetwork *network,
                      Tensor *target, double *loss, double *correct) {
  Tensor input;
  MakeBatch(problem, ids, begin, end, network->num_models(), &input, target);
  absl::StatusOr<Tensor> output = network->Forward(input);
  if (!output.ok()) return output.status();
  absl::StatusOr<LossValue> value = network->ComputeLoss(*target);
  if (!value.ok()) return value.status();
  absl::StatusOr<double> frac_correct = network->FracCorrect(*target);
  if (!frac_correct.ok()) return frac_correct.status();
  *loss += value->total / network->num_models();
  *correct += *frac_correct * (end - begin);
  return absl::OkStatus();
}

// Evaluates the network on `ids` without touching its gradients.
absl::Status Evaluate(const Problem &problem, const std::vector<uint32_t> &ids,
                      size_t batch_size, SpikingNetwork *network,
                      double *loss, double *correct,
                      const std::function<void(size_t)> &progress) {
  size_t num_batches = 0;
  Tensor target;
  for (size_t batch = 0; batch < ids.size(); batch += batch_size) {
    const size_t batch_end = std::min(batch + batch_size, ids.size());
    absl::Status status = RunBatch(problem, ids, batch, batch_end, network,
                                   &target, loss, correct);
    network->ResetState();
    if (!status.ok()) return status;
    num_batches++;
    if (progress) progress(batch_end);
  }
  if (num_batches > 0) *loss /= num_batches;
  return absl::OkStatus();
}

}  // namespace

void MakeBatch(const Problem &problem, const std::vector<uint32_t> &ids,
               size_t begin, size_t end, size_t num_models, Tensor *input,
               Tensor *target) {
  SPIKEGRAD_CHECK(begin < end && end <= ids.size());
  std::vector<Tensor> inputs(end - begin);
  std::vector<Tensor> targets(end - begin);
  for (size_t i = begin; i < end; i++) {
    problem.Example(ids[i], &inputs[i - begin], &targets[i - begin]);
  }
  *input = Tensor::ConcatRows(inputs);
  *target = Tensor::ConcatRows(targets);
  if (num_models > 1) {
    *input = Replicate(*input, num_models);
    *target = Replicate(*target, num_models);
  }
}

absl::StatusOr<TrainingOutcome> TrainNetwork(
    const LearningParams &learning_params, const Problem &problem,
    const std::vector<uint32_t> &training,
    const std::vector<uint32_t> &validation, SpikingNetwork *network,
    TrainCallback *callback) {
  SPIKEGRAD_CHECK(learning_params.batch_size > 0);
  TrainingOutcome training_outcome;
  training_outcome.best_params = network->params();
  AdamOptimizer adam(network->params());
  Tensor target;

  for (size_t epoch = 0; epoch < learning_params.num_epochs; epoch++) {
    const absl::Time epoch_start = absl::Now();
    double train_loss = 0.0;
    double train_correct = 0.0;
    size_t num_batches = 0;
    for (size_t batch = 0; batch < training.size();
         batch += learning_params.batch_size) {
      const size_t batch_end =
          std::min(batch + learning_params.batch_size, training.size());
      absl::Status status = RunBatch(problem, training, batch, batch_end,
                                     network, &target, &train_loss,
                                     &train_correct);
      if (!status.ok()) {
        network->ResetState();
        return status;
      }
      status = network->Backward(target);
      if (!status.ok()) {
        network->ResetState();
        return status;
      }
      if (learning_params.optimizer == OptimizerKind::kAdam) {
        adam.Step(learning_params.learning_rate, &network->params());
      } else {
        SgdUpdate(learning_params.learning_rate, &network->params());
      }
      num_batches++;
      if (callback) callback->TrainProgress(batch_end, training.size());
    }
    if (num_batches > 0) train_loss /= num_batches;

    double validation_loss = 0.0;
    double validation_correct = 0.0;
    absl::Status status = Evaluate(
        problem, validation, learning_params.batch_size, network,
        &validation_loss, &validation_correct, [&](size_t done) {
          if (callback) callback->ValidProgress(done, validation.size());
        });
    if (!status.ok()) return status;

    const double training_accuracy = Percentage(train_correct, training.size());
    const double validation_accuracy =
        Percentage(validation_correct, validation.size());
    if (validation_accuracy > training_outcome.best_validation_accuracy) {
      training_outcome.best_validation_accuracy = validation_accuracy;
      training_outcome.best_params = network->params();
    }

    const double elapsed = absl::ToDoubleSeconds(absl::Now() - epoch_start);
    if (callback) {
      callback->EpochDone(epoch, training_accuracy, train_loss,
                          validation_accuracy, validation_loss, elapsed);
    }
    training_outcome.last_train_accuracy = training_accuracy;
    training_outcome.last_validation_accuracy = validation_accuracy;
    training_outcome.elapsed_time += elapsed;
  }
  return training_outcome;
}

absl::StatusOr<TestOutcome> TestNetwork(const Problem &problem,
                                        const std::vector<uint32_t> &test,
                                        size_t batch_size,
                                        SpikingNetwork *network,
                                        TestCallback *callback) {
  SPIKEGRAD_CHECK(batch_size > 0);
  const absl::Time start = absl::Now();
  TestOutcome outcome;
  double correct = 0.0;
  absl::Status status =
      Evaluate(problem, test, batch_size, network, &outcome.loss, &correct,
               [&](size_t done) {
                 if (callback) callback->TestProgress(done, test.size());
               });
  if (!status.ok()) return status;
  outcome.accuracy = Percentage(correct, test.size());
  if (callback) {
    callback->Done(outcome.accuracy, outcome.loss,
                   absl::ToDoubleSeconds(absl::Now() - start));
  }
  return outcome;
}

}  // namespace spikegrad
