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


#ifndef SPIKEGRAD_SNN_TRAINER_H_
#define SPIKEGRAD_SNN_TRAINER_H_

#include <stdint.h>
#include <stdio.h>

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/tensor.h"
#include "snn/layers.h"
#include "snn/network.h"
#include "snn/problem.h"

namespace spikegrad {

enum class OptimizerKind { kAdam, kSgd };

struct LearningParams {
  double learning_rate = 0.001;
  size_t num_epochs = 10;
  size_t batch_size = 16;
  OptimizerKind optimizer = OptimizerKind::kAdam;
};

struct TrainingOutcome {
  double last_train_accuracy = 0.0;
  double last_validation_accuracy = 0.0;
  double best_validation_accuracy = 0.0;
  double elapsed_time = 0.0;
  ParameterArena best_params;
};

struct TestOutcome {
  double accuracy = 0.0;
  double loss = 0.0;
};

// An object implementing this interface can be used to execute code during
// training and at the end of each epoch, typically to report progress.
class TrainCallback {
 public:
  virtual void TrainProgress(size_t cur, size_t total) = 0;
  virtual void ValidProgress(size_t cur, size_t total) = 0;
  virtual void EpochDone(size_t epoch, float train_accuracy, float train_loss,
                         float valid_accuracy, float valid_loss,
                         float seconds) = 0;
  virtual ~TrainCallback() {}
};

// TrainCallback that prints training information on standard error.
class StderrTrainCallback : public TrainCallback {
 public:
  void TrainProgress(size_t cur, size_t total) override {
    fprintf(stderr, "T %9zu/%9zu\r", cur, total);
    fflush(stderr);
  }
  void ValidProgress(size_t cur, size_t total) override {
    fprintf(stderr, "V %9zu/%9zu\r", cur, total);
    fflush(stderr);
  }
  void EpochDone(size_t epoch, float train_accuracy, float train_loss,
                 float valid_accuracy, float valid_loss,
                 float seconds) override {
    fprintf(stderr,
            "E %10zu: train %6.2f%% / %10.5f, valid \033[;1m%6.2f%% / "
            "%10.5f\033[;m %8.3fs\n",
            epoch, train_accuracy, train_loss, valid_accuracy, valid_loss,
            seconds);
  }
};

// Similar to TrainCallback, but for test progress/results.
class TestCallback {
 public:
  virtual void TestProgress(size_t cur, size_t total) = 0;
  virtual void Done(float accuracy, float loss, float seconds) = 0;
  virtual ~TestCallback() {}
};

class StderrTestCallback : public TestCallback {
 public:
  void TestProgress(size_t cur, size_t total) override {
    fprintf(stderr, "T %9zu/%9zu\r", cur, total);
    fflush(stderr);
  }
  void Done(float accuracy, float loss, float seconds) override {
    fprintf(stderr, "Test accuracy: %.2f%%\nTest loss: %.5f\nElapsed: %8.3fs\n",
            accuracy, loss, seconds);
  }
};

// Builds the input and target batch of examples `ids[begin, end)`. A network
// with M models receives the same batch on every model, as [M, B, ...].
void MakeBatch(const Problem &problem, const std::vector<uint32_t> &ids,
               size_t begin, size_t end, size_t num_models, Tensor *input,
               Tensor *target);

// Trains `network` on `training`, one optimizer step per batch, and evaluates
// it on `validation` after every epoch. Accuracies are percentages and losses
// are averaged over batches and models.
absl::StatusOr<TrainingOutcome> TrainNetwork(
    const LearningParams &learning_params, const Problem &problem,
    const std::vector<uint32_t> &training,
    const std::vector<uint32_t> &validation, SpikingNetwork *network,
    TrainCallback *callback = nullptr);

// Runs `network` on `test` in batches of `batch_size` without training.
absl::StatusOr<TestOutcome> TestNetwork(const Problem &problem,
                                        const std::vector<uint32_t> &test,
                                        size_t batch_size,
                                        SpikingNetwork *network,
                                        TestCallback *callback = nullptr);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_TRAINER_H_
