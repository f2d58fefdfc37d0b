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

#include "gtest/gtest.h"
#include "snn/problem.h"

namespace spikegrad {
namespace {

RatePatternProblem::Options SmallProblem(LossKind target_type) {
  RatePatternProblem::Options options;
  options.num_inputs = 6;
  options.num_classes = 2;
  options.time_length = 12;
  options.target_type = target_type;
  options.max_input_rate = 0.5;
  options.target_period = 4;
  options.n_train = 10;
  options.n_validation = 4;
  options.n_test = 5;
  return options;
}

TEST(ProblemTest, ExamplesAreDeterministic) {
  RatePatternProblem problem(SmallProblem(LossKind::kCount));
  EXPECT_EQ(problem.NumInputs(), 6);
  EXPECT_EQ(problem.NumOutputs(), 2);
  Tensor input_a, target_a, input_b, target_b;
  problem.Example(17, &input_a, &target_a);
  problem.Example(17, &input_b, &target_b);
  EXPECT_EQ(input_a.shape(), Shape({1, 12, 6}));
  EXPECT_EQ(input_a.values(), input_b.values());
  EXPECT_EQ(target_a.values(), target_b.values());
}

TEST(ProblemTest, TrainTargetFiresOnLabelNeuron) {
  RatePatternProblem problem(SmallProblem(LossKind::kTrain));
  Tensor input, target;
  problem.Example(3, &input, &target);
  const size_t label = problem.Label(3);
  ASSERT_EQ(target.shape(), Shape({1, 12, 2}));
  for (size_t t = 0; t < 12; ++t) {
    EXPECT_EQ(target.at({0, t, label}), t % 4 == 0 ? 1.0 : 0.0);
    EXPECT_EQ(target.at({0, t, 1 - label}), 0.0);
  }
}

TEST(ProblemTest, LatencyTargetIsClassIndex) {
  RatePatternProblem problem(SmallProblem(LossKind::kLatency));
  Tensor input, target;
  problem.Example(5, &input, &target);
  ASSERT_EQ(target.shape(), Shape({1}));
  EXPECT_EQ(target[0], problem.Label(5));
}

TEST(ProblemTest, SpatialInputKeepsFeatureShape) {
  RatePatternProblem::Options options = SmallProblem(LossKind::kCount);
  options.input_shape = {1, 4, 4};
  RatePatternProblem problem(options);
  EXPECT_EQ(problem.NumInputs(), 16);
  Tensor input, target;
  problem.Example(9, &input, &target);
  EXPECT_EQ(input.shape(), Shape({1, 12, 1, 4, 4}));
  EXPECT_EQ(target.shape(), Shape({1, 12, 2}));
}

TEST(ProblemTest, SplitIsSeeded) {
  RatePatternProblem problem(SmallProblem(LossKind::kCount));
  std::vector<uint32_t> train_a, valid_a, test_a, train_b, valid_b, test_b;
  problem.Split(1, &train_a, &valid_a, &test_a);
  problem.Split(1, &train_b, &valid_b, &test_b);
  EXPECT_EQ(train_a.size(), 10);
  EXPECT_EQ(valid_a.size(), 4);
  EXPECT_EQ(test_a.size(), 5);
  EXPECT_EQ(train_a, train_b);
  EXPECT_EQ(test_a, test_b);
}

TEST(TrainerTest, MakeBatchReplicatesForModels) {
  RatePatternProblem problem(SmallProblem(LossKind::kLatency));
  std::vector<uint32_t> train, valid, test;
  problem.Split(2, &train, &valid, &test);
  Tensor input, target;
  MakeBatch(problem, train, 2, 5, 2, &input, &target);
  EXPECT_EQ(input.shape(), Shape({2, 3, 12, 6}));
  EXPECT_EQ(target.shape(), Shape({2, 3}));
  for (size_t b = 0; b < 3; ++b) {
    EXPECT_EQ(target.at({0, b}), target.at({1, b}));
    EXPECT_EQ(target.at({0, b}), problem.Label(train[2 + b]));
  }
}

// Records every callback invocation.
class CountingCallback : public TrainCallback, public TestCallback {
 public:
  void TrainProgress(size_t cur, size_t total) override { train_steps++; }
  void ValidProgress(size_t cur, size_t total) override { valid_steps++; }
  void EpochDone(size_t epoch, float train_accuracy, float train_loss,
                 float valid_accuracy, float valid_loss,
                 float seconds) override {
    epochs++;
    EXPECT_GE(train_accuracy, 0.0f);
    EXPECT_LE(train_accuracy, 100.0f);
  }
  void TestProgress(size_t cur, size_t total) override { test_steps++; }
  void Done(float accuracy, float loss, float seconds) override { done++; }

  int train_steps = 0;
  int valid_steps = 0;
  int epochs = 0;
  int test_steps = 0;
  int done = 0;
};

TEST(TrainerTest, TrainsAndTestsEveryRule) {
  for (LossKind kind :
       {LossKind::kCount, LossKind::kTrain, LossKind::kLatency}) {
    for (LearningRule rule : {LearningRule::kActivation, LearningRule::kTiming,
                              LearningRule::kAntlr}) {
      RatePatternProblem problem(SmallProblem(kind));
      std::vector<uint32_t> train, valid, test;
      problem.Split(3, &train, &valid, &test);

      SnnConfig config;
      config.network_size = {"6", "fc4", "fc2"};
      config.time_length = 12;
      config.target_type = kind;
      config.lrule = rule;
      config.weight_bias = 0.3;
      absl::StatusOr<std::unique_ptr<SpikingNetwork>> network =
          SpikingNetwork::Create(config);
      ASSERT_TRUE(network.ok());

      LearningParams learning_params;
      learning_params.num_epochs = 2;
      learning_params.batch_size = 4;
      CountingCallback callback;
      absl::StatusOr<TrainingOutcome> outcome =
          TrainNetwork(learning_params, problem, train, valid,
                       network->get(), &callback);
      ASSERT_TRUE(outcome.ok()) << outcome.status();
      EXPECT_EQ(callback.epochs, 2);
      // Ten examples in batches of four.
      EXPECT_EQ(callback.train_steps, 6);
      EXPECT_EQ(callback.valid_steps, 2);
      EXPECT_GE(outcome->best_validation_accuracy,
                outcome->last_validation_accuracy);
      EXPECT_EQ(outcome->best_params.num_models(), 1);

      absl::StatusOr<TestOutcome> tested =
          TestNetwork(problem, test, 2, network->get(), &callback);
      ASSERT_TRUE(tested.ok()) << tested.status();
      EXPECT_EQ(callback.test_steps, 3);
      EXPECT_EQ(callback.done, 1);
      EXPECT_GE(tested->accuracy, 0.0);
      EXPECT_LE(tested->accuracy, 100.0);
      EXPECT_FALSE((*network)->has_trace());
    }
  }
}

TEST(TrainerTest, TrainsConvolutionalNetwork) {
  for (const char *pool : {"apool2", "mpool2"}) {
    SnnConfig config;
    config.network_size = {"1x4x4", "conv2c3", pool, "flatten", "fc2"};
    config.time_length = 12;
    config.weight_bias = 0.3;
    absl::StatusOr<std::unique_ptr<SpikingNetwork>> network =
        SpikingNetwork::Create(config);
    ASSERT_TRUE(network.ok()) << network.status();

    RatePatternProblem::Options options = SmallProblem(LossKind::kCount);
    options.input_shape = (*network)->topology().input_shape;
    RatePatternProblem problem(options);
    std::vector<uint32_t> train, valid, test;
    problem.Split(5, &train, &valid, &test);

    LearningParams learning_params;
    learning_params.num_epochs = 1;
    learning_params.batch_size = 4;
    CountingCallback callback;
    absl::StatusOr<TrainingOutcome> outcome =
        TrainNetwork(learning_params, problem, train, valid, network->get(),
                     &callback);
    ASSERT_TRUE(outcome.ok()) << outcome.status();
    EXPECT_EQ(callback.train_steps, 3);
    EXPECT_EQ(callback.epochs, 1);

    absl::StatusOr<TestOutcome> tested =
        TestNetwork(problem, test, 5, network->get());
    ASSERT_TRUE(tested.ok()) << tested.status();
  }
}

TEST(TrainerTest, FailedBatchReleasesTrace) {
  // Three target classes for a network with two outputs: the forward pass
  // succeeds and the loss rejects the target.
  RatePatternProblem::Options options = SmallProblem(LossKind::kTrain);
  options.num_classes = 3;
  RatePatternProblem problem(options);
  std::vector<uint32_t> train, valid, test;
  problem.Split(6, &train, &valid, &test);
  SnnConfig config;
  config.network_size = {"6", "fc2"};
  config.time_length = 12;
  config.target_type = LossKind::kTrain;
  absl::StatusOr<std::unique_ptr<SpikingNetwork>> network =
      SpikingNetwork::Create(config);
  ASSERT_TRUE(network.ok());

  LearningParams learning_params;
  learning_params.num_epochs = 1;
  absl::StatusOr<TrainingOutcome> outcome = TrainNetwork(
      learning_params, problem, train, valid, network->get());
  EXPECT_EQ(outcome.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_FALSE((*network)->has_trace());

  absl::StatusOr<TestOutcome> tested =
      TestNetwork(problem, test, 2, network->get());
  EXPECT_EQ(tested.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_FALSE((*network)->has_trace());
}

TEST(TrainerTest, SgdTrainingOfMultipleModels) {
  RatePatternProblem problem(SmallProblem(LossKind::kCount));
  std::vector<uint32_t> train, valid, test;
  problem.Split(4, &train, &valid, &test);
  SnnConfig config;
  config.network_size = {"6", "fc2"};
  config.time_length = 12;
  config.multi_model = true;
  config.num_models = 2;
  config.grad_clip = {1.0, 2.0};
  absl::StatusOr<std::unique_ptr<SpikingNetwork>> network =
      SpikingNetwork::Create(config);
  ASSERT_TRUE(network.ok());
  LearningParams learning_params;
  learning_params.num_epochs = 1;
  learning_params.optimizer = OptimizerKind::kSgd;
  learning_params.learning_rate = 0.1;
  absl::StatusOr<TrainingOutcome> outcome = TrainNetwork(
      learning_params, problem, train, valid, network->get());
  ASSERT_TRUE(outcome.ok()) << outcome.status();
  EXPECT_EQ(outcome->best_params.num_models(), 2);
}

}  // namespace
}  // namespace spikegrad
