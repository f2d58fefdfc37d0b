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

#include <cmath>

#include "common/test_util.h"
#include "gtest/gtest.h"

namespace spikegrad {
namespace {

Kernels KernelsFor(LossKind kind, int time_length, double alpha_exp = 0.8) {
  SnnConfig config;
  config.target_type = kind;
  config.time_length = time_length;
  config.alpha_exp = alpha_exp;
  return InitKernels(config);
}

TEST(LossTest, ConvolveTruncated) {
  VectorXd result = ConvolveTruncated({1, 0, 2}, {1, 0.5}, 5);
  EXPECT_EQ(result, VectorXd({1, 0.5, 2, 1, 0}));
  EXPECT_EQ(ConvolveTruncated({1, 0, 2}, {1, 0.5}, 2), VectorXd({1, 0.5}));
}

TEST(LossTest, SoftmaxCrossEntropyDerivative) {
  const VectorXd logits = {0.3, -1.2, 2.0, 0.0};
  VectorXd d_logits;
  const double loss = SoftmaxCrossEntropy(logits, 1, &d_logits);
  double sum = 0.0;
  for (double d : d_logits) sum += d;
  EXPECT_NEAR(sum, 0.0, 1e-12);
  const double h = 1e-7;
  for (size_t i = 0; i < logits.size(); ++i) {
    VectorXd shifted = logits;
    shifted[i] += h;
    VectorXd unused;
    EXPECT_TRUE(IsDerivativeClose(
        d_logits[i], SoftmaxCrossEntropy(shifted, 1, &unused), loss, h));
  }
}

TEST(LossTest, CountLossOfHandComputedExample) {
  // Neuron 0 fires 5 times for a target of 3, neuron 1 never for a target
  // of 2.
  Tensor output({1, 5, 2});
  Tensor target({1, 5, 2});
  for (size_t t = 0; t < 5; ++t) output.at({0, t, 0}) = 1.0;
  for (size_t t = 0; t < 3; ++t) target.at({0, t, 0}) = 1.0;
  for (size_t t = 0; t < 2; ++t) target.at({0, t, 1}) = 1.0;

  SpikeCountLoss loss(KernelsFor(LossKind::kCount, 5), 5);
  absl::StatusOr<LossResult> result = loss.LossDerivative(output, target, 1);
  ASSERT_TRUE(result.ok()) << result.status();
  // (2^2 + 2^2) / 5.
  EXPECT_NEAR(result->value.total, 1.6, 1e-12);
  ASSERT_EQ(result->dl_ds.size(), 5);
  for (size_t t = 0; t < 5; ++t) {
    EXPECT_NEAR(result->dl_ds[t].at({0, 0}), 0.8, 1e-12);
    EXPECT_NEAR(result->dl_ds[t].at({0, 1}), -0.8, 1e-12);
    EXPECT_EQ(result->dl_dt[t].Sum(), 0.0);
  }
  EXPECT_EQ(loss.FracCorrect(output, target), 1.0);
}

TEST(LossTest, TrainLossSpikeGradientMatchesFiniteDifference) {
  const int steps = 8;
  SpikeTrainLoss loss(KernelsFor(LossKind::kTrain, steps), steps);
  Tensor output = RandomSpikes({2, steps, 3}, 0.4, 1);
  Tensor target = RandomSpikes({2, steps, 3}, 0.4, 2);
  absl::StatusOr<LossResult> base = loss.LossDerivative(output, target, 1);
  ASSERT_TRUE(base.ok());

  const double h = 1e-6;
  for (size_t r = 0; r < 2; ++r) {
    for (size_t t = 0; t < static_cast<size_t>(steps); ++t) {
      for (size_t n = 0; n < 3; ++n) {
        Tensor shifted = output;
        shifted.at({r, t, n}) += h;
        absl::StatusOr<LossResult> moved =
            loss.LossDerivative(shifted, target, 1);
        ASSERT_TRUE(moved.ok());
        EXPECT_TRUE(IsDerivativeClose(base->dl_ds[t].at({r, n}),
                                      moved->value.total, base->value.total,
                                      h, 1e-4));
      }
    }
  }
}

TEST(LossTest, TrainTimeGradientOnlyAtSpikes) {
  const int steps = 6;
  SpikeTrainLoss loss(KernelsFor(LossKind::kTrain, steps), steps);
  Tensor output({1, steps, 1});
  Tensor target({1, steps, 1});
  output.at({0, 1, 0}) = 1.0;
  target.at({0, 4, 0}) = 1.0;
  absl::StatusOr<LossResult> result = loss.LossDerivative(output, target, 1);
  ASSERT_TRUE(result.ok());
  for (size_t t = 0; t < static_cast<size_t>(steps); ++t) {
    if (t == 1) continue;
    EXPECT_EQ(result->dl_dt[t][0], 0.0);
  }
  // Delaying the early spike towards the target lowers the loss.
  EXPECT_LT(result->dl_dt[1][0], 0.0);
}

TEST(LossTest, ShapeMismatchIsFailedPrecondition) {
  SpikeTrainLoss loss(KernelsFor(LossKind::kTrain, 4), 4);
  EXPECT_EQ(
      loss.LossDerivative(Tensor({1, 4, 2}), Tensor({1, 4, 3}), 1)
          .status()
          .code(),
      absl::StatusCode::kFailedPrecondition);
  LatencyLoss latency(1.0, 1.0);
  EXPECT_EQ(latency.LossDerivative(Tensor({2, 4, 2}), Tensor({3}), 1)
                .status()
                .code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST(LossTest, LatencyScores) {
  Tensor output({1, 4, 3});
  output.at({0, 1, 0}) = 1.0;
  output.at({0, 3, 0}) = 1.0;
  output.at({0, 2, 1}) = 1.0;
  Tensor scores = LatencyScores(output);
  EXPECT_EQ(scores.values(), VectorXd({3.0, 2.0, 0.0}));
}

TEST(LossTest, LatencyGradientLandsOnFirstSpike) {
  Tensor output({2, 4, 3});
  output.at({0, 1, 0}) = 1.0;
  output.at({0, 2, 1}) = 1.0;
  output.at({1, 0, 2}) = 1.0;
  output.at({1, 3, 0}) = 1.0;
  Tensor target({2}, VectorXd({1, 2}));
  const double beta = 0.5;
  LatencyLoss loss(beta, 1.0);
  absl::StatusOr<LossResult> result = loss.LossDerivative(output, target, 1);
  ASSERT_TRUE(result.ok());

  VectorXd d_logits;
  const double ce0 = SoftmaxCrossEntropy({1.5, 1.0, 0.0}, 1, &d_logits);
  EXPECT_NEAR(result->dl_dt[1].at({0, 0}), -beta * d_logits[0] / 2, 1e-12);
  EXPECT_NEAR(result->dl_dt[2].at({0, 1}), -beta * d_logits[1] / 2, 1e-12);
  // Neuron 2 of row 0 never fired: no time gradient anywhere.
  for (size_t t = 0; t < 4; ++t) EXPECT_EQ(result->dl_dt[t].at({0, 2}), 0.0);

  VectorXd unused;
  const double ce1 = SoftmaxCrossEntropy({0.5, 0.0, 2.0}, 2, &unused);
  EXPECT_NEAR(result->value.total, (ce0 + ce1) / 2, 1e-12);
  EXPECT_EQ(loss.FracCorrect(output, target), 0.5);
}

TEST(LossTest, LatencyPenalizesSilentTarget) {
  Tensor output({1, 3, 2});
  output.at({0, 0, 0}) = 1.0;
  Tensor target({1}, 1.0);
  LatencyLoss loss(1.0, 2.0);
  absl::StatusOr<LossResult> result = loss.LossDerivative(output, target, 1);
  ASSERT_TRUE(result.ok());
  VectorXd unused;
  const double ce = SoftmaxCrossEntropy({3.0, 0.0}, 1, &unused);
  EXPECT_NEAR(result->value.total, ce + 2.0, 1e-12);
  for (size_t t = 0; t < 3; ++t) {
    EXPECT_EQ(result->dl_ds[t].at({0, 1}), -2.0);
    EXPECT_EQ(result->dl_ds[t].at({0, 0}), 0.0);
  }
  EXPECT_EQ(loss.FracCorrect(output, target), 0.0);
}

TEST(LossTest, LatencyRejectsInvalidClass) {
  LatencyLoss loss(1.0, 1.0);
  Tensor output({1, 3, 2});
  for (double label : {-1.0, 2.0, 0.5}) {
    EXPECT_EQ(loss.LossDerivative(output, Tensor({1}, label), 1)
                  .status()
                  .code(),
              absl::StatusCode::kInvalidArgument);
  }
}

TEST(LossTest, LossIsNormalizedPerModel) {
  const int steps = 6;
  SpikeTrainLoss loss(KernelsFor(LossKind::kTrain, steps), steps);
  Tensor output = RandomSpikes({4, steps, 2}, 0.5, 3);
  Tensor target = RandomSpikes({4, steps, 2}, 0.5, 4);
  absl::StatusOr<LossResult> joint = loss.LossDerivative(output, target, 2);
  ASSERT_TRUE(joint.ok());
  ASSERT_EQ(joint->value.per_model.size(), 2);
  for (size_t m = 0; m < 2; ++m) {
    absl::StatusOr<LossResult> single = loss.LossDerivative(
        output.Rows(2 * m, 2 * m + 2), target.Rows(2 * m, 2 * m + 2), 1);
    ASSERT_TRUE(single.ok());
    EXPECT_EQ(joint->value.per_model[m], single->value.total);
    for (size_t t = 0; t < static_cast<size_t>(steps); ++t) {
      EXPECT_TRUE(TensorsIdentical(joint->dl_ds[t].Rows(2 * m, 2 * m + 2),
                                   single->dl_ds[t]));
    }
  }
}

}  // namespace
}  // namespace spikegrad
