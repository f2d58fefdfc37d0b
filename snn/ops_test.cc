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


#include "snn/ops.h"

#include <random>

#include "common/test_util.h"
#include "gtest/gtest.h"

namespace spikegrad {
namespace {

Tensor RandomTensor(const Shape &shape, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> dist(-1.0, 1.0);
  Tensor t(shape);
  for (size_t i = 0; i < t.size(); ++i) t[i] = dist(rng);
  return t;
}

double Dot(const Tensor &a, const Tensor &b) {
  EXPECT_EQ(a.size(), b.size());
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) sum += a[i] * b[i];
  return sum;
}

TEST(OpsTest, LinearForwardOnRowRange) {
  Tensor x({2, 3}, VectorXd({1, 2, 3, 4, 5, 6}));
  Tensor w({2, 3}, VectorXd({1, 0, -1, 0.5, 0.5, 0.5}));
  Tensor y({2, 2}, -7.0);
  LinearForward(x, w, 1, 2, &y);
  EXPECT_EQ(y.at({0, 0}), -7.0);  // Row 0 is outside the range.
  EXPECT_EQ(y.at({1, 0}), -2.0);
  EXPECT_EQ(y.at({1, 1}), 7.5);
}

TEST(OpsTest, LinearBackwardIsAdjoint) {
  Tensor x = RandomTensor({3, 5}, 1);
  Tensor w = RandomTensor({4, 5}, 2);
  Tensor dy = RandomTensor({3, 4}, 3);
  Tensor y({3, 4});
  LinearForward(x, w, 0, 3, &y);
  Tensor dx({3, 5});
  LinearBackwardInput(dy, w, 0, 3, &dx);
  EXPECT_NEAR(Dot(y, dy), Dot(x, dx), 1e-12);

  Tensor dw({4, 5});
  LinearAccumulateWeightGrad(dy, x, 0, 3, 1.0, &dw);
  EXPECT_NEAR(Dot(y, dy), Dot(w, dw), 1e-12);
}

TEST(OpsTest, LinearWeightGradAccumulatesWithScale) {
  Tensor x({1, 2}, VectorXd({1, 2}));
  Tensor dy({1, 1}, VectorXd({3}));
  Tensor dw({1, 2}, 1.0);
  LinearAccumulateWeightGrad(dy, x, 0, 1, 0.5, &dw);
  EXPECT_EQ(dw.values(), VectorXd({2.5, 4.0}));
}

TEST(OpsTest, ConvPreservesSpatialShape) {
  Tensor x = RandomTensor({2, 3, 6, 5}, 4);
  Tensor w = RandomTensor({4, 3, 3, 3}, 5);
  Tensor y = Conv2dForward(x, w, 1);
  EXPECT_EQ(y.shape(), Shape({2, 4, 6, 5}));
}

TEST(OpsTest, ConvIdentityKernel) {
  Tensor x = RandomTensor({1, 1, 4, 4}, 6);
  Tensor w({1, 1, 3, 3});
  w.at({0, 0, 1, 1}) = 2.0;
  Tensor y = Conv2dForward(x, w, 1);
  for (size_t i = 0; i < x.size(); ++i) EXPECT_DOUBLE_EQ(y[i], 2.0 * x[i]);
}

TEST(OpsTest, ConvBackwardIsAdjoint) {
  Tensor x = RandomTensor({2, 2, 5, 5}, 7);
  Tensor w = RandomTensor({3, 2, 3, 3}, 8);
  Tensor y = Conv2dForward(x, w, 1);
  Tensor dy = RandomTensor(y.shape(), 9);

  Tensor dx = Conv2dBackwardInput(dy, w, 1, x.shape());
  EXPECT_NEAR(Dot(y, dy), Dot(x, dx), 1e-10);

  Tensor dw(w.shape());
  Conv2dAccumulateWeightGrad(x, dy, 1, 1.0, &dw);
  EXPECT_NEAR(Dot(y, dy), Dot(w, dw), 1e-10);
}

TEST(OpsTest, AvgPoolFloorsAndAverages) {
  Tensor x({1, 1, 5, 4});
  for (size_t i = 0; i < x.size(); ++i) x[i] = i;
  Tensor y = AvgPoolForward(x, 2);
  ASSERT_EQ(y.shape(), Shape({1, 1, 2, 2}));
  EXPECT_EQ(y[0], (0 + 1 + 4 + 5) / 4.0);
  EXPECT_EQ(y[3], (10 + 11 + 14 + 15) / 4.0);
}

TEST(OpsTest, AvgPoolBackwardZeroesUncoveredPositions) {
  Tensor dy({1, 1, 2, 2}, 4.0);
  Tensor dx = AvgPoolBackward(dy, 2, {1, 1, 5, 4});
  EXPECT_EQ(dx.at({0, 0, 0, 0}), 1.0);
  EXPECT_EQ(dx.at({0, 0, 3, 3}), 1.0);
  // The fifth row is not covered by any window.
  for (size_t j = 0; j < 4; ++j) EXPECT_EQ(dx.at({0, 0, 4, j}), 0.0);
  EXPECT_EQ(dx.Sum(), 16.0);
}

TEST(OpsTest, MaxPoolRoutesGradientToFirstMaximum) {
  Tensor x({1, 1, 2, 4}, VectorXd({1, 1, 0, 3,  //
                                   1, 0, 2, 3}));
  std::vector<size_t> argmax;
  Tensor y = MaxPoolForward(x, 2, &argmax);
  ASSERT_EQ(y.shape(), Shape({1, 1, 1, 2}));
  EXPECT_EQ(y.values(), VectorXd({1, 3}));
  EXPECT_EQ(argmax, std::vector<size_t>({0, 3}));

  Tensor dy({1, 1, 1, 2}, VectorXd({5, 7}));
  Tensor dx = MaxPoolBackward(dy, argmax, x.shape());
  EXPECT_EQ(dx.values(), VectorXd({5, 0, 0, 7, 0, 0, 0, 0}));
}

TEST(OpsTest, MaxPoolIndicesArePerRow) {
  Tensor x = RandomSpikes({3, 2, 4, 4}, 0.3, 10);
  std::vector<size_t> argmax;
  Tensor y = MaxPoolForward(x, 2, &argmax);
  for (size_t idx = 0; idx < y.size(); ++idx) {
    const size_t r = idx / y.row_size();
    EXPECT_LT(argmax[idx], x.row_size());
    EXPECT_EQ(y[idx], x.row(r)[argmax[idx]]);
  }
}

}  // namespace
}  // namespace spikegrad
