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

#ifndef SPIKEGRAD_SNN_OPS_H_
#define SPIKEGRAD_SNN_OPS_H_

#include <vector>

#include "common/tensor.h"

// Dense building blocks of the simulator. Batched tensors have the row
// (batch) dimension first; spatial maps are [rows, C, H, W] and vectors are
// [rows, N]. Linear ops work on a row range so that each model replica can
// use its own weights on its own rows.

namespace spikegrad {

// y[r, o] = sum_i w[o, i] * x[r, i] for r in [row_begin, row_end).
void LinearForward(const Tensor &x, const Tensor &weight, size_t row_begin,
                   size_t row_end, Tensor *y);

// dx[r, i] = sum_o w[o, i] * dy[r, o] for r in [row_begin, row_end).
void LinearBackwardInput(const Tensor &dy, const Tensor &weight,
                         size_t row_begin, size_t row_end, Tensor *dx);

// dw[o, i] += scale * sum_r dy[r, o] * x[r, i] over [row_begin, row_end).
void LinearAccumulateWeightGrad(const Tensor &dy, const Tensor &x,
                                size_t row_begin, size_t row_end, double scale,
                                Tensor *dw);

// Cross-correlation with zero padding and stride 1. `x` is [rows, C, H, W],
// `weight` is [O, C, K, K]; the result is [rows, O, H + 2p - K + 1, ...].
Tensor Conv2dForward(const Tensor &x, const Tensor &weight, size_t padding);

// Gradient of Conv2dForward with respect to its input of shape
// `input_shape` ([rows, C, H, W]).
Tensor Conv2dBackwardInput(const Tensor &dy, const Tensor &weight,
                           size_t padding, const Shape &input_shape);

// dw += scale * gradient of Conv2dForward with respect to its weight.
void Conv2dAccumulateWeightGrad(const Tensor &x, const Tensor &dy,
                                size_t padding, double scale, Tensor *dw);

// Non-overlapping k x k average pooling; trailing rows and columns that do
// not fill a window are dropped.
Tensor AvgPoolForward(const Tensor &x, size_t kernel);

// Spreads every pooled gradient evenly over its window. Positions of
// `input_shape` not covered by any window receive zero.
Tensor AvgPoolBackward(const Tensor &dy, size_t kernel,
                       const Shape &input_shape);

// Non-overlapping k x k max pooling. For every output element, `argmax`
// receives the offset of the selected input element within its row; ties
// go to the first maximum in scan order.
Tensor MaxPoolForward(const Tensor &x, size_t kernel,
                      std::vector<size_t> *argmax);

// Routes every pooled gradient to the input position recorded in `argmax`.
Tensor MaxPoolBackward(const Tensor &dy, const std::vector<size_t> &argmax,
                       const Shape &input_shape);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_OPS_H_
