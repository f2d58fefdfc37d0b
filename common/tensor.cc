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

#include "common/tensor.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "common/util.h"

namespace spikegrad {

size_t NumElements(const Shape &shape) {
  if (shape.empty()) return 0;
  size_t n = 1;
  for (size_t d : shape) n *= d;
  return n;
}

std::string ShapeToString(const Shape &shape) { return VecToString(shape); }

Tensor::Tensor(Shape shape, double value)
    : shape_(std::move(shape)), data_(NumElements(shape_), value) {}

Tensor::Tensor(Shape shape, VectorXd data)
    : shape_(std::move(shape)), data_(std::move(data)) {
  SPIKEGRAD_CHECK(data_.size() == NumElements(shape_),
                  "Data size does not match shape ", ShapeString());
}

size_t Tensor::row_size() const {
  if (shape_.empty()) return 0;
  size_t n = 1;
  for (size_t i = 1; i < shape_.size(); ++i) n *= shape_[i];
  return n;
}

size_t Tensor::FlatIndex(std::initializer_list<size_t> index) const {
  SPIKEGRAD_CHECK(index.size() == shape_.size(), "Index rank ", index.size(),
                  " does not match tensor rank ", shape_.size());
  size_t flat = 0;
  size_t d = 0;
  for (size_t i : index) {
    SPIKEGRAD_CHECK(i < shape_[d], "Index ", i, " out of range in dim ", d);
    flat = flat * shape_[d] + i;
    ++d;
  }
  return flat;
}

double &Tensor::at(std::initializer_list<size_t> index) {
  return data_[FlatIndex(index)];
}

double Tensor::at(std::initializer_list<size_t> index) const {
  return data_[FlatIndex(index)];
}

Tensor Tensor::Reshaped(Shape shape) const {
  Tensor result = *this;
  result.Reshape(std::move(shape));
  return result;
}

void Tensor::Reshape(Shape shape) {
  SPIKEGRAD_CHECK(NumElements(shape) == data_.size(), "Cannot reshape ",
                  ShapeString(), " to ", ShapeToString(shape));
  shape_ = std::move(shape);
}

void Tensor::Fill(double value) { std::fill(data_.begin(), data_.end(), value); }

double Tensor::Sum() const {
  double sum = 0.0;
  for (double v : data_) sum += v;
  return sum;
}

double Tensor::Max() const {
  double max = -std::numeric_limits<double>::infinity();
  for (double v : data_) max = std::max(max, v);
  return max;
}

Tensor Tensor::TimeSlice(size_t t) const {
  SPIKEGRAD_CHECK(rank() >= 2, "TimeSlice needs a [rows, time, ...] tensor.");
  SPIKEGRAD_CHECK(t < shape_[1]);
  Shape out_shape;
  out_shape.push_back(shape_[0]);
  out_shape.insert(out_shape.end(), shape_.begin() + 2, shape_.end());
  Tensor out(out_shape);
  const size_t step = out.row_size();
  const size_t steps = shape_[1];
  for (size_t r = 0; r < shape_[0]; ++r) {
    std::copy_n(data_.data() + (r * steps + t) * step, step, out.row(r));
  }
  return out;
}

Tensor Tensor::StackTime(const std::vector<Tensor> &steps) {
  SPIKEGRAD_CHECK(!steps.empty());
  const Shape &step_shape = steps.front().shape();
  Shape out_shape;
  out_shape.push_back(step_shape[0]);
  out_shape.push_back(steps.size());
  out_shape.insert(out_shape.end(), step_shape.begin() + 1, step_shape.end());
  Tensor out(out_shape);
  const size_t step = steps.front().row_size();
  for (size_t t = 0; t < steps.size(); ++t) {
    SPIKEGRAD_CHECK(steps[t].shape() == step_shape);
    for (size_t r = 0; r < step_shape[0]; ++r) {
      std::copy_n(steps[t].row(r), step,
                  out.data() + (r * steps.size() + t) * step);
    }
  }
  return out;
}

Tensor Tensor::Rows(size_t begin, size_t end) const {
  SPIKEGRAD_CHECK(begin <= end && end <= rows());
  Shape out_shape = shape_;
  out_shape[0] = end - begin;
  const size_t n = row_size();
  return Tensor(out_shape, VectorXd(data_.begin() + begin * n,
                                    data_.begin() + end * n));
}

Tensor Tensor::ConcatRows(const std::vector<Tensor> &parts) {
  SPIKEGRAD_CHECK(!parts.empty());
  Shape out_shape = parts.front().shape();
  out_shape[0] = 0;
  VectorXd data;
  for (const Tensor &part : parts) {
    SPIKEGRAD_CHECK(part.rank() == out_shape.size());
    for (size_t d = 1; d < out_shape.size(); ++d) {
      SPIKEGRAD_CHECK(part.dim(d) == out_shape[d]);
    }
    out_shape[0] += part.rows();
    data.insert(data.end(), part.values().begin(), part.values().end());
  }
  return Tensor(out_shape, std::move(data));
}

std::string Tensor::ShapeString() const { return ShapeToString(shape_); }

}  // namespace spikegrad
