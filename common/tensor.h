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

#ifndef SPIKEGRAD_COMMON_TENSOR_H_
#define SPIKEGRAD_COMMON_TENSOR_H_

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace spikegrad {

typedef std::vector<double> VectorXd;
typedef std::vector<size_t> Shape;

// Dense row-major array of doubles. The first dimension is the batch (row)
// dimension for every per-timestep state tensor of the simulator.
class Tensor {
 public:
  Tensor() = default;
  explicit Tensor(Shape shape, double value = 0.0);
  Tensor(Shape shape, VectorXd data);

  static Tensor Zeros(const Shape &shape) { return Tensor(shape); }

  const Shape &shape() const { return shape_; }
  size_t rank() const { return shape_.size(); }
  size_t dim(size_t i) const { return shape_[i]; }
  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  // Number of elements in one row, i.e. the product of all dimensions but the
  // first.
  size_t row_size() const;
  size_t rows() const { return shape_.empty() ? 0 : shape_[0]; }

  double *data() { return data_.data(); }
  const double *data() const { return data_.data(); }
  double *row(size_t r) { return data_.data() + r * row_size(); }
  const double *row(size_t r) const { return data_.data() + r * row_size(); }

  double &operator[](size_t i) { return data_[i]; }
  double operator[](size_t i) const { return data_[i]; }

  // Multi-index access. The number of indices must match the rank.
  double &at(std::initializer_list<size_t> index);
  double at(std::initializer_list<size_t> index) const;

  const VectorXd &values() const { return data_; }

  // Returns a copy with a different shape holding the same number of
  // elements.
  Tensor Reshaped(Shape shape) const;
  void Reshape(Shape shape);

  void Fill(double value);

  double Sum() const;
  double Max() const;

  // Slices a [rows, time, ...] tensor at time `t`: result is [rows, ...].
  Tensor TimeSlice(size_t t) const;

  // Inverse of TimeSlice for a list of [rows, ...] tensors: result is
  // [rows, steps.size(), ...].
  static Tensor StackTime(const std::vector<Tensor> &steps);

  // Rows [begin, end) of the tensor.
  Tensor Rows(size_t begin, size_t end) const;

  // Concatenates tensors along the first dimension. All other dimensions must
  // agree.
  static Tensor ConcatRows(const std::vector<Tensor> &parts);

  std::string ShapeString() const;

 private:
  size_t FlatIndex(std::initializer_list<size_t> index) const;

  Shape shape_;
  VectorXd data_;
};

size_t NumElements(const Shape &shape);
std::string ShapeToString(const Shape &shape);

}  // namespace spikegrad

#endif  // SPIKEGRAD_COMMON_TENSOR_H_
