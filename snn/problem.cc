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


#include "snn/problem.h"

#include <random>

#include "common/util.h"

namespace spikegrad {

RatePatternProblem::RatePatternProblem(const Options &options)
    : options_(options) {
  if (options_.input_shape.empty()) {
    options_.input_shape = {options_.num_inputs};
  } else {
    options_.num_inputs = NumElements(options_.input_shape);
  }
  SPIKEGRAD_CHECK(options_.num_classes > 0 && options_.num_inputs > 0);
  SPIKEGRAD_CHECK(options_.target_period > 0);
  std::mt19937 rng(options_.pattern_seed);
  std::uniform_real_distribution<double> rate(0.0, options_.max_input_rate);
  patterns_.resize(options_.num_classes);
  for (VectorXd &pattern : patterns_) {
    pattern.resize(options_.num_inputs);
    for (double &p : pattern) p = rate(rng);
  }
}

size_t RatePatternProblem::Label(uint32_t id) const {
  std::mt19937 rng(id);
  return std::uniform_int_distribution<size_t>(0, options_.num_classes - 1)(
      rng);
}

void RatePatternProblem::Example(uint32_t id, Tensor *input,
                                 Tensor *target) const {
  std::mt19937 rng(id);
  const size_t label = std::uniform_int_distribution<size_t>(
      0, options_.num_classes - 1)(rng);
  const size_t steps = options_.time_length;
  std::uniform_real_distribution<double> coin(0.0, 1.0);

  *input = Tensor({1, steps, options_.num_inputs});
  for (size_t t = 0; t < steps; t++) {
    for (size_t i = 0; i < options_.num_inputs; i++) {
      if (coin(rng) < patterns_[label][i]) input->at({0, t, i}) = 1.0;
    }
  }
  if (options_.input_shape.size() > 1) {
    Shape shape = {1, steps};
    shape.insert(shape.end(), options_.input_shape.begin(),
                 options_.input_shape.end());
    input->Reshape(shape);
  }

  if (options_.target_type == LossKind::kLatency) {
    *target = Tensor({1}, static_cast<double>(label));
    return;
  }
  *target = Tensor({1, steps, options_.num_classes});
  for (size_t t = 0; t < steps; t += options_.target_period) {
    target->at({0, t, label}) = 1.0;
  }
}

void RatePatternProblem::Split(size_t seed, std::vector<uint32_t> *training,
                               std::vector<uint32_t> *validation,
                               std::vector<uint32_t> *test) {
  std::mt19937 rng(seed);
  for (size_t i = 0; i < options_.n_train; i++) {
    training->push_back(rng());
  }
  for (size_t i = 0; i < options_.n_validation; i++) {
    validation->push_back(rng());
  }
  for (size_t i = 0; i < options_.n_test; i++) {
    test->push_back(rng());
  }
}

}  // namespace spikegrad
