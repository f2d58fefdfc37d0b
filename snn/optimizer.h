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


#ifndef SPIKEGRAD_SNN_OPTIMIZER_H_
#define SPIKEGRAD_SNN_OPTIMIZER_H_

#include <cmath>
#include <vector>

#include "common/tensor.h"
#include "common/util.h"
#include "snn/layers.h"

namespace spikegrad {

// Keeps momentum and variance information to run ADAM update steps on a given
// tensor of parameters.
struct AdamUpdater {
  // Update momentum and variance information using the gradient `d`, produce
  // parameter updates using the learning rate `lr` and update the parameters
  // passed in `values`.
  void Update(const Tensor &d, double lr, Tensor *values) {
    SPIKEGRAD_CHECK(d.size() == values->size(), "Gradient has ", d.size(),
                    " entries, parameters ", values->size());
    if (momentum_.empty()) {
      momentum_.resize(d.size());
      var_.resize(d.size());
    }
    epoch_++;
    double m_scale = 1.0 / (1.0 - IPow(kB1, epoch_));
    double v_scale = 1.0 / (1.0 - IPow(kB2, epoch_));
    for (size_t j = 0; j < d.size(); j++) {
      momentum_[j] = kB1 * momentum_[j] + ckB1 * d[j];
      var_[j] = kB2 * var_[j] + ckB2 * d[j] * d[j];
      (*values)[j] -=
          lr * momentum_[j] * m_scale / std::sqrt(var_[j] * v_scale + kEps);
    }
  }

 private:
  size_t epoch_ = 0;
  std::vector<double> momentum_;
  std::vector<double> var_;
  static constexpr double kB1 = 0.9;
  static constexpr double kB2 = 0.999;
  static constexpr double kEps = 1e-8;
  static constexpr double ckB1 = 1.0 - kB1;
  static constexpr double ckB2 = 1.0 - kB2;
};

// One AdamUpdater per weight and bias tensor of a parameter arena.
class AdamOptimizer {
 public:
  explicit AdamOptimizer(const ParameterArena &params)
      : weight_updaters_(params.num_layers() * params.num_models()),
        bias_updaters_(params.num_layers() * params.num_models()) {}

  // Applies one step using the gradients currently stored in `params`.
  void Step(double lr, ParameterArena *params);

 private:
  std::vector<AdamUpdater> weight_updaters_;
  std::vector<AdamUpdater> bias_updaters_;
};

// Plain gradient descent: value -= lr * grad for every trainable tensor.
void SgdUpdate(double lr, ParameterArena *params);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_OPTIMIZER_H_
