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


#include "snn/optimizer.h"

namespace spikegrad {

void AdamOptimizer::Step(double lr, ParameterArena *params) {
  SPIKEGRAD_CHECK(
      weight_updaters_.size() == params->num_layers() * params->num_models(),
      "Optimizer was built for a different arena");
  for (size_t l = 0; l < params->num_layers(); l++) {
    for (size_t m = 0; m < params->num_models(); m++) {
      LayerParams &layer = params->at(l, m);
      if (layer.weight.empty()) continue;
      const size_t idx = l * params->num_models() + m;
      weight_updaters_[idx].Update(layer.weight_grad, lr, &layer.weight);
      bias_updaters_[idx].Update(layer.bias_grad, lr, &layer.bias);
    }
  }
}

void SgdUpdate(double lr, ParameterArena *params) {
  for (size_t l = 0; l < params->num_layers(); l++) {
    for (size_t m = 0; m < params->num_models(); m++) {
      LayerParams &layer = params->at(l, m);
      for (size_t i = 0; i < layer.weight.size(); i++) {
        layer.weight[i] -= lr * layer.weight_grad[i];
      }
      for (size_t i = 0; i < layer.bias.size(); i++) {
        layer.bias[i] -= lr * layer.bias_grad[i];
      }
    }
  }
}

}  // namespace spikegrad
