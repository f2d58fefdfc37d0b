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


#ifndef SPIKEGRAD_SNN_PROBLEM_H_
#define SPIKEGRAD_SNN_PROBLEM_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "common/tensor.h"
#include "snn/config.h"

namespace spikegrad {

class Problem {
 public:
  virtual ~Problem() = default;

  virtual size_t NumInputs() const = 0;

  // Number of output neurons of a network solving this problem.
  virtual size_t NumOutputs() const = 0;

  virtual std::string Name() const = 0;

  // Produces the example corresponding to a given `id`. `input` becomes a
  // [1, T, <input shape>] spike train with NumInputs() neurons per step. `target` becomes a [1] class index for
  // latency targets and a [1, T, NumOutputs()] spike train otherwise, so
  // examples can be concatenated into batches. `id` must be a value returned
  // in one of the output parameters of a call to `Split`; all calls with the
  // same value of `id` produce the same example.
  virtual void Example(uint32_t id, Tensor *input, Tensor *target) const = 0;

  // Produces identifiers of training/validation/test examples. Calls with the
  // same `seed` are guaranteed to produce the same split.
  virtual void Split(size_t seed, std::vector<uint32_t> *training,
                     std::vector<uint32_t> *validation,
                     std::vector<uint32_t> *test) = 0;
};

// Classification of Poisson-like spike patterns. Every class is a fixed
// vector of per-input firing probabilities; an example of a class is a
// Bernoulli spike train drawn from it.
class RatePatternProblem : public Problem {
 public:
  struct Options {
    size_t num_inputs = 20;
    // Per-step shape of the input, e.g. [C, H, W] for convolutional
    // networks. Empty means [num_inputs]; otherwise it overrides it.
    Shape input_shape;
    size_t num_classes = 2;
    size_t time_length = 100;
    LossKind target_type = LossKind::kCount;
    // Firing probabilities of the class patterns are drawn from
    // [0, max_input_rate].
    double max_input_rate = 0.2;
    // Train and count targets: the neuron of the correct class fires once
    // every `target_period` steps, all others stay silent.
    size_t target_period = 10;
    size_t n_train = 1000;
    size_t n_validation = 100;
    size_t n_test = 100;
    // Seeds the class patterns, not the examples.
    uint32_t pattern_seed = 1;
  };

  explicit RatePatternProblem(const Options &options);

  size_t NumInputs() const override final { return options_.num_inputs; }
  size_t NumOutputs() const override final { return options_.num_classes; }
  std::string Name() const override final { return "RatePattern"; }

  // The class of example `id`, drawn from the same generator as its spikes.
  size_t Label(uint32_t id) const;

  void Example(uint32_t id, Tensor *input,
               Tensor *target) const override final;

  // Produces RNG seeds for the training/validation/test datasets, in amounts
  // given by the `n_train`/`n_validation`/`n_test` options.
  void Split(size_t seed, std::vector<uint32_t> *training,
             std::vector<uint32_t> *validation,
             std::vector<uint32_t> *test) override final;

  const std::vector<VectorXd> &patterns() const { return patterns_; }

 private:
  Options options_;
  std::vector<VectorXd> patterns_;
};

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_PROBLEM_H_
