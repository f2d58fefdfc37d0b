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

#ifndef SPIKEGRAD_SNN_KERNELS_H_
#define SPIKEGRAD_SNN_KERNELS_H_

#include "common/tensor.h"
#include "snn/config.h"

namespace spikegrad {

// Extra steps over which the smoothed spike-train difference is evaluated
// past the end of the simulation.
constexpr int kTrainAlphaExtend = 200;

// Alpha kernels are never longer than this.
constexpr int kMaxAlphaKernelLength = 1000;

// Entries of the alpha kernel at or below this magnitude are dropped.
constexpr double kAlphaKernelCutoff = 1e-6;

// Impulse responses and normalization constants derived from the decay
// parameters. Recompute whenever time_length or a decay constant changes.
struct Kernels {
  // alpha_exp^t; empty for latency targets.
  VectorXd alpha;
  VectorXd alpha_prime;
  int alpha_extend = 0;

  // Double-exponential post-synaptic response, already scaled by
  // beta_i * beta_v.
  VectorXd epsilon;
  VectorXd epsilon_prime;

  double beta_i = 1.0;
  double beta_v = 1.0;
  double beta_bias = 1.0;
};

// alpha_exp^t for t < min(time_length, kMaxAlphaKernelLength), keeping only
// entries above kAlphaKernelCutoff.
VectorXd AlphaKernel(double alpha_exp, int time_length);

// Centered finite difference of `kernel`, two entries longer than the input:
// result[k] = (kernel[k] - kernel[k - 2]) / 2, with out-of-range entries of
// `kernel` taken as zero.
VectorXd KernelPrime(const VectorXd &kernel);

// epsilon[t] = sum_{k=0}^{t} alpha_i^k * alpha_v^(t-k), before normalization.
VectorXd EpsilonKernel(double alpha_i, double alpha_v, int time_length);

// Builds all kernels for `config`. For count targets alpha_exp is forced to 1
// and no extension is used.
Kernels InitKernels(const SnnConfig &config);

}  // namespace spikegrad

#endif  // SPIKEGRAD_SNN_KERNELS_H_
