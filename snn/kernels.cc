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

#include "snn/kernels.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_format.h"
#include "common/util.h"

namespace spikegrad {

VectorXd AlphaKernel(double alpha_exp, int time_length) {
  SPIKEGRAD_CHECK(time_length > 0);
  const int length = std::min(time_length, kMaxAlphaKernelLength);
  VectorXd kernel;
  for (int t = 0; t < length; ++t) {
    double value = IPow(alpha_exp, t);
    if (value > kAlphaKernelCutoff) kernel.push_back(value);
  }
  return kernel;
}

VectorXd KernelPrime(const VectorXd &kernel) {
  VectorXd prime(kernel.size() + 2);
  for (size_t k = 0; k < prime.size(); ++k) {
    double front = k < kernel.size() ? kernel[k] : 0.0;
    double back = k >= 2 ? kernel[k - 2] : 0.0;
    prime[k] = (front - back) / 2;
  }
  return prime;
}

VectorXd EpsilonKernel(double alpha_i, double alpha_v, int time_length) {
  SPIKEGRAD_CHECK(time_length > 0);
  VectorXd epsilon(time_length);
  // Synaptic current injected at step k decays towards the future, and the
  // membrane integrates it with its own decay towards the past.
  for (int t = 0; t < time_length; ++t) {
    double sum = 0.0;
    for (int k = 0; k <= t; ++k) {
      sum += IPow(alpha_i, k) * IPow(alpha_v, t - k);
    }
    epsilon[t] = sum;
  }
  return epsilon;
}

Kernels InitKernels(const SnnConfig &config) {
  Kernels kernels;
  if (config.target_type == LossKind::kTrain ||
      config.target_type == LossKind::kCount) {
    double alpha_exp = config.alpha_exp;
    if (config.target_type == LossKind::kTrain) {
      kernels.alpha_extend = kTrainAlphaExtend;
    } else {
      alpha_exp = 1.0;
      kernels.alpha_extend = 0;
    }
    kernels.alpha = AlphaKernel(alpha_exp, config.time_length);
    kernels.alpha_prime = KernelPrime(kernels.alpha);
  }

  VectorXd epsilon =
      EpsilonKernel(config.alpha_i, config.alpha_v, config.time_length);
  if (config.beta_auto) {
    const double max_epsilon = *std::max_element(epsilon.begin(), epsilon.end());
    kernels.beta_i = 1.0;
    kernels.beta_v = 1.0 / max_epsilon;
    kernels.beta_bias = 1.0 / max_epsilon;
    SPIKEGRAD_LOG(LogSeverity::INFO,
                  absl::StrFormat("calculated beta_v: %g, beta_bias: %g",
                                  kernels.beta_v, kernels.beta_bias));
  } else {
    kernels.beta_i = config.beta_i;
    kernels.beta_v = config.beta_v;
    kernels.beta_bias = config.beta_bias;
  }
  for (double &e : epsilon) e *= kernels.beta_i * kernels.beta_v;
  kernels.epsilon_prime = KernelPrime(epsilon);
  kernels.epsilon = std::move(epsilon);
  return kernels;
}

}  // namespace spikegrad
