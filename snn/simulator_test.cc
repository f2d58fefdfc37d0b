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


#include "snn/simulator.h"

#include "common/test_util.h"
#include "common/util.h"
#include "gtest/gtest.h"

namespace spikegrad {
namespace {

// Topology, kernels and parameters built from one config.
struct Fixture {
  explicit Fixture(const SnnConfig &c) : config(c) {
    absl::StatusOr<Topology> built =
        BuildTopology(config.network_size, config.multi_model);
    SPIKEGRAD_CHECK(built.ok(), built.status().ToString());
    topology = *built;
    kernels = InitKernels(config);
    params = ParameterArena(topology, config.num_models);
    params.Initialize(topology, config);
  }

  absl::StatusOr<SimulationTrace> Run(const Tensor &input) const {
    return Simulate(config, kernels, topology, params, input);
  }

  SnnConfig config;
  Topology topology;
  Kernels kernels;
  ParameterArena params;
};

TEST(SimulatorTest, RejectsMismatchedInput) {
  SnnConfig config;
  config.network_size = {"4", "fc2"};
  config.time_length = 5;
  Fixture fixture(config);
  EXPECT_EQ(fixture.Run(Tensor({1, 6, 4})).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(fixture.Run(Tensor({1, 5, 3})).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(fixture.Run(Tensor({5, 4})).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(fixture.Run(Tensor({0, 5, 4})).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(fixture.Run(Tensor({3, 5, 4})).ok());
}

TEST(SimulatorTest, RecordsStatePerLayerAndStep) {
  SnnConfig config;
  config.network_size = {"1x6x6", "conv2c3", "mpool2", "flatten", "fc3"};
  config.time_length = 4;
  config.weight_bias = 0.5;
  Fixture fixture(config);
  absl::StatusOr<SimulationTrace> trace =
      fixture.Run(RandomSpikes({2, 4, 1, 6, 6}, 0.5, 1));
  ASSERT_TRUE(trace.ok()) << trace.status();
  EXPECT_EQ(trace->term_length, 4);
  EXPECT_EQ(trace->rows(), 2);
  ASSERT_EQ(trace->spikes.size(), 4);
  EXPECT_EQ(trace->voltage[0].size(), 4);
  EXPECT_EQ(trace->voltage[0][0].shape(), Shape({2, 2, 6, 6}));
  EXPECT_TRUE(trace->voltage[1].empty());
  EXPECT_EQ(trace->spikes[1][3].shape(), Shape({2, 2, 3, 3}));
  EXPECT_EQ(trace->max_indices[1].size(), 4);
  EXPECT_EQ(trace->spikes[2][0].shape(), Shape({2, 18}));
  EXPECT_EQ(trace->output.shape(), Shape({2, 4, 3}));
  for (size_t t = 0; t < 4; ++t) {
    const Tensor &v_prime = trace->voltage_prime[0][t];
    for (size_t i = 0; i < v_prime.size(); ++i) {
      EXPECT_GE(v_prime[i], kMinVoltagePrime);
    }
  }
}

TEST(SimulatorTest, ZeroDecayIsMemoryless) {
  SnnConfig config;
  config.network_size = {"5", "fc8", "fc3"};
  config.time_length = 6;
  config.alpha_i = 0.0;
  config.alpha_v = 0.0;
  config.weight_bias = 0.3;
  Fixture fixture(config);

  Tensor input = RandomSpikes({2, 6, 5}, 0.5, 2);
  Tensor reversed(input.shape());
  for (size_t r = 0; r < 2; ++r) {
    for (size_t t = 0; t < 6; ++t) {
      for (size_t i = 0; i < 5; ++i) {
        reversed.at({r, 5 - t, i}) = input.at({r, t, i});
      }
    }
  }
  absl::StatusOr<SimulationTrace> forward = fixture.Run(input);
  absl::StatusOr<SimulationTrace> backward = fixture.Run(reversed);
  ASSERT_TRUE(forward.ok());
  ASSERT_TRUE(backward.ok());
  for (size_t l = 0; l < 2; ++l) {
    for (size_t t = 0; t < 6; ++t) {
      EXPECT_TRUE(TensorsIdentical(forward->voltage[l][t],
                                   backward->voltage[l][5 - t]));
      EXPECT_TRUE(TensorsIdentical(forward->spikes[l][t],
                                   backward->spikes[l][5 - t]));
    }
  }
}

TEST(SimulatorTest, LatencyStopsOnceEveryOutputSpiked) {
  SnnConfig config;
  config.network_size = {"4", "fc3"};
  config.time_length = 10;
  config.target_type = LossKind::kLatency;
  Fixture fixture(config);
  fixture.params.at(0, 0).weight.Fill(2.0);

  // Silent for two steps, then every input fires.
  Tensor input({1, 10, 4});
  for (size_t t = 2; t < 10; ++t) {
    for (size_t i = 0; i < 4; ++i) input.at({0, t, i}) = 1.0;
  }
  absl::StatusOr<SimulationTrace> trace = fixture.Run(input);
  ASSERT_TRUE(trace.ok());
  EXPECT_EQ(trace->term_length, 3);
  EXPECT_EQ(trace->output.shape(), Shape({1, 3, 3}));
  for (size_t n = 0; n < 3; ++n) {
    EXPECT_EQ(trace->output.at({0, 2, n}), 1.0);
  }
  EXPECT_EQ(trace->stats.first_spike_time, VectorXd({2.0}));
  EXPECT_EQ(trace->stats.first_spike_time_min, VectorXd({2.0}));
  EXPECT_EQ(trace->stats.num_spike_total[0], std::vector<double>({3.0}));
  EXPECT_EQ(trace->stats.num_spike_necessary[0], std::vector<double>({3.0}));
}

TEST(SimulatorTest, LatencyRunsFullHorizonWhileSomeOutputIsSilent) {
  SnnConfig config;
  config.network_size = {"4", "fc2"};
  config.time_length = 8;
  config.target_type = LossKind::kLatency;
  Fixture fixture(config);
  Tensor &weight = fixture.params.at(0, 0).weight;
  weight.Fill(0.0);
  for (size_t i = 0; i < 4; ++i) weight.at({0, i}) = 2.0;

  absl::StatusOr<SimulationTrace> trace = fixture.Run(Tensor({2, 8, 4}, 1.0));
  ASSERT_TRUE(trace.ok());
  EXPECT_EQ(trace->term_length, 8);
  for (size_t t = 0; t < 8; ++t) EXPECT_EQ(trace->output.at({1, t, 1}), 0.0);
}

TEST(SimulatorTest, SpikeStatsForSilentRows) {
  SnnConfig config;
  config.network_size = {"3", "fc2"};
  config.time_length = 5;
  Fixture fixture(config);
  absl::StatusOr<SimulationTrace> trace = fixture.Run(Tensor({2, 5, 3}));
  ASSERT_TRUE(trace.ok());
  // No input, no bias: nothing ever fires.
  EXPECT_EQ(trace->stats.first_spike_time, VectorXd({5.0, 5.0}));
  EXPECT_EQ(trace->stats.first_spike_time_mean, VectorXd({5.0}));
  EXPECT_EQ(trace->stats.num_spike_total[0], std::vector<double>({0.0}));
}

TEST(SimulatorTest, MultiModelRowsUseTheirOwnWeights) {
  SnnConfig config;
  config.network_size = {"2", "fc1"};
  config.time_length = 3;
  config.multi_model = true;
  config.num_models = 2;
  Fixture fixture(config);
  fixture.params.at(0, 0).weight.Fill(0.0);
  fixture.params.at(0, 1).weight.Fill(5.0);

  absl::StatusOr<SimulationTrace> trace =
      fixture.Run(Tensor({2, 1, 3, 2}, 1.0));
  ASSERT_TRUE(trace.ok());
  EXPECT_EQ(trace->num_models, 2);
  EXPECT_EQ(trace->batch_size, 1);
  EXPECT_EQ(trace->output.shape(), Shape({2, 3, 1}));
  EXPECT_EQ(trace->output.at({0, 0, 0}), 0.0);
  EXPECT_EQ(trace->output.at({1, 0, 0}), 1.0);
  EXPECT_EQ(trace->stats.num_spike_total[0][0], 0.0);
  EXPECT_GT(trace->stats.num_spike_total[1][0], 0.0);
}

}  // namespace
}  // namespace spikegrad
