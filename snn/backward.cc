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

#include "snn/backward.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"
#include "common/util.h"
#include "snn/ops.h"

namespace spikegrad {

namespace {

LayerTimeTensors MakeLayerTime(size_t num_layers, size_t term) {
  return LayerTimeTensors(num_layers, std::vector<Tensor>(term));
}

void InitMembrane(size_t num_layers, size_t term, MembraneGradients *g) {
  g->voltage = MakeLayerTime(num_layers, term);
  g->voltage_dep = MakeLayerTime(num_layers, term);
  g->current = MakeLayerTime(num_layers, term);
}

void InitTiming(size_t num_layers, size_t term, TimingGradients *g) {
  g->time = MakeLayerTime(num_layers, term);
  g->ef1 = MakeLayerTime(num_layers, term);
  g->ef2 = MakeLayerTime(num_layers, term);
}

// Shared driver of the three rules. `spike` and `timing` are null when the
// rule does not use the corresponding gradient.
class Recurrence {
 public:
  Recurrence(const BackwardContext &context, DecayStyle style,
             double lambda_act, double lambda_timing,
             MembraneGradients *membrane, LayerTimeTensors *spike,
             TimingGradients *timing)
      : context_(context),
        style_(style),
        lambda_act_(lambda_act),
        lambda_timing_(lambda_timing),
        term_(context.trace.term_length),
        membrane_(membrane),
        spike_(spike),
        timing_(timing) {
    const size_t num_layers = context.topology.num_layers();
    InitMembrane(num_layers, term_, membrane_);
    if (spike_) *spike_ = MakeLayerTime(num_layers, term_);
    if (timing_) InitTiming(num_layers, term_, timing_);
  }

  void Run(const LossResult &seeds) {
    SPIKEGRAD_CHECK(!spike_ || seeds.dl_ds.size() >= term_);
    SPIKEGRAD_CHECK(!timing_ || seeds.dl_dt.size() >= term_);
    const size_t num_layers = context_.topology.num_layers();
    for (size_t t = term_; t-- > 0;) {
      for (size_t l = num_layers; l-- > 0;) {
        PullFromAbove(t, l, seeds);
        if (context_.topology.layers[l].trainable()) {
          SpikeToVoltage(t, l);
          VoltageToCurrent(t, l);
        }
      }
    }
  }

 private:
  size_t rows() const { return context_.trace.rows(); }

  // dL/dS and dL/dT of layer `l` at step `t`.
  void PullFromAbove(size_t t, size_t l, const LossResult &seeds) {
    const Topology &topology = context_.topology;
    if (l + 1 == topology.num_layers()) {
      if (spike_) (*spike_)[l][t] = seeds.dl_ds[t];
      if (timing_) timing_->time[l][t] = seeds.dl_dt[t];
      return;
    }
    const size_t upper = l + 1;
    if (topology.layers[upper].trainable()) {
      if (timing_) {
        UpdateEligibility(t, upper);
        Tensor dt = InputGradient(upper, timing_->ef2[upper][t]);
        const Tensor &s = context_.trace.spikes[l][t];
        for (size_t i = 0; i < dt.size(); ++i) dt[i] *= s[i];
        timing_->time[l][t] = std::move(dt);
      }
      if (spike_) {
        (*spike_)[l][t] = InputGradient(upper, membrane_->current[upper][t]);
      }
    } else {
      if (timing_) {
        timing_->time[l][t] = Unpool(upper, t, timing_->time[upper][t]);
      }
      if (spike_) (*spike_)[l][t] = Unpool(upper, t, (*spike_)[upper][t]);
    }
  }

  // beta_i * W^T * grad through the weights of trainable layer `upper`.
  Tensor InputGradient(size_t upper, const Tensor &grad) const {
    const LayerDescriptor &layer = context_.topology.layers[upper];
    Shape input_shape = {rows()};
    input_shape.insert(input_shape.end(), layer.input_shape.begin(),
                       layer.input_shape.end());
    Tensor dx;
    if (layer.kind == LayerKind::kFc) {
      dx = Tensor(input_shape);
      const size_t batch = context_.trace.batch_size;
      for (size_t m = 0; m < context_.trace.num_models; ++m) {
        LinearBackwardInput(grad, context_.params.at(upper, m).weight,
                            m * batch, (m + 1) * batch, &dx);
      }
    } else {
      dx = Conv2dBackwardInput(grad, context_.params.at(upper, 0).weight,
                               layer.padding, input_shape);
    }
    for (size_t i = 0; i < dx.size(); ++i) dx[i] *= context_.kernels.beta_i;
    return dx;
  }

  // Inverse of the structural transform of pooling / flatten layer `upper`.
  Tensor Unpool(size_t upper, size_t t, const Tensor &grad) const {
    const LayerDescriptor &layer = context_.topology.layers[upper];
    Shape input_shape = {rows()};
    input_shape.insert(input_shape.end(), layer.input_shape.begin(),
                       layer.input_shape.end());
    switch (layer.kind) {
      case LayerKind::kAvgPool:
        return AvgPoolBackward(grad, layer.kernel_size, input_shape);
      case LayerKind::kMaxPool:
        return MaxPoolBackward(grad, context_.trace.max_indices[upper][t],
                               input_shape);
      case LayerKind::kFlatten:
        return grad.Reshaped(input_shape);
      default:
        SPIKEGRAD_LOG(LogSeverity::FATAL,
                      absl::StrCat("no structural inverse for ",
                                   LayerKindName(layer.kind)));
    }
    return Tensor();
  }

  // Eligibility traces of layer `u` at step `t`, from its dL/dV at t and t+1.
  void UpdateEligibility(size_t t, size_t u) {
    const SnnConfig &config = context_.config;
    const double beta_v = context_.kernels.beta_v;
    const Tensor &s = context_.trace.spikes[u][t];
    const Tensor &dv = membrane_->voltage[u][t];
    Tensor ef1(s.shape());
    Tensor ef2(s.shape());
    const bool has_next = t + 1 < term_;
    for (size_t i = 0; i < s.size(); ++i) {
      double e1 = 0.0;
      double e2 = 0.0;
      if (has_next) {
        const double open = 1 - s[i];
        e1 = membrane_->voltage[u][t + 1][i] / 2 * open +
             config.alpha_v * open * timing_->ef1[u][t + 1][i];
        e2 = config.alpha_i * open * timing_->ef2[u][t + 1][i];
      }
      e1 += config.alpha_v * (-dv[i] / 2);
      e2 += beta_v * config.alpha_i * (-dv[i] / 2);
      e2 += beta_v * e1;
      ef1[i] = e1;
      ef2[i] = e2;
    }
    timing_->ef1[u][t] = std::move(ef1);
    timing_->ef2[u][t] = std::move(ef2);
  }

  // dL/dV of trainable layer `l` from its spike and/or time gradient.
  void SpikeToVoltage(size_t t, size_t l) {
    const SimulationTrace &trace = context_.trace;
    const SnnConfig &config = context_.config;
    const Tensor &v = trace.voltage[l][t];
    const Tensor &s = trace.spikes[l][t];
    Tensor dv(v.shape());
    if (spike_) {
      const Tensor &ds = (*spike_)[l][t];
      for (size_t i = 0; i < dv.size(); ++i) {
        dv[i] = lambda_act_ *
                Surrogate(v[i], config.surr_alpha, config.surr_beta) * ds[i];
      }
    }
    if (timing_) {
      const Tensor &dt = timing_->time[l][t];
      const Tensor &v_prime = trace.voltage_prime[l][t];
      for (size_t i = 0; i < dv.size(); ++i) {
        if (s[i] == 1.0) dv[i] += lambda_timing_ * (dt[i] / -v_prime[i]);
      }
    }
    membrane_->voltage[l][t] = std::move(dv);
  }

  // dL/dI of trainable layer `l`, carrying the leak of V and I backwards.
  void VoltageToCurrent(size_t t, size_t l) {
    const SnnConfig &config = context_.config;
    const double beta_v = context_.kernels.beta_v;
    const Tensor &s = context_.trace.spikes[l][t];
    const bool has_next = t + 1 < term_;
    Tensor &dv = membrane_->voltage[l][t];
    Tensor di(s.shape());
    Tensor v_dep;
    if (style_ != DecayStyle::kRnn) v_dep = Tensor(s.shape());

    for (size_t i = 0; i < s.size(); ++i) {
      const double gate = style_ == DecayStyle::kSlayer ? 1.0 : 1 - s[i];
      double v_grad;
      if (style_ == DecayStyle::kRnn) {
        if (has_next) {
          dv[i] += config.alpha_v * gate * membrane_->voltage[l][t + 1][i];
        }
        v_grad = dv[i];
      } else {
        v_grad = dv[i];
        if (has_next) {
          v_grad += config.alpha_v * gate * membrane_->voltage_dep[l][t + 1][i];
        }
        v_dep[i] = v_grad;
      }
      di[i] = beta_v * v_grad;
      if (has_next) {
        di[i] += config.alpha_i * gate * membrane_->current[l][t + 1][i];
      }
    }
    membrane_->current[l][t] = std::move(di);
    if (style_ != DecayStyle::kRnn) membrane_->voltage_dep[l][t] = std::move(v_dep);
  }

  const BackwardContext &context_;
  const DecayStyle style_;
  const double lambda_act_;
  const double lambda_timing_;
  const size_t term_;
  MembraneGradients *membrane_;
  LayerTimeTensors *spike_;
  TimingGradients *timing_;
};

// Lowers the fc weights of neurons that stayed silent for the whole run, so
// that the timing rule, which only sees spikes, can revive them.
void ApplyTimingPenalty(const BackwardContext &context, size_t l, size_t m,
                        Tensor *weight_grad) {
  const SimulationTrace &trace = context.trace;
  const LayerDescriptor &layer = context.topology.layers[l];
  const size_t n_out = layer.output_shape[0];
  const size_t batch = trace.batch_size;
  const double coefficient =
      context.config.timing_penalty / static_cast<double>(layer.fan_in());
  for (size_t o = 0; o < n_out; ++o) {
    double silent = 0.0;
    for (size_t r = m * batch; r < (m + 1) * batch; ++r) {
      double spikes = 0.0;
      for (size_t t = 0; t < trace.term_length; ++t) {
        spikes += trace.spikes[l][t].row(r)[o];
      }
      if (spikes == 0.0) silent += 1.0;
    }
    const double penalty = coefficient * silent / batch;
    double *w = weight_grad->row(o);
    for (size_t i = 0; i < weight_grad->dim(1); ++i) w[i] -= penalty;
  }
}

}  // namespace

double Surrogate(double voltage, double surr_alpha, double surr_beta) {
  return surr_alpha * std::exp(-surr_beta * std::abs(voltage - 1.0));
}

void BackpropActivation(const BackwardContext &context, DecayStyle style,
                        const LossResult &seeds,
                        ActivationGradientTrace *gradients) {
  Recurrence recurrence(context, style, 1.0, 0.0, &gradients->membrane,
                        &gradients->spike, nullptr);
  recurrence.Run(seeds);
}

void BackpropTiming(const BackwardContext &context, const LossResult &seeds,
                    TimingGradientTrace *gradients) {
  Recurrence recurrence(context, DecayStyle::kSrm, 0.0, 1.0,
                        &gradients->membrane, nullptr, &gradients->timing);
  recurrence.Run(seeds);
}

void BackpropAntlr(const BackwardContext &context, const LossResult &seeds,
                   AntlrGradientTrace *gradients) {
  Recurrence recurrence(context, DecayStyle::kSrm, context.config.lambda_act,
                        context.config.lambda_timing, &gradients->membrane,
                        &gradients->spike, &gradients->timing);
  recurrence.Run(seeds);
}

void AccumulateParameterGradients(const BackwardContext &context,
                                  DecayStyle style,
                                  const MembraneGradients &membrane,
                                  bool timing_penalty, ParameterArena *params) {
  const SimulationTrace &trace = context.trace;
  const Topology &topology = context.topology;
  const double beta_i = context.kernels.beta_i;
  const double beta_bias = context.kernels.beta_bias;
  const size_t batch = trace.batch_size;
  const LayerTimeTensors &v_dep =
      style == DecayStyle::kRnn ? membrane.voltage : membrane.voltage_dep;

  for (size_t l = 0; l < topology.num_layers(); ++l) {
    const LayerDescriptor &layer = topology.layers[l];
    if (!layer.trainable()) continue;
    for (size_t m = 0; m < trace.num_models; ++m) {
      LayerParams &p = params->at(l, m);
      p.weight_grad.Fill(0.0);
      p.bias_grad.Fill(0.0);
      for (size_t t = 0; t < trace.term_length; ++t) {
        const Tensor x = trace.LayerInput(l, t);
        const Tensor &di = membrane.current[l][t];
        if (layer.kind == LayerKind::kFc) {
          LinearAccumulateWeightGrad(di, x, m * batch, (m + 1) * batch, beta_i,
                                     &p.weight_grad);
        } else {
          Conv2dAccumulateWeightGrad(x, di, layer.padding, beta_i,
                                     &p.weight_grad);
        }
        const Tensor &dv = v_dep[l][t];
        const size_t row_size = dv.row_size();
        const size_t bias_stride = row_size / p.bias_grad.size();
        for (size_t r = m * batch; r < (m + 1) * batch; ++r) {
          const double *g = dv.row(r);
          for (size_t e = 0; e < row_size; ++e) {
            p.bias_grad[e / bias_stride] += beta_bias * g[e];
          }
        }
      }
      if (timing_penalty && layer.kind == LayerKind::kFc) {
        ApplyTimingPenalty(context, l, m, &p.weight_grad);
      }
      if (ReplaceNaNWithZero(&p.weight_grad) + ReplaceNaNWithZero(&p.bias_grad) >
          0) {
        SPIKEGRAD_LOG(LogSeverity::WARNING,
                      absl::StrCat("nan found and replaced with 0 in layer ",
                                   l, " model ", m));
      }
    }
  }
}

size_t ReplaceNaNWithZero(Tensor *tensor) {
  size_t replaced = 0;
  for (size_t i = 0; i < tensor->size(); ++i) {
    if (std::isnan((*tensor)[i])) {
      (*tensor)[i] = 0.0;
      ++replaced;
    }
  }
  return replaced;
}

absl::StatusOr<double> GradClipForModel(const std::vector<double> &grad_clip,
                                        size_t model, size_t num_models) {
  if (grad_clip.empty()) {
    return absl::InvalidArgumentError("grad_clip must not be empty");
  }
  if (num_models % grad_clip.size() != 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "len(grad_clip) must be a factor of num_models (were ",
        grad_clip.size(), " and ", num_models, ")"));
  }
  SPIKEGRAD_CHECK(model < num_models);
  const size_t models_per_clip = num_models / grad_clip.size();
  return std::abs(grad_clip[model / models_per_clip]);
}

absl::Status ClipGradients(const std::vector<double> &grad_clip,
                           ParameterArena *params) {
  const size_t num_models = params->num_models();
  // A single model only ever uses the first bound.
  const std::vector<double> clips =
      num_models == 1 && !grad_clip.empty()
          ? std::vector<double>(1, grad_clip[0])
          : grad_clip;
  for (size_t m = 0; m < num_models; ++m) {
    absl::StatusOr<double> clip = GradClipForModel(clips, m, num_models);
    if (!clip.ok()) return clip.status();
    for (size_t l = 0; l < params->num_layers(); ++l) {
      LayerParams &p = params->at(l, m);
      for (Tensor *grad : {&p.weight_grad, &p.bias_grad}) {
        for (size_t i = 0; i < grad->size(); ++i) {
          (*grad)[i] = std::min(std::max((*grad)[i], -*clip), *clip);
        }
      }
    }
  }
  return absl::OkStatus();
}

absl::Status RunBackward(const BackwardContext &context,
                         const LossResult &seeds, ParameterArena *params) {
  switch (context.config.lrule) {
    case LearningRule::kActivation: {
      ActivationGradientTrace gradients;
      BackpropActivation(context, context.config.decay_style, seeds,
                         &gradients);
      AccumulateParameterGradients(context, context.config.decay_style,
                                   gradients.membrane, false, params);
      break;
    }
    case LearningRule::kTiming: {
      TimingGradientTrace gradients;
      BackpropTiming(context, seeds, &gradients);
      AccumulateParameterGradients(context, DecayStyle::kSrm,
                                   gradients.membrane, true, params);
      break;
    }
    case LearningRule::kAntlr: {
      AntlrGradientTrace gradients;
      BackpropAntlr(context, seeds, &gradients);
      AccumulateParameterGradients(context, DecayStyle::kSrm,
                                   gradients.membrane, false, params);
      break;
    }
  }
  return ClipGradients(context.config.grad_clip, params);
}

}  // namespace spikegrad
