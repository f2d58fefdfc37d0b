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

#include "snn/ops.h"

#include "common/util.h"

namespace spikegrad {

namespace {

// Geometry of a [rows, C, H, W] map.
struct MapDims {
  explicit MapDims(const Shape &shape) {
    SPIKEGRAD_CHECK(shape.size() == 4, "Expected a [rows, C, H, W] tensor, got ",
                    ShapeToString(shape));
    rows = shape[0];
    channels = shape[1];
    height = shape[2];
    width = shape[3];
  }
  size_t plane() const { return height * width; }
  size_t row() const { return channels * plane(); }

  size_t rows, channels, height, width;
};

void CheckLinear(const Tensor &x, const Tensor &weight, size_t row_end) {
  SPIKEGRAD_CHECK(weight.rank() == 2);
  SPIKEGRAD_CHECK(x.rank() == 2, "Linear input must be [rows, N], got ",
                  x.ShapeString());
  SPIKEGRAD_CHECK(row_end <= x.rows());
}

}  // namespace

void LinearForward(const Tensor &x, const Tensor &weight, size_t row_begin,
                   size_t row_end, Tensor *y) {
  CheckLinear(x, weight, row_end);
  const size_t n_in = weight.dim(1);
  const size_t n_out = weight.dim(0);
  SPIKEGRAD_CHECK(x.dim(1) == n_in && y->rank() == 2 && y->dim(1) == n_out);
  for (size_t r = row_begin; r < row_end; ++r) {
    const double *in = x.row(r);
    double *out = y->row(r);
    for (size_t o = 0; o < n_out; ++o) {
      const double *w = weight.row(o);
      double sum = 0.0;
      for (size_t i = 0; i < n_in; ++i) sum += w[i] * in[i];
      out[o] = sum;
    }
  }
}

void LinearBackwardInput(const Tensor &dy, const Tensor &weight,
                         size_t row_begin, size_t row_end, Tensor *dx) {
  CheckLinear(dy, weight, row_end);
  const size_t n_in = weight.dim(1);
  const size_t n_out = weight.dim(0);
  SPIKEGRAD_CHECK(dy.dim(1) == n_out && dx->rank() == 2 && dx->dim(1) == n_in);
  for (size_t r = row_begin; r < row_end; ++r) {
    const double *grad = dy.row(r);
    double *out = dx->row(r);
    for (size_t i = 0; i < n_in; ++i) out[i] = 0.0;
    for (size_t o = 0; o < n_out; ++o) {
      if (grad[o] == 0.0) continue;
      const double *w = weight.row(o);
      for (size_t i = 0; i < n_in; ++i) out[i] += w[i] * grad[o];
    }
  }
}

void LinearAccumulateWeightGrad(const Tensor &dy, const Tensor &x,
                                size_t row_begin, size_t row_end, double scale,
                                Tensor *dw) {
  SPIKEGRAD_CHECK(dw->rank() == 2);
  const size_t n_out = dw->dim(0);
  const size_t n_in = dw->dim(1);
  SPIKEGRAD_CHECK(dy.dim(1) == n_out && x.dim(1) == n_in);
  SPIKEGRAD_CHECK(row_end <= dy.rows() && row_end <= x.rows());
  for (size_t r = row_begin; r < row_end; ++r) {
    const double *grad = dy.row(r);
    const double *in = x.row(r);
    for (size_t o = 0; o < n_out; ++o) {
      const double g = scale * grad[o];
      double *w = dw->row(o);
      for (size_t i = 0; i < n_in; ++i) w[i] += g * in[i];
    }
  }
}

Tensor Conv2dForward(const Tensor &x, const Tensor &weight, size_t padding) {
  const MapDims in(x.shape());
  SPIKEGRAD_CHECK(weight.rank() == 4 && weight.dim(1) == in.channels);
  const size_t out_channels = weight.dim(0);
  const size_t k = weight.dim(2);
  const long pad = static_cast<long>(padding);
  const size_t out_h = in.height + 2 * padding - k + 1;
  const size_t out_w = in.width + 2 * padding - k + 1;
  Tensor y({in.rows, out_channels, out_h, out_w});
  const MapDims out(y.shape());

  for (size_t r = 0; r < in.rows; ++r) {
    const double *src = x.row(r);
    double *dst = y.row(r);
    for (size_t o = 0; o < out_channels; ++o) {
      for (size_t c = 0; c < in.channels; ++c) {
        const double *kernel = weight.data() + (o * in.channels + c) * k * k;
        const double *plane = src + c * in.plane();
        for (size_t i = 0; i < out_h; ++i) {
          for (size_t j = 0; j < out_w; ++j) {
            double sum = 0.0;
            for (size_t ki = 0; ki < k; ++ki) {
              const long yy = static_cast<long>(i + ki) - pad;
              if (yy < 0 || yy >= static_cast<long>(in.height)) continue;
              for (size_t kj = 0; kj < k; ++kj) {
                const long xx = static_cast<long>(j + kj) - pad;
                if (xx < 0 || xx >= static_cast<long>(in.width)) continue;
                sum += kernel[ki * k + kj] * plane[yy * in.width + xx];
              }
            }
            dst[o * out.plane() + i * out_w + j] += sum;
          }
        }
      }
    }
  }
  return y;
}

Tensor Conv2dBackwardInput(const Tensor &dy, const Tensor &weight,
                           size_t padding, const Shape &input_shape) {
  const MapDims out(dy.shape());
  Tensor dx(input_shape);
  const MapDims in(dx.shape());
  SPIKEGRAD_CHECK(in.rows == out.rows);
  SPIKEGRAD_CHECK(weight.rank() == 4 && weight.dim(0) == out.channels &&
                  weight.dim(1) == in.channels);
  const size_t k = weight.dim(2);
  const long pad = static_cast<long>(padding);

  for (size_t r = 0; r < out.rows; ++r) {
    const double *grad = dy.row(r);
    double *dst = dx.row(r);
    for (size_t o = 0; o < out.channels; ++o) {
      for (size_t i = 0; i < out.height; ++i) {
        for (size_t j = 0; j < out.width; ++j) {
          const double g = grad[o * out.plane() + i * out.width + j];
          if (g == 0.0) continue;
          for (size_t c = 0; c < in.channels; ++c) {
            const double *kernel =
                weight.data() + (o * in.channels + c) * k * k;
            double *plane = dst + c * in.plane();
            for (size_t ki = 0; ki < k; ++ki) {
              const long yy = static_cast<long>(i + ki) - pad;
              if (yy < 0 || yy >= static_cast<long>(in.height)) continue;
              for (size_t kj = 0; kj < k; ++kj) {
                const long xx = static_cast<long>(j + kj) - pad;
                if (xx < 0 || xx >= static_cast<long>(in.width)) continue;
                plane[yy * in.width + xx] += kernel[ki * k + kj] * g;
              }
            }
          }
        }
      }
    }
  }
  return dx;
}

void Conv2dAccumulateWeightGrad(const Tensor &x, const Tensor &dy,
                                size_t padding, double scale, Tensor *dw) {
  const MapDims in(x.shape());
  const MapDims out(dy.shape());
  SPIKEGRAD_CHECK(in.rows == out.rows);
  SPIKEGRAD_CHECK(dw->rank() == 4 && dw->dim(0) == out.channels &&
                  dw->dim(1) == in.channels);
  const size_t k = dw->dim(2);
  const long pad = static_cast<long>(padding);

  for (size_t o = 0; o < out.channels; ++o) {
    for (size_t c = 0; c < in.channels; ++c) {
      double *kernel = dw->data() + (o * in.channels + c) * k * k;
      for (size_t ki = 0; ki < k; ++ki) {
        for (size_t kj = 0; kj < k; ++kj) {
          double sum = 0.0;
          for (size_t r = 0; r < in.rows; ++r) {
            const double *grad = dy.row(r) + o * out.plane();
            const double *plane = x.row(r) + c * in.plane();
            for (size_t i = 0; i < out.height; ++i) {
              const long yy = static_cast<long>(i + ki) - pad;
              if (yy < 0 || yy >= static_cast<long>(in.height)) continue;
              for (size_t j = 0; j < out.width; ++j) {
                const long xx = static_cast<long>(j + kj) - pad;
                if (xx < 0 || xx >= static_cast<long>(in.width)) continue;
                sum += grad[i * out.width + j] * plane[yy * in.width + xx];
              }
            }
          }
          kernel[ki * k + kj] += scale * sum;
        }
      }
    }
  }
}

Tensor AvgPoolForward(const Tensor &x, size_t kernel) {
  const MapDims in(x.shape());
  Tensor y({in.rows, in.channels, in.height / kernel, in.width / kernel});
  const MapDims out(y.shape());
  const double norm = 1.0 / (kernel * kernel);
  for (size_t r = 0; r < in.rows; ++r) {
    for (size_t c = 0; c < in.channels; ++c) {
      const double *plane = x.row(r) + c * in.plane();
      double *dst = y.row(r) + c * out.plane();
      for (size_t i = 0; i < out.height; ++i) {
        for (size_t j = 0; j < out.width; ++j) {
          double sum = 0.0;
          for (size_t ki = 0; ki < kernel; ++ki) {
            for (size_t kj = 0; kj < kernel; ++kj) {
              sum += plane[(i * kernel + ki) * in.width + j * kernel + kj];
            }
          }
          dst[i * out.width + j] = sum * norm;
        }
      }
    }
  }
  return y;
}

Tensor AvgPoolBackward(const Tensor &dy, size_t kernel,
                       const Shape &input_shape) {
  const MapDims out(dy.shape());
  Tensor dx(input_shape);
  const MapDims in(dx.shape());
  SPIKEGRAD_CHECK(in.rows == out.rows && in.channels == out.channels &&
                      in.height / kernel == out.height &&
                      in.width / kernel == out.width,
                  "Pooled gradient ", dy.ShapeString(),
                  " does not match input ", dx.ShapeString());
  const double norm = 1.0 / (kernel * kernel);
  for (size_t r = 0; r < out.rows; ++r) {
    for (size_t c = 0; c < out.channels; ++c) {
      const double *grad = dy.row(r) + c * out.plane();
      double *plane = dx.row(r) + c * in.plane();
      for (size_t i = 0; i < out.height; ++i) {
        for (size_t j = 0; j < out.width; ++j) {
          const double g = grad[i * out.width + j] * norm;
          for (size_t ki = 0; ki < kernel; ++ki) {
            for (size_t kj = 0; kj < kernel; ++kj) {
              plane[(i * kernel + ki) * in.width + j * kernel + kj] = g;
            }
          }
        }
      }
    }
  }
  return dx;
}

Tensor MaxPoolForward(const Tensor &x, size_t kernel,
                      std::vector<size_t> *argmax) {
  const MapDims in(x.shape());
  Tensor y({in.rows, in.channels, in.height / kernel, in.width / kernel});
  const MapDims out(y.shape());
  argmax->assign(y.size(), 0);
  for (size_t r = 0; r < in.rows; ++r) {
    const double *src = x.row(r);
    for (size_t c = 0; c < in.channels; ++c) {
      for (size_t i = 0; i < out.height; ++i) {
        for (size_t j = 0; j < out.width; ++j) {
          size_t best = c * in.plane() + i * kernel * in.width + j * kernel;
          for (size_t ki = 0; ki < kernel; ++ki) {
            for (size_t kj = 0; kj < kernel; ++kj) {
              const size_t idx = c * in.plane() +
                                 (i * kernel + ki) * in.width +
                                 j * kernel + kj;
              if (src[idx] > src[best]) best = idx;
            }
          }
          const size_t out_idx =
              r * out.row() + c * out.plane() + i * out.width + j;
          y[out_idx] = src[best];
          (*argmax)[out_idx] = best;
        }
      }
    }
  }
  return y;
}

Tensor MaxPoolBackward(const Tensor &dy, const std::vector<size_t> &argmax,
                       const Shape &input_shape) {
  SPIKEGRAD_CHECK(argmax.size() == dy.size());
  Tensor dx(input_shape);
  SPIKEGRAD_CHECK(dx.rows() == dy.rows());
  const size_t out_row = dy.row_size();
  for (size_t r = 0; r < dy.rows(); ++r) {
    double *dst = dx.row(r);
    for (size_t i = 0; i < out_row; ++i) {
      const size_t idx = r * out_row + i;
      dst[argmax[idx]] += dy[idx];
    }
  }
  return dx;
}

}  // namespace spikegrad
