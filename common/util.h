/*
 * Copyright 2019 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SPIKEGRAD_COMMON_UTIL_H_
#define SPIKEGRAD_COMMON_UTIL_H_

#include <math.h>
#include <stdlib.h>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <string>
#include <type_traits>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace spikegrad {

enum class LogSeverity { INFO = 0, WARNING = 1, ERROR = 2, FATAL = 3 };

namespace internal {

static constexpr char kLogInitials[] = {"IWEF"};

inline std::string log_time_string() {
  absl::Time t1 = absl::Now();
  absl::TimeZone tz = absl::LocalTimeZone();
  return absl::FormatTime(t1, tz);
}

[[noreturn]] inline void fail_check_and_die(const std::string &expression,
                                            const std::string &location,
                                            int line,
                                            const std::string &message = "") {
  std::cerr << "SPIKEGRAD_CHECK(" << expression << ") failed at " << location
            << ":" << line;
  if (message != "") std::cerr << ": " << message;
  std::cerr << std::endl;
  abort();
}

}  // namespace internal

#define SPIKEGRAD_LOG(severity, message)                                     \
  {                                                                          \
    static_assert(                                                           \
        std::is_same<decltype((severity)), ::spikegrad::LogSeverity>::value, \
        "Wrong severity type");                                              \
                                                                             \
    std::cerr                                                                \
        << ::spikegrad::internal::kLogInitials[static_cast<int>((severity))] \
        << ::spikegrad::internal::log_time_string() << " " << __FILE__       \
        << ":" << __LINE__ << "] " << (message) << std::endl;                \
    if ((severity) == ::spikegrad::LogSeverity::FATAL) {                     \
      abort();                                                               \
    }                                                                        \
  }

// Internal invariant check. Configuration and shape errors coming from the
// caller are reported through absl::Status instead.
#define SPIKEGRAD_CHECK(condition, ...)                               \
  {                                                                   \
    while (!(condition)) {                                            \
      ::spikegrad::internal::fail_check_and_die(                      \
          #condition, __FILE__, __LINE__, absl::StrCat(__VA_ARGS__)); \
    }                                                                 \
  }

template <typename T>
std::string VecToString(const std::vector<T> &v) {
  return absl::StrCat("[", absl::StrJoin(v, ", "), "]");
}

template <typename T>
T IPow(T base, uint32_t exp) {
  T result = 1;
  T mul = base;

  while (exp) {
    if (exp & 1) result *= mul;
    mul *= mul;
    exp >>= 1;
  }

  return result;
}

}  // namespace spikegrad

#endif  // SPIKEGRAD_COMMON_UTIL_H_
