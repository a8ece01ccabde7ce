/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <ostream>
#include <string>

#include <fmt/format.h>

#include "kairos/common/base/Status.h"

namespace facebook::kairos {

/// A signed span of time with microsecond precision, normalized as
/// (days, seconds, microseconds) with 0 <= seconds < 86400 and
/// 0 <= microseconds < 1000000. Only days carries the sign, so -1us is
/// (-1, 86399, 999999).
class Duration {
 public:
  static constexpr int64_t kMinDays = -999'999'999;
  static constexpr int64_t kMaxDays = 999'999'999;

  constexpr Duration() : days_(0), seconds_(0), micros_(0) {}

  /// Normalizes the arguments, which may be of any sign and magnitude.
  /// Returns Overflow if the normalized days fall outside
  /// [kMinDays, kMaxDays].
  static Expected<Duration>
  create(int64_t days, int64_t seconds = 0, int64_t micros = 0);

  static Duration fromMicros(int64_t micros);

  static constexpr Duration min() {
    return Duration(kMinDays, 0, 0);
  }

  static constexpr Duration max() {
    return Duration(kMaxDays, 86'399, 999'999);
  }

  int64_t days() const {
    return days_;
  }

  int32_t seconds() const {
    return seconds_;
  }

  int32_t microseconds() const {
    return micros_;
  }

  /// Total microseconds. Throws KairosUserError (ARITHMETIC_ERROR) when the
  /// total does not fit in 64 bits, i.e. beyond about 106 million days.
  int64_t toMicros() const;

  /// Formats as [D day[s], ]H:MM:SS[.ffffff].
  std::string toString() const;

  bool operator==(const Duration& other) const {
    return days_ == other.days_ && seconds_ == other.seconds_ &&
        micros_ == other.micros_;
  }

  bool operator!=(const Duration& other) const {
    return !(*this == other);
  }

  bool operator<(const Duration& other) const {
    if (days_ != other.days_) {
      return days_ < other.days_;
    }
    if (seconds_ != other.seconds_) {
      return seconds_ < other.seconds_;
    }
    return micros_ < other.micros_;
  }

  bool operator<=(const Duration& other) const {
    return !(other < *this);
  }

  bool operator>(const Duration& other) const {
    return other < *this;
  }

  bool operator>=(const Duration& other) const {
    return !(*this < other);
  }

 private:
  constexpr Duration(int64_t days, int32_t seconds, int32_t micros)
      : days_(days), seconds_(seconds), micros_(micros) {}

  int64_t days_;
  int32_t seconds_;
  int32_t micros_;
};

std::ostream& operator<<(std::ostream& os, const Duration& duration);

} // namespace facebook::kairos

template <>
struct fmt::formatter<facebook::kairos::Duration> : formatter<std::string> {
  auto format(const facebook::kairos::Duration& d, format_context& ctx) {
    return formatter<std::string>::format(d.toString(), ctx);
  }
};
