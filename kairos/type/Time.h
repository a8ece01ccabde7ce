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

/// A time of day between 00:00:00 and 23:59:59.999999 with microsecond
/// precision.
///
/// The fold (0 or 1) disambiguates a wall time repeated by a backward clock
/// transition: fold 0 selects the earlier of the two instants. Fold only has
/// meaning once a time zone is attached and takes no part in comparisons.
class Time {
 public:
  constexpr Time() : hour_(0), minute_(0), second_(0), micros_(0), fold_(0) {}

  /// Returns UserError if the fields do not form a valid time of day or the
  /// fold is not 0 or 1.
  static Expected<Time> create(
      int32_t hour,
      int32_t minute,
      int32_t second,
      int32_t micros,
      int32_t fold = 0);

  /// Microseconds since midnight must be in [0, 86400000000).
  static Expected<Time> fromMicros(int64_t micros, int32_t fold = 0);

  static constexpr Time min() {
    return Time();
  }

  static constexpr Time max() {
    return Time(23, 59, 59, 999'999, 0);
  }

  int32_t hour() const {
    return hour_;
  }

  int32_t minute() const {
    return minute_;
  }

  int32_t second() const {
    return second_;
  }

  int32_t microsecond() const {
    return micros_;
  }

  int32_t fold() const {
    return fold_;
  }

  /// Returns a copy with the given fold.
  Time withFold(int32_t fold) const;

  /// Microseconds since midnight.
  int64_t toMicros() const;

  /// ISO 8601: HH:MM:SS, followed by .ffffff when microsecond is not zero.
  std::string toString() const;

  bool operator==(const Time& other) const {
    return toMicros() == other.toMicros();
  }

  bool operator!=(const Time& other) const {
    return !(*this == other);
  }

  bool operator<(const Time& other) const {
    return toMicros() < other.toMicros();
  }

  bool operator<=(const Time& other) const {
    return toMicros() <= other.toMicros();
  }

  bool operator>(const Time& other) const {
    return toMicros() > other.toMicros();
  }

  bool operator>=(const Time& other) const {
    return toMicros() >= other.toMicros();
  }

 private:
  constexpr Time(
      int32_t hour,
      int32_t minute,
      int32_t second,
      int32_t micros,
      int32_t fold)
      : hour_(hour),
        minute_(minute),
        second_(second),
        micros_(micros),
        fold_(fold) {}

  int32_t hour_;
  int32_t minute_;
  int32_t second_;
  int32_t micros_;
  int32_t fold_;
};

std::ostream& operator<<(std::ostream& os, const Time& time);

} // namespace facebook::kairos

template <>
struct fmt::formatter<facebook::kairos::Time> : formatter<std::string> {
  auto format(const facebook::kairos::Time& t, format_context& ctx) {
    return formatter<std::string>::format(t.toString(), ctx);
  }
};
