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
#include "kairos/type/Date.h"
#include "kairos/type/Duration.h"
#include "kairos/type/Time.h"

namespace facebook::kairos {

/// A naive (time zone free) date and time of day between
/// 0001-01-01T00:00:00 and 9999-12-31T23:59:59.999999.
///
/// Carries the fold of its time of day. Like Time, comparisons ignore the
/// fold.
class Datetime {
 public:
  constexpr Datetime() = default;

  Datetime(const Date& date, const Time& time) : date_(date), time_(time) {}

  /// Returns UserError if the fields do not form a valid datetime.
  static Expected<Datetime> create(
      int32_t year,
      int32_t month,
      int32_t day,
      int32_t hour = 0,
      int32_t minute = 0,
      int32_t second = 0,
      int32_t micros = 0,
      int32_t fold = 0);

  /// Builds the datetime that lies 'micros' microseconds after
  /// 1970-01-01T00:00:00. Returns Overflow outside [min(), max()].
  static Expected<Datetime> fromMicros(int64_t micros, int32_t fold = 0);

  static Datetime min() {
    return Datetime(Date::min(), Time::min());
  }

  static Datetime max() {
    return Datetime(Date::max(), Time::max());
  }

  const Date& date() const {
    return date_;
  }

  const Time& time() const {
    return time_;
  }

  int32_t year() const {
    return date_.year();
  }

  int32_t month() const {
    return date_.month();
  }

  int32_t day() const {
    return date_.day();
  }

  int32_t hour() const {
    return time_.hour();
  }

  int32_t minute() const {
    return time_.minute();
  }

  int32_t second() const {
    return time_.second();
  }

  int32_t microsecond() const {
    return time_.microsecond();
  }

  int32_t fold() const {
    return time_.fold();
  }

  Datetime withFold(int32_t fold) const {
    return Datetime(date_, time_.withFold(fold));
  }

  /// Microseconds since 1970-01-01T00:00:00 of the same calendar.
  int64_t toMicros() const;

  /// Adds a (possibly negative) duration. The fold of the result is 0.
  /// Returns Overflow when the result is not representable.
  Expected<Datetime> plus(const Duration& duration) const;

  /// ISO 8601: YYYY-MM-DDTHH:MM:SS[.ffffff].
  std::string toString() const;

  bool operator==(const Datetime& other) const {
    return date_ == other.date_ && time_ == other.time_;
  }

  bool operator!=(const Datetime& other) const {
    return !(*this == other);
  }

  bool operator<(const Datetime& other) const {
    if (date_ != other.date_) {
      return date_ < other.date_;
    }
    return time_ < other.time_;
  }

  bool operator<=(const Datetime& other) const {
    return !(other < *this);
  }

  bool operator>(const Datetime& other) const {
    return other < *this;
  }

  bool operator>=(const Datetime& other) const {
    return !(*this < other);
  }

 private:
  Date date_;
  Time time_;
};

std::ostream& operator<<(std::ostream& os, const Datetime& datetime);

} // namespace facebook::kairos

template <>
struct fmt::formatter<facebook::kairos::Datetime> : formatter<std::string> {
  auto format(const facebook::kairos::Datetime& d, format_context& ctx) {
    return formatter<std::string>::format(d.toString(), ctx);
  }
};
