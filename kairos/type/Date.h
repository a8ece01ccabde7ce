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

/// A proleptic Gregorian calendar date between 0001-01-01 and 9999-12-31.
class Date {
 public:
  constexpr Date() : year_(1970), month_(1), day_(1) {}

  /// Returns UserError if the fields do not form a valid date.
  static Expected<Date> create(int32_t year, int32_t month, int32_t day);

  /// Returns Overflow if the result is outside [min(), max()].
  static Expected<Date> fromDaysSinceEpoch(int64_t days);

  static constexpr Date min() {
    return Date(1, 1, 1);
  }

  static constexpr Date max() {
    return Date(9999, 12, 31);
  }

  int32_t year() const {
    return year_;
  }

  int32_t month() const {
    return month_;
  }

  int32_t day() const {
    return day_;
  }

  /// Number of days since 1970-01-01, negative before.
  int64_t daysSinceEpoch() const;

  /// ISO 8601: YYYY-MM-DD.
  std::string toString() const;

  bool operator==(const Date& other) const {
    return year_ == other.year_ && month_ == other.month_ &&
        day_ == other.day_;
  }

  bool operator!=(const Date& other) const {
    return !(*this == other);
  }

  bool operator<(const Date& other) const {
    if (year_ != other.year_) {
      return year_ < other.year_;
    }
    if (month_ != other.month_) {
      return month_ < other.month_;
    }
    return day_ < other.day_;
  }

  bool operator<=(const Date& other) const {
    return !(other < *this);
  }

  bool operator>(const Date& other) const {
    return other < *this;
  }

  bool operator>=(const Date& other) const {
    return !(*this < other);
  }

 private:
  constexpr Date(int32_t year, int32_t month, int32_t day)
      : year_(year), month_(month), day_(day) {}

  int32_t year_;
  int32_t month_;
  int32_t day_;
};

std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace facebook::kairos

template <>
struct fmt::formatter<facebook::kairos::Date> : formatter<std::string> {
  auto format(const facebook::kairos::Date& d, format_context& ctx) {
    return formatter<std::string>::format(d.toString(), ctx);
  }
};
