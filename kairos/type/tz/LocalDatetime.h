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

#include "kairos/type/Datetime.h"
#include "kairos/type/Time.h"
#include "kairos/type/tz/TimeZone.h"

namespace facebook::kairos {

/// A wall time, optionally attached to a time zone together with the UTC
/// offset it resolved to. Without a zone the value is naive and its offset is
/// zero.
class LocalDatetime {
 public:
  explicit LocalDatetime(const Datetime& local) : local_(local) {}

  LocalDatetime(const Datetime& local, tz::TimeZonePtr zone, Duration offset)
      : local_(local), zone_(std::move(zone)), utcOffset_(offset) {}

  /// Attaches 'zone' with the offset it reports for 'local', including its
  /// fold. Never fails. A null zone yields a naive value.
  static LocalDatetime attach(const Datetime& local, tz::TimeZonePtr zone);

  const Datetime& local() const {
    return local_;
  }

  const tz::TimeZonePtr& zone() const {
    return zone_;
  }

  bool isNaive() const {
    return zone_ == nullptr;
  }

  const Duration& utcOffset() const {
    return utcOffset_;
  }

  /// Microseconds since the UTC epoch. Defined even when the UTC instant
  /// itself is not a representable Datetime.
  int64_t utcMicros() const;

  /// Returns Overflow when the UTC instant is outside the Datetime range.
  Expected<Datetime> toUtc() const;

  /// E.g. 2000-01-01T00:00:00+05:00[Asia/Karachi]; naive values print the
  /// wall time only.
  std::string toString() const;

  bool operator==(const LocalDatetime& other) const {
    return local_ == other.local_ && local_.fold() == other.local_.fold() &&
        zone_ == other.zone_ && utcOffset_ == other.utcOffset_;
  }

  bool operator!=(const LocalDatetime& other) const {
    return !(*this == other);
  }

 private:
  Datetime local_;
  tz::TimeZonePtr zone_;
  Duration utcOffset_;
};

/// A time of day, optionally with a time zone. Times carry no date, so no
/// offset is resolved.
class LocalTime {
 public:
  explicit LocalTime(const Time& local, tz::TimeZonePtr zone = nullptr)
      : local_(local), zone_(std::move(zone)) {}

  const Time& local() const {
    return local_;
  }

  const tz::TimeZonePtr& zone() const {
    return zone_;
  }

  bool isNaive() const {
    return zone_ == nullptr;
  }

  std::string toString() const;

  bool operator==(const LocalTime& other) const {
    return local_ == other.local_ && local_.fold() == other.local_.fold() &&
        zone_ == other.zone_;
  }

  bool operator!=(const LocalTime& other) const {
    return !(*this == other);
  }

 private:
  Time local_;
  tz::TimeZonePtr zone_;
};

std::ostream& operator<<(std::ostream& os, const LocalDatetime& value);

std::ostream& operator<<(std::ostream& os, const LocalTime& value);

} // namespace facebook::kairos

template <>
struct fmt::formatter<facebook::kairos::LocalDatetime>
    : formatter<std::string> {
  auto format(const facebook::kairos::LocalDatetime& d, format_context& ctx) {
    return formatter<std::string>::format(d.toString(), ctx);
  }
};

template <>
struct fmt::formatter<facebook::kairos::LocalTime> : formatter<std::string> {
  auto format(const facebook::kairos::LocalTime& t, format_context& ctx) {
    return formatter<std::string>::format(t.toString(), ctx);
  }
};
