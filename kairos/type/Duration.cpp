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

#include "kairos/type/Duration.h"

#include "kairos/common/base/CheckedArithmetic.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos {
namespace {

// Floor division and the matching non-negative remainder.
inline void
floorDivMod(int64_t value, int64_t divisor, int64_t& q, int64_t& r) {
  q = value / divisor;
  r = value % divisor;
  if (r < 0) {
    r += divisor;
    --q;
  }
}

} // namespace

// static
Expected<Duration>
Duration::create(int64_t days, int64_t seconds, int64_t micros) {
  int64_t carrySeconds;
  int64_t normalizedMicros;
  floorDivMod(micros, util::kMicrosPerSec, carrySeconds, normalizedMicros);

  auto totalSeconds = tryPlus(seconds, carrySeconds);
  if (!totalSeconds.has_value()) {
    return folly::makeUnexpected(
        Status::Overflow("duration seconds overflow: {}", seconds));
  }

  int64_t carryDays;
  int64_t normalizedSeconds;
  floorDivMod(*totalSeconds, util::kSecsPerDay, carryDays, normalizedSeconds);

  auto totalDays = tryPlus(days, carryDays);
  if (!totalDays.has_value() || *totalDays < kMinDays ||
      *totalDays > kMaxDays) {
    return folly::makeUnexpected(Status::Overflow(
        "duration out of range: days={} seconds={} microseconds={}",
        days,
        seconds,
        micros));
  }
  return Duration(
      *totalDays,
      static_cast<int32_t>(normalizedSeconds),
      static_cast<int32_t>(normalizedMicros));
}

// static
Duration Duration::fromMicros(int64_t micros) {
  int64_t totalSeconds;
  int64_t normalizedMicros;
  floorDivMod(micros, util::kMicrosPerSec, totalSeconds, normalizedMicros);
  int64_t days;
  int64_t normalizedSeconds;
  floorDivMod(totalSeconds, util::kSecsPerDay, days, normalizedSeconds);
  return Duration(
      days,
      static_cast<int32_t>(normalizedSeconds),
      static_cast<int32_t>(normalizedMicros));
}

int64_t Duration::toMicros() const {
  auto dayMicros = checkedMultiply<int64_t>(days_, util::kMicrosPerDay);
  return checkedPlus<int64_t>(
      dayMicros, int64_t{seconds_} * util::kMicrosPerSec + micros_);
}

std::string Duration::toString() const {
  auto clock = fmt::format(
      "{}:{:02d}:{:02d}",
      seconds_ / util::kSecsPerHour,
      (seconds_ % util::kSecsPerHour) / util::kSecsPerMinute,
      seconds_ % util::kSecsPerMinute);
  if (micros_ != 0) {
    clock += fmt::format(".{:06d}", micros_);
  }
  if (days_ == 0) {
    return clock;
  }
  return fmt::format(
      "{} day{}, {}", days_, (days_ == 1 || days_ == -1) ? "" : "s", clock);
}

std::ostream& operator<<(std::ostream& os, const Duration& duration) {
  os << duration.toString();
  return os;
}

} // namespace facebook::kairos
