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

#include "kairos/type/Datetime.h"

#include "kairos/common/base/CheckedArithmetic.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos {

// static
Expected<Datetime> Datetime::create(
    int32_t year,
    int32_t month,
    int32_t day,
    int32_t hour,
    int32_t minute,
    int32_t second,
    int32_t micros,
    int32_t fold) {
  auto date = Date::create(year, month, day);
  KAIROS_RETURN_UNEXPECTED(date);
  auto time = Time::create(hour, minute, second, micros, fold);
  KAIROS_RETURN_UNEXPECTED(time);
  return Datetime(date.value(), time.value());
}

// static
Expected<Datetime> Datetime::fromMicros(int64_t micros, int32_t fold) {
  if (micros < util::kMinMicrosSinceEpoch ||
      micros > util::kMaxMicrosSinceEpoch) {
    return folly::makeUnexpected(Status::Overflow(
        "datetime out of range: {} us since epoch", micros));
  }
  int64_t days = micros / util::kMicrosPerDay;
  int64_t rem = micros % util::kMicrosPerDay;
  if (rem < 0) {
    rem += util::kMicrosPerDay;
    --days;
  }
  auto date = Date::fromDaysSinceEpoch(days);
  KAIROS_RETURN_UNEXPECTED(date);
  auto time = Time::fromMicros(rem, fold);
  KAIROS_RETURN_UNEXPECTED(time);
  return Datetime(date.value(), time.value());
}

int64_t Datetime::toMicros() const {
  return date_.daysSinceEpoch() * util::kMicrosPerDay + time_.toMicros();
}

Expected<Datetime> Datetime::plus(const Duration& duration) const {
  // Any duration longer than the whole representable range overflows.
  constexpr int64_t kMaxSpanDays =
      util::kMaxDaysSinceEpoch - util::kMinDaysSinceEpoch + 1;
  if (duration.days() > kMaxSpanDays || duration.days() < -kMaxSpanDays) {
    return folly::makeUnexpected(Status::Overflow(
        "{} + {} is out of range", toString(), duration.toString()));
  }
  auto result = tryPlus(toMicros(), duration.toMicros());
  if (!result.has_value()) {
    return folly::makeUnexpected(Status::Overflow(
        "{} + {} is out of range", toString(), duration.toString()));
  }
  return fromMicros(*result);
}

std::string Datetime::toString() const {
  return fmt::format("{}T{}", date_.toString(), time_.toString());
}

std::ostream& operator<<(std::ostream& os, const Datetime& datetime) {
  os << datetime.toString();
  return os;
}

} // namespace facebook::kairos
