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

#include "kairos/type/Time.h"

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos {

// static
Expected<Time> Time::create(
    int32_t hour,
    int32_t minute,
    int32_t second,
    int32_t micros,
    int32_t fold) {
  if (!util::isValidTime(hour, minute, second, micros)) {
    return folly::makeUnexpected(Status::UserError(
        "invalid time of day: {}:{}:{}.{}", hour, minute, second, micros));
  }
  if (fold != 0 && fold != 1) {
    return folly::makeUnexpected(
        Status::UserError("fold must be either 0 or 1, got {}", fold));
  }
  return Time(hour, minute, second, micros, fold);
}

// static
Expected<Time> Time::fromMicros(int64_t micros, int32_t fold) {
  if (micros < 0 || micros >= util::kMicrosPerDay) {
    return folly::makeUnexpected(
        Status::UserError("time of day out of range: {} us", micros));
  }
  int32_t hour;
  int32_t minute;
  int32_t second;
  int32_t us;
  util::toTime(micros, hour, minute, second, us);
  return create(hour, minute, second, us, fold);
}

Time Time::withFold(int32_t fold) const {
  KAIROS_CHECK(fold == 0 || fold == 1, "fold must be either 0 or 1");
  return Time(hour_, minute_, second_, micros_, fold);
}

int64_t Time::toMicros() const {
  return util::fromTime(hour_, minute_, second_, micros_);
}

std::string Time::toString() const {
  if (micros_ == 0) {
    return fmt::format("{:02d}:{:02d}:{:02d}", hour_, minute_, second_);
  }
  return fmt::format(
      "{:02d}:{:02d}:{:02d}.{:06d}", hour_, minute_, second_, micros_);
}

std::ostream& operator<<(std::ostream& os, const Time& time) {
  os << time.toString();
  return os;
}

} // namespace facebook::kairos
