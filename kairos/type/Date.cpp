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

#include "kairos/type/Date.h"

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos {

// static
Expected<Date> Date::create(int32_t year, int32_t month, int32_t day) {
  int64_t days;
  auto status = util::daysSinceEpochFromDate(year, month, day, days);
  if (!status.ok()) {
    return folly::makeUnexpected(std::move(status));
  }
  return Date(year, month, day);
}

// static
Expected<Date> Date::fromDaysSinceEpoch(int64_t days) {
  int32_t year;
  int32_t month;
  int32_t day;
  auto status = util::dateFromDaysSinceEpoch(days, year, month, day);
  if (!status.ok()) {
    return folly::makeUnexpected(std::move(status));
  }
  return Date(year, month, day);
}

int64_t Date::daysSinceEpoch() const {
  int64_t days = 0;
  // Fields were validated on construction.
  auto status = util::daysSinceEpochFromDate(year_, month_, day_, days);
  KAIROS_CHECK(status.ok(), "{}", status.toString());
  return days;
}

std::string Date::toString() const {
  return fmt::format("{:04d}-{:02d}-{:02d}", year_, month_, day_);
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
  os << date.toString();
  return os;
}

} // namespace facebook::kairos
