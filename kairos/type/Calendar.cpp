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

#include "kairos/type/Calendar.h"

#include <algorithm>

#include "kairos/common/base/Exceptions.h"

namespace facebook::kairos::util {
namespace {

constexpr int32_t kLeapDays[] =
    {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
constexpr int32_t kNormalDays[] =
    {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

const int16_t daysBeforeFirstDayOfMonth[][12] = {
    {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334},
    {0, 31, 60, 91, 121, 152, 182, 213, 244, 274, 305, 335},
};

constexpr int32_t kDaysPerYear = 365;
constexpr int64_t kLeapYearOffset = 400'000;

inline int64_t leapThroughEndOf(int64_t y) {
  // Add a multiple of 400 years so that intermediate years before year 1
  // divide correctly.
  y += kLeapYearOffset;
  KAIROS_DCHECK_GE(y, 0);
  return y / 4 - y / 100 + y / 400;
}

inline int64_t daysBetweenYears(int64_t y1, int64_t y2) {
  return kDaysPerYear * (y2 - y1) + leapThroughEndOf(y2 - 1) -
      leapThroughEndOf(y1 - 1);
}

} // namespace

bool isLeapYear(int32_t year) {
  return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

bool isValidDate(int32_t year, int32_t month, int32_t day) {
  if (month < 1 || month > kMonthsPerYear) {
    return false;
  }
  if (year < kMinYear || year > kMaxYear) {
    return false;
  }
  if (day < 1) {
    return false;
  }
  return isLeapYear(year) ? day <= kLeapDays[month] : day <= kNormalDays[month];
}

bool isValidTime(int32_t hour, int32_t minute, int32_t second, int32_t micros) {
  return hour >= 0 && hour < kHoursPerDay && minute >= 0 &&
      minute < kMinsPerHour && second >= 0 && second < kSecsPerMinute &&
      micros >= 0 && micros < kMicrosPerSec;
}

int32_t getMaxDayOfMonth(int32_t year, int32_t month) {
  KAIROS_DCHECK_GE(month, 1);
  KAIROS_DCHECK_LE(month, kMonthsPerYear);
  return isLeapYear(year) ? kLeapDays[month] : kNormalDays[month];
}

Status
daysSinceEpochFromDate(int32_t year, int32_t month, int32_t day, int64_t& out) {
  if (!isValidDate(year, month, day)) {
    if (month < 1 || month > kMonthsPerYear) {
      return Status::UserError("month must be in 1..12, got {}", month);
    }
    if (year < kMinYear || year > kMaxYear) {
      return Status::UserError(
          "year {} is out of range [{}, {}]", year, kMinYear, kMaxYear);
    }
    return Status::UserError(
        "day is out of range for month: {}-{}-{}", year, month, day);
  }
  auto dayOfYear =
      daysBeforeFirstDayOfMonth[isLeapYear(year)][month - 1] + day - 1;
  out = daysBetweenYears(1970, year) + dayOfYear;
  return Status::OK();
}

Status dateFromDaysSinceEpoch(
    int64_t daysSinceEpoch,
    int32_t& year,
    int32_t& month,
    int32_t& day) {
  KAIROS_RETURN_IF(
      daysSinceEpoch < kMinDaysSinceEpoch ||
          daysSinceEpoch > kMaxDaysSinceEpoch,
      Status::Overflow("date value out of range: {} days", daysSinceEpoch));

  int64_t days = daysSinceEpoch;
  int64_t y = 1970;
  bool leapYear;
  while (days < 0 || days >= kDaysPerYear + (leapYear = isLeapYear(y))) {
    auto newy = y + days / kDaysPerYear - (days < 0);
    days -= daysBetweenYears(y, newy);
    y = newy;
  }
  auto* months = daysBeforeFirstDayOfMonth[leapYear];
  auto monthIndex = std::upper_bound(months, months + 12, days) - months - 1;
  year = static_cast<int32_t>(y);
  month = static_cast<int32_t>(monthIndex + 1);
  day = static_cast<int32_t>(days - months[monthIndex] + 1);
  return Status::OK();
}

int64_t
fromTime(int32_t hour, int32_t minute, int32_t second, int32_t microseconds) {
  int64_t result;
  result = hour; // hours
  result = result * kMinsPerHour + minute; // hours -> minutes
  result = result * kSecsPerMinute + second; // minutes -> seconds
  result = result * kMicrosPerSec + microseconds; // seconds -> microseconds
  return result;
}

void toTime(
    int64_t micros,
    int32_t& hour,
    int32_t& minute,
    int32_t& second,
    int32_t& microseconds) {
  KAIROS_DCHECK_GE(micros, 0);
  KAIROS_DCHECK_LT(micros, kMicrosPerDay);
  microseconds = static_cast<int32_t>(micros % kMicrosPerSec);
  micros /= kMicrosPerSec;
  second = static_cast<int32_t>(micros % kSecsPerMinute);
  micros /= kSecsPerMinute;
  minute = static_cast<int32_t>(micros % kMinsPerHour);
  hour = static_cast<int32_t>(micros / kMinsPerHour);
}

} // namespace facebook::kairos::util
