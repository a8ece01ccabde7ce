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

#include <cstdint>
#include "kairos/common/base/Status.h"

namespace facebook::kairos::util {

constexpr const int32_t kHoursPerDay{24};
constexpr const int32_t kMinsPerHour{60};
constexpr const int32_t kSecsPerMinute{60};
constexpr const int32_t kMonthsPerYear{12};

constexpr const int64_t kMicrosPerSec{1'000'000};
constexpr const int64_t kMicrosPerMinute{kMicrosPerSec * kSecsPerMinute};
constexpr const int64_t kMicrosPerHour{kMicrosPerMinute * kMinsPerHour};
constexpr const int64_t kMicrosPerDay{kMicrosPerHour * kHoursPerDay};

constexpr const int32_t kSecsPerHour{kSecsPerMinute * kMinsPerHour};
constexpr const int32_t kSecsPerDay{kSecsPerHour * kHoursPerDay};

// Proleptic Gregorian years representable by Date and Datetime.
constexpr const int32_t kMinYear{1};
constexpr const int32_t kMaxYear{9999};

// Days from 1970-01-01 to 0001-01-01 and to 9999-12-31.
constexpr const int64_t kMinDaysSinceEpoch{-719'162};
constexpr const int64_t kMaxDaysSinceEpoch{2'932'896};

// Local microseconds since 1970-01-01T00:00:00 of the smallest and largest
// representable Datetime.
constexpr const int64_t kMinMicrosSinceEpoch{
    kMinDaysSinceEpoch * kMicrosPerDay};
constexpr const int64_t kMaxMicrosSinceEpoch{
    (kMaxDaysSinceEpoch + 1) * kMicrosPerDay - 1};

// Returns true if leap year, false otherwise.
bool isLeapYear(int32_t year);

// Returns true if year, month, day corresponds to valid date, false otherwise.
bool isValidDate(int32_t year, int32_t month, int32_t day);

// Returns true if the fields form a valid time of day, false otherwise.
bool isValidTime(int32_t hour, int32_t minute, int32_t second, int32_t micros);

// Returns max day of month for inputted month of inputted year.
int32_t getMaxDayOfMonth(int32_t year, int32_t month);

/// Computes the (signed) number of days since unix epoch (1970-01-01).
/// Returns UserError status if the date is invalid.
Status
daysSinceEpochFromDate(int32_t year, int32_t month, int32_t day, int64_t& out);

/// Computes year, month and day of the given (signed) number of days since
/// unix epoch. Returns Overflow status if the result falls outside
/// [kMinYear, kMaxYear].
Status dateFromDaysSinceEpoch(
    int64_t daysSinceEpoch,
    int32_t& year,
    int32_t& month,
    int32_t& day);

/// Returns the cumulative number of microseconds.
/// Does not perform any sanity checks.
int64_t
fromTime(int32_t hour, int32_t minute, int32_t second, int32_t microseconds);

/// Splits microseconds since midnight into hour, minute, second and
/// microsecond. `micros` must be in [0, kMicrosPerDay).
void toTime(
    int64_t micros,
    int32_t& hour,
    int32_t& minute,
    int32_t& second,
    int32_t& microseconds);

} // namespace facebook::kairos::util
