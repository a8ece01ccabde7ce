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

#include <string_view>

#include "kairos/fuzzer/SearchStrategy.h"
#include "kairos/type/Date.h"
#include "kairos/type/Datetime.h"
#include "kairos/type/Duration.h"
#include "kairos/type/Time.h"
#include "kairos/type/tz/LocalDatetime.h"

namespace facebook::kairos::fuzzer {

/// Label of the example groups the naive fields of an aware datetime are
/// drawn in.
constexpr std::string_view kDrawNaivePartLabel{"draw naive part of a datetime"};

/// Label of the example group of each draw attempt.
constexpr std::string_view kDrawAttemptLabel{"trying to draw a weird datetime"};

/// Number of attempts a strategy makes when the drawn fields do not form a
/// value, before the draw is marked invalid.
constexpr int32_t kMaxDrawAttempts{3};

/// Dates in [min, max]. Throws KairosUserError if min > max.
SearchStrategyPtr<Date> dates(Date min = Date::min(), Date max = Date::max());

/// Times of day in [min, max], with a timezone drawn from 'timezones'
/// attached. Throws KairosUserError if min > max or 'timezones' is null.
SearchStrategyPtr<LocalTime> times(
    Time min = Time::min(),
    Time max = Time::max(),
    SearchStrategyPtr<tz::TimeZonePtr> timezones = noTimeZones());

/// Datetimes whose local fields lie in [min, max], naive or localized to a
/// zone drawn from 'timezones'. Values are biased toward local times that
/// do not exist or are ambiguous in their zone and toward instants close to
/// leap seconds. With 'allowImaginary' unset, local times that do not exist
/// are rejected with DataSource::markInvalid().
///
/// Throws KairosUserError if min > max or 'timezones' is null.
SearchStrategyPtr<LocalDatetime> datetimes(
    Datetime min = Datetime::min(),
    Datetime max = Datetime::max(),
    SearchStrategyPtr<tz::TimeZonePtr> timezones = noTimeZones(),
    bool allowImaginary = true);

/// Durations in [min, max], shrinking toward zero. Throws KairosUserError if
/// min > max.
SearchStrategyPtr<Duration> durations(
    Duration min = Duration::min(),
    Duration max = Duration::max());

} // namespace facebook::kairos::fuzzer
