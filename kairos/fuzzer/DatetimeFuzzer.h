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

#include <string>
#include <vector>

#include "kairos/type/Duration.h"
#include "kairos/type/tz/TimeZone.h"
#include "kairos/type/tz/TransitionTable.h"

namespace facebook::kairos::fuzzer {

/// Returns a table with daylight saving time from March 10 to November 3 of
/// every year in [firstYear, lastYear], switching at 02:00 local time. The
/// daylight offset is one hour ahead of 'standardOffset'.
tz::TransitionTable makeDaylightSavingTable(
    Duration standardOffset,
    int32_t firstYear,
    int32_t lastYear);

/// Returns the zones the fuzzer draws from: UTC, a fixed offset, a
/// daylight saving zone of each kind, and the tz database zones named in
/// 'tzdbNames'.
std::vector<tz::TimeZonePtr> makeFuzzerTimeZones(
    const std::vector<std::string>& tzdbNames);

struct DatetimeFuzzerOptions {
  /// Number of iterations to run. Ignored if 'durationSec' is positive.
  int32_t steps{10};

  /// For how long to run. If zero, runs exactly 'steps' iterations.
  int32_t durationSec{0};

  /// Number of values drawn from each strategy in one iteration.
  int32_t drawsPerStep{100};

  bool allowImaginary{true};

  /// Names of tz database zones to draw from in addition to the built-in
  /// ones.
  std::vector<std::string> tzNames;
};

/// Counts of what the fuzzer drew.
struct DatetimeFuzzerStats {
  size_t numDraws{0};
  size_t numInvalid{0};
  size_t numNaive{0};
  size_t numNonexistent{0};
  size_t numAmbiguous{0};
  size_t numLeapSmear{0};

  std::string toString() const;
};

/// Repeatedly draws from randomly bounded date, datetime and duration
/// strategies and checks that every value lies within its bounds, that
/// replaying the recorded choices reproduces it, and that local times which
/// do not exist are rejected when 'allowImaginary' is unset. Throws
/// KairosRuntimeError on the first violation.
DatetimeFuzzerStats datetimeFuzzer(
    size_t seed,
    const DatetimeFuzzerOptions& options);

} // namespace facebook::kairos::fuzzer
