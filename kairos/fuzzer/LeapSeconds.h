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

#include <vector>

#include "kairos/type/Calendar.h"
#include "kairos/type/Datetime.h"

namespace facebook::kairos::fuzzer {

/// Clock-handling bugs are likely within this distance of a leap second,
/// since smearing implementations spread it over a day.
constexpr int64_t kLeapSmearHalfWidthMicros{12 * util::kMicrosPerHour};

/// The historical leap second insertion points as UTC datetimes at 23:59:59
/// on June 30 or December 31, sorted ascending. Computed once.
const std::vector<Datetime>& getLeapSeconds();

/// Returns true if 'utcMicros' is strictly less than 12 hours away from a
/// leap second.
bool isNearLeapSecond(int64_t utcMicros);

/// Returns true if some leap second and its 12 hour margins on both sides
/// lie strictly inside (loUtcMicros, hiUtcMicros).
bool containsLeapSmear(int64_t loUtcMicros, int64_t hiUtcMicros);

} // namespace facebook::kairos::fuzzer
