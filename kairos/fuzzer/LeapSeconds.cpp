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

#include "kairos/fuzzer/LeapSeconds.h"

#include <algorithm>
#include <cstdlib>
#include <utility>

#include "kairos/common/base/Exceptions.h"

namespace facebook::kairos::fuzzer {
namespace {

constexpr size_t kNumLeapSeconds = 27;

// (year, month) of each insertion. The leap second follows 23:59:59 on the
// last day of that month.
constexpr std::pair<int32_t, int32_t> kLeapMonths[] = {
    {1972, 6},  {1972, 12}, {1973, 12}, {1974, 12}, {1975, 12}, {1976, 12},
    {1977, 12}, {1978, 12}, {1979, 12}, {1981, 6},  {1982, 6},  {1983, 6},
    {1985, 6},  {1987, 12}, {1989, 12}, {1990, 12}, {1992, 6},  {1993, 6},
    {1994, 6},  {1995, 12}, {1997, 6},  {1998, 12}, {2005, 12}, {2008, 12},
    {2012, 6},  {2015, 6},  {2016, 12},
};

std::vector<Datetime> makeLeapSeconds() {
  std::vector<Datetime> leaps;
  leaps.reserve(kNumLeapSeconds);
  for (const auto& [year, month] : kLeapMonths) {
    const auto day = month == 6 ? 30 : 31;
    auto leap = Datetime::create(year, month, day, 23, 59, 59);
    KAIROS_CHECK(leap.hasValue(), "{}", leap.error().message());
    leaps.push_back(leap.value());
  }

  KAIROS_CHECK_EQ(leaps.size(), kNumLeapSeconds);
  KAIROS_CHECK(
      std::is_sorted(leaps.begin(), leaps.end()),
      "Leap seconds must be sorted");
  return leaps;
}

} // namespace

const std::vector<Datetime>& getLeapSeconds() {
  static const std::vector<Datetime> kLeapSeconds = makeLeapSeconds();
  return kLeapSeconds;
}

bool isNearLeapSecond(int64_t utcMicros) {
  for (const auto& leap : getLeapSeconds()) {
    if (std::llabs(utcMicros - leap.toMicros()) < kLeapSmearHalfWidthMicros) {
      return true;
    }
  }
  return false;
}

bool containsLeapSmear(int64_t loUtcMicros, int64_t hiUtcMicros) {
  for (const auto& leap : getLeapSeconds()) {
    const auto micros = leap.toMicros();
    if (loUtcMicros < micros - kLeapSmearHalfWidthMicros &&
        micros + kLeapSmearHalfWidthMicros < hiUtcMicros) {
      return true;
    }
  }
  return false;
}

} // namespace facebook::kairos::fuzzer
