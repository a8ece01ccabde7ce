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

#include "kairos/fuzzer/Nastiness.h"

#include <fmt/format.h>

#include "kairos/fuzzer/LeapSeconds.h"

namespace facebook::kairos::fuzzer {
namespace {

const Datetime& canonicalCenter() {
  static const Datetime kCenter =
      Datetime(Date::create(2000, 1, 1).value(), Time());
  return kCenter;
}

bool qualifies(const LocalDatetime& lo, const LocalDatetime& hi) {
  return lo.utcOffset() != hi.utcOffset() ||
      containsLeapSmear(lo.utcMicros(), hi.utcMicros());
}

} // namespace

bool doesNotExist(const LocalDatetime& value) {
  if (value.isNaive()) {
    return false;
  }
  auto utc = value.toUtc();
  if (utc.hasError()) {
    return true;
  }
  auto roundTrip = value.zone()->fromUtc(utc.value());
  if (roundTrip.hasError()) {
    return true;
  }
  return roundTrip.value() != value.local();
}

bool isAmbiguous(const LocalDatetime& value) {
  if (value.isNaive() ||
      value.zone()->kind() != tz::TimeZoneKind::kFoldAware) {
    return false;
  }
  const auto& zone = *value.zone();
  return zone.utcOffset(value.local().withFold(0)) !=
      zone.utcOffset(value.local().withFold(1));
}

bool isInLeapSmear(const LocalDatetime& value) {
  if (value.isNaive()) {
    return false;
  }
  return isNearLeapSecond(value.utcMicros());
}

std::string Nastiness::toString() const {
  return fmt::format(
      "nonexistent: {}, ambiguous: {}, leap smear: {}",
      nonexistent,
      ambiguous,
      leapSmear);
}

Nastiness classify(const LocalDatetime& value) {
  Nastiness nastiness;
  nastiness.nonexistent = doesNotExist(value);
  nastiness.ambiguous = isAmbiguous(value);
  nastiness.leapSmear = isInLeapSmear(value);
  return nastiness;
}

std::optional<std::pair<LocalDatetime, LocalDatetime>> getNastyBounds(
    const LocalDatetime& lo,
    const LocalDatetime& mid,
    const LocalDatetime& hi) {
  std::pair<LocalDatetime, LocalDatetime> halves[] = {{lo, mid}, {mid, hi}};
  if (mid.local() <= canonicalCenter()) {
    std::swap(halves[0], halves[1]);
  }
  for (const auto& half : halves) {
    if (qualifies(half.first, half.second)) {
      return half;
    }
  }
  return std::nullopt;
}

} // namespace facebook::kairos::fuzzer
