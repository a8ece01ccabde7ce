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

#include <optional>
#include <string>
#include <utility>

#include "kairos/type/tz/LocalDatetime.h"

namespace facebook::kairos::fuzzer {

/// Returns true if the local time does not exist in its zone, i.e. a round
/// trip through UTC changes its fields, or if the round trip leaves the
/// representable range. Always false for naive values.
bool doesNotExist(const LocalDatetime& value);

/// Returns true if fold 0 and fold 1 of the same local fields have
/// different UTC offsets. Only fold-aware zones can be ambiguous.
bool isAmbiguous(const LocalDatetime& value);

/// Returns true if the UTC instant is less than 12 hours from a leap second.
/// Always false for naive values.
bool isInLeapSmear(const LocalDatetime& value);

struct Nastiness {
  bool nonexistent{false};
  bool ambiguous{false};
  bool leapSmear{false};

  bool any() const {
    return nonexistent || ambiguous || leapSmear;
  }

  std::string toString() const;
};

Nastiness classify(const LocalDatetime& value);

inline bool isNasty(const LocalDatetime& value) {
  return classify(value).any();
}

/// Returns a half of [lo, hi], split at 'mid', that is known to contain a
/// nasty instant: the zone's UTC offset differs between its endpoints, or it
/// contains a leap second with 12 hours of margin on both sides. When both
/// halves qualify the one containing 2000-01-01 wins. Returns std::nullopt
/// if neither half qualifies.
std::optional<std::pair<LocalDatetime, LocalDatetime>> getNastyBounds(
    const LocalDatetime& lo,
    const LocalDatetime& mid,
    const LocalDatetime& hi);

} // namespace facebook::kairos::fuzzer
