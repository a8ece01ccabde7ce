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

namespace facebook::kairos::tz {

/// Offset rule in effect for a period of time.
struct ZoneOffset {
  /// Total offset from UTC, including daylight saving time.
  Duration utcOffset;

  /// Daylight saving part of utcOffset. Zero for standard time.
  Duration dstOffset;

  std::string abbreviation;

  bool isDst() const {
    return dstOffset != Duration();
  }
};

/// A change of offset at a UTC instant.
struct Transition {
  /// Microseconds since 1970-01-01T00:00:00 UTC at which 'offset' starts.
  int64_t utcMicros;

  ZoneOffset offset;
};

/// Result of resolving a wall time against a table, after the
/// date::local_info model: a wall time maps to one period, falls into the gap
/// left by a forward transition, or is repeated by a backward transition. In
/// the latter two cases 'first' is the period before the transition and
/// 'second' the period after it.
struct LocalInfo {
  enum class Result { kUnique, kNonexistent, kAmbiguous };

  Result result;
  const ZoneOffset* first;
  const ZoneOffset* second;
};

/// Caller supplied history of a zone: the offset in effect before the first
/// transition, followed by strictly increasing transitions.
class TransitionTable {
 public:
  /// Throws KairosUserError if transitions are not ordered, or are so close
  /// together that the gap or overlap of one reaches into the next.
  TransitionTable(ZoneOffset initial, std::vector<Transition> transitions);

  /// Offset in effect at the given UTC instant.
  const ZoneOffset& offsetAtUtc(int64_t utcMicros) const;

  /// Resolves a wall time, given as microseconds since 1970-01-01T00:00:00
  /// local time.
  LocalInfo localInfo(int64_t localMicros) const;

  const ZoneOffset& initial() const {
    return initial_;
  }

  const std::vector<Transition>& transitions() const {
    return transitions_;
  }

 private:
  // Offset in effect just before transitions_[i].
  const ZoneOffset& offsetBefore(size_t i) const {
    return i == 0 ? initial_ : transitions_[i - 1].offset;
  }

  // First local instant no longer affected by transitions_[i].
  int64_t localEnd(size_t i) const;

  // First local instant affected by transitions_[i].
  int64_t localBegin(size_t i) const;

  const ZoneOffset initial_;
  const std::vector<Transition> transitions_;
};

} // namespace facebook::kairos::tz
