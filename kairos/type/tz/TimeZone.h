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

#include <memory>
#include <string>

#include "kairos/common/base/Status.h"
#include "kairos/type/Datetime.h"
#include "kairos/type/Duration.h"

namespace facebook::kairos::tz {

/// The two ways a naive wall time gets attached to a time zone.
enum class TimeZoneKind {
  /// The zone honors Datetime::fold(): fold 0 picks the offset in effect
  /// before a transition, fold 1 the offset after it, both for repeated and
  /// for skipped wall times. Attaching never fails.
  kFoldAware,

  /// The zone ignores fold. A naive value is resolved to a single table entry
  /// through OffsetTableTimeZone::localize(naive, isDst), which may fail with
  /// an overflow at the edges of the representable range.
  kOffsetTable,
};

std::string_view toString(TimeZoneKind kind);

/// Capability interface over a time zone. Implementations are immutable and
/// shared through TimeZonePtr.
class TimeZone {
 public:
  virtual ~TimeZone() = default;

  virtual TimeZoneKind kind() const = 0;

  /// Offset of local wall time from UTC at the given wall time.
  virtual Duration utcOffset(const Datetime& local) const = 0;

  /// Daylight saving part of utcOffset(local). Zero outside DST.
  virtual Duration dstOffset(const Datetime& local) const = 0;

  /// Abbreviation in effect at the given wall time, e.g. "EST".
  virtual std::string name(const Datetime& local) const = 0;

  /// Converts a UTC instant to wall time in this zone. Fold-aware zones set
  /// fold to 1 on the second occurrence of a repeated wall time. Returns
  /// Overflow if the wall time is not representable.
  virtual Expected<Datetime> fromUtc(const Datetime& utc) const = 0;

  /// Name of the zone itself, used in diagnostics.
  virtual std::string toString() const = 0;
};

using TimeZonePtr = std::shared_ptr<const TimeZone>;

/// Formats an offset as +HH:MM, or +HH:MM:SS when seconds are not zero.
std::string formatOffset(const Duration& offset);

} // namespace facebook::kairos::tz
