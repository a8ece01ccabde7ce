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

#include "kairos/type/tz/LocalDatetime.h"
#include "kairos/type/tz/TimeZone.h"
#include "kairos/type/tz/TransitionTable.h"

namespace facebook::kairos::tz {

/// Legacy zone that predates fold. A wall time is attached by choosing one
/// table entry through localize(naive, isDst): among the candidate entries of
/// a repeated or skipped wall time, the one whose DST state matches 'isDst'
/// wins; if that does not single out an entry, the one yielding the earliest
/// UTC instant does.
///
/// The TimeZone accessors resolve wall times the same way, with
/// isDst = (fold == 0). Must be owned by a std::shared_ptr.
class OffsetTableTimeZone
    : public TimeZone,
      public std::enable_shared_from_this<OffsetTableTimeZone> {
 public:
  OffsetTableTimeZone(std::string name, TransitionTable table)
      : name_(std::move(name)), table_(std::move(table)) {}

  TimeZoneKind kind() const override {
    return TimeZoneKind::kOffsetTable;
  }

  /// Returns Overflow when the resolved UTC instant is not a representable
  /// Datetime.
  Expected<LocalDatetime> localize(const Datetime& naive, bool isDst) const;

  Duration utcOffset(const Datetime& local) const override {
    return resolve(local.toMicros(), local.fold() == 0).utcOffset;
  }

  Duration dstOffset(const Datetime& local) const override {
    return resolve(local.toMicros(), local.fold() == 0).dstOffset;
  }

  std::string name(const Datetime& local) const override {
    return resolve(local.toMicros(), local.fold() == 0).abbreviation;
  }

  /// The result always has fold 0.
  Expected<Datetime> fromUtc(const Datetime& utc) const override;

  std::string toString() const override {
    return name_;
  }

 private:
  const ZoneOffset& resolve(int64_t localMicros, bool isDst) const;

  const std::string name_;
  const TransitionTable table_;
};

} // namespace facebook::kairos::tz
