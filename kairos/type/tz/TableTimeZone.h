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

#include "kairos/type/tz/TimeZone.h"
#include "kairos/type/tz/TransitionTable.h"

namespace facebook::kairos::tz {

/// Fold-aware zone over a caller supplied transition table.
///
/// Follows PEP 495: for a wall time that is repeated or skipped, fold 0
/// selects the offset in effect before the transition and fold 1 the offset
/// after it.
class TableTimeZone : public TimeZone {
 public:
  TableTimeZone(std::string name, TransitionTable table)
      : name_(std::move(name)), table_(std::move(table)) {}

  TimeZoneKind kind() const override {
    return TimeZoneKind::kFoldAware;
  }

  Duration utcOffset(const Datetime& local) const override {
    return resolve(local).utcOffset;
  }

  Duration dstOffset(const Datetime& local) const override {
    return resolve(local).dstOffset;
  }

  std::string name(const Datetime& local) const override {
    return resolve(local).abbreviation;
  }

  Expected<Datetime> fromUtc(const Datetime& utc) const override;

  std::string toString() const override {
    return name_;
  }

  const TransitionTable& table() const {
    return table_;
  }

 private:
  const ZoneOffset& resolve(const Datetime& local) const;

  const std::string name_;
  const TransitionTable table_;
};

} // namespace facebook::kairos::tz
