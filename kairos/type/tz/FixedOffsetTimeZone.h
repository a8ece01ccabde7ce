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

namespace facebook::kairos::tz {

/// A zone with a constant offset from UTC and no daylight saving time. No
/// wall time is skipped or repeated, so fold never matters.
class FixedOffsetTimeZone : public TimeZone {
 public:
  /// The offset must be strictly within one day. An empty name formats as
  /// "UTC+HH:MM".
  explicit FixedOffsetTimeZone(Duration offset, std::string name = "");

  /// Shared UTC instance.
  static const TimeZonePtr& utc();

  TimeZoneKind kind() const override {
    return TimeZoneKind::kFoldAware;
  }

  Duration utcOffset(const Datetime& /*local*/) const override {
    return offset_;
  }

  Duration dstOffset(const Datetime& /*local*/) const override {
    return Duration();
  }

  std::string name(const Datetime& /*local*/) const override {
    return name_;
  }

  Expected<Datetime> fromUtc(const Datetime& utc) const override;

  std::string toString() const override {
    return name_;
  }

 private:
  const Duration offset_;
  const std::string name_;
};

} // namespace facebook::kairos::tz
