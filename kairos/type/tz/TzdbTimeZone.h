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

#include <string_view>

#include "kairos/type/tz/TimeZone.h"

namespace date {
class time_zone;
}

namespace facebook::kairos::tz {

/// Fold-aware adapter over a zone of the IANA time zone database, as loaded
/// by the date library. Fold selects between the two candidate periods of a
/// repeated or skipped wall time like TableTimeZone does.
class TzdbTimeZone : public TimeZone {
 public:
  explicit TzdbTimeZone(const date::time_zone* zone);

  /// Looks up a zone by IANA name, e.g. "America/New_York". Throws
  /// KairosUserError if the name is unknown or the database cannot be
  /// loaded.
  static TimeZonePtr locate(std::string_view name);

  TimeZoneKind kind() const override {
    return TimeZoneKind::kFoldAware;
  }

  Duration utcOffset(const Datetime& local) const override;

  Duration dstOffset(const Datetime& local) const override;

  std::string name(const Datetime& local) const override;

  Expected<Datetime> fromUtc(const Datetime& utc) const override;

  std::string toString() const override;

 private:
  const date::time_zone* const zone_;
};

} // namespace facebook::kairos::tz
