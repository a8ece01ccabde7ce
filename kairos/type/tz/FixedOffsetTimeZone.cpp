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

#include "kairos/type/tz/FixedOffsetTimeZone.h"

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos::tz {

FixedOffsetTimeZone::FixedOffsetTimeZone(Duration offset, std::string name)
    : offset_(offset),
      name_(name.empty() ? "UTC" + formatOffset(offset) : std::move(name)) {
  KAIROS_USER_CHECK(
      offset > Duration::fromMicros(-util::kMicrosPerDay) &&
          offset < Duration::fromMicros(util::kMicrosPerDay),
      "offset must be strictly between -24 and 24 hours, got {}",
      offset);
}

// static
const TimeZonePtr& FixedOffsetTimeZone::utc() {
  static const TimeZonePtr kUtc =
      std::make_shared<FixedOffsetTimeZone>(Duration(), "UTC");
  return kUtc;
}

Expected<Datetime> FixedOffsetTimeZone::fromUtc(const Datetime& utc) const {
  return utc.plus(offset_);
}

} // namespace facebook::kairos::tz
