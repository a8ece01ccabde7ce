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

#include "kairos/type/tz/TimeZone.h"

#include <fmt/format.h>

#include "kairos/type/Calendar.h"

namespace facebook::kairos::tz {

std::string_view toString(TimeZoneKind kind) {
  switch (kind) {
    case TimeZoneKind::kFoldAware:
      return "FOLD_AWARE";
    case TimeZoneKind::kOffsetTable:
      return "OFFSET_TABLE";
  }
  return "";
}

std::string formatOffset(const Duration& offset) {
  auto micros = offset.toMicros();
  char sign = micros < 0 ? '-' : '+';
  auto seconds = (micros < 0 ? -micros : micros) / util::kMicrosPerSec;
  auto hours = seconds / util::kSecsPerHour;
  auto minutes = (seconds % util::kSecsPerHour) / util::kSecsPerMinute;
  auto rest = seconds % util::kSecsPerMinute;
  if (rest != 0) {
    return fmt::format("{}{:02d}:{:02d}:{:02d}", sign, hours, minutes, rest);
  }
  return fmt::format("{}{:02d}:{:02d}", sign, hours, minutes);
}

} // namespace facebook::kairos::tz
