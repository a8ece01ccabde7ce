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

#include "kairos/type/tz/LocalDatetime.h"

namespace facebook::kairos {

// static
LocalDatetime LocalDatetime::attach(
    const Datetime& local,
    tz::TimeZonePtr zone) {
  if (zone == nullptr) {
    return LocalDatetime(local);
  }
  auto offset = zone->utcOffset(local);
  return LocalDatetime(local, std::move(zone), offset);
}

int64_t LocalDatetime::utcMicros() const {
  // Offsets are below one day, so this stays far from int64 limits.
  return local_.toMicros() - utcOffset_.toMicros();
}

Expected<Datetime> LocalDatetime::toUtc() const {
  return Datetime::fromMicros(utcMicros());
}

std::string LocalDatetime::toString() const {
  if (isNaive()) {
    return local_.toString();
  }
  return fmt::format(
      "{}{}[{}]",
      local_.toString(),
      tz::formatOffset(utcOffset_),
      zone_->toString());
}

std::string LocalTime::toString() const {
  if (isNaive()) {
    return local_.toString();
  }
  return fmt::format("{}[{}]", local_.toString(), zone_->toString());
}

std::ostream& operator<<(std::ostream& os, const LocalDatetime& value) {
  os << value.toString();
  return os;
}

std::ostream& operator<<(std::ostream& os, const LocalTime& value) {
  os << value.toString();
  return os;
}

} // namespace facebook::kairos
