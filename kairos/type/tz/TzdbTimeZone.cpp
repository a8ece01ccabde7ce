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

#include "kairos/type/tz/TzdbTimeZone.h"

#include <date/tz.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos::tz {
namespace {

date::local_seconds toLocalSeconds(const Datetime& local) {
  return date::local_seconds(std::chrono::floor<std::chrono::seconds>(
      std::chrono::microseconds(local.toMicros())));
}

// Picks the period a wall time belongs to, honoring its fold.
const date::sys_info& select(
    const date::local_info& info,
    const Datetime& local) {
  if (info.result == date::local_info::unique || local.fold() == 0) {
    return info.first;
  }
  return info.second;
}

Duration toDuration(std::chrono::seconds seconds) {
  return Duration::fromMicros(seconds.count() * util::kMicrosPerSec);
}

} // namespace

TzdbTimeZone::TzdbTimeZone(const date::time_zone* zone) : zone_(zone) {
  KAIROS_CHECK_NOT_NULL(zone_);
}

// static
TimeZonePtr TzdbTimeZone::locate(std::string_view name) {
  const date::time_zone* zone = nullptr;
  try {
    zone = date::locate_zone(std::string(name));
  } catch (const std::runtime_error& e) {
    KAIROS_USER_FAIL("Unknown time zone: '{}': {}", name, e.what());
  }
  return std::make_shared<TzdbTimeZone>(zone);
}

Duration TzdbTimeZone::utcOffset(const Datetime& local) const {
  auto info = zone_->get_info(toLocalSeconds(local));
  return toDuration(select(info, local).offset);
}

Duration TzdbTimeZone::dstOffset(const Datetime& local) const {
  auto info = zone_->get_info(toLocalSeconds(local));
  return toDuration(select(info, local).save);
}

std::string TzdbTimeZone::name(const Datetime& local) const {
  auto info = zone_->get_info(toLocalSeconds(local));
  return select(info, local).abbrev;
}

Expected<Datetime> TzdbTimeZone::fromUtc(const Datetime& utc) const {
  auto utcMicros = utc.toMicros();
  auto sysSeconds = date::sys_seconds(std::chrono::floor<std::chrono::seconds>(
      std::chrono::microseconds(utcMicros)));
  auto period = zone_->get_info(sysSeconds);
  auto localMicros = utcMicros + period.offset.count() * util::kMicrosPerSec;

  auto localResult = Datetime::fromMicros(localMicros);
  KAIROS_RETURN_UNEXPECTED(localResult);

  // The second occurrence of a repeated wall time gets fold 1.
  auto info = zone_->get_info(toLocalSeconds(localResult.value()));
  if (info.result == date::local_info::ambiguous &&
      info.second.begin == period.begin) {
    return localResult.value().withFold(1);
  }
  return localResult;
}

std::string TzdbTimeZone::toString() const {
  return std::string(zone_->name());
}

} // namespace facebook::kairos::tz
