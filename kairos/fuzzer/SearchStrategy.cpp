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

#include "kairos/fuzzer/SearchStrategy.h"

namespace facebook::kairos::fuzzer {

std::string describe(const tz::TimeZonePtr& zone) {
  return zone == nullptr ? "None" : zone->toString();
}

SearchStrategyPtr<tz::TimeZonePtr> noTimeZones() {
  static const SearchStrategyPtr<tz::TimeZonePtr> kNoTimeZones =
      std::make_shared<NoTimeZonesStrategy>();
  return kNoTimeZones;
}

SearchStrategyPtr<tz::TimeZonePtr> timeZones(
    std::vector<tz::TimeZonePtr> zones) {
  for (size_t i = 0; i < zones.size(); ++i) {
    KAIROS_USER_CHECK_NOT_NULL(zones[i], "Time zone at index {} is null", i);
  }
  return sampledFrom(std::move(zones));
}

bool isNoTimeZones(const SearchStrategy<tz::TimeZonePtr>& strategy) {
  return dynamic_cast<const NoTimeZonesStrategy*>(&strategy) != nullptr;
}

} // namespace facebook::kairos::fuzzer
