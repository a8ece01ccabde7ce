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

#include "kairos/type/tz/OffsetTableTimeZone.h"

#include "kairos/type/Calendar.h"

namespace facebook::kairos::tz {

const ZoneOffset& OffsetTableTimeZone::resolve(
    int64_t localMicros,
    bool isDst) const {
  auto info = table_.localInfo(localMicros);
  if (info.result == LocalInfo::Result::kUnique) {
    return *info.first;
  }
  bool firstMatches = info.first->isDst() == isDst;
  bool secondMatches = info.second->isDst() == isDst;
  if (firstMatches != secondMatches) {
    return firstMatches ? *info.first : *info.second;
  }
  // The larger offset gives the earlier UTC instant.
  return info.first->utcOffset >= info.second->utcOffset ? *info.first
                                                         : *info.second;
}

Expected<LocalDatetime> OffsetTableTimeZone::localize(
    const Datetime& naive,
    bool isDst) const {
  auto localMicros = naive.toMicros();
  const auto& offset = resolve(localMicros, isDst);
  auto utcMicros = localMicros - offset.utcOffset.toMicros();
  if (utcMicros < util::kMinMicrosSinceEpoch ||
      utcMicros > util::kMaxMicrosSinceEpoch) {
    return folly::makeUnexpected(Status::Overflow(
        "localizing {} in {} leaves the representable range",
        naive.toString(),
        name_));
  }
  return LocalDatetime(naive, shared_from_this(), offset.utcOffset);
}

Expected<Datetime> OffsetTableTimeZone::fromUtc(const Datetime& utc) const {
  auto utcMicros = utc.toMicros();
  const auto& offset = table_.offsetAtUtc(utcMicros);
  return Datetime::fromMicros(utcMicros + offset.utcOffset.toMicros());
}

} // namespace facebook::kairos::tz
