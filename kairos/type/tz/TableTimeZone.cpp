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

#include "kairos/type/tz/TableTimeZone.h"

namespace facebook::kairos::tz {

const ZoneOffset& TableTimeZone::resolve(const Datetime& local) const {
  auto info = table_.localInfo(local.toMicros());
  if (info.result == LocalInfo::Result::kUnique || local.fold() == 0) {
    return *info.first;
  }
  return *info.second;
}

Expected<Datetime> TableTimeZone::fromUtc(const Datetime& utc) const {
  auto utcMicros = utc.toMicros();
  const auto& offset = table_.offsetAtUtc(utcMicros);
  auto localMicros = utcMicros + offset.utcOffset.toMicros();

  // The second occurrence of a repeated wall time gets fold 1.
  auto info = table_.localInfo(localMicros);
  int32_t fold =
      (info.result == LocalInfo::Result::kAmbiguous && info.second == &offset)
      ? 1
      : 0;
  return Datetime::fromMicros(localMicros, fold);
}

} // namespace facebook::kairos::tz
