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

#include "kairos/type/tz/TransitionTable.h"

#include <algorithm>

#include "kairos/common/base/Exceptions.h"

namespace facebook::kairos::tz {

TransitionTable::TransitionTable(
    ZoneOffset initial,
    std::vector<Transition> transitions)
    : initial_(std::move(initial)), transitions_(std::move(transitions)) {
  for (size_t i = 1; i < transitions_.size(); ++i) {
    KAIROS_USER_CHECK_LT(
        transitions_[i - 1].utcMicros,
        transitions_[i].utcMicros,
        "transitions must be strictly increasing");
    KAIROS_USER_CHECK_LE(
        localEnd(i - 1),
        localBegin(i),
        "transition at {} overlaps the next one",
        transitions_[i - 1].utcMicros);
  }
}

int64_t TransitionTable::localBegin(size_t i) const {
  return transitions_[i].utcMicros +
      std::min(
             offsetBefore(i).utcOffset.toMicros(),
             transitions_[i].offset.utcOffset.toMicros());
}

int64_t TransitionTable::localEnd(size_t i) const {
  return transitions_[i].utcMicros +
      std::max(
             offsetBefore(i).utcOffset.toMicros(),
             transitions_[i].offset.utcOffset.toMicros());
}

const ZoneOffset& TransitionTable::offsetAtUtc(int64_t utcMicros) const {
  auto it = std::upper_bound(
      transitions_.begin(),
      transitions_.end(),
      utcMicros,
      [](int64_t micros, const Transition& transition) {
        return micros < transition.utcMicros;
      });
  if (it == transitions_.begin()) {
    return initial_;
  }
  return std::prev(it)->offset;
}

LocalInfo TransitionTable::localInfo(int64_t localMicros) const {
  // Find the first transition whose effect on wall time has not ended yet.
  size_t low = 0;
  size_t high = transitions_.size();
  while (low < high) {
    auto mid = low + (high - low) / 2;
    if (localEnd(mid) <= localMicros) {
      low = mid + 1;
    } else {
      high = mid;
    }
  }

  if (low == transitions_.size()) {
    const auto& last =
        transitions_.empty() ? initial_ : transitions_.back().offset;
    return {LocalInfo::Result::kUnique, &last, nullptr};
  }

  const auto& before = offsetBefore(low);
  if (localMicros < localBegin(low)) {
    return {LocalInfo::Result::kUnique, &before, nullptr};
  }

  const auto& after = transitions_[low].offset;
  if (after.utcOffset > before.utcOffset) {
    return {LocalInfo::Result::kNonexistent, &before, &after};
  }
  return {LocalInfo::Result::kAmbiguous, &before, &after};
}

} // namespace facebook::kairos::tz
