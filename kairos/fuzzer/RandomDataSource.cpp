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

#include "kairos/fuzzer/RandomDataSource.h"

#include <algorithm>

#include <folly/lang/Bits.h>
#include <glog/logging.h>

#include "kairos/common/base/Exceptions.h"

namespace facebook::kairos::fuzzer {

RandomDataSource::RandomDataSource(size_t seed) : rng_(seed) {}

RandomDataSource::RandomDataSource(std::vector<int64_t> prefix, size_t seed)
    : rng_(seed), prefix_(std::move(prefix)) {}

std::optional<int64_t> RandomDataSource::nextPrefixChoice() {
  if (position_ < prefix_.size()) {
    return prefix_[position_++];
  }
  return std::nullopt;
}

int64_t
RandomDataSource::drawCentered(int64_t min, int64_t max, int64_t center) {
  // Pick a side of the center, then an offset whose bit width is uniform,
  // so that small distances from the center dominate.
  bool up;
  if (center == min) {
    up = true;
  } else if (center == max) {
    up = false;
  } else {
    up = coinToss(rng_, 0.5);
  }

  const uint64_t gap = up
      ? static_cast<uint64_t>(max) - static_cast<uint64_t>(center)
      : static_cast<uint64_t>(center) - static_cast<uint64_t>(min);
  if (gap == 0) {
    return center;
  }

  const auto maxWidth = static_cast<int32_t>(folly::findLastSet(gap));
  const auto width = rand<int32_t>(rng_, 1, maxWidth);
  const uint64_t mask =
      width == 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
  const auto offset = rand<uint64_t>(rng_, 0, std::min(mask, gap));

  return up ? static_cast<int64_t>(static_cast<uint64_t>(center) + offset)
            : static_cast<int64_t>(static_cast<uint64_t>(center) - offset);
}

int64_t RandomDataSource::drawInteger(
    int64_t min,
    int64_t max,
    std::optional<int64_t> center,
    std::optional<int64_t> forced) {
  KAIROS_CHECK_LE(min, max);

  if (forced.has_value()) {
    KAIROS_CHECK(
        *forced >= min && *forced <= max,
        "Forced value {} is outside of [{}, {}]",
        *forced,
        min,
        max);
  }

  if (min == max) {
    return min;
  }

  if (forced.has_value()) {
    nextPrefixChoice();
    choices_.push_back(*forced);
    return *forced;
  }

  int64_t value;
  if (auto recorded = nextPrefixChoice()) {
    value = std::clamp(*recorded, min, max);
  } else {
    value = drawCentered(min, max, std::clamp(center.value_or(min), min, max));
  }
  choices_.push_back(value);
  return value;
}

bool RandomDataSource::drawBoolean(double probability) {
  bool value;
  if (auto recorded = nextPrefixChoice()) {
    value = *recorded != 0;
  } else {
    value = coinToss(rng_, probability);
  }
  choices_.push_back(value ? 1 : 0);
  return value;
}

uint64_t RandomDataSource::drawBits(int32_t n) {
  KAIROS_CHECK(n > 0 && n < 64, "Cannot draw {} bits", n);
  const uint64_t mask = (uint64_t{1} << n) - 1;

  uint64_t value;
  if (auto recorded = nextPrefixChoice()) {
    value = static_cast<uint64_t>(*recorded) & mask;
  } else {
    value = rand<uint64_t>(rng_, 0, mask);
  }
  choices_.push_back(static_cast<int64_t>(value));
  return value;
}

void RandomDataSource::startExample(std::string_view label) {
  openExamples_.push_back(examples_.size());
  examples_.push_back(Example{
      std::string(label),
      static_cast<int32_t>(openExamples_.size() - 1),
      choices_.size()});
}

void RandomDataSource::stopExample(bool discard) {
  KAIROS_CHECK(!openExamples_.empty(), "No example to stop");
  auto& example = examples_[openExamples_.back()];
  openExamples_.pop_back();

  example.end = choices_.size();
  example.stopped = true;
  example.discarded = discard;
  VLOG(2) << "Stopped example '" << example.label << "' at depth "
          << example.depth << (discard ? " (discarded)" : "");
}

void RandomDataSource::markInvalid(std::string_view reason) {
  VLOG(1) << "Marking test case invalid: " << reason;
  invalid_ = true;
  invalidReason_ = std::string(reason);
}

void RandomDataSource::noteEvent(std::string_view message) {
  events_.emplace_back(message);
}

} // namespace facebook::kairos::fuzzer
