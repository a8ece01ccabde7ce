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

#include <folly/Random.h>

#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

namespace facebook::kairos::fuzzer {

using FuzzerGenerator = folly::detail::DefaultGenerator;

/// Returns true with probability 'threshold'.
bool coinToss(FuzzerGenerator& rng, double threshold);

/// Returns a value drawn uniformly from [min, max].
template <typename T>
inline T rand(FuzzerGenerator& rng, T min, T max) {
  if constexpr (std::is_integral_v<T>) {
    return boost::random::uniform_int_distribution<T>(min, max)(rng);
  } else {
    return boost::random::uniform_real_distribution<T>(min, max)(rng);
  }
}

} // namespace facebook::kairos::fuzzer
