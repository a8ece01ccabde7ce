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

#include "kairos/fuzzer/Utils.h"

namespace facebook::kairos::fuzzer {

bool coinToss(FuzzerGenerator& rng, double threshold) {
  return boost::random::uniform_real_distribution<double>(0.0, 1.0)(rng) <
      threshold;
}

} // namespace facebook::kairos::fuzzer
