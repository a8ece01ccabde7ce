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

#include <ctime>

#include <folly/String.h>
#include <folly/init/Init.h>
#include <gflags/gflags.h>

#include "kairos/fuzzer/DatetimeFuzzer.h"

DEFINE_int64(
    seed,
    0,
    "Initial seed for random number generator used to reproduce previous "
    "results (0 means start with random seed).");

DEFINE_int32(steps, 10, "Number of strategies to generate and test.");

DEFINE_int32(
    duration_sec,
    0,
    "For how long it should run (in seconds). If zero, "
    "it executes exactly --steps iterations and exits.");

DEFINE_int32(
    draws_per_step,
    100,
    "Number of values drawn from each strategy in one iteration.");

DEFINE_bool(
    allow_imaginary,
    true,
    "If false, datetimes that do not exist in their time zone are rejected "
    "and the fuzzer verifies that none is returned.");

DEFINE_string(
    tz_names,
    "",
    "Comma separated list of tz database zones to draw from in addition to "
    "the built-in ones, e.g. America/New_York,Europe/London.");

int main(int argc, char** argv) {
  // Calls common init functions in the necessary order, initializing
  // singletons, installing proper signal handlers for better debugging
  // experience, and initialize glog and gflags.
  folly::Init init(&argc, &argv);

  facebook::kairos::fuzzer::DatetimeFuzzerOptions options;
  options.steps = FLAGS_steps;
  options.durationSec = FLAGS_duration_sec;
  options.drawsPerStep = FLAGS_draws_per_step;
  options.allowImaginary = FLAGS_allow_imaginary;
  if (!FLAGS_tz_names.empty()) {
    folly::split(',', FLAGS_tz_names, options.tzNames);
  }

  size_t initialSeed = FLAGS_seed == 0 ? std::time(nullptr) : FLAGS_seed;
  facebook::kairos::fuzzer::datetimeFuzzer(initialSeed, options);
  return 0;
}
