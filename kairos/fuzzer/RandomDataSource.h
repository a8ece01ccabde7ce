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

#include <string>
#include <vector>

#include "kairos/fuzzer/DataSource.h"
#include "kairos/fuzzer/Utils.h"

namespace facebook::kairos::fuzzer {

/// DataSource backed by a seeded pseudo-random generator. Every answer is
/// recorded as one integer choice. A source constructed from a recorded
/// choice sequence answers from that sequence first (clamping each entry
/// into the requested range) and falls back to the generator once it is
/// exhausted, so replaying choices() of a previous source reproduces its
/// values.
class RandomDataSource : public DataSource {
 public:
  struct Example {
    std::string label;
    int32_t depth;
    /// Index of the first choice made inside the example.
    size_t start;
    /// One past the last choice made inside the example. Only meaningful
    /// once the example is stopped.
    size_t end{0};
    bool stopped{false};
    bool discarded{false};
  };

  explicit RandomDataSource(size_t seed);

  RandomDataSource(std::vector<int64_t> prefix, size_t seed = 0);

  int64_t drawInteger(
      int64_t min,
      int64_t max,
      std::optional<int64_t> center = std::nullopt,
      std::optional<int64_t> forced = std::nullopt) override;

  bool drawBoolean(double probability = 0.5) override;

  uint64_t drawBits(int32_t n) override;

  void startExample(std::string_view label) override;

  void stopExample(bool discard = false) override;

  void markInvalid(std::string_view reason) override;

  void noteEvent(std::string_view message) override;

  bool isInvalid() const override {
    return invalid_;
  }

  const std::string& invalidReason() const {
    return invalidReason_;
  }

  const std::vector<int64_t>& choices() const {
    return choices_;
  }

  /// Examples in the order they were started.
  const std::vector<Example>& examples() const {
    return examples_;
  }

  const std::vector<std::string>& events() const {
    return events_;
  }

  /// Number of examples started and not yet stopped.
  size_t depth() const {
    return openExamples_.size();
  }

 private:
  // Returns the next recorded choice if one is left.
  std::optional<int64_t> nextPrefixChoice();

  int64_t drawCentered(int64_t min, int64_t max, int64_t center);

  FuzzerGenerator rng_;
  const std::vector<int64_t> prefix_;
  size_t position_{0};

  std::vector<int64_t> choices_;
  std::vector<Example> examples_;
  std::vector<size_t> openExamples_;
  std::vector<std::string> events_;

  bool invalid_{false};
  std::string invalidReason_;
};

} // namespace facebook::kairos::fuzzer
