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

#include <cstdint>
#include <optional>
#include <string_view>

namespace facebook::kairos::fuzzer {

/// Source of the choices a strategy draws from. Every value a strategy
/// produces is a pure function of the sequence of answers it gets from this
/// interface, which is what makes draws replayable and shrinkable.
///
/// Draws can be grouped into nested examples. A group stopped with
/// 'discard' set marks the draws inside it as not contributing to the
/// structure of the final value.
class DataSource {
 public:
  virtual ~DataSource() = default;

  /// Returns a value in [min, max]. Without 'forced', values close to
  /// 'center' (clamped into range, defaults to 'min') are favored. With
  /// 'forced', returns exactly that value, which must lie in range, and
  /// records it as if it had been drawn.
  virtual int64_t drawInteger(
      int64_t min,
      int64_t max,
      std::optional<int64_t> center = std::nullopt,
      std::optional<int64_t> forced = std::nullopt) = 0;

  /// Returns true with the given probability.
  virtual bool drawBoolean(double probability = 0.5) = 0;

  /// Returns an unsigned value below 2^n, 0 < n <= 63.
  virtual uint64_t drawBits(int32_t n) = 0;

  virtual void startExample(std::string_view label) = 0;

  virtual void stopExample(bool discard = false) = 0;

  /// Marks the current test case as not a valid example. This is not a
  /// failure: the engine is expected to retry with different choices.
  virtual void markInvalid(std::string_view reason) = 0;

  /// Attaches a diagnostic message to the current test case.
  virtual void noteEvent(std::string_view message) = 0;

  virtual bool isInvalid() const = 0;
};

/// Keeps an example group open for the lifetime of the object. A scope that
/// is left without an explicit stop() (e.g. on an early return) is closed
/// with 'discard' set.
class ExampleScope {
 public:
  ExampleScope(DataSource& data, std::string_view label) : data_(data) {
    data_.startExample(label);
  }

  ~ExampleScope() {
    if (!stopped_) {
      data_.stopExample(true);
    }
  }

  ExampleScope(const ExampleScope&) = delete;
  ExampleScope& operator=(const ExampleScope&) = delete;

  void stop(bool discard = false) {
    if (!stopped_) {
      stopped_ = true;
      data_.stopExample(discard);
    }
  }

 private:
  DataSource& data_;
  bool stopped_{false};
};

} // namespace facebook::kairos::fuzzer
