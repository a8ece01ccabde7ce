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

#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/common/base/Status.h"
#include "kairos/fuzzer/DataSource.h"
#include "kairos/type/tz/TimeZone.h"

namespace facebook::kairos::fuzzer {

/// Describes a value in strategy representations.
template <typename T>
std::string describe(const T& value) {
  return fmt::format("{}", value);
}

std::string describe(const tz::TimeZonePtr& zone);

/// Produces values of type T from the choices of a DataSource. Strategies
/// are immutable once constructed and can be shared between threads that
/// each own their DataSource.
template <typename T>
class SearchStrategy {
 public:
  virtual ~SearchStrategy() = default;

  /// Draws one value inside an example group labeled with label(). Returns
  /// Status::Invalid if the draw was rejected, in which case
  /// DataSource::markInvalid() has been called.
  Expected<T> draw(DataSource& data) const {
    ExampleScope scope(data, label());
    auto result = doDraw(data);
    scope.stop();
    return result;
  }

  virtual std::string label() const = 0;

  virtual std::string toString() const = 0;

 protected:
  virtual Expected<T> doDraw(DataSource& data) const = 0;
};

template <typename T>
using SearchStrategyPtr = std::shared_ptr<const SearchStrategy<T>>;

/// Always returns the same value without consuming any choice.
template <typename T>
class JustStrategy : public SearchStrategy<T> {
 public:
  explicit JustStrategy(T value) : value_(std::move(value)) {}

  const T& value() const {
    return value_;
  }

  std::string label() const override {
    return "just";
  }

  std::string toString() const override {
    return fmt::format("just({})", describe(value_));
  }

 protected:
  Expected<T> doDraw(DataSource& /*data*/) const override {
    return value_;
  }

 private:
  const T value_;
};

/// Returns one of a fixed list of values, shrinking toward the first.
template <typename T>
class SampledFromStrategy : public SearchStrategy<T> {
 public:
  explicit SampledFromStrategy(std::vector<T> values)
      : values_(std::move(values)) {
    KAIROS_USER_CHECK(
        !values_.empty(), "Cannot sample from an empty list of values");
  }

  const std::vector<T>& values() const {
    return values_;
  }

  std::string label() const override {
    return "sampledFrom";
  }

  std::string toString() const override {
    std::string out = "sampledFrom([";
    for (size_t i = 0; i < values_.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += describe(values_[i]);
    }
    out += "])";
    return out;
  }

 protected:
  Expected<T> doDraw(DataSource& data) const override {
    const auto index = data.drawInteger(0, values_.size() - 1, 0);
    return values_[index];
  }

 private:
  const std::vector<T> values_;
};

/// The timezone strategy that always returns no timezone, which makes
/// datetime and time strategies produce naive values.
class NoTimeZonesStrategy : public JustStrategy<tz::TimeZonePtr> {
 public:
  NoTimeZonesStrategy() : JustStrategy<tz::TimeZonePtr>(nullptr) {}

  std::string label() const override {
    return "none";
  }

  std::string toString() const override {
    return "none()";
  }
};

template <typename T>
SearchStrategyPtr<T> just(T value) {
  return std::make_shared<JustStrategy<T>>(std::move(value));
}

template <typename T>
SearchStrategyPtr<T> sampledFrom(std::vector<T> values) {
  return std::make_shared<SampledFromStrategy<T>>(std::move(values));
}

SearchStrategyPtr<tz::TimeZonePtr> noTimeZones();

/// Samples from the given zones. Throws KairosUserError if 'zones' is empty
/// or contains a null zone.
SearchStrategyPtr<tz::TimeZonePtr> timeZones(
    std::vector<tz::TimeZonePtr> zones);

bool isNoTimeZones(const SearchStrategy<tz::TimeZonePtr>& strategy);

} // namespace facebook::kairos::fuzzer
