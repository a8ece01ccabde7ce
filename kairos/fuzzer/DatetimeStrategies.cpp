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

#include "kairos/fuzzer/DatetimeStrategies.h"

#include <array>

#include <fmt/format.h>
#include <glog/logging.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/common/base/KairosException.h"
#include "kairos/fuzzer/CalendarFieldDrawer.h"
#include "kairos/fuzzer/Nastiness.h"
#include "kairos/type/tz/OffsetTableTimeZone.h"

namespace facebook::kairos::fuzzer {
namespace {

/// Runs 'attempt' up to kMaxDrawAttempts times, each inside its own example
/// group. An attempt that fails to construct its value (Status::UserError or
/// Status::Overflow) has its group discarded. Once all attempts failed, the
/// message built by 'describeFailure' is noted as an event and the draw is
/// marked invalid. Status::Invalid is returned as is.
template <typename T, typename Attempt, typename DescribeFailure>
Expected<T> drawWithRetries(
    DataSource& data,
    Attempt&& attempt,
    DescribeFailure&& describeFailure) {
  for (int32_t i = 0; i < kMaxDrawAttempts; ++i) {
    ExampleScope scope(data, kDrawAttemptLabel);
    Expected<T> result = attempt();
    if (result.hasValue() || result.error().isInvalid()) {
      scope.stop();
      return result;
    }
    VLOG(1) << "Draw attempt " << i + 1 << " failed: " << result.error();
    scope.stop(true);
  }

  const std::string message = fmt::format(
      "{} attempts to create {} failed.", kMaxDrawAttempts, describeFailure());
  LOG(WARNING) << message;
  data.noteEvent(message);
  data.markInvalid(message);
  return folly::makeUnexpected(Status::Invalid("{}", message));
}

/// Attaches 'zone' to 'naive' the way the zone's kind requires.
Expected<LocalDatetime> localize(
    const Datetime& naive,
    const tz::TimeZonePtr& zone) {
  if (zone == nullptr) {
    return LocalDatetime(naive);
  }
  switch (zone->kind()) {
    case tz::TimeZoneKind::kFoldAware:
      return LocalDatetime::attach(naive, zone);
    case tz::TimeZoneKind::kOffsetTable:
      return static_cast<const tz::OffsetTableTimeZone&>(*zone).localize(
          naive, naive.fold() == 0);
  }
  KAIROS_UNREACHABLE("Unknown time zone kind");
}

Expected<LocalDatetime> drawLocalized(
    DataSource& data,
    const Datetime& min,
    const Datetime& max,
    const tz::TimeZonePtr& zone,
    const ForcedFields& forced = {}) {
  auto naive = drawCappedMultipart<Datetime>(data, min, max, forced);
  KAIROS_RETURN_UNEXPECTED(naive);
  return localize(naive.value(), zone);
}

class DateStrategy : public SearchStrategy<Date> {
 public:
  DateStrategy(Date min, Date max) : min_(min), max_(max) {}

  std::string label() const override {
    return "dates";
  }

  std::string toString() const override {
    return fmt::format("dates(min={}, max={})", min_, max_);
  }

 protected:
  Expected<Date> doDraw(DataSource& data) const override {
    return drawWithRetries<Date>(
        data,
        [&]() { return drawCappedMultipart<Date>(data, min_, max_); },
        [&]() { return fmt::format("a date between {} and {}", min_, max_); });
  }

 private:
  const Date min_;
  const Date max_;
};

class TimeStrategy : public SearchStrategy<LocalTime> {
 public:
  TimeStrategy(
      Time min,
      Time max,
      SearchStrategyPtr<tz::TimeZonePtr> timezones)
      : min_(min), max_(max), timezones_(std::move(timezones)) {}

  std::string label() const override {
    return "times";
  }

  std::string toString() const override {
    return fmt::format(
        "times(min={}, max={}, timezones={})",
        min_,
        max_,
        timezones_->toString());
  }

 protected:
  Expected<LocalTime> doDraw(DataSource& data) const override {
    return drawWithRetries<LocalTime>(
        data,
        [&]() -> Expected<LocalTime> {
          auto time = drawCappedMultipart<Time>(data, min_, max_);
          KAIROS_RETURN_UNEXPECTED(time);
          auto zone = timezones_->draw(data);
          KAIROS_RETURN_UNEXPECTED(zone);
          return LocalTime(time.value(), zone.value());
        },
        [&]() {
          return fmt::format(
              "a time between {} and {} with timezone from {}",
              min_,
              max_,
              timezones_->toString());
        });
  }

 private:
  const Time min_;
  const Time max_;
  const SearchStrategyPtr<tz::TimeZonePtr> timezones_;
};

class DatetimeStrategy : public SearchStrategy<LocalDatetime> {
 public:
  DatetimeStrategy(
      Datetime min,
      Datetime max,
      SearchStrategyPtr<tz::TimeZonePtr> timezones,
      bool allowImaginary)
      : min_(min),
        max_(max),
        timezones_(std::move(timezones)),
        allowImaginary_(allowImaginary) {}

  std::string label() const override {
    return "datetimes";
  }

  std::string toString() const override {
    return fmt::format(
        "datetimes(min={}, max={}, timezones={}, allowImaginary={})",
        min_,
        max_,
        timezones_->toString(),
        allowImaginary_);
  }

 protected:
  Expected<LocalDatetime> doDraw(DataSource& data) const override {
    ExceptionContextSetter context(
        {[](void* arg) {
           return fmt::format(
               "Drawing from {}",
               static_cast<const DatetimeStrategy*>(arg)->toString());
         },
         const_cast<DatetimeStrategy*>(this)});

    return drawWithRetries<LocalDatetime>(
        data,
        [&]() { return drawAttempt(data); },
        [&]() {
          return fmt::format(
              "a datetime between {} and {} with timezone from {}",
              min_,
              max_,
              timezones_->toString());
        });
  }

 private:
  Expected<LocalDatetime> drawAttempt(DataSource& data) const {
    auto zone = timezones_->draw(data);
    KAIROS_RETURN_UNEXPECTED(zone);

    if (zone.value() == nullptr) {
      auto naive = drawCappedMultipart<Datetime>(data, min_, max_);
      KAIROS_RETURN_UNEXPECTED(naive);
      return LocalDatetime(naive.value());
    }

    auto result = drawAware(data, zone.value());
    KAIROS_RETURN_UNEXPECTED(result);

    if (!allowImaginary_ && doesNotExist(result.value())) {
      const auto message = fmt::format(
          "{} does not exist (usually a DST transition)", result.value());
      data.markInvalid(message);
      return folly::makeUnexpected(Status::Invalid("{}", message));
    }
    return result;
  }

  // Draws one value over [min_, max_]. With probability 1/4, searches for a
  // nasty value by bisecting the bounds toward a sub-interval known to
  // contain one, then draws the value found again over [min_, max_] with
  // its fields forced, so that it has the structure of an ordinary draw.
  Expected<LocalDatetime> drawAware(
      DataSource& data,
      const tz::TimeZonePtr& zone) const {
    const bool tryToBeNasty = data.drawBits(2) == 1;

    ExampleScope first(data, kDrawNaivePartLabel);
    auto candidate = drawLocalized(data, min_, max_, zone);
    KAIROS_RETURN_UNEXPECTED(candidate);
    if (!tryToBeNasty || isNasty(candidate.value())) {
      first.stop();
      return candidate;
    }

    auto bounds = getNastyBounds(
        LocalDatetime::attach(min_, zone),
        candidate.value(),
        LocalDatetime::attach(max_, zone));
    if (!bounds.has_value()) {
      first.stop();
      return candidate;
    }
    first.stop(true);

    LocalDatetime current = candidate.value();
    while (!isNasty(current)) {
      const auto& [lo, hi] = *bounds;
      const auto width = hi.local().toMicros() - lo.local().toMicros();
      VLOG(1) << "Searching for a nasty datetime between " << lo << " and "
              << hi;

      ExampleScope scope(data, kDrawNaivePartLabel);
      auto next = drawLocalized(data, lo.local(), hi.local(), zone);
      KAIROS_RETURN_UNEXPECTED(next);
      scope.stop(true);
      current = next.value();

      auto narrowed = getNastyBounds(lo, current, hi);
      if (!narrowed.has_value() ||
          narrowed->second.local().toMicros() -
                  narrowed->first.local().toMicros() >=
              width) {
        break;
      }
      bounds = std::move(narrowed);
    }
    VLOG(1) << "Nasty search ended at " << current << " ("
            << classify(current).toString() << ")";

    ExampleScope replay(data, kDrawNaivePartLabel);
    auto result = drawLocalized(
        data, min_, max_, zone, ForcedFields::fromDatetime(current.local()));
    KAIROS_RETURN_UNEXPECTED(result);
    replay.stop();
    return result;
  }

  const Datetime min_;
  const Datetime max_;
  const SearchStrategyPtr<tz::TimeZonePtr> timezones_;
  const bool allowImaginary_;
};

class DurationStrategy : public SearchStrategy<Duration> {
 public:
  DurationStrategy(Duration min, Duration max) : min_(min), max_(max) {}

  std::string label() const override {
    return "durations";
  }

  std::string toString() const override {
    return fmt::format("durations(min={}, max={})", min_, max_);
  }

 protected:
  Expected<Duration> doDraw(DataSource& data) const override {
    return drawWithRetries<Duration>(
        data,
        [&]() { return drawFields(data); },
        [&]() {
          return fmt::format("a duration between {} and {}", min_, max_);
        });
  }

 private:
  // Days, seconds and microseconds, capped the same way as calendar fields
  // and each centered on zero.
  Expected<Duration> drawFields(DataSource& data) const {
    const std::array<int64_t, 3> mins{
        min_.days(), min_.seconds(), min_.microseconds()};
    const std::array<int64_t, 3> maxs{
        max_.days(), max_.seconds(), max_.microseconds()};
    const std::array<int64_t, 3> absoluteMins{
        Duration::min().days(),
        Duration::min().seconds(),
        Duration::min().microseconds()};
    const std::array<int64_t, 3> absoluteMaxs{
        Duration::max().days(),
        Duration::max().seconds(),
        Duration::max().microseconds()};

    std::array<int64_t, 3> values{};
    bool capLow = true;
    bool capHigh = true;
    for (size_t i = 0; i < values.size(); ++i) {
      const auto low = capLow ? mins[i] : absoluteMins[i];
      const auto high = capHigh ? maxs[i] : absoluteMaxs[i];
      values[i] = data.drawInteger(low, high, 0);
      capLow = capLow && values[i] == low;
      capHigh = capHigh && values[i] == high;
    }
    return Duration::create(values[0], values[1], values[2]);
  }

  const Duration min_;
  const Duration max_;
};

void checkTimeZones(const SearchStrategyPtr<tz::TimeZonePtr>& timezones) {
  KAIROS_USER_CHECK_NOT_NULL(
      timezones, "timezones must be a strategy, use noTimeZones() for none");
}

} // namespace

SearchStrategyPtr<Date> dates(Date min, Date max) {
  KAIROS_USER_CHECK(
      min <= max, "Cannot have max={} < min={} for dates", max, min);
  if (min == max) {
    return just(min);
  }
  return std::make_shared<DateStrategy>(min, max);
}

SearchStrategyPtr<LocalTime>
times(Time min, Time max, SearchStrategyPtr<tz::TimeZonePtr> timezones) {
  KAIROS_USER_CHECK(
      min <= max, "Cannot have max={} < min={} for times", max, min);
  checkTimeZones(timezones);
  if (min == max && isNoTimeZones(*timezones)) {
    return just(LocalTime(min));
  }
  return std::make_shared<TimeStrategy>(min, max, std::move(timezones));
}

SearchStrategyPtr<LocalDatetime> datetimes(
    Datetime min,
    Datetime max,
    SearchStrategyPtr<tz::TimeZonePtr> timezones,
    bool allowImaginary) {
  KAIROS_USER_CHECK(
      min <= max, "Cannot have max={} < min={} for datetimes", max, min);
  checkTimeZones(timezones);
  if (min == max && isNoTimeZones(*timezones)) {
    return just(LocalDatetime(min));
  }
  return std::make_shared<DatetimeStrategy>(
      min, max, std::move(timezones), allowImaginary);
}

SearchStrategyPtr<Duration> durations(Duration min, Duration max) {
  KAIROS_USER_CHECK(
      min <= max, "Cannot have max={} < min={} for durations", max, min);
  if (min == max) {
    return just(min);
  }
  return std::make_shared<DurationStrategy>(min, max);
}

} // namespace facebook::kairos::fuzzer
