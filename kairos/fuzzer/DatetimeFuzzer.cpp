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

#include "kairos/fuzzer/DatetimeFuzzer.h"

#include <chrono>
#include <iterator>

#include <fmt/format.h>
#include <glog/logging.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/fuzzer/DatetimeStrategies.h"
#include "kairos/fuzzer/Nastiness.h"
#include "kairos/fuzzer/RandomDataSource.h"
#include "kairos/fuzzer/Utils.h"
#include "kairos/type/Calendar.h"
#include "kairos/type/tz/FixedOffsetTimeZone.h"
#include "kairos/type/tz/OffsetTableTimeZone.h"
#include "kairos/type/tz/TableTimeZone.h"
#include "kairos/type/tz/TzdbTimeZone.h"

namespace facebook::kairos::fuzzer {
namespace {

int64_t localMicros(int32_t year, int32_t month, int32_t day, int32_t hour) {
  return Datetime::create(year, month, day, hour).value().toMicros();
}

template <typename T>
bool isDone(size_t i, T startTime, const DatetimeFuzzerOptions& options) {
  if (options.durationSec > 0) {
    const std::chrono::duration<double> elapsed =
        std::chrono::system_clock::now() - startTime;
    return elapsed.count() >= options.durationSec;
  }
  return i >= static_cast<size_t>(options.steps);
}

class DatetimeFuzzer {
 public:
  DatetimeFuzzer(size_t initialSeed, DatetimeFuzzerOptions options)
      : options_(std::move(options)),
        zones_(makeFuzzerTimeZones(options_.tzNames)) {
    seed(initialSeed);
  }

  DatetimeFuzzerStats go();

 private:
  void seed(size_t seed) {
    currentSeed_ = seed;
    rng_.seed(currentSeed_);
  }

  void reSeed() {
    seed(rng_());
  }

  Datetime randDatetime(int64_t minMicros, int64_t maxMicros) {
    return Datetime::fromMicros(rand<int64_t>(rng_, minMicros, maxMicros))
        .value();
  }

  // Returns bounds that are close together most of the time, so that
  // capping is exercised on every field.
  std::pair<Datetime, Datetime> randDatetimeBounds();

  Duration randDuration();

  SearchStrategyPtr<tz::TimeZonePtr> randTimeZones();

  void verifyDatetimes();

  void verifyDates();

  void verifyDurations();

  const DatetimeFuzzerOptions options_;
  const std::vector<tz::TimeZonePtr> zones_;

  FuzzerGenerator rng_;
  size_t currentSeed_{0};
  DatetimeFuzzerStats stats_;
};

std::pair<Datetime, Datetime> DatetimeFuzzer::randDatetimeBounds() {
  static const int64_t kWidths[] = {
      0,
      util::kMicrosPerHour,
      util::kMicrosPerDay,
      30 * util::kMicrosPerDay,
      366 * util::kMicrosPerDay,
      50 * 366 * util::kMicrosPerDay,
      util::kMaxMicrosSinceEpoch - util::kMinMicrosSinceEpoch,
  };

  Datetime min;
  if (coinToss(rng_, 0.7)) {
    min =
        randDatetime(localMicros(1960, 1, 1, 0), localMicros(2040, 1, 1, 0));
  } else {
    min = randDatetime(util::kMinMicrosSinceEpoch, util::kMaxMicrosSinceEpoch);
  }

  const auto maxWidth = std::min(
      kWidths[rand<size_t>(rng_, 0, std::size(kWidths) - 1)],
      util::kMaxMicrosSinceEpoch - min.toMicros());
  const auto max = randDatetime(
      min.toMicros(), min.toMicros() + rand<int64_t>(rng_, 0, maxWidth));
  return {min, max};
}

Duration DatetimeFuzzer::randDuration() {
  if (coinToss(rng_, 0.5)) {
    return Duration::create(
               rand<int64_t>(rng_, -1'000, 1'000),
               rand<int64_t>(rng_, 0, util::kSecsPerDay - 1),
               rand<int64_t>(rng_, 0, util::kMicrosPerSec - 1))
        .value();
  }
  return Duration::create(
             rand<int64_t>(rng_, Duration::kMinDays, Duration::kMaxDays),
             rand<int64_t>(rng_, 0, util::kSecsPerDay - 1),
             rand<int64_t>(rng_, 0, util::kMicrosPerSec - 1))
      .value();
}

SearchStrategyPtr<tz::TimeZonePtr> DatetimeFuzzer::randTimeZones() {
  if (coinToss(rng_, 0.2)) {
    return noTimeZones();
  }
  if (coinToss(rng_, 0.5)) {
    return timeZones({zones_[rand<size_t>(rng_, 0, zones_.size() - 1)]});
  }
  return timeZones(zones_);
}

void DatetimeFuzzer::verifyDatetimes() {
  const auto [min, max] = randDatetimeBounds();
  const auto strategy =
      datetimes(min, max, randTimeZones(), options_.allowImaginary);
  VLOG(1) << "Drawing from " << strategy->toString();

  for (auto i = 0; i < options_.drawsPerStep; ++i) {
    RandomDataSource data(rng_());
    const auto value = strategy->draw(data);
    ++stats_.numDraws;
    KAIROS_CHECK_EQ(data.depth(), size_t{0});

    if (value.hasError()) {
      KAIROS_CHECK(
          value.error().isInvalid() && data.isInvalid(),
          "Unexpected failure drawing from {}: {}",
          strategy->toString(),
          value.error());
      ++stats_.numInvalid;
      continue;
    }

    const auto& local = value.value().local();
    KAIROS_CHECK(
        min <= local && local <= max,
        "{} is outside of [{}, {}]",
        value.value(),
        min,
        max);
    KAIROS_CHECK(
        util::isValidDate(local.year(), local.month(), local.day()),
        "{} is not a valid date",
        local);

    RandomDataSource replay(data.choices());
    const auto replayed = strategy->draw(replay);
    KAIROS_CHECK(
        replayed.hasValue() && replayed.value() == value.value(),
        "Replaying {} produced {}",
        value.value(),
        replayed.hasValue() ? replayed.value().toString()
                            : replayed.error().toString());

    if (value.value().isNaive()) {
      ++stats_.numNaive;
      continue;
    }

    const auto nastiness = classify(value.value());
    KAIROS_CHECK(
        options_.allowImaginary || !nastiness.nonexistent,
        "{} does not exist but imaginary datetimes are not allowed",
        value.value());
    stats_.numNonexistent += nastiness.nonexistent;
    stats_.numAmbiguous += nastiness.ambiguous;
    stats_.numLeapSmear += nastiness.leapSmear;
  }
}

void DatetimeFuzzer::verifyDates() {
  const auto [min, max] = randDatetimeBounds();
  const auto strategy = dates(min.date(), max.date());

  for (auto i = 0; i < options_.drawsPerStep; ++i) {
    RandomDataSource data(rng_());
    const auto value = strategy->draw(data);
    ++stats_.numDraws;
    KAIROS_CHECK(value.hasValue(), "{}", value.error());
    KAIROS_CHECK(
        min.date() <= value.value() && value.value() <= max.date(),
        "{} is outside of [{}, {}]",
        value.value(),
        min.date(),
        max.date());

    RandomDataSource replay(data.choices());
    const auto replayed = strategy->draw(replay);
    KAIROS_CHECK(
        replayed.hasValue() && replayed.value() == value.value(),
        "Replaying {} produced a different date",
        value.value());
  }
}

void DatetimeFuzzer::verifyDurations() {
  auto min = randDuration();
  auto max = randDuration();
  if (max < min) {
    std::swap(min, max);
  }
  const auto strategy = durations(min, max);

  for (auto i = 0; i < options_.drawsPerStep; ++i) {
    RandomDataSource data(rng_());
    const auto value = strategy->draw(data);
    ++stats_.numDraws;
    KAIROS_CHECK(value.hasValue(), "{}", value.error());
    KAIROS_CHECK(
        min <= value.value() && value.value() <= max,
        "{} is outside of [{}, {}]",
        value.value(),
        min,
        max);

    RandomDataSource replay(data.choices());
    const auto replayed = strategy->draw(replay);
    KAIROS_CHECK(
        replayed.hasValue() && replayed.value() == value.value(),
        "Replaying {} produced a different duration",
        value.value());
  }
}

DatetimeFuzzerStats DatetimeFuzzer::go() {
  KAIROS_CHECK(
      options_.steps > 0 || options_.durationSec > 0,
      "Either --steps or --duration_sec needs to be greater than zero.");

  auto startTime = std::chrono::system_clock::now();
  size_t iteration = 0;

  while (!isDone(iteration, startTime, options_)) {
    LOG(INFO) << "==============================> Started iteration "
              << iteration << " (seed: " << currentSeed_ << ")";

    verifyDatetimes();
    verifyDates();
    verifyDurations();

    LOG(INFO) << "==============================> Done with iteration "
              << iteration;

    reSeed();
    ++iteration;
  }

  LOG(INFO) << stats_.toString();
  return stats_;
}

} // namespace

tz::TransitionTable makeDaylightSavingTable(
    Duration standardOffset,
    int32_t firstYear,
    int32_t lastYear) {
  KAIROS_USER_CHECK_LE(firstYear, lastYear);
  const tz::ZoneOffset standard{standardOffset, Duration(), "ST"};
  const auto daylightOffset =
      Duration::fromMicros(standardOffset.toMicros() + util::kMicrosPerHour);
  const tz::ZoneOffset daylight{
      daylightOffset, Duration::fromMicros(util::kMicrosPerHour), "DT"};

  std::vector<tz::Transition> transitions;
  for (auto year = firstYear; year <= lastYear; ++year) {
    transitions.push_back(
        {localMicros(year, 3, 10, 2) - standardOffset.toMicros(), daylight});
    transitions.push_back(
        {localMicros(year, 11, 3, 2) - daylightOffset.toMicros(), standard});
  }
  return tz::TransitionTable(standard, std::move(transitions));
}

std::vector<tz::TimeZonePtr> makeFuzzerTimeZones(
    const std::vector<std::string>& tzdbNames) {
  const auto eastern = Duration::fromMicros(-5 * util::kMicrosPerHour);

  std::vector<tz::TimeZonePtr> zones{
      tz::FixedOffsetTimeZone::utc(),
      std::make_shared<tz::FixedOffsetTimeZone>(Duration::fromMicros(
          5 * util::kMicrosPerHour + 30 * util::kMicrosPerMinute)),
      std::make_shared<tz::TableTimeZone>(
          "Synthetic/Daylight", makeDaylightSavingTable(eastern, 1970, 2037)),
      std::make_shared<tz::OffsetTableTimeZone>(
          "Synthetic/DaylightTable",
          makeDaylightSavingTable(eastern, 1970, 2037)),
  };
  for (const auto& name : tzdbNames) {
    zones.push_back(tz::TzdbTimeZone::locate(name));
  }
  return zones;
}

std::string DatetimeFuzzerStats::toString() const {
  return fmt::format(
      "Draws: {}, invalid: {}, naive: {}, nonexistent: {}, ambiguous: {}, "
      "leap smear: {}",
      numDraws,
      numInvalid,
      numNaive,
      numNonexistent,
      numAmbiguous,
      numLeapSmear);
}

DatetimeFuzzerStats datetimeFuzzer(
    size_t seed,
    const DatetimeFuzzerOptions& options) {
  auto fuzzer = DatetimeFuzzer(seed, options);
  return fuzzer.go();
}

} // namespace facebook::kairos::fuzzer
