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

#include <gtest/gtest.h>

#include "kairos/fuzzer/DatetimeFuzzer.h"
#include "kairos/fuzzer/Nastiness.h"
#include "kairos/type/Calendar.h"
#include "kairos/type/tz/FixedOffsetTimeZone.h"
#include "kairos/type/tz/OffsetTableTimeZone.h"
#include "kairos/type/tz/TableTimeZone.h"

namespace facebook::kairos::fuzzer::test {
namespace {

Datetime datetime(
    int32_t year,
    int32_t month,
    int32_t day,
    int32_t hour = 0,
    int32_t minute = 0,
    int32_t second = 0,
    int32_t fold = 0) {
  return Datetime::create(year, month, day, hour, minute, second, 0, fold)
      .value();
}

const Duration kEastern = Duration::fromMicros(-5 * util::kMicrosPerHour);

class NastinessTest : public testing::Test {
 protected:
  // Daylight saving time from 2021-03-10T02:00 to 2021-11-03T02:00.
  const tz::TimeZonePtr table_ = std::make_shared<tz::TableTimeZone>(
      "Test/Eastern", makeDaylightSavingTable(kEastern, 2021, 2021));
  const tz::TimeZonePtr offsetTable_ =
      std::make_shared<tz::OffsetTableTimeZone>(
          "Test/EasternTable",
          makeDaylightSavingTable(kEastern, 2021, 2021));
  const tz::TimeZonePtr utc_ = tz::FixedOffsetTimeZone::utc();
};

TEST_F(NastinessTest, doesNotExist) {
  EXPECT_TRUE(doesNotExist(
      LocalDatetime::attach(datetime(2021, 3, 10, 2, 30), table_)));
  EXPECT_TRUE(doesNotExist(
      LocalDatetime::attach(datetime(2021, 3, 10, 2, 30, 0, 1), table_)));
  EXPECT_FALSE(doesNotExist(
      LocalDatetime::attach(datetime(2021, 3, 10, 3, 0), table_)));
  EXPECT_FALSE(doesNotExist(
      LocalDatetime::attach(datetime(2021, 3, 10, 1, 59), table_)));
  EXPECT_FALSE(doesNotExist(
      LocalDatetime::attach(datetime(2021, 11, 3, 1, 30), table_)));
  EXPECT_FALSE(doesNotExist(LocalDatetime(datetime(2021, 3, 10, 2, 30))));

  const auto& offsetTable =
      static_cast<const tz::OffsetTableTimeZone&>(*offsetTable_);
  EXPECT_TRUE(doesNotExist(
      offsetTable.localize(datetime(2021, 3, 10, 2, 30), true).value()));
  EXPECT_TRUE(doesNotExist(
      offsetTable.localize(datetime(2021, 3, 10, 2, 30), false).value()));
  EXPECT_FALSE(doesNotExist(
      offsetTable.localize(datetime(2021, 3, 10, 4, 30), false).value()));

  // Leaving the representable range counts as not existing.
  auto plus5 = std::make_shared<tz::FixedOffsetTimeZone>(
      Duration::fromMicros(5 * util::kMicrosPerHour));
  EXPECT_TRUE(doesNotExist(LocalDatetime::attach(Datetime::min(), plus5)));
  EXPECT_FALSE(doesNotExist(LocalDatetime::attach(Datetime::max(), plus5)));
}

TEST_F(NastinessTest, isAmbiguous) {
  EXPECT_TRUE(isAmbiguous(
      LocalDatetime::attach(datetime(2021, 11, 3, 1, 30), table_)));
  EXPECT_TRUE(isAmbiguous(
      LocalDatetime::attach(datetime(2021, 11, 3, 1, 30, 0, 1), table_)));
  EXPECT_FALSE(isAmbiguous(
      LocalDatetime::attach(datetime(2021, 11, 3, 2, 0), table_)));
  EXPECT_FALSE(
      isAmbiguous(LocalDatetime::attach(datetime(2021, 6, 1), table_)));
  EXPECT_FALSE(isAmbiguous(LocalDatetime(datetime(2021, 11, 3, 1, 30))));
  EXPECT_FALSE(
      isAmbiguous(LocalDatetime::attach(datetime(2021, 11, 3, 1, 30), utc_)));

  // Offset-table zones resolve every wall time to a single entry.
  const auto& offsetTable =
      static_cast<const tz::OffsetTableTimeZone&>(*offsetTable_);
  EXPECT_FALSE(isAmbiguous(
      offsetTable.localize(datetime(2021, 11, 3, 1, 30), true).value()));
}

TEST_F(NastinessTest, isInLeapSmear) {
  EXPECT_TRUE(isInLeapSmear(
      LocalDatetime::attach(datetime(2016, 12, 31, 23, 59, 59), utc_)));
  EXPECT_TRUE(isInLeapSmear(
      LocalDatetime::attach(datetime(2017, 1, 1, 11, 0), utc_)));
  EXPECT_FALSE(isInLeapSmear(
      LocalDatetime::attach(datetime(2017, 1, 1, 12, 0), utc_)));
  EXPECT_FALSE(isInLeapSmear(LocalDatetime(datetime(2016, 12, 31, 23, 59))));

  // 2016-12-31T18:00-05:00 is 23:00 UTC.
  EXPECT_TRUE(isInLeapSmear(
      LocalDatetime::attach(datetime(2016, 12, 31, 18, 0), table_)));
}

TEST_F(NastinessTest, classify) {
  auto value = LocalDatetime::attach(datetime(2021, 3, 10, 2, 30), table_);
  auto nastiness = classify(value);
  EXPECT_TRUE(nastiness.nonexistent);
  // A skipped wall time has a different offset for each fold.
  EXPECT_TRUE(nastiness.ambiguous);
  EXPECT_FALSE(nastiness.leapSmear);
  EXPECT_TRUE(nastiness.any());
  EXPECT_TRUE(isNasty(value));
  EXPECT_EQ(
      "nonexistent: true, ambiguous: true, leap smear: false",
      nastiness.toString());

  EXPECT_FALSE(isNasty(LocalDatetime::attach(datetime(2021, 6, 1), table_)));
  EXPECT_FALSE(classify(LocalDatetime(datetime(2016, 12, 31))).any());
}

TEST_F(NastinessTest, getNastyBoundsOffsetChange) {
  auto attach = [&](const Datetime& local) {
    return LocalDatetime::attach(local, table_);
  };
  auto lo = attach(datetime(2021, 1, 1));
  auto hi = attach(datetime(2021, 6, 30));

  auto bounds = getNastyBounds(lo, attach(datetime(2021, 4, 1)), hi);
  ASSERT_TRUE(bounds.has_value());
  EXPECT_EQ(lo, bounds->first);
  EXPECT_EQ(datetime(2021, 4, 1), bounds->second.local());

  bounds = getNastyBounds(lo, attach(datetime(2021, 2, 1)), hi);
  ASSERT_TRUE(bounds.has_value());
  EXPECT_EQ(datetime(2021, 2, 1), bounds->first.local());
  EXPECT_EQ(hi, bounds->second);

  // Same offset at all three points, and no leap second in between.
  EXPECT_FALSE(getNastyBounds(
                   lo,
                   attach(datetime(2021, 2, 1)),
                   attach(datetime(2021, 3, 1)))
                   .has_value());
}

TEST_F(NastinessTest, getNastyBoundsPrefersCanonicalHalf) {
  auto lo = LocalDatetime::attach(datetime(1990, 1, 1), utc_);
  auto hi = LocalDatetime::attach(datetime(2010, 1, 1), utc_);

  // Both halves contain a leap second. The one containing 2000-01-01 wins.
  auto before = LocalDatetime::attach(datetime(1999, 6, 1), utc_);
  auto bounds = getNastyBounds(lo, before, hi);
  ASSERT_TRUE(bounds.has_value());
  EXPECT_EQ(before, bounds->first);
  EXPECT_EQ(hi, bounds->second);

  auto after = LocalDatetime::attach(datetime(2001, 6, 1), utc_);
  bounds = getNastyBounds(lo, after, hi);
  ASSERT_TRUE(bounds.has_value());
  EXPECT_EQ(lo, bounds->first);
  EXPECT_EQ(after, bounds->second);

  auto center = LocalDatetime::attach(datetime(2000, 1, 1), utc_);
  bounds = getNastyBounds(lo, center, hi);
  ASSERT_TRUE(bounds.has_value());
  EXPECT_EQ(center, bounds->first);

  // A leap second too close to an endpoint does not qualify.
  EXPECT_FALSE(getNastyBounds(
                   LocalDatetime::attach(datetime(2016, 12, 31, 12), utc_),
                   LocalDatetime::attach(datetime(2017, 6, 1), utc_),
                   LocalDatetime::attach(datetime(2018, 1, 1), utc_))
                   .has_value());
}

} // namespace
} // namespace facebook::kairos::fuzzer::test
