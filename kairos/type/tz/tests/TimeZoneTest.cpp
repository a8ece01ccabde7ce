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

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/Calendar.h"
#include "kairos/type/tz/FixedOffsetTimeZone.h"
#include "kairos/type/tz/LocalDatetime.h"
#include "kairos/type/tz/OffsetTableTimeZone.h"
#include "kairos/type/tz/TableTimeZone.h"

namespace facebook::kairos::tz::test {
namespace {

Duration hours(int64_t count) {
  return Duration::fromMicros(count * util::kMicrosPerHour);
}

Datetime datetime(
    int32_t year,
    int32_t month,
    int32_t day,
    int32_t hour = 0,
    int32_t minute = 0,
    int32_t fold = 0) {
  return Datetime::create(year, month, day, hour, minute, 0, 0, fold).value();
}

int64_t utcMicros(int32_t year, int32_t month, int32_t day, int32_t hour) {
  return datetime(year, month, day, hour).toMicros();
}

// UTC-5, with daylight saving time (UTC-4) from 2021-03-10T02:00 to
// 2021-11-03T02:00 local time.
TransitionTable makeTable() {
  const ZoneOffset standard{hours(-5), Duration(), "EST"};
  const ZoneOffset daylight{hours(-4), hours(1), "EDT"};
  return TransitionTable(
      standard,
      {{utcMicros(2021, 3, 10, 7), daylight},
       {utcMicros(2021, 11, 3, 6), standard}});
}

TEST(TimeZoneTest, fixedOffset) {
  const auto& utc = FixedOffsetTimeZone::utc();
  EXPECT_EQ(TimeZoneKind::kFoldAware, utc->kind());
  EXPECT_EQ("UTC", utc->toString());
  EXPECT_EQ(Duration(), utc->utcOffset(Datetime()));

  FixedOffsetTimeZone india(Duration::fromMicros(
      5 * util::kMicrosPerHour + 30 * util::kMicrosPerMinute));
  EXPECT_EQ("UTC+05:30", india.toString());
  EXPECT_EQ(Duration(), india.dstOffset(Datetime()));
  EXPECT_EQ(datetime(1970, 1, 1, 5, 30), india.fromUtc(Datetime()).value());
  EXPECT_TRUE(india.fromUtc(Datetime::max()).error().isOverflow());

  FixedOffsetTimeZone west(hours(-8), "PST");
  EXPECT_EQ("PST", west.name(Datetime()));
  EXPECT_TRUE(west.fromUtc(Datetime::min()).error().isOverflow());

  EXPECT_THROW(FixedOffsetTimeZone(hours(24)), KairosUserError);
  EXPECT_EQ("-08:00", formatOffset(hours(-8)));
  EXPECT_EQ("+00:00:30", formatOffset(Duration::create(0, 30).value()));
  EXPECT_EQ("OFFSET_TABLE", toString(TimeZoneKind::kOffsetTable));
}

TEST(TimeZoneTest, localDatetime) {
  auto naive = LocalDatetime(datetime(2000, 1, 1));
  EXPECT_TRUE(naive.isNaive());
  EXPECT_EQ("2000-01-01T00:00:00", naive.toString());

  auto zone = std::make_shared<FixedOffsetTimeZone>(hours(5));
  auto aware = LocalDatetime::attach(datetime(2000, 1, 1, 5), zone);
  EXPECT_FALSE(aware.isNaive());
  EXPECT_EQ(hours(5), aware.utcOffset());
  EXPECT_EQ(datetime(2000, 1, 1).toMicros(), aware.utcMicros());
  EXPECT_EQ(datetime(2000, 1, 1), aware.toUtc().value());
  EXPECT_EQ("2000-01-01T05:00:00+05:00[UTC+05:00]", aware.toString());
  EXPECT_NE(naive, aware);
  EXPECT_EQ(aware, LocalDatetime::attach(datetime(2000, 1, 1, 5), zone));

  // The instant lies before 0001-01-01T00:00 UTC.
  auto early = LocalDatetime::attach(Datetime::min(), zone);
  EXPECT_TRUE(early.toUtc().error().isOverflow());

  LocalTime time(Time::create(12, 0, 0, 0).value(), zone);
  EXPECT_EQ("12:00:00[UTC+05:00]", time.toString());
  EXPECT_EQ(
      "12:00:00", LocalTime(Time::create(12, 0, 0, 0).value()).toString());
}

TEST(TransitionTableTest, offsetAtUtc) {
  auto table = makeTable();
  auto abbreviationAt = [&](int64_t utc) {
    return table.offsetAtUtc(utc).abbreviation;
  };
  EXPECT_EQ("EST", abbreviationAt(utcMicros(2021, 1, 1, 0)));
  EXPECT_EQ("EST", abbreviationAt(utcMicros(2021, 3, 10, 7) - 1));
  EXPECT_EQ("EDT", abbreviationAt(utcMicros(2021, 3, 10, 7)));
  EXPECT_EQ("EDT", abbreviationAt(utcMicros(2021, 11, 3, 6) - 1));
  EXPECT_EQ("EST", abbreviationAt(utcMicros(2021, 11, 3, 6)));
  EXPECT_TRUE(table.offsetAtUtc(utcMicros(2021, 6, 1, 0)).isDst());
}

TEST(TransitionTableTest, localInfo) {
  auto table = makeTable();
  auto local = [](int32_t month, int32_t day, int32_t hour, int32_t minute) {
    return datetime(2021, month, day, hour, minute).toMicros();
  };

  auto info = table.localInfo(local(1, 1, 0, 0));
  EXPECT_EQ(LocalInfo::Result::kUnique, info.result);
  EXPECT_EQ("EST", info.first->abbreviation);

  info = table.localInfo(local(3, 10, 2, 30));
  EXPECT_EQ(LocalInfo::Result::kNonexistent, info.result);
  EXPECT_EQ("EST", info.first->abbreviation);
  EXPECT_EQ("EDT", info.second->abbreviation);

  info = table.localInfo(local(3, 10, 3, 0));
  EXPECT_EQ(LocalInfo::Result::kUnique, info.result);
  EXPECT_EQ("EDT", info.first->abbreviation);

  info = table.localInfo(local(11, 3, 1, 30));
  EXPECT_EQ(LocalInfo::Result::kAmbiguous, info.result);
  EXPECT_EQ("EDT", info.first->abbreviation);
  EXPECT_EQ("EST", info.second->abbreviation);

  info = table.localInfo(local(11, 3, 2, 0));
  EXPECT_EQ(LocalInfo::Result::kUnique, info.result);
  EXPECT_EQ("EST", info.first->abbreviation);

  info = table.localInfo(local(12, 31, 0, 0));
  EXPECT_EQ(LocalInfo::Result::kUnique, info.result);
  EXPECT_EQ("EST", info.first->abbreviation);
}

TEST(TransitionTableTest, invalidTransitions) {
  const ZoneOffset standard{hours(-5), Duration(), "EST"};
  const ZoneOffset daylight{hours(-4), hours(1), "EDT"};
  EXPECT_THROW(
      TransitionTable(
          standard,
          {{utcMicros(2021, 11, 3, 6), standard},
           {utcMicros(2021, 3, 10, 7), daylight}}),
      KairosUserError);
  EXPECT_THROW(
      TransitionTable(
          standard,
          {{utcMicros(2021, 3, 10, 7), daylight},
           {utcMicros(2021, 3, 10, 7), standard}}),
      KairosUserError);
}

TEST(TableTimeZoneTest, foldSelectsOffset) {
  TableTimeZone zone("Test/Eastern", makeTable());
  EXPECT_EQ(TimeZoneKind::kFoldAware, zone.kind());
  EXPECT_EQ("Test/Eastern", zone.toString());

  // Repeated wall time: fold 0 is the first occurrence.
  EXPECT_EQ(hours(-4), zone.utcOffset(datetime(2021, 11, 3, 1, 30, 0)));
  EXPECT_EQ(hours(-5), zone.utcOffset(datetime(2021, 11, 3, 1, 30, 1)));
  EXPECT_EQ("EDT", zone.name(datetime(2021, 11, 3, 1, 30, 0)));
  EXPECT_EQ(Duration(), zone.dstOffset(datetime(2021, 11, 3, 1, 30, 1)));

  // Skipped wall time: fold 0 uses the offset before the transition.
  EXPECT_EQ(hours(-5), zone.utcOffset(datetime(2021, 3, 10, 2, 30, 0)));
  EXPECT_EQ(hours(-4), zone.utcOffset(datetime(2021, 3, 10, 2, 30, 1)));

  EXPECT_EQ(hours(-5), zone.utcOffset(datetime(2021, 1, 1, 12, 0, 1)));
}

TEST(TableTimeZoneTest, fromUtc) {
  TableTimeZone zone("Test/Eastern", makeTable());

  auto first = zone.fromUtc(datetime(2021, 11, 3, 5, 30)).value();
  EXPECT_EQ(datetime(2021, 11, 3, 1, 30), first);
  EXPECT_EQ(0, first.fold());

  auto second = zone.fromUtc(datetime(2021, 11, 3, 6, 30)).value();
  EXPECT_EQ(datetime(2021, 11, 3, 1, 30), second);
  EXPECT_EQ(1, second.fold());

  EXPECT_EQ(
      datetime(2021, 3, 10, 3, 0),
      zone.fromUtc(datetime(2021, 3, 10, 7)).value());
  EXPECT_TRUE(zone.fromUtc(Datetime::min()).error().isOverflow());
}

TEST(OffsetTableTimeZoneTest, localize) {
  auto zone =
      std::make_shared<OffsetTableTimeZone>("Test/EasternTable", makeTable());
  EXPECT_EQ(TimeZoneKind::kOffsetTable, zone->kind());

  auto summer = zone->localize(datetime(2021, 6, 1), false).value();
  EXPECT_EQ(hours(-4), summer.utcOffset());
  EXPECT_EQ(zone, summer.zone());

  // Repeated wall time: the DST flag picks the entry.
  auto ambiguous = datetime(2021, 11, 3, 1, 30);
  EXPECT_EQ(hours(-4), zone->localize(ambiguous, true)->utcOffset());
  EXPECT_EQ(hours(-5), zone->localize(ambiguous, false)->utcOffset());

  // Skipped wall time: same rule, the result does not round trip.
  auto skipped = datetime(2021, 3, 10, 2, 30);
  auto localized = zone->localize(skipped, false).value();
  EXPECT_EQ(hours(-5), localized.utcOffset());
  EXPECT_EQ(
      datetime(2021, 3, 10, 3, 30),
      zone->fromUtc(localized.toUtc().value()).value());
  EXPECT_EQ(hours(-4), zone->localize(skipped, true)->utcOffset());

  EXPECT_EQ(hours(-4), zone->utcOffset(ambiguous));
  EXPECT_EQ(hours(-5), zone->utcOffset(ambiguous.withFold(1)));
  EXPECT_EQ("EST", zone->name(ambiguous.withFold(1)));
  EXPECT_EQ(hours(1), zone->dstOffset(ambiguous));
}

TEST(OffsetTableTimeZoneTest, localizeOverflow) {
  const ZoneOffset offset{hours(5), Duration(), "+05"};
  auto zone = std::make_shared<OffsetTableTimeZone>(
      "Test/Plus5", TransitionTable(offset, {}));

  auto result = zone->localize(Datetime::min(), true);
  ASSERT_TRUE(result.hasError());
  EXPECT_TRUE(result.error().isOverflow());
  EXPECT_TRUE(zone->localize(datetime(1, 1, 1, 5), true).hasValue());
  EXPECT_EQ(datetime(1970, 1, 1, 5), zone->fromUtc(Datetime()).value());
}

} // namespace
} // namespace facebook::kairos::tz::test
