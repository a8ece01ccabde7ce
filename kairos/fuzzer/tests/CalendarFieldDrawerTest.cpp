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

#include <set>

#include <gtest/gtest.h>

#include "kairos/common/base/Exceptions.h"
#include "kairos/fuzzer/CalendarFieldDrawer.h"
#include "kairos/fuzzer/RandomDataSource.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos::fuzzer::test {
namespace {

Datetime datetime(
    int32_t year,
    int32_t month,
    int32_t day,
    int32_t hour = 0,
    int32_t minute = 0,
    int32_t second = 0,
    int32_t micros = 0) {
  return Datetime::create(year, month, day, hour, minute, second, micros)
      .value();
}

Date date(int32_t year, int32_t month, int32_t day) {
  return Date::create(year, month, day).value();
}

TEST(CalendarFieldDrawerTest, descriptors) {
  const auto& descriptors = calendarFieldDescriptors();
  std::vector<std::string_view> names;
  for (const auto& descriptor : descriptors) {
    names.push_back(descriptor.name);
  }
  EXPECT_EQ(
      (std::vector<std::string_view>{
          "year", "month", "day", "hour", "minute", "second", "microsecond"}),
      names);

  EXPECT_EQ(1, getDescriptor(CalendarField::kYear).absoluteMin);
  EXPECT_EQ(9999, getDescriptor(CalendarField::kYear).absoluteMax);
  EXPECT_EQ(31, getDescriptor(CalendarField::kDay).absoluteMax);
  EXPECT_TRUE(getDescriptor(CalendarField::kDay).clampToMonthLength);
  EXPECT_FALSE(getDescriptor(CalendarField::kMonth).clampToMonthLength);
  EXPECT_EQ(999'999, getDescriptor(CalendarField::kMicrosecond).absoluteMax);
}

TEST(CalendarFieldDrawerTest, datetimesStayInBounds) {
  const std::vector<std::pair<Datetime, Datetime>> bounds = {
      {datetime(2021, 1, 31, 23, 59, 59, 999'999), datetime(2021, 3, 1)},
      {datetime(2000, 2, 28, 12), datetime(2000, 3, 1, 12)},
      {datetime(1999, 12, 31, 23, 59, 59), datetime(2000, 1, 1, 0, 0, 1)},
      {Datetime::min(), Datetime::max()},
      {datetime(1, 1, 1), datetime(1, 1, 1, 0, 0, 0, 1)},
  };

  for (const auto& [min, max] : bounds) {
    SCOPED_TRACE(fmt::format("[{}, {}]", min, max));
    for (size_t seed = 0; seed < 200; ++seed) {
      RandomDataSource data(seed);
      auto value = drawCappedMultipart<Datetime>(data, min, max);
      ASSERT_TRUE(value.hasValue()) << value.error();
      EXPECT_LE(min, value.value());
      EXPECT_LE(value.value(), max);
      EXPECT_TRUE(util::isValidDate(
          value->year(), value->month(), value->day()));
    }
  }
}

TEST(CalendarFieldDrawerTest, datesStayInBounds) {
  const auto min = date(2020, 1, 31);
  const auto max = date(2021, 2, 28);
  bool sawLeapDay = false;
  for (size_t seed = 0; seed < 500; ++seed) {
    RandomDataSource data(seed);
    auto value = drawCappedMultipart<Date>(data, min, max);
    ASSERT_TRUE(value.hasValue()) << value.error();
    EXPECT_LE(min, value.value());
    EXPECT_LE(value.value(), max);
    sawLeapDay |= value->month() == 2 && value->day() == 29;
  }
  EXPECT_TRUE(sawLeapDay);
}

TEST(CalendarFieldDrawerTest, dayIsClampedToMonthLength) {
  // Leaving the month of 'min' drops the lower cap on day and bounds it by
  // the length of the month drawn, so January 30 never leads to February 30.
  const auto min = date(2021, 1, 30);
  const auto max = date(2021, 3, 31);

  RandomDataSource data({2, 31});
  auto value = drawCappedMultipart<Date>(data, min, max);
  ASSERT_TRUE(value.hasValue()) << value.error();
  EXPECT_EQ(date(2021, 2, 28), value.value());
  EXPECT_EQ((std::vector<int64_t>{2, 28}), data.choices());

  for (size_t seed = 0; seed < 500; ++seed) {
    RandomDataSource random(seed);
    value = drawCappedMultipart<Date>(random, min, max);
    ASSERT_TRUE(value.hasValue()) << value.error();
    EXPECT_LE(min, value.value());
    EXPECT_LE(value.value(), max);
  }
}

TEST(CalendarFieldDrawerTest, timesStayInBounds) {
  const auto min = Time::create(10, 59, 30, 0).value();
  const auto max = Time::create(11, 0, 30, 0).value();
  std::set<int32_t> folds;
  for (size_t seed = 0; seed < 200; ++seed) {
    RandomDataSource data(seed);
    auto value = drawCappedMultipart<Time>(data, min, max);
    ASSERT_TRUE(value.hasValue()) << value.error();
    EXPECT_LE(min, value.value());
    EXPECT_LE(value.value(), max);
    folds.insert(value->fold());
  }
  EXPECT_EQ((std::set<int32_t>{0, 1}), folds);
}

TEST(CalendarFieldDrawerTest, capping) {
  // Only two values exist between these bounds.
  const auto min = date(2000, 12, 31);
  const auto max = date(2001, 1, 1);
  std::set<std::string> values;
  for (size_t seed = 0; seed < 100; ++seed) {
    RandomDataSource data(seed);
    values.insert(drawCappedMultipart<Date>(data, min, max)->toString());
  }
  EXPECT_EQ((std::set<std::string>{"2000-12-31", "2001-01-01"}), values);
}

TEST(CalendarFieldDrawerTest, equalBounds) {
  RandomDataSource data(1);
  auto day = date(2021, 6, 15);
  EXPECT_EQ(day, drawCappedMultipart<Date>(data, day, day).value());
  EXPECT_TRUE(data.choices().empty());

  // Only the fold is drawn.
  auto value = datetime(2021, 6, 15, 1, 2, 3, 4);
  EXPECT_EQ(value, drawCappedMultipart<Datetime>(data, value, value).value());
  EXPECT_EQ(1, data.choices().size());
}

TEST(CalendarFieldDrawerTest, yearCentersOn2000) {
  int32_t near = 0;
  for (size_t seed = 0; seed < 500; ++seed) {
    RandomDataSource data(seed);
    auto value =
        drawCappedMultipart<Date>(data, Date::min(), Date::max()).value();
    if (value.year() > 1900 && value.year() < 2100) {
      ++near;
    }
  }
  EXPECT_GT(near, 150);
}

TEST(CalendarFieldDrawerTest, forcedFieldsReplay) {
  const auto min = datetime(1990, 1, 1);
  const auto max = datetime(2030, 12, 31, 23, 59, 59, 999'999);
  for (size_t seed = 0; seed < 100; ++seed) {
    RandomDataSource data(seed);
    auto value = drawCappedMultipart<Datetime>(data, min, max).value();

    auto forced = ForcedFields::fromDatetime(value);
    forced.fold = value.fold();
    RandomDataSource replay(seed + 1'000);
    auto replayed =
        drawCappedMultipart<Datetime>(replay, min, max, forced).value();
    EXPECT_EQ(value, replayed);
    EXPECT_EQ(value.fold(), replayed.fold());
    EXPECT_EQ(data.choices(), replay.choices());
  }
}

TEST(CalendarFieldDrawerTest, partiallyForcedFields) {
  ForcedFields forced;
  forced[CalendarField::kMonth] = 2;
  forced[CalendarField::kDay] = 29;
  forced.fold = 1;
  for (size_t seed = 0; seed < 50; ++seed) {
    RandomDataSource data(seed);
    auto value = drawCappedMultipart<Datetime>(
        data, datetime(2000, 1, 1), datetime(2000, 12, 31), forced);
    ASSERT_TRUE(value.hasValue());
    EXPECT_EQ(2, value->month());
    EXPECT_EQ(29, value->day());
    EXPECT_EQ(1, value->fold());
  }

  // February 30 is outside of the capped range for the day.
  forced[CalendarField::kDay] = 30;
  RandomDataSource data(1);
  EXPECT_THROW(
      drawCappedMultipart<Datetime>(
          data, datetime(2000, 1, 1), datetime(2000, 12, 31), forced),
      KairosRuntimeError);
}

} // namespace
} // namespace facebook::kairos::fuzzer::test
