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
#include "kairos/type/Date.h"
#include "kairos/type/Datetime.h"
#include "kairos/type/Duration.h"
#include "kairos/type/Time.h"

namespace facebook::kairos::test {
namespace {

Datetime datetime(
    int32_t year,
    int32_t month,
    int32_t day,
    int32_t hour = 0,
    int32_t minute = 0,
    int32_t second = 0,
    int32_t micros = 0,
    int32_t fold = 0) {
  return Datetime::create(year, month, day, hour, minute, second, micros, fold)
      .value();
}

TEST(DateTest, create) {
  auto date = Date::create(2021, 1, 31);
  ASSERT_TRUE(date.hasValue());
  EXPECT_EQ(2021, date->year());
  EXPECT_EQ(1, date->month());
  EXPECT_EQ(31, date->day());
  EXPECT_EQ("2021-01-31", date->toString());
  EXPECT_EQ("0001-01-01", Date::min().toString());
  EXPECT_EQ("9999-12-31", fmt::format("{}", Date::max()));

  auto invalid = Date::create(2021, 2, 30);
  ASSERT_TRUE(invalid.hasError());
  EXPECT_TRUE(invalid.error().isUserError());
  EXPECT_TRUE(Date::create(10'000, 1, 1).hasError());
}

TEST(DateTest, ordering) {
  EXPECT_LT(
      Date::create(2020, 12, 31).value(), Date::create(2021, 1, 1).value());
  EXPECT_LT(
      Date::create(2021, 1, 1).value(), Date::create(2021, 1, 2).value());
  EXPECT_EQ(Date(), Date::create(1970, 1, 1).value());
  EXPECT_LE(Date::min(), Date());
  EXPECT_GT(Date::max(), Date());
}

TEST(DateTest, daysSinceEpoch) {
  EXPECT_EQ(0, Date().daysSinceEpoch());
  EXPECT_EQ(util::kMinDaysSinceEpoch, Date::min().daysSinceEpoch());
  EXPECT_EQ(util::kMaxDaysSinceEpoch, Date::max().daysSinceEpoch());
  EXPECT_EQ(
      Date::create(2016, 12, 31).value(),
      Date::fromDaysSinceEpoch(17'166).value());
  EXPECT_TRUE(Date::fromDaysSinceEpoch(util::kMaxDaysSinceEpoch + 1)
                  .error()
                  .isOverflow());
}

TEST(TimeTest, create) {
  auto time = Time::create(23, 59, 59, 999'999);
  ASSERT_TRUE(time.hasValue());
  EXPECT_EQ(Time::max(), time.value());
  EXPECT_EQ("23:59:59.999999", time->toString());
  EXPECT_EQ("00:00:00", Time::min().toString());
  EXPECT_EQ("01:02:03.000004", Time::create(1, 2, 3, 4)->toString());

  EXPECT_TRUE(Time::create(24, 0, 0, 0).error().isUserError());
  EXPECT_TRUE(Time::create(0, 0, 0, 0, 2).error().isUserError());
  EXPECT_TRUE(Time::fromMicros(util::kMicrosPerDay).hasError());
  EXPECT_EQ(
      Time::create(0, 0, 1, 5).value(),
      Time::fromMicros(util::kMicrosPerSec + 5).value());
}

TEST(TimeTest, foldIsIgnoredByComparisons) {
  auto time = Time::create(1, 30, 0, 0).value();
  auto folded = time.withFold(1);
  EXPECT_EQ(1, folded.fold());
  EXPECT_EQ(0, time.fold());
  EXPECT_EQ(time, folded);
  EXPECT_FALSE(time < folded);
  EXPECT_FALSE(folded < time);
  EXPECT_THROW(time.withFold(2), KairosRuntimeError);
}

TEST(DatetimeTest, create) {
  auto value = datetime(2000, 6, 30, 23, 59, 59);
  EXPECT_EQ("2000-06-30T23:59:59", value.toString());
  EXPECT_EQ(2000, value.year());
  EXPECT_EQ(6, value.month());
  EXPECT_EQ(30, value.day());
  EXPECT_EQ(23, value.hour());
  EXPECT_EQ(59, value.minute());
  EXPECT_EQ(59, value.second());
  EXPECT_EQ(0, value.microsecond());

  EXPECT_TRUE(Datetime::create(2021, 2, 29).error().isUserError());
  EXPECT_TRUE(Datetime::create(2021, 2, 28, 24).error().isUserError());
  EXPECT_EQ("0001-01-01T00:00:00", Datetime::min().toString());
  EXPECT_EQ("9999-12-31T23:59:59.999999", Datetime::max().toString());
}

TEST(DatetimeTest, micros) {
  EXPECT_EQ(0, datetime(1970, 1, 1).toMicros());
  EXPECT_EQ(-1, datetime(1969, 12, 31, 23, 59, 59, 999'999).toMicros());
  EXPECT_EQ(util::kMinMicrosSinceEpoch, Datetime::min().toMicros());
  EXPECT_EQ(util::kMaxMicrosSinceEpoch, Datetime::max().toMicros());

  EXPECT_EQ(
      datetime(1969, 12, 31, 23, 59, 59, 999'999),
      Datetime::fromMicros(-1).value());
  EXPECT_EQ(
      Datetime::max(),
      Datetime::fromMicros(Datetime::max().toMicros()).value());
  EXPECT_TRUE(Datetime::fromMicros(util::kMaxMicrosSinceEpoch + 1)
                  .error()
                  .isOverflow());
  EXPECT_TRUE(Datetime::fromMicros(util::kMinMicrosSinceEpoch - 1)
                  .error()
                  .isOverflow());
  EXPECT_EQ(1, Datetime::fromMicros(0, 1)->fold());
}

TEST(DatetimeTest, plus) {
  auto hour = Duration::fromMicros(util::kMicrosPerHour);
  EXPECT_EQ(
      datetime(2000, 1, 1, 0, 30),
      datetime(1999, 12, 31, 23, 30).plus(hour).value());
  EXPECT_EQ(
      datetime(1999, 12, 31, 23, 30),
      datetime(2000, 1, 1, 0, 30)
          .plus(Duration::fromMicros(-util::kMicrosPerHour))
          .value());

  EXPECT_TRUE(Datetime::max().plus(hour).error().isOverflow());
  EXPECT_TRUE(Datetime::min()
                  .plus(Duration::fromMicros(-1))
                  .error()
                  .isOverflow());
  EXPECT_TRUE(Datetime().plus(Duration::max()).error().isOverflow());
  EXPECT_TRUE(Datetime().plus(Duration::min()).error().isOverflow());
}

TEST(DatetimeTest, ordering) {
  EXPECT_LT(datetime(2000, 1, 1), datetime(2000, 1, 1, 0, 0, 0, 1));
  EXPECT_LT(datetime(1999, 12, 31, 23, 59, 59), datetime(2000, 1, 1));
  EXPECT_EQ(datetime(2000, 1, 1, 1), datetime(2000, 1, 1, 1, 0, 0, 0, 1));
  EXPECT_EQ(1, datetime(2000, 1, 1).withFold(1).fold());
}

TEST(DurationTest, normalization) {
  auto duration = Duration::create(0, -1).value();
  EXPECT_EQ(-1, duration.days());
  EXPECT_EQ(86'399, duration.seconds());
  EXPECT_EQ(0, duration.microseconds());

  duration = Duration::create(1, 86'400, 1'000'001).value();
  EXPECT_EQ(2, duration.days());
  EXPECT_EQ(1, duration.seconds());
  EXPECT_EQ(1, duration.microseconds());

  EXPECT_EQ(Duration::fromMicros(-1), Duration::create(0, 0, -1).value());
  EXPECT_EQ(-1, Duration::fromMicros(-1).toMicros());
  EXPECT_EQ(
      Duration::max(), Duration::create(999'999'999, 86'399, 999'999).value());
  EXPECT_TRUE(Duration::create(999'999'999, 86'400).error().isOverflow());
  EXPECT_TRUE(Duration::create(-999'999'999, -1).error().isOverflow());
}

TEST(DurationTest, toString) {
  EXPECT_EQ("0:00:00", Duration().toString());
  EXPECT_EQ("1 day, 0:00:00", Duration::create(1).value().toString());
  EXPECT_EQ("-1 day, 0:00:00", Duration::create(-1).value().toString());
  EXPECT_EQ(
      "-1 day, 23:59:59.999999", Duration::fromMicros(-1).toString());
  EXPECT_EQ(
      "2 days, 1:02:03", Duration::create(2, 3'723).value().toString());
  EXPECT_EQ(
      "999999999 days, 23:59:59.999999", fmt::format("{}", Duration::max()));
}

TEST(DurationTest, ordering) {
  EXPECT_LT(Duration::min(), Duration());
  EXPECT_LT(Duration::fromMicros(-1), Duration());
  EXPECT_LT(Duration(), Duration::fromMicros(1));
  EXPECT_LT(Duration::create(0, 86'399).value(), Duration::create(1).value());
  EXPECT_THROW(Duration::max().toMicros(), KairosUserError);
}

} // namespace
} // namespace facebook::kairos::test
