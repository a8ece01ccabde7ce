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

#include "kairos/fuzzer/CalendarFieldDrawer.h"

#include "kairos/common/base/Exceptions.h"
#include "kairos/type/Calendar.h"

namespace facebook::kairos::fuzzer {
namespace {

constexpr int32_t kYearCenter = 2000;

const std::array<CalendarFieldDescriptor, kNumCalendarFields> kDescriptors{{
    {CalendarField::kYear, "year", util::kMinYear, util::kMaxYear, false},
    {CalendarField::kMonth, "month", 1, util::kMonthsPerYear, false},
    {CalendarField::kDay, "day", 1, 31, true},
    {CalendarField::kHour, "hour", 0, util::kHoursPerDay - 1, false},
    {CalendarField::kMinute, "minute", 0, util::kMinsPerHour - 1, false},
    {CalendarField::kSecond, "second", 0, util::kSecsPerMinute - 1, false},
    {CalendarField::kMicrosecond,
     "microsecond",
     0,
     static_cast<int32_t>(util::kMicrosPerSec - 1),
     false},
}};

} // namespace

const std::array<CalendarFieldDescriptor, kNumCalendarFields>&
calendarFieldDescriptors() {
  return kDescriptors;
}

const CalendarFieldDescriptor& getDescriptor(CalendarField field) {
  return kDescriptors[static_cast<size_t>(field)];
}

// static
ForcedFields ForcedFields::fromDatetime(const Datetime& value) {
  ForcedFields forced;
  const auto fields = CalendarTraits<Datetime>::toFields(value);
  for (const auto& descriptor : kDescriptors) {
    forced[descriptor.field] = fields[descriptor.field];
  }
  return forced;
}

// static
CalendarFields CalendarTraits<Date>::toFields(const Date& value) {
  CalendarFields fields;
  fields[CalendarField::kYear] = value.year();
  fields[CalendarField::kMonth] = value.month();
  fields[CalendarField::kDay] = value.day();
  return fields;
}

// static
Expected<Date> CalendarTraits<Date>::fromFields(const CalendarFields& fields) {
  return Date::create(
      fields[CalendarField::kYear],
      fields[CalendarField::kMonth],
      fields[CalendarField::kDay]);
}

// static
CalendarFields CalendarTraits<Time>::toFields(const Time& value) {
  CalendarFields fields;
  fields[CalendarField::kHour] = value.hour();
  fields[CalendarField::kMinute] = value.minute();
  fields[CalendarField::kSecond] = value.second();
  fields[CalendarField::kMicrosecond] = value.microsecond();
  fields.fold = value.fold();
  return fields;
}

// static
Expected<Time> CalendarTraits<Time>::fromFields(const CalendarFields& fields) {
  return Time::create(
      fields[CalendarField::kHour],
      fields[CalendarField::kMinute],
      fields[CalendarField::kSecond],
      fields[CalendarField::kMicrosecond],
      fields.fold);
}

// static
CalendarFields CalendarTraits<Datetime>::toFields(const Datetime& value) {
  auto fields = CalendarTraits<Date>::toFields(value.date());
  const auto time = CalendarTraits<Time>::toFields(value.time());
  for (auto field = static_cast<size_t>(CalendarField::kHour);
       field < kNumCalendarFields;
       ++field) {
    fields.values[field] = time.values[field];
  }
  fields.fold = time.fold;
  return fields;
}

// static
Expected<Datetime> CalendarTraits<Datetime>::fromFields(
    const CalendarFields& fields) {
  return Datetime::create(
      fields[CalendarField::kYear],
      fields[CalendarField::kMonth],
      fields[CalendarField::kDay],
      fields[CalendarField::kHour],
      fields[CalendarField::kMinute],
      fields[CalendarField::kSecond],
      fields[CalendarField::kMicrosecond],
      fields.fold);
}

CalendarFields drawCappedFields(
    DataSource& data,
    CalendarField first,
    CalendarField last,
    bool withFold,
    const CalendarFields& min,
    const CalendarFields& max,
    const ForcedFields& forced) {
  KAIROS_CHECK_LE(static_cast<int>(first), static_cast<int>(last));

  CalendarFields result;
  bool capLow = true;
  bool capHigh = true;
  for (auto i = static_cast<size_t>(first); i <= static_cast<size_t>(last);
       ++i) {
    const auto& descriptor = kDescriptors[i];
    const auto field = descriptor.field;

    const int32_t low = capLow ? min[field] : descriptor.absoluteMin;
    int32_t high;
    if (capHigh) {
      high = max[field];
    } else if (descriptor.clampToMonthLength) {
      high = util::getMaxDayOfMonth(
          result[CalendarField::kYear], result[CalendarField::kMonth]);
    } else {
      high = descriptor.absoluteMax;
    }
    KAIROS_CHECK_LE(low, high, "Empty range for {}", descriptor.name);

    const int32_t center = field == CalendarField::kYear ? kYearCenter : low;
    const auto value = static_cast<int32_t>(
        data.drawInteger(low, high, center, forced[field]));
    result[field] = value;

    capLow = capLow && value == low;
    capHigh = capHigh && value == high;
  }

  if (withFold) {
    result.fold = static_cast<int32_t>(data.drawInteger(0, 1, 0, forced.fold));
  }
  return result;
}

} // namespace facebook::kairos::fuzzer
