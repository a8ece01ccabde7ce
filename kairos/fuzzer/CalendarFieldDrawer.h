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

#include <array>
#include <optional>
#include <string_view>

#include "kairos/common/base/Status.h"
#include "kairos/fuzzer/DataSource.h"
#include "kairos/type/Date.h"
#include "kairos/type/Datetime.h"
#include "kairos/type/Time.h"

namespace facebook::kairos::fuzzer {

/// Calendar fields in draw order.
enum class CalendarField : int8_t {
  kYear = 0,
  kMonth,
  kDay,
  kHour,
  kMinute,
  kSecond,
  kMicrosecond,
};

constexpr size_t kNumCalendarFields = 7;

struct CalendarFieldDescriptor {
  CalendarField field;
  std::string_view name;
  int32_t absoluteMin;
  int32_t absoluteMax;
  /// When the value is no longer capped from above, the upper limit is the
  /// length of the already drawn month rather than 'absoluteMax'.
  bool clampToMonthLength;
};

/// All calendar fields, in draw order.
const std::array<CalendarFieldDescriptor, kNumCalendarFields>&
calendarFieldDescriptors();

const CalendarFieldDescriptor& getDescriptor(CalendarField field);

/// Field values of a date, a time or a datetime. Fields the kind does not
/// have are left at zero.
struct CalendarFields {
  std::array<int32_t, kNumCalendarFields> values{};
  int32_t fold{0};

  int32_t& operator[](CalendarField field) {
    return values[static_cast<size_t>(field)];
  }

  int32_t operator[](CalendarField field) const {
    return values[static_cast<size_t>(field)];
  }
};

/// Values to return instead of drawing, per field.
struct ForcedFields {
  std::array<std::optional<int32_t>, kNumCalendarFields> values;
  std::optional<int32_t> fold;

  std::optional<int32_t>& operator[](CalendarField field) {
    return values[static_cast<size_t>(field)];
  }

  const std::optional<int32_t>& operator[](CalendarField field) const {
    return values[static_cast<size_t>(field)];
  }

  /// Forces year through microsecond to those of 'value'. Fold stays free.
  static ForcedFields fromDatetime(const Datetime& value);
};

template <typename T>
struct CalendarTraits;

template <>
struct CalendarTraits<Date> {
  static constexpr CalendarField kFirst = CalendarField::kYear;
  static constexpr CalendarField kLast = CalendarField::kDay;
  static constexpr bool kHasFold = false;

  static CalendarFields toFields(const Date& value);

  static Expected<Date> fromFields(const CalendarFields& fields);
};

template <>
struct CalendarTraits<Time> {
  static constexpr CalendarField kFirst = CalendarField::kHour;
  static constexpr CalendarField kLast = CalendarField::kMicrosecond;
  static constexpr bool kHasFold = true;

  static CalendarFields toFields(const Time& value);

  static Expected<Time> fromFields(const CalendarFields& fields);
};

template <>
struct CalendarTraits<Datetime> {
  static constexpr CalendarField kFirst = CalendarField::kYear;
  static constexpr CalendarField kLast = CalendarField::kMicrosecond;
  static constexpr bool kHasFold = true;

  static CalendarFields toFields(const Datetime& value);

  static Expected<Datetime> fromFields(const CalendarFields& fields);
};

/// Draws fields 'first' through 'last' between the fields of 'min' and
/// 'max'. A field is bounded by 'min' (resp. 'max') only while every field
/// drawn before it equals the corresponding field of 'min' (resp. 'max');
/// otherwise the field's absolute range applies, and day is bounded by the
/// length of the drawn month. Year centers on 2000, other fields on their
/// lower bound. Fold is drawn last, unbiased, when 'withFold' is set.
///
/// With valid bounds the result always forms a valid calendar value. A
/// forced field outside the range allowed by the fields drawn before it
/// fails the range check in DataSource::drawInteger().
CalendarFields drawCappedFields(
    DataSource& data,
    CalendarField first,
    CalendarField last,
    bool withFold,
    const CalendarFields& min,
    const CalendarFields& max,
    const ForcedFields& forced);

/// Draws a value of T in [min, max] field by field. Never retries.
template <typename T>
Expected<T> drawCappedMultipart(
    DataSource& data,
    const T& min,
    const T& max,
    const ForcedFields& forced = {}) {
  using Traits = CalendarTraits<T>;
  auto fields = drawCappedFields(
      data,
      Traits::kFirst,
      Traits::kLast,
      Traits::kHasFold,
      Traits::toFields(min),
      Traits::toFields(max),
      forced);
  return Traits::fromFields(fields);
}

} // namespace facebook::kairos::fuzzer
