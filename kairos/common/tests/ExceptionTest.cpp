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

#include <fmt/format.h>
#include <folly/Range.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "kairos/common/base/CheckedArithmetic.h"
#include "kairos/common/base/Exceptions.h"

using namespace facebook::kairos;

namespace {

struct Counter {
  mutable int counter = 0;
};

} // namespace

template <>
struct fmt::formatter<Counter> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const Counter& c, FormatContext& ctx) {
    auto x = c.counter++;
    return format_to(ctx.out(), "{}", x);
  }
};

namespace {

template <typename T>
void verifyException(
    std::function<void()> f,
    std::function<void(const T&)> exceptionVerifier) {
  try {
    f();
    FAIL() << "Expected exception of type " << typeid(T).name()
           << ", but no exception was thrown.";
  } catch (const T& e) {
    exceptionVerifier(e);
  } catch (...) {
    FAIL() << "Expected exception of type " << typeid(T).name()
           << ", but instead got an exception of a different type.";
  }
}

void verifyKairosException(
    std::function<void()> f,
    const std::string& messagePrefix) {
  verifyException<KairosException>(f, [&messagePrefix](const auto& e) {
    EXPECT_TRUE(folly::StringPiece{e.what()}.startsWith(messagePrefix))
        << "\nException message prefix mismatch.\n\nExpected prefix: "
        << messagePrefix << "\n\nActual message: " << e.what();
  });
}

std::string boundsContext(void* arg) {
  return fmt::format("drawing between {}", *static_cast<std::string*>(arg));
}

} // namespace

// Ensures that message arguments are not evaluated unless the check fails.
TEST(ExceptionTest, lazyMessageEvaluation) {
  Counter c;

  EXPECT_EQ(0, c.counter);
  KAIROS_CHECK(true, "{}", c);
  EXPECT_EQ(0, c.counter);

  EXPECT_THROW(
      ([&]() { KAIROS_CHECK(false, "{}", c); })(), KairosRuntimeError);
  EXPECT_EQ(1, c.counter);

  EXPECT_THROW(
      ([&]() { KAIROS_USER_CHECK(false, "{}", c); })(), KairosUserError);
  EXPECT_EQ(2, c.counter);

  size_t i = 0;
  KAIROS_CHECK(true, "{}", i++);
  EXPECT_EQ(0, i);
  EXPECT_THROW(
      ([&]() { KAIROS_CHECK(false, "{}", i++); })(), KairosRuntimeError);
  EXPECT_EQ(1, i);
}

TEST(ExceptionTest, runtimeCheckMessage) {
  verifyKairosException(
      []() { KAIROS_CHECK(4 > 5, "Test message 1"); },
      "Exception: KairosRuntimeError\nError Source: RUNTIME\n"
      "Error Code: INVALID_STATE\nReason: Test message 1\n"
      "Expression: 4 > 5\nFunction: operator()\nFile: ");
}

TEST(ExceptionTest, unreachableMessage) {
  verifyKairosException(
      []() { KAIROS_UNREACHABLE("Test message 3"); },
      "Exception: KairosRuntimeError\nError Source: RUNTIME\n"
      "Error Code: UNREACHABLE_CODE\nReason: Test message 3\n"
      "Function: operator()\nFile: ");
}

TEST(ExceptionTest, userCheckComparisons) {
  verifyKairosException(
      []() { KAIROS_USER_CHECK_LE(5, 4, "min_value={} max_value={}", 5, 4); },
      "Exception: KairosUserError\nError Source: USER\n"
      "Error Code: INVALID_ARGUMENT\n"
      "Reason: (5 vs. 4) min_value=5 max_value=4\n"
      "Expression: 5 <= 4\nFunction: operator()\nFile: ");

  verifyKairosException(
      []() { KAIROS_CHECK_EQ(27, 26); },
      "Exception: KairosRuntimeError\nError Source: RUNTIME\n"
      "Error Code: INVALID_STATE\nReason: (27 vs. 26)\n"
      "Expression: 27 == 26\nFunction: operator()\nFile: ");

  int* nullValue = nullptr;
  EXPECT_THROW(KAIROS_USER_CHECK_NOT_NULL(nullValue), KairosUserError);
  KAIROS_USER_CHECK_NULL(nullValue);
  KAIROS_CHECK_LT(1, 2);
  KAIROS_CHECK_GE(2, 2);
}

TEST(ExceptionTest, errorAccessors) {
  verifyException<KairosUserError>(
      []() { KAIROS_USER_FAIL("timezones must not be null"); },
      [](const KairosUserError& e) {
        EXPECT_TRUE(e.isUserError());
        EXPECT_EQ("timezones must not be null", e.message());
        EXPECT_EQ(error_code::kInvalidArgument.c_str(), e.errorCode());
        EXPECT_EQ("KairosUserError", e.exceptionName());
        EXPECT_EQ("", e.failingExpression());
      });

  verifyException<KairosRuntimeError>(
      []() { KAIROS_FAIL("bad state {}", 7); },
      [](const KairosRuntimeError& e) {
        EXPECT_FALSE(e.isUserError());
        EXPECT_EQ("bad state 7", e.message());
        EXPECT_EQ(error_source::kErrorSourceRuntime.c_str(), e.errorSource());
      });
}

TEST(ExceptionTest, context) {
  std::string bounds = "2000-01-01 and 2001-01-01";
  {
    ExceptionContextSetter setter({boundsContext, &bounds});
    verifyException<KairosRuntimeError>(
        []() { KAIROS_CHECK(false); },
        [](const KairosRuntimeError& e) {
          EXPECT_EQ(
              "drawing between 2000-01-01 and 2001-01-01", e.context());
          EXPECT_THAT(
              e.what(),
              testing::HasSubstr(
                  "Context: drawing between 2000-01-01 and 2001-01-01\n"));
        });
  }

  // The previous (empty) context is restored when the setter goes away.
  verifyException<KairosRuntimeError>(
      []() { KAIROS_CHECK(false); },
      [](const KairosRuntimeError& e) { EXPECT_EQ("", e.context()); });
}

TEST(ExceptionTest, checkedArithmetic) {
  EXPECT_EQ(5, checkedPlus<int64_t>(2, 3));
  EXPECT_EQ(-1, checkedMinus<int64_t>(2, 3));
  EXPECT_EQ(86'400'000'000, checkedMultiply<int64_t>(86'400, 1'000'000));
  EXPECT_EQ(-3, checkedNegate<int32_t>(3));

  verifyException<KairosUserError>(
      []() {
        checkedMultiply<int64_t>(std::numeric_limits<int64_t>::max(), 2);
      },
      [](const KairosUserError& e) {
        EXPECT_EQ(error_code::kArithmeticError.c_str(), e.errorCode());
      });
  EXPECT_THROW(
      checkedNegate<int32_t>(std::numeric_limits<int32_t>::min()),
      KairosUserError);

  EXPECT_FALSE(
      tryPlus<int64_t>(std::numeric_limits<int64_t>::max(), 1).has_value());
  EXPECT_EQ(7, tryMinus<int64_t>(10, 3).value());
}
