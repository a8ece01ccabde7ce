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
#include <sstream>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <glog/logging.h>

#include <folly/Likely.h>
#include <folly/Preprocessor.h>
#include "kairos/common/base/KairosException.h"

namespace facebook {
namespace kairos {
namespace detail {

struct KairosCheckFailArgs {
  const char* file;
  size_t line;
  const char* function;
  const char* expression;
  const char* errorSource;
  const char* errorCode;
};

struct CompileTimeEmptyString {
  CompileTimeEmptyString() = default;
  constexpr operator const char*() const {
    return "";
  }
  constexpr operator std::string_view() const {
    return {};
  }
  operator std::string() const {
    return {};
  }
};

// kairosCheckFail is defined as a separate helper function rather than
// a macro or inline `throw` expression to allow the compiler *not* to
// inline it when it is large. Having an out-of-line error path helps
// otherwise-small functions that call error-checking macros stay
// small and thus stay eligible for inlining.
template <typename Exception, typename StringType>
[[noreturn]] void kairosCheckFail(
    const KairosCheckFailArgs& args,
    StringType s) {
  static_assert(
      !std::is_same_v<StringType, std::string>,
      "BUG: we should not pass std::string by value to kairosCheckFail");
  LOG(ERROR) << "Line: " << args.file << ":" << args.line
             << ", Function:" << args.function
             << ", Expression: " << args.expression << " " << s
             << ", Source: " << args.errorSource
             << ", ErrorCode: " << args.errorCode;

  throw Exception(
      args.file,
      args.line,
      args.function,
      args.expression,
      s,
      args.errorSource,
      args.errorCode);
}

// KairosCheckFailStringType helps us pass by reference to
// kairosCheckFail exactly when the string type is std::string.
template <typename T>
struct KairosCheckFailStringType;

template <>
struct KairosCheckFailStringType<CompileTimeEmptyString> {
  using type = CompileTimeEmptyString;
};

template <>
struct KairosCheckFailStringType<const char*> {
  using type = const char*;
};

template <>
struct KairosCheckFailStringType<std::string> {
  using type = const std::string&;
};

// Declare explicit instantiations of kairosCheckFail for the given
// exceptionType. Just like normal function declarations (prototypes),
// this allows the compiler to assume that they are defined elsewhere
// and simply insert a function call for the linker to fix up, rather
// than emitting a definition of these templates into every
// translation unit they are used in.
#define KAIROS_DECLARE_CHECK_FAIL_TEMPLATES(exception_type)           \
  namespace detail {                                                  \
  extern template void                                                \
  kairosCheckFail<exception_type, CompileTimeEmptyString>(            \
      const KairosCheckFailArgs& args, CompileTimeEmptyString);       \
  extern template void kairosCheckFail<exception_type, const char*>(  \
      const KairosCheckFailArgs& args, const char*);                  \
  extern template void                                                \
  kairosCheckFail<exception_type, const std::string&>(                \
      const KairosCheckFailArgs& args, const std::string&);           \
  } // namespace detail

// Definitions corresponding to KAIROS_DECLARE_CHECK_FAIL_TEMPLATES. Should
// only be used in Exceptions.cpp.
#define KAIROS_DEFINE_CHECK_FAIL_TEMPLATES(exception_type)               \
  template void kairosCheckFail<exception_type, CompileTimeEmptyString>( \
      const KairosCheckFailArgs& args, CompileTimeEmptyString);          \
  template void kairosCheckFail<exception_type, const char*>(            \
      const KairosCheckFailArgs& args, const char*);                     \
  template void kairosCheckFail<exception_type, const std::string&>(     \
      const KairosCheckFailArgs& args, const std::string&);

// When there is no message passed, we can statically detect this case
// and avoid passing even a single unnecessary argument pointer,
// minimizing size and thus maximizing eligibility for inlining.
inline CompileTimeEmptyString errorMessage() {
  return {};
}

inline const char* errorMessage(const char* s) {
  return s;
}

template <typename... Args>
std::string errorMessage(fmt::string_view fmt, const Args&... args) {
  return fmt::vformat(fmt, fmt::make_format_args(args...));
}

} // namespace detail

#define _KAIROS_THROW_IMPL(exception, expr_str, errorSource, errorCode, ...) \
  {                                                                          \
    /* GCC 9.2.1 doesn't accept this code with constexpr. */                 \
    static const ::facebook::kairos::detail::KairosCheckFailArgs             \
        kairosCheckFailArgs = {                                              \
            __FILE__,                                                        \
            __LINE__,                                                        \
            __FUNCTION__,                                                    \
            expr_str,                                                        \
            errorSource,                                                     \
            errorCode};                                                      \
    auto message = ::facebook::kairos::detail::errorMessage(__VA_ARGS__);    \
    ::facebook::kairos::detail::kairosCheckFail<                             \
        exception,                                                           \
        typename ::facebook::kairos::detail::KairosCheckFailStringType<      \
            decltype(message)>::type>(kairosCheckFailArgs, message);         \
  }

#define _KAIROS_CHECK_AND_THROW_IMPL(                              \
    expr, expr_str, exception, errorSource, errorCode, ...)        \
  if (FOLLY_UNLIKELY(!(expr))) {                                   \
    _KAIROS_THROW_IMPL(                                            \
        exception, expr_str, errorSource, errorCode, __VA_ARGS__); \
  }

#define _KAIROS_THROW(exception, ...) \
  _KAIROS_THROW_IMPL(exception, "", ##__VA_ARGS__)

KAIROS_DECLARE_CHECK_FAIL_TEMPLATES(::facebook::kairos::KairosRuntimeError);

#define _KAIROS_CHECK_IMPL(expr, expr_str, ...)                      \
  _KAIROS_CHECK_AND_THROW_IMPL(                                      \
      expr,                                                          \
      expr_str,                                                      \
      ::facebook::kairos::KairosRuntimeError,                        \
      ::facebook::kairos::error_source::kErrorSourceRuntime.c_str(), \
      ::facebook::kairos::error_code::kInvalidState.c_str(),         \
      ##__VA_ARGS__)

// If the caller passes a custom message (4 *or more* arguments), we
// have to construct a format string from ours ("({} vs. {})") plus
// theirs by adding a space and shuffling arguments. If they don't (exactly 3
// arguments), we can just pass our own format string and arguments straight
// through.

#define _KAIROS_CHECK_OP_WITH_USER_FMT_HELPER(  \
    implmacro, expr1, expr2, op, user_fmt, ...) \
  implmacro(                                    \
      (expr1)op(expr2),                         \
      #expr1 " " #op " " #expr2,                \
      "({} vs. {}) " user_fmt,                  \
      expr1,                                    \
      expr2,                                    \
      ##__VA_ARGS__)

#define _KAIROS_CHECK_OP_HELPER(implmacro, expr1, expr2, op, ...) \
  if constexpr (FOLLY_PP_DETAIL_NARGS(__VA_ARGS__) > 0) {         \
    _KAIROS_CHECK_OP_WITH_USER_FMT_HELPER(                        \
        implmacro, expr1, expr2, op, __VA_ARGS__);                \
  } else {                                                        \
    implmacro(                                                    \
        (expr1)op(expr2),                                         \
        #expr1 " " #op " " #expr2,                                \
        "({} vs. {})",                                            \
        expr1,                                                    \
        expr2);                                                   \
  }

#define _KAIROS_CHECK_OP(expr1, expr2, op, ...) \
  _KAIROS_CHECK_OP_HELPER(_KAIROS_CHECK_IMPL, expr1, expr2, op, ##__VA_ARGS__)

#define _KAIROS_USER_CHECK_IMPL(expr, expr_str, ...)              \
  _KAIROS_CHECK_AND_THROW_IMPL(                                   \
      expr,                                                       \
      expr_str,                                                   \
      ::facebook::kairos::KairosUserError,                        \
      ::facebook::kairos::error_source::kErrorSourceUser.c_str(), \
      ::facebook::kairos::error_code::kInvalidArgument.c_str(),   \
      ##__VA_ARGS__)

#define _KAIROS_USER_CHECK_OP(expr1, expr2, op, ...) \
  _KAIROS_CHECK_OP_HELPER(                           \
      _KAIROS_USER_CHECK_IMPL, expr1, expr2, op, ##__VA_ARGS__)

// For all below macros, an additional message can be passed using a
// format string and arguments, as with `fmt::format`.
#define KAIROS_CHECK(expr, ...) _KAIROS_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)
#define KAIROS_CHECK_GT(e1, e2, ...) _KAIROS_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define KAIROS_CHECK_GE(e1, e2, ...) _KAIROS_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)
#define KAIROS_CHECK_LT(e1, e2, ...) _KAIROS_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define KAIROS_CHECK_LE(e1, e2, ...) _KAIROS_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#define KAIROS_CHECK_EQ(e1, e2, ...) _KAIROS_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)
#define KAIROS_CHECK_NE(e1, e2, ...) _KAIROS_CHECK_OP(e1, e2, !=, ##__VA_ARGS__)
#define KAIROS_CHECK_NULL(e, ...) KAIROS_CHECK(e == nullptr, ##__VA_ARGS__)
#define KAIROS_CHECK_NOT_NULL(e, ...) KAIROS_CHECK(e != nullptr, ##__VA_ARGS__)

#define KAIROS_ARITHMETIC_ERROR(...)                              \
  _KAIROS_THROW(                                                  \
      ::facebook::kairos::KairosUserError,                        \
      ::facebook::kairos::error_source::kErrorSourceUser.c_str(), \
      ::facebook::kairos::error_code::kArithmeticError.c_str(),   \
      ##__VA_ARGS__)

#define KAIROS_UNREACHABLE(...)                                      \
  _KAIROS_THROW(                                                     \
      ::facebook::kairos::KairosRuntimeError,                        \
      ::facebook::kairos::error_source::kErrorSourceRuntime.c_str(), \
      ::facebook::kairos::error_code::kUnreachableCode.c_str(),      \
      ##__VA_ARGS__)

#ifndef NDEBUG
#define KAIROS_DCHECK(expr, ...) KAIROS_CHECK(expr, ##__VA_ARGS__)
#define KAIROS_DCHECK_GE(e1, e2, ...) KAIROS_CHECK_GE(e1, e2, ##__VA_ARGS__)
#define KAIROS_DCHECK_LE(e1, e2, ...) KAIROS_CHECK_LE(e1, e2, ##__VA_ARGS__)
#define KAIROS_DCHECK_LT(e1, e2, ...) KAIROS_CHECK_LT(e1, e2, ##__VA_ARGS__)
#else
#define KAIROS_DCHECK(expr, ...) KAIROS_CHECK(true)
#define KAIROS_DCHECK_GE(e1, e2, ...) KAIROS_CHECK(true)
#define KAIROS_DCHECK_LE(e1, e2, ...) KAIROS_CHECK(true)
#define KAIROS_DCHECK_LT(e1, e2, ...) KAIROS_CHECK(true)
#endif

#define KAIROS_FAIL(...)                                             \
  _KAIROS_THROW(                                                     \
      ::facebook::kairos::KairosRuntimeError,                        \
      ::facebook::kairos::error_source::kErrorSourceRuntime.c_str(), \
      ::facebook::kairos::error_code::kInvalidState.c_str(),         \
      ##__VA_ARGS__)

KAIROS_DECLARE_CHECK_FAIL_TEMPLATES(::facebook::kairos::KairosUserError);

// For all below macros, an additional message can be passed using a
// format string and arguments, as with `fmt::format`.
#define KAIROS_USER_CHECK(expr, ...) \
  _KAIROS_USER_CHECK_IMPL(expr, #expr, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_GT(e1, e2, ...) \
  _KAIROS_USER_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_GE(e1, e2, ...) \
  _KAIROS_USER_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_LT(e1, e2, ...) \
  _KAIROS_USER_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_LE(e1, e2, ...) \
  _KAIROS_USER_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_EQ(e1, e2, ...) \
  _KAIROS_USER_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_NE(e1, e2, ...) \
  _KAIROS_USER_CHECK_OP(e1, e2, !=, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_NULL(e, ...) \
  KAIROS_USER_CHECK(e == nullptr, ##__VA_ARGS__)
#define KAIROS_USER_CHECK_NOT_NULL(e, ...) \
  KAIROS_USER_CHECK(e != nullptr, ##__VA_ARGS__)

#define KAIROS_USER_FAIL(...)                                     \
  _KAIROS_THROW(                                                  \
      ::facebook::kairos::KairosUserError,                        \
      ::facebook::kairos::error_source::kErrorSourceUser.c_str(), \
      ::facebook::kairos::error_code::kInvalidArgument.c_str(),   \
      ##__VA_ARGS__)

} // namespace kairos
} // namespace facebook
