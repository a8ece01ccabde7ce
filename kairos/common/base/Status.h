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

// Adapted from Apache Arrow.

#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <folly/Expected.h>
#include <folly/Likely.h>
#include <string>
#include <utility>

namespace facebook::kairos {

/// The Status object holds the outcome of an operation (success or error).
///
/// For the common success case its size is a single (nullptr) pointer. For
/// failure cases it allocates an external object containing the StatusCode
/// and error message.
///
/// Value construction in kairos never throws for bad field combinations.
/// Instead it returns a Status (or an Expected<T>, see below):
///
///  Expected<Date> Date::create(int32_t year, int32_t month, int32_t day) {
///    KAIROS_RETURN_IF(
///        !util::isValidDate(year, month, day),
///        Status::UserError("day is out of range for month"));
///    ...
///  }
///
/// Call site:
///
///  auto date = Date::create(2021, 2, 30);
///  if (date.hasError() && date.error().isUserError()) {
///    (retry with different fields)
///  }

/// Categories of errors found in the library.
///
/// - kOK: A successful operation. No errors.
///
/// - kUserError: A field combination that does not form a valid calendar
///   value, e.g. February 30 or hour 24.
///
/// - kOverflow: A computation left the representable range, e.g. a UTC
///   conversion before 0001-01-01 or after 9999-12-31.
///
/// - kInvalid: A draw that was rejected and reported to the data source as
///   invalid.
///
/// - kUnknownError: An error triggered by an unknown cause. Usually
///   triggered by bugs.
enum class StatusCode : int8_t {
  kOK = 0,
  kUserError = 1,
  kOverflow = 2,
  kInvalid = 3,
  kUnknownError = 4,
};
std::string_view toString(StatusCode code);

class [[nodiscard]] Status {
 public:
  // Create a success status.
  constexpr Status() noexcept : state_(nullptr) {}

  ~Status() noexcept {
    if (FOLLY_UNLIKELY(state_ != nullptr)) {
      deleteState();
    }
  }

  explicit Status(StatusCode code);

  Status(StatusCode code, std::string msg);

  // Copy the specified status.
  inline Status(const Status& s);
  inline Status& operator=(const Status& s);

  // Move the specified status.
  inline Status(Status&& s) noexcept;
  inline Status& operator=(Status&& s) noexcept;

  inline bool operator==(const Status& other) const noexcept;
  inline bool operator!=(const Status& other) const noexcept {
    return !(*this == other);
  }

  inline friend std::ostream& operator<<(std::ostream& ss, const Status& s) {
    return ss << s.toString();
  }

  /// Return a success status.
  static Status OK() {
    return Status();
  }

  // The static factory methods below do not follow the lower camel-case pattern
  // as they are meant to represent classes of errors. For example:
  //
  //   auto st1 = Status::UserError("month must be in 1..12"):
  //   auto st2 = Status::Overflow("date value out of range"):

  /// Return an error status for invalid calendar values.
  template <typename... Args>
  static Status UserError(Args&&... args) {
    return Status::fromArgs(
        StatusCode::kUserError, std::forward<Args>(args)...);
  }

  /// Return an error status for results outside the representable range.
  template <typename... Args>
  static Status Overflow(Args&&... args) {
    return Status::fromArgs(StatusCode::kOverflow, std::forward<Args>(args)...);
  }

  /// Return an error status for a draw rejected as invalid.
  template <typename... Args>
  static Status Invalid(Args&&... args) {
    return Status::fromArgs(StatusCode::kInvalid, std::forward<Args>(args)...);
  }

  /// Return an error status for unknown errors
  template <typename... Args>
  static Status UnknownError(Args&&... args) {
    return Status::fromArgs(
        StatusCode::kUnknownError, std::forward<Args>(args)...);
  }

  /// Return true iff the status indicates success.
  constexpr bool ok() const {
    return (state_ == nullptr);
  }

  /// Return true iff the status indicates an invalid calendar value.
  constexpr bool isUserError() const {
    return code() == StatusCode::kUserError;
  }

  /// Return true iff the status indicates an out of range result.
  constexpr bool isOverflow() const {
    return code() == StatusCode::kOverflow;
  }

  /// Return true iff the status indicates a rejected draw.
  constexpr bool isInvalid() const {
    return code() == StatusCode::kInvalid;
  }

  /// Return true iff the status indicates an unknown error.
  constexpr bool isUnknownError() const {
    return code() == StatusCode::kUnknownError;
  }

  /// Return a string representation of this status suitable for printing.
  ///
  /// The string "OK" is returned for success.
  std::string toString() const;

  /// Return a string representation of the status code, without the message
  /// text.
  std::string_view codeAsString() const;
  static std::string_view codeAsString(StatusCode);

  /// Return the StatusCode value attached to this status.
  constexpr StatusCode code() const {
    return ok() ? StatusCode::kOK : state_->code;
  }

  /// Return the specific error message attached to this status.
  const std::string& message() const {
    static const std::string kNoMessage = "";
    return ok() ? kNoMessage : state_->msg;
  }

  /// Return a new Status with changed message, copying the existing status
  /// code.
  template <typename... Args>
  Status withMessage(Args&&... args) const {
    return fromArgs(code(), std::forward<Args>(args)...);
  }

  void warn() const;
  void warn(const std::string_view& message) const;

 private:
  template <typename... Args>
  static Status
  fromArgs(StatusCode code, fmt::string_view fmt, Args&&... args) {
    return Status(code, fmt::vformat(fmt, fmt::make_format_args(args...)));
  }

  static Status fromArgs(StatusCode code) {
    return Status(code);
  }

  void deleteState() {
    delete state_;
    state_ = nullptr;
  }

  void copyFrom(const Status& s);
  inline void moveFrom(Status& s);

  struct State {
    StatusCode code;
    std::string msg;
  };

  // OK status has a `nullptr` state_.  Otherwise, `state_` points to
  // a `State` structure containing the error code and message.
  State* state_;
};

Status::Status(const Status& s)
    : state_((s.state_ == nullptr) ? nullptr : new State(*s.state_)) {}

Status& Status::operator=(const Status& s) {
  // The following condition catches both aliasing (when this == &s),
  // and the common case where both s and *this are ok.
  if (state_ != s.state_) {
    copyFrom(s);
  }
  return *this;
}

Status::Status(Status&& s) noexcept : state_(s.state_) {
  s.state_ = nullptr;
}

Status& Status::operator=(Status&& s) noexcept {
  moveFrom(s);
  return *this;
}

inline bool Status::operator==(const Status& other) const noexcept {
  if (state_ == other.state_) {
    return true;
  }

  if (ok() || other.ok()) {
    return false;
  }
  return (code() == other.code()) && (message() == other.message());
}

void Status::moveFrom(Status& s) {
  if (this == &s) {
    return;
  }
  delete state_;
  state_ = s.state_;
  s.state_ = nullptr;
}

// Helper Macros.

/// Return with given status if condition is met.
#define KAIROS_RETURN_IF(condition, status) \
  do {                                      \
    if (FOLLY_UNLIKELY(condition)) {        \
      return (status);                      \
    }                                       \
  } while (0)

/// Propagate any non-successful Status to the caller.
#define KAIROS_RETURN_NOT_OK(status)                           \
  do {                                                         \
    ::facebook::kairos::Status __s =                           \
        ::facebook::kairos::internal::genericToStatus(status); \
    KAIROS_RETURN_IF(!__s.ok(), __s);                          \
  } while (false)

/// Propagate the error of an Expected<T> to a caller returning Expected<U>.
#define KAIROS_RETURN_UNEXPECTED(expected)                    \
  do {                                                        \
    if (FOLLY_UNLIKELY((expected).hasError())) {              \
      return folly::makeUnexpected((expected).error());       \
    }                                                         \
  } while (false)

namespace internal {

/// Common API for extracting Status from Status. Useful for status check macros
/// such as KAIROS_RETURN_NOT_OK.
inline const Status& genericToStatus(const Status& st) {
  return st;
}
inline Status genericToStatus(Status&& st) {
  return std::move(st);
}

} // namespace internal

/// Holds a result or an error. Designed to be used by APIs that do not throw.
///
///  Expected<Datetime> Datetime::fromMicros(int64_t micros) {
///    if (micros < kMinMicros || micros > kMaxMicros) {
///      return folly::makeUnexpected(Status::Overflow("out of range"));
///    }
///    ...
///  }
///
/// Status should not be OK.
template <typename T>
using Expected = folly::Expected<T, Status>;

} // namespace facebook::kairos

template <>
struct fmt::formatter<facebook::kairos::Status> : fmt::formatter<std::string> {
  auto format(const facebook::kairos::Status& s, format_context& ctx) {
    return formatter<std::string>::format(s.toString(), ctx);
  }
};

template <>
struct fmt::formatter<facebook::kairos::StatusCode>
    : fmt::formatter<std::string_view> {
  auto format(facebook::kairos::StatusCode code, format_context& ctx) {
    return formatter<std::string_view>::format(
        facebook::kairos::toString(code), ctx);
  }
};
