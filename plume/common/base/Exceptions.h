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

#include <string>

#include <fmt/format.h>
#include <folly/Likely.h>

#include "plume/common/base/PlumeException.h"

namespace facebook::plume::detail {

/// Filled in by the macros below.
struct CheckFailArgs {
  SourceLocation location;
  const char* expression;
  const char* errorCode;
};

/// Logs the failure when --plume_exception_log_failures is set, then throws
/// 'Exception'. Instantiated in Exceptions.cpp for the two error types.
template <typename Exception>
[[noreturn]] void checkFail(const CheckFailArgs& args, std::string message);

extern template void checkFail<PlumeRuntimeError>(
    const CheckFailArgs& args,
    std::string message);
extern template void checkFail<PlumeUserError>(
    const CheckFailArgs& args,
    std::string message);

inline std::string errorMessage() {
  return {};
}

/// Formats 'format' with 'args'. A format without arguments is returned as
/// is, so it may contain braces.
template <typename... Args>
std::string errorMessage(fmt::string_view format, const Args&... args) {
  if constexpr (sizeof...(Args) == 0) {
    return std::string(format.data(), format.size());
  } else {
    return fmt::vformat(format, fmt::make_format_args(args...));
  }
}

template <typename L, typename R>
std::string
comparisonMessage(const L& lhs, const R& rhs, const std::string& message) {
  if (message.empty()) {
    return fmt::format("({} vs. {})", lhs, rhs);
  }
  return fmt::format("({} vs. {}) {}", lhs, rhs, message);
}

} // namespace facebook::plume::detail

#define _PLUME_RAISE(exception, errorCode, expression, ...)            \
  ::facebook::plume::detail::checkFail<exception>(                     \
      {{__FILE__, __LINE__, __func__}, expression, errorCode.c_str()}, \
      ::facebook::plume::detail::errorMessage(__VA_ARGS__))

#define _PLUME_CHECK(exception, errorCode, condition, ...)         \
  do {                                                             \
    if (FOLLY_UNLIKELY(!(condition))) {                            \
      _PLUME_RAISE(exception, errorCode, #condition, __VA_ARGS__); \
    }                                                              \
  } while (false)

// Both operands are evaluated once and printed when the comparison fails.
#define _PLUME_CHECK_OP(exception, errorCode, lhs, op, rhs, ...)      \
  do {                                                                \
    const auto& _plumeLhs = (lhs);                                    \
    const auto& _plumeRhs = (rhs);                                    \
    if (FOLLY_UNLIKELY(!(_plumeLhs op _plumeRhs))) {                  \
      ::facebook::plume::detail::checkFail<exception>(                \
          {{__FILE__, __LINE__, __func__},                            \
           #lhs " " #op " " #rhs,                                     \
           errorCode.c_str()},                                        \
          ::facebook::plume::detail::comparisonMessage(               \
              _plumeLhs,                                              \
              _plumeRhs,                                              \
              ::facebook::plume::detail::errorMessage(__VA_ARGS__))); \
    }                                                                 \
  } while (false)

/// Internal invariants. A failure throws PlumeRuntimeError. The optional
/// message arguments are an fmt format string and its arguments.
#define PLUME_CHECK(condition, ...)                 \
  _PLUME_CHECK(                                     \
      ::facebook::plume::PlumeRuntimeError,         \
      ::facebook::plume::error_code::kInvalidState, \
      condition,                                    \
      __VA_ARGS__)

#define _PLUME_RUNTIME_CHECK_OP(lhs, op, rhs, ...)  \
  _PLUME_CHECK_OP(                                  \
      ::facebook::plume::PlumeRuntimeError,         \
      ::facebook::plume::error_code::kInvalidState, \
      lhs,                                          \
      op,                                           \
      rhs,                                          \
      __VA_ARGS__)

#define PLUME_CHECK_GT(lhs, rhs, ...) \
  _PLUME_RUNTIME_CHECK_OP(lhs, >, rhs, __VA_ARGS__)
#define PLUME_CHECK_GE(lhs, rhs, ...) \
  _PLUME_RUNTIME_CHECK_OP(lhs, >=, rhs, __VA_ARGS__)
#define PLUME_CHECK_LT(lhs, rhs, ...) \
  _PLUME_RUNTIME_CHECK_OP(lhs, <, rhs, __VA_ARGS__)
#define PLUME_CHECK_LE(lhs, rhs, ...) \
  _PLUME_RUNTIME_CHECK_OP(lhs, <=, rhs, __VA_ARGS__)
#define PLUME_CHECK_EQ(lhs, rhs, ...) \
  _PLUME_RUNTIME_CHECK_OP(lhs, ==, rhs, __VA_ARGS__)

#define PLUME_CHECK_NOT_NULL(pointer, ...) \
  PLUME_CHECK((pointer) != nullptr, __VA_ARGS__)

#define PLUME_FAIL(...)                             \
  _PLUME_RAISE(                                     \
      ::facebook::plume::PlumeRuntimeError,         \
      ::facebook::plume::error_code::kInvalidState, \
      "",                                           \
      __VA_ARGS__)

#define PLUME_UNREACHABLE(...)                         \
  _PLUME_RAISE(                                        \
      ::facebook::plume::PlumeRuntimeError,            \
      ::facebook::plume::error_code::kUnreachableCode, \
      "",                                              \
      __VA_ARGS__)

/// Bad input from the caller. A failure throws PlumeUserError.
#define PLUME_USER_CHECK(condition, ...)               \
  _PLUME_CHECK(                                        \
      ::facebook::plume::PlumeUserError,               \
      ::facebook::plume::error_code::kInvalidArgument, \
      condition,                                       \
      __VA_ARGS__)

#define _PLUME_USER_CHECK_OP(lhs, op, rhs, ...)        \
  _PLUME_CHECK_OP(                                     \
      ::facebook::plume::PlumeUserError,               \
      ::facebook::plume::error_code::kInvalidArgument, \
      lhs,                                             \
      op,                                              \
      rhs,                                             \
      __VA_ARGS__)

#define PLUME_USER_CHECK_GT(lhs, rhs, ...) \
  _PLUME_USER_CHECK_OP(lhs, >, rhs, __VA_ARGS__)
#define PLUME_USER_CHECK_GE(lhs, rhs, ...) \
  _PLUME_USER_CHECK_OP(lhs, >=, rhs, __VA_ARGS__)
#define PLUME_USER_CHECK_LT(lhs, rhs, ...) \
  _PLUME_USER_CHECK_OP(lhs, <, rhs, __VA_ARGS__)
#define PLUME_USER_CHECK_LE(lhs, rhs, ...) \
  _PLUME_USER_CHECK_OP(lhs, <=, rhs, __VA_ARGS__)
#define PLUME_USER_CHECK_EQ(lhs, rhs, ...) \
  _PLUME_USER_CHECK_OP(lhs, ==, rhs, __VA_ARGS__)

#define PLUME_USER_FAIL(...)                           \
  _PLUME_RAISE(                                        \
      ::facebook::plume::PlumeUserError,               \
      ::facebook::plume::error_code::kInvalidArgument, \
      "",                                              \
      __VA_ARGS__)
