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

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <folly/FixedString.h>

namespace facebook::plume {

/// Describes what the current thread is doing. Writers install one while they
/// descend into nested values so that an error raised at a leaf says where it
/// happened. 'messageFunc' runs only when an exception is constructed.
struct ExceptionContext {
  using MessageFunction = std::string (*)(void* arg);

  MessageFunction messageFunc{nullptr};
  void* arg{nullptr};

  std::string message() const {
    return messageFunc != nullptr ? messageFunc(arg) : std::string();
  }
};

/// Returns the context of the calling thread.
ExceptionContext& getExceptionContext();

/// Makes 'context' current for the lifetime of the setter, then puts back
/// whatever was current before.
class ExceptionContextSetter {
 public:
  explicit ExceptionContextSetter(ExceptionContext context)
      : previous_{std::exchange(getExceptionContext(), context)} {}

  ~ExceptionContextSetter() {
    getExceptionContext() = previous_;
  }

  ExceptionContextSetter(const ExceptionContextSetter&) = delete;
  ExceptionContextSetter& operator=(const ExceptionContextSetter&) = delete;

 private:
  const ExceptionContext previous_;
};

namespace error_source {
using namespace folly::string_literals;

// The caller passed a value or built a writer that does not fit the schema.
inline constexpr auto kErrorSourceUser = "USER"_fs;

// An internal invariant broke, e.g. unbalanced encoder calls.
inline constexpr auto kErrorSourceRuntime = "RUNTIME"_fs;
} // namespace error_source

namespace error_code {
using namespace folly::string_literals;

inline constexpr auto kInvalidArgument = "INVALID_ARGUMENT"_fs;
inline constexpr auto kInvalidState = "INVALID_STATE"_fs;
inline constexpr auto kUnreachableCode = "UNREACHABLE_CODE"_fs;
} // namespace error_code

/// Call site of a failed check.
struct SourceLocation {
  const char* file;
  size_t line;
  const char* function;
};

class PlumeException : public std::exception {
 public:
  PlumeException(
      SourceLocation location,
      std::string_view failingExpression,
      std::string message,
      std::string_view errorSource,
      std::string_view errorCode);

  /// Multi-line description with source, code, reason, context and location.
  const char* what() const noexcept override {
    return state_->what.c_str();
  }

  const std::string& message() const {
    return state_->message;
  }

  const std::string& errorSource() const {
    return state_->errorSource;
  }

  const std::string& errorCode() const {
    return state_->errorCode;
  }

  /// Message of the ExceptionContext that was current at construction.
  const std::string& context() const {
    return state_->context;
  }

  const std::string& failingExpression() const {
    return state_->failingExpression;
  }

  const SourceLocation& location() const {
    return state_->location;
  }

 private:
  struct State {
    SourceLocation location;
    std::string failingExpression;
    std::string message;
    std::string errorSource;
    std::string errorCode;
    std::string context;
    std::string what;
  };

  // Exceptions are copied while unwinding. Copies share one State.
  std::shared_ptr<const State> state_;
};

class PlumeUserError : public PlumeException {
 public:
  PlumeUserError(
      SourceLocation location,
      std::string_view failingExpression,
      std::string message,
      std::string_view errorCode = error_code::kInvalidArgument.c_str())
      : PlumeException(
            location,
            failingExpression,
            std::move(message),
            error_source::kErrorSourceUser.c_str(),
            errorCode) {}
};

class PlumeRuntimeError final : public PlumeException {
 public:
  PlumeRuntimeError(
      SourceLocation location,
      std::string_view failingExpression,
      std::string message,
      std::string_view errorCode = error_code::kInvalidState.c_str())
      : PlumeException(
            location,
            failingExpression,
            std::move(message),
            error_source::kErrorSourceRuntime.c_str(),
            errorCode) {}
};

} // namespace facebook::plume
