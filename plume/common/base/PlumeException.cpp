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

#include "plume/common/base/PlumeException.h"

#include <iterator>

#include <fmt/format.h>

namespace facebook::plume {

ExceptionContext& getExceptionContext() {
  thread_local ExceptionContext context;
  return context;
}

PlumeException::PlumeException(
    SourceLocation location,
    std::string_view failingExpression,
    std::string message,
    std::string_view errorSource,
    std::string_view errorCode) {
  auto state = std::make_shared<State>();
  state->location = location;
  state->failingExpression = std::string(failingExpression);
  state->message = std::move(message);
  state->errorSource = std::string(errorSource);
  state->errorCode = std::string(errorCode);
  state->context = getExceptionContext().message();

  auto out = std::back_inserter(state->what);
  fmt::format_to(
      out,
      "Error Source: {}\nError Code: {}\n",
      state->errorSource,
      state->errorCode);
  if (!state->message.empty()) {
    fmt::format_to(out, "Reason: {}\n", state->message);
  }
  if (!state->failingExpression.empty()) {
    fmt::format_to(out, "Expression: {}\n", state->failingExpression);
  }
  if (!state->context.empty()) {
    fmt::format_to(out, "Context: {}\n", state->context);
  }
  fmt::format_to(
      out,
      "Function: {}\nFile: {}:{}",
      location.function,
      location.file,
      location.line);
  state_ = std::move(state);
}

} // namespace facebook::plume
