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

#include <gtest/gtest.h>

#include "plume/common/base/Exceptions.h"

#define PLUME_ASSERT_THROW_IMPL(_type, _expression, _errorMessage)           \
  try {                                                                      \
    (_expression);                                                           \
    FAIL() << "Expected an exception";                                       \
  } catch (const _type& e) {                                                 \
    ASSERT_TRUE(e.message().find(_errorMessage) != std::string::npos)        \
        << "Expected error message to contain '" << (_errorMessage)          \
        << "', but received '" << e.message() << "'.";                       \
  }

#define PLUME_ASSERT_THROW(_expression, _errorMessage) \
  PLUME_ASSERT_THROW_IMPL(                             \
      ::facebook::plume::PlumeException, _expression, _errorMessage)

#define PLUME_ASSERT_USER_THROW(_expression, _errorMessage) \
  PLUME_ASSERT_THROW_IMPL(                                  \
      ::facebook::plume::PlumeUserError, _expression, _errorMessage)

#define PLUME_ASSERT_RUNTIME_THROW(_expression, _errorMessage) \
  PLUME_ASSERT_THROW_IMPL(                                     \
      ::facebook::plume::PlumeRuntimeError, _expression, _errorMessage)
