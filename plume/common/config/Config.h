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

#include <cstdint>
#include <string>
#include <typeinfo>
#include <unordered_map>

#include <folly/Conv.h>
#include <folly/Demangle.h>
#include <folly/Optional.h>

#include "plume/common/base/Exceptions.h"

namespace facebook::plume::config {

/// Binary units. Each one is 1024 times the previous.
enum class CapacityUnit {
  BYTE,
  KILOBYTE,
  MEGABYTE,
  GIGABYTE,
  TERABYTE,
  PETABYTE
};

/// Parses a capacity string such as "64KB" or "1.5 mb" and returns it in
/// 'unit', truncated. Unit suffixes are case insensitive and required.
uint64_t toCapacity(const std::string& from, CapacityUnit unit);

/// Read-only string key/value configuration with typed lookups. Typed
/// accessor classes such as the avro WriterConfig wrap one of these.
class ConfigBase {
 public:
  explicit ConfigBase(std::unordered_map<std::string, std::string> configs)
      : configs_(std::move(configs)) {}

  /// Returns the value of 'key' converted to T, or none if 'key' is not set.
  /// Throws a user error if the value does not convert.
  template <typename T>
  folly::Optional<T> get(const std::string& key) const {
    auto it = configs_.find(key);
    if (it == configs_.end()) {
      return folly::none;
    }
    auto converted = folly::tryTo<T>(it->second);
    if (converted.hasError()) {
      PLUME_USER_FAIL(
          "Invalid value '{}' for config '{}', expected {}",
          it->second,
          key,
          folly::demangle(typeid(T)).toStdString());
    }
    return std::move(converted).value();
  }

  template <typename T>
  T get(const std::string& key, const T& defaultValue) const {
    auto value = get<T>(key);
    return value.hasValue() ? std::move(value).value() : defaultValue;
  }

 private:
  const std::unordered_map<std::string, std::string> configs_;
};

} // namespace facebook::plume::config
