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

#include "plume/common/config/Config.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <re2/re2.h>

namespace facebook::plume::config {

namespace {
// log2 of the number of bytes in 'unit'.
int unitShift(CapacityUnit unit) {
  return 10 * static_cast<int>(unit);
}

CapacityUnit parseCapacityUnit(const std::string& unit) {
  static const std::unordered_map<std::string, CapacityUnit> kUnits{
      {"b", CapacityUnit::BYTE},
      {"kb", CapacityUnit::KILOBYTE},
      {"mb", CapacityUnit::MEGABYTE},
      {"gb", CapacityUnit::GIGABYTE},
      {"tb", CapacityUnit::TERABYTE},
      {"pb", CapacityUnit::PETABYTE},
  };
  std::string lower(unit.size(), '\0');
  std::transform(unit.begin(), unit.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  auto it = kUnits.find(lower);
  if (it == kUnits.end()) {
    PLUME_USER_FAIL("Invalid capacity unit '{}'", unit);
  }
  return it->second;
}
} // namespace

uint64_t toCapacity(const std::string& from, CapacityUnit unit) {
  static const RE2 kPattern(R"(^\s*(\d+(?:\.\d+)?)\s*([a-zA-Z]+)\s*$)");
  double value;
  std::string suffix;
  if (!RE2::FullMatch(from, kPattern, &value, &suffix)) {
    PLUME_USER_FAIL("Invalid capacity string '{}'", from);
  }
  const auto shift = unitShift(parseCapacityUnit(suffix)) - unitShift(unit);
  const auto capacity = std::ldexp(value, shift);
  PLUME_USER_CHECK(
      capacity < std::ldexp(1.0, 64), "Capacity '{}' is out of range", from);
  return static_cast<uint64_t>(capacity);
}

} // namespace facebook::plume::config
