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
#include <ostream>
#include <string>

#include "plume/type/HugeInt.h"

namespace facebook::plume {

/// An arbitrary precision decimal value up to 38 digits: an unscaled integer
/// and the number of digits after the decimal point. 123.45 is {12345, 2}.
struct Decimal {
  int128_t unscaledValue{0};
  int32_t scale{0};

  /// Number of decimal digits of the unscaled value. Zero has precision 1.
  int32_t precision() const;

  std::string toString() const;

  bool operator==(const Decimal& other) const {
    return unscaledValue == other.unscaledValue && scale == other.scale;
  }

  bool operator!=(const Decimal& other) const {
    return !(*this == other);
  }

  bool operator<(const Decimal& other) const {
    return scale != other.scale ? scale < other.scale
                                : unscaledValue < other.unscaledValue;
  }
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
  return os << value.toString();
}

} // namespace facebook::plume
