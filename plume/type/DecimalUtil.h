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

#include <array>
#include <string>

#include "plume/common/base/Exceptions.h"
#include "plume/type/Decimal.h"
#include "plume/type/HugeInt.h"

namespace facebook::plume {

/// Helpers for DECIMAL values stored as an unscaled int128_t and a scale.
class DecimalUtil {
 public:
  static constexpr int32_t kMaxPrecision = 38;

  /// kPowersOfTen[i] == 10^i.
  static constexpr std::array<int128_t, kMaxPrecision + 1> kPowersOfTen =
      []() {
        std::array<int128_t, kMaxPrecision + 1> powers{};
        powers[0] = 1;
        for (size_t i = 1; i < powers.size(); ++i) {
          powers[i] = powers[i - 1] * 10;
        }
        return powers;
      }();

  /// Largest and smallest unscaled values with kMaxPrecision digits.
  static constexpr int128_t kDecimalMax = kPowersOfTen[kMaxPrecision] - 1;
  static constexpr int128_t kDecimalMin = -kDecimalMax;

  /// Number of decimal digits of 'value', ignoring the sign. Returns 1 for
  /// zero.
  static int32_t numDigits(int128_t value);

  /// Returns the fixed number of bytes used to store unscaled values of
  /// the given precision: the smallest n such that every value of 'precision'
  /// digits fits in n bytes of two's-complement, i.e.
  /// precision <= floor(log10(2^(8n-1) - 1)). Throws a user error if
  /// 'precision' is outside [1, 38].
  static int32_t requiredBytes(int32_t precision);

  /// Number of bytes in the shortest big-endian two's complement form of
  /// 'value'. At least one sign bit is always included, so 0 and -1 take one
  /// byte and 128 takes two.
  static int32_t getByteArrayLength(int128_t value);

  /// Writes the shortest big-endian two's complement form of 'value' to
  /// 'out', which must hold 16 bytes. Returns the number of bytes written.
  static int32_t toByteArray(int128_t value, char* out);

  /// Renders 'unscaledValue' with 'scale' digits after the decimal point,
  /// e.g. (-5, 2) -> "-0.05". Negative scales and scales above
  /// kMaxPrecision use exponent notation, e.g. (12, -2) -> "12E+2".
  static std::string toString(int128_t unscaledValue, int32_t scale);

  /// Parses a plain decimal literal such as "-123.45". The scale of the
  /// result is the number of digits after the point. Exponents are not
  /// supported.
  static Decimal parse(const std::string& str);
}; // DecimalUtil
} // namespace facebook::plume
