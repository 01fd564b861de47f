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

#include "plume/type/DecimalUtil.h"

#include <array>
#include <cstring>

#include <fmt/format.h>
#include <folly/lang/Bits.h>

namespace facebook::plume {

namespace {
constexpr int32_t kMaxBytes = sizeof(int128_t);

// kRequiredBytes[p] is the byte length for precision p. Entry 0 is unused.
constexpr std::array<int32_t, DecimalUtil::kMaxPrecision + 1>
computeRequiredBytes() {
  std::array<int32_t, DecimalUtil::kMaxPrecision + 1> result{};
  int32_t bytes = 1;
  for (int32_t precision = 1; precision <= DecimalUtil::kMaxPrecision;
       ++precision) {
    // 10^precision - 1 fits in 'bytes' bytes iff 10^precision <= 2^(8n-1) - 1,
    // i.e. 10^precision < 2^(8n-1) since no power of ten is a power of two.
    while (static_cast<uint128_t>(DecimalUtil::kPowersOfTen[precision]) >=
           (static_cast<uint128_t>(1) << (8 * bytes - 1))) {
      ++bytes;
    }
    result[precision] = bytes;
  }
  return result;
}

constexpr auto kRequiredBytes = computeRequiredBytes();
static_assert(kRequiredBytes[DecimalUtil::kMaxPrecision] == kMaxBytes);
} // namespace

int32_t DecimalUtil::numDigits(int128_t value) {
  const uint128_t magnitude = value < 0 ? -static_cast<uint128_t>(value)
                                        : static_cast<uint128_t>(value);
  int32_t digits = 1;
  while (digits <= kMaxPrecision &&
         magnitude >= static_cast<uint128_t>(kPowersOfTen[digits])) {
    ++digits;
  }
  return digits;
}

int32_t DecimalUtil::requiredBytes(int32_t precision) {
  PLUME_USER_CHECK(
      precision >= 1 && precision <= kMaxPrecision,
      "Decimal precision must be in range [1, {}], got {}",
      kMaxPrecision,
      precision);
  return kRequiredBytes[precision];
}

int32_t DecimalUtil::getByteArrayLength(int128_t value) {
  if (value < 0) {
    value = ~value;
  }
  int nbits;
  if (auto hi = HugeInt::upper(value)) {
    nbits = 128 - __builtin_clzll(hi);
  } else if (auto lo = HugeInt::lower(value)) {
    nbits = 64 - __builtin_clzll(lo);
  } else {
    nbits = 0;
  }
  return 1 + nbits / 8;
}

int32_t DecimalUtil::toByteArray(int128_t value, char* out) {
  int32_t length = getByteArrayLength(value);
  auto lowBig = folly::Endian::big<int64_t>(value);
  uint8_t* lowAddr = reinterpret_cast<uint8_t*>(&lowBig);
  if (length <= sizeof(int64_t)) {
    memcpy(out, lowAddr + sizeof(int64_t) - length, length);
  } else {
    auto highBig = folly::Endian::big<int64_t>(value >> 64);
    uint8_t* highAddr = reinterpret_cast<uint8_t*>(&highBig);
    memcpy(out, highAddr + sizeof(int128_t) - length, length - sizeof(int64_t));
    memcpy(out + length - sizeof(int64_t), lowAddr, sizeof(int64_t));
  }
  return length;
}

std::string DecimalUtil::toString(int128_t unscaledValue, int32_t scale) {
  if (scale == 0) {
    return std::to_string(unscaledValue);
  }
  if (scale < 0 || scale > kMaxPrecision) {
    // Exponent notation, so the length does not depend on the scale.
    return fmt::format(
        "{}E{:+}",
        std::to_string(unscaledValue),
        -static_cast<int64_t>(scale));
  }
  const bool negative = unscaledValue < 0;
  auto digits = std::to_string(unscaledValue);
  if (negative) {
    digits.erase(0, 1);
  }
  if (digits.size() <= static_cast<size_t>(scale)) {
    digits.insert(0, scale - digits.size() + 1, '0');
  }
  digits.insert(digits.size() - scale, 1, '.');
  return (negative ? "-" : "") + digits;
}

Decimal DecimalUtil::parse(const std::string& str) {
  PLUME_USER_CHECK(!str.empty(), "Empty string cannot be parsed as decimal");
  const auto point = str.find('.');
  if (point == std::string::npos) {
    return Decimal{HugeInt::parse(str), 0};
  }
  PLUME_USER_CHECK_EQ(
      str.find('.', point + 1),
      std::string::npos,
      "Invalid decimal literal: {}",
      str);
  const auto fraction = str.substr(point + 1);
  PLUME_USER_CHECK(!fraction.empty(), "Invalid decimal literal: {}", str);
  auto integral = str.substr(0, point);
  if (integral.empty() || integral == "-" || integral == "+") {
    integral += "0";
  }
  const auto unscaled = HugeInt::parse(integral + fraction);
  PLUME_USER_CHECK_LE(
      numDigits(unscaled),
      kMaxPrecision,
      "Decimal literal exceeds the maximum precision: {}",
      str);
  return Decimal{unscaled, static_cast<int32_t>(fraction.size())};
}

} // namespace facebook::plume
