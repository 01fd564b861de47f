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

#include "plume/type/HugeInt.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

#include "plume/common/base/Exceptions.h"

namespace facebook::plume {

int128_t HugeInt::parse(const std::string& str) {
  PLUME_USER_CHECK(
      !str.empty(), "Empty string cannot be converted to int128_t.");
  const bool negative = str[0] == '-';
  const size_t start = (negative || str[0] == '+') ? 1 : 0;
  PLUME_USER_CHECK_LT(start, str.size(), "No digits in '{}'", str);

  // The magnitude of the minimum is one more than the maximum.
  const uint128_t limit =
      static_cast<uint128_t>(std::numeric_limits<int128_t>::max()) +
      (negative ? 1 : 0);
  uint128_t magnitude = 0;
  for (size_t i = start; i < str.size(); ++i) {
    const char c = str[i];
    PLUME_USER_CHECK(
        std::isdigit(static_cast<unsigned char>(c)),
        "Invalid character {} in the string.",
        c);
    const uint128_t digit = c - '0';
    if (magnitude > (limit - digit) / 10) {
      PLUME_USER_FAIL("{} is out of range of int128_t", str);
    }
    magnitude = magnitude * 10 + digit;
  }

  if (!negative) {
    return static_cast<int128_t>(magnitude);
  }
  return magnitude == 0 ? 0 : -static_cast<int128_t>(magnitude - 1) - 1;
}

} // namespace facebook::plume

namespace std {
string to_string(facebook::plume::int128_t x) {
  if (x == 0) {
    return "0";
  }
  string ans;
  bool negative = x < 0;
  while (x != 0) {
    ans += '0' + abs(static_cast<int>(x % 10));
    x /= 10;
  }
  if (negative) {
    ans += '-';
  }
  reverse(ans.begin(), ans.end());
  return ans;
}

} // namespace std
