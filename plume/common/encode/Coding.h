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

//
// Miscellaneous number encoding/decoding routines
// - Varint coding
// - ZigZag coding

#pragma once

#include <folly/Range.h>
#include <algorithm>
#include <cstdint>

#include "plume/common/base/Exceptions.h"

namespace facebook::plume {

// Variable-length integer encoding, using a little-endian, base-128
// representation.
// The MSb is set on all bytes except the last.
class Varint {
 public:
  // A 64-bit value takes at most 10 bytes.
  static constexpr int32_t kMaxSize64 = 10;

  // Encode "val" into the buffer pointed to by *dest, and advance *dest.
  // No bounds checking is done.
  static void encode(uint64_t val, char** dest) {
    char* p = *dest;
    while (val >= 128) {
      *p++ = 0x80 | (static_cast<char>(val) & 0x7f);
      val >>= 7;
    }
    *p++ = static_cast<char>(val);
    *dest = p;
  }

  // Decode a value from the buffer pointed to by *src, and advance *src.
  // Reads at most 'maxSize' bytes.
  static uint64_t decode(const char** src, int64_t maxSize) {
    const char* p = *src;
    uint64_t val = 0;
    int32_t shift = 0;
    maxSize = std::min<int64_t>(maxSize, kMaxSize64);
    while (*p & 0x80) {
      // We must have room for the last byte, too. Varints > 64bits are data
      // corruption.
      PLUME_CHECK_GT(maxSize, 1, "Malformed varint");
      --maxSize;
      val |= static_cast<uint64_t>(*p++ & 0x7f) << shift;
      shift += 7;
    }
    PLUME_CHECK_GT(maxSize, 0, "Malformed varint");
    val |= static_cast<uint64_t>(*p++ & 0x7f) << shift;
    *src = p;
    return val;
  }

  // Decode a value from a StringPiece, and advance the StringPiece.
  static uint64_t decode(folly::StringPiece* data) {
    PLUME_CHECK(!data->empty(), "Cannot decode varint from empty input");
    const char* p = data->start();
    uint64_t val = decode(&p, data->size());
    data->advance(p - data->start());
    return val;
  }
};

// Zig-zag encoding that maps signed integers with a small absolute value
// to unsigned integers with a small (positive) value.
// if x >= 0, ZigZag::encode(x) == 2*x
// if x <  0, ZigZag::encode(x) == -2*x - 1
class ZigZag {
 public:
  static uint64_t encode(int64_t val) {
    // Bit-twiddling magic stolen from the Google protocol buffer document;
    // val >> 63 is an arithmetic shift because val is signed
    return (static_cast<uint64_t>(val) << 1) ^ (val >> 63);
  }

  static int64_t decode(uint64_t val) {
    return static_cast<int64_t>((val >> 1) ^ -(val & 1));
  }
};

} // namespace facebook::plume
