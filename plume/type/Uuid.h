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

#include "plume/type/HugeInt.h"

namespace facebook::plume {

/// Helpers for 128-bit identifiers carried as HUGEINT values. The first 8
/// bytes of the canonical form are the high 64 bits.
class UuidUtil {
 public:
  /// Parses the canonical 8-4-4-4-12 hexadecimal form, e.g.
  /// "00112233-4455-6677-8899-aabbccddeeff". Throws a user error on malformed
  /// input.
  static int128_t parse(const std::string& str);

  /// Renders the canonical lower-case form.
  static std::string toString(int128_t value);
};

} // namespace facebook::plume
