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

#include "plume/type/Uuid.h"

#include <stdexcept>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "plume/common/base/Exceptions.h"

namespace facebook::plume {

int128_t UuidUtil::parse(const std::string& str) {
  boost::uuids::uuid uuid;
  try {
    uuid = boost::uuids::string_generator()(str);
  } catch (const std::runtime_error& e) {
    PLUME_USER_FAIL("Invalid UUID string '{}': {}", str, e.what());
  }

  uint64_t hi = 0;
  uint64_t lo = 0;
  for (size_t i = 0; i < 8; ++i) {
    hi = (hi << 8) | uuid.data[i];
    lo = (lo << 8) | uuid.data[i + 8];
  }
  return HugeInt::build(hi, lo);
}

std::string UuidUtil::toString(int128_t value) {
  boost::uuids::uuid uuid;
  const uint64_t hi = HugeInt::upper(value);
  const uint64_t lo = HugeInt::lower(value);
  for (size_t i = 0; i < 8; ++i) {
    uuid.data[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
    uuid.data[i + 8] = static_cast<uint8_t>(lo >> (56 - 8 * i));
  }
  return boost::uuids::to_string(uuid);
}

} // namespace facebook::plume
