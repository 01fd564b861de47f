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

#include "plume/type/Variant.h"

#include <cmath>

#include <folly/Conv.h>

#include "plume/type/Uuid.h"

namespace facebook::plume {

namespace {

template <TypeKind KIND>
std::string scalarToString(const Variant& value) {
  const auto& v = value.value<KIND>();
  if constexpr (KIND == TypeKind::BOOLEAN) {
    return v ? "true" : "false";
  } else if constexpr (KIND == TypeKind::HUGEINT) {
    return UuidUtil::toString(v);
  } else if constexpr (KIND == TypeKind::DECIMAL) {
    return v.toString();
  } else if constexpr (KIND == TypeKind::VARCHAR) {
    return fmt::format("\"{}\"", v);
  } else if constexpr (KIND == TypeKind::VARBINARY) {
    std::string hex = "0x";
    for (unsigned char c : v) {
      hex += fmt::format("{:02X}", c);
    }
    return hex;
  } else if constexpr (KIND == TypeKind::UNKNOWN) {
    return "null";
  } else {
    return folly::to<std::string>(v);
  }
}

template <TypeKind KIND>
std::string variantToString(const Variant& value) {
  if constexpr (KIND == TypeKind::ARRAY || KIND == TypeKind::ROW) {
    const auto& children = value.value<KIND>();
    std::string out = KIND == TypeKind::ARRAY ? "[" : "{";
    for (size_t i = 0; i < children.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += children[i].toString();
    }
    out += KIND == TypeKind::ARRAY ? "]" : "}";
    return out;
  } else if constexpr (KIND == TypeKind::MAP) {
    const auto& entries = value.map();
    std::string out = "{";
    for (size_t i = 0; i < entries.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += entries[i].first.toString();
      out += " => ";
      out += entries[i].second.toString();
    }
    out += "}";
    return out;
  } else {
    return scalarToString<KIND>(value);
  }
}

} // namespace

void Variant::throwCheckIsKindError(TypeKind kind) const {
  PLUME_USER_FAIL(
      "wrong kind! {} != {}",
      mapTypeKindToName(kind_),
      mapTypeKindToName(kind));
}

void Variant::throwCheckPtrError() const {
  PLUME_USER_FAIL(
      "missing Variant value of kind {}", mapTypeKindToName(kind_));
}

template <TypeKind KIND>
bool Variant::equals(const Variant& other) const {
  using T = typename detail::VariantTypeTraits<KIND>::stored_type;
  if constexpr (std::is_floating_point_v<T>) {
    const T a = value<KIND>();
    const T b = other.value<KIND>();
    if (std::isnan(a) || std::isnan(b)) {
      return std::isnan(a) && std::isnan(b);
    }
    return a == b;
  } else {
    return value<KIND>() == other.value<KIND>();
  }
}

bool Variant::equals(const Variant& other) const {
  if (other.kind_ != this->kind_) {
    return false;
  }
  if (other.isNull() || this->isNull()) {
    return other.isNull() && this->isNull();
  }
  return PLUME_DYNAMIC_TYPE_DISPATCH_ALL(equals, kind_, other);
}

std::string Variant::toString() const {
  if (isNull()) {
    return "null";
  }
  return PLUME_DYNAMIC_TYPE_DISPATCH_ALL(variantToString, kind_, *this);
}

const Variant& Variant::field(size_t index) const {
  const auto& fields = row();
  PLUME_USER_CHECK_LT(
      index,
      fields.size(),
      "Row has {} fields, cannot access field {}",
      fields.size(),
      index);
  return fields[index];
}

} // namespace facebook::plume
