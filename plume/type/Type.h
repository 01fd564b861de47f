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

#include <fmt/format.h>

#include "plume/common/base/Exceptions.h"
#include "plume/type/Decimal.h"
#include "plume/type/HugeInt.h"

namespace facebook::plume {

// Kinds of values that flow through a writer tree.
enum class TypeKind : int8_t {
  BOOLEAN = 0,
  INTEGER = 1,
  BIGINT = 2,
  // 128-bit identifiers (UUID). The high 64 bits are the most significant
  // half.
  HUGEINT = 3,
  REAL = 4,
  DOUBLE = 5,
  VARCHAR = 6,
  VARBINARY = 7,
  DECIMAL = 8,
  // Containers are numbered apart from the scalars.
  ARRAY = 30,
  MAP = 31,
  ROW = 32,
  // The kind of a null whose type is not known.
  UNKNOWN = 33,
  INVALID = 36
};

std::string mapTypeKindToName(const TypeKind& typeKind);

std::ostream& operator<<(std::ostream& os, const TypeKind& kind);

/// Value of the UNKNOWN kind. It is never materialized; UNKNOWN values are
/// always null.
struct UnknownValue {
  bool operator==(const UnknownValue& /* other */) const {
    return true;
  }
};

/// C++ type holding a value of a scalar kind. Containers have none.
template <TypeKind KIND>
struct TypeTraits {
  using NativeType = void;
  static constexpr bool isPrimitiveType = false;
};

#define PLUME_SCALAR_TYPE_TRAITS(KIND, TYPE)      \
  template <>                                     \
  struct TypeTraits<TypeKind::KIND> {             \
    using NativeType = TYPE;                      \
    static constexpr bool isPrimitiveType = true; \
  };

PLUME_SCALAR_TYPE_TRAITS(BOOLEAN, bool)
PLUME_SCALAR_TYPE_TRAITS(INTEGER, int32_t)
PLUME_SCALAR_TYPE_TRAITS(BIGINT, int64_t)
PLUME_SCALAR_TYPE_TRAITS(HUGEINT, int128_t)
PLUME_SCALAR_TYPE_TRAITS(REAL, float)
PLUME_SCALAR_TYPE_TRAITS(DOUBLE, double)
PLUME_SCALAR_TYPE_TRAITS(VARCHAR, std::string)
PLUME_SCALAR_TYPE_TRAITS(VARBINARY, std::string)
PLUME_SCALAR_TYPE_TRAITS(DECIMAL, Decimal)
PLUME_SCALAR_TYPE_TRAITS(UNKNOWN, UnknownValue)

#undef PLUME_SCALAR_TYPE_TRAITS

#define _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, KIND, ...) \
  case ::facebook::plume::TypeKind::KIND:                   \
    return TEMPLATE_FUNC<::facebook::plume::TypeKind::KIND>(__VA_ARGS__);

/// Calls TEMPLATE_FUNC<kind>(args...) for the runtime 'typeKind'. Every kind
/// except INVALID has a case.
#define PLUME_DYNAMIC_TYPE_DISPATCH_ALL(TEMPLATE_FUNC, typeKind, ...)        \
  [&]() {                                                                    \
    switch (typeKind) {                                                      \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, BOOLEAN, __VA_ARGS__)         \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, INTEGER, __VA_ARGS__)         \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, BIGINT, __VA_ARGS__)          \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, HUGEINT, __VA_ARGS__)         \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, REAL, __VA_ARGS__)            \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, DOUBLE, __VA_ARGS__)          \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, VARCHAR, __VA_ARGS__)         \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, VARBINARY, __VA_ARGS__)       \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, DECIMAL, __VA_ARGS__)         \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, ARRAY, __VA_ARGS__)           \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, MAP, __VA_ARGS__)             \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, ROW, __VA_ARGS__)             \
      _PLUME_TYPE_DISPATCH_CASE(TEMPLATE_FUNC, UNKNOWN, __VA_ARGS__)         \
      default:                                                               \
        PLUME_FAIL(                                                          \
            "not a known type kind: {}",                                     \
            ::facebook::plume::mapTypeKindToName(typeKind));                 \
    }                                                                        \
  }()

} // namespace facebook::plume

template <>
struct fmt::formatter<facebook::plume::TypeKind> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const facebook::plume::TypeKind& kind, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        facebook::plume::mapTypeKindToName(kind), ctx);
  }
};
