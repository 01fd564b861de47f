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

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "plume/common/base/Exceptions.h"
#include "plume/type/Type.h"

namespace facebook::plume {

class Variant;

namespace detail {
template <TypeKind KIND, typename = void>
struct VariantTypeTraits {};

template <TypeKind KIND>
struct VariantTypeTraits<
    KIND,
    std::enable_if_t<TypeTraits<KIND>::isPrimitiveType, void>> {
  using stored_type = typename TypeTraits<KIND>::NativeType;
};

template <>
struct VariantTypeTraits<TypeKind::ARRAY> {
  using stored_type = std::vector<Variant>;
};

// Entries keep insertion order. Writers emit them in that order.
template <>
struct VariantTypeTraits<TypeKind::MAP> {
  using stored_type = std::vector<std::pair<Variant, Variant>>;
};

template <>
struct VariantTypeTraits<TypeKind::ROW> {
  using stored_type = std::vector<Variant>;
};
} // namespace detail

/// A dynamically typed value: a TypeKind plus, unless null, a value of the
/// corresponding C++ type. Complex kinds hold child Variants, so one Variant
/// can describe a whole row.
class Variant {
 private:
  Variant(TypeKind kind, void* ptr) : ptr_{ptr}, kind_{kind} {}

  template <TypeKind KIND>
  bool equals(const Variant& other) const;

  template <TypeKind KIND>
  void typedDestroy() {
    delete static_cast<
        const typename detail::VariantTypeTraits<KIND>::stored_type*>(ptr_);
    ptr_ = nullptr;
  }

  template <TypeKind KIND>
  void typedCopy(const void* other) {
    using stored_type = typename detail::VariantTypeTraits<KIND>::stored_type;
    ptr_ = new stored_type(*static_cast<const stored_type*>(other));
  }

  void dynamicCopy(const void* p, const TypeKind kind) {
    PLUME_DYNAMIC_TYPE_DISPATCH_ALL(typedCopy, kind, p);
  }

  void dynamicFree() {
    PLUME_DYNAMIC_TYPE_DISPATCH_ALL(typedDestroy, kind_);
  }

  [[noreturn]] void throwCheckIsKindError(TypeKind kind) const;

  [[noreturn]] void throwCheckPtrError() const;

 public:
  using MapEntries = std::vector<std::pair<Variant, Variant>>;

#define PLUME_VARIANT_SCALAR_MEMBERS(KIND)                                 \
  /* implicit */ Variant(                                                  \
      typename detail::VariantTypeTraits<KIND>::stored_type v)             \
      : ptr_{new detail::VariantTypeTraits<KIND>::stored_type(std::move(v))}, \
        kind_{KIND} {}

  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::BOOLEAN)
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::INTEGER)
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::BIGINT)
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::HUGEINT)
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::REAL)
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::DOUBLE)
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::DECIMAL)
  // VARBINARY shares std::string with VARCHAR. Use binary() for it.
  PLUME_VARIANT_SCALAR_MEMBERS(TypeKind::VARCHAR)
#undef PLUME_VARIANT_SCALAR_MEMBERS

  // Accepts 1LL where int64_t is 'long'. The template parameter keeps the
  // constructor out of overload resolution where the two types are equal.
  template <
      typename T = long long,
      std::enable_if_t<
          std::is_same_v<T, long long> && !std::is_same_v<long long, int64_t>,
          bool> = true>
  /* implicit */ Variant(const T& v) : Variant(static_cast<int64_t>(v)) {}

  /* implicit */ Variant(const char* str)
      : ptr_{new std::string{str}}, kind_{TypeKind::VARCHAR} {}

  static Variant row(const std::vector<Variant>& inputs) {
    return {TypeKind::ROW, new std::vector<Variant>(inputs)};
  }

  static Variant row(std::vector<Variant>&& inputs) {
    return {TypeKind::ROW, new std::vector<Variant>(std::move(inputs))};
  }

  static Variant array(const std::vector<Variant>& inputs) {
    return {TypeKind::ARRAY, new std::vector<Variant>(inputs)};
  }

  static Variant array(std::vector<Variant>&& inputs) {
    return {TypeKind::ARRAY, new std::vector<Variant>(std::move(inputs))};
  }

  /// Keys are expected to be unique. This is not verified.
  static Variant map(const MapEntries& inputs) {
    return {TypeKind::MAP, new MapEntries(inputs)};
  }

  static Variant map(MapEntries&& inputs) {
    return {TypeKind::MAP, new MapEntries(std::move(inputs))};
  }

  static Variant binary(std::string val) {
    return {TypeKind::VARBINARY, new std::string{std::move(val)}};
  }

  static Variant null(TypeKind kind) {
    return Variant{kind};
  }

  Variant() : ptr_{nullptr}, kind_{TypeKind::INVALID} {}

  /* implicit */ Variant(TypeKind kind) : ptr_{nullptr}, kind_{kind} {}

  Variant(const Variant& other) : ptr_{nullptr}, kind_{other.kind_} {
    if (other.ptr_ != nullptr) {
      dynamicCopy(other.ptr_, other.kind_);
    }
  }

  Variant(Variant&& other) noexcept
      : ptr_{std::exchange(other.ptr_, nullptr)}, kind_{other.kind_} {}

  // Copy and move assignment both go through the by-value parameter.
  Variant& operator=(Variant other) noexcept {
    std::swap(ptr_, other.ptr_);
    std::swap(kind_, other.kind_);
    return *this;
  }

  ~Variant() {
    if (ptr_ != nullptr) {
      dynamicFree();
    }
  }

  /// Kind-aware equality. Nulls of the same kind are equal and NaN equals NaN.
  bool equals(const Variant& other) const;

  /// Returns a human readable rendering of the value, e.g. [1, null, 3].
  std::string toString() const;

  bool isNull() const {
    return ptr_ == nullptr;
  }

  void checkPtr() const {
    if (ptr_ == nullptr) {
      throwCheckPtrError();
    }
  }

  void checkIsKind(TypeKind kind) const {
    if (kind_ != kind) {
      throwCheckIsKindError(kind);
    }
  }

  TypeKind kind() const {
    return kind_;
  }

  template <TypeKind KIND>
  const auto& value() const {
    checkIsKind(KIND);
    checkPtr();

    return *static_cast<
        const typename detail::VariantTypeTraits<KIND>::stored_type*>(ptr_);
  }

  const std::vector<Variant>& row() const {
    return value<TypeKind::ROW>();
  }

  const MapEntries& map() const {
    return value<TypeKind::MAP>();
  }

  const std::vector<Variant>& array() const {
    return value<TypeKind::ARRAY>();
  }

  /// Returns the field at 'index' of a non-null ROW value. Throws a user error
  /// if the row has fewer fields.
  const Variant& field(size_t index) const;

  friend std::ostream& operator<<(std::ostream& os, const Variant& value) {
    return os << value.toString();
  }

 private:
  const void* ptr_;
  TypeKind kind_;
};

inline bool operator==(const Variant& a, const Variant& b) {
  return a.equals(b);
}

inline bool operator!=(const Variant& a, const Variant& b) {
  return !(a == b);
}

} // namespace facebook::plume
