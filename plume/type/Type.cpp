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

#include "plume/type/Type.h"

namespace facebook::plume {

std::string mapTypeKindToName(const TypeKind& typeKind) {
  switch (typeKind) {
    case TypeKind::BOOLEAN:
      return "BOOLEAN";
    case TypeKind::INTEGER:
      return "INTEGER";
    case TypeKind::BIGINT:
      return "BIGINT";
    case TypeKind::HUGEINT:
      return "HUGEINT";
    case TypeKind::REAL:
      return "REAL";
    case TypeKind::DOUBLE:
      return "DOUBLE";
    case TypeKind::VARCHAR:
      return "VARCHAR";
    case TypeKind::VARBINARY:
      return "VARBINARY";
    case TypeKind::DECIMAL:
      return "DECIMAL";
    case TypeKind::ARRAY:
      return "ARRAY";
    case TypeKind::MAP:
      return "MAP";
    case TypeKind::ROW:
      return "ROW";
    case TypeKind::UNKNOWN:
      return "UNKNOWN";
    case TypeKind::INVALID:
      return "INVALID";
  }
  return fmt::format("UNKNOWN_KIND({})", static_cast<int>(typeKind));
}

std::ostream& operator<<(std::ostream& os, const TypeKind& kind) {
  return os << mapTypeKindToName(kind);
}

} // namespace facebook::plume
