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

#include <memory>

#include "plume/dwio/avro/Encoder.h"
#include "plume/type/Variant.h"

namespace facebook::plume::dwio::avro {

/// Writes values of one schema node to an Encoder. Writers are immutable once
/// constructed and may be shared by concurrent write calls, each with its own
/// Encoder.
class ValueWriter {
 public:
  virtual ~ValueWriter() = default;

  /// Writes 'value' to 'encoder'. Throws PlumeUserError if 'value' does not
  /// match what the writer accepts. Bytes already written for 'value' are not
  /// rolled back.
  virtual void write(const Variant& value, Encoder& encoder) const = 0;
};

using ValueWriterPtr = std::shared_ptr<const ValueWriter>;

} // namespace facebook::plume::dwio::avro
