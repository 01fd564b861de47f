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
#include <string_view>

namespace facebook::plume::dwio::avro {

/// Destination of the Avro binary encoding. Value writers call the primitive
/// operations for leaf values and the structural operations to frame arrays,
/// maps and unions.
///
/// Arrays and maps are written as
///   writeArrayStart, setItemCount(n), n x (startItem, <item>), writeArrayEnd
/// and the same with writeMapStart/writeMapEnd, where each map item is a key
/// followed by a value.
///
/// Implementations may buffer. Failures of the underlying storage are raised
/// from whichever call hits them.
class Encoder {
 public:
  virtual ~Encoder() = default;

  virtual void writeNull() = 0;

  virtual void writeBoolean(bool value) = 0;

  virtual void writeInt(int32_t value) = 0;

  virtual void writeLong(int64_t value) = 0;

  virtual void writeFloat(float value) = 0;

  virtual void writeDouble(double value) = 0;

  /// Length prefixed UTF-8 bytes.
  virtual void writeString(std::string_view value) = 0;

  /// Length prefixed raw bytes.
  virtual void writeBytes(std::string_view value) = 0;

  /// Raw bytes without a length prefix. The reader knows the length from the
  /// schema.
  virtual void writeFixed(std::string_view value) = 0;

  virtual void writeArrayStart() = 0;

  virtual void writeArrayEnd() = 0;

  virtual void writeMapStart() = 0;

  virtual void writeMapEnd() = 0;

  /// Declares the number of items of the next block of the innermost open
  /// array or map.
  virtual void setItemCount(int64_t count) = 0;

  virtual void startItem() = 0;

  /// Writes the branch index of a union.
  virtual void writeIndex(int32_t index) = 0;

  virtual void flush() = 0;

  /// Total number of bytes written so far, including buffered bytes.
  virtual uint64_t bytesWritten() const = 0;
};

} // namespace facebook::plume::dwio::avro
