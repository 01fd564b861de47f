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
#include <vector>

#include <folly/ThreadLocal.h>

#include "plume/dwio/avro/ValueWriter.h"

namespace facebook::plume::dwio::avro {

/// Factory of value writers. Writers without parameters are shared
/// singletons. Every other call returns a new writer.
class ValueWriters {
 public:
  /// Writes nothing. Accepts null values of any kind.
  static ValueWriterPtr nulls();

  /// BOOLEAN values as a single byte.
  static ValueWriterPtr booleans();

  /// INTEGER values through `Encoder::writeInt`.
  static ValueWriterPtr ints();

  /// BIGINT values through `Encoder::writeLong`.
  static ValueWriterPtr longs();

  /// REAL values through `Encoder::writeFloat`.
  static ValueWriterPtr floats();

  /// DOUBLE values through `Encoder::writeDouble`.
  static ValueWriterPtr doubles();

  /// VARCHAR values as length prefixed UTF-8.
  static ValueWriterPtr strings();

  /// HUGEINT values as 16 bytes: the high 64 bits big-endian followed by the
  /// low 64 bits big-endian.
  static ValueWriterPtr uuids();

  /// VARBINARY values of exactly 'length' bytes, without a length prefix.
  static ValueWriterPtr fixed(int32_t length);

  /// VARBINARY values as length prefixed bytes.
  static ValueWriterPtr bytes();

  /// DECIMAL values with the given scale and at most 'precision' digits as
  /// fixed size big-endian two's-complement. Throws if 'precision' is not in
  /// [1, 38].
  static ValueWriterPtr decimal(int32_t precision, int32_t scale);

  /// Union of null and the type of 'writer'. 'nullIndex' is the branch of
  /// null in the union and must be 0 or 1.
  static ValueWriterPtr option(int32_t nullIndex, ValueWriterPtr writer);

  /// ARRAY values as a single block of items followed by the terminator.
  static ValueWriterPtr array(ValueWriterPtr elementWriter);

  /// MAP values as an Avro array of key/value records.
  static ValueWriterPtr arrayMap(
      ValueWriterPtr keyWriter,
      ValueWriterPtr valueWriter);

  /// MAP values as an Avro map.
  static ValueWriterPtr map(
      ValueWriterPtr keyWriter,
      ValueWriterPtr valueWriter);

  /// ROW values: field i is written by writers[i]. Writes no framing of its
  /// own.
  static ValueWriterPtr record(std::vector<ValueWriterPtr> writers);
};

class NullWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class BooleanWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class IntegerWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class LongWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class FloatWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class DoubleWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class StringWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class BytesWriter : public ValueWriter {
 public:
  void write(const Variant& value, Encoder& encoder) const override;
};

class UuidWriter : public ValueWriter {
 public:
  static constexpr int32_t kLength = 16;

  UuidWriter();

  void write(const Variant& value, Encoder& encoder) const override;

 private:
  folly::ThreadLocal<std::vector<char>> buffer_;
};

class FixedWriter : public ValueWriter {
 public:
  explicit FixedWriter(int32_t length);

  void write(const Variant& value, Encoder& encoder) const override;

  int32_t length() const {
    return length_;
  }

 private:
  const int32_t length_;
};

class DecimalWriter : public ValueWriter {
 public:
  DecimalWriter(int32_t precision, int32_t scale);

  void write(const Variant& value, Encoder& encoder) const override;

  int32_t precision() const {
    return precision_;
  }

  int32_t scale() const {
    return scale_;
  }

  /// Number of bytes written per value.
  int32_t length() const {
    return length_;
  }

 private:
  const int32_t precision_;
  const int32_t scale_;
  const int32_t length_;
  // Holds the encoded value during one write() call.
  folly::ThreadLocal<std::vector<char>> buffer_;
};

class OptionWriter : public ValueWriter {
 public:
  OptionWriter(int32_t nullIndex, ValueWriterPtr valueWriter);

  void write(const Variant& value, Encoder& encoder) const override;

  int32_t nullIndex() const {
    return nullIndex_;
  }

  int32_t valueIndex() const {
    return valueIndex_;
  }

 private:
  const int32_t nullIndex_;
  const int32_t valueIndex_;
  const ValueWriterPtr valueWriter_;
};

class ArrayWriter : public ValueWriter {
 public:
  explicit ArrayWriter(ValueWriterPtr elementWriter);

  void write(const Variant& value, Encoder& encoder) const override;

 private:
  const ValueWriterPtr elementWriter_;
};

class ArrayMapWriter : public ValueWriter {
 public:
  ArrayMapWriter(ValueWriterPtr keyWriter, ValueWriterPtr valueWriter);

  void write(const Variant& value, Encoder& encoder) const override;

 private:
  const ValueWriterPtr keyWriter_;
  const ValueWriterPtr valueWriter_;
};

class MapWriter : public ValueWriter {
 public:
  MapWriter(ValueWriterPtr keyWriter, ValueWriterPtr valueWriter);

  void write(const Variant& value, Encoder& encoder) const override;

 private:
  const ValueWriterPtr keyWriter_;
  const ValueWriterPtr valueWriter_;
};

class RecordWriter : public ValueWriter {
 public:
  explicit RecordWriter(std::vector<ValueWriterPtr> writers);

  /// Sets the exception context to the index of the field being written so
  /// that errors from nested writers name the failing field.
  void write(const Variant& value, Encoder& encoder) const override;

  size_t numFields() const {
    return writers_.size();
  }

 private:
  const std::vector<ValueWriterPtr> writers_;
};

} // namespace facebook::plume::dwio::avro
