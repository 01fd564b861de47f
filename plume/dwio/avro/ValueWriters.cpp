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

#include "plume/dwio/avro/ValueWriters.h"

#include <cstring>

#include <folly/lang/Bits.h>
#include <glog/logging.h>

#include "plume/common/base/Exceptions.h"
#include "plume/type/DecimalUtil.h"

namespace facebook::plume::dwio::avro {

ValueWriterPtr ValueWriters::nulls() {
  static const auto kInstance = std::make_shared<const NullWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::booleans() {
  static const auto kInstance = std::make_shared<const BooleanWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::ints() {
  static const auto kInstance = std::make_shared<const IntegerWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::longs() {
  static const auto kInstance = std::make_shared<const LongWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::floats() {
  static const auto kInstance = std::make_shared<const FloatWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::doubles() {
  static const auto kInstance = std::make_shared<const DoubleWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::strings() {
  static const auto kInstance = std::make_shared<const StringWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::uuids() {
  static const auto kInstance = std::make_shared<const UuidWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::fixed(int32_t length) {
  return std::make_shared<const FixedWriter>(length);
}

ValueWriterPtr ValueWriters::bytes() {
  static const auto kInstance = std::make_shared<const BytesWriter>();
  return kInstance;
}

ValueWriterPtr ValueWriters::decimal(int32_t precision, int32_t scale) {
  auto writer = std::make_shared<const DecimalWriter>(precision, scale);
  VLOG(1) << "Writing decimal(" << precision << "," << scale << ") as "
          << writer->length() << " bytes";
  return writer;
}

ValueWriterPtr ValueWriters::option(int32_t nullIndex, ValueWriterPtr writer) {
  auto optionWriter =
      std::make_shared<const OptionWriter>(nullIndex, std::move(writer));
  VLOG(1) << "Writing option with null at branch "
          << optionWriter->nullIndex() << " and value at branch "
          << optionWriter->valueIndex();
  return optionWriter;
}

ValueWriterPtr ValueWriters::array(ValueWriterPtr elementWriter) {
  return std::make_shared<const ArrayWriter>(std::move(elementWriter));
}

ValueWriterPtr ValueWriters::arrayMap(
    ValueWriterPtr keyWriter,
    ValueWriterPtr valueWriter) {
  return std::make_shared<const ArrayMapWriter>(
      std::move(keyWriter), std::move(valueWriter));
}

ValueWriterPtr ValueWriters::map(
    ValueWriterPtr keyWriter,
    ValueWriterPtr valueWriter) {
  return std::make_shared<const MapWriter>(
      std::move(keyWriter), std::move(valueWriter));
}

ValueWriterPtr ValueWriters::record(std::vector<ValueWriterPtr> writers) {
  return std::make_shared<const RecordWriter>(std::move(writers));
}

void NullWriter::write(const Variant& value, Encoder& encoder) const {
  PLUME_USER_CHECK(
      value.isNull(), "Cannot write non-null {} value as null", value.kind());
  encoder.writeNull();
}

void BooleanWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeBoolean(value.value<TypeKind::BOOLEAN>());
}

void IntegerWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeInt(value.value<TypeKind::INTEGER>());
}

void LongWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeLong(value.value<TypeKind::BIGINT>());
}

void FloatWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeFloat(value.value<TypeKind::REAL>());
}

void DoubleWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeDouble(value.value<TypeKind::DOUBLE>());
}

void StringWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeString(value.value<TypeKind::VARCHAR>());
}

void BytesWriter::write(const Variant& value, Encoder& encoder) const {
  encoder.writeBytes(value.value<TypeKind::VARBINARY>());
}

UuidWriter::UuidWriter()
    : buffer_([]() { return new std::vector<char>(kLength); }) {}

void UuidWriter::write(const Variant& value, Encoder& encoder) const {
  const auto uuid = value.value<TypeKind::HUGEINT>();
  auto& buffer = *buffer_;
  const auto hi = folly::Endian::big(HugeInt::upper(uuid));
  const auto lo = folly::Endian::big(HugeInt::lower(uuid));
  std::memcpy(buffer.data(), &hi, sizeof(hi));
  std::memcpy(buffer.data() + sizeof(hi), &lo, sizeof(lo));
  encoder.writeFixed(std::string_view(buffer.data(), kLength));
}

FixedWriter::FixedWriter(int32_t length) : length_(length) {
  PLUME_USER_CHECK_GE(length_, 0, "Fixed length must not be negative");
}

void FixedWriter::write(const Variant& value, Encoder& encoder) const {
  const auto& bytes = value.value<TypeKind::VARBINARY>();
  if (static_cast<int64_t>(bytes.size()) != length_) {
    PLUME_USER_FAIL(
        "Cannot write byte array of length {} as fixed[{}]",
        bytes.size(),
        length_);
  }
  encoder.writeFixed(bytes);
}

DecimalWriter::DecimalWriter(int32_t precision, int32_t scale)
    : precision_(precision),
      scale_(scale),
      length_(DecimalUtil::requiredBytes(precision)),
      buffer_([length = length_]() { return new std::vector<char>(length); }) {}

void DecimalWriter::write(const Variant& value, Encoder& encoder) const {
  const auto& decimal = value.value<TypeKind::DECIMAL>();
  if (decimal.scale != scale_) {
    PLUME_USER_FAIL(
        "Cannot write value as decimal({},{}), wrong scale: "
        "unscaled {}, scale {}",
        precision_,
        scale_,
        std::to_string(decimal.unscaledValue),
        decimal.scale);
  }
  if (decimal.precision() > precision_) {
    PLUME_USER_FAIL(
        "Cannot write value as decimal({},{}), too large: "
        "unscaled {}, scale {}",
        precision_,
        scale_,
        std::to_string(decimal.unscaledValue),
        decimal.scale);
  }

  char unscaled[sizeof(int128_t)];
  const auto unscaledLength =
      DecimalUtil::toByteArray(decimal.unscaledValue, unscaled);
  auto& buffer = *buffer_;
  const auto offset = length_ - unscaledLength;
  const char fillByte = decimal.unscaledValue < 0 ? '\xFF' : '\x00';
  std::memset(buffer.data(), fillByte, offset);
  std::memcpy(buffer.data() + offset, unscaled, unscaledLength);
  encoder.writeFixed(std::string_view(buffer.data(), length_));
}

OptionWriter::OptionWriter(int32_t nullIndex, ValueWriterPtr valueWriter)
    : nullIndex_(nullIndex),
      valueIndex_([nullIndex]() {
        if (nullIndex == 0) {
          return 1;
        }
        if (nullIndex == 1) {
          return 0;
        }
        PLUME_USER_FAIL("Invalid option index: {}", nullIndex);
      }()),
      valueWriter_(std::move(valueWriter)) {
  PLUME_CHECK_NOT_NULL(valueWriter_, "Option value writer must not be null");
}

void OptionWriter::write(const Variant& value, Encoder& encoder) const {
  if (value.isNull()) {
    encoder.writeIndex(nullIndex_);
  } else {
    encoder.writeIndex(valueIndex_);
    valueWriter_->write(value, encoder);
  }
}

ArrayWriter::ArrayWriter(ValueWriterPtr elementWriter)
    : elementWriter_(std::move(elementWriter)) {
  PLUME_CHECK_NOT_NULL(
      elementWriter_, "Array element writer must not be null");
}

void ArrayWriter::write(const Variant& value, Encoder& encoder) const {
  const auto& elements = value.array();
  encoder.writeArrayStart();
  encoder.setItemCount(elements.size());
  for (const auto& element : elements) {
    encoder.startItem();
    elementWriter_->write(element, encoder);
  }
  encoder.writeArrayEnd();
}

ArrayMapWriter::ArrayMapWriter(
    ValueWriterPtr keyWriter,
    ValueWriterPtr valueWriter)
    : keyWriter_(std::move(keyWriter)), valueWriter_(std::move(valueWriter)) {
  PLUME_CHECK_NOT_NULL(keyWriter_, "Map key writer must not be null");
  PLUME_CHECK_NOT_NULL(valueWriter_, "Map value writer must not be null");
}

void ArrayMapWriter::write(const Variant& value, Encoder& encoder) const {
  const auto& entries = value.map();
  encoder.writeArrayStart();
  encoder.setItemCount(entries.size());
  for (const auto& [key, mapValue] : entries) {
    encoder.startItem();
    keyWriter_->write(key, encoder);
    valueWriter_->write(mapValue, encoder);
  }
  encoder.writeArrayEnd();
}

MapWriter::MapWriter(ValueWriterPtr keyWriter, ValueWriterPtr valueWriter)
    : keyWriter_(std::move(keyWriter)), valueWriter_(std::move(valueWriter)) {
  PLUME_CHECK_NOT_NULL(keyWriter_, "Map key writer must not be null");
  PLUME_CHECK_NOT_NULL(valueWriter_, "Map value writer must not be null");
}

void MapWriter::write(const Variant& value, Encoder& encoder) const {
  const auto& entries = value.map();
  encoder.writeMapStart();
  encoder.setItemCount(entries.size());
  for (const auto& [key, mapValue] : entries) {
    encoder.startItem();
    keyWriter_->write(key, encoder);
    valueWriter_->write(mapValue, encoder);
  }
  encoder.writeMapEnd();
}

namespace {
struct RecordFieldContext {
  size_t index;
  // Context of the enclosing record, if any.
  ExceptionContext parent;
};

std::string recordFieldContextMessage(void* arg) {
  auto* context = static_cast<RecordFieldContext*>(arg);
  auto parent = context->parent.message();
  if (parent.empty()) {
    return fmt::format("record field {}", context->index);
  }
  return fmt::format("{}, record field {}", parent, context->index);
}
} // namespace

RecordWriter::RecordWriter(std::vector<ValueWriterPtr> writers)
    : writers_(std::move(writers)) {
  for (const auto& writer : writers_) {
    PLUME_CHECK_NOT_NULL(writer, "Record field writer must not be null");
  }
}

void RecordWriter::write(const Variant& value, Encoder& encoder) const {
  RecordFieldContext context{0, getExceptionContext()};
  ExceptionContextSetter setter({recordFieldContextMessage, &context});
  for (size_t i = 0; i < writers_.size(); ++i) {
    context.index = i;
    writers_[i]->write(value.field(i), encoder);
  }
}

} // namespace facebook::plume::dwio::avro
