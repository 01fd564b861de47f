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

#include "plume/dwio/avro/BinaryEncoder.h"

#include <cstring>

#include <folly/lang/Bits.h>
#include <glog/logging.h>

#include "plume/common/encode/Coding.h"

namespace facebook::plume::dwio::avro {

BinaryEncoder::BinaryEncoder(
    std::unique_ptr<WriteFile> file,
    const WriterConfig& config)
    : file_(std::move(file)),
      bufferSize_(config.bufferSize()),
      validateItemCounts_(config.validateItemCounts()) {
  PLUME_CHECK_NOT_NULL(file_);
  buffer_.reserve(bufferSize_);
}

void BinaryEncoder::writeBoolean(bool value) {
  const char byte = value ? 1 : 0;
  write(std::string_view(&byte, 1));
}

void BinaryEncoder::writeInt(int32_t value) {
  writeVarint(value);
}

void BinaryEncoder::writeLong(int64_t value) {
  writeVarint(value);
}

void BinaryEncoder::writeFloat(float value) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  bits = folly::Endian::little(bits);
  write(std::string_view(reinterpret_cast<const char*>(&bits), sizeof(bits)));
}

void BinaryEncoder::writeDouble(double value) {
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  bits = folly::Endian::little(bits);
  write(std::string_view(reinterpret_cast<const char*>(&bits), sizeof(bits)));
}

void BinaryEncoder::writeString(std::string_view value) {
  writeBytes(value);
}

void BinaryEncoder::writeBytes(std::string_view value) {
  writeVarint(value.size());
  write(value);
}

void BinaryEncoder::writeFixed(std::string_view value) {
  write(value);
}

void BinaryEncoder::writeArrayStart() {
  startBlock(BlockKind::kArray);
}

void BinaryEncoder::writeArrayEnd() {
  endBlock(BlockKind::kArray);
}

void BinaryEncoder::writeMapStart() {
  startBlock(BlockKind::kMap);
}

void BinaryEncoder::writeMapEnd() {
  endBlock(BlockKind::kMap);
}

void BinaryEncoder::setItemCount(int64_t count) {
  PLUME_CHECK_GE(count, 0, "Item count must not be negative");
  if (validateItemCounts_) {
    PLUME_CHECK(
        !blocks_.empty(), "setItemCount called outside of an array or map");
    auto& block = blocks_.back();
    checkBlockComplete(block);
    block.expectedItems = count;
    block.startedItems = 0;
  }
  if (count > 0) {
    writeVarint(count);
  }
}

void BinaryEncoder::startItem() {
  if (!validateItemCounts_) {
    return;
  }
  PLUME_CHECK(!blocks_.empty(), "startItem called outside of an array or map");
  auto& block = blocks_.back();
  PLUME_CHECK_LT(
      block.startedItems,
      block.expectedItems,
      "More items than the declared item count in {}",
      blockKindName(block.kind));
  ++block.startedItems;
}

void BinaryEncoder::writeIndex(int32_t index) {
  writeVarint(index);
}

void BinaryEncoder::flush() {
  flushBuffer();
  file_->flush();
}

std::string_view BinaryEncoder::blockKindName(BlockKind kind) {
  switch (kind) {
    case BlockKind::kArray:
      return "array";
    case BlockKind::kMap:
      return "map";
  }
  PLUME_UNREACHABLE();
}

void BinaryEncoder::writeVarint(int64_t value) {
  char buffer[Varint::kMaxSize64];
  char* end = buffer;
  Varint::encode(ZigZag::encode(value), &end);
  write(std::string_view(buffer, end - buffer));
}

void BinaryEncoder::write(std::string_view data) {
  buffer_.append(data.data(), data.size());
  bytesWritten_ += data.size();
  maybeFlushBuffer();
}

void BinaryEncoder::maybeFlushBuffer() {
  if (buffer_.size() >= bufferSize_) {
    flushBuffer();
  }
}

void BinaryEncoder::flushBuffer() {
  if (buffer_.empty()) {
    return;
  }
  VLOG(1) << "Appending " << buffer_.size() << " bytes to Avro output file";
  file_->append(buffer_);
  buffer_.clear();
}

void BinaryEncoder::startBlock(BlockKind kind) {
  if (validateItemCounts_) {
    blocks_.push_back(Block{kind});
  }
}

void BinaryEncoder::endBlock(BlockKind kind) {
  if (validateItemCounts_) {
    PLUME_CHECK(
        !blocks_.empty() && blocks_.back().kind == kind,
        "End of {} without a matching start",
        blockKindName(kind));
    checkBlockComplete(blocks_.back());
    blocks_.pop_back();
  }
  writeVarint(0);
}

void BinaryEncoder::checkBlockComplete(const Block& block) const {
  PLUME_CHECK_EQ(
      block.startedItems,
      block.expectedItems,
      "Item count mismatch in {}: declared {} items, wrote {}",
      blockKindName(block.kind),
      block.expectedItems,
      block.startedItems);
}

} // namespace facebook::plume::dwio::avro
