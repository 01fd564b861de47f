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
#include <string>
#include <vector>

#include "plume/common/file/File.h"
#include "plume/dwio/avro/Encoder.h"
#include "plume/dwio/avro/WriterConfig.h"

namespace facebook::plume::dwio::avro {

/// Encoder producing the Avro binary encoding into a WriteFile.
///
/// ints, longs, union branch indices, item counts and length prefixes are
/// zig-zag varints. Floats and doubles are IEEE-754 little-endian. An array or
/// map is a sequence of (count, items) blocks terminated by a zero count; the
/// start markers emit nothing and setItemCount(0) emits nothing.
///
/// Bytes are collected in memory and appended to the file whenever the buffer
/// reaches the configured size and on flush(). The destructor does not flush:
/// the owner decides whether partially written data is kept.
class BinaryEncoder : public Encoder {
 public:
  BinaryEncoder(std::unique_ptr<WriteFile> file, const WriterConfig& config);

  void writeNull() override {}

  void writeBoolean(bool value) override;

  void writeInt(int32_t value) override;

  void writeLong(int64_t value) override;

  void writeFloat(float value) override;

  void writeDouble(double value) override;

  void writeString(std::string_view value) override;

  void writeBytes(std::string_view value) override;

  void writeFixed(std::string_view value) override;

  void writeArrayStart() override;

  void writeArrayEnd() override;

  void writeMapStart() override;

  void writeMapEnd() override;

  void setItemCount(int64_t count) override;

  void startItem() override;

  void writeIndex(int32_t index) override;

  /// Appends the buffered bytes to the file and flushes the file.
  void flush() override;

  uint64_t bytesWritten() const override {
    return bytesWritten_;
  }

  /// Number of bytes not yet appended to the file.
  uint64_t bufferedBytes() const {
    return buffer_.size();
  }

  WriteFile* file() const {
    return file_.get();
  }

 private:
  enum class BlockKind { kArray, kMap };

  struct Block {
    BlockKind kind;
    // Item count declared by the last setItemCount().
    int64_t expectedItems{0};
    int64_t startedItems{0};
  };

  static std::string_view blockKindName(BlockKind kind);

  void writeVarint(int64_t value);

  void write(std::string_view data);

  void maybeFlushBuffer();

  void flushBuffer();

  void startBlock(BlockKind kind);

  void endBlock(BlockKind kind);

  void checkBlockComplete(const Block& block) const;

  const std::unique_ptr<WriteFile> file_;
  const uint64_t bufferSize_;
  const bool validateItemCounts_;

  std::string buffer_;
  uint64_t bytesWritten_{0};
  // Open arrays and maps, innermost last. Only maintained when
  // validateItemCounts_ is set.
  std::vector<Block> blocks_;
};

} // namespace facebook::plume::dwio::avro
