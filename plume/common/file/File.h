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

// Abstraction of a simplified write-only file interface.
//
// Writers only ever append bytes. Storage backed implementations live with
// the storage layer; an in-memory implementation is available here.
//
// All functions are not threadsafe -- external locking is required, even
// for const member functions.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "plume/common/base/Exceptions.h"

namespace facebook::plume {

// A write-only file. Nothing written to the file should be read back until it
// is closed.
class WriteFile {
 public:
  virtual ~WriteFile() = default;

  // Appends data to the end of the file.
  virtual void append(std::string_view data) = 0;

  // Flushes any local buffers, i.e. ensures the backing medium received
  // all data that has been appended.
  virtual void flush() = 0;

  // Close the file. Any cleanup (disk flush, etc.) will be done here.
  virtual void close() = 0;

  /// Current file size, i.e. the sum of all previous Appends.  No flush should
  /// be needed to get the exact size written, and this should be able to be
  /// called after the file close.
  virtual uint64_t size() const = 0;
};

// We currently do a simple implementation for the in-memory files
// that simply resizes a string as needed.
class InMemoryWriteFile final : public WriteFile {
 public:
  explicit InMemoryWriteFile(std::string* file) : file_(file) {}

  void append(std::string_view data) final;

  void flush() final {}

  void close() final {
    closed_ = true;
  }

  uint64_t size() const final;

 private:
  std::string* file_;
  bool closed_{false};
};

} // namespace facebook::plume
