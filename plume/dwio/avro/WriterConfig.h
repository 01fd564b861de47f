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
#include <memory>
#include <string>

#include "plume/common/base/Exceptions.h"

namespace facebook::plume::config {
class ConfigBase;
}

namespace facebook::plume::dwio::avro {

/// Avro writer configs.
class WriterConfig {
 public:
  /// In-memory buffer size of the binary encoder before the bytes are appended
  /// to the underlying file. A capacity string such as "64KB".
  static constexpr const char* kBufferSize = "avro.encoder.buffer-size";

  /// Whether the binary encoder keeps track of open arrays and maps and
  /// verifies that the number of items matches the declared item count.
  static constexpr const char* kValidateItemCounts =
      "avro.encoder.validate-item-counts";

  WriterConfig(std::shared_ptr<const config::ConfigBase> config);

  const std::shared_ptr<const config::ConfigBase>& config() const {
    return config_;
  }

  uint64_t bufferSize() const;

  bool validateItemCounts() const;

 private:
  std::shared_ptr<const config::ConfigBase> config_;
};

} // namespace facebook::plume::dwio::avro
