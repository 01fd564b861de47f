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

#include "plume/dwio/avro/WriterConfig.h"

#include "plume/common/config/Config.h"

namespace facebook::plume::dwio::avro {

WriterConfig::WriterConfig(std::shared_ptr<const config::ConfigBase> config) {
  PLUME_CHECK_NOT_NULL(
      config, "Config is null for WriterConfig initialization");
  config_ = std::move(config);
}

uint64_t WriterConfig::bufferSize() const {
  const auto size = config::toCapacity(
      config_->get<std::string>(kBufferSize, "64KB"),
      config::CapacityUnit::BYTE);
  PLUME_USER_CHECK_GT(size, 0, "{} must be positive", kBufferSize);
  return size;
}

bool WriterConfig::validateItemCounts() const {
  return config_->get<bool>(kValidateItemCounts, true);
}

} // namespace facebook::plume::dwio::avro
