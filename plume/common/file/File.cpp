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

#include "plume/common/file/File.h"

namespace facebook::plume {

void InMemoryWriteFile::append(std::string_view data) {
  PLUME_CHECK(!closed_, "Cannot append to a closed file");
  file_->append(data);
}

uint64_t InMemoryWriteFile::size() const {
  return file_->size();
}

} // namespace facebook::plume
