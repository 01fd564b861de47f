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

#include "plume/common/base/Exceptions.h"

#include <gflags/gflags.h>
#include <glog/logging.h>

DECLARE_bool(plume_exception_log_failures);

namespace facebook::plume::detail {

template <typename Exception>
void checkFail(const CheckFailArgs& args, std::string message) {
  if (FLAGS_plume_exception_log_failures) {
    LOG(ERROR) << "Check failed at " << args.location.file << ":"
               << args.location.line << " in " << args.location.function
               << " [" << args.errorCode << "] " << args.expression << " "
               << message;
  }
  throw Exception(
      args.location, args.expression, std::move(message), args.errorCode);
}

template void checkFail<PlumeRuntimeError>(
    const CheckFailArgs& args,
    std::string message);
template void checkFail<PlumeUserError>(
    const CheckFailArgs& args,
    std::string message);

} // namespace facebook::plume::detail
