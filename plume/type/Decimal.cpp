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

#include "plume/type/Decimal.h"

#include "plume/type/DecimalUtil.h"

namespace facebook::plume {

int32_t Decimal::precision() const {
  return DecimalUtil::numDigits(unscaledValue);
}

std::string Decimal::toString() const {
  return DecimalUtil::toString(unscaledValue, scale);
}

} // namespace facebook::plume
