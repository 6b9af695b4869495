/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "bugsift/base/status.h"

#include <stdarg.h>
#include <stdio.h>

namespace bugsift {
namespace base {

Status ErrStatus(const char* format, ...) {
  char buffer[1024];
  va_list ap;
  va_start(ap, format);
  vsnprintf(buffer, sizeof(buffer), format, ap);
  va_end(ap);
  return Status(buffer);
}

std::optional<std::string_view> Status::GetPayload(
    std::string_view type_url) const {
  auto it = payloads_.find(type_url);
  if (it == payloads_.end())
    return std::nullopt;
  return std::string_view(it->second);
}

void Status::SetPayload(std::string_view type_url, std::string value) {
  if (ok_)
    return;
  payloads_.insert_or_assign(std::string(type_url), std::move(value));
}

}  // namespace base
}  // namespace bugsift
