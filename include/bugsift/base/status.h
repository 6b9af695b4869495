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

#ifndef INCLUDE_BUGSIFT_BASE_STATUS_H_
#define INCLUDE_BUGSIFT_BASE_STATUS_H_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "bugsift/base/compiler.h"
#include "bugsift/base/logging.h"

namespace bugsift {
namespace base {

// Outcome of an operation: either OK or an error message.
//
// An error can carry payloads keyed by a type URL (e.g.
// "bugsift.dev/ConflictingItem" -> "ANR.activity"), which let callers tell
// kinds of failures apart without matching on the message.
class Status {
 public:
  Status() = default;
  explicit Status(std::string msg) : ok_(false), message_(std::move(msg)) {
    BUGSIFT_CHECK(!message_.empty());
  }

  bool ok() const { return ok_; }

  // The error message, empty for an OK status.
  const std::string& message() const { return message_; }
  const char* c_message() const { return message_.c_str(); }

  // Returns the payload stored under |type_url|, if any.
  std::optional<std::string_view> GetPayload(std::string_view type_url) const;

  // Stores |value| under |type_url|, replacing any previous value. OK
  // statuses never carry payloads and ignore this.
  void SetPayload(std::string_view type_url, std::string value);

 private:
  bool ok_ = true;
  std::string message_;
  std::map<std::string, std::string, std::less<>> payloads_;
};

inline Status OkStatus() {
  return Status();
}

// printf-style error. Messages longer than 1KB are truncated.
Status ErrStatus(const char* format, ...) BUGSIFT_PRINTF_FORMAT(1, 2);

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_BASE_STATUS_H_
