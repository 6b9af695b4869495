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

#ifndef INCLUDE_BUGSIFT_EXT_BASE_STATUS_OR_H_
#define INCLUDE_BUGSIFT_EXT_BASE_STATUS_OR_H_

#include <optional>

#include "bugsift/base/status.h"

namespace bugsift {
namespace base {

// Either a |T| or the error Status explaining why there is none.
template <typename T>
class StatusOr {
 public:
  // Both constructors are implicit so that functions can return either a
  // value or ErrStatus(...) directly.
  StatusOr(Status status) : status_(std::move(status)) {
    if (status_.ok())
      BUGSIFT_FATAL("StatusOr built from an OK status without a value");
  }
  StatusOr(T value) : value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }

  T& value() {
    BUGSIFT_DCHECK(ok());
    return *value_;
  }
  const T& value() const {
    BUGSIFT_DCHECK(ok());
    return *value_;
  }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

 private:
  Status status_;
  std::optional<T> value_;
};

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_EXT_BASE_STATUS_OR_H_
