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

#ifndef INCLUDE_BUGSIFT_EXT_BASE_STATUS_MACROS_H_
#define INCLUDE_BUGSIFT_EXT_BASE_STATUS_MACROS_H_

#include "bugsift/base/status.h"
#include "bugsift/ext/base/status_or.h"

// Evaluates |expr|, which should return a base::Status. If the status is an
// error status, returns the status from the current function.
#define RETURN_IF_ERROR(expr)                                \
  do {                                                       \
    ::bugsift::base::Status status_macro_internal_status =   \
        (expr);                                              \
    if (!status_macro_internal_status.ok())                  \
      return status_macro_internal_status;                   \
  } while (0)

#define BUGSIFT_INTERNAL_CONCAT_IMPL(x, y) x##y
#define BUGSIFT_INTERNAL_CONCAT(x, y) BUGSIFT_INTERNAL_CONCAT_IMPL(x, y)

#define BUGSIFT_INTERNAL_ASSIGN_OR_RETURN_IMPL(var, lhs, rhs) \
  auto var = (rhs);                                           \
  if (!var.ok())                                              \
    return var.status();                                      \
  lhs = std::move(var.value())

// Evalues |rhs|, which should return a base::StatusOr<T>. If the status is an
// error status, returns the status from the current function. Otherwise,
// assigns the value to |lhs|, which may be a declaration.
#define ASSIGN_OR_RETURN(lhs, rhs)                                          \
  BUGSIFT_INTERNAL_ASSIGN_OR_RETURN_IMPL(                                   \
      BUGSIFT_INTERNAL_CONCAT(status_or_internal_var_, __LINE__), lhs, rhs)

#endif  // INCLUDE_BUGSIFT_EXT_BASE_STATUS_MACROS_H_
