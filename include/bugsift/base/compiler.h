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

#ifndef INCLUDE_BUGSIFT_BASE_COMPILER_H_
#define INCLUDE_BUGSIFT_BASE_COMPILER_H_

#if defined(__GNUC__) || defined(__clang__)
#define BUGSIFT_LIKELY(_x) __builtin_expect(!!(_x), 1)
#define BUGSIFT_UNLIKELY(_x) __builtin_expect(!!(_x), 0)
#else
#define BUGSIFT_LIKELY(_x) (_x)
#define BUGSIFT_UNLIKELY(_x) (_x)
#endif

#if defined(__GNUC__) || defined(__clang__)
#define BUGSIFT_PRINTF_FORMAT(x, y) \
  __attribute__((__format__(__printf__, x, y)))
#else
#define BUGSIFT_PRINTF_FORMAT(x, y)
#endif

namespace bugsift {
namespace base {

template <typename... T>
inline void ignore_result(const T&...) {}

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_BASE_COMPILER_H_
