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

#ifndef INCLUDE_BUGSIFT_EXT_BASE_FILE_UTILS_H_
#define INCLUDE_BUGSIFT_EXT_BASE_FILE_UTILS_H_

#include <stddef.h>
#include <sys/types.h>

#include <string>

namespace bugsift {
namespace base {

// Appends the whole content of |fd| (or |path|) to |out|. Returns false on
// I/O errors, in which case errno is preserved for the caller.
bool ReadFileDescriptor(int fd, std::string* out);
bool ReadFile(const std::string& path, std::string* out);

// A wrapper around read(2) that deals with EINTR. Has the same semantics of
// UNIX's read(2).
ssize_t Read(int fd, void* dst, size_t dst_size);

// Call write() until all data is written or an error is detected.
ssize_t WriteAll(int fd, const void* buf, size_t count);

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_EXT_BASE_FILE_UTILS_H_
