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

#ifndef INCLUDE_BUGSIFT_EXT_BASE_TEMP_FILE_H_
#define INCLUDE_BUGSIFT_EXT_BASE_TEMP_FILE_H_

#include <string>

namespace bugsift {
namespace base {

std::string GetSysTempDir();

// A file under the system temp directory, unlinked and closed on destruction.
class TempFile {
 public:
  static TempFile Create();

  TempFile(TempFile&&) noexcept;
  TempFile& operator=(TempFile&&) noexcept;
  ~TempFile();

  const std::string& path() const { return path_; }
  int fd() const { return fd_; }

  // Unlinks the file from the filesystem but keeps the fd() open.
  void Unlink();

 private:
  TempFile();
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  int fd_ = -1;
  std::string path_;
};

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_EXT_BASE_TEMP_FILE_H_
