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

#include "bugsift/ext/base/temp_file.h"

#include <stdlib.h>
#include <unistd.h>

#include <new>
#include <utility>

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/string_utils.h"

namespace bugsift {
namespace base {

std::string GetSysTempDir() {
  const char* tmpdir = getenv("TMPDIR");
  if (tmpdir)
    return base::StripSuffix(tmpdir, "/");
  return "/tmp";
}

// static
TempFile TempFile::Create() {
  TempFile temp_file;
  temp_file.path_ = GetSysTempDir() + "/bugsift-XXXXXXXX";
  temp_file.fd_ = mkstemp(&temp_file.path_[0]);
  if (BUGSIFT_UNLIKELY(temp_file.fd_ < 0)) {
    BUGSIFT_FATAL("Could not create temp file %s", temp_file.path_.c_str());
  }
  return temp_file;
}

TempFile::TempFile() = default;

TempFile::TempFile(TempFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {
  other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
  if (this != &other) {
    this->~TempFile();
    new (this) TempFile(std::move(other));
  }
  return *this;
}

TempFile::~TempFile() {
  Unlink();
  if (fd_ >= 0)
    close(fd_);
  fd_ = -1;
}

void TempFile::Unlink() {
  if (path_.empty())
    return;
  BUGSIFT_CHECK(unlink(path_.c_str()) == 0);
  path_.clear();
}

}  // namespace base
}  // namespace bugsift
