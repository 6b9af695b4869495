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

#include "bugsift/ext/base/file_utils.h"

#include <errno.h>

#include "bugsift/ext/base/temp_file.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace base {
namespace {

TEST(FileUtilsTest, ReadWriteFile) {
  TempFile tmp = TempFile::Create();
  const std::string contents = "------ PROCRANK (procrank) ------\n";
  ASSERT_EQ(WriteAll(tmp.fd(), contents.data(), contents.size()),
            static_cast<ssize_t>(contents.size()));

  std::string out = "prefix:";
  ASSERT_TRUE(ReadFile(tmp.path(), &out));
  EXPECT_EQ(out, "prefix:" + contents);
}

TEST(FileUtilsTest, ReadMissingFile) {
  std::string out;
  errno = 0;
  EXPECT_FALSE(ReadFile("/this/file/does/not/exist", &out));
  EXPECT_EQ(errno, ENOENT);
}

}  // namespace
}  // namespace base
}  // namespace bugsift
