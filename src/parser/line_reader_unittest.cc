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

#include "src/parser/line_reader.h"

#include <zlib.h>

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/file_utils.h"
#include "bugsift/ext/base/temp_file.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;

std::string GzipCompress(const std::string& input) {
  std::string output(input.size() + 1024, '\0');
  z_stream defstream{};
  defstream.avail_in = uint32_t(input.size());
  defstream.next_in =
      const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
  defstream.avail_out = uint32_t(output.size());
  defstream.next_out = reinterpret_cast<Bytef*>(&output[0]);
  BUGSIFT_CHECK(deflateInit2(&defstream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                             16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK);
  BUGSIFT_CHECK(deflate(&defstream, Z_FINISH) == Z_STREAM_END);
  deflateEnd(&defstream);
  output.resize(output.size() - defstream.avail_out);
  return output;
}

base::TempFile WriteTempFile(const std::string& contents) {
  base::TempFile tmp = base::TempFile::Create();
  BUGSIFT_CHECK(base::WriteAll(tmp.fd(), contents.data(), contents.size()) ==
                static_cast<ssize_t>(contents.size()));
  return tmp;
}

TEST(LineReaderTest, SplitLines) {
  EXPECT_THAT(SplitLines(""), IsEmpty());
  EXPECT_THAT(SplitLines("a"), ElementsAre("a"));
  EXPECT_THAT(SplitLines("a\n"), ElementsAre("a"));
  EXPECT_THAT(SplitLines("a\nb"), ElementsAre("a", "b"));
  EXPECT_THAT(SplitLines("a\n\nb\n"), ElementsAre("a", "", "b"));
  EXPECT_THAT(SplitLines("a\n\n"), ElementsAre("a", ""));
  EXPECT_THAT(SplitLines("\n"), ElementsAre(""));
}

TEST(LineReaderTest, SplitLinesStripsCarriageReturns) {
  EXPECT_THAT(SplitLines("a\r\nb\r\n\r\nc"), ElementsAre("a", "b", "", "c"));
  // Only a carriage return right before the newline is dropped.
  EXPECT_THAT(SplitLines("a\rb\n"), ElementsAre("a\rb"));
}

TEST(LineReaderTest, ReadPlainFile) {
  base::TempFile tmp = WriteTempFile(
      "== dumpstate: 2012-04-25 20:45:10\r\n"
      "------ MEMORY INFO (/proc/meminfo) ------\r\n"
      "MemTotal:         353332 kB\r\n");

  base::StatusOr<std::vector<std::string>> lines = ReadFileLines(tmp.path());
  ASSERT_TRUE(lines.ok()) << lines.status().message();
  EXPECT_THAT(*lines, ElementsAre("== dumpstate: 2012-04-25 20:45:10",
                                  "------ MEMORY INFO (/proc/meminfo) ------",
                                  "MemTotal:         353332 kB"));
}

TEST(LineReaderTest, ReadGzipFile) {
  std::string text;
  std::vector<std::string> expected;
  for (int i = 0; i < 2000; i++) {
    std::string line = "01-01 01:02:03.000     1     1 I TAG     : message " +
                       std::to_string(i);
    text += line + "\n";
    expected.push_back(line);
  }
  base::TempFile tmp = WriteTempFile(GzipCompress(text));

  base::StatusOr<std::vector<std::string>> lines = ReadFileLines(tmp.path());
  ASSERT_TRUE(lines.ok()) << lines.status().message();
  EXPECT_EQ(*lines, expected);
}

TEST(LineReaderTest, ReadTruncatedGzipFile) {
  std::string compressed = GzipCompress("some text that gets cut short\n");
  base::TempFile tmp =
      WriteTempFile(compressed.substr(0, compressed.size() / 2));

  base::StatusOr<std::vector<std::string>> lines = ReadFileLines(tmp.path());
  ASSERT_FALSE(lines.ok());
  EXPECT_THAT(lines.status().message(), HasSubstr(tmp.path()));
  EXPECT_THAT(lines.status().message(), HasSubstr("Truncated gzip data"));
}

TEST(LineReaderTest, ReadCorruptGzipFile) {
  std::string compressed = GzipCompress("corrupt\n");
  compressed[2] = 0x42;
  base::TempFile tmp = WriteTempFile(compressed);

  base::StatusOr<std::vector<std::string>> lines = ReadFileLines(tmp.path());
  ASSERT_FALSE(lines.ok());
  EXPECT_THAT(lines.status().message(),
              HasSubstr("Failed to decompress gzip data"));
}

TEST(LineReaderTest, ReadMissingFile) {
  base::StatusOr<std::vector<std::string>> lines =
      ReadFileLines("/this/file/does/not/exist");
  ASSERT_FALSE(lines.ok());
  EXPECT_THAT(lines.status().message(),
              HasSubstr("Could not read /this/file/does/not/exist"));
}

TEST(LineReaderTest, ReadEmptyFile) {
  base::TempFile tmp = base::TempFile::Create();
  base::StatusOr<std::vector<std::string>> lines = ReadFileLines(tmp.path());
  ASSERT_TRUE(lines.ok());
  EXPECT_THAT(*lines, IsEmpty());
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
