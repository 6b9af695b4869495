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

#include "bugsift/ext/base/string_utils.h"

#include <optional>

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace base {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

TEST(StringUtilsTest, Lowercase) {
  EXPECT_EQ(Lowercase('A'), 'a');
  EXPECT_EQ(Lowercase('a'), 'a');
  EXPECT_EQ(Lowercase('!'), '!');
  EXPECT_EQ(ToLower("PID Vss Rss"), "pid vss rss");
}

TEST(StringUtilsTest, StringToInt32) {
  EXPECT_EQ(StringToInt32("0"), std::make_optional<int32_t>(0));
  EXPECT_EQ(StringToInt32("-42"), std::make_optional<int32_t>(-42));
  EXPECT_EQ(StringToInt32(""), std::nullopt);
  EXPECT_EQ(StringToInt32("abc"), std::nullopt);
  EXPECT_EQ(StringToInt32("123 abc"), std::nullopt);
}

TEST(StringUtilsTest, StringToInt64) {
  EXPECT_EQ(StringToInt64("1234567890123"),
            std::make_optional<int64_t>(1234567890123LL));
  EXPECT_EQ(StringToInt64("12k"), std::nullopt);
}

TEST(StringUtilsTest, StringToDouble) {
  EXPECT_DOUBLE_EQ(StringToDouble("-42.5").value(), -42.5);
  EXPECT_DOUBLE_EQ(StringToDouble("0.66").value(), 0.66);
  EXPECT_EQ(StringToDouble(""), std::nullopt);
  EXPECT_EQ(StringToDouble("1.5%"), std::nullopt);
}

TEST(StringUtilsTest, StartsWith) {
  EXPECT_TRUE(StartsWith("ANR in foo", "ANR"));
  EXPECT_TRUE(StartsWith("ANR", ""));
  EXPECT_FALSE(StartsWith("AN", "ANR"));
}

TEST(StringUtilsTest, Join) {
  EXPECT_EQ(Join({}, "\n"), "");
  EXPECT_EQ(Join({"a"}, "\n"), "a");
  EXPECT_EQ(Join({"a", "b", "c"}, ", "), "a, b, c");
}

TEST(StringUtilsTest, StripAndReplace) {
  EXPECT_EQ(StripSuffix("/tmp/", "/"), "/tmp");
  EXPECT_EQ(StripSuffix("/", "//"), "/");
  EXPECT_EQ(StripSuffix("/tmp", "/"), "/tmp");
  EXPECT_EQ(ReplaceAll("// a // b", "// ", ""), "a b");
  EXPECT_EQ(ReplaceAll("aaa", "a", "aa"), "aaaaaa");
}

TEST(StringUtilsTest, TrimWhitespace) {
  EXPECT_EQ(TrimWhitespace(""), "");
  EXPECT_EQ(TrimWhitespace(" \t\n "), "");
  EXPECT_EQ(TrimWhitespace("\n a b \r\n"), "a b");
}

TEST(StringUtilsTest, SplitWhitespace) {
  EXPECT_THAT(SplitWhitespace("   "), IsEmpty());
  EXPECT_THAT(SplitWhitespace("  178   87136K \t 81684K  "),
              ElementsAre("178", "87136K", "81684K"));
  EXPECT_THAT(SplitWhitespace(" 1  2  /system/bin/foo --bar  ", 3),
              ElementsAre("1", "2", "/system/bin/foo --bar"));
  EXPECT_THAT(SplitWhitespace("1 2", 3), ElementsAre("1", "2"));
}

}  // namespace
}  // namespace base
}  // namespace bugsift
