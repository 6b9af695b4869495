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

#include "bugsift/ext/base/regex.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace base {
namespace {

using testing::ElementsAre;

TEST(RegexTest, CreateInvalid) {
  base::StatusOr<Regex> re = Regex::Create("(unbalanced");
  ASSERT_FALSE(re.ok());
  EXPECT_FALSE(Regex("[").IsValid());
}

TEST(RegexTest, FullMatch) {
  base::StatusOr<Regex> re = Regex::Create("------ PROCRANK .*");
  ASSERT_TRUE(re.ok());
  EXPECT_TRUE(re->FullMatch("------ PROCRANK (procrank) ------"));
  EXPECT_FALSE(re->FullMatch(" ------ PROCRANK (procrank) ------"));
  EXPECT_FALSE(re->FullMatch("------ PROCRANK"));
}

TEST(RegexTest, FullMatchGroups) {
  Regex re("^(\\d+)(?: \\((\\w+)\\))?$");
  std::vector<std::string_view> groups;
  ASSERT_TRUE(re.FullMatch("123 (foo)", &groups));
  EXPECT_THAT(groups, ElementsAre("123 (foo)", "123", "foo"));

  ASSERT_TRUE(re.FullMatch("456", &groups));
  ASSERT_EQ(groups.size(), 3u);
  EXPECT_EQ(groups[1], "456");
  EXPECT_EQ(groups[2].data(), nullptr);

  EXPECT_FALSE(re.FullMatch("abc", &groups));
  EXPECT_TRUE(groups.empty());
}

TEST(RegexTest, Submatch) {
  Regex re("(\\d+(?:\\.\\d+)?)% user");
  std::vector<std::string_view> groups;
  re.Submatch("27% TOTAL: 15.5% user + 11% kernel", groups);
  EXPECT_THAT(groups, ElementsAre("15.5% user", "15.5"));

  re.Submatch("27% TOTAL: 11% kernel", groups);
  EXPECT_TRUE(groups.empty());
}

}  // namespace
}  // namespace base
}  // namespace bugsift
