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

#include "src/parser/anr_parser.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

TEST(AnrParserTest, Parse) {
  AnrParser parser;
  std::optional<AnrItem> anr = parser.Parse({
      "ANR in com.android.package (com.android.package/.Activity)",
      "Reason: keyDispatchingTimedOut",
      "Load: 0.71 / 0.83 / 0.51",
      "CPU usage from 4357ms to -1434ms ago:",
      "  22% 3378/com.android.package: 19% user + 3.7% kernel / faults: 4 minor",
      "33% TOTAL: 21% user + 11% kernel + 0.3% iowait + 0.4% irq",
      "CPU usage from 907ms to 1431ms later:",
      "14% TOTAL: 9% user + 4.5% kernel",
  });
  ASSERT_TRUE(anr.has_value());
  EXPECT_EQ(anr->app, "com.android.package");
  EXPECT_EQ(anr->activity, "com.android.package/.Activity");
  EXPECT_EQ(anr->reason, "keyDispatchingTimedOut");
  EXPECT_DOUBLE_EQ(*anr->load_1, 0.71);
  EXPECT_DOUBLE_EQ(*anr->load_5, 0.83);
  EXPECT_DOUBLE_EQ(*anr->load_15, 0.51);
  // Only the first TOTAL line counts.
  EXPECT_DOUBLE_EQ(*anr->cpu_total, 33.0);
  EXPECT_DOUBLE_EQ(*anr->cpu_user, 21.0);
  EXPECT_DOUBLE_EQ(*anr->cpu_kernel, 11.0);
  EXPECT_DOUBLE_EQ(*anr->cpu_iowait, 0.3);
  EXPECT_DOUBLE_EQ(*anr->cpu_irq, 0.4);
  EXPECT_FALSE(anr->trace.has_value());
  EXPECT_FALSE(anr->pid.has_value());
}

TEST(AnrParserTest, ProcessVariantAndActivityLine) {
  AnrParser parser;
  std::optional<AnrItem> anr = parser.Parse({
      "ANR (application not responding) in process: com.android.package",
      "Activity: com.android.package/.Other",
      "Reason: Broadcast of Intent { act=foo }",
      "12% TOTAL: 5% user + 6% kernel",
  });
  ASSERT_TRUE(anr.has_value());
  EXPECT_EQ(anr->app, "com.android.package");
  EXPECT_EQ(anr->activity, "com.android.package/.Other");
  EXPECT_EQ(anr->reason, "Broadcast of Intent { act=foo }");
  EXPECT_DOUBLE_EQ(*anr->cpu_total, 12.0);
  EXPECT_FALSE(anr->cpu_iowait.has_value());
  EXPECT_FALSE(anr->cpu_irq.has_value());
  EXPECT_FALSE(anr->load_1.has_value());
}

TEST(AnrParserTest, NoStartLine) {
  AnrParser parser;
  EXPECT_FALSE(parser.Parse({"Reason: keyDispatchingTimedOut"}).has_value());
  EXPECT_FALSE(parser.Parse({}).has_value());
}

TEST(AnrParserTest, IsAnrStart) {
  AnrParser parser;
  EXPECT_TRUE(parser.IsAnrStart("ANR in com.android.package"));
  EXPECT_TRUE(parser.IsAnrStart(
      "ANR (application not responding) in process: com.android.package"));
  EXPECT_FALSE(parser.IsAnrStart("Reason: keyDispatchingTimedOut"));
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
