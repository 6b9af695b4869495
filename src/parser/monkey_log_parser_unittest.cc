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

#include "src/parser/monkey_log_parser.h"

#include <algorithm>
#include <string>
#include <vector>

#include "bugsift/base/time.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

using DroppedCategory = MonkeyLogItem::DroppedCategory;
using testing::ElementsAre;

const std::vector<std::string> kSuccessLog = {
    "# Wednesday, 04/25/2012 01:37:12 AM - device uptime = 242.13: Monkey "
    "command used for this test:",
    "adb shell monkey -p com.google.android.browser  -c "
    "android.intent.category.SAMPLE_CODE -c "
    "android.intent.category.CAR_DOCK -c android.intent.category.LAUNCHER "
    "-c android.intent.category.MONKEY -c android.intent.category.INFO  "
    "--ignore-security-exceptions --throttle 100  -s 528 -v -v -v 10000 ",
    "",
    ":Monkey: seed=528 count=10000",
    ":AllowPackage: com.google.android.browser",
    ":IncludeCategory: android.intent.category.LAUNCHER",
    ":Switch: "
    "#Intent;action=android.intent.action.MAIN;category=android.intent."
    "category.LAUNCHER;launchFlags=0x10200000;end",
    "    // Allowing start of Intent { act=android.intent.action.MAIN } in "
    "package com.google.android.browser",
    "Sleeping for 100 milliseconds",
    "    // Sending event #5200",
    ":Sending Key (ACTION_DOWN): 23    // KEYCODE_DPAD_CENTER",
    "    // Sending event #9900",
    "Events injected: 10000",
    ":Dropped: keys=5 pointers=6 trackballs=7 flips=8 rotations=9",
    "// Monkey finished",
    "",
    "# Wednesday, 04/25/2012 01:42:09 AM - device uptime = 539.21: Monkey "
    "command ran for: 04:57 (mm:ss)",
};

TEST(MonkeyLogParserTest, Success) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse(kSuccessLog);

  EXPECT_EQ(monkey_log.start_time_ms,
            base::MkTime(2012, 4, 25, 1, 37, 12) * 1000);
  EXPECT_EQ(monkey_log.stop_time_ms,
            base::MkTime(2012, 4, 25, 1, 42, 9) * 1000);
  EXPECT_EQ(monkey_log.start_uptime_ms, 242130);
  EXPECT_EQ(monkey_log.stop_uptime_ms, 539210);
  EXPECT_EQ(monkey_log.total_duration_ms, 4 * 60 * 1000 + 57 * 1000);
  EXPECT_THAT(monkey_log.packages, ElementsAre("com.google.android.browser"));
  EXPECT_THAT(monkey_log.categories,
              ElementsAre("android.intent.category.LAUNCHER"));
  EXPECT_EQ(monkey_log.throttle, 100);
  EXPECT_EQ(monkey_log.seed, 528);
  EXPECT_EQ(monkey_log.target_count, 10000);
  EXPECT_TRUE(monkey_log.ignore_security_exceptions);
  EXPECT_TRUE(monkey_log.is_finished);
  EXPECT_FALSE(monkey_log.no_activities);
  EXPECT_EQ(monkey_log.intermediate_count, 9900);
  EXPECT_EQ(monkey_log.final_count, 10000);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kKeys), 5);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kPointers), 6);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kTrackballs), 7);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kFlips), 8);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kRotations), 9);
  EXPECT_FALSE(monkey_log.crash.has_value());
}

TEST(MonkeyLogParserTest, BlankedLinesKeepCounts) {
  MonkeyLogItem expected = MonkeyLogParser::Parse(kSuccessLog);
  // Lines that carry no counter or banner.
  for (const char* blanked : {"Sleeping for 100 milliseconds",
                              ":Sending Key (ACTION_DOWN): 23    // "
                              "KEYCODE_DPAD_CENTER"}) {
    std::vector<std::string> lines = kSuccessLog;
    auto it = std::find(lines.begin(), lines.end(), blanked);
    ASSERT_NE(it, lines.end());
    *it = "";
    MonkeyLogItem monkey_log = MonkeyLogParser::Parse(lines);
    EXPECT_EQ(monkey_log.intermediate_count, expected.intermediate_count);
    EXPECT_EQ(monkey_log.final_count, expected.final_count);
    EXPECT_EQ(monkey_log.target_count, expected.target_count);
    EXPECT_EQ(monkey_log.dropped_counts, expected.dropped_counts);
    EXPECT_EQ(monkey_log, expected);
  }
}

TEST(MonkeyLogParserTest, Anr) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse({
      "# Tuesday, 04/24/2012 05:23:30 PM - device uptime = 216.48: Monkey "
      "command used for this test:",
      ":Monkey: seed=1337 count=10000",
      "    // Sending event #5300",
      "// NOT RESPONDING: com.google.android.youtube (pid 3301)",
      "ANR in com.google.android.youtube "
      "(com.google.android.youtube/.app.honeycomb.Shell$HomeActivity)",
      "Reason: keyDispatchingTimedOut",
      "Load: 1.0 / 1.05 / 0.6",
      "CPU usage from 4794ms to -1502ms ago with 99% awake:",
      "  18% 3301/com.google.android.youtube: 16% user + 2.3% kernel / "
      "faults: 268 minor 9 major",
      "25% TOTAL: 21% user + 3.9% kernel + 0.2% iowait",
      "",
      "** Monkey aborted due to error.",
      "Events injected: 5322",
      ":Dropped: keys=1 pointers=0 trackballs=0 flips=0 rotations=0",
      "# Tuesday, 04/24/2012 05:27:44 PM - device uptime = 471.37: Monkey "
      "command ran for: 04:14 (mm:ss)",
  });

  EXPECT_EQ(monkey_log.start_time_ms,
            base::MkTime(2012, 4, 24, 17, 23, 30) * 1000);
  EXPECT_EQ(monkey_log.stop_time_ms,
            base::MkTime(2012, 4, 24, 17, 27, 44) * 1000);
  EXPECT_EQ(monkey_log.seed, 1337);
  EXPECT_EQ(monkey_log.intermediate_count, 5300);
  EXPECT_EQ(monkey_log.final_count, 5322);
  EXPECT_FALSE(monkey_log.is_finished);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kKeys), 1);
  EXPECT_EQ(monkey_log.GetDroppedCount(DroppedCategory::kRotations), 0);

  ASSERT_TRUE(monkey_log.crash.has_value());
  const AnrItem* anr = std::get_if<AnrItem>(&*monkey_log.crash);
  ASSERT_NE(anr, nullptr);
  EXPECT_EQ(anr->app, "com.google.android.youtube");
  EXPECT_EQ(anr->pid, 3301);
  EXPECT_EQ(anr->reason, "keyDispatchingTimedOut");
  EXPECT_DOUBLE_EQ(*anr->load_1, 1.0);
  EXPECT_DOUBLE_EQ(*anr->cpu_total, 25.0);
  EXPECT_DOUBLE_EQ(*anr->cpu_iowait, 0.2);
}

TEST(MonkeyLogParserTest, JavaCrash) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse({
      ":Monkey: seed=1337 count=10000",
      "// CRASH: com.android.package (pid 3064)",
      "// Short Msg: java.lang.Exception",
      "// Long Msg: java.lang.Exception: This is the message",
      "// Build Label: google/yakju/maguro:JellyBean/JRN24B/338896:userdebug",
      "// Build Changelist: 338896",
      "// Build Time: 1335309051000",
      "// java.lang.Exception: This is the message",
      "// \tat class.method1(Class.java:1)",
      "// \tat class.method2(Class.java:2)",
      "// ",
      "** Monkey aborted due to error.",
      "Events injected: 4",
  });

  EXPECT_EQ(monkey_log.final_count, 4);
  ASSERT_TRUE(monkey_log.crash.has_value());
  const JavaCrashItem* crash = std::get_if<JavaCrashItem>(&*monkey_log.crash);
  ASSERT_NE(crash, nullptr);
  EXPECT_EQ(crash->app, "com.android.package");
  EXPECT_EQ(crash->pid, 3064);
  EXPECT_EQ(crash->exception, "java.lang.Exception");
  EXPECT_EQ(crash->message, "This is the message");
  EXPECT_EQ(crash->stack,
            "java.lang.Exception: This is the message\n"
            "\tat class.method1(Class.java:1)\n"
            "\tat class.method2(Class.java:2)");
}

TEST(MonkeyLogParserTest, CrashAtEndOfInput) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse({
      "// CRASH: com.android.package (pid 3064)",
      "// java.lang.NullPointerException",
      "// \tat class.method1(Class.java:1)",
  });

  ASSERT_TRUE(monkey_log.crash.has_value());
  const JavaCrashItem* crash = std::get_if<JavaCrashItem>(&*monkey_log.crash);
  ASSERT_NE(crash, nullptr);
  EXPECT_EQ(crash->exception, "java.lang.NullPointerException");
  EXPECT_FALSE(crash->message.has_value());
  EXPECT_EQ(crash->pid, 3064);
}

TEST(MonkeyLogParserTest, UnparsableCrashIsDropped) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse({
      "// NOT RESPONDING: com.android.package (pid 3064)",
      "Reason: keyDispatchingTimedOut",
      "",
      "Events injected: 12",
  });

  EXPECT_FALSE(monkey_log.crash.has_value());
  EXPECT_EQ(monkey_log.final_count, 12);
}

TEST(MonkeyLogParserTest, NoActivities) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse({
      ":Monkey: seed=1 count=100",
      "** No activities found to run, monkey aborted.",
  });

  EXPECT_TRUE(monkey_log.no_activities);
  EXPECT_FALSE(monkey_log.is_finished);
  EXPECT_FALSE(monkey_log.final_count.has_value());
  EXPECT_EQ(monkey_log.intermediate_count, 0);
  EXPECT_EQ(monkey_log.throttle, 0);
  EXPECT_FALSE(monkey_log.GetDroppedCount(DroppedCategory::kKeys).has_value());
}

TEST(MonkeyLogParserTest, EmptyLog) {
  MonkeyLogItem monkey_log = MonkeyLogParser::Parse({});
  EXPECT_EQ(monkey_log, MonkeyLogItem());
}

TEST(MonkeyLogParserTest, ParseBannerTime) {
  EXPECT_EQ(MonkeyLogParser::ParseBannerTime("Mon Apr 23 08:23:31 PDT 2012"),
            base::MkTime(2012, 4, 23, 8, 23, 31) * 1000);
  EXPECT_EQ(MonkeyLogParser::ParseBannerTime("Mon Apr 23 08:23:31 2012"),
            base::MkTime(2012, 4, 23, 8, 23, 31) * 1000);
  EXPECT_EQ(MonkeyLogParser::ParseBannerTime("Tue Apr  3 08:23:31 PDT 2012"),
            base::MkTime(2012, 4, 3, 8, 23, 31) * 1000);
  EXPECT_EQ(
      MonkeyLogParser::ParseBannerTime("Tuesday, 04/24/2012 05:23:30 PM"),
      base::MkTime(2012, 4, 24, 17, 23, 30) * 1000);
  EXPECT_EQ(
      MonkeyLogParser::ParseBannerTime("Tuesday, 04/24/2012 12:05:00 AM"),
      base::MkTime(2012, 4, 24, 0, 5, 0) * 1000);
  EXPECT_EQ(
      MonkeyLogParser::ParseBannerTime("Tuesday, 04/24/2012 12:05:00 PM"),
      base::MkTime(2012, 4, 24, 12, 5, 0) * 1000);
  EXPECT_FALSE(MonkeyLogParser::ParseBannerTime("yesterday").has_value());
  EXPECT_FALSE(
      MonkeyLogParser::ParseBannerTime("Tuesday, 04/24/2012 13:05:00 PM")
          .has_value());
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
