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

#include "src/parser/section_parsers.h"

#include "bugsift/parser/items.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

TEST(MemInfoParserTest, Parse) {
  MemInfoParser parser;
  ItemList items;
  parser.ParseBlock(
      {
          "MemTotal:         353332 kB",
          "MemFree:           65420 kB",
          "Buffers:           20800 kB",
          "Cached:            86204 kB",
          "SwapCached:            0 kB",
          "Unparsable line",
          "Mlocked:   not a number kB",
      },
      &items);

  const MemInfoItem* mem_info = items.GetFirst<MemInfoItem>();
  ASSERT_NE(mem_info, nullptr);
  EXPECT_EQ(mem_info->values.size(), 5u);
  EXPECT_EQ(mem_info->values.at("MemTotal"), 353332);
  EXPECT_EQ(mem_info->values.at("MemFree"), 65420);
  EXPECT_EQ(mem_info->values.at("Buffers"), 20800);
  EXPECT_EQ(mem_info->values.at("Cached"), 86204);
  EXPECT_EQ(mem_info->values.at("SwapCached"), 0);
}

TEST(MemInfoParserTest, EmptyBlock) {
  MemInfoParser parser;
  ItemList items;
  parser.ParseBlock({}, &items);
  const MemInfoItem* mem_info = items.GetFirst<MemInfoItem>();
  ASSERT_NE(mem_info, nullptr);
  EXPECT_TRUE(mem_info->values.empty());
}

TEST(SystemPropsParserTest, Parse) {
  SystemPropsParser parser;
  ItemList items;
  parser.ParseBlock(
      {
          "[dalvik.vm.dexopt-flags]: [m=y]",
          "[dalvik.vm.heapgrowthlimit]: [48m]",
          "[dalvik.vm.heapsize]: [256m]",
          "[gsm.version.ril-impl]: [android moto-ril-multimode 1.0]",
          "[ro.empty]: []",
          "garbage",
      },
      &items);

  const SystemPropsItem* props = items.GetFirst<SystemPropsItem>();
  ASSERT_NE(props, nullptr);
  EXPECT_EQ(props->values.size(), 5u);
  EXPECT_EQ(props->values.at("dalvik.vm.dexopt-flags"), "m=y");
  EXPECT_EQ(props->values.at("dalvik.vm.heapgrowthlimit"), "48m");
  EXPECT_EQ(props->values.at("dalvik.vm.heapsize"), "256m");
  EXPECT_EQ(props->values.at("gsm.version.ril-impl"),
            "android moto-ril-multimode 1.0");
  EXPECT_EQ(props->values.at("ro.empty"), "");
}

TEST(TracesParserTest, Parse) {
  TracesParser parser;
  ItemList items;
  parser.ParseBlock(
      {
          "",
          "",
          "----- pid 2887 at 2012-05-02 16:43:41 -----",
          "Cmd line: com.android.package",
          "",
          "DALVIK THREADS:",
          "(mutexes: tll=0 tsl=0 tscl=0 ghl=0)",
          "",
          "\"main\" prio=5 tid=1 SUSPENDED",
          "  | group=\"main\" sCount=1 dsCount=0 obj=0x00000001 "
          "self=0x00000001",
          "  | sysTid=2887 nice=0 sched=0/0 cgrp=foreground handle=0000000001",
          "  | schedstat=( 0 0 0 ) utm=5954 stm=1017 core=0",
          "  at class.method1(Class.java:1)",
          "  at class.method2(Class.java:2)",
          "  at class.method2(Class.java:2)",
          "",
          "\"Task_1\" prio=5 tid=27 SUSPENDED",
          "  at class.task1(Class.java:1)",
          "",
          "----- pid 2888 at 2012-05-02 16:43:41 -----",
          "Cmd line: com.android.other",
      },
      &items);

  const TracesItem* traces = items.GetFirst<TracesItem>();
  ASSERT_NE(traces, nullptr);
  EXPECT_EQ(traces->pid, 2887);
  EXPECT_EQ(traces->app, "com.android.package");
  EXPECT_EQ(traces->stack,
            "\"main\" prio=5 tid=1 SUSPENDED\n"
            "  | group=\"main\" sCount=1 dsCount=0 obj=0x00000001 "
            "self=0x00000001\n"
            "  | sysTid=2887 nice=0 sched=0/0 cgrp=foreground "
            "handle=0000000001\n"
            "  | schedstat=( 0 0 0 ) utm=5954 stm=1017 core=0\n"
            "  at class.method1(Class.java:1)\n"
            "  at class.method2(Class.java:2)\n"
            "  at class.method2(Class.java:2)");
}

TEST(TracesParserTest, StackUntilEndOfBlock) {
  TracesParser parser;
  ItemList items;
  parser.ParseBlock(
      {
          "----- pid 100 at 2012-05-02 16:43:41 -----",
          "\"main\" prio=5 tid=1 NATIVE",
          "  at class.method1(Class.java:1)",
      },
      &items);

  const TracesItem* traces = items.GetFirst<TracesItem>();
  ASSERT_NE(traces, nullptr);
  EXPECT_EQ(traces->pid, 100);
  EXPECT_FALSE(traces->app.has_value());
  EXPECT_EQ(traces->stack,
            "\"main\" prio=5 tid=1 NATIVE\n"
            "  at class.method1(Class.java:1)");
}

TEST(TracesParserTest, NoMainThread) {
  TracesParser parser;
  ItemList items;
  parser.ParseBlock({"Cmd line: com.android.package"}, &items);

  const TracesItem* traces = items.GetFirst<TracesItem>();
  ASSERT_NE(traces, nullptr);
  EXPECT_FALSE(traces->pid.has_value());
  EXPECT_EQ(traces->app, "com.android.package");
  EXPECT_FALSE(traces->stack.has_value());
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
