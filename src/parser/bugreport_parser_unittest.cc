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

#include "src/parser/bugreport_parser.h"

#include "bugsift/base/time.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

int64_t TimeMs(int year, int month, int day, int h, int m, int s, int ms) {
  return base::MkTime(year, month, day, h, m, s) * 1000 + ms;
}

const char kExpectedStack[] =
    "\"main\" prio=5 tid=1 SUSPENDED\n"
    "  | group=\"main\" sCount=1 dsCount=0 obj=0x00000001 self=0x00000001\n"
    "  | sysTid=2887 nice=0 sched=0/0 cgrp=foreground handle=0000000001\n"
    "  | schedstat=( 0 0 0 ) utm=5954 stm=1017 core=0\n"
    "  at class.method1(Class.java:1)\n"
    "  at class.method2(Class.java:2)\n"
    "  at class.method2(Class.java:2)";

std::vector<std::string> TracesSection(const std::string& app) {
  return {
      "------ VM TRACES AT LAST ANR (/data/anr/traces.txt: 2012-04-25 "
      "17:17:08) ------",
      "",
      "----- pid 2887 at 2012-04-25 17:17:08 -----",
      "Cmd line: " + app,
      "",
      "DALVIK THREADS:",
      "(mutexes: tll=0 tsl=0 tscl=0 ghl=0)",
      "",
      "\"main\" prio=5 tid=1 SUSPENDED",
      "  | group=\"main\" sCount=1 dsCount=0 obj=0x00000001 self=0x00000001",
      "  | sysTid=2887 nice=0 sched=0/0 cgrp=foreground handle=0000000001",
      "  | schedstat=( 0 0 0 ) utm=5954 stm=1017 core=0",
      "  at class.method1(Class.java:1)",
      "  at class.method2(Class.java:2)",
      "  at class.method2(Class.java:2)",
      "",
      "----- end 2887 -----",
      "",
  };
}

std::vector<std::string> Concat(std::vector<std::string> a,
                                const std::vector<std::string>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

TEST(BugreportParserTest, Parse) {
  std::vector<std::string> lines = {
      "========================================================",
      "== dumpstate: 2012-04-25 20:45:10",
      "========================================================",
      "------ SECTION ------",
      "",
      "------ MEMORY INFO (/proc/meminfo) ------",
      "MemTotal:         353332 kB",
      "MemFree:           65420 kB",
      "Buffers:           20800 kB",
      "Cached:            86204 kB",
      "SwapCached:            0 kB",
      "",
      "------ PROCRANK (procrank) ------",
      "  PID      Vss      Rss      Pss      Uss  cmdline",
      "  178   87136K   81684K   52829K   50012K  system_server",
      " 1313   78128K   77996K   48603K   45812K  com.google.android.apps.maps",
      " 3247   61652K   61492K   33122K   30972K  com.android.browser",
      "                          ------   ------  ------",
      "                          203624K  163604K  TOTAL",
      "RAM: 731448K total, 415804K free, 9016K buffers, 108548K cached",
      "[procrank: 1.6s elapsed]",
      "",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method1(Class.java:1)",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method2(Class.java:2)",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method3(Class.java:3)",
      "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application not "
      "responding) in process: com.android.package",
      "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "04-25 17:17:08.445   312   366 E ActivityManager: Load: 0.71 / 0.83 / "
      "0.51",
      "04-25 17:17:08.445   312   366 E ActivityManager: 33% TOTAL: 21% user + "
      "11% kernel + 0.3% iowait",
      "04-25 18:33:27.273   115   115 I DEBUG   : *** *** *** *** *** *** *** "
      "*** *** *** *** *** *** *** *** ***",
      "04-25 18:33:27.273   115   115 I DEBUG   : Build fingerprint: "
      "'product:build:target'",
      "04-25 18:33:27.273   115   115 I DEBUG   : pid: 3112, tid: 3112  >>> "
      "com.google.android.browser <<<",
      "04-25 18:33:27.273   115   115 I DEBUG   : signal 11 (SIGSEGV), code 1 "
      "(SEGV_MAPERR), fault addr 00000000",
      "",
      "------ SYSTEM PROPERTIES ------",
      "[dalvik.vm.dexopt-flags]: [m=y]",
      "[dalvik.vm.heapgrowthlimit]: [48m]",
      "[dalvik.vm.heapsize]: [256m]",
      "[gsm.version.ril-impl]: [android moto-ril-multimode 1.0]",
      "",
      "------ SECTION ------",
      "",
  };
  lines = Concat(lines, TracesSection("com.android.package"));
  lines = Concat(lines, {"------ SECTION ------", ""});

  BugreportItem bugreport = BugreportParser::Parse(lines);
  EXPECT_EQ(bugreport.time_ms, TimeMs(2012, 4, 25, 20, 45, 10, 0));

  ASSERT_TRUE(bugreport.mem_info.has_value());
  EXPECT_EQ(bugreport.mem_info->values.size(), 5u);
  EXPECT_EQ(bugreport.mem_info->values.at("MemTotal"), 353332);

  ASSERT_TRUE(bugreport.procrank.has_value());
  EXPECT_EQ(bugreport.procrank->GetPids().size(), 3u);
  EXPECT_EQ(bugreport.procrank->GetProcessName(178), "system_server");

  ASSERT_TRUE(bugreport.system_log.has_value());
  const LogcatItem& logcat = *bugreport.system_log;
  EXPECT_EQ(logcat.start_time_ms, TimeMs(2012, 4, 25, 9, 55, 47, 799));
  EXPECT_EQ(logcat.stop_time_ms, TimeMs(2012, 4, 25, 18, 33, 27, 273));
  EXPECT_FALSE(logcat.year_inferred);
  EXPECT_EQ(logcat.events.size(), 3u);
  ASSERT_EQ(logcat.GetAnrs().size(), 1u);
  EXPECT_EQ(logcat.GetAnrs()[0]->trace, kExpectedStack);
  EXPECT_EQ(logcat.GetJavaCrashes().size(), 1u);
  EXPECT_EQ(logcat.GetNativeCrashes().size(), 1u);

  ASSERT_TRUE(bugreport.system_props.has_value());
  EXPECT_EQ(bugreport.system_props->values.size(), 4u);
}

TEST(BugreportParserTest, LogcatYearFromHeader) {
  BugreportItem bugreport = BugreportParser::Parse({
      "========================================================",
      "== dumpstate: 1999-01-01 02:03:04",
      "========================================================",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "01-01 01:02:03.000     1     1 I TAG     : message",
      "01-01 01:02:04.000     1     1 I TAG     : message",
      "",
  });

  EXPECT_EQ(bugreport.time_ms, TimeMs(1999, 1, 1, 2, 3, 4, 0));
  ASSERT_TRUE(bugreport.system_log.has_value());
  EXPECT_EQ(bugreport.system_log->start_time_ms,
            TimeMs(1999, 1, 1, 1, 2, 3, 0));
  EXPECT_EQ(bugreport.system_log->stop_time_ms,
            TimeMs(1999, 1, 1, 1, 2, 4, 0));
  EXPECT_FALSE(bugreport.system_log->year_inferred);
}

TEST(BugreportParserTest, HeaderYearOverridesConfig) {
  Config config;
  config.logcat_year = 2005;
  BugreportItem bugreport = BugreportParser::Parse(
      {
          "== dumpstate: 1999-01-01 02:03:04",
          "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
          "01-01 01:02:03.000     1     1 I TAG     : message",
      },
      config);

  ASSERT_TRUE(bugreport.system_log.has_value());
  EXPECT_EQ(bugreport.system_log->start_time_ms,
            TimeMs(1999, 1, 1, 1, 2, 3, 0));
}

TEST(BugreportParserTest, AnrTraceSingle) {
  std::vector<std::string> lines = {
      "========================================================",
      "== dumpstate: 2012-04-25 20:45:10",
      "========================================================",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application not "
      "responding) in process: com.android.package",
      "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "04-25 17:17:08.445   312   366 E ActivityManager: Load: 0.71 / 0.83 / "
      "0.51",
      "04-25 17:17:08.445   312   366 E ActivityManager: 33% TOTAL: 21% user + "
      "11% kernel + 0.3% iowait",
      "",
  };
  lines = Concat(lines, TracesSection("com.android.package"));

  BugreportItem bugreport = BugreportParser::Parse(lines);
  ASSERT_TRUE(bugreport.system_log.has_value());
  std::vector<const AnrItem*> anrs = bugreport.system_log->GetAnrs();
  ASSERT_EQ(anrs.size(), 1u);
  EXPECT_EQ(anrs[0]->trace, kExpectedStack);
}

TEST(BugreportParserTest, AnrTraceMultiple) {
  std::vector<std::string> lines = {
      "========================================================",
      "== dumpstate: 2012-04-25 20:45:10",
      "========================================================",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application not "
      "responding) in process: com.android.package",
      "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "04-25 17:18:08.445   312   366 E ActivityManager: ANR (application not "
      "responding) in process: com.android.package",
      "04-25 17:18:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "04-25 17:19:08.445   312   366 E ActivityManager: ANR (application not "
      "responding) in process: com.android.different.package",
      "04-25 17:19:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "",
  };
  lines = Concat(lines, TracesSection("com.android.package"));

  BugreportItem bugreport = BugreportParser::Parse(lines);
  ASSERT_TRUE(bugreport.system_log.has_value());
  std::vector<const AnrItem*> anrs = bugreport.system_log->GetAnrs();
  ASSERT_EQ(anrs.size(), 3u);
  EXPECT_FALSE(anrs[0]->trace.has_value());
  EXPECT_EQ(anrs[1]->trace, kExpectedStack);
  EXPECT_FALSE(anrs[2]->trace.has_value());
}

TEST(BugreportParserTest, AnrTraceOfOtherApp) {
  std::vector<std::string> lines = {
      "== dumpstate: 2012-04-25 20:45:10",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "04-25 17:17:08.445   312   366 E ActivityManager: ANR in "
      "com.android.package",
      "",
  };
  lines = Concat(lines, TracesSection("com.android.other"));

  BugreportItem bugreport = BugreportParser::Parse(lines);
  ASSERT_TRUE(bugreport.system_log.has_value());
  std::vector<const AnrItem*> anrs = bugreport.system_log->GetAnrs();
  ASSERT_EQ(anrs.size(), 1u);
  EXPECT_FALSE(anrs[0]->trace.has_value());
}

TEST(BugreportParserTest, NoTraces) {
  BugreportItem bugreport = BugreportParser::Parse({
      "========================================================",
      "== dumpstate: 2012-04-25 20:45:10",
      "========================================================",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application not "
      "responding) in process: com.android.package",
      "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "",
      "*** NO ANR VM TRACES FILE (/data/anr/traces.txt): No such file or "
      "directory",
      "",
  });

  ASSERT_TRUE(bugreport.system_log.has_value());
  std::vector<const AnrItem*> anrs = bugreport.system_log->GetAnrs();
  ASSERT_EQ(anrs.size(), 1u);
  EXPECT_FALSE(anrs[0]->trace.has_value());
}

TEST(BugreportParserTest, SetAppsFromProcrank) {
  BugreportItem bugreport = BugreportParser::Parse({
      "========================================================",
      "== dumpstate: 2012-04-25 20:45:10",
      "========================================================",
      "------ PROCRANK (procrank) ------",
      "  PID      Vss      Rss      Pss      Uss  cmdline",
      " 3064   87136K   81684K   52829K   50012K  com.android.package",
      "                          ------   ------  ------",
      "                          203624K  163604K  TOTAL",
      "RAM: 731448K total, 415804K free, 9016K buffers, 108548K cached",
      "[procrank: 1.6s elapsed]",
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method1(Class.java:1)",
      "04-25 09:55:47.799  3065  3083 E AndroidRuntime: java.lang.Exception",
      "04-25 09:55:47.799  3065  3083 E AndroidRuntime: \tat "
      "class.method1(Class.java:1)",
  });

  ASSERT_TRUE(bugreport.system_log.has_value());
  std::vector<const JavaCrashItem*> crashes =
      bugreport.system_log->GetJavaCrashes();
  ASSERT_EQ(crashes.size(), 2u);
  EXPECT_EQ(crashes[0]->app, "com.android.package");
  EXPECT_FALSE(crashes[1]->app.has_value());
}

TEST(BugreportParserTest, SystemLogAsMainLog) {
  BugreportItem bugreport = BugreportParser::Parse({
      "------ MAIN LOG (logcat -b main -b system -v threadtime -d *:v) ------",
      "--------- beginning of /dev/log/system",
      "12-11 19:48:07.945  1484  1508 D BatteryService: update start",
  });

  EXPECT_FALSE(bugreport.time_ms.has_value());
  ASSERT_TRUE(bugreport.system_log.has_value());
  EXPECT_TRUE(bugreport.system_log->events.empty());
  EXPECT_TRUE(bugreport.system_log->start_time_ms.has_value());
}

TEST(BugreportParserTest, EmptyInput) {
  BugreportItem bugreport = BugreportParser::Parse({});
  EXPECT_EQ(bugreport, BugreportItem());
}

TEST(BugreportParserTest, NoSystemLog) {
  BugreportItem bugreport = BugreportParser::Parse({
      "== dumpstate: 2012-04-25 20:45:10",
      "------ MEMORY INFO (/proc/meminfo) ------",
      "MemTotal:         353332 kB",
  });

  EXPECT_EQ(bugreport.time_ms, TimeMs(2012, 4, 25, 20, 45, 10, 0));
  ASSERT_TRUE(bugreport.mem_info.has_value());
  EXPECT_FALSE(bugreport.procrank.has_value());
  EXPECT_FALSE(bugreport.system_log.has_value());
  EXPECT_FALSE(bugreport.system_props.has_value());
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
