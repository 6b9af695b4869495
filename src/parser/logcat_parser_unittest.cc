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

#include "src/parser/logcat_parser.h"

#include <string>
#include <vector>

#include "bugsift/base/time.h"
#include "bugsift/ext/base/string_utils.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

// Milliseconds since the Epoch of a 2012 logcat timestamp.
int64_t TimeMs(int month, int day, int h, int m, int s, int ms) {
  return base::MkTime(2012, month, day, h, m, s) * 1000 + ms;
}

Config Config2012() {
  Config config;
  config.logcat_year = 2012;
  return config;
}

TEST(LogcatParserTest, Anr) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application "
          "not responding) in process: com.android.package",
          "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
          "keyDispatchingTimedOut",
          "04-25 17:17:08.445   312   366 E ActivityManager: Load: 0.71 / 0.83 "
          "/ 0.51",
          "04-25 17:17:08.445   312   366 E ActivityManager: 33% TOTAL: 21% "
          "user + 11% kernel + 0.3% iowait",
      },
      Config2012());

  EXPECT_EQ(logcat.start_time_ms, TimeMs(4, 25, 17, 17, 8, 445));
  EXPECT_EQ(logcat.stop_time_ms, TimeMs(4, 25, 17, 17, 8, 445));
  EXPECT_FALSE(logcat.year_inferred);
  ASSERT_EQ(logcat.events.size(), 1u);
  ASSERT_EQ(logcat.GetAnrs().size(), 1u);
  const AnrItem* anr = logcat.GetAnrs()[0];
  EXPECT_EQ(anr->pid, 312);
  EXPECT_EQ(anr->tid, 366);
  EXPECT_EQ(anr->app, "com.android.package");
  EXPECT_EQ(anr->reason, "keyDispatchingTimedOut");
  EXPECT_DOUBLE_EQ(*anr->cpu_iowait, 0.3);
  EXPECT_EQ(anr->last_preamble, "");
  EXPECT_EQ(anr->process_preamble, "");
  EXPECT_EQ(anr->event_time_ms, TimeMs(4, 25, 17, 17, 8, 445));
}

TEST(LogcatParserTest, JavaCrash) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: "
          "java.lang.Exception",
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
          "class.method1(Class.java:1)",
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
          "class.method2(Class.java:2)",
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
          "class.method3(Class.java:3)",
      },
      Config2012());

  EXPECT_EQ(logcat.start_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
  EXPECT_EQ(logcat.stop_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
  ASSERT_EQ(logcat.events.size(), 1u);
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 1u);
  const JavaCrashItem* crash = logcat.GetJavaCrashes()[0];
  EXPECT_EQ(crash->pid, 3064);
  EXPECT_EQ(crash->tid, 3082);
  EXPECT_EQ(crash->exception, "java.lang.Exception");
  EXPECT_EQ(crash->stack,
            "java.lang.Exception\n"
            "\tat class.method1(Class.java:1)\n"
            "\tat class.method2(Class.java:2)\n"
            "\tat class.method3(Class.java:3)");
  EXPECT_EQ(crash->last_preamble, "");
  EXPECT_EQ(crash->process_preamble, "");
  EXPECT_EQ(crash->event_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
}

TEST(LogcatParserTest, NativeCrash) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 18:33:27.273   115   115 I DEBUG   : *** *** *** *** *** *** "
          "*** *** *** *** *** *** *** *** *** ***",
          "04-25 18:33:27.273   115   115 I DEBUG   : Build fingerprint: "
          "'product:build:target'",
          "04-25 18:33:27.273   115   115 I DEBUG   : pid: 3112, tid: 3112  >>> "
          "com.google.android.browser <<<",
          "04-25 18:33:27.273   115   115 I DEBUG   : signal 11 (SIGSEGV), code "
          "1 (SEGV_MAPERR), fault addr 00000000",
      },
      Config2012());

  ASSERT_EQ(logcat.events.size(), 1u);
  ASSERT_EQ(logcat.GetNativeCrashes().size(), 1u);
  const NativeCrashItem* crash = logcat.GetNativeCrashes()[0];
  EXPECT_EQ(crash->pid, 115);
  EXPECT_EQ(crash->tid, 115);
  EXPECT_EQ(crash->app, "com.google.android.browser");
  EXPECT_EQ(crash->fingerprint, "product:build:target");
  EXPECT_EQ(crash->last_preamble, "");
  EXPECT_EQ(crash->process_preamble, "");
  EXPECT_EQ(crash->event_time_ms, TimeMs(4, 25, 18, 33, 27, 273));
}

TEST(LogcatParserTest, MultipleEvents) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
          "class.method1(Class.java:1)",
          "04-25 09:55:47.799  3065  3090 E AndroidRuntime: java.lang.Exception",
          "04-25 09:55:47.799  3065  3090 E AndroidRuntime: \tat "
          "class.method1(Class.java:1)",
          "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application "
          "not responding) in process: com.android.package",
          "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
          "keyDispatchingTimedOut",
          "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application "
          "not responding) in process: com.android.package",
          "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
          "keyDispatchingTimedOut",
          "04-25 18:33:27.273   115   115 I DEBUG   : *** *** *** *** *** *** "
          "*** *** *** *** *** *** *** *** *** ***",
          "04-25 18:33:27.273   115   115 I DEBUG   : Build fingerprint: "
          "'product:build:target'",
          "04-25 18:33:27.273   117   117 I DEBUG   : *** *** *** *** *** *** "
          "*** *** *** *** *** *** *** *** *** ***",
          "04-25 18:33:27.273   117   117 I DEBUG   : Build fingerprint: "
          "'product:build:target'",
      },
      Config2012());

  EXPECT_EQ(logcat.start_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
  EXPECT_EQ(logcat.stop_time_ms, TimeMs(4, 25, 18, 33, 27, 273));
  EXPECT_EQ(logcat.events.size(), 6u);
  ASSERT_EQ(logcat.GetAnrs().size(), 2u);
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 2u);
  ASSERT_EQ(logcat.GetNativeCrashes().size(), 2u);

  EXPECT_EQ(logcat.GetAnrs()[0]->pid, 312);
  EXPECT_EQ(logcat.GetAnrs()[1]->tid, 366);
  EXPECT_EQ(logcat.GetJavaCrashes()[0]->pid, 3064);
  EXPECT_EQ(logcat.GetJavaCrashes()[0]->tid, 3082);
  EXPECT_EQ(logcat.GetJavaCrashes()[1]->pid, 3065);
  EXPECT_EQ(logcat.GetJavaCrashes()[1]->tid, 3090);
  EXPECT_EQ(logcat.GetNativeCrashes()[0]->pid, 115);
  EXPECT_EQ(logcat.GetNativeCrashes()[1]->pid, 117);
  EXPECT_EQ(logcat.GetNativeCrashes()[1]->event_time_ms,
            TimeMs(4, 25, 18, 33, 27, 273));
}

TEST(LogcatParserTest, BlankedLinesKeepCounts) {
  const std::vector<std::string> kLines = {
      "04-25 09:55:40.000  1000  1000 I ActivityManager: Start proc foo",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method1(Class.java:1)",
      "04-25 10:00:00.000  1000  1000 D dalvikvm: GC_CONCURRENT freed 1K",
      "04-25 17:17:08.445   312   366 E ActivityManager: ANR (application "
      "not responding) in process: com.android.package",
      "04-25 17:17:08.445   312   366 E ActivityManager: Reason: "
      "keyDispatchingTimedOut",
      "04-25 18:00:00.000  1000  1000 W WindowManager: Window freeze timeout",
      "04-25 18:33:27.273   115   115 I DEBUG   : *** *** *** *** *** *** "
      "*** *** *** *** *** *** *** *** *** ***",
      "04-25 18:33:27.273   115   115 I DEBUG   : pid: 3112, tid: 3112  >>> "
      "com.google.android.browser <<<",
  };

  // Lines that belong to no event.
  for (size_t blanked : {0u, 3u, 6u}) {
    std::vector<std::string> lines = kLines;
    lines[blanked] = "";
    LogcatItem logcat = LogcatParser::Parse(lines, Config2012());
    EXPECT_EQ(logcat.events.size(), 3u) << "line " << blanked;
    EXPECT_EQ(logcat.GetAnrs().size(), 1u) << "line " << blanked;
    EXPECT_EQ(logcat.GetJavaCrashes().size(), 1u) << "line " << blanked;
    EXPECT_EQ(logcat.GetNativeCrashes().size(), 1u) << "line " << blanked;
  }
}

TEST(LogcatParserTest, InterleavedEvents) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
          "04-25 09:55:47.799  3065  3090 E AndroidRuntime: java.lang.Exception",
          "04-25 09:55:47.799   115   115 I DEBUG   : *** *** *** *** *** *** "
          "*** *** *** *** *** *** *** *** *** ***",
          "04-25 09:55:47.799   117   117 I DEBUG   : *** *** *** *** *** *** "
          "*** *** *** *** *** *** *** *** *** ***",
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
          "class.method1(Class.java:1)",
          "04-25 09:55:47.799  3065  3090 E AndroidRuntime: \tat "
          "class.method1(Class.java:1)",
          "04-25 09:55:47.799   115   115 I DEBUG   : Build fingerprint: "
          "'product:build:target'",
          "04-25 09:55:47.799   117   117 I DEBUG   : Build fingerprint: "
          "'product:build:target'",
      },
      Config2012());

  EXPECT_EQ(logcat.events.size(), 4u);
  EXPECT_EQ(logcat.GetAnrs().size(), 0u);
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 2u);
  ASSERT_EQ(logcat.GetNativeCrashes().size(), 2u);
  EXPECT_EQ(logcat.GetJavaCrashes()[0]->stack,
            "java.lang.Exception\n\tat class.method1(Class.java:1)");
  EXPECT_EQ(logcat.GetJavaCrashes()[1]->pid, 3065);
  EXPECT_EQ(logcat.GetNativeCrashes()[0]->fingerprint, "product:build:target");
  EXPECT_EQ(logcat.GetNativeCrashes()[1]->pid, 117);
}

TEST(LogcatParserTest, FatalExceptionStartsNewEvent) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 09:55:47.799  3064  3064 E AndroidRuntime: FATAL EXCEPTION: "
          "main",
          "04-25 09:55:47.799  3064  3064 E AndroidRuntime: java.lang.Exception",
          "04-25 09:56:47.799  3064  3064 E AndroidRuntime: FATAL EXCEPTION: "
          "main",
          "04-25 09:56:47.799  3064  3064 E AndroidRuntime: Process: "
          "com.android.package, PID: 3064",
          "04-25 09:56:47.799  3064  3064 E AndroidRuntime: "
          "java.lang.IllegalStateException: boom",
      },
      Config2012());

  ASSERT_EQ(logcat.GetJavaCrashes().size(), 2u);
  EXPECT_EQ(logcat.GetJavaCrashes()[0]->exception, "java.lang.Exception");
  EXPECT_EQ(logcat.GetJavaCrashes()[1]->exception,
            "java.lang.IllegalStateException");
  EXPECT_EQ(logcat.GetJavaCrashes()[1]->app, "com.android.package");
  EXPECT_EQ(logcat.GetJavaCrashes()[1]->event_time_ms,
            TimeMs(4, 25, 9, 56, 47, 799));
}

TEST(LogcatParserTest, PartialPreambles) {
  std::vector<std::string> preamble = {
      "04-25 09:15:47.799   123  3082 I tag: message 1",
      "04-25 09:20:47.799  3064  3082 I tag: message 2",
      "04-25 09:25:47.799   345  3082 I tag: message 3",
      "04-25 09:30:47.799  3064  3082 I tag: message 4",
      "04-25 09:35:47.799   456  3082 I tag: message 5",
      "04-25 09:40:47.799  3064  3082 I tag: message 6",
      "04-25 09:45:47.799   567  3082 I tag: message 7",
      "04-25 09:50:47.799  3064  3082 I tag: message 8",
  };
  std::vector<std::string> lines = preamble;
  lines.push_back(
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception");
  lines.push_back(
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method1(Class.java:1)");

  LogcatItem logcat = LogcatParser::Parse(lines, Config2012());
  EXPECT_EQ(logcat.start_time_ms, TimeMs(4, 25, 9, 15, 47, 799));
  EXPECT_EQ(logcat.stop_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 1u);
  const JavaCrashItem* crash = logcat.GetJavaCrashes()[0];
  EXPECT_EQ(crash->last_preamble, base::Join(preamble, "\n"));
  EXPECT_EQ(crash->process_preamble,
            base::Join({preamble[1], preamble[3], preamble[5], preamble[7]},
                       "\n"));
}

TEST(LogcatParserTest, Preambles) {
  std::vector<std::string> lines = {
      "04-25 09:43:47.799  3064  3082 I tag: message 1",
      "04-25 09:44:47.799   123  3082 I tag: message 2",
      "04-25 09:45:47.799  3064  3082 I tag: message 3",
      "04-25 09:46:47.799   234  3082 I tag: message 4",
      "04-25 09:47:47.799  3064  3082 I tag: message 5",
      "04-25 09:48:47.799   345  3082 I tag: message 6",
      "04-25 09:49:47.799  3064  3082 I tag: message 7",
      "04-25 09:50:47.799   456  3082 I tag: message 8",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
  };
  Config config = Config2012();
  config.last_preamble_size = 3;
  config.process_preamble_size = 3;

  LogcatItem logcat = LogcatParser::Parse(lines, config);
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 1u);
  const JavaCrashItem* crash = logcat.GetJavaCrashes()[0];
  EXPECT_EQ(crash->last_preamble,
            base::Join({lines[5], lines[6], lines[7]}, "\n"));
  EXPECT_EQ(crash->process_preamble,
            base::Join({lines[2], lines[4], lines[6]}, "\n"));
}

TEST(LogcatParserTest, RingBufferBoundsPreambles) {
  std::vector<std::string> lines = {
      "04-25 09:43:47.799  3064  3082 I tag: message 1",
      "04-25 09:44:47.799   123  3082 I tag: message 2",
      "04-25 09:45:47.799  3064  3082 I tag: message 3",
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
  };
  Config config = Config2012();
  config.logcat_ring_buffer_size = 2;

  LogcatItem logcat = LogcatParser::Parse(lines, config);
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 1u);
  const JavaCrashItem* crash = logcat.GetJavaCrashes()[0];
  EXPECT_EQ(crash->last_preamble, lines[1] + "\n" + lines[2]);
  EXPECT_EQ(crash->process_preamble, lines[2]);
}

TEST(LogcatParserTest, TimeFormat) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 09:55:47.799  E/AndroidRuntime(3064): java.lang.Exception",
          "04-25 09:55:47.799  E/AndroidRuntime(3064): \tat "
          "class.method1(Class.java:1)",
          "04-25 09:55:47.799  E/AndroidRuntime( 3064): \tat "
          "class.method2(Class.java:2)",
      },
      Config2012());

  EXPECT_EQ(logcat.start_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
  ASSERT_EQ(logcat.events.size(), 1u);
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 1u);
  const JavaCrashItem* crash = logcat.GetJavaCrashes()[0];
  EXPECT_EQ(crash->pid, 3064);
  EXPECT_FALSE(crash->tid.has_value());
  EXPECT_EQ(crash->event_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
}

// The time format pads the tag before the pid: "I/DEBUG   (  115)".
TEST(LogcatParserTest, TimeFormatPaddedTag) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "04-25 18:33:27.273 I/DEBUG   (  115): *** *** *** *** *** *** *** "
          "*** *** *** *** *** *** *** *** ***",
          "04-25 18:33:27.273 I/DEBUG   (  115): Build fingerprint: 'fp'",
          "04-25 18:33:27.273 I/DEBUG   (  115): pid: 957, tid: 963  >>> "
          "com.android.camera <<<",
      },
      Config2012());

  ASSERT_EQ(logcat.events.size(), 1u);
  ASSERT_EQ(logcat.GetNativeCrashes().size(), 1u);
  const NativeCrashItem* crash = logcat.GetNativeCrashes()[0];
  EXPECT_EQ(crash->pid, 115);
  EXPECT_EQ(crash->app, "com.android.camera");
  EXPECT_EQ(crash->fingerprint, "fp");
  EXPECT_EQ(crash->event_time_ms, TimeMs(4, 25, 18, 33, 27, 273));
}

TEST(LogcatParserTest, SkipsMarkersAndGarbage) {
  LogcatItem logcat = LogcatParser::Parse(
      {
          "--------- beginning of /dev/log/system",
          "this is not a logcat line",
          "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception",
      },
      Config2012());
  ASSERT_EQ(logcat.GetJavaCrashes().size(), 1u);
  EXPECT_EQ(logcat.GetJavaCrashes()[0]->last_preamble, "");
  EXPECT_EQ(logcat.start_time_ms, TimeMs(4, 25, 9, 55, 47, 799));
}

TEST(LogcatParserTest, EmptyLog) {
  LogcatItem logcat = LogcatParser::Parse({}, Config2012());
  EXPECT_FALSE(logcat.start_time_ms.has_value());
  EXPECT_FALSE(logcat.stop_time_ms.has_value());
  EXPECT_TRUE(logcat.events.empty());
}

TEST(LogcatParserTest, InferredYear) {
  LogcatItem logcat = LogcatParser::Parse(
      {"04-25 09:55:47.799  3064  3082 I tag: message"});
  EXPECT_TRUE(logcat.year_inferred);
  ASSERT_TRUE(logcat.start_time_ms.has_value());
  EXPECT_EQ(base::GetYear(*logcat.start_time_ms / 1000),
            base::GetCurrentYear());
}

TEST(LogcatParserTest, SetYear) {
  LogcatParser parser;
  parser.set_year(1999);
  ItemList items;
  parser.ParseBlock({"01-01 00:00:01.000  1  1 I tag: message"}, &items);
  const LogcatItem* logcat = items.GetFirst<LogcatItem>();
  ASSERT_NE(logcat, nullptr);
  EXPECT_FALSE(logcat->year_inferred);
  EXPECT_EQ(logcat->start_time_ms, base::MkTime(1999, 1, 1, 0, 0, 1) * 1000);
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
