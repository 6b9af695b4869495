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

#include "bugsift/parser/parse.h"

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/file_utils.h"
#include "bugsift/ext/base/temp_file.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

base::TempFile WriteTempFile(const std::string& contents) {
  base::TempFile tmp = base::TempFile::Create();
  BUGSIFT_CHECK(base::WriteAll(tmp.fd(), contents.data(), contents.size()) ==
                static_cast<ssize_t>(contents.size()));
  return tmp;
}

TEST(ParseTest, BugreportFile) {
  base::TempFile tmp = WriteTempFile(
      "== dumpstate: 2012-04-25 20:45:10\n"
      "------ SYSTEM LOG (logcat -v threadtime -d *:v) ------\n"
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception\n"
      "04-25 09:55:47.799  3064  3082 E AndroidRuntime: \tat "
      "class.method1(Class.java:1)\n");

  base::StatusOr<BugreportItem> bugreport = ParseBugreportFile(tmp.path());
  ASSERT_TRUE(bugreport.ok()) << bugreport.status().message();
  ASSERT_TRUE(bugreport->system_log.has_value());
  EXPECT_EQ(bugreport->system_log->GetJavaCrashes().size(), 1u);
}

TEST(ParseTest, LogcatFileWithConfig) {
  base::TempFile tmp = WriteTempFile(
      "01-01 01:02:03.000     1     1 I TAG     : message\n"
      "01-01 01:02:04.000     1     1 I TAG     : message\n");
  Config config;
  config.logcat_year = 2010;

  base::StatusOr<LogcatItem> logcat = ParseLogcatFile(tmp.path(), config);
  ASSERT_TRUE(logcat.ok()) << logcat.status().message();
  EXPECT_FALSE(logcat->year_inferred);
  EXPECT_EQ(logcat->start_time_ms,
            ParseLogcat({"01-01 01:02:03.000     1     1 I TAG     : x"},
                        config)
                .start_time_ms);
}

TEST(ParseTest, MonkeyLogFile) {
  base::TempFile tmp = WriteTempFile(
      ":Monkey: seed=528 count=10000\n"
      "Events injected: 10000\n"
      "// Monkey finished\n");

  base::StatusOr<MonkeyLogItem> monkey_log = ParseMonkeyLogFile(tmp.path());
  ASSERT_TRUE(monkey_log.ok()) << monkey_log.status().message();
  EXPECT_EQ(monkey_log->seed, 528);
  EXPECT_EQ(monkey_log->final_count, 10000);
  EXPECT_TRUE(monkey_log->is_finished);
}

TEST(ParseTest, ProcrankFile) {
  base::TempFile tmp = WriteTempFile(
      "  PID      Vss      Rss      Pss      Uss  cmdline\n"
      "  178   87136K   81684K   52829K   50012K  system_server\n");

  base::StatusOr<ProcrankItem> procrank = ParseProcrankFile(tmp.path());
  ASSERT_TRUE(procrank.ok()) << procrank.status().message();
  EXPECT_EQ(procrank->GetProcessName(178), "system_server");
  EXPECT_EQ(procrank->GetPss(178), 52829);
}

TEST(ParseTest, MissingFiles) {
  const std::string kPath = "/this/file/does/not/exist";
  EXPECT_FALSE(ParseBugreportFile(kPath).ok());
  EXPECT_FALSE(ParseLogcatFile(kPath).ok());
  EXPECT_FALSE(ParseMonkeyLogFile(kPath).ok());
  EXPECT_FALSE(ParseProcrankFile(kPath).ok());
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
