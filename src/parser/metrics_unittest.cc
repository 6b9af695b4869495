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

#include "bugsift/parser/metrics.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

using testing::Contains;
using testing::Key;
using testing::Not;
using testing::Pair;
using testing::UnorderedElementsAre;

TEST(MetricsTest, EmptyLogcat) {
  EXPECT_THAT(ToMetrics(LogcatItem()),
              UnorderedElementsAre(Pair("anrs", "0"), Pair("java_crashes", "0"),
                                   Pair("native_crashes", "0"),
                                   Pair("logcat_year_inferred", "0")));
}

TEST(MetricsTest, Logcat) {
  LogcatItem logcat;
  logcat.start_time_ms = 1000;
  logcat.stop_time_ms = 2000;
  logcat.year_inferred = true;
  logcat.events.emplace_back(AnrItem());
  logcat.events.emplace_back(AnrItem());
  logcat.events.emplace_back(NativeCrashItem());

  Metrics metrics = ToMetrics(logcat);
  EXPECT_THAT(metrics, Contains(Pair("anrs", "2")));
  EXPECT_THAT(metrics, Contains(Pair("java_crashes", "0")));
  EXPECT_THAT(metrics, Contains(Pair("native_crashes", "1")));
  EXPECT_THAT(metrics, Contains(Pair("logcat_start_time_ms", "1000")));
  EXPECT_THAT(metrics, Contains(Pair("logcat_stop_time_ms", "2000")));
  EXPECT_THAT(metrics, Contains(Pair("logcat_year_inferred", "1")));
}

TEST(MetricsTest, Bugreport) {
  BugreportItem bugreport;
  bugreport.time_ms = 1335386710000;
  bugreport.mem_info.emplace();
  bugreport.mem_info->values["MemTotal"] = 353332;
  bugreport.mem_info->values["Buffers"] = 20800;
  bugreport.procrank.emplace();
  bugreport.procrank->rows[178].process_name = "system_server";
  bugreport.procrank->rows[1313].process_name = "com.android.browser";
  bugreport.system_props.emplace();
  bugreport.system_props->values["dalvik.vm.heapsize"] = "256m";
  bugreport.system_log.emplace();
  bugreport.system_log->events.emplace_back(JavaCrashItem());

  Metrics metrics = ToMetrics(bugreport);
  EXPECT_THAT(metrics, Contains(Pair("bugreport_time_ms", "1335386710000")));
  EXPECT_THAT(metrics, Contains(Pair("mem_total_kb", "353332")));
  EXPECT_THAT(metrics, Not(Contains(Key("mem_free_kb"))));
  EXPECT_THAT(metrics, Contains(Pair("procrank_processes", "2")));
  EXPECT_THAT(metrics, Contains(Pair("system_props", "1")));
  EXPECT_THAT(metrics, Contains(Pair("java_crashes", "1")));
}

TEST(MetricsTest, BugreportWithoutSystemLog) {
  Metrics metrics = ToMetrics(BugreportItem());
  EXPECT_TRUE(metrics.empty());
}

TEST(MetricsTest, MonkeyLog) {
  MonkeyLogItem monkey_log;
  monkey_log.target_count = 10000;
  monkey_log.intermediate_count = 9900;
  monkey_log.final_count = 10000;
  monkey_log.seed = 528;
  monkey_log.throttle = 100;
  monkey_log.is_finished = true;
  monkey_log.total_duration_ms = 297000;
  monkey_log.start_uptime_ms = 242130;
  monkey_log.stop_uptime_ms = 539210;
  monkey_log.packages = {"com.android.b", "com.android.a"};
  monkey_log.dropped_counts[MonkeyLogItem::DroppedCategory::kKeys] = 5;
  monkey_log.dropped_counts[MonkeyLogItem::DroppedCategory::kRotations] = 0;

  Metrics metrics = ToMetrics(monkey_log);
  EXPECT_THAT(metrics, Contains(Pair("monkey_target_count", "10000")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_intermediate_count", "9900")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_final_count", "10000")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_seed", "528")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_throttle", "100")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_finished", "1")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_no_activities", "0")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_total_duration_ms", "297000")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_uptime_ms", "297080")));
  EXPECT_THAT(metrics,
              Contains(Pair("monkey_packages", "com.android.a,com.android.b")));
  EXPECT_THAT(metrics, Not(Contains(Key("monkey_categories"))));
  EXPECT_THAT(metrics, Contains(Pair("monkey_dropped_keys", "5")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_dropped_rotations", "0")));
  EXPECT_THAT(metrics, Not(Contains(Key("monkey_dropped_flips"))));
  EXPECT_THAT(metrics, Not(Contains(Key("monkey_crash"))));
}

TEST(MetricsTest, MonkeyLogCrash) {
  MonkeyLogItem monkey_log;
  AnrItem anr;
  anr.app = "com.android.package";
  monkey_log.crash = anr;
  Metrics metrics = ToMetrics(monkey_log);
  EXPECT_THAT(metrics, Contains(Pair("monkey_crash", "ANR")));
  EXPECT_THAT(metrics, Contains(Pair("monkey_crash_app", "com.android.package")));

  monkey_log.crash = JavaCrashItem();
  metrics = ToMetrics(monkey_log);
  EXPECT_THAT(metrics, Contains(Pair("monkey_crash", "JAVA CRASH")));
  EXPECT_THAT(metrics, Not(Contains(Key("monkey_crash_app"))));
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
