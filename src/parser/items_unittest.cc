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

#include "bugsift/parser/items.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

AnrItem PartialAnr1() {
  AnrItem anr;
  anr.app = "com.android.package";
  anr.reason = "reason";
  anr.cpu_user = 13;
  anr.cpu_iowait = 19;
  anr.load_1 = 2.0;
  anr.load_15 = 5.0;
  anr.pid = 101;
  return anr;
}

AnrItem PartialAnr2() {
  AnrItem anr;
  anr.activity = "com.android.package/.Activity";
  anr.cpu_total = 11;
  anr.cpu_kernel = 17;
  anr.cpu_irq = 23;
  anr.load_5 = 3.0;
  anr.event_time_ms = 0;
  anr.tid = 103;
  return anr;
}

AnrItem FullAnr() {
  AnrItem anr = PartialAnr1();
  anr.activity = "com.android.package/.Activity";
  anr.cpu_total = 11;
  anr.cpu_kernel = 17;
  anr.cpu_irq = 23;
  anr.load_5 = 3.0;
  anr.event_time_ms = 0;
  anr.tid = 103;
  return anr;
}

TEST(ItemsTest, MergeEmptyAnrs) {
  base::StatusOr<AnrItem> anr = MergeItems(AnrItem(), AnrItem());
  ASSERT_TRUE(anr.ok());
  EXPECT_EQ(*anr, AnrItem());
  EXPECT_FALSE(anr->app.has_value());
  EXPECT_FALSE(anr->trace.has_value());
}

TEST(ItemsTest, MergeComplementaryAnrs) {
  base::StatusOr<AnrItem> anr = MergeItems(PartialAnr1(), PartialAnr2());
  ASSERT_TRUE(anr.ok());
  EXPECT_EQ(*anr, FullAnr());

  // Merging is symmetric.
  anr = MergeItems(PartialAnr2(), PartialAnr1());
  ASSERT_TRUE(anr.ok());
  EXPECT_EQ(*anr, FullAnr());

  anr = MergeItems(FullAnr(), PartialAnr1());
  ASSERT_TRUE(anr.ok());
  EXPECT_EQ(*anr, FullAnr());
}

TEST(ItemsTest, MergeWithSelf) {
  AnrItem full = FullAnr();
  full.trace = "\"main\" prio=5 tid=1 NATIVE";
  full.last_preamble = "preamble";

  base::StatusOr<AnrItem> anr = MergeItems(full, full);
  ASSERT_TRUE(anr.ok());
  EXPECT_EQ(*anr, full);
  EXPECT_TRUE(IsConsistent(full, full));
}

TEST(ItemsTest, MergeConflictingAnrs) {
  AnrItem inconsistent = FullAnr();
  inconsistent.reason = "different reason";

  base::StatusOr<AnrItem> anr = MergeItems(FullAnr(), inconsistent);
  ASSERT_FALSE(anr.ok());
  EXPECT_TRUE(IsConflictingItemError(anr.status()));
  EXPECT_EQ(anr.status().GetPayload(kConflictingItemPayload), "ANR.reason");

  EXPECT_TRUE(IsConsistent(FullAnr(), PartialAnr2()));
  EXPECT_FALSE(IsConsistent(PartialAnr1(), inconsistent));
}

TEST(ItemsTest, ConflictNamesFirstField) {
  AnrItem a;
  a.pid = 1;
  a.trace = "a";
  AnrItem b;
  b.pid = 2;
  b.trace = "b";
  base::StatusOr<AnrItem> anr = MergeItems(a, b);
  ASSERT_FALSE(anr.ok());
  EXPECT_EQ(anr.status().GetPayload(kConflictingItemPayload), "ANR.pid");
}

TEST(ItemsTest, IsConflictingItemError) {
  EXPECT_FALSE(IsConflictingItemError(base::OkStatus()));
  EXPECT_FALSE(IsConflictingItemError(base::ErrStatus("I/O error")));
}

TEST(ItemsTest, MergeJavaCrashes) {
  JavaCrashItem a;
  a.exception = "java.lang.Exception";
  a.cause_stacks = {"Caused by: foo"};
  JavaCrashItem b;
  b.app = "com.android.package";
  b.message = "Test";

  base::StatusOr<JavaCrashItem> crash = MergeItems(a, b);
  ASSERT_TRUE(crash.ok());
  EXPECT_EQ(crash->exception, "java.lang.Exception");
  EXPECT_EQ(crash->app, "com.android.package");
  EXPECT_EQ(crash->message, "Test");
  EXPECT_THAT(crash->cause_stacks, testing::ElementsAre("Caused by: foo"));

  b.cause_stacks = {"Caused by: bar"};
  crash = MergeItems(a, b);
  ASSERT_FALSE(crash.ok());
  EXPECT_EQ(crash.status().GetPayload(kConflictingItemPayload),
            "JAVA CRASH.cause_stacks");
}

TEST(ItemsTest, MergeNativeCrashes) {
  NativeCrashItem a;
  a.fingerprint = "fingerprint";
  NativeCrashItem b;
  b.stack = "stack";
  base::StatusOr<NativeCrashItem> crash = MergeItems(a, b);
  ASSERT_TRUE(crash.ok());
  EXPECT_EQ(crash->fingerprint, "fingerprint");
  EXPECT_EQ(crash->stack, "stack");

  b.fingerprint = "other";
  EXPECT_FALSE(IsConsistent(a, b));
}

TEST(ItemsTest, MergeMapsKeyWise) {
  MemInfoItem a;
  a.values["MemTotal"] = 353332;
  MemInfoItem b;
  b.values["MemFree"] = 65420;
  b.values["MemTotal"] = 353332;

  base::StatusOr<MemInfoItem> mem_info = MergeItems(a, b);
  ASSERT_TRUE(mem_info.ok());
  EXPECT_EQ(mem_info->values.size(), 2u);

  b.values["MemTotal"] = 1;
  mem_info = MergeItems(a, b);
  ASSERT_FALSE(mem_info.ok());
  EXPECT_EQ(mem_info.status().GetPayload(kConflictingItemPayload),
            "MEMORY INFO.values");
}

TEST(ItemsTest, MergeProcrankRows) {
  ProcrankItem a;
  a.rows[178] = ProcrankItem::Row{"system_server", {{"pss", 52829}}};
  ProcrankItem b;
  b.rows[1] = ProcrankItem::Row{"/init", {{"pss", 10}}};

  base::StatusOr<ProcrankItem> procrank = MergeItems(a, b);
  ASSERT_TRUE(procrank.ok());
  EXPECT_THAT(procrank->GetPids(), testing::ElementsAre(1, 178));
  EXPECT_EQ(procrank->GetProcessName(178), "system_server");
  EXPECT_EQ(procrank->GetPss(178), 52829);
  EXPECT_EQ(procrank->GetUss(178), std::nullopt);
  EXPECT_EQ(procrank->GetProcessName(2), std::nullopt);

  b.rows[178] = ProcrankItem::Row{"zygote", {{"pss", 52829}}};
  EXPECT_FALSE(IsConsistent(a, b));
}

TEST(ItemsTest, MergeBugreportRecursively) {
  BugreportItem a;
  a.time_ms = 1000;
  a.system_props = SystemPropsItem();
  a.system_props->values["ro.build.id"] = "ABC";
  BugreportItem b;
  b.system_props = SystemPropsItem();
  b.system_props->values["ro.product.name"] = "soju";

  base::StatusOr<BugreportItem> bugreport = MergeItems(a, b);
  ASSERT_TRUE(bugreport.ok());
  EXPECT_EQ(bugreport->time_ms, 1000);
  EXPECT_EQ(bugreport->system_props->values.size(), 2u);
  EXPECT_FALSE(bugreport->procrank.has_value());

  b.system_props->values["ro.build.id"] = "XYZ";
  bugreport = MergeItems(a, b);
  ASSERT_FALSE(bugreport.ok());
  EXPECT_EQ(bugreport.status().GetPayload(kConflictingItemPayload),
            "SYSTEM PROPERTIES.values");
}

TEST(ItemsTest, LogcatEventAccessors) {
  LogcatItem logcat;
  logcat.events.push_back(AnrItem());
  logcat.events.push_back(JavaCrashItem());
  logcat.events.push_back(AnrItem());
  logcat.events.push_back(NativeCrashItem());

  EXPECT_EQ(logcat.GetAnrs().size(), 2u);
  EXPECT_EQ(logcat.GetJavaCrashes().size(), 1u);
  EXPECT_EQ(logcat.GetNativeCrashes().size(), 1u);

  logcat.GetMutableAnrs()[1]->trace = "trace";
  EXPECT_FALSE(logcat.GetAnrs()[0]->trace.has_value());
  EXPECT_EQ(logcat.GetAnrs()[1]->trace, "trace");
}

TEST(ItemsTest, MergeLogcats) {
  LogcatItem a;
  a.start_time_ms = 1;
  a.events.push_back(AnrItem());
  LogcatItem b;
  b.stop_time_ms = 2;
  b.year_inferred = true;

  base::StatusOr<LogcatItem> logcat = MergeItems(a, b);
  ASSERT_TRUE(logcat.ok());
  EXPECT_EQ(logcat->start_time_ms, 1);
  EXPECT_EQ(logcat->stop_time_ms, 2);
  EXPECT_TRUE(logcat->year_inferred);
  EXPECT_EQ(logcat->events.size(), 1u);

  b.events.push_back(JavaCrashItem());
  EXPECT_FALSE(IsConsistent(a, b));
}

TEST(ItemsTest, MergeMonkeyLogs) {
  MonkeyLogItem a;
  a.throttle = 100;
  a.packages = {"com.android.browser"};
  a.dropped_counts[MonkeyLogItem::DroppedCategory::kKeys] = 5;
  MonkeyLogItem b;
  b.seed = 123;
  b.is_finished = true;
  b.dropped_counts[MonkeyLogItem::DroppedCategory::kPointers] = 1;

  base::StatusOr<MonkeyLogItem> monkey = MergeItems(a, b);
  ASSERT_TRUE(monkey.ok());
  EXPECT_EQ(monkey->throttle, 100);
  EXPECT_EQ(monkey->seed, 123);
  EXPECT_TRUE(monkey->is_finished);
  EXPECT_EQ(
      monkey->GetDroppedCount(MonkeyLogItem::DroppedCategory::kKeys), 5);
  EXPECT_EQ(
      monkey->GetDroppedCount(MonkeyLogItem::DroppedCategory::kPointers), 1);
  EXPECT_EQ(
      monkey->GetDroppedCount(MonkeyLogItem::DroppedCategory::kFlips),
      std::nullopt);

  b.throttle = 200;
  EXPECT_FALSE(IsConsistent(a, b));
}

TEST(ItemsTest, MergeMonkeyCrashes) {
  MonkeyLogItem a;
  AnrItem anr;
  anr.app = "com.android.browser";
  a.crash = anr;
  MonkeyLogItem b;
  AnrItem other;
  other.pid = 1;
  b.crash = other;

  base::StatusOr<MonkeyLogItem> monkey = MergeItems(a, b);
  ASSERT_TRUE(monkey.ok());
  const AnrItem* merged = std::get_if<AnrItem>(&*monkey->crash);
  ASSERT_NE(merged, nullptr);
  EXPECT_EQ(merged->app, "com.android.browser");
  EXPECT_EQ(merged->pid, 1);

  b.crash = JavaCrashItem();
  monkey = MergeItems(a, b);
  ASSERT_FALSE(monkey.ok());
  EXPECT_EQ(monkey.status().GetPayload(kConflictingItemPayload),
            "MONKEY_LOG.crash");
}

TEST(ItemsTest, MergeVariantItems) {
  Item anr = PartialAnr1();
  Item other_anr = PartialAnr2();
  Item crash = JavaCrashItem();

  base::StatusOr<Item> merged = MergeItems(anr, other_anr);
  ASSERT_TRUE(merged.ok());
  EXPECT_EQ(std::get<AnrItem>(*merged), FullAnr());

  merged = MergeItems(anr, crash);
  ASSERT_FALSE(merged.ok());
  EXPECT_TRUE(IsConflictingItemError(merged.status()));

  EXPECT_TRUE(IsConsistent(anr, &other_anr));
  EXPECT_FALSE(IsConsistent(anr, &crash));
  EXPECT_FALSE(IsConsistent(anr, nullptr));
}

TEST(ItemsTest, GetItemType) {
  EXPECT_STREQ(GetItemType(Item(AnrItem())), "ANR");
  EXPECT_STREQ(GetItemType(Item(JavaCrashItem())), "JAVA CRASH");
  EXPECT_STREQ(GetItemType(Item(NativeCrashItem())), "NATIVE CRASH");
  EXPECT_STREQ(GetItemType(Item(ProcrankItem())), "PROCRANK");
  EXPECT_STREQ(GetItemType(Item(LogcatItem())), "LOGCAT");
  EXPECT_STREQ(GetItemType(Item(BugreportItem())), "BUGREPORT");
  EXPECT_STREQ(GetItemType(Item(MonkeyLogItem())), "MONKEY_LOG");
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
