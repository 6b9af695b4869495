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

#ifndef INCLUDE_BUGSIFT_PARSER_ITEMS_H_
#define INCLUDE_BUGSIFT_PARSER_ITEMS_H_

#include <stdint.h>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "bugsift/base/status.h"
#include "bugsift/ext/base/status_or.h"

namespace bugsift {
namespace parser {

// The items below are the typed records produced by the parsers. Every field
// that may be missing from the input is an std::optional: absent data stays
// unset rather than defaulting to zero.
//
// All timestamps are milliseconds since the Epoch (UTC). Memory sizes are in
// KB.

// Type URL of the payload attached to the error status returned by
// MergeItems() when both sides hold different values for the same field. The
// payload value is "<item type>.<field>".
constexpr char kConflictingItemPayload[] = "bugsift.dev/ConflictingItem";

// Returns true if |status| was returned by a merge that failed because of
// conflicting values.
bool IsConflictingItemError(const base::Status& status);

// Fields shared by all the events extracted from a logcat.
struct GenericLogcatItem {
  std::optional<int64_t> event_time_ms;
  std::optional<int32_t> pid;
  std::optional<int32_t> tid;  // Unset for logcats in the "time" format.
  std::optional<std::string> app;
  // The last lines of the log before the event, regardless of their origin.
  std::optional<std::string> last_preamble;
  // The last lines of the log before the event, from the event's pid only.
  std::optional<std::string> process_preamble;

  bool operator==(const GenericLogcatItem& o) const;
};

struct AnrItem : public GenericLogcatItem {
  static constexpr char kType[] = "ANR";

  std::optional<std::string> activity;
  std::optional<std::string> reason;
  // CPU usage percentages from the TOTAL line.
  std::optional<double> cpu_total;
  std::optional<double> cpu_user;
  std::optional<double> cpu_kernel;
  std::optional<double> cpu_iowait;
  std::optional<double> cpu_irq;
  // Load averages.
  std::optional<double> load_1;
  std::optional<double> load_5;
  std::optional<double> load_15;
  // Main thread stack from the "VM TRACES AT LAST ANR" bugreport section.
  std::optional<std::string> trace;

  bool operator==(const AnrItem& o) const;
  bool operator!=(const AnrItem& o) const { return !(*this == o); }
};

struct JavaCrashItem : public GenericLogcatItem {
  static constexpr char kType[] = "JAVA CRASH";

  std::optional<std::string> exception;
  std::optional<std::string> message;
  // The exception line followed by its stack frames.
  std::optional<std::string> stack;
  // One entry per "Caused by:" group, in order. Empty means unset.
  std::vector<std::string> cause_stacks;

  bool operator==(const JavaCrashItem& o) const;
  bool operator!=(const JavaCrashItem& o) const { return !(*this == o); }
};

struct NativeCrashItem : public GenericLogcatItem {
  static constexpr char kType[] = "NATIVE CRASH";

  std::optional<std::string> fingerprint;
  std::optional<std::string> stack;

  bool operator==(const NativeCrashItem& o) const;
  bool operator!=(const NativeCrashItem& o) const { return !(*this == o); }
};

// Per-process memory usage, keyed by pid.
struct ProcrankItem {
  static constexpr char kType[] = "PROCRANK";

  struct Row {
    std::string process_name;
    // Lowercased column name (e.g. "vss", "pss", "swap") -> value in KB.
    std::map<std::string, int64_t> stats_kb;

    bool operator==(const Row& o) const {
      return process_name == o.process_name && stats_kb == o.stats_kb;
    }
    bool operator!=(const Row& o) const { return !(*this == o); }
  };

  std::vector<int32_t> GetPids() const;
  std::optional<std::string> GetProcessName(int32_t pid) const;
  std::optional<int64_t> GetStat(int32_t pid, const std::string& column) const;
  std::optional<int64_t> GetVss(int32_t pid) const {
    return GetStat(pid, "vss");
  }
  std::optional<int64_t> GetRss(int32_t pid) const {
    return GetStat(pid, "rss");
  }
  std::optional<int64_t> GetPss(int32_t pid) const {
    return GetStat(pid, "pss");
  }
  std::optional<int64_t> GetUss(int32_t pid) const {
    return GetStat(pid, "uss");
  }

  bool operator==(const ProcrankItem& o) const { return rows == o.rows; }
  bool operator!=(const ProcrankItem& o) const { return !(*this == o); }

  std::map<int32_t, Row> rows;
};

// Contents of /proc/meminfo: "MemTotal" -> 353332 (KB).
struct MemInfoItem {
  static constexpr char kType[] = "MEMORY INFO";

  bool operator==(const MemInfoItem& o) const { return values == o.values; }
  bool operator!=(const MemInfoItem& o) const { return !(*this == o); }

  std::map<std::string, int64_t> values;
};

// Output of getprop: "dalvik.vm.heapsize" -> "256m".
struct SystemPropsItem {
  static constexpr char kType[] = "SYSTEM PROPERTIES";

  bool operator==(const SystemPropsItem& o) const {
    return values == o.values;
  }
  bool operator!=(const SystemPropsItem& o) const { return !(*this == o); }

  std::map<std::string, std::string> values;
};

// The VM traces dumped for the last ANR.
struct TracesItem {
  static constexpr char kType[] = "TRACES";

  std::optional<int32_t> pid;
  std::optional<std::string> app;
  // Stack of the main thread.
  std::optional<std::string> stack;

  bool operator==(const TracesItem& o) const;
  bool operator!=(const TracesItem& o) const { return !(*this == o); }
};

using LogcatEvent = std::variant<AnrItem, JavaCrashItem, NativeCrashItem>;

struct LogcatItem {
  static constexpr char kType[] = "LOGCAT";

  std::vector<const AnrItem*> GetAnrs() const;
  std::vector<const JavaCrashItem*> GetJavaCrashes() const;
  std::vector<const NativeCrashItem*> GetNativeCrashes() const;
  std::vector<AnrItem*> GetMutableAnrs();

  bool operator==(const LogcatItem& o) const;
  bool operator!=(const LogcatItem& o) const { return !(*this == o); }

  // Timestamps of the first and last parsed lines.
  std::optional<int64_t> start_time_ms;
  std::optional<int64_t> stop_time_ms;

  // True if the timestamps were built using the current wall-clock year
  // because no year was known for this log.
  bool year_inferred = false;

  // Events in the order they started in the log.
  std::vector<LogcatEvent> events;
};

struct BugreportItem {
  static constexpr char kType[] = "BUGREPORT";

  bool operator==(const BugreportItem& o) const;
  bool operator!=(const BugreportItem& o) const { return !(*this == o); }

  // Time of the dumpstate header.
  std::optional<int64_t> time_ms;
  std::optional<MemInfoItem> mem_info;
  std::optional<ProcrankItem> procrank;
  std::optional<LogcatItem> system_log;
  std::optional<SystemPropsItem> system_props;
};

using MonkeyCrash = std::variant<AnrItem, JavaCrashItem>;

struct MonkeyLogItem {
  static constexpr char kType[] = "MONKEY_LOG";

  enum class DroppedCategory {
    kKeys = 0,
    kPointers,
    kTrackballs,
    kFlips,
    kRotations,
  };

  std::optional<int32_t> GetDroppedCount(DroppedCategory category) const;

  bool operator==(const MonkeyLogItem& o) const;
  bool operator!=(const MonkeyLogItem& o) const { return !(*this == o); }

  std::optional<int64_t> start_time_ms;
  std::optional<int64_t> stop_time_ms;
  std::set<std::string> packages;
  std::set<std::string> categories;
  int32_t throttle = 0;
  std::optional<int64_t> seed;
  std::optional<int32_t> target_count;
  bool ignore_security_exceptions = false;
  // Duration reported by the stop banner (mm:ss).
  std::optional<int64_t> total_duration_ms;
  // Device uptime at the start and stop banners.
  std::optional<int64_t> start_uptime_ms;
  std::optional<int64_t> stop_uptime_ms;
  bool is_finished = false;
  bool no_activities = false;
  int32_t intermediate_count = 0;
  std::optional<int32_t> final_count;
  std::map<DroppedCategory, int32_t> dropped_counts;
  std::optional<MonkeyCrash> crash;
};

using Item = std::variant<AnrItem,
                          JavaCrashItem,
                          NativeCrashItem,
                          ProcrankItem,
                          MemInfoItem,
                          SystemPropsItem,
                          TracesItem,
                          LogcatItem,
                          BugreportItem,
                          MonkeyLogItem>;

// Returns the type tag (the kType of the held alternative).
const char* GetItemType(const Item& item);

// Field-by-field merge. For each field the non-null side wins. If both sides
// hold different non-null values the merge fails with an error status
// carrying the kConflictingItemPayload payload. Map-like items merge key by
// key. Sub-items of composite items are merged recursively.
base::StatusOr<AnrItem> MergeItems(const AnrItem& a, const AnrItem& b);
base::StatusOr<JavaCrashItem> MergeItems(const JavaCrashItem& a,
                                         const JavaCrashItem& b);
base::StatusOr<NativeCrashItem> MergeItems(const NativeCrashItem& a,
                                           const NativeCrashItem& b);
base::StatusOr<ProcrankItem> MergeItems(const ProcrankItem& a,
                                        const ProcrankItem& b);
base::StatusOr<MemInfoItem> MergeItems(const MemInfoItem& a,
                                       const MemInfoItem& b);
base::StatusOr<SystemPropsItem> MergeItems(const SystemPropsItem& a,
                                           const SystemPropsItem& b);
base::StatusOr<TracesItem> MergeItems(const TracesItem& a,
                                      const TracesItem& b);
base::StatusOr<LogcatItem> MergeItems(const LogcatItem& a,
                                      const LogcatItem& b);
base::StatusOr<BugreportItem> MergeItems(const BugreportItem& a,
                                         const BugreportItem& b);
base::StatusOr<MonkeyLogItem> MergeItems(const MonkeyLogItem& a,
                                         const MonkeyLogItem& b);

// Items of different types never merge.
base::StatusOr<Item> MergeItems(const Item& a, const Item& b);

// Returns true iff MergeItems(a, b) would succeed.
template <typename T>
bool IsConsistent(const T& a, const T& b) {
  return MergeItems(a, b).ok();
}

// A missing item is never consistent with anything.
bool IsConsistent(const Item& a, const Item* b);

}  // namespace parser
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_PARSER_ITEMS_H_
