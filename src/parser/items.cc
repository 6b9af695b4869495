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

#include <tuple>
#include <type_traits>
#include <utility>

namespace bugsift {
namespace parser {

namespace {

// Accumulates the field-by-field merge of two items of the same type. The
// first conflict is recorded and later fields are still merged, so that the
// resulting status always names the first offending field.
class FieldMerger {
 public:
  explicit FieldMerger(const char* type) : type_(type) {}

  template <typename T>
  void Merge(const char* field,
             const std::optional<T>& a,
             const std::optional<T>& b,
             std::optional<T>* out) {
    if (a && b && *a != *b) {
      Conflict(field);
      return;
    }
    *out = a ? a : b;
  }

  // For fields with a default value, the default is treated as unset.
  template <typename T>
  void MergeValue(const char* field, const T& a, const T& b, T* out) {
    const T unset{};
    if (a != unset && b != unset && a != b) {
      Conflict(field);
      return;
    }
    *out = a != unset ? a : b;
  }

  // Collections are atomic: an empty collection is unset.
  template <typename C>
  void MergeCollection(const char* field, const C& a, const C& b, C* out) {
    if (!a.empty() && !b.empty() && a != b) {
      Conflict(field);
      return;
    }
    *out = a.empty() ? b : a;
  }

  // Maps merge key by key.
  template <typename K, typename V>
  void MergeMap(const char* field,
                const std::map<K, V>& a,
                const std::map<K, V>& b,
                std::map<K, V>* out) {
    std::map<K, V> merged = a;
    for (const auto& kv : b) {
      auto it = merged.find(kv.first);
      if (it == merged.end()) {
        merged.emplace(kv.first, kv.second);
      } else if (it->second != kv.second) {
        Conflict(field);
        return;
      }
    }
    *out = std::move(merged);
  }

  // Sub-items are merged recursively through their own MergeItems().
  template <typename T>
  void MergeChild(const std::optional<T>& a,
                  const std::optional<T>& b,
                  std::optional<T>* out) {
    if (!a || !b) {
      *out = a ? a : b;
      return;
    }
    base::StatusOr<T> merged = MergeItems(*a, *b);
    if (!merged.ok()) {
      if (status_.ok())
        status_ = merged.status();
      return;
    }
    *out = std::move(merged.value());
  }

  void MergeGeneric(const GenericLogcatItem& a,
                    const GenericLogcatItem& b,
                    GenericLogcatItem* out) {
    Merge("event_time", a.event_time_ms, b.event_time_ms, &out->event_time_ms);
    Merge("pid", a.pid, b.pid, &out->pid);
    Merge("tid", a.tid, b.tid, &out->tid);
    Merge("app", a.app, b.app, &out->app);
    Merge("last_preamble", a.last_preamble, b.last_preamble,
          &out->last_preamble);
    Merge("process_preamble", a.process_preamble, b.process_preamble,
          &out->process_preamble);
  }

  void Conflict(const char* field) {
    if (!status_.ok())
      return;
    status_ = base::ErrStatus("Cannot merge %s items: conflicting values for %s",
                              type_, field);
    status_.SetPayload(kConflictingItemPayload,
                       std::string(type_) + "." + field);
  }

  const base::Status& status() const { return status_; }

 private:
  const char* type_;
  base::Status status_;
};

template <typename T>
base::StatusOr<T> Finish(const FieldMerger& merger, T out) {
  if (!merger.status().ok())
    return merger.status();
  return std::move(out);
}

template <typename T, typename Events>
std::vector<const T*> FilterEvents(const Events& events) {
  std::vector<const T*> res;
  for (const auto& event : events) {
    if (const T* item = std::get_if<T>(&event))
      res.push_back(item);
  }
  return res;
}

auto GenericTie(const GenericLogcatItem& i) {
  return std::tie(i.event_time_ms, i.pid, i.tid, i.app, i.last_preamble,
                  i.process_preamble);
}

}  // namespace

bool IsConflictingItemError(const base::Status& status) {
  return !status.ok() && status.GetPayload(kConflictingItemPayload).has_value();
}

bool GenericLogcatItem::operator==(const GenericLogcatItem& o) const {
  return GenericTie(*this) == GenericTie(o);
}

bool AnrItem::operator==(const AnrItem& o) const {
  return GenericLogcatItem::operator==(o) &&
         std::tie(activity, reason, cpu_total, cpu_user, cpu_kernel,
                  cpu_iowait, cpu_irq, load_1, load_5, load_15, trace) ==
             std::tie(o.activity, o.reason, o.cpu_total, o.cpu_user,
                      o.cpu_kernel, o.cpu_iowait, o.cpu_irq, o.load_1,
                      o.load_5, o.load_15, o.trace);
}

bool JavaCrashItem::operator==(const JavaCrashItem& o) const {
  return GenericLogcatItem::operator==(o) &&
         std::tie(exception, message, stack, cause_stacks) ==
             std::tie(o.exception, o.message, o.stack, o.cause_stacks);
}

bool NativeCrashItem::operator==(const NativeCrashItem& o) const {
  return GenericLogcatItem::operator==(o) &&
         std::tie(fingerprint, stack) == std::tie(o.fingerprint, o.stack);
}

std::vector<int32_t> ProcrankItem::GetPids() const {
  std::vector<int32_t> pids;
  pids.reserve(rows.size());
  for (const auto& kv : rows)
    pids.push_back(kv.first);
  return pids;
}

std::optional<std::string> ProcrankItem::GetProcessName(int32_t pid) const {
  auto it = rows.find(pid);
  if (it == rows.end())
    return std::nullopt;
  return it->second.process_name;
}

std::optional<int64_t> ProcrankItem::GetStat(int32_t pid,
                                             const std::string& column) const {
  auto row = rows.find(pid);
  if (row == rows.end())
    return std::nullopt;
  auto stat = row->second.stats_kb.find(column);
  if (stat == row->second.stats_kb.end())
    return std::nullopt;
  return stat->second;
}

bool TracesItem::operator==(const TracesItem& o) const {
  return std::tie(pid, app, stack) == std::tie(o.pid, o.app, o.stack);
}

std::vector<const AnrItem*> LogcatItem::GetAnrs() const {
  return FilterEvents<AnrItem>(events);
}

std::vector<const JavaCrashItem*> LogcatItem::GetJavaCrashes() const {
  return FilterEvents<JavaCrashItem>(events);
}

std::vector<const NativeCrashItem*> LogcatItem::GetNativeCrashes() const {
  return FilterEvents<NativeCrashItem>(events);
}

std::vector<AnrItem*> LogcatItem::GetMutableAnrs() {
  std::vector<AnrItem*> res;
  for (auto& event : events) {
    if (AnrItem* anr = std::get_if<AnrItem>(&event))
      res.push_back(anr);
  }
  return res;
}

bool LogcatItem::operator==(const LogcatItem& o) const {
  return std::tie(start_time_ms, stop_time_ms, year_inferred, events) ==
         std::tie(o.start_time_ms, o.stop_time_ms, o.year_inferred, o.events);
}

bool BugreportItem::operator==(const BugreportItem& o) const {
  return std::tie(time_ms, mem_info, procrank, system_log, system_props) ==
         std::tie(o.time_ms, o.mem_info, o.procrank, o.system_log,
                  o.system_props);
}

std::optional<int32_t> MonkeyLogItem::GetDroppedCount(
    DroppedCategory category) const {
  auto it = dropped_counts.find(category);
  if (it == dropped_counts.end())
    return std::nullopt;
  return it->second;
}

bool MonkeyLogItem::operator==(const MonkeyLogItem& o) const {
  return std::tie(start_time_ms, stop_time_ms, packages, categories, throttle,
                  seed, target_count, ignore_security_exceptions,
                  total_duration_ms, start_uptime_ms, stop_uptime_ms,
                  is_finished, no_activities, intermediate_count, final_count,
                  dropped_counts, crash) ==
         std::tie(o.start_time_ms, o.stop_time_ms, o.packages, o.categories,
                  o.throttle, o.seed, o.target_count,
                  o.ignore_security_exceptions, o.total_duration_ms,
                  o.start_uptime_ms, o.stop_uptime_ms, o.is_finished,
                  o.no_activities, o.intermediate_count, o.final_count,
                  o.dropped_counts, o.crash);
}

const char* GetItemType(const Item& item) {
  return std::visit(
      [](const auto& i) -> const char* {
        return std::decay_t<decltype(i)>::kType;
      },
      item);
}

base::StatusOr<AnrItem> MergeItems(const AnrItem& a, const AnrItem& b) {
  FieldMerger m(AnrItem::kType);
  AnrItem out;
  m.MergeGeneric(a, b, &out);
  m.Merge("activity", a.activity, b.activity, &out.activity);
  m.Merge("reason", a.reason, b.reason, &out.reason);
  m.Merge("cpu_total", a.cpu_total, b.cpu_total, &out.cpu_total);
  m.Merge("cpu_user", a.cpu_user, b.cpu_user, &out.cpu_user);
  m.Merge("cpu_kernel", a.cpu_kernel, b.cpu_kernel, &out.cpu_kernel);
  m.Merge("cpu_iowait", a.cpu_iowait, b.cpu_iowait, &out.cpu_iowait);
  m.Merge("cpu_irq", a.cpu_irq, b.cpu_irq, &out.cpu_irq);
  m.Merge("load_1", a.load_1, b.load_1, &out.load_1);
  m.Merge("load_5", a.load_5, b.load_5, &out.load_5);
  m.Merge("load_15", a.load_15, b.load_15, &out.load_15);
  m.Merge("trace", a.trace, b.trace, &out.trace);
  return Finish(m, std::move(out));
}

base::StatusOr<JavaCrashItem> MergeItems(const JavaCrashItem& a,
                                         const JavaCrashItem& b) {
  FieldMerger m(JavaCrashItem::kType);
  JavaCrashItem out;
  m.MergeGeneric(a, b, &out);
  m.Merge("exception", a.exception, b.exception, &out.exception);
  m.Merge("message", a.message, b.message, &out.message);
  m.Merge("stack", a.stack, b.stack, &out.stack);
  m.MergeCollection("cause_stacks", a.cause_stacks, b.cause_stacks,
                    &out.cause_stacks);
  return Finish(m, std::move(out));
}

base::StatusOr<NativeCrashItem> MergeItems(const NativeCrashItem& a,
                                           const NativeCrashItem& b) {
  FieldMerger m(NativeCrashItem::kType);
  NativeCrashItem out;
  m.MergeGeneric(a, b, &out);
  m.Merge("fingerprint", a.fingerprint, b.fingerprint, &out.fingerprint);
  m.Merge("stack", a.stack, b.stack, &out.stack);
  return Finish(m, std::move(out));
}

base::StatusOr<ProcrankItem> MergeItems(const ProcrankItem& a,
                                        const ProcrankItem& b) {
  FieldMerger m(ProcrankItem::kType);
  ProcrankItem out;
  m.MergeMap("rows", a.rows, b.rows, &out.rows);
  return Finish(m, std::move(out));
}

base::StatusOr<MemInfoItem> MergeItems(const MemInfoItem& a,
                                       const MemInfoItem& b) {
  FieldMerger m(MemInfoItem::kType);
  MemInfoItem out;
  m.MergeMap("values", a.values, b.values, &out.values);
  return Finish(m, std::move(out));
}

base::StatusOr<SystemPropsItem> MergeItems(const SystemPropsItem& a,
                                           const SystemPropsItem& b) {
  FieldMerger m(SystemPropsItem::kType);
  SystemPropsItem out;
  m.MergeMap("values", a.values, b.values, &out.values);
  return Finish(m, std::move(out));
}

base::StatusOr<TracesItem> MergeItems(const TracesItem& a,
                                      const TracesItem& b) {
  FieldMerger m(TracesItem::kType);
  TracesItem out;
  m.Merge("pid", a.pid, b.pid, &out.pid);
  m.Merge("app", a.app, b.app, &out.app);
  m.Merge("stack", a.stack, b.stack, &out.stack);
  return Finish(m, std::move(out));
}

base::StatusOr<LogcatItem> MergeItems(const LogcatItem& a,
                                      const LogcatItem& b) {
  FieldMerger m(LogcatItem::kType);
  LogcatItem out;
  m.Merge("start_time", a.start_time_ms, b.start_time_ms, &out.start_time_ms);
  m.Merge("stop_time", a.stop_time_ms, b.stop_time_ms, &out.stop_time_ms);
  m.MergeCollection("events", a.events, b.events, &out.events);
  out.year_inferred = a.year_inferred || b.year_inferred;
  return Finish(m, std::move(out));
}

base::StatusOr<BugreportItem> MergeItems(const BugreportItem& a,
                                         const BugreportItem& b) {
  FieldMerger m(BugreportItem::kType);
  BugreportItem out;
  m.Merge("time", a.time_ms, b.time_ms, &out.time_ms);
  m.MergeChild(a.mem_info, b.mem_info, &out.mem_info);
  m.MergeChild(a.procrank, b.procrank, &out.procrank);
  m.MergeChild(a.system_log, b.system_log, &out.system_log);
  m.MergeChild(a.system_props, b.system_props, &out.system_props);
  return Finish(m, std::move(out));
}

base::StatusOr<MonkeyLogItem> MergeItems(const MonkeyLogItem& a,
                                         const MonkeyLogItem& b) {
  FieldMerger m(MonkeyLogItem::kType);
  MonkeyLogItem out;
  m.Merge("start_time", a.start_time_ms, b.start_time_ms, &out.start_time_ms);
  m.Merge("stop_time", a.stop_time_ms, b.stop_time_ms, &out.stop_time_ms);
  m.MergeCollection("packages", a.packages, b.packages, &out.packages);
  m.MergeCollection("categories", a.categories, b.categories,
                    &out.categories);
  m.MergeValue("throttle", a.throttle, b.throttle, &out.throttle);
  m.Merge("seed", a.seed, b.seed, &out.seed);
  m.Merge("target_count", a.target_count, b.target_count, &out.target_count);
  m.MergeValue("ignore_security_exceptions", a.ignore_security_exceptions,
               b.ignore_security_exceptions, &out.ignore_security_exceptions);
  m.Merge("total_duration", a.total_duration_ms, b.total_duration_ms,
          &out.total_duration_ms);
  m.Merge("start_uptime", a.start_uptime_ms, b.start_uptime_ms,
          &out.start_uptime_ms);
  m.Merge("stop_uptime", a.stop_uptime_ms, b.stop_uptime_ms,
          &out.stop_uptime_ms);
  m.MergeValue("is_finished", a.is_finished, b.is_finished, &out.is_finished);
  m.MergeValue("no_activities", a.no_activities, b.no_activities,
               &out.no_activities);
  m.MergeValue("intermediate_count", a.intermediate_count,
               b.intermediate_count, &out.intermediate_count);
  m.Merge("final_count", a.final_count, b.final_count, &out.final_count);
  m.MergeMap("dropped_counts", a.dropped_counts, b.dropped_counts,
             &out.dropped_counts);

  if (a.crash && b.crash) {
    if (a.crash->index() != b.crash->index()) {
      m.Conflict("crash");
    } else {
      base::Status crash_status = std::visit(
          [&b, &out](const auto& crash) -> base::Status {
            using T = std::decay_t<decltype(crash)>;
            base::StatusOr<T> merged = MergeItems(crash, std::get<T>(*b.crash));
            if (!merged.ok())
              return merged.status();
            out.crash = std::move(merged.value());
            return base::OkStatus();
          },
          *a.crash);
      if (!crash_status.ok() && m.status().ok())
        return crash_status;
    }
  } else {
    out.crash = a.crash ? a.crash : b.crash;
  }
  return Finish(m, std::move(out));
}

base::StatusOr<Item> MergeItems(const Item& a, const Item& b) {
  if (a.index() != b.index()) {
    base::Status status =
        base::ErrStatus("Cannot merge a %s item with a %s item",
                        GetItemType(a), GetItemType(b));
    status.SetPayload(kConflictingItemPayload, "type");
    return status;
  }
  return std::visit(
      [&b](const auto& item) -> base::StatusOr<Item> {
        using T = std::decay_t<decltype(item)>;
        base::StatusOr<T> merged = MergeItems(item, std::get<T>(b));
        if (!merged.ok())
          return merged.status();
        return Item(std::move(merged.value()));
      },
      a);
}

bool IsConsistent(const Item& a, const Item* b) {
  if (!b)
    return false;
  return MergeItems(a, *b).ok();
}

}  // namespace parser
}  // namespace bugsift
