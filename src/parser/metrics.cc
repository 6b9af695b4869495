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

#include <stdint.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bugsift/ext/base/string_utils.h"

namespace bugsift {
namespace parser {

namespace {

template <typename T>
void AddIfSet(Metrics* metrics, const char* key, const std::optional<T>& v) {
  if (v)
    (*metrics)[key] = std::to_string(*v);
}

const char* GetDroppedCategoryName(MonkeyLogItem::DroppedCategory category) {
  switch (category) {
    case MonkeyLogItem::DroppedCategory::kKeys:
      return "keys";
    case MonkeyLogItem::DroppedCategory::kPointers:
      return "pointers";
    case MonkeyLogItem::DroppedCategory::kTrackballs:
      return "trackballs";
    case MonkeyLogItem::DroppedCategory::kFlips:
      return "flips";
    case MonkeyLogItem::DroppedCategory::kRotations:
      return "rotations";
  }
  return "unknown";
}

std::string JoinSet(const std::set<std::string>& values) {
  return base::Join(std::vector<std::string>(values.begin(), values.end()),
                    ",");
}

}  // namespace

Metrics ToMetrics(const LogcatItem& logcat) {
  Metrics metrics;
  metrics["anrs"] = std::to_string(logcat.GetAnrs().size());
  metrics["java_crashes"] = std::to_string(logcat.GetJavaCrashes().size());
  metrics["native_crashes"] = std::to_string(logcat.GetNativeCrashes().size());
  AddIfSet(&metrics, "logcat_start_time_ms", logcat.start_time_ms);
  AddIfSet(&metrics, "logcat_stop_time_ms", logcat.stop_time_ms);
  metrics["logcat_year_inferred"] = logcat.year_inferred ? "1" : "0";
  return metrics;
}

Metrics ToMetrics(const BugreportItem& bugreport) {
  Metrics metrics;
  if (bugreport.system_log)
    metrics = ToMetrics(*bugreport.system_log);
  AddIfSet(&metrics, "bugreport_time_ms", bugreport.time_ms);
  if (bugreport.mem_info) {
    const auto& values = bugreport.mem_info->values;
    auto total = values.find("MemTotal");
    if (total != values.end())
      metrics["mem_total_kb"] = std::to_string(total->second);
    auto free = values.find("MemFree");
    if (free != values.end())
      metrics["mem_free_kb"] = std::to_string(free->second);
  }
  if (bugreport.procrank) {
    metrics["procrank_processes"] =
        std::to_string(bugreport.procrank->rows.size());
  }
  if (bugreport.system_props) {
    metrics["system_props"] =
        std::to_string(bugreport.system_props->values.size());
  }
  return metrics;
}

Metrics ToMetrics(const MonkeyLogItem& monkey_log) {
  Metrics metrics;
  AddIfSet(&metrics, "monkey_target_count", monkey_log.target_count);
  metrics["monkey_intermediate_count"] =
      std::to_string(monkey_log.intermediate_count);
  AddIfSet(&metrics, "monkey_final_count", monkey_log.final_count);
  AddIfSet(&metrics, "monkey_seed", monkey_log.seed);
  metrics["monkey_throttle"] = std::to_string(monkey_log.throttle);
  metrics["monkey_finished"] = monkey_log.is_finished ? "1" : "0";
  metrics["monkey_no_activities"] = monkey_log.no_activities ? "1" : "0";
  AddIfSet(&metrics, "monkey_total_duration_ms", monkey_log.total_duration_ms);
  if (monkey_log.start_uptime_ms && monkey_log.stop_uptime_ms) {
    metrics["monkey_uptime_ms"] = std::to_string(*monkey_log.stop_uptime_ms -
                                                 *monkey_log.start_uptime_ms);
  }
  if (!monkey_log.packages.empty())
    metrics["monkey_packages"] = JoinSet(monkey_log.packages);
  if (!monkey_log.categories.empty())
    metrics["monkey_categories"] = JoinSet(monkey_log.categories);
  for (const auto& it : monkey_log.dropped_counts) {
    metrics[std::string("monkey_dropped_") + GetDroppedCategoryName(it.first)] =
        std::to_string(it.second);
  }
  if (monkey_log.crash) {
    std::visit(
        [&metrics](const GenericLogcatItem& crash) {
          if (crash.app)
            metrics["monkey_crash_app"] = *crash.app;
        },
        *monkey_log.crash);
    metrics["monkey_crash"] = std::holds_alternative<AnrItem>(*monkey_log.crash)
                                  ? AnrItem::kType
                                  : JavaCrashItem::kType;
  }
  return metrics;
}

}  // namespace parser
}  // namespace bugsift
