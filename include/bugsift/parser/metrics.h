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

#ifndef INCLUDE_BUGSIFT_PARSER_METRICS_H_
#define INCLUDE_BUGSIFT_PARSER_METRICS_H_

#include <map>
#include <string>

#include "bugsift/parser/items.h"

namespace bugsift {
namespace parser {

// Flat key=value summaries of parsed items, as consumed by result reporters.
// Unset fields produce no key.
using Metrics = std::map<std::string, std::string>;

// Keys: anrs, java_crashes, native_crashes, logcat_start_time_ms,
// logcat_stop_time_ms, logcat_year_inferred.
Metrics ToMetrics(const LogcatItem& logcat);

// Keys: bugreport_time_ms, mem_total_kb, mem_free_kb, procrank_processes,
// system_props, plus the logcat keys of the system log.
Metrics ToMetrics(const BugreportItem& bugreport);

// Keys are prefixed with "monkey_": target_count, intermediate_count,
// final_count, seed, throttle, finished, no_activities, total_duration_ms,
// uptime_ms, packages, categories, dropped_<category>, crash, crash_app.
Metrics ToMetrics(const MonkeyLogItem& monkey_log);

}  // namespace parser
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_PARSER_METRICS_H_
