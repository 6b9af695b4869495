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

#include <stddef.h>

#include <algorithm>

#include "bugsift/base/logging.h"
#include "bugsift/base/time.h"
#include "bugsift/ext/base/string_utils.h"
#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

#define BUGSIFT_LOGCAT_TIMESTAMP \
  "^(\\d{2})-(\\d{2}) (\\d{2}):(\\d{2}):(\\d{2})\\.(\\d{3})\\s+"

// 04-25 09:55:47.799  3064  3082 E AndroidRuntime: java.lang.Exception
constexpr char kThreadtimePattern[] =
    BUGSIFT_LOGCAT_TIMESTAMP
    "(\\d+)\\s+(\\d+)\\s+([A-Z])\\s+"  // pid, tid, level.
    "(.+?)\\s*: (.*)$";                // tag, message.

// 04-25 09:55:47.799  E/AndroidRuntime( 3064): java.lang.Exception
constexpr char kTimePattern[] =
    BUGSIFT_LOGCAT_TIMESTAMP
    "(\\w)/(.+?)\\s*\\(\\s*(\\d+)\\): (.*)$";  // level, tag, pid, message.

#undef BUGSIFT_LOGCAT_TIMESTAMP

// Number of timestamp groups at the beginning of both patterns.
constexpr size_t kNumTimeGroups = 6;

constexpr char kMarkerPrefix[] = "--------- beginning of";

constexpr char kActivityManagerTag[] = "ActivityManager";
constexpr char kAndroidRuntimeTag[] = "AndroidRuntime";
constexpr char kDebugTag[] = "DEBUG";

std::string EncodeKey(int32_t pid,
                      std::optional<int32_t> tid,
                      const std::string& level,
                      const std::string& tag) {
  std::string key = std::to_string(pid);
  if (tid)
    key += "|" + std::to_string(*tid);
  return key + "|" + level + "|" + tag;
}

}  // namespace

LogcatParser::LogcatParser(const Config& config)
    : config_(config),
      year_(config.logcat_year),
      threadtime_line_(CompileBuiltinRegex(kThreadtimePattern)),
      time_line_(CompileBuiltinRegex(kTimePattern)) {}

LogcatParser::~LogcatParser() = default;

// static
LogcatItem LogcatParser::Parse(const std::vector<std::string>& lines,
                               const Config& config) {
  LogcatParser parser(config);
  ItemList items;
  parser.ParseBlock(lines, &items);
  const LogcatItem* logcat = items.GetFirst<LogcatItem>();
  BUGSIFT_CHECK(logcat);
  return *logcat;
}

void LogcatParser::set_year(int year) {
  BUGSIFT_DCHECK(!start_time_ms_);
  year_ = year;
  year_inferred_ = false;
}

int64_t LogcatParser::ToEpochMs(const std::vector<std::string_view>& groups) {
  if (!year_) {
    year_ = base::GetCurrentYear();
    year_inferred_ = true;
    BUGSIFT_LOG("No year for the logcat timestamps, assuming %d", *year_);
  }
  int field[kNumTimeGroups];
  for (size_t i = 0; i < kNumTimeGroups; i++)
    field[i] = GroupToInt32(groups[i + 1]).value_or(0);
  int64_t secs =
      base::MkTime(*year_, field[0], field[1], field[2], field[3], field[4]);
  return secs * 1000 + field[5];
}

std::optional<LogcatParser::LogLine> LogcatParser::ParseLogLine(
    const std::string& line) {
  std::vector<std::string_view> groups;
  LogLine log_line;
  if (threadtime_line_.FullMatch(line, &groups)) {
    std::optional<int32_t> pid = GroupToInt32(groups[7]);
    log_line.tid = GroupToInt32(groups[8]);
    if (!pid || !log_line.tid)
      return std::nullopt;
    log_line.pid = *pid;
    log_line.level = std::string(groups[9]);
    log_line.tag = std::string(groups[10]);
    log_line.msg = std::string(groups[11]);
  } else if (time_line_.FullMatch(line, &groups)) {
    std::optional<int32_t> pid = GroupToInt32(groups[9]);
    if (!pid)
      return std::nullopt;
    log_line.pid = *pid;
    log_line.level = std::string(groups[7]);
    log_line.tag = std::string(groups[8]);
    log_line.msg = std::string(groups[10]);
  } else {
    return std::nullopt;
  }
  log_line.time_ms = ToEpochMs(groups);
  return log_line;
}

std::optional<LogcatParser::EventKind> LogcatParser::GetEventKind(
    const LogLine& log_line) const {
  if (log_line.level == "E" && log_line.tag == kActivityManagerTag)
    return EventKind::kAnr;
  if (log_line.level == "E" && log_line.tag == kAndroidRuntimeTag)
    return EventKind::kJavaCrash;
  if ((log_line.level == "I" || log_line.level == "F") &&
      log_line.tag == kDebugTag) {
    return EventKind::kNativeCrash;
  }
  return std::nullopt;
}

bool LogcatParser::IsEventStart(EventKind kind, const std::string& msg) const {
  switch (kind) {
    case EventKind::kAnr:
      return anr_parser_.IsAnrStart(msg);
    case EventKind::kJavaCrash:
      return java_crash_parser_.IsCrashStart(msg);
    case EventKind::kNativeCrash:
      return native_crash_parser_.IsCrashStart(msg);
  }
  return false;
}

void LogcatParser::ParseLine(const std::string& line, ItemList*) {
  BUGSIFT_DCHECK(!committed_);
  if (base::StartsWith(line, kMarkerPrefix))
    return;

  std::optional<LogLine> log_line = ParseLogLine(line);
  if (!log_line) {
    BUGSIFT_DLOG("Failed to parse logcat line |%s|", line.c_str());
    return;
  }

  if (!start_time_ms_)
    start_time_ms_ = log_line->time_ms;
  stop_time_ms_ = log_line->time_ms;

  int32_t pid = log_line->pid;
  std::optional<EventKind> kind = GetEventKind(*log_line);
  if (kind)
    AddToRecord(*kind, std::move(*log_line));

  // The line is buffered only after the preambles of a new record have been
  // captured, so that an event never includes its own first line.
  ring_buffer_.push_back({pid, line});
  if (ring_buffer_.size() > config_.logcat_ring_buffer_size)
    ring_buffer_.pop_front();
}

void LogcatParser::AddToRecord(EventKind kind, LogLine log_line) {
  std::string key =
      EncodeKey(log_line.pid, log_line.tid, log_line.level, log_line.tag);
  auto it = open_records_.find(key);
  if (it == open_records_.end() || IsEventStart(kind, log_line.msg)) {
    Record record{kind,
                  log_line.time_ms,
                  log_line.pid,
                  log_line.tid,
                  GetLastPreamble(),
                  GetProcessPreamble(log_line.pid),
                  {}};
    records_.emplace_back(std::move(record));
    open_records_[key] = records_.size() - 1;
    it = open_records_.find(key);
  }
  records_[it->second].lines.emplace_back(std::move(log_line.msg));
}

std::string LogcatParser::GetLastPreamble() const {
  size_t size = std::min(ring_buffer_.size(), config_.last_preamble_size);
  std::vector<std::string> preamble;
  preamble.reserve(size);
  for (auto it = ring_buffer_.end() - static_cast<ptrdiff_t>(size);
       it != ring_buffer_.end(); ++it) {
    preamble.push_back(it->text);
  }
  return JoinAndTrim(preamble);
}

std::string LogcatParser::GetProcessPreamble(int32_t pid) const {
  std::vector<std::string> preamble;
  for (auto it = ring_buffer_.rbegin();
       it != ring_buffer_.rend() &&
       preamble.size() < config_.process_preamble_size;
       ++it) {
    if (it->pid == pid)
      preamble.push_back(it->text);
  }
  std::reverse(preamble.begin(), preamble.end());
  return JoinAndTrim(preamble);
}

std::optional<LogcatEvent> LogcatParser::ParseRecord(
    const Record& record) const {
  std::optional<LogcatEvent> event;
  switch (record.kind) {
    case EventKind::kAnr:
      if (auto anr = anr_parser_.Parse(record.lines))
        event = std::move(*anr);
      break;
    case EventKind::kJavaCrash:
      if (auto crash = java_crash_parser_.Parse(record.lines))
        event = std::move(*crash);
      break;
    case EventKind::kNativeCrash:
      if (auto crash = native_crash_parser_.Parse(record.lines))
        event = std::move(*crash);
      break;
  }
  if (!event) {
    BUGSIFT_DLOG("Discarding record of %zu lines from pid %d",
                 record.lines.size(), record.pid);
    return event;
  }
  std::visit(
      [&record](GenericLogcatItem& item) {
        item.event_time_ms = record.time_ms;
        item.pid = record.pid;
        item.tid = record.tid;
        item.last_preamble = record.last_preamble;
        item.process_preamble = record.process_preamble;
      },
      *event);
  return event;
}

void LogcatParser::Commit(ItemList* items) {
  BUGSIFT_DCHECK(!committed_);
  committed_ = true;

  LogcatItem logcat;
  logcat.start_time_ms = start_time_ms_;
  logcat.stop_time_ms = stop_time_ms_;
  logcat.year_inferred = year_inferred_;
  for (const Record& record : records_) {
    std::optional<LogcatEvent> event = ParseRecord(record);
    if (event)
      logcat.events.emplace_back(std::move(*event));
  }
  items->AddItem(std::move(logcat));
}

}  // namespace parser
}  // namespace bugsift
