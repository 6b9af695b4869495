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

#ifndef SRC_PARSER_LOGCAT_PARSER_H_
#define SRC_PARSER_LOGCAT_PARSER_H_

#include <stdint.h>

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/basic_types.h"
#include "bugsift/parser/items.h"
#include "src/parser/anr_parser.h"
#include "src/parser/java_crash_parser.h"
#include "src/parser/line_parser.h"
#include "src/parser/native_crash_parser.h"

namespace bugsift {
namespace parser {

// Scans a logcat and groups the lines of ANRs, Java crashes and native
// crashes into events. Both formats are auto-detected on a per-line basis:
// 1) threadtime: 04-25 09:55:47.799  3064  3082 E AndroidRuntime: message
// 2) time:       04-25 09:55:47.799  E/AndroidRuntime( 3064): message
//
// Lines are grouped into records keyed by (pid, [tid,] level, tag):
// - E/ActivityManager lines are ANRs.
// - E/AndroidRuntime lines are Java crashes.
// - I/DEBUG and F/DEBUG lines are native crashes.
// The first line of a report (e.g. "ANR in ...") opens a new record even if
// one is already open for the same key, so that back to back events of the
// same process are kept apart.
//
// Each event also carries two preambles, built from a ring buffer of the last
// parsed lines: the last lines of the log and the last lines of the same pid.
//
// Instances are single use: one instance parses exactly one logcat.
class LogcatParser : public AbstractBlockParser {
 public:
  explicit LogcatParser(const Config& config = Config());
  ~LogcatParser() override;

  static LogcatItem Parse(const std::vector<std::string>& lines,
                          const Config& config = Config());

  // Sets the year of the logcat timestamps, overriding Config::logcat_year.
  // Must be called before the first line is parsed.
  void set_year(int year);

  // LineParser implementation.
  void ParseLine(const std::string& line, ItemList* items) override;
  void Commit(ItemList* items) override;

 private:
  enum class EventKind {
    kAnr = 0,
    kJavaCrash,
    kNativeCrash,
  };

  struct LogLine {
    int64_t time_ms = 0;
    int32_t pid = 0;
    std::optional<int32_t> tid;  // Not available in the "time" format.
    std::string level;
    std::string tag;
    std::string msg;
  };

  // The lines of one event, plus the context captured when it started.
  struct Record {
    EventKind kind;
    int64_t time_ms;
    int32_t pid;
    std::optional<int32_t> tid;
    std::string last_preamble;
    std::string process_preamble;
    std::vector<std::string> lines;
  };

  struct BufferedLine {
    int32_t pid;
    std::string text;
  };

  std::optional<LogLine> ParseLogLine(const std::string& line);
  std::optional<EventKind> GetEventKind(const LogLine& log_line) const;
  bool IsEventStart(EventKind kind, const std::string& msg) const;
  void AddToRecord(EventKind kind, LogLine log_line);
  std::optional<LogcatEvent> ParseRecord(const Record& record) const;

  std::string GetLastPreamble() const;
  std::string GetProcessPreamble(int32_t pid) const;

  int64_t ToEpochMs(const std::vector<std::string_view>& groups);

  const Config config_;
  std::optional<int> year_;
  bool year_inferred_ = false;
  bool committed_ = false;

  base::Regex threadtime_line_;
  base::Regex time_line_;
  AnrParser anr_parser_;
  JavaCrashParser java_crash_parser_;
  NativeCrashParser native_crash_parser_;

  std::deque<BufferedLine> ring_buffer_;
  std::vector<Record> records_;
  // Key -> index in |records_| of the most recent record for that key.
  std::map<std::string, size_t> open_records_;
  std::optional<int64_t> start_time_ms_;
  std::optional<int64_t> stop_time_ms_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_LOGCAT_PARSER_H_
