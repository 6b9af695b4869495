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

#ifndef SRC_PARSER_MONKEY_LOG_PARSER_H_
#define SRC_PARSER_MONKEY_LOG_PARSER_H_

#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/items.h"
#include "src/parser/anr_parser.h"
#include "src/parser/java_crash_parser.h"
#include "src/parser/line_parser.h"

namespace bugsift {
namespace parser {

// Parses the output of a monkey run. Every line is tested against all the
// known patterns independently. A "// NOT RESPONDING" or "// CRASH" line
// starts the capture of the crash report, which lasts until the next blank
// line. Emits a MonkeyLogItem on Commit().
//
// Instances are single use.
class MonkeyLogParser : public LineParser {
 public:
  MonkeyLogParser();
  ~MonkeyLogParser() override;

  static MonkeyLogItem Parse(const std::vector<std::string>& lines);

  // Parses the wall time of the start and stop banners. Both
  // "Mon Apr 23 08:23:31 PDT 2012" and "Tuesday, 04/24/2012 05:23:30 PM" are
  // accepted. The time zone is ignored and the time is taken as UTC.
  static std::optional<int64_t> ParseBannerTime(const std::string& time);

  // LineParser implementation.
  void ParseLine(const std::string& line, ItemList* items) override;
  void Commit(ItemList* items) override;

 private:
  enum class Capture {
    kNone = 0,
    kAnr,
    kJavaCrash,
  };

  struct DroppedPattern {
    DroppedPattern(base::Regex r, MonkeyLogItem::DroppedCategory c);
    DroppedPattern(DroppedPattern&&) noexcept;
    ~DroppedPattern();

    base::Regex regex;
    MonkeyLogItem::DroppedCategory category;
  };

  void ParseCaptureLine(const std::string& line);
  void FinishCapture();

  base::Regex throttle_;
  base::Regex seed_and_target_count_;
  base::Regex security_exceptions_;
  base::Regex packages_;
  base::Regex categories_;
  base::Regex start_uptime_;
  base::Regex stop_uptime_;
  base::Regex intermediate_count_;
  base::Regex finished_;
  base::Regex final_count_;
  base::Regex no_activities_;
  base::Regex anr_;
  base::Regex java_crash_;
  std::vector<DroppedPattern> dropped_;

  AnrParser anr_parser_;
  JavaCrashParser java_crash_parser_;

  Capture capture_ = Capture::kNone;
  std::vector<std::string> crash_lines_;
  std::optional<std::string> crash_app_;
  std::optional<int32_t> crash_pid_;

  MonkeyLogItem monkey_log_;
  bool committed_ = false;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_MONKEY_LOG_PARSER_H_
