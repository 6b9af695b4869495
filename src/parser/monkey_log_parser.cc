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

#include "src/parser/monkey_log_parser.h"

#include <math.h>

#include "bugsift/base/logging.h"
#include "bugsift/base/time.h"
#include "bugsift/ext/base/string_utils.h"
#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

using DroppedCategory = MonkeyLogItem::DroppedCategory;

constexpr char kThrottlePattern[] = "^adb shell monkey.* --throttle (\\d+).*$";
constexpr char kSeedAndTargetCountPattern[] =
    "^:Monkey: seed=(\\d+) count=(\\d+)$";
constexpr char kSecurityExceptionsPattern[] =
    "^adb shell monkey.* --ignore-security-exceptions.*$";
constexpr char kPackagesPattern[] = "^:AllowPackage: (\\S+)$";
constexpr char kCategoriesPattern[] = "^:IncludeCategory: (\\S+)$";
constexpr char kStartUptimePattern[] =
    "^# (.*) - device uptime = (\\d+\\.\\d+): "
    "Monkey command used for this test:$";
constexpr char kStopUptimePattern[] =
    "^# (.*) - device uptime = (\\d+\\.\\d+): "
    "Monkey command ran for: (\\d+):(\\d+) \\(mm:ss\\)$";
constexpr char kIntermediateCountPattern[] = "^\\s*// Sending event #(\\d+)$";
constexpr char kFinishedPattern[] = "^// Monkey finished$";
constexpr char kFinalCountPattern[] = "^Events injected: (\\d+)$";
constexpr char kNoActivitiesPattern[] =
    "^\\*\\* No activities found to run, monkey aborted\\.$";
constexpr char kAnrPattern[] = "^// NOT RESPONDING: (\\S+) \\(pid (\\d+)\\)$";
constexpr char kJavaCrashPattern[] = "^// CRASH: (\\S+) \\(pid (\\d+)\\)$";

struct DroppedPatternDef {
  const char* pattern;
  DroppedCategory category;
};

constexpr DroppedPatternDef kDroppedPatterns[] = {
    {"^:Dropped: .*keys=(\\d+).*$", DroppedCategory::kKeys},
    {"^:Dropped: .*pointers=(\\d+).*$", DroppedCategory::kPointers},
    {"^:Dropped: .*trackballs=(\\d+).*$", DroppedCategory::kTrackballs},
    {"^:Dropped: .*flips=(\\d+).*$", DroppedCategory::kFlips},
    {"^:Dropped: .*rotations=(\\d+).*$", DroppedCategory::kRotations},
};

// "Mon Apr 23 08:23:31 PDT 2012". The time zone may be missing and days below
// 10 may be space padded ("Tue Apr  3").
constexpr char kLongDatePattern[] =
    "^\\w{3} (\\w{3}) +(\\d{1,2}) (\\d{2}):(\\d{2}):(\\d{2}) (?:\\S+ )?"
    "(\\d{4})$";
// "Tuesday, 04/24/2012 05:23:30 PM".
constexpr char kShortDatePattern[] =
    "^\\w+, (\\d{2})/(\\d{2})/(\\d{4}) (\\d{2}):(\\d{2}):(\\d{2}) "
    "([AaPp][Mm])$";

constexpr const char* kMonthNames[] = {"jan", "feb", "mar", "apr",
                                       "may", "jun", "jul", "aug",
                                       "sep", "oct", "nov", "dec"};

std::optional<int> ParseMonthName(std::string_view name) {
  std::string lower = base::ToLower(std::string(name));
  for (size_t i = 0; i < 12; i++) {
    if (lower == kMonthNames[i])
      return static_cast<int>(i + 1);
  }
  return std::nullopt;
}

std::optional<int64_t> SecondsToMs(std::string_view secs) {
  std::optional<double> value = GroupToDouble(secs);
  if (!value)
    return std::nullopt;
  return static_cast<int64_t>(llround(*value * 1000));
}

}  // namespace

MonkeyLogParser::DroppedPattern::DroppedPattern(base::Regex r,
                                                DroppedCategory c)
    : regex(std::move(r)), category(c) {}
MonkeyLogParser::DroppedPattern::DroppedPattern(DroppedPattern&&) noexcept =
    default;
MonkeyLogParser::DroppedPattern::~DroppedPattern() = default;

MonkeyLogParser::MonkeyLogParser()
    : throttle_(CompileBuiltinRegex(kThrottlePattern)),
      seed_and_target_count_(CompileBuiltinRegex(kSeedAndTargetCountPattern)),
      security_exceptions_(CompileBuiltinRegex(kSecurityExceptionsPattern)),
      packages_(CompileBuiltinRegex(kPackagesPattern)),
      categories_(CompileBuiltinRegex(kCategoriesPattern)),
      start_uptime_(CompileBuiltinRegex(kStartUptimePattern)),
      stop_uptime_(CompileBuiltinRegex(kStopUptimePattern)),
      intermediate_count_(CompileBuiltinRegex(kIntermediateCountPattern)),
      finished_(CompileBuiltinRegex(kFinishedPattern)),
      final_count_(CompileBuiltinRegex(kFinalCountPattern)),
      no_activities_(CompileBuiltinRegex(kNoActivitiesPattern)),
      anr_(CompileBuiltinRegex(kAnrPattern)),
      java_crash_(CompileBuiltinRegex(kJavaCrashPattern)) {
  for (const DroppedPatternDef& def : kDroppedPatterns)
    dropped_.emplace_back(CompileBuiltinRegex(def.pattern), def.category);
}

MonkeyLogParser::~MonkeyLogParser() = default;

// static
MonkeyLogItem MonkeyLogParser::Parse(const std::vector<std::string>& lines) {
  MonkeyLogParser parser;
  ItemList items;
  for (const std::string& line : lines)
    parser.ParseLine(line, &items);
  parser.Commit(&items);
  const MonkeyLogItem* monkey_log = items.GetFirst<MonkeyLogItem>();
  BUGSIFT_CHECK(monkey_log);
  return *monkey_log;
}

// static
std::optional<int64_t> MonkeyLogParser::ParseBannerTime(
    const std::string& time) {
  std::vector<std::string_view> g;
  base::Regex long_date = CompileBuiltinRegex(kLongDatePattern);
  if (long_date.FullMatch(time, &g)) {
    std::optional<int> month = ParseMonthName(g[1]);
    std::optional<int32_t> day = GroupToInt32(g[2]);
    std::optional<int32_t> hour = GroupToInt32(g[3]);
    std::optional<int32_t> min = GroupToInt32(g[4]);
    std::optional<int32_t> sec = GroupToInt32(g[5]);
    std::optional<int32_t> year = GroupToInt32(g[6]);
    if (month && day && hour && min && sec && year)
      return base::MkTime(*year, *month, *day, *hour, *min, *sec) * 1000;
  }

  base::Regex short_date = CompileBuiltinRegex(kShortDatePattern);
  if (short_date.FullMatch(time, &g)) {
    std::optional<int32_t> month = GroupToInt32(g[1]);
    std::optional<int32_t> day = GroupToInt32(g[2]);
    std::optional<int32_t> year = GroupToInt32(g[3]);
    std::optional<int32_t> hour = GroupToInt32(g[4]);
    std::optional<int32_t> min = GroupToInt32(g[5]);
    std::optional<int32_t> sec = GroupToInt32(g[6]);
    if (month && day && year && hour && min && sec && *hour >= 1 &&
        *hour <= 12) {
      // 12:xx AM is midnight, 12:xx PM is noon.
      int h24 = *hour % 12;
      if (base::Lowercase(g[7][0]) == 'p')
        h24 += 12;
      return base::MkTime(*year, *month, *day, h24, *min, *sec) * 1000;
    }
  }

  BUGSIFT_ELOG("Could not parse monkey date |%s|", time.c_str());
  return std::nullopt;
}

void MonkeyLogParser::ParseLine(const std::string& line, ItemList*) {
  BUGSIFT_DCHECK(!committed_);
  if (capture_ != Capture::kNone) {
    ParseCaptureLine(line);
    return;
  }

  std::vector<std::string_view> g;
  if (throttle_.FullMatch(line, &g)) {
    if (auto throttle = GroupToInt32(g[1]))
      monkey_log_.throttle = *throttle;
  }
  if (seed_and_target_count_.FullMatch(line, &g)) {
    monkey_log_.seed = GroupToInt64(g[1]);
    monkey_log_.target_count = GroupToInt32(g[2]);
  }
  if (security_exceptions_.FullMatch(line))
    monkey_log_.ignore_security_exceptions = true;
  if (packages_.FullMatch(line, &g))
    monkey_log_.packages.emplace(g[1]);
  if (categories_.FullMatch(line, &g))
    monkey_log_.categories.emplace(g[1]);
  if (start_uptime_.FullMatch(line, &g)) {
    monkey_log_.start_time_ms = ParseBannerTime(std::string(g[1]));
    monkey_log_.start_uptime_ms = SecondsToMs(g[2]);
  }
  if (stop_uptime_.FullMatch(line, &g)) {
    monkey_log_.stop_time_ms = ParseBannerTime(std::string(g[1]));
    monkey_log_.stop_uptime_ms = SecondsToMs(g[2]);
    std::optional<int32_t> mins = GroupToInt32(g[3]);
    std::optional<int32_t> secs = GroupToInt32(g[4]);
    if (mins && secs)
      monkey_log_.total_duration_ms = *mins * 60000ll + *secs * 1000ll;
  }
  if (intermediate_count_.FullMatch(line, &g)) {
    if (auto count = GroupToInt32(g[1]))
      monkey_log_.intermediate_count = *count;
  }
  if (final_count_.FullMatch(line, &g))
    monkey_log_.final_count = GroupToInt32(g[1]);
  if (finished_.FullMatch(line))
    monkey_log_.is_finished = true;
  if (no_activities_.FullMatch(line))
    monkey_log_.no_activities = true;
  for (const DroppedPattern& dropped : dropped_) {
    if (!dropped.regex.FullMatch(line, &g))
      continue;
    if (auto count = GroupToInt32(g[1]))
      monkey_log_.dropped_counts[dropped.category] = *count;
  }
  if (anr_.FullMatch(line, &g)) {
    capture_ = Capture::kAnr;
    crash_app_ = GroupToString(g[1]);
    crash_pid_ = GroupToInt32(g[2]);
    crash_lines_.clear();
  }
  if (java_crash_.FullMatch(line, &g)) {
    capture_ = Capture::kJavaCrash;
    crash_app_ = GroupToString(g[1]);
    crash_pid_ = GroupToInt32(g[2]);
    crash_lines_.clear();
  }
}

void MonkeyLogParser::ParseCaptureLine(const std::string& line) {
  // Java crash reports are prefixed by "// ".
  std::string stripped =
      capture_ == Capture::kJavaCrash ? base::ReplaceAll(line, "// ", "") : line;
  if (stripped.empty()) {
    FinishCapture();
    return;
  }
  crash_lines_.emplace_back(std::move(stripped));
}

void MonkeyLogParser::FinishCapture() {
  std::optional<MonkeyCrash> crash;
  if (capture_ == Capture::kAnr) {
    if (auto anr = anr_parser_.Parse(crash_lines_))
      crash = std::move(*anr);
  } else if (capture_ == Capture::kJavaCrash) {
    if (auto java_crash = java_crash_parser_.Parse(crash_lines_))
      crash = std::move(*java_crash);
  }

  if (crash) {
    std::visit(
        [this](GenericLogcatItem& item) {
          item.pid = crash_pid_;
          item.app = crash_app_;
        },
        *crash);
    monkey_log_.crash = std::move(*crash);
  } else {
    BUGSIFT_ELOG("Could not parse the crash of %s (%zu lines)",
                 crash_app_.value_or("?").c_str(), crash_lines_.size());
  }

  capture_ = Capture::kNone;
  crash_lines_.clear();
  crash_app_.reset();
  crash_pid_.reset();
}

void MonkeyLogParser::Commit(ItemList* items) {
  BUGSIFT_DCHECK(!committed_);
  committed_ = true;
  if (capture_ != Capture::kNone)
    FinishCapture();
  items->AddItem(std::move(monkey_log_));
}

}  // namespace parser
}  // namespace bugsift
