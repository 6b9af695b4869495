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

#include "src/parser/anr_parser.h"

#include "bugsift/base/logging.h"
#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

#define BUGSIFT_ANR_NUM "(\\d+(?:\\.\\d+)?)"

constexpr char kStartPattern[] =
    "^ANR (?:\\(application not responding\\) )?in (?:process: )?(\\S+)"
    "(?: \\(([^)]*)\\))?.*$";
constexpr char kActivityPattern[] = "^Activity: (.*)$";
constexpr char kReasonPattern[] = "^Reason: (.*)$";
constexpr char kLoadPattern[] = "^Load: " BUGSIFT_ANR_NUM " / " BUGSIFT_ANR_NUM
                                " / " BUGSIFT_ANR_NUM "$";
constexpr char kTotalPattern[] = "^" BUGSIFT_ANR_NUM "% TOTAL: (.*)$";
constexpr char kUserPattern[] = BUGSIFT_ANR_NUM "% user";
constexpr char kKernelPattern[] = BUGSIFT_ANR_NUM "% kernel";
constexpr char kIowaitPattern[] = BUGSIFT_ANR_NUM "% iowait";
constexpr char kIrqPattern[] = BUGSIFT_ANR_NUM "% irq";

#undef BUGSIFT_ANR_NUM

// Sets |field| from the first group of the first match of |re| in |text|,
// unless already set.
void SearchPercentage(const base::Regex& re,
                      const std::string& text,
                      std::optional<double>* field) {
  if (field->has_value())
    return;
  std::vector<std::string_view> groups;
  re.Submatch(text, groups);
  if (groups.size() > 1)
    *field = GroupToDouble(groups[1]);
}

}  // namespace

AnrParser::AnrParser()
    : start_(CompileBuiltinRegex(kStartPattern)),
      activity_(CompileBuiltinRegex(kActivityPattern)),
      reason_(CompileBuiltinRegex(kReasonPattern)),
      load_(CompileBuiltinRegex(kLoadPattern)),
      total_(CompileBuiltinRegex(kTotalPattern)),
      user_(CompileBuiltinRegex(kUserPattern)),
      kernel_(CompileBuiltinRegex(kKernelPattern)),
      iowait_(CompileBuiltinRegex(kIowaitPattern)),
      irq_(CompileBuiltinRegex(kIrqPattern)) {}

AnrParser::~AnrParser() = default;

bool AnrParser::IsAnrStart(const std::string& line) const {
  return start_.FullMatch(line);
}

std::optional<AnrItem> AnrParser::Parse(
    const std::vector<std::string>& lines) const {
  std::optional<AnrItem> anr;
  std::vector<std::string_view> groups;
  for (const std::string& line : lines) {
    if (!anr) {
      if (!start_.FullMatch(line, &groups))
        continue;
      anr.emplace();
      anr->app = GroupToString(groups[1]);
      anr->activity = GroupToString(groups[2]);
      continue;
    }

    if (!anr->activity && activity_.FullMatch(line, &groups)) {
      anr->activity = GroupToString(groups[1]);
    } else if (!anr->reason && reason_.FullMatch(line, &groups)) {
      anr->reason = GroupToString(groups[1]);
    } else if (!anr->load_1 && load_.FullMatch(line, &groups)) {
      anr->load_1 = GroupToDouble(groups[1]);
      anr->load_5 = GroupToDouble(groups[2]);
      anr->load_15 = GroupToDouble(groups[3]);
    } else if (!anr->cpu_total && total_.FullMatch(line, &groups)) {
      anr->cpu_total = GroupToDouble(groups[1]);
      const std::string breakdown(groups[2]);
      SearchPercentage(user_, breakdown, &anr->cpu_user);
      SearchPercentage(kernel_, breakdown, &anr->cpu_kernel);
      SearchPercentage(iowait_, breakdown, &anr->cpu_iowait);
      SearchPercentage(irq_, breakdown, &anr->cpu_irq);
    }
  }
  if (!anr)
    BUGSIFT_DLOG("No ANR start line in %zu lines", lines.size());
  return anr;
}

}  // namespace parser
}  // namespace bugsift
