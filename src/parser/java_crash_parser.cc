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

#include "src/parser/java_crash_parser.h"

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/string_utils.h"
#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

constexpr char kFatalExceptionPattern[] = "^FATAL EXCEPTION: (.*)$";
constexpr char kProcessPattern[] = "^Process: (\\S+), PID: (\\d+)$";
constexpr char kExceptionPattern[] = "^([^\\s:]+)(?:: (.*))?$";
constexpr char kCausedByPrefix[] = "Caused by:";

}  // namespace

JavaCrashParser::JavaCrashParser()
    : fatal_exception_(CompileBuiltinRegex(kFatalExceptionPattern)),
      process_(CompileBuiltinRegex(kProcessPattern)),
      exception_(CompileBuiltinRegex(kExceptionPattern)) {}

JavaCrashParser::~JavaCrashParser() = default;

bool JavaCrashParser::IsCrashStart(const std::string& line) const {
  return fatal_exception_.FullMatch(line);
}

std::optional<JavaCrashItem> JavaCrashParser::Parse(
    const std::vector<std::string>& lines) const {
  std::optional<JavaCrashItem> crash;
  std::optional<std::string> app;
  std::vector<std::string> stack;
  std::vector<std::vector<std::string>> causes;
  std::vector<std::string_view> groups;

  for (const std::string& line : lines) {
    if (!crash) {
      if (fatal_exception_.FullMatch(line))
        continue;
      if (process_.FullMatch(line, &groups)) {
        app = GroupToString(groups[1]);
        continue;
      }
      if (!exception_.FullMatch(line, &groups)) {
        BUGSIFT_DLOG("Skipping line before the exception: |%s|", line.c_str());
        continue;
      }
      crash.emplace();
      crash->exception = GroupToString(groups[1]);
      crash->message = GroupToString(groups[2]);
      stack.push_back(line);
      continue;
    }

    if (base::StartsWith(line, kCausedByPrefix)) {
      causes.emplace_back();
      causes.back().push_back(line);
    } else if (!causes.empty()) {
      causes.back().push_back(line);
    } else {
      stack.push_back(line);
    }
  }

  if (!crash)
    return crash;
  crash->app = app;
  crash->stack = JoinAndTrim(stack);
  for (const auto& cause : causes)
    crash->cause_stacks.push_back(JoinAndTrim(cause));
  return crash;
}

}  // namespace parser
}  // namespace bugsift
