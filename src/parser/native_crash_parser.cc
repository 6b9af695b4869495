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

#include "src/parser/native_crash_parser.h"

#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

constexpr char kStartPattern[] = "^(?:\\*\\*\\* ){15}\\*\\*\\*$";
constexpr char kFingerprintPattern[] = "^Build fingerprint: '(.*)'$";
constexpr char kAppPattern[] =
    "^pid: \\d+, tid: \\d+(?:, name: .*)?  >>> (\\S+) <<<$";

}  // namespace

NativeCrashParser::NativeCrashParser()
    : start_(CompileBuiltinRegex(kStartPattern)),
      fingerprint_(CompileBuiltinRegex(kFingerprintPattern)),
      app_(CompileBuiltinRegex(kAppPattern)) {}

NativeCrashParser::~NativeCrashParser() = default;

bool NativeCrashParser::IsCrashStart(const std::string& line) const {
  return start_.FullMatch(line);
}

std::optional<NativeCrashItem> NativeCrashParser::Parse(
    const std::vector<std::string>& lines) const {
  std::optional<NativeCrashItem> crash;
  std::vector<std::string> stack;
  std::vector<std::string_view> groups;
  for (const std::string& line : lines) {
    if (start_.FullMatch(line)) {
      // A new marker restarts the capture.
      crash.emplace();
      stack.clear();
    }
    if (!crash)
      continue;
    if (fingerprint_.FullMatch(line, &groups)) {
      crash->fingerprint = GroupToString(groups[1]);
    } else if (app_.FullMatch(line, &groups)) {
      crash->app = GroupToString(groups[1]);
    }
    stack.push_back(line);
  }
  if (crash)
    crash->stack = JoinAndTrim(stack);
  return crash;
}

}  // namespace parser
}  // namespace bugsift
