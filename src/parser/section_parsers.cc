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

#include "src/parser/section_parsers.h"

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/string_utils.h"
#include "bugsift/parser/items.h"
#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

constexpr char kInfoLinePattern[] = "^([^:]+):\\s+(\\d+) kB$";
constexpr char kPropLinePattern[] = "^\\[(.*)\\]: \\[(.*)\\]$";
constexpr char kPidLinePattern[] = "^----- pid (\\d+) at .* -----$";
constexpr char kCmdLinePattern[] = "^Cmd line: (.*)$";
constexpr char kMainThreadPattern[] = "^\"main\" .*$";

}  // namespace

MemInfoParser::MemInfoParser()
    : info_line_(CompileBuiltinRegex(kInfoLinePattern)) {}
MemInfoParser::~MemInfoParser() = default;

void MemInfoParser::ParseBlock(const std::vector<std::string>& lines,
                               ItemList* items) {
  MemInfoItem mem_info;
  std::vector<std::string_view> groups;
  for (const std::string& line : lines) {
    std::optional<int64_t> value;
    if (info_line_.FullMatch(line, &groups))
      value = GroupToInt64(groups[2]);
    if (!value) {
      BUGSIFT_DLOG("Failed to parse meminfo line |%s|", line.c_str());
      continue;
    }
    mem_info.values[std::string(groups[1])] = *value;
  }
  items->AddItem(std::move(mem_info));
}

SystemPropsParser::SystemPropsParser()
    : prop_line_(CompileBuiltinRegex(kPropLinePattern)) {}
SystemPropsParser::~SystemPropsParser() = default;

void SystemPropsParser::ParseBlock(const std::vector<std::string>& lines,
                                   ItemList* items) {
  SystemPropsItem props;
  std::vector<std::string_view> groups;
  for (const std::string& line : lines) {
    if (!prop_line_.FullMatch(line, &groups)) {
      BUGSIFT_DLOG("Failed to parse property line |%s|", line.c_str());
      continue;
    }
    props.values[std::string(groups[1])] = std::string(groups[2]);
  }
  items->AddItem(std::move(props));
}

TracesParser::TracesParser()
    : pid_line_(CompileBuiltinRegex(kPidLinePattern)),
      cmd_line_(CompileBuiltinRegex(kCmdLinePattern)),
      main_thread_(CompileBuiltinRegex(kMainThreadPattern)) {}
TracesParser::~TracesParser() = default;

void TracesParser::ParseBlock(const std::vector<std::string>& lines,
                              ItemList* items) {
  TracesItem traces;
  std::vector<std::string> stack;
  bool in_main_stack = false;
  std::vector<std::string_view> groups;
  for (const std::string& line : lines) {
    if (in_main_stack) {
      if (line.empty()) {
        traces.stack = base::Join(stack, "\n");
        break;
      }
      stack.push_back(line);
      continue;
    }
    if (!traces.pid && pid_line_.FullMatch(line, &groups)) {
      traces.pid = GroupToInt32(groups[1]);
    } else if (!traces.app && cmd_line_.FullMatch(line, &groups)) {
      traces.app = GroupToString(groups[1]);
    } else if (main_thread_.FullMatch(line)) {
      in_main_stack = true;
      stack.push_back(line);
    }
  }
  // The section ended in the middle of the stack.
  if (in_main_stack && !traces.stack)
    traces.stack = base::Join(stack, "\n");
  items->AddItem(std::move(traces));
}

}  // namespace parser
}  // namespace bugsift
