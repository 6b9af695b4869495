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

#ifndef SRC_PARSER_SECTION_PARSERS_H_
#define SRC_PARSER_SECTION_PARSERS_H_

#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "src/parser/line_parser.h"

namespace bugsift {
namespace parser {

// Parses the "MEMORY INFO" bugreport section (/proc/meminfo):
//   MemTotal:         353332 kB
// Emits a MemInfoItem.
class MemInfoParser : public BlockParser {
 public:
  MemInfoParser();
  ~MemInfoParser() override;

  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) override;

 private:
  base::Regex info_line_;
};

// Parses the "SYSTEM PROPERTIES" bugreport section (getprop):
//   [dalvik.vm.heapsize]: [256m]
// Emits a SystemPropsItem.
class SystemPropsParser : public BlockParser {
 public:
  SystemPropsParser();
  ~SystemPropsParser() override;

  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) override;

 private:
  base::Regex prop_line_;
};

// Parses the "VM TRACES AT LAST ANR" bugreport section. Only the pid, the
// command line and the stack of the "main" thread of the first process are
// kept. Emits a TracesItem.
class TracesParser : public BlockParser {
 public:
  TracesParser();
  ~TracesParser() override;

  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) override;

 private:
  base::Regex pid_line_;
  base::Regex cmd_line_;
  base::Regex main_thread_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_SECTION_PARSERS_H_
