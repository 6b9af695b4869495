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

#include "bugsift/parser/parse.h"

#include "bugsift/ext/base/status_macros.h"
#include "src/parser/bugreport_parser.h"
#include "src/parser/line_reader.h"
#include "src/parser/logcat_parser.h"
#include "src/parser/monkey_log_parser.h"
#include "src/parser/procrank_parser.h"

namespace bugsift {
namespace parser {

BugreportItem ParseBugreport(const std::vector<std::string>& lines,
                             const Config& config) {
  return BugreportParser::Parse(lines, config);
}

base::StatusOr<BugreportItem> ParseBugreportFile(const std::string& path,
                                                 const Config& config) {
  ASSIGN_OR_RETURN(std::vector<std::string> lines, ReadFileLines(path));
  return ParseBugreport(lines, config);
}

LogcatItem ParseLogcat(const std::vector<std::string>& lines,
                       const Config& config) {
  return LogcatParser::Parse(lines, config);
}

base::StatusOr<LogcatItem> ParseLogcatFile(const std::string& path,
                                           const Config& config) {
  ASSIGN_OR_RETURN(std::vector<std::string> lines, ReadFileLines(path));
  return ParseLogcat(lines, config);
}

MonkeyLogItem ParseMonkeyLog(const std::vector<std::string>& lines) {
  return MonkeyLogParser::Parse(lines);
}

base::StatusOr<MonkeyLogItem> ParseMonkeyLogFile(const std::string& path) {
  ASSIGN_OR_RETURN(std::vector<std::string> lines, ReadFileLines(path));
  return ParseMonkeyLog(lines);
}

ProcrankItem ParseProcrank(const std::vector<std::string>& lines) {
  return ProcrankParser::Parse(lines);
}

base::StatusOr<ProcrankItem> ParseProcrankFile(const std::string& path) {
  ASSIGN_OR_RETURN(std::vector<std::string> lines, ReadFileLines(path));
  return ParseProcrank(lines);
}

}  // namespace parser
}  // namespace bugsift
