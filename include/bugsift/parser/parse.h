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

#ifndef INCLUDE_BUGSIFT_PARSER_PARSE_H_
#define INCLUDE_BUGSIFT_PARSER_PARSE_H_

#include <string>
#include <vector>

#include "bugsift/ext/base/status_or.h"
#include "bugsift/parser/basic_types.h"
#include "bugsift/parser/items.h"

namespace bugsift {
namespace parser {

// Entry points of the parsing library. The functions taking lines never fail:
// malformed input is skipped and missing data is left unset. The *File
// variants read (and inflate, if gzipped) |path| first and return an error
// status if that fails.

BugreportItem ParseBugreport(const std::vector<std::string>& lines,
                             const Config& config = Config());
base::StatusOr<BugreportItem> ParseBugreportFile(
    const std::string& path,
    const Config& config = Config());

LogcatItem ParseLogcat(const std::vector<std::string>& lines,
                       const Config& config = Config());
base::StatusOr<LogcatItem> ParseLogcatFile(const std::string& path,
                                           const Config& config = Config());

MonkeyLogItem ParseMonkeyLog(const std::vector<std::string>& lines);
base::StatusOr<MonkeyLogItem> ParseMonkeyLogFile(const std::string& path);

ProcrankItem ParseProcrank(const std::vector<std::string>& lines);
base::StatusOr<ProcrankItem> ParseProcrankFile(const std::string& path);

}  // namespace parser
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_PARSER_PARSE_H_
