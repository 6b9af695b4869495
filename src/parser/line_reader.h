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

#ifndef SRC_PARSER_LINE_READER_H_
#define SRC_PARSER_LINE_READER_H_

#include <string>
#include <vector>

#include "bugsift/ext/base/status_or.h"

namespace bugsift {
namespace parser {

// Splits |text| on '\n'. A trailing "\r" is dropped from every line and a
// final empty line (i.e. a trailing newline) is not reported.
std::vector<std::string> SplitLines(const std::string& text);

// Reads the whole file at |path| and splits it into lines. Gzip-compressed
// files (detected by their magic bytes) are inflated first.
base::StatusOr<std::vector<std::string>> ReadFileLines(const std::string& path);

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_LINE_READER_H_
