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

#include "src/parser/line_parser.h"

namespace bugsift {
namespace parser {

LineParser::~LineParser() = default;
BlockParser::~BlockParser() = default;
AbstractBlockParser::~AbstractBlockParser() = default;

void AbstractBlockParser::ParseBlock(const std::vector<std::string>& lines,
                                     ItemList* items) {
  for (const std::string& line : lines)
    ParseLine(line, items);
  Commit(items);
}

}  // namespace parser
}  // namespace bugsift
