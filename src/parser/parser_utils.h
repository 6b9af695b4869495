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

#ifndef SRC_PARSER_PARSER_UTILS_H_
#define SRC_PARSER_PARSER_UTILS_H_

#include <stdint.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bugsift/ext/base/regex.h"

namespace bugsift {
namespace parser {

// Compiles one of the built-in line grammars. A malformed built-in pattern is
// a programming error and crashes.
base::Regex CompileBuiltinRegex(const char* pattern);

// Helpers to convert regex groups. Unmatched groups (null views) and
// malformed numbers yield nullopt.
std::optional<std::string> GroupToString(std::string_view group);
std::optional<int32_t> GroupToInt32(std::string_view group);
std::optional<int64_t> GroupToInt64(std::string_view group);
std::optional<double> GroupToDouble(std::string_view group);

// Joins |lines| with '\n' and trims the result.
std::string JoinAndTrim(const std::vector<std::string>& lines);

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_PARSER_UTILS_H_
