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

#include "src/parser/parser_utils.h"

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/string_utils.h"

namespace bugsift {
namespace parser {

base::Regex CompileBuiltinRegex(const char* pattern) {
  base::Regex re(pattern);
  if (!re.IsValid())
    BUGSIFT_FATAL("Invalid built-in pattern: %s", pattern);
  return re;
}

std::optional<std::string> GroupToString(std::string_view group) {
  if (!group.data())
    return std::nullopt;
  return std::string(group);
}

std::optional<int32_t> GroupToInt32(std::string_view group) {
  if (!group.data())
    return std::nullopt;
  return base::StringToInt32(std::string(group));
}

std::optional<int64_t> GroupToInt64(std::string_view group) {
  if (!group.data())
    return std::nullopt;
  return base::StringToInt64(std::string(group));
}

std::optional<double> GroupToDouble(std::string_view group) {
  if (!group.data())
    return std::nullopt;
  return base::StringToDouble(std::string(group));
}

std::string JoinAndTrim(const std::vector<std::string>& lines) {
  return base::TrimWhitespace(base::Join(lines, "\n"));
}

}  // namespace parser
}  // namespace bugsift
