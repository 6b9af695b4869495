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

#ifndef INCLUDE_BUGSIFT_EXT_BASE_STRING_UTILS_H_
#define INCLUDE_BUGSIFT_EXT_BASE_STRING_UTILS_H_

#include <inttypes.h>
#include <stdlib.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bugsift {
namespace base {

inline char Lowercase(char c) {
  return ('A' <= c && c <= 'Z') ? static_cast<char>(c - ('A' - 'a')) : c;
}

inline std::optional<int32_t> CStringToInt32(const char* s, int base = 10) {
  char* endptr = nullptr;
  auto value = static_cast<int32_t>(strtol(s, &endptr, base));
  return (*s && !*endptr) ? std::make_optional(value) : std::nullopt;
}

inline std::optional<int64_t> CStringToInt64(const char* s, int base = 10) {
  char* endptr = nullptr;
  auto value = static_cast<int64_t>(strtoll(s, &endptr, base));
  return (*s && !*endptr) ? std::make_optional(value) : std::nullopt;
}

inline std::optional<double> CStringToDouble(const char* s) {
  char* endptr = nullptr;
  double value = strtod(s, &endptr);
  std::optional<double> result(std::nullopt);
  if (*s != '\0' && *endptr == '\0')
    result = value;
  return result;
}

inline std::optional<int32_t> StringToInt32(const std::string& s,
                                            int base = 10) {
  return CStringToInt32(s.c_str(), base);
}

inline std::optional<int64_t> StringToInt64(const std::string& s,
                                            int base = 10) {
  return CStringToInt64(s.c_str(), base);
}

inline std::optional<double> StringToDouble(const std::string& s) {
  return CStringToDouble(s.c_str());
}

bool StartsWith(const std::string& str, const std::string& prefix);
std::string Join(const std::vector<std::string>& parts,
                 const std::string& delim);
std::string StripSuffix(const std::string& str, const std::string& suffix);
std::string ToLower(const std::string& str);
std::string ReplaceAll(std::string str,
                       const std::string& to_replace,
                       const std::string& replacement);

// Removes leading and trailing ASCII whitespace (' ', '\t', '\n', '\r', '\v'
// and '\f').
std::string TrimWhitespace(const std::string& str);

// Splits |text| into tokens separated by runs of whitespace, ignoring leading
// and trailing whitespace. If |max_tokens| is non-zero, at most |max_tokens|
// tokens are returned and the last one holds the rest of the line verbatim
// (e.g. a command line containing spaces).
std::vector<std::string> SplitWhitespace(const std::string& text,
                                         size_t max_tokens = 0);

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_EXT_BASE_STRING_UTILS_H_
