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

#include "bugsift/ext/base/string_utils.h"

#include "bugsift/base/logging.h"

namespace bugsift {
namespace base {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

}  // namespace

bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.compare(0, prefix.length(), prefix) == 0;
}

std::string Join(const std::vector<std::string>& parts,
                 const std::string& delim) {
  std::string acc;
  for (size_t i = 0; i < parts.size(); ++i) {
    acc += parts[i];
    if (i + 1 != parts.size()) {
      acc += delim;
    }
  }
  return acc;
}

std::string StripSuffix(const std::string& str, const std::string& suffix) {
  if (suffix.size() > str.size() ||
      str.compare(str.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return str;
  }
  return str.substr(0, str.size() - suffix.size());
}

std::string ToLower(const std::string& str) {
  std::string res(str);
  for (char& c : res)
    c = Lowercase(c);
  return res;
}

std::string ReplaceAll(std::string str,
                       const std::string& to_replace,
                       const std::string& replacement) {
  BUGSIFT_CHECK(!to_replace.empty());
  size_t pos = 0;
  while ((pos = str.find(to_replace, pos)) != std::string::npos) {
    str.replace(pos, to_replace.length(), replacement);
    pos += replacement.length();
  }
  return str;
}

std::string TrimWhitespace(const std::string& str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && IsSpace(str[begin]))
    ++begin;
  while (end > begin && IsSpace(str[end - 1]))
    --end;
  return str.substr(begin, end - begin);
}

std::vector<std::string> SplitWhitespace(const std::string& text,
                                         size_t max_tokens) {
  std::vector<std::string> output;
  size_t i = 0;
  const size_t size = text.size();
  for (;;) {
    while (i < size && IsSpace(text[i]))
      ++i;
    if (i >= size)
      break;
    if (max_tokens && output.size() + 1 == max_tokens) {
      size_t end = size;
      while (end > i && IsSpace(text[end - 1]))
        --end;
      output.emplace_back(text.substr(i, end - i));
      break;
    }
    size_t start = i;
    while (i < size && !IsSpace(text[i]))
      ++i;
    output.emplace_back(text.substr(start, i - start));
  }
  return output;
}

}  // namespace base
}  // namespace bugsift
