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

#ifndef INCLUDE_BUGSIFT_EXT_BASE_REGEX_H_
#define INCLUDE_BUGSIFT_EXT_BASE_REGEX_H_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "bugsift/base/status.h"
#include "bugsift/ext/base/status_or.h"

namespace re2 {
class RE2;
}  // namespace re2

namespace bugsift {
namespace base {

// Thin wrapper around RE2. All the log grammars are written in RE2 syntax.
class Regex {
 public:
  // Parses |pattern|. Returns an error if the pattern is malformed.
  static StatusOr<Regex> Create(const char* pattern);

  // Prefer Create() for patterns coming from the outside. Built-in patterns
  // can use this constructor and check IsValid().
  explicit Regex(const std::string& pattern);
  ~Regex();

  Regex(Regex&&) noexcept;
  Regex& operator=(Regex&&) noexcept;
  Regex(const Regex&) = delete;
  Regex& operator=(const Regex&) = delete;

  bool IsValid() const;

  const std::string& pattern() const;

  // Returns true if the whole of |s| matches the regex.
  bool FullMatch(std::string_view s) const;

  // Like above, but also fills |groups| with the matched groups. The first
  // element is the full match, subsequent elements are parenthesized
  // subexpressions. Optional groups that did not participate in the match are
  // reported as null views (data() == nullptr).
  // |groups| is left empty if there is no match.
  bool FullMatch(std::string_view s, std::vector<std::string_view>* groups) const;

  // Reports the groups of the first match found anywhere in |s|, with the
  // same conventions as FullMatch(). |out| is left empty if there is no match.
  void Submatch(std::string_view s, std::vector<std::string_view>& out) const;

 private:
  bool DoMatch(std::string_view s,
               bool anchored,
               std::vector<std::string_view>* groups) const;

  std::unique_ptr<re2::RE2> re_;
};

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_EXT_BASE_REGEX_H_
