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

#include "bugsift/ext/base/regex.h"

#include <re2/re2.h>

#include "bugsift/base/logging.h"

namespace bugsift {
namespace base {

StatusOr<Regex> Regex::Create(const char* pattern) {
  Regex re(pattern);
  if (!re.IsValid()) {
    return base::ErrStatus("Regex pattern '%s' is malformed.", pattern);
  }
  return std::move(re);
}

Regex::Regex(const std::string& pattern) {
  re2::RE2::Options re2_opt;
  re2_opt.set_log_errors(false);
  re_ = std::make_unique<re2::RE2>(pattern, re2_opt);
}

Regex::~Regex() = default;
Regex::Regex(Regex&&) noexcept = default;
Regex& Regex::operator=(Regex&&) noexcept = default;

bool Regex::IsValid() const {
  return re_ && re_->ok();
}

const std::string& Regex::pattern() const {
  BUGSIFT_CHECK(re_);
  return re_->pattern();
}

bool Regex::FullMatch(std::string_view s) const {
  return DoMatch(s, /*anchored=*/true, nullptr);
}

bool Regex::FullMatch(std::string_view s,
                      std::vector<std::string_view>* groups) const {
  return DoMatch(s, /*anchored=*/true, groups);
}

void Regex::Submatch(std::string_view s,
                     std::vector<std::string_view>& out) const {
  DoMatch(s, /*anchored=*/false, &out);
}

bool Regex::DoMatch(std::string_view s,
                    bool anchored,
                    std::vector<std::string_view>* groups) const {
  if (groups)
    groups->clear();
  if (!IsValid())
    return false;

  // RE2 reports an empty-but-valid StringPiece for an empty input. Make sure
  // it always points somewhere so that matched empty groups are not confused
  // with groups that did not participate.
  static const char kEmpty[] = "";
  re2::StringPiece input(s.data() ? s.data() : kEmpty, s.size());
  const auto anchor = anchored ? re2::RE2::ANCHOR_BOTH : re2::RE2::UNANCHORED;

  if (!groups)
    return re_->Match(input, 0, input.size(), anchor, nullptr, 0);

  int n_groups = re_->NumberOfCapturingGroups();
  if (n_groups < 0)
    return false;
  size_t num_to_capture = static_cast<size_t>(n_groups) + 1;
  std::vector<re2::StringPiece> matches(num_to_capture);
  if (!re_->Match(input, 0, input.size(), anchor, matches.data(),
                  static_cast<int>(num_to_capture))) {
    return false;
  }
  for (const auto& m : matches) {
    if (m.data() == nullptr) {
      // Optional group that did not match.
      groups->emplace_back();
    } else {
      groups->emplace_back(m.data(), m.size());
    }
  }
  return true;
}

}  // namespace base
}  // namespace bugsift
