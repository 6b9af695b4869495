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

#ifndef SRC_PARSER_NATIVE_CRASH_PARSER_H_
#define SRC_PARSER_NATIVE_CRASH_PARSER_H_

#include <optional>
#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/items.h"

namespace bugsift {
namespace parser {

// Extracts a NativeCrashItem from a tombstone printed by debuggerd. Lines
// before the "*** *** ***" marker are ignored so that output from a previous,
// unrelated crash does not leak into the stack.
class NativeCrashParser {
 public:
  NativeCrashParser();
  ~NativeCrashParser();

  // Returns nullopt if |lines| does not contain the start marker.
  std::optional<NativeCrashItem> Parse(
      const std::vector<std::string>& lines) const;

  bool IsCrashStart(const std::string& line) const;

 private:
  base::Regex start_;
  base::Regex fingerprint_;
  base::Regex app_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_NATIVE_CRASH_PARSER_H_
