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

#ifndef SRC_PARSER_ANR_PARSER_H_
#define SRC_PARSER_ANR_PARSER_H_

#include <optional>
#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/items.h"

namespace bugsift {
namespace parser {

// Extracts an AnrItem from the ActivityManager lines of an ANR, e.g.:
//   ANR in com.android.package (com.android.package/.Activity)
//   Reason: keyDispatchingTimedOut
//   Load: 0.71 / 0.83 / 0.51
//   33% TOTAL: 21% user + 11% kernel + 0.3% iowait
// Any subset of the fields may be present. The first occurrence of each field
// wins. Event time, pid and tid are left to the caller.
class AnrParser {
 public:
  AnrParser();
  ~AnrParser();

  // Returns nullopt if |lines| does not contain an ANR start line.
  std::optional<AnrItem> Parse(const std::vector<std::string>& lines) const;

  // Returns true if |line| is the first line of an ANR report.
  bool IsAnrStart(const std::string& line) const;

 private:
  base::Regex start_;
  base::Regex activity_;
  base::Regex reason_;
  base::Regex load_;
  base::Regex total_;
  base::Regex user_;
  base::Regex kernel_;
  base::Regex iowait_;
  base::Regex irq_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_ANR_PARSER_H_
