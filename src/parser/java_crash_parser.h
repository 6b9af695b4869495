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

#ifndef SRC_PARSER_JAVA_CRASH_PARSER_H_
#define SRC_PARSER_JAVA_CRASH_PARSER_H_

#include <optional>
#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/items.h"

namespace bugsift {
namespace parser {

// Extracts a JavaCrashItem from an uncaught exception report:
//   FATAL EXCEPTION: main                 (optional)
//   Process: com.android.package, PID: 1  (optional)
//   java.lang.IllegalStateException: message
//   \tat class.method(Class.java:1)
//   Caused by: java.lang.RuntimeException
//   \tat class.method(Class.java:2)
// The main stack holds the exception line and its frames. Every "Caused by:"
// group becomes one entry of |cause_stacks|.
class JavaCrashParser {
 public:
  JavaCrashParser();
  ~JavaCrashParser();

  // Returns nullopt if |lines| does not contain an exception line.
  std::optional<JavaCrashItem> Parse(
      const std::vector<std::string>& lines) const;

  // Returns true if |line| opens an AndroidRuntime crash report.
  bool IsCrashStart(const std::string& line) const;

 private:
  base::Regex fatal_exception_;
  base::Regex process_;
  base::Regex exception_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_JAVA_CRASH_PARSER_H_
