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

#ifndef SRC_PARSER_BUGREPORT_PARSER_H_
#define SRC_PARSER_BUGREPORT_PARSER_H_

#include <optional>
#include <string>
#include <vector>

#include "bugsift/parser/basic_types.h"
#include "bugsift/parser/item_list.h"
#include "bugsift/parser/items.h"
#include "src/parser/section_dispatcher.h"

namespace bugsift {
namespace parser {

class LogcatSectionParser;

// Parses a full bugreport into a single BugreportItem.
//
// The text before the first section header is the dumpstate header, whose
// "== dumpstate: yyyy-MM-dd HH:mm:ss" line gives the time of the report and
// the year of the system log timestamps. The recognized sections are:
//   ------ MEMORY INFO (/proc/meminfo) ------
//   ------ PROCRANK (procrank) ------
//   ------ SYSTEM PROPERTIES ------
//   ------ VM TRACES AT LAST ANR (/data/anr/traces.txt: ...) ------
//   ------ SYSTEM LOG (logcat -v threadtime -d *:v) ------
// Any other "------ " header ends the current section and its body is
// dropped. A "MAIN LOG" section is accepted in place of the system log.
//
// Once all the sections are parsed the report is assembled: logcat events
// lacking an app take it from procrank, and the main thread stack of the VM
// traces is attached to the most recent ANR of the same app.
class BugreportParser : public SectionDispatcher {
 public:
  explicit BugreportParser(const Config& config = Config());
  ~BugreportParser() override;

  static BugreportItem Parse(const std::vector<std::string>& lines,
                             const Config& config = Config());

  // LineParser implementation. Exactly one BugreportItem is added to |items|
  // on Commit().
  void ParseLine(const std::string& line, ItemList* items) override;
  void Commit(ItemList* items) override;

 protected:
  void OnSwitchParser(ItemList* items) override;

 private:
  BugreportItem Assemble() const;

  // Owned by the dispatcher.
  LogcatSectionParser* logcat_section_ = nullptr;
  bool header_parsed_ = false;
  bool committed_ = false;

  // Items emitted by the section parsers, before assembly.
  ItemList sections_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_BUGREPORT_PARSER_H_
