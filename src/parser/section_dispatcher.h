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

#ifndef SRC_PARSER_SECTION_DISPATCHER_H_
#define SRC_PARSER_SECTION_DISPATCHER_H_

#include <memory>
#include <string>
#include <vector>

#include "bugsift/base/status.h"
#include "bugsift/ext/base/regex.h"
#include "src/parser/line_parser.h"

namespace bugsift {
namespace parser {

// Swallows the sections nobody cares about.
class NoopSectionParser : public BlockParser {
 public:
  ~NoopSectionParser() override;
  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) override;
};

// Splits a stream of lines into sections, each one started by a header line,
// and hands the body of each section (header excluded) to the BlockParser
// registered for that header.
//
// Header patterns are tried in registration order and the first full match
// wins, so more specific patterns must be registered before generic ones. A
// catch-all pattern bound to a NoopSectionParser makes sure unknown sections
// still terminate the previous one.
//
// Lines before the first header go to the initial parser. The last section is
// flushed by Commit().
class SectionDispatcher : public LineParser {
 public:
  // Uses a NoopSectionParser as the initial parser.
  SectionDispatcher();
  explicit SectionDispatcher(std::unique_ptr<BlockParser> initial_parser);
  ~SectionDispatcher() override;

  // Returns an error if |header_pattern| is not a valid regex.
  base::Status AddSectionParser(const char* header_pattern,
                                std::unique_ptr<BlockParser> parser);

  // LineParser implementation.
  void ParseLine(const std::string& line, ItemList* items) override;
  void Commit(ItemList* items) override;

 protected:
  // Invoked every time a section has been handed to its parser, right before
  // switching to the parser of the next section.
  virtual void OnSwitchParser(ItemList* items);

 private:
  struct Section {
    Section(base::Regex h, std::unique_ptr<BlockParser> p);
    Section(Section&&) noexcept;
    ~Section();

    base::Regex header;
    std::unique_ptr<BlockParser> parser;
  };

  BlockParser* FindSectionParser(const std::string& line) const;
  void RunCurrentParser(ItemList* items);

  std::unique_ptr<BlockParser> initial_parser_;
  std::vector<Section> sections_;
  BlockParser* current_parser_ = nullptr;
  std::vector<std::string> block_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_SECTION_DISPATCHER_H_
