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

#include "src/parser/section_dispatcher.h"

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/status_macros.h"

namespace bugsift {
namespace parser {

NoopSectionParser::~NoopSectionParser() = default;

void NoopSectionParser::ParseBlock(const std::vector<std::string>&,
                                   ItemList*) {}

SectionDispatcher::Section::Section(base::Regex h,
                                    std::unique_ptr<BlockParser> p)
    : header(std::move(h)), parser(std::move(p)) {}
SectionDispatcher::Section::Section(Section&&) noexcept = default;
SectionDispatcher::Section::~Section() = default;

SectionDispatcher::SectionDispatcher()
    : SectionDispatcher(std::unique_ptr<BlockParser>(new NoopSectionParser())) {
}

SectionDispatcher::SectionDispatcher(
    std::unique_ptr<BlockParser> initial_parser)
    : initial_parser_(std::move(initial_parser)),
      current_parser_(initial_parser_.get()) {}

SectionDispatcher::~SectionDispatcher() = default;

base::Status SectionDispatcher::AddSectionParser(
    const char* header_pattern,
    std::unique_ptr<BlockParser> parser) {
  ASSIGN_OR_RETURN(base::Regex header, base::Regex::Create(header_pattern));
  sections_.emplace_back(std::move(header), std::move(parser));
  return base::OkStatus();
}

BlockParser* SectionDispatcher::FindSectionParser(
    const std::string& line) const {
  for (const Section& section : sections_) {
    if (section.header.FullMatch(line))
      return section.parser.get();
  }
  return nullptr;
}

void SectionDispatcher::ParseLine(const std::string& line, ItemList* items) {
  BlockParser* next_parser = FindSectionParser(line);
  if (!next_parser) {
    if (current_parser_) {
      block_.push_back(line);
    } else {
      BUGSIFT_DLOG("Line outside of any section: |%s|", line.c_str());
    }
    return;
  }

  BUGSIFT_DLOG("Switching section parser at |%s|", line.c_str());
  RunCurrentParser(items);
  OnSwitchParser(items);
  current_parser_ = next_parser;
}

void SectionDispatcher::Commit(ItemList* items) {
  RunCurrentParser(items);
}

void SectionDispatcher::OnSwitchParser(ItemList*) {}

void SectionDispatcher::RunCurrentParser(ItemList* items) {
  if (current_parser_)
    current_parser_->ParseBlock(block_, items);
  block_.clear();
}

}  // namespace parser
}  // namespace bugsift
