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

#ifndef SRC_PARSER_PROCRANK_PARSER_H_
#define SRC_PARSER_PROCRANK_PARSER_H_

#include <stdint.h>

#include <optional>
#include <string>
#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/items.h"
#include "src/parser/line_parser.h"

namespace bugsift {
namespace parser {

// Parses the table printed by procrank:
//     PID       Vss      Rss      Pss      Uss  cmdline
//     178   87136K   81684K   52829K   50012K  system_server
//                             ------   ------  ------
// The first non-blank line is the header. Every following row must have as
// many fields as the header; the last field (the command line) may contain
// spaces. The "------ ------ ------" line ends the table and everything after
// it is ignored. Emits a ProcrankItem on Commit().
class ProcrankParser : public AbstractBlockParser {
 public:
  ProcrankParser();
  ~ProcrankParser() override;

  // Parses a memory size with an optional b/k/m/g suffix (case insensitive)
  // into KB. A bare number is already in KB.
  static std::optional<int64_t> ParseMemValue(const std::string& value);

  // Parses a whole table.
  static ProcrankItem Parse(const std::vector<std::string>& lines);

  // LineParser implementation.
  void ParseLine(const std::string& line, ItemList* items) override;
  void Commit(ItemList* items) override;

 private:
  enum class State {
    kUnseen = 0,
    kHeaderSeen,
    kTableEnd,
  };

  void ParseRow(const std::string& line);

  base::Regex table_end_;
  State state_ = State::kUnseen;
  std::vector<std::string> columns_;  // Lowercased.
  size_t pid_column_ = 0;
  ProcrankItem procrank_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_PROCRANK_PARSER_H_
