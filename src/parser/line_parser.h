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

#ifndef SRC_PARSER_LINE_PARSER_H_
#define SRC_PARSER_LINE_PARSER_H_

#include <string>
#include <vector>

#include "bugsift/parser/item_list.h"

namespace bugsift {
namespace parser {

// A parser fed one line at a time. Commit() signals the end of the input and
// must flush any partially accumulated state into |items|.
// Implementations never fail on malformed lines: they log and skip them.
class LineParser {
 public:
  virtual ~LineParser();

  virtual void ParseLine(const std::string& line, ItemList* items) = 0;
  virtual void Commit(ItemList* items) = 0;
};

// A parser fed a whole pre-isolated block of lines at once (e.g. the body of
// a bugreport section).
class BlockParser {
 public:
  virtual ~BlockParser();

  virtual void ParseBlock(const std::vector<std::string>& lines,
                          ItemList* items) = 0;
};

// Adapts a LineParser into a BlockParser: ParseBlock() feeds every line to
// ParseLine() and then calls Commit().
class AbstractBlockParser : public LineParser, public BlockParser {
 public:
  ~AbstractBlockParser() override;

  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) final;
};

}  // namespace parser
}  // namespace bugsift

#endif  // SRC_PARSER_LINE_PARSER_H_
