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

#include "src/parser/procrank_parser.h"

#include "bugsift/base/logging.h"
#include "bugsift/ext/base/string_utils.h"
#include "src/parser/parser_utils.h"

namespace bugsift {
namespace parser {

namespace {

constexpr char kTableEndPattern[] = "^\\s*-{6,}\\s+-{6,}\\s+-{6,}\\s*$";
constexpr char kPidColumn[] = "pid";

}  // namespace

ProcrankParser::ProcrankParser()
    : table_end_(CompileBuiltinRegex(kTableEndPattern)) {}

ProcrankParser::~ProcrankParser() = default;

// static
std::optional<int64_t> ProcrankParser::ParseMemValue(const std::string& value) {
  if (value.empty())
    return std::nullopt;
  std::string digits = value;
  int64_t multiplier = 1;
  int64_t divisor = 1;
  char suffix = base::Lowercase(value.back());
  if (suffix < '0' || suffix > '9') {
    digits.pop_back();
    switch (suffix) {
      case 'b':
        divisor = 1024;
        break;
      case 'k':
        break;
      case 'm':
        multiplier = 1024;
        break;
      case 'g':
        multiplier = 1024 * 1024;
        break;
      default:
        return std::nullopt;
    }
  }
  // Sizes are never negative.
  if (digits.empty() || digits[0] < '0' || digits[0] > '9')
    return std::nullopt;
  std::optional<int64_t> num = base::StringToInt64(digits);
  if (!num)
    return std::nullopt;
  return *num * multiplier / divisor;
}

// static
ProcrankItem ProcrankParser::Parse(const std::vector<std::string>& lines) {
  ProcrankParser parser;
  ItemList items;
  parser.ParseBlock(lines, &items);
  const ProcrankItem* procrank = items.GetFirst<ProcrankItem>();
  return procrank ? *procrank : ProcrankItem();
}

void ProcrankParser::ParseLine(const std::string& line, ItemList*) {
  if (state_ == State::kTableEnd)
    return;
  if (table_end_.FullMatch(line)) {
    state_ = State::kTableEnd;
    return;
  }
  if (base::TrimWhitespace(line).empty())
    return;

  if (state_ == State::kUnseen) {
    columns_ = base::SplitWhitespace(base::ToLower(line));
    for (size_t i = 0; i < columns_.size(); i++) {
      if (columns_[i] == kPidColumn) {
        pid_column_ = i;
        break;
      }
    }
    state_ = State::kHeaderSeen;
    return;
  }
  ParseRow(line);
}

void ProcrankParser::ParseRow(const std::string& line) {
  std::vector<std::string> fields = base::SplitWhitespace(line, columns_.size());
  if (columns_.size() < 2 || fields.size() != columns_.size()) {
    BUGSIFT_DLOG("Skipping procrank line with %zu fields: |%s|", fields.size(),
                 line.c_str());
    return;
  }

  std::optional<int32_t> pid = base::StringToInt32(fields[pid_column_]);
  if (!pid) {
    BUGSIFT_DLOG("Skipping procrank line with invalid pid: |%s|",
                 line.c_str());
    return;
  }

  ProcrankItem::Row row;
  row.process_name = fields.back();
  for (size_t i = 0; i + 1 < fields.size(); i++) {
    if (i == pid_column_)
      continue;
    std::optional<int64_t> value = ParseMemValue(fields[i]);
    if (!value) {
      BUGSIFT_DLOG("Skipping procrank line with invalid value %s: |%s|",
                   fields[i].c_str(), line.c_str());
      return;
    }
    row.stats_kb[columns_[i]] = *value;
  }
  procrank_.rows[*pid] = std::move(row);
}

void ProcrankParser::Commit(ItemList* items) {
  if (state_ == State::kUnseen) {
    BUGSIFT_DLOG("Procrank table without a header");
  } else {
    items->AddItem(std::move(procrank_));
  }
  // Get ready for the next table.
  procrank_ = ProcrankItem();
  state_ = State::kUnseen;
  columns_.clear();
  pid_column_ = 0;
}

}  // namespace parser
}  // namespace bugsift
