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

#include "src/parser/bugreport_parser.h"

#include <memory>
#include <utility>
#include <variant>

#include "bugsift/base/logging.h"
#include "bugsift/base/time.h"
#include "bugsift/ext/base/regex.h"
#include "src/parser/logcat_parser.h"
#include "src/parser/parser_utils.h"
#include "src/parser/procrank_parser.h"
#include "src/parser/section_parsers.h"

namespace bugsift {
namespace parser {

namespace {

constexpr char kMemInfoSection[] = "------ MEMORY INFO .*";
constexpr char kProcrankSection[] = "------ PROCRANK .*";
constexpr char kSystemPropsSection[] = "------ SYSTEM PROPERTIES .*";
constexpr char kAnrTracesSection[] = "------ VM TRACES AT LAST ANR .*";
constexpr char kSystemLogSection[] = "------ (?:SYSTEM|MAIN) LOG .*";
constexpr char kNoopSection[] = "------ .*";

// == dumpstate: 2012-04-26 12:13:14
constexpr char kDatePattern[] =
    "^== dumpstate: (\\d{4})-(\\d{2})-(\\d{2}) "
    "(\\d{2}):(\\d{2}):(\\d{2})$";

// Parses the lines preceding the first section header.
class DumpstateHeaderParser : public BlockParser {
 public:
  DumpstateHeaderParser() : date_line_(CompileBuiltinRegex(kDatePattern)) {}
  ~DumpstateHeaderParser() override;

  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) override {
    BugreportItem bugreport;
    std::vector<std::string_view> groups;
    for (const std::string& line : lines) {
      if (!date_line_.FullMatch(line, &groups))
        continue;
      int fields[6];
      for (size_t i = 0; i < 6; i++)
        fields[i] = GroupToInt32(groups[i + 1]).value_or(0);
      bugreport.time_ms = base::MkTime(fields[0], fields[1], fields[2],
                                       fields[3], fields[4], fields[5]) *
                          1000;
    }
    items->AddItem(std::move(bugreport));
  }

 private:
  base::Regex date_line_;
};

DumpstateHeaderParser::~DumpstateHeaderParser() = default;

// Attaches |trace| to the most recent ANR of |app|.
void AddAnrTrace(LogcatItem* logcat,
                 const std::string& app,
                 const std::string& trace) {
  std::vector<AnrItem*> anrs = logcat->GetMutableAnrs();
  for (auto it = anrs.rbegin(); it != anrs.rend(); ++it) {
    AnrItem* anr = *it;
    if (anr->app != app)
      continue;
    AnrItem traced;
    traced.trace = trace;
    base::StatusOr<AnrItem> merged = MergeItems(*anr, traced);
    if (!merged.ok()) {
      BUGSIFT_LOG("Not attaching the ANR trace of %s: %s", app.c_str(),
                  merged.status().c_message());
      return;
    }
    *anr = std::move(merged.value());
    return;
  }
  BUGSIFT_DLOG("No ANR matches the trace of %s", app.c_str());
}

void SetAppsFromProcrank(LogcatItem* logcat, const ProcrankItem& procrank) {
  for (LogcatEvent& event : logcat->events) {
    std::visit(
        [&procrank](GenericLogcatItem& item) {
          if (item.app || !item.pid)
            return;
          item.app = procrank.GetProcessName(*item.pid);
        },
        event);
  }
}

}  // namespace

// A LogcatParser is single use, so a fresh one parses each system log
// section, using the year of the dumpstate header when known.
class LogcatSectionParser : public BlockParser {
 public:
  explicit LogcatSectionParser(const Config& config) : config_(config) {}
  ~LogcatSectionParser() override;

  void set_year(int year) { year_ = year; }

  void ParseBlock(const std::vector<std::string>& lines,
                  ItemList* items) override {
    LogcatParser parser(config_);
    if (year_)
      parser.set_year(*year_);
    parser.ParseBlock(lines, items);
  }

 private:
  const Config config_;
  std::optional<int> year_;
};

LogcatSectionParser::~LogcatSectionParser() = default;

BugreportParser::BugreportParser(const Config& config)
    : SectionDispatcher(std::make_unique<DumpstateHeaderParser>()) {
  std::unique_ptr<LogcatSectionParser> logcat(new LogcatSectionParser(config));
  logcat_section_ = logcat.get();

  BUGSIFT_CHECK(
      AddSectionParser(kMemInfoSection, std::make_unique<MemInfoParser>())
          .ok());
  BUGSIFT_CHECK(
      AddSectionParser(kProcrankSection, std::make_unique<ProcrankParser>())
          .ok());
  BUGSIFT_CHECK(AddSectionParser(kSystemPropsSection,
                                 std::make_unique<SystemPropsParser>())
                    .ok());
  BUGSIFT_CHECK(
      AddSectionParser(kAnrTracesSection, std::make_unique<TracesParser>())
          .ok());
  BUGSIFT_CHECK(AddSectionParser(kSystemLogSection, std::move(logcat)).ok());
  BUGSIFT_CHECK(
      AddSectionParser(kNoopSection, std::make_unique<NoopSectionParser>())
          .ok());
}

BugreportParser::~BugreportParser() = default;

// static
BugreportItem BugreportParser::Parse(const std::vector<std::string>& lines,
                                     const Config& config) {
  BugreportParser parser(config);
  ItemList items;
  for (const std::string& line : lines)
    parser.ParseLine(line, &items);
  parser.Commit(&items);
  const BugreportItem* bugreport = items.GetFirst<BugreportItem>();
  BUGSIFT_CHECK(bugreport);
  return *bugreport;
}

void BugreportParser::ParseLine(const std::string& line, ItemList*) {
  BUGSIFT_DCHECK(!committed_);
  SectionDispatcher::ParseLine(line, &sections_);
}

void BugreportParser::OnSwitchParser(ItemList* items) {
  if (header_parsed_)
    return;
  header_parsed_ = true;
  const BugreportItem* header = items->GetFirst<BugreportItem>();
  if (header && header->time_ms)
    logcat_section_->set_year(base::GetYear(*header->time_ms / 1000));
}

void BugreportParser::Commit(ItemList* items) {
  BUGSIFT_DCHECK(!committed_);
  committed_ = true;
  SectionDispatcher::Commit(&sections_);
  items->AddItem(Assemble());
}

BugreportItem BugreportParser::Assemble() const {
  BugreportItem bugreport;
  if (const BugreportItem* header = sections_.GetFirst<BugreportItem>())
    bugreport.time_ms = header->time_ms;
  if (const MemInfoItem* mem_info = sections_.GetFirst<MemInfoItem>())
    bugreport.mem_info = *mem_info;
  if (const ProcrankItem* procrank = sections_.GetFirst<ProcrankItem>())
    bugreport.procrank = *procrank;
  if (const SystemPropsItem* props = sections_.GetFirst<SystemPropsItem>())
    bugreport.system_props = *props;
  if (const LogcatItem* logcat = sections_.GetFirst<LogcatItem>())
    bugreport.system_log = *logcat;

  if (!bugreport.system_log)
    return bugreport;

  if (bugreport.procrank)
    SetAppsFromProcrank(&*bugreport.system_log, *bugreport.procrank);

  const TracesItem* traces = sections_.GetFirst<TracesItem>();
  if (traces && traces->app && traces->stack)
    AddAnrTrace(&*bugreport.system_log, *traces->app, *traces->stack);
  return bugreport;
}

}  // namespace parser
}  // namespace bugsift
