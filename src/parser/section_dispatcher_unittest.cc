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

#include <memory>

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

using testing::ElementsAre;
using testing::IsEmpty;

// Records every block it is handed.
class RecordingParser : public BlockParser {
 public:
  explicit RecordingParser(std::vector<std::vector<std::string>>* blocks)
      : blocks_(blocks) {}
  ~RecordingParser() override = default;

  void ParseBlock(const std::vector<std::string>& lines, ItemList*) override {
    blocks_->push_back(lines);
  }

 private:
  std::vector<std::vector<std::string>>* blocks_;
};

class CountingDispatcher : public SectionDispatcher {
 public:
  using SectionDispatcher::SectionDispatcher;

  int switches() const { return switches_; }

 protected:
  void OnSwitchParser(ItemList*) override { switches_++; }

 private:
  int switches_ = 0;
};

void Feed(LineParser* parser, const std::vector<std::string>& lines) {
  ItemList items;
  for (const std::string& line : lines)
    parser->ParseLine(line, &items);
  parser->Commit(&items);
}

TEST(SectionDispatcherTest, InvalidHeaderPattern) {
  SectionDispatcher dispatcher;
  base::Status status = dispatcher.AddSectionParser(
      "------ (FOO", std::make_unique<NoopSectionParser>());
  EXPECT_FALSE(status.ok());
}

TEST(SectionDispatcherTest, SplitsSections) {
  std::vector<std::vector<std::string>> initial;
  std::vector<std::vector<std::string>> foo;
  std::vector<std::vector<std::string>> bar;
  CountingDispatcher dispatcher(std::make_unique<RecordingParser>(&initial));
  ASSERT_TRUE(dispatcher
                  .AddSectionParser("------ FOO .*",
                                    std::make_unique<RecordingParser>(&foo))
                  .ok());
  ASSERT_TRUE(dispatcher
                  .AddSectionParser("------ BAR .*",
                                    std::make_unique<RecordingParser>(&bar))
                  .ok());
  ASSERT_TRUE(dispatcher
                  .AddSectionParser("------ .*",
                                    std::make_unique<NoopSectionParser>())
                  .ok());

  Feed(&dispatcher, {
                        "header 1",
                        "header 2",
                        "------ FOO (foo) ------",
                        "foo 1",
                        "------ UNKNOWN ------",
                        "dropped",
                        "------ BAR (bar) ------",
                        "bar 1",
                        "bar 2",
                        "------ FOO (foo) ------",
                        "foo 2",
                    });

  EXPECT_THAT(initial, ElementsAre(ElementsAre("header 1", "header 2")));
  EXPECT_THAT(foo, ElementsAre(ElementsAre("foo 1"), ElementsAre("foo 2")));
  EXPECT_THAT(bar, ElementsAre(ElementsAre("bar 1", "bar 2")));
  EXPECT_EQ(dispatcher.switches(), 4);
}

TEST(SectionDispatcherTest, FirstMatchingPatternWins) {
  std::vector<std::vector<std::string>> generic;
  std::vector<std::vector<std::string>> specific;
  SectionDispatcher dispatcher;
  ASSERT_TRUE(dispatcher
                  .AddSectionParser("------ .*",
                                    std::make_unique<RecordingParser>(&generic))
                  .ok());
  ASSERT_TRUE(
      dispatcher
          .AddSectionParser("------ FOO .*",
                            std::make_unique<RecordingParser>(&specific))
          .ok());

  Feed(&dispatcher, {"------ FOO ------", "foo"});
  EXPECT_THAT(generic, ElementsAre(ElementsAre("foo")));
  EXPECT_THAT(specific, IsEmpty());
}

TEST(SectionDispatcherTest, NoHeaders) {
  std::vector<std::vector<std::string>> initial;
  CountingDispatcher dispatcher(std::make_unique<RecordingParser>(&initial));
  Feed(&dispatcher, {"a", "b"});
  EXPECT_THAT(initial, ElementsAre(ElementsAre("a", "b")));
  EXPECT_EQ(dispatcher.switches(), 0);
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
