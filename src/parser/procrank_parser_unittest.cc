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

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

using testing::ElementsAre;

const std::vector<std::string> kProcrank = {
    "  PID      Vss      Rss      Pss      Uss  cmdline",
    "  178   87136K   81684K   52829K   50012K  system_server",
    " 1313   78128K   77996K   48603K   45812K  com.google.android.apps.maps",
    " 3247   61652K   61492K   33122K   30972K  com.android.browser",
    "  334   55740K   55572K   29629K   28360K  com.android.launcher",
    " 2072   51348K   51172K   24263K   22812K  android.process.acore",
    " 1236   51440K   51312K   22911K   20608K  com.android.settings",
    "                 51312K   22911K   20608K  invalid.format",
    "                          ------   ------  ------",
    "                          203624K  163604K  TOTAL",
    "RAM: 731448K total, 415804K free, 9016K buffers, 108548K cached",
    "[procrank: 1.6s elapsed]",
};

TEST(ProcrankParserTest, ParseTable) {
  ProcrankItem procrank = ProcrankParser::Parse(kProcrank);

  // Only 6 of the rows under the header are valid.
  EXPECT_EQ(procrank.GetPids().size(), 6u);
  EXPECT_EQ(procrank.GetVss(178), 87136);
  EXPECT_EQ(procrank.GetRss(1313), 77996);
  EXPECT_EQ(procrank.GetPss(3247), 33122);
  EXPECT_EQ(procrank.GetUss(334), 28360);
  EXPECT_EQ(procrank.GetProcessName(2072), "android.process.acore");
  EXPECT_EQ(procrank.GetProcessName(1236), "com.android.settings");
  EXPECT_EQ(procrank.GetStat(178, "cmdline"), std::nullopt);
}

TEST(ProcrankParserTest, ParseIsRepeatable) {
  ProcrankItem first = ProcrankParser::Parse(kProcrank);
  ProcrankItem second = ProcrankParser::Parse(kProcrank);
  EXPECT_EQ(first, second);
  EXPECT_EQ(second.GetPids().size(), 6u);
}

TEST(ProcrankParserTest, RowsAfterTableEndAreIgnored) {
  ProcrankItem procrank = ProcrankParser::Parse({
      "  PID      Vss      Rss      Pss      Uss  cmdline",
      "  178   87136K   81684K   52829K   50012K  system_server",
      "                          ------   ------  ------",
      " 1313   78128K   77996K   48603K   45812K  com.google.android.apps.maps",
  });
  EXPECT_THAT(procrank.GetPids(), ElementsAre(178));
  EXPECT_EQ(procrank.GetProcessName(1313), std::nullopt);
}

TEST(ProcrankParserTest, ExtraColumnsAndSpacesInCmdline) {
  ProcrankItem procrank = ProcrankParser::Parse({
      "",
      "  PID       Vss      Rss      Pss      Uss     Swap    PSwap    USwap  "
      "ZSwap  cmdline",
      " 1190  142104K  104688K   69112K   64432K    8808K    8808K    8808K  "
      "  2942K  /system/bin/surfaceflinger --foo",
      "",
      "  abc  142104K  104688K   69112K   64432K    8808K    8808K    8808K  "
      "  2942K  bad_pid",
      "   12  142104K  104688K   69112K   64432K    8808Q    8808K    8808K  "
      "  2942K  bad_value",
  });
  EXPECT_THAT(procrank.GetPids(), ElementsAre(1190));
  EXPECT_EQ(procrank.GetProcessName(1190), "/system/bin/surfaceflinger --foo");
  EXPECT_EQ(procrank.GetStat(1190, "swap"), 8808);
  EXPECT_EQ(procrank.GetStat(1190, "zswap"), 2942);
}

TEST(ProcrankParserTest, PidColumnNotFirst) {
  ProcrankItem procrank = ProcrankParser::Parse({
      "Vss PID cmdline",
      "10M 42 foo",
  });
  EXPECT_THAT(procrank.GetPids(), ElementsAre(42));
  EXPECT_EQ(procrank.GetVss(42), 10240);
}

TEST(ProcrankParserTest, NoHeader) {
  ItemList items;
  ProcrankParser parser;
  parser.ParseBlock({"", "   "}, &items);
  EXPECT_TRUE(items.empty());
}

TEST(ProcrankParserTest, ParseMemValue) {
  EXPECT_EQ(ProcrankParser::ParseMemValue("87136K"), 87136);
  EXPECT_EQ(ProcrankParser::ParseMemValue("87136k"), 87136);
  EXPECT_EQ(ProcrankParser::ParseMemValue("1234"), 1234);
  EXPECT_EQ(ProcrankParser::ParseMemValue("2M"), 2048);
  EXPECT_EQ(ProcrankParser::ParseMemValue("1G"), 1024 * 1024);
  EXPECT_EQ(ProcrankParser::ParseMemValue("4096B"), 4);
  EXPECT_EQ(ProcrankParser::ParseMemValue(""), std::nullopt);
  EXPECT_EQ(ProcrankParser::ParseMemValue("K"), std::nullopt);
  EXPECT_EQ(ProcrankParser::ParseMemValue("12X"), std::nullopt);
  EXPECT_EQ(ProcrankParser::ParseMemValue("-12K"), std::nullopt);
  EXPECT_EQ(ProcrankParser::ParseMemValue("------"), std::nullopt);
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
