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

#include "src/parser/native_crash_parser.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

constexpr char kMarker[] =
    "*** *** *** *** *** *** *** *** *** *** *** *** *** *** *** ***";

TEST(NativeCrashParserTest, Parse) {
  NativeCrashParser parser;
  std::optional<NativeCrashItem> crash = parser.Parse({
      kMarker,
      "Build fingerprint: 'product:build:target'",
      "pid: 3112, tid: 3112  >>> com.google.android.browser <<<",
      "signal 11 (SIGSEGV), code 1 (SEGV_MAPERR), fault addr 00000000",
  });
  ASSERT_TRUE(crash.has_value());
  EXPECT_EQ(crash->fingerprint, "product:build:target");
  EXPECT_EQ(crash->app, "com.google.android.browser");
  EXPECT_EQ(crash->stack,
            std::string(kMarker) +
                "\n"
                "Build fingerprint: 'product:build:target'\n"
                "pid: 3112, tid: 3112  >>> com.google.android.browser <<<\n"
                "signal 11 (SIGSEGV), code 1 (SEGV_MAPERR), fault addr "
                "00000000");
}

TEST(NativeCrashParserTest, NamedThreadVariant) {
  NativeCrashParser parser;
  std::optional<NativeCrashItem> crash = parser.Parse({
      kMarker,
      "pid: 1234, tid: 1250, name: RenderThread  >>> com.android.systemui <<<",
  });
  ASSERT_TRUE(crash.has_value());
  EXPECT_EQ(crash->app, "com.android.systemui");
  EXPECT_FALSE(crash->fingerprint.has_value());
}

TEST(NativeCrashParserTest, NewMarkerRestarts) {
  NativeCrashParser parser;
  std::optional<NativeCrashItem> crash = parser.Parse({
      "garbage before the marker",
      kMarker,
      "Build fingerprint: 'first'",
      kMarker,
      "pid: 1, tid: 1  >>> /system/bin/foo <<<",
  });
  ASSERT_TRUE(crash.has_value());
  EXPECT_FALSE(crash->fingerprint.has_value());
  EXPECT_EQ(crash->app, "/system/bin/foo");
  EXPECT_EQ(crash->stack,
            std::string(kMarker) + "\npid: 1, tid: 1  >>> /system/bin/foo <<<");
}

TEST(NativeCrashParserTest, NoMarker) {
  NativeCrashParser parser;
  EXPECT_FALSE(parser.Parse({"Build fingerprint: 'x'"}).has_value());
  EXPECT_TRUE(parser.IsCrashStart(kMarker));
  EXPECT_FALSE(parser.IsCrashStart("*** ***"));
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
