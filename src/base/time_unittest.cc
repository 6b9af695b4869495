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

#include "bugsift/base/time.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace base {
namespace {

TEST(TimeTest, MkTime) {
  EXPECT_EQ(MkTime(1970, 1, 1, 0, 0, 0), 0);
  // 2012-04-25 20:45:10 UTC.
  EXPECT_EQ(MkTime(2012, 4, 25, 20, 45, 10), 1335386710);
  // Leap day.
  EXPECT_EQ(MkTime(2012, 2, 29, 0, 0, 0), MkTime(2012, 3, 1, 0, 0, 0) - 86400);
}

TEST(TimeTest, GetYear) {
  EXPECT_EQ(GetYear(0), 1970);
  EXPECT_EQ(GetYear(MkTime(1999, 12, 31, 23, 59, 59)), 1999);
  EXPECT_EQ(GetYear(MkTime(2000, 1, 1, 0, 0, 0)), 2000);
  EXPECT_GE(GetCurrentYear(), 2024);
}

TEST(TimeTest, WallTime) {
  TimeMillis ms = GetWallTimeMs();
  TimeNanos ns = GetWallTimeNs();
  EXPECT_NEAR(static_cast<double>(ms.count()),
              static_cast<double>(ns.count()) / 1000000, 1000);
}

}  // namespace
}  // namespace base
}  // namespace bugsift
