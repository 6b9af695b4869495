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

#include "src/parser/java_crash_parser.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

using testing::ElementsAre;

TEST(JavaCrashParserTest, Parse) {
  JavaCrashParser parser;
  std::optional<JavaCrashItem> crash = parser.Parse({
      "java.lang.Exception: This is the message",
      "\tat class.method1(Class.java:1)",
      "\tat class.method2(Class.java:2)",
      "\tat class.method3(Class.java:3)",
  });
  ASSERT_TRUE(crash.has_value());
  EXPECT_EQ(crash->exception, "java.lang.Exception");
  EXPECT_EQ(crash->message, "This is the message");
  EXPECT_EQ(crash->stack,
            "java.lang.Exception: This is the message\n"
            "\tat class.method1(Class.java:1)\n"
            "\tat class.method2(Class.java:2)\n"
            "\tat class.method3(Class.java:3)");
  EXPECT_TRUE(crash->cause_stacks.empty());
  EXPECT_FALSE(crash->app.has_value());
}

TEST(JavaCrashParserTest, NoMessage) {
  JavaCrashParser parser;
  std::optional<JavaCrashItem> crash =
      parser.Parse({"java.lang.NullPointerException", "\tat a.b(C.java:1)"});
  ASSERT_TRUE(crash.has_value());
  EXPECT_EQ(crash->exception, "java.lang.NullPointerException");
  EXPECT_FALSE(crash->message.has_value());
}

TEST(JavaCrashParserTest, FatalExceptionHeaderAndCauses) {
  JavaCrashParser parser;
  std::optional<JavaCrashItem> crash = parser.Parse({
      "FATAL EXCEPTION: main",
      "Process: com.android.package, PID: 3064",
      "java.lang.RuntimeException: Unable to start activity",
      "\tat android.app.ActivityThread.main(ActivityThread.java:1)",
      "Caused by: java.lang.IllegalStateException: bad state",
      "\tat com.android.package.Foo.bar(Foo.java:10)",
      "\t... 11 more",
      "Caused by: java.lang.NullPointerException",
      "\tat com.android.package.Foo.baz(Foo.java:20)",
  });
  ASSERT_TRUE(crash.has_value());
  EXPECT_EQ(crash->app, "com.android.package");
  EXPECT_EQ(crash->exception, "java.lang.RuntimeException");
  EXPECT_EQ(crash->message, "Unable to start activity");
  EXPECT_EQ(crash->stack,
            "java.lang.RuntimeException: Unable to start activity\n"
            "\tat android.app.ActivityThread.main(ActivityThread.java:1)");
  EXPECT_THAT(
      crash->cause_stacks,
      ElementsAre("Caused by: java.lang.IllegalStateException: bad state\n"
                  "\tat com.android.package.Foo.bar(Foo.java:10)\n"
                  "\t... 11 more",
                  "Caused by: java.lang.NullPointerException\n"
                  "\tat com.android.package.Foo.baz(Foo.java:20)"));
}

TEST(JavaCrashParserTest, NoException) {
  JavaCrashParser parser;
  EXPECT_FALSE(parser.Parse({"FATAL EXCEPTION: main"}).has_value());
  EXPECT_FALSE(parser.Parse({}).has_value());
}

TEST(JavaCrashParserTest, IsCrashStart) {
  JavaCrashParser parser;
  EXPECT_TRUE(parser.IsCrashStart("FATAL EXCEPTION: main"));
  EXPECT_FALSE(parser.IsCrashStart("java.lang.Exception"));
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
