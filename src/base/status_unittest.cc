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

#include "bugsift/base/status.h"

#include "bugsift/ext/base/status_macros.h"
#include "bugsift/ext/base/status_or.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace base {
namespace {

TEST(StatusTest, GetMissingPayload) {
  base::Status status = base::ErrStatus("Error");
  ASSERT_EQ(status.GetPayload("bugsift.dev/Foo"), std::nullopt);
}

TEST(StatusTest, SetThenGetPayload) {
  base::Status status = base::ErrStatus("Error");
  status.SetPayload("bugsift.dev/Foo", "ANR.app");
  ASSERT_EQ(status.GetPayload("bugsift.dev/Foo"), "ANR.app");
}

TEST(StatusTest, PayloadsAreKeyed) {
  base::Status status = base::ErrStatus("Error");
  status.SetPayload("bugsift.dev/Foo", "foo");
  status.SetPayload("bugsift.dev/Bar", "bar");
  ASSERT_EQ(status.GetPayload("bugsift.dev/Foo"), "foo");
  ASSERT_EQ(status.GetPayload("bugsift.dev/Bar"), "bar");

  // Payloads travel with copies of the status.
  base::Status copy = status;
  ASSERT_EQ(copy.GetPayload("bugsift.dev/Bar"), "bar");
}

TEST(StatusTest, SetOverride) {
  base::Status status = base::ErrStatus("Error");
  status.SetPayload("bugsift.dev/Foo", "payload_value");
  status.SetPayload("bugsift.dev/Foo", "other_value");
  ASSERT_EQ(status.GetPayload("bugsift.dev/Foo"), "other_value");
}

TEST(StatusTest, SetGetOk) {
  base::Status status = base::OkStatus();
  status.SetPayload("bugsift.dev/Foo", "payload_value");
  ASSERT_EQ(status.GetPayload("bugsift.dev/Foo"), std::nullopt);
}

TEST(StatusTest, FormatsMessage) {
  base::Status status = base::ErrStatus("Could not read %s: %d", "foo", 42);
  ASSERT_FALSE(status.ok());
  ASSERT_EQ(status.message(), "Could not read foo: 42");
}

TEST(StatusOrTest, IntOk) {
  base::StatusOr<int> int_or = 1;
  ASSERT_TRUE(int_or.ok());
  ASSERT_TRUE(int_or.status().ok());
  ASSERT_EQ(int_or.value(), 1);
  ASSERT_EQ(*int_or, 1);
}

TEST(StatusOrTest, VecOk) {
  base::StatusOr<std::vector<int>> vec_or({0, 1, 100});
  ASSERT_TRUE(vec_or.ok());
  ASSERT_EQ((*vec_or)[2], 100);
  ASSERT_EQ(vec_or->at(0), 0);
}

TEST(StatusOrTest, ErrStatus) {
  base::StatusOr<std::vector<int>> err(base::ErrStatus("Bad error"));
  ASSERT_FALSE(err.ok());
  ASSERT_FALSE(err.status().ok());
}

base::StatusOr<int> Half(int x) {
  if (x % 2)
    return base::ErrStatus("%d is odd", x);
  return x / 2;
}

base::StatusOr<int> Quarter(int x) {
  ASSIGN_OR_RETURN(int half, Half(x));
  ASSIGN_OR_RETURN(int quarter, Half(half));
  return quarter;
}

base::Status CheckEven(int x) {
  RETURN_IF_ERROR(Half(x).status());
  return base::OkStatus();
}

TEST(StatusMacrosTest, Propagate) {
  ASSERT_EQ(*Quarter(8), 2);
  base::StatusOr<int> res = Quarter(6);
  ASSERT_FALSE(res.ok());
  ASSERT_EQ(res.status().message(), "3 is odd");
  ASSERT_TRUE(CheckEven(2).ok());
  ASSERT_FALSE(CheckEven(3).ok());
}

}  // namespace
}  // namespace base
}  // namespace bugsift
