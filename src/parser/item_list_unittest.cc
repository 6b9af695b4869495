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

#include "bugsift/parser/item_list.h"

#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace parser {
namespace {

TEST(ItemListTest, GetItemsByType) {
  ItemList items;
  EXPECT_TRUE(items.empty());

  AnrItem anr;
  anr.app = "com.android.foo";
  items.AddItem(anr);
  items.AddItem(JavaCrashItem());
  items.AddItem(NativeCrashItem());
  items.AddItem(AnrItem());
  ASSERT_EQ(items.size(), 4u);

  base::Regex anrs("ANR");
  std::vector<const Item*> res = items.GetItemsByType(anrs);
  ASSERT_EQ(res.size(), 2u);
  EXPECT_EQ(std::get<AnrItem>(*res[0]).app, "com.android.foo");
  EXPECT_EQ(res[0], items.GetFirstItemByType(anrs));

  // The whole tag must match.
  EXPECT_EQ(items.GetItemsByType(base::Regex("CRASH")).size(), 0u);
  EXPECT_EQ(items.GetItemsByType(base::Regex(".* CRASH")).size(), 2u);
  EXPECT_EQ(items.GetFirstItemByType(base::Regex("PROCRANK")), nullptr);
}

TEST(ItemListTest, GetFirst) {
  ItemList items;
  EXPECT_EQ(items.GetFirst<MemInfoItem>(), nullptr);

  MemInfoItem first;
  first.values["MemTotal"] = 1;
  items.AddItem(SystemPropsItem());
  items.AddItem(first);
  items.AddItem(MemInfoItem());

  const MemInfoItem* mem_info = items.GetFirst<MemInfoItem>();
  ASSERT_NE(mem_info, nullptr);
  EXPECT_EQ(*mem_info, first);
}

}  // namespace
}  // namespace parser
}  // namespace bugsift
