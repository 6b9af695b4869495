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

namespace bugsift {
namespace parser {

ItemList::ItemList() = default;
ItemList::~ItemList() = default;
ItemList::ItemList(ItemList&&) noexcept = default;
ItemList& ItemList::operator=(ItemList&&) noexcept = default;

void ItemList::AddItem(Item item) {
  items_.emplace_back(std::move(item));
}

std::vector<const Item*> ItemList::GetItemsByType(
    const base::Regex& type_regex) const {
  std::vector<const Item*> res;
  for (const Item& item : items_) {
    if (type_regex.FullMatch(GetItemType(item)))
      res.push_back(&item);
  }
  return res;
}

const Item* ItemList::GetFirstItemByType(const base::Regex& type_regex) const {
  for (const Item& item : items_) {
    if (type_regex.FullMatch(GetItemType(item)))
      return &item;
  }
  return nullptr;
}

}  // namespace parser
}  // namespace bugsift
