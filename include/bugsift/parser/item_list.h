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

#ifndef INCLUDE_BUGSIFT_PARSER_ITEM_LIST_H_
#define INCLUDE_BUGSIFT_PARSER_ITEM_LIST_H_

#include <vector>

#include "bugsift/ext/base/regex.h"
#include "bugsift/parser/items.h"

namespace bugsift {
namespace parser {

// Ordered, append-only collection of items. Parsers push their output here.
class ItemList {
 public:
  ItemList();
  ~ItemList();

  ItemList(ItemList&&) noexcept;
  ItemList& operator=(ItemList&&) noexcept;

  void AddItem(Item item);

  const std::vector<Item>& items() const { return items_; }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

  // Returns all the items whose type tag fully matches |type_regex|, in
  // insertion order.
  std::vector<const Item*> GetItemsByType(const base::Regex& type_regex) const;

  // Returns the first item whose type tag fully matches |type_regex| or
  // nullptr.
  const Item* GetFirstItemByType(const base::Regex& type_regex) const;

  // Returns the first item holding a T or nullptr.
  template <typename T>
  const T* GetFirst() const {
    for (const Item& item : items_) {
      if (const T* t = std::get_if<T>(&item))
        return t;
    }
    return nullptr;
  }

 private:
  ItemList(const ItemList&) = delete;
  ItemList& operator=(const ItemList&) = delete;

  std::vector<Item> items_;
};

}  // namespace parser
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_PARSER_ITEM_LIST_H_
