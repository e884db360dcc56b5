#pragma once

#include "fastlist/intrusive_list.h"
#include <compare>
#include <vector>

// Record ordered by key only; seq tells equal keys apart.
struct Item {
  int key;
  int seq = 0;
  FastList::Link<Item> link;
};

inline std::weak_ordering by_key(const Item &a, const Item &b) {
  return a.key <=> b.key;
}

using ItemList = FastList::List<Item>;

inline std::vector<int> keys_of(const ItemList &list) {
  std::vector<int> keys;
  for (const Item &item : list)
    keys.push_back(item.key);
  return keys;
}

inline std::vector<int> keys_reversed(const ItemList &list) {
  std::vector<int> keys;
  for (auto it = list.rbegin(); it != list.rend(); ++it)
    keys.push_back(it->key);
  return keys;
}
