#pragma once

#include <ankerl/unordered_dense.h>

namespace gangway::core {

// Dense open-addressing hash containers (ankerl::unordered_dense).
// Iterators are invalidated on insertion, like std::vector.
//
// Usage:
//   gangway::core::fast_map<std::string_view, std::string_view> mime_types;
//   gangway::core::fast_map<uint64_t, std::string> sessions;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace gangway::core
