#pragma once

#include <ankerl/unordered_dense.h>

namespace waypoint::core {

// Hash container aliases backed by ankerl::unordered_dense.
// Dense storage, vector-like iteration, iterators invalidated on insertion.
//
// Usage:
//   waypoint::core::fast_map<std::string, int> counts;
//   waypoint::core::fast_set<std::string> touched_ids;
//
// Iteration order is insertion order while nothing is erased; code that emits
// documents must not rely on it and sorts explicitly instead.

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace waypoint::core
