#pragma once

#include <bytell_hash_map.hpp>
#include <functional>
#include <memory>
#include <utility>

namespace routemap {

template <typename K, typename V, typename H = std::hash<K>, typename E = std::equal_to<K>,
          typename A = std::allocator<std::pair<K, V> > >
using flat_hash_map = ska::bytell_hash_map<K, V, H, E, A>;

template <typename K, typename H = std::hash<K>, typename E = std::equal_to<K>, typename A = std::allocator<K> >
using flat_hash_set = ska::bytell_hash_set<K, H, E, A>;

}  // namespace routemap
