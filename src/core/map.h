#pragma once

#include <parallel_hashmap/phmap.h>

template <class Key, class Value, class Hash = phmap::priv::hash_default_hash<Key>>
using Map = typename phmap::flat_hash_map<Key, Value, Hash>;
