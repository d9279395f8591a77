#pragma once

#include <algorithm>
#include <vector>

namespace agirace::util {

// unordered_map iteration order is unspecified. Everything that consumes RNG
// draws or writes log lines while walking a map goes through sorted keys so
// the same inputs always replay the same way.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

template <typename T>
inline bool contains(const std::vector<T>& v, const T& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

// Set-like append for vectors that keep insertion order. Returns false if already present.
template <typename T>
inline bool push_unique(std::vector<T>& v, const T& x) {
  if (contains(v, x)) return false;
  v.push_back(x);
  return true;
}

} // namespace agirace::util
