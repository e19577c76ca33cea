#pragma once
// Approximate serialized size of cache values, in bytes. Strings count their
// quotes, containers their brackets and separators.
#include <charconv>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace steward::governor {

inline uint64_t estimate_size(std::string_view s) { return s.size() + 2; }
inline uint64_t estimate_size(const std::string& s) { return s.size() + 2; }
inline uint64_t estimate_size(const char* s) { return s ? std::strlen(s) + 2 : 4; }
inline uint64_t estimate_size(bool b) { return b ? 4 : 5; }

template <class T>
  requires std::is_arithmetic_v<T>
uint64_t estimate_size(T v) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  return ec == std::errc{} ? static_cast<uint64_t>(ptr - buf) : sizeof(T);
}

template <class T>
uint64_t estimate_size(const std::vector<T>& v) {
  uint64_t n = 2;
  for (const auto& e : v) n += estimate_size(e);
  if (v.size() > 1) n += v.size() - 1;
  return n;
}

template <class K, class V>
uint64_t estimate_size(const std::map<K, V>& m) {
  uint64_t n = 2;
  for (const auto& [k, v] : m) n += estimate_size(k) + 1 + estimate_size(v);
  if (m.size() > 1) n += m.size() - 1;
  return n;
}

template <class K, class V>
uint64_t estimate_size(const std::unordered_map<K, V>& m) {
  uint64_t n = 2;
  for (const auto& [k, v] : m) n += estimate_size(k) + 1 + estimate_size(v);
  if (m.size() > 1) n += m.size() - 1;
  return n;
}

// Types that know their own footprint expose 'uint64_t cache_size() const'.
template <class T>
  requires requires(const T& t) { { t.cache_size() } -> std::convertible_to<uint64_t>; }
uint64_t estimate_size(const T& v) {
  return v.cache_size();
}

} // namespace steward::governor
