#include "governor/LruCache.hpp"
#include "util/Log.hpp"
#include "util/Time.hpp"

#include <algorithm>
#include <vector>

namespace steward::governor {

LruCache::LruCache(uint64_t budget_bytes) : budget_bytes_(budget_bytes) {}

bool LruCache::put(const std::string& key, std::any value, uint64_t size_bytes,
                   std::optional<std::chrono::milliseconds> ttl) {
  if (size_bytes > budget_bytes_) {
    util::log_warn("Cache", "entry '%s' (%llu bytes) exceeds the cache budget (%llu bytes), rejected",
                   key.c_str(), static_cast<unsigned long long>(size_bytes),
                   static_cast<unsigned long long>(budget_bytes_));
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = slots_.find(key); it != slots_.end()) {
    total_bytes_ -= it->second.size_bytes;
    slots_.erase(it);
  }
  if (total_bytes_ + size_bytes > budget_bytes_) {
    (void)evict_lru_locked(total_bytes_ + size_bytes - budget_bytes_);
  }
  Slot s;
  s.value = std::move(value);
  s.size_bytes = size_bytes;
  s.inserted_ms = util::wall_ms();
  s.inserted_at = std::chrono::steady_clock::now();
  s.last_access_tick = ++tick_;
  s.last_accessed_ms = s.inserted_ms;
  s.ttl = ttl;
  slots_[key] = std::move(s);
  total_bytes_ += size_bytes;
  return true;
}

std::optional<std::any> LruCache::get(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end()) {
    ++misses_;
    return std::nullopt;
  }
  Slot& s = it->second;
  if (s.ttl && std::chrono::steady_clock::now() - s.inserted_at > *s.ttl) {
    total_bytes_ -= s.size_bytes;
    slots_.erase(it);
    ++misses_;
    return std::nullopt;
  }
  ++s.access_count;
  s.last_access_tick = ++tick_;
  s.last_accessed_ms = util::wall_ms();
  ++hits_;
  return s.value;
}

bool LruCache::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end()) return false;
  total_bytes_ -= it->second.size_bytes;
  slots_.erase(it);
  return true;
}

uint64_t LruCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  uint64_t freed = total_bytes_;
  slots_.clear();
  total_bytes_ = 0;
  util::log_info("Cache", "cleared: %.1fMB freed", static_cast<double>(freed) / (1024.0 * 1024.0));
  return freed;
}

uint64_t LruCache::shrink_by(double fraction) {
  fraction = std::clamp(fraction, 0.0, 1.0);
  std::lock_guard<std::mutex> lk(mu_);
  auto target = static_cast<uint64_t>(static_cast<double>(total_bytes_) * fraction);
  if (target == 0) return 0;
  return evict_lru_locked(target);
}

uint64_t LruCache::evict_lru_locked(uint64_t bytes_needed) {
  std::vector<std::pair<uint64_t, std::string>> order;
  order.reserve(slots_.size());
  for (const auto& [k, s] : slots_) order.emplace_back(s.last_access_tick, k);
  std::sort(order.begin(), order.end());

  uint64_t freed = 0;
  size_t evicted = 0;
  for (const auto& [tick, k] : order) {
    if (freed >= bytes_needed) break;
    auto it = slots_.find(k);
    freed += it->second.size_bytes;
    total_bytes_ -= it->second.size_bytes;
    slots_.erase(it);
    ++evicted;
    ++evictions_;
  }
  if (evicted > 0)
    util::log_debug("Cache", "evicted %zu entries, freed %.1fKB", evicted, static_cast<double>(freed) / 1024.0);
  return freed;
}

model::CacheStats LruCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  model::CacheStats st;
  st.total_size_bytes = total_bytes_;
  st.budget_bytes = budget_bytes_;
  st.entry_count = slots_.size();
  st.hits = hits_;
  st.misses = misses_;
  st.evictions = evictions_;
  uint64_t requests = hits_ + misses_;
  st.hit_rate_pct = requests > 0 ? static_cast<double>(hits_) / static_cast<double>(requests) * 100.0 : 0.0;
  if (!slots_.empty()) {
    int64_t oldest = INT64_MAX, newest = INT64_MIN;
    for (const auto& [k, s] : slots_) {
      oldest = std::min(oldest, s.inserted_ms);
      newest = std::max(newest, s.inserted_ms);
    }
    int64_t now = util::wall_ms();
    st.oldest_entry_ms = oldest;
    st.newest_entry_ms = newest;
    st.oldest_entry_age_ms = std::max<int64_t>(0, now - oldest);
    st.newest_entry_age_ms = std::max<int64_t>(0, now - newest);
  }
  return st;
}

uint64_t LruCache::total_bytes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return total_bytes_;
}

size_t LruCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.size();
}

bool LruCache::contains(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.count(key) != 0;
}

} // namespace steward::governor
