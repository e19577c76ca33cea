#include "minitest.hpp"
#include "test_doubles.hpp"
#include "governor/LruCache.hpp"
#include "governor/ObjectPools.hpp"
#include "governor/SizeEstimate.hpp"

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

using steward::governor::LruCache;
using steward::governor::ObjectPools;
using steward::governor::estimate_size;

static constexpr uint64_t MiB = 1024ull * 1024ull;

TEST(cache_evicts_least_recently_used_to_fit) {
  LruCache c(50 * MiB);
  ASSERT_TRUE(c.put("a", std::string("first"), 40 * MiB));
  ASSERT_TRUE(c.put("b", std::string("second"), 20 * MiB));
  ASSERT_TRUE(!c.contains("a"));
  ASSERT_TRUE(c.contains("b"));
  ASSERT_EQ(c.total_bytes(), 20 * MiB);
  ASSERT_EQ(c.stats().evictions, 1u);
}

TEST(cache_access_protects_entry_from_eviction) {
  LruCache c(100);
  ASSERT_TRUE(c.put("a", 1, 40));
  ASSERT_TRUE(c.put("b", 2, 40));
  ASSERT_TRUE(c.get("a").has_value());
  ASSERT_TRUE(c.put("c", 3, 40));
  ASSERT_TRUE(c.contains("a"));
  ASSERT_TRUE(!c.contains("b"));
  ASSERT_TRUE(c.contains("c"));
  ASSERT_TRUE(c.total_bytes() <= 100);
}

TEST(cache_rejects_entry_larger_than_budget) {
  steward::testing::LogCapture logs;
  LruCache c(10 * MiB);
  ASSERT_TRUE(c.put("keep", 7, 1 * MiB));
  ASSERT_TRUE(!c.put("huge", 8, 11 * MiB));
  ASSERT_TRUE(c.contains("keep"));
  ASSERT_TRUE(!c.contains("huge"));
  ASSERT_EQ(c.total_bytes(), 1 * MiB);
  ASSERT_EQ(logs.count(steward::util::LogLevel::Warn, "exceeds the cache budget"), 1u);
}

TEST(cache_reinsert_replaces_and_releases_old_size) {
  LruCache c(100);
  ASSERT_TRUE(c.put("k", 1, 60));
  ASSERT_TRUE(c.put("k", 2, 30));
  ASSERT_EQ(c.size(), 1u);
  ASSERT_EQ(c.total_bytes(), 30u);
  auto v = c.get("k");
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(std::any_cast<int>(*v), 2);
  // Replacing with a larger value must not evict anything else needlessly.
  ASSERT_TRUE(c.put("other", 3, 60));
  ASSERT_TRUE(c.put("k", 4, 40));
  ASSERT_TRUE(c.contains("other"));
  ASSERT_EQ(c.total_bytes(), 100u);
}

TEST(cache_ttl_expiry_counts_misses) {
  LruCache c(1000);
  ASSERT_TRUE(c.put("t", std::string("v"), 10, std::chrono::milliseconds(20)));
  ASSERT_TRUE(c.get("t").has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  ASSERT_TRUE(!c.get("t").has_value());
  ASSERT_TRUE(!c.get("t").has_value());
  auto st = c.stats();
  ASSERT_EQ(st.hits, 1u);
  ASSERT_EQ(st.misses, 2u);
  ASSERT_EQ(st.entry_count, 0u);
  ASSERT_EQ(st.total_size_bytes, 0u);
  ASSERT_NEAR(st.hit_rate_pct, 100.0 / 3.0, 1e-9);
}

TEST(cache_shrink_by_fraction_and_clear) {
  LruCache c(1000);
  for (int i = 0; i < 10; ++i) ASSERT_TRUE(c.put("k" + std::to_string(i), i, 50));
  ASSERT_EQ(c.total_bytes(), 500u);
  uint64_t freed = c.shrink_by(0.3);
  ASSERT_EQ(freed, 150u);
  ASSERT_EQ(c.total_bytes(), 350u);
  ASSERT_TRUE(!c.contains("k0"));
  ASSERT_TRUE(!c.contains("k2"));
  ASSERT_TRUE(c.contains("k3"));
  ASSERT_EQ(c.clear(), 350u);
  ASSERT_EQ(c.size(), 0u);
}

TEST(cache_stats_empty_has_zero_ages) {
  LruCache c(1000);
  auto st = c.stats();
  ASSERT_EQ(st.entry_count, 0u);
  ASSERT_EQ(st.oldest_entry_ms, 0);
  ASSERT_EQ(st.hit_rate_pct, 0.0);
  ASSERT_EQ(st.budget_bytes, 1000u);
}

namespace {
struct Blob {
  uint64_t bytes;
  uint64_t cache_size() const { return bytes; }
};
} // namespace

TEST(size_estimate_matches_serialized_form) {
  ASSERT_EQ(estimate_size(std::string("abc")), 5u);   // "abc"
  ASSERT_EQ(estimate_size(42), 2u);
  ASSERT_EQ(estimate_size(-1.5), 4u);
  ASSERT_EQ(estimate_size(true), 4u);
  ASSERT_EQ(estimate_size(false), 5u);
  ASSERT_EQ(estimate_size(std::vector<int>{1, 22, 333}), 10u); // [1,22,333]
  std::map<std::string, int> m{{"a", 1}, {"b", 2}};
  ASSERT_EQ(estimate_size(m), 13u); // {"a":1,"b":2}
  ASSERT_EQ(estimate_size(Blob{4096}), 4096u);
}

TEST(object_pool_reuses_released_objects) {
  ObjectPools pools;
  int made = 0;
  auto factory = [&] { ++made; return std::vector<int>(16); };
  auto a = pools.acquire<std::vector<int>>("buffers", factory);
  ASSERT_EQ(made, 1);
  auto* raw = a.get();
  ASSERT_TRUE(pools.release("buffers", a));
  ASSERT_EQ(pools.pooled("buffers"), 1u);
  auto b = pools.acquire<std::vector<int>>("buffers", factory);
  ASSERT_EQ(made, 1);
  ASSERT_TRUE(b.get() == raw);
  ASSERT_EQ(pools.pooled("buffers"), 0u);
}

TEST(object_pool_caps_at_limit_and_clears) {
  ObjectPools pools;
  for (size_t i = 0; i < ObjectPools::kMaxPooled; ++i)
    ASSERT_TRUE(pools.release("ints", std::make_shared<int>(static_cast<int>(i))));
  ASSERT_TRUE(!pools.release("ints", std::make_shared<int>(-1)));
  ASSERT_EQ(pools.pooled("ints"), ObjectPools::kMaxPooled);
  // Another type under the same name is refused.
  ASSERT_TRUE(!pools.release("ints", std::make_shared<double>(1.0)));
  pools.clear("ints");
  ASSERT_EQ(pools.pooled("ints"), 0u);
  ASSERT_EQ(pools.pooled("missing"), 0u);
}

TEST(object_pool_factory_may_return_shared_ptr) {
  ObjectPools pools;
  auto p = pools.acquire<std::string>("s", [] { return std::make_shared<std::string>("x"); });
  ASSERT_EQ(*p, "x");
}
