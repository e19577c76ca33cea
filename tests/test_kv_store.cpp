#include "minitest.hpp"
#include "store/KeyValueStore.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

using steward::store::FileKeyValueStore;
using steward::store::MemoryKeyValueStore;
namespace fs = std::filesystem;

static fs::path make_dir(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("steward_test_kv_") + tag + "_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(root, ec);
  return root;
}

TEST(memory_store_set_get_remove) {
  MemoryKeyValueStore kv;
  ASSERT_TRUE(!kv.get("a").has_value());
  ASSERT_TRUE(kv.set("a", "1"));
  ASSERT_EQ(kv.get("a").value_or(""), "1");
  ASSERT_TRUE(kv.set("a", "2"));
  ASSERT_EQ(kv.get("a").value_or(""), "2");
  ASSERT_EQ(kv.size(), 1u);
  ASSERT_TRUE(kv.remove("a"));
  ASSERT_TRUE(kv.remove("a"));
  ASSERT_EQ(kv.size(), 0u);
}

TEST(memory_store_write_failures) {
  MemoryKeyValueStore kv;
  ASSERT_TRUE(kv.set("keep", "x"));
  kv.fail_writes(true);
  ASSERT_TRUE(!kv.set("keep", "y"));
  ASSERT_TRUE(!kv.remove("keep"));
  ASSERT_EQ(kv.get("keep").value_or(""), "x");
}

TEST(file_store_persists_across_instances) {
  auto dir = make_dir("persist");
  {
    FileKeyValueStore kv(dir.string());
    ASSERT_TRUE(kv.set("launch_metrics", "line one\nline\ttwo\n"));
  }
  FileKeyValueStore again(dir.string());
  ASSERT_EQ(again.get("launch_metrics").value_or(""), "line one\nline\ttwo\n");
  ASSERT_TRUE(!fs::exists(dir / "launch_metrics.tmp"));
  ASSERT_TRUE(again.remove("launch_metrics"));
  ASSERT_TRUE(!again.get("launch_metrics").has_value());
  ASSERT_TRUE(again.remove("launch_metrics"));
  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(file_store_rejects_unsafe_keys) {
  auto dir = make_dir("keys");
  FileKeyValueStore kv(dir.string());
  ASSERT_TRUE(!kv.set("../escape", "x"));
  ASSERT_TRUE(!kv.set(".hidden", "x"));
  ASSERT_TRUE(!kv.set("", "x"));
  ASSERT_TRUE(!kv.set("a/b", "x"));
  ASSERT_TRUE(!kv.get("../escape").has_value());
  ASSERT_TRUE(kv.set("ok-key_1.v2", "x"));
  std::error_code ec;
  fs::remove_all(dir, ec);
}
