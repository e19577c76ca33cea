#pragma once
// Opaque string blob persistence.
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace steward::store {

class IKeyValueStore {
public:
  virtual ~IKeyValueStore() = default;
  [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;
  [[nodiscard]] virtual bool set(const std::string& key, const std::string& value) = 0;
  [[nodiscard]] virtual bool remove(const std::string& key) = 0; // true when nothing remains stored
  [[nodiscard]] virtual const char* name() const = 0;
};

class MemoryKeyValueStore : public IKeyValueStore {
public:
  std::optional<std::string> get(const std::string& key) override;
  bool set(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;
  const char* name() const override { return "memory"; }

  [[nodiscard]] size_t size() const;

#ifdef STEWARD_TESTING
  // Make subsequent set/remove calls fail (simulates a full or read-only store).
  void fail_writes(bool on) { std::lock_guard<std::mutex> lk(mu_); fail_writes_ = on; }
#endif

private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> data_;
  bool fail_writes_{false};
};

// One file per key under a directory; writes go to "<key>.tmp" then rename.
// Keys are restricted to [A-Za-z0-9_.-].
class FileKeyValueStore : public IKeyValueStore {
public:
  explicit FileKeyValueStore(std::string dir);

  std::optional<std::string> get(const std::string& key) override;
  bool set(const std::string& key, const std::string& value) override;
  bool remove(const std::string& key) override;
  const char* name() const override { return "file"; }

  [[nodiscard]] const std::string& dir() const { return dir_; }

private:
  [[nodiscard]] std::optional<std::string> path_for(const std::string& key) const;

  std::string dir_;
  std::mutex mu_;
};

} // namespace steward::store
