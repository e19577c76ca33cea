#include "store/KeyValueStore.hpp"
#include "util/Faults.hpp"
#include "util/Log.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace steward::store {

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

bool MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_) return false;
  data_[key] = value;
  return true;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_) return false;
  data_.erase(key);
  return true;
}

size_t MemoryKeyValueStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return data_.size();
}

FileKeyValueStore::FileKeyValueStore(std::string dir) : dir_(std::move(dir)) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) util::log_warn("KeyValueStore", "cannot create %s: %s", dir_.c_str(), ec.message().c_str());
}

std::optional<std::string> FileKeyValueStore::path_for(const std::string& key) const {
  if (key.empty()) return std::nullopt;
  for (char c : key) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '_' || c == '-' || c == '.';
    if (!ok) return std::nullopt;
  }
  if (key[0] == '.') return std::nullopt;
  return (std::filesystem::path(dir_) / key).string();
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
  auto path = path_for(key);
  if (!path) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  std::ifstream in(*path, std::ios::binary);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    util::note_fault(util::FaultKind::Persistence);
    return std::nullopt;
  }
  return s;
}

bool FileKeyValueStore::set(const std::string& key, const std::string& value) {
  auto path = path_for(key);
  if (!path) {
    util::log_warn("KeyValueStore", "rejecting key '%s'", key.c_str());
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  std::string tmp = *path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
    out.flush();
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, *path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

bool FileKeyValueStore::remove(const std::string& key) {
  auto path = path_for(key);
  if (!path) return false;
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  std::filesystem::remove(*path, ec);
  return !ec;
}

} // namespace steward::store
