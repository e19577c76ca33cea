#pragma once
// Named free-lists of reusable objects, at most kMaxPooled per pool.
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace steward::governor {

class ObjectPools {
public:
  static constexpr size_t kMaxPooled = 100;

  // Pops a pooled object of type T, or makes a new one with 'factory', which
  // returns either a T or something convertible to std::shared_ptr<T>.
  template <class T, class Factory>
  std::shared_ptr<T> acquire(const std::string& pool, Factory&& factory) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = pools_.find(pool);
      if (it != pools_.end() && it->second.type == std::type_index(typeid(T)) && !it->second.free.empty()) {
        auto obj = std::static_pointer_cast<T>(it->second.free.back());
        it->second.free.pop_back();
        return obj;
      }
    }
    if constexpr (std::is_convertible_v<std::invoke_result_t<Factory&>, std::shared_ptr<T>>)
      return factory();
    else
      return std::make_shared<T>(factory());
  }

  // Returns false when the pool is full or holds another type; the object is then dropped.
  template <class T>
  bool release(const std::string& pool, std::shared_ptr<T> obj) {
    if (!obj) return false;
    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = pools_.try_emplace(pool, Pool{std::type_index(typeid(T)), {}});
    if (it->second.type != std::type_index(typeid(T))) return false;
    if (it->second.free.size() >= kMaxPooled) return false;
    it->second.free.push_back(std::move(obj));
    return true;
  }

  void clear(const std::string& pool);
  [[nodiscard]] size_t pooled(const std::string& pool) const;

private:
  struct Pool {
    std::type_index type;
    std::vector<std::shared_ptr<void>> free;
  };

  mutable std::mutex mu_;
  std::map<std::string, Pool> pools_;
};

} // namespace steward::governor
