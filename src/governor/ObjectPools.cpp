#include "governor/ObjectPools.hpp"

namespace steward::governor {

void ObjectPools::clear(const std::string& pool) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = pools_.find(pool);
  if (it != pools_.end()) it->second.free.clear();
}

size_t ObjectPools::pooled(const std::string& pool) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = pools_.find(pool);
  return it == pools_.end() ? 0 : it->second.free.size();
}

} // namespace steward::governor
