#include "vp/scene/ResourceRegistry.hpp"
#include <stdexcept>
#include <string>

namespace vp {

Id ResourceRegistry::allocate(ResourceKind kind) {
  while (next_ == kInvalidId || kinds_.count(next_) != 0) ++next_;
  kinds_.emplace(next_, kind);
  return next_++;
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  return kinds_.emplace(id, kind).second;
}

ResourceKind ResourceRegistry::kindOf(Id id) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) {
    throw std::out_of_range("ResourceRegistry: unknown id " + std::to_string(id));
  }
  return it->second;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> out;
  for (const auto& kv : kinds_) {
    if (kv.second == kind) out.push_back(kv.first);
  }
  return out;
}

std::size_t ResourceRegistry::count(ResourceKind kind) const {
  std::size_t n = 0;
  for (const auto& kv : kinds_) {
    if (kv.second == kind) n++;
  }
  return n;
}

} // namespace vp
