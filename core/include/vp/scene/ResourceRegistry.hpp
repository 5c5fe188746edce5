#pragma once
#include "vp/scene/Types.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace vp {

// Id -> kind table for every live scene resource. Ids are either supplied by
// the caller (layout plan, recipes) or allocated upward from 1.
class ResourceRegistry {
public:
  Id allocate(ResourceKind kind);
  // Fails for kInvalidId or an id already in use.
  bool reserve(Id id, ResourceKind kind);

  bool exists(Id id) const { return kinds_.count(id) != 0; }
  // Throws std::out_of_range for an unknown id.
  ResourceKind kindOf(Id id) const;

  bool release(Id id) { return kinds_.erase(id) > 0; }

  // Ascending by id.
  std::vector<Id> list(ResourceKind kind) const;
  std::size_t count(ResourceKind kind) const;
  std::size_t size() const { return kinds_.size(); }

private:
  Id next_{1};
  std::map<Id, ResourceKind> kinds_;
};

} // namespace vp
