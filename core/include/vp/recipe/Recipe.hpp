#pragma once
#include "vp/ids/Id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vp {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

// Commands that create a recipe's resources, in application order. Recipe
// resources live as long as the figure.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
};

// Base class for all recipes. A recipe translates a declarative description
// into figure commands using deterministic ID allocation (idBase + offset).
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }
};

} // namespace vp
