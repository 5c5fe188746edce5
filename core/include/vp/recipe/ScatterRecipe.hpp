#pragma once
#include "vp/recipe/Recipe.hpp"
#include "vp/scene/Types.hpp"
#include <string>
#include <vector>

namespace vp {

// A scatter recipe creates: buffer, geometry, drawItem, and binds to points@1.
// Requires the pane's layer to already exist.
//
// ID layout (offsets from idBase):
//   0: Buffer (point3: clipX, clipY, colorValue)
//   1: Geometry
//   2: DrawItem
struct ScatterRecipeConfig {
  Id layerId{0};
  std::string name;
  std::uint32_t pointCount{0};
};

class ScatterRecipe : public Recipe {
public:
  ScatterRecipe(Id idBase, const ScatterRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  // Map data-space points into the clip region. Points with a non-finite
  // coordinate are dropped; colorValues may be empty (value 0 is used).
  static std::vector<float> computePoints(const std::vector<float>& x,
                                          const std::vector<float>& y,
                                          const std::vector<float>& colorValues,
                                          const DataRange& range,
                                          const PaneRegion& region);

private:
  ScatterRecipeConfig config_;
};

} // namespace vp
