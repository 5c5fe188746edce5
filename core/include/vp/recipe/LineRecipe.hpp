#pragma once
#include "vp/recipe/Recipe.hpp"
#include "vp/scene/Types.hpp"
#include <string>
#include <vector>

namespace vp {

// A line recipe creates: buffer, geometry, drawItem, and binds to line2d@1
// (solid) or lineDash@1 (dashed).
//
// ID layout (offsets from idBase):
//   0: Buffer (rect4 segments)
//   1: Geometry
//   2: DrawItem
struct LineRecipeConfig {
  Id layerId{0};
  std::string name;
  std::uint32_t segmentCount{0};
  bool dashed{false};
};

class LineRecipe : public Recipe {
public:
  LineRecipe(Id idBase, const LineRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  // Connect consecutive data-space samples as clip-space segments
  // (x0, y0, x1, y1), trimmed to `range` so nothing leaves `region`.
  // Segments touching a non-finite sample or lying outside `range` are skipped.
  static std::vector<float> computeSegments(const std::vector<float>& xs,
                                            const std::vector<float>& ys,
                                            const DataRange& range,
                                            const PaneRegion& region);

private:
  LineRecipeConfig config_;
};

} // namespace vp
