#include "vp/recipe/ScatterRecipe.hpp"
#include "vp/commands/CommandJson.hpp"
#include "vp/math/Normalize.hpp"

#include <algorithm>
#include <cmath>

namespace vp {

ScatterRecipe::ScatterRecipe(Id idBase, const ScatterRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult ScatterRecipe::build() const {
  RecipeBuildResult result;

  result.createCommands.push_back(
    R"({"cmd":"createBuffer","id":)" + idStr(bufferId()) + R"(,"byteLength":0})");
  result.createCommands.push_back(
    R"({"cmd":"createGeometry","id":)" + idStr(geometryId()) +
    R"(,"vertexBufferId":)" + idStr(bufferId()) +
    R"(,"format":"point3","vertexCount":)" + std::to_string(config_.pointCount) + "}");
  result.createCommands.push_back(
    R"({"cmd":"createDrawItem","id":)" + idStr(drawItemId()) +
    R"(,"layerId":)" + idStr(config_.layerId) +
    R"(,"name":)" + jsonQuote(config_.name) + "}");
  result.createCommands.push_back(
    R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(drawItemId()) +
    R"(,"pipeline":"points@1","geometryId":)" + idStr(geometryId()) + "}");

  return result;
}

std::vector<float> ScatterRecipe::computePoints(const std::vector<float>& x,
                                                const std::vector<float>& y,
                                                const std::vector<float>& colorValues,
                                                const DataRange& range,
                                                const PaneRegion& region) {
  std::vector<float> out;
  const std::size_t n = std::min(x.size(), y.size());
  out.reserve(n * 3);

  for (std::size_t i = 0; i < n; i++) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
    out.push_back(dataXToClip(x[i], range, region));
    out.push_back(dataYToClip(y[i], range, region));
    out.push_back(i < colorValues.size() ? colorValues[i] : 0.0f);
  }
  return out;
}

} // namespace vp
