#include "vp/recipe/LineRecipe.hpp"
#include "vp/commands/CommandJson.hpp"
#include "vp/math/Normalize.hpp"

#include <algorithm>
#include <cmath>

namespace vp {

LineRecipe::LineRecipe(Id idBase, const LineRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult LineRecipe::build() const {
  RecipeBuildResult result;
  const char* pipeline = config_.dashed ? "lineDash@1" : "line2d@1";

  result.createCommands.push_back(
    R"({"cmd":"createBuffer","id":)" + idStr(bufferId()) + R"(,"byteLength":0})");
  result.createCommands.push_back(
    R"({"cmd":"createGeometry","id":)" + idStr(geometryId()) +
    R"(,"vertexBufferId":)" + idStr(bufferId()) +
    R"(,"format":"rect4","vertexCount":)" + std::to_string(config_.segmentCount) + "}");
  result.createCommands.push_back(
    R"({"cmd":"createDrawItem","id":)" + idStr(drawItemId()) +
    R"(,"layerId":)" + idStr(config_.layerId) +
    R"(,"name":)" + jsonQuote(config_.name) + "}");
  result.createCommands.push_back(
    R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(drawItemId()) +
    R"(,"pipeline":")" + pipeline + R"(","geometryId":)" + idStr(geometryId()) + "}");

  return result;
}

// Liang-Barsky: trims (x0,y0)-(x1,y1) to the range box. False when the
// segment lies entirely outside.
static bool clipSegment(double& x0, double& y0, double& x1, double& y1,
                        const DataRange& range) {
  const double dx = x1 - x0, dy = y1 - y0;
  const double p[4] = {-dx, dx, -dy, dy};
  const double q[4] = {x0 - range.xMin, range.xMax - x0, y0 - range.yMin, range.yMax - y0};
  double t0 = 0.0, t1 = 1.0;
  for (int k = 0; k < 4; k++) {
    if (p[k] == 0.0) {
      if (q[k] < 0.0) return false;
      continue;
    }
    const double t = q[k] / p[k];
    if (p[k] < 0.0) {
      if (t > t1) return false;
      t0 = std::max(t0, t);
    } else {
      if (t < t0) return false;
      t1 = std::min(t1, t);
    }
  }
  const double ox = x0, oy = y0;
  x0 = ox + t0 * dx;
  y0 = oy + t0 * dy;
  x1 = ox + t1 * dx;
  y1 = oy + t1 * dy;
  return true;
}

std::vector<float> LineRecipe::computeSegments(const std::vector<float>& xs,
                                               const std::vector<float>& ys,
                                               const DataRange& range,
                                               const PaneRegion& region) {
  std::vector<float> out;
  const std::size_t n = std::min(xs.size(), ys.size());
  if (n < 2) return out;
  out.reserve((n - 1) * 4);

  auto cx = [&](double v) { return dataXToClip(static_cast<float>(v), range, region); };
  auto cy = [&](double v) { return dataYToClip(static_cast<float>(v), range, region); };

  for (std::size_t i = 0; i + 1 < n; i++) {
    if (!std::isfinite(xs[i]) || !std::isfinite(ys[i]) ||
        !std::isfinite(xs[i + 1]) || !std::isfinite(ys[i + 1])) continue;
    double x0 = xs[i], y0 = ys[i], x1 = xs[i + 1], y1 = ys[i + 1];
    if (!clipSegment(x0, y0, x1, y1, range)) continue;
    out.push_back(cx(x0));
    out.push_back(cy(y0));
    out.push_back(cx(x1));
    out.push_back(cy(y1));
  }
  return out;
}

} // namespace vp
