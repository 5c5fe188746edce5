#pragma once
#include <cstddef>
#include <vector>

namespace vp {

struct PaneRegion {
  float clipYMin, clipYMax;
  float clipXMin, clipXMax;
};

struct GridSpacing {
  float wspace{0.5f};   // horizontal gap as a fraction of the average cell width
  float hspace{0.8f};   // vertical gap as a fraction of the average cell height
  float margin{0.05f};  // outer margin in clip units
};

// Compute clip-space regions for a rows x cols grid, row-major, row 0 on top.
// Clip space is [-1, 1] on both axes.
inline std::vector<PaneRegion> computeGridLayout(int rows, int cols,
                                                 const GridSpacing& spacing = {}) {
  std::vector<PaneRegion> result;
  if (rows <= 0 || cols <= 0) return result;

  float availableX = 2.0f - 2.0f * spacing.margin;
  float availableY = 2.0f - 2.0f * spacing.margin;

  float cellW = availableX / (static_cast<float>(cols) +
                              spacing.wspace * static_cast<float>(cols - 1));
  float cellH = availableY / (static_cast<float>(rows) +
                              spacing.hspace * static_cast<float>(rows - 1));
  float gapW = spacing.wspace * cellW;
  float gapH = spacing.hspace * cellH;

  result.reserve(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols));
  for (int r = 0; r < rows; r++) {
    float top = 1.0f - spacing.margin - static_cast<float>(r) * (cellH + gapH);
    for (int c = 0; c < cols; c++) {
      float left = -1.0f + spacing.margin + static_cast<float>(c) * (cellW + gapW);
      PaneRegion reg;
      reg.clipYMax = top;
      reg.clipYMin = top - cellH;
      reg.clipXMin = left;
      reg.clipXMax = left + cellW;
      result.push_back(reg);
    }
  }

  return result;
}

} // namespace vp
