#pragma once
#include "vp/scene/Types.hpp"

namespace vp {

// Linear map of one data axis [lo, hi] onto [clipMin, clipMax]. A collapsed
// axis maps every value to the middle of the clip interval.
inline float axisToClip(float value, double lo, double hi, float clipMin, float clipMax) {
  const float mid = 0.5f * (clipMin + clipMax);
  if (!(hi > lo)) return mid;
  double t = (static_cast<double>(value) - lo) / (hi - lo);
  return static_cast<float>(clipMin + t * (clipMax - clipMin));
}

inline float dataXToClip(float x, const DataRange& range, const PaneRegion& region) {
  return axisToClip(x, range.xMin, range.xMax, region.clipXMin, region.clipXMax);
}

inline float dataYToClip(float y, const DataRange& range, const PaneRegion& region) {
  return axisToClip(y, range.yMin, range.yMax, region.clipYMin, region.clipYMax);
}

} // namespace vp
