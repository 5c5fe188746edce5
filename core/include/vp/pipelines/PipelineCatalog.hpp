#pragma once
#include "vp/scene/Geometry.hpp"
#include <string>

namespace vp {

// A draw pipeline a DrawItem can bind, addressed as "<name>@<version>".
struct PipelineSpec {
  const char* key;
  VertexFormat requiredVertexFormat;
  bool colorMapped;  // per-vertex value goes through the item's colormap
  bool dashed;
};

// Fixed set of pipelines a figure can draw with:
//   points@1    scatter with a per-point color value (point3)
//   line2d@1    solid line segments (rect4)
//   lineDash@1  dashed line segments (rect4)
class PipelineCatalog {
public:
  // nullptr for an unknown key.
  const PipelineSpec* find(const std::string& key) const;
};

} // namespace vp
