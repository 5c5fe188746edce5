#pragma once
#include "vp/ids/Id.hpp"
#include "vp/layout/GridLayout.hpp"
#include <string>

namespace vp {

enum class ResourceKind : std::uint8_t {
  Pane,
  Layer,
  DrawItem,
  Buffer,
  Geometry
};

inline const char* toString(ResourceKind k) {
  switch (k) {
    case ResourceKind::Pane: return "pane";
    case ResourceKind::Layer: return "layer";
    case ResourceKind::DrawItem: return "drawItem";
    case ResourceKind::Buffer: return "buffer";
    case ResourceKind::Geometry: return "geometry";
    default: return "unknown";
  }
}

// Axes decoration for one pane.
struct PaneStyle {
  std::string title;
  std::string xlabel;
  std::string ylabel;
  bool frameOn{true};
  bool colorbar{false};
  std::string legendLoc{"none"};
  float fontSize{8.0f};
  float legendFontSize{8.0f};
};

// Data-space window mapped onto the pane's clip region.
struct DataRange {
  double xMin{0}, xMax{1}, yMin{0}, yMax{1};
};

struct Pane {
  Id id{0};
  std::string name;
  PaneRegion region{-1.0f, 1.0f, -1.0f, 1.0f};
  PaneStyle style;
  DataRange dataRange;
  bool hasDataRange{false};
};

struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

struct DrawItemStyle {
  float color[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  float pointSize{1.0f};
  float lineWidth{1.0f};
  float dashLength{0.0f};  // 0 = solid
  std::string colorMap;    // empty = uniform color
  float vmin{0.0f};
  float vmax{1.0f};
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  // bindings for pipeline execution
  std::string pipeline;  // e.g. "points@1"
  Id geometryId{0};      // must refer to a Geometry resource

  DrawItemStyle style;
};

} // namespace vp
