#pragma once
#include "vp/ids/Id.hpp"
#include <cstdint>
#include <string>

namespace vp {

enum class VertexFormat : std::uint8_t {
  Pos2_Clip = 1, // vec2 position in clip space
  Point3    = 2, // x, y (clip) + scalar color value
  Rect4     = 3  // x0, y0, x1, y1 segment (clip)
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return "pos2_clip";
    case VertexFormat::Point3: return "point3";
    case VertexFormat::Rect4: return "rect4";
    default: return "unknown";
  }
}

// Returns false for unknown names.
inline bool parseVertexFormat(const std::string& s, VertexFormat& out) {
  if (s == "pos2_clip") { out = VertexFormat::Pos2_Clip; return true; }
  if (s == "point3")    { out = VertexFormat::Point3; return true; }
  if (s == "rect4")     { out = VertexFormat::Rect4; return true; }
  return false;
}

inline std::uint32_t floatsPerVertex(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return 2;
    case VertexFormat::Point3: return 3;
    case VertexFormat::Rect4: return 4;
    default: return 0;
  }
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2_Clip};
  std::uint32_t vertexCount{0};
};

} // namespace vp
