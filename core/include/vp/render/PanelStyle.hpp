#pragma once
#include "vp/style/ColorMap.hpp"

#include <string>

namespace vp {

// Caller styling shared by every panel of one plot. Defaults are resolved at
// the entry point; the renderers use the values as given.
struct PanelStyle {
  std::string color;                 // color key, empty = uniform
  ColorMapChoice colorMap;           // Paired("RdYlGn", "gnuplot_r")
  bool colorbar{true};
  bool usePerc{true};
  float percLow{2.0f};
  float percHigh{98.0f};
  float alpha{0.5f};
  float size{1.0f};
  std::string legendLoc{"none"};     // applied to the last gene only
  float legendFontSize{8.0f};
  float fontSize{8.0f};
  std::string xlabel{"spliced"};     // phase portrait axes
  std::string ylabel{"unspliced"};
};

} // namespace vp
