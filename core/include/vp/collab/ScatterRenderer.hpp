#pragma once
#include "vp/data/Dataset.hpp"
#include "vp/layout/LayoutPlanner.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vp {

class Figure;

// Everything a single colored scatter needs.
struct ScatterRequest {
  enum class Source : std::uint8_t {
    Embedding,    // per-cell coordinates from dataset embedding `basis`
    Coordinates   // explicit x / y
  };

  Source source{Source::Embedding};
  std::string basis;
  std::vector<float> x;
  std::vector<float> y;

  std::string gene;        // gene the panel belongs to (fit lines, layer colors)
  std::string color;       // obs key, layer name, "X" or gene name; empty = uniform
  std::string colorLayer;  // when set, color by the values of `color` (a gene) in this layer
  std::vector<std::string> fitLines;  // fitted models overlaid on the scatter

  std::string colorMap;
  bool usePerc{true};
  float percLow{2.0f};
  float percHigh{98.0f};

  std::string title;
  std::string xlabel;
  std::string ylabel;
  float fontSize{8.0f};
  float legendFontSize{8.0f};
  float size{1.0f};
  float alpha{0.5f};
  bool frameOn{true};
  bool colorbar{true};
  std::string legendLoc{"none"};
};

// A polyline drawn over an existing panel in its data coordinates.
struct LineRequest {
  std::string name;
  std::vector<float> x;
  std::vector<float> y;
  bool dashed{true};
};

class ScatterRenderer {
public:
  virtual ~ScatterRenderer() = default;

  virtual void renderScatter(Figure& figure, const Dataset& dataset,
                             const ScatterRequest& request, const Panel& target) = 0;

  virtual void renderLine(Figure& figure, const LineRequest& request,
                          const Panel& target) = 0;
};

} // namespace vp
