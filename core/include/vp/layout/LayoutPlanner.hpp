#pragma once
#include "vp/layout/GridLayout.hpp"
#include "vp/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vp {

enum class PanelKind : std::uint8_t {
  PhasePortrait,   // offset 0
  LayerEmbedding,  // offsets 1..L
  Stochastic,      // offset L+1 (stochastic mode)
  Reserved         // offset L+2 (stochastic mode, left empty)
};

inline const char* toString(PanelKind k) {
  switch (k) {
    case PanelKind::PhasePortrait: return "phase";
    case PanelKind::LayerEmbedding: return "layer";
    case PanelKind::Stochastic: return "stochastic";
    case PanelKind::Reserved: return "reserved";
    default: return "unknown";
  }
}

// One slot in the output grid.
struct Panel {
  std::size_t geneIndex{0};
  std::size_t offset{0};      // position within the gene's stride
  std::size_t flatIndex{0};   // geneIndex * panelsPerGene + offset
  int row{0};
  int col{0};
  PanelKind kind{PanelKind::PhasePortrait};
  std::string gene;
  std::string layer;          // LayerEmbedding only
  PaneRegion region{-1.0f, 1.0f, -1.0f, 1.0f};
  Id paneId{0};
  Id layerId{0};
};

struct FigureSize {
  float widthIn{0.0f};
  float heightIn{0.0f};
  int dpi{80};
  int pixelWidth{0};
  int pixelHeight{0};
};

struct LayoutPlan {
  int rows{0};
  int totalColumns{0};
  std::size_t panelsPerGene{0};
  std::vector<Panel> panels;  // gene-major, panel-minor
  FigureSize figure;

  std::size_t geneCount() const {
    return panelsPerGene == 0 ? 0 : panels.size() / panelsPerGene;
  }

  // Throws std::out_of_range for a slot outside the plan.
  const Panel& panel(std::size_t geneIndex, std::size_t offset) const;
};

struct LayoutPlannerConfig {
  int ncols{1};           // genes per grid row
  float baseWidth{7.0f};  // inches, scaled by totalColumns / 2
  float baseHeight{5.0f}; // inches, scaled by rows / 2
  int dpi{80};
  GridSpacing spacing;
  Id paneIdBase{1};
};

class LayoutPlanner {
public:
  void setConfig(const LayoutPlannerConfig& cfg);

  // Throws ConfigurationError for an empty gene list or ncols < 1.
  LayoutPlan plan(const std::vector<std::string>& genes,
                  const std::vector<std::string>& layers,
                  bool stochastic) const;

  static std::size_t panelsPerGene(std::size_t layerCount, bool stochastic) {
    return 1 + layerCount + (stochastic ? 2 : 0);
  }

  static FigureSize figureSize(int rows, int totalColumns,
                               float baseWidth, float baseHeight, int dpi);

  // Pane + its single layer.
  static constexpr std::uint32_t ID_SLOTS_PER_PANEL = 2;

private:
  LayoutPlannerConfig config_;
};

} // namespace vp
