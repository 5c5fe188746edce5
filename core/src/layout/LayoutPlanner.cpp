#include "vp/layout/LayoutPlanner.hpp"
#include "vp/session/Errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace vp {

const Panel& LayoutPlan::panel(std::size_t geneIndex, std::size_t offset) const {
  if (offset >= panelsPerGene) {
    throw std::out_of_range("LayoutPlan: panel offset out of range");
  }
  std::size_t flat = geneIndex * panelsPerGene + offset;
  if (flat >= panels.size()) {
    throw std::out_of_range("LayoutPlan: gene index out of range");
  }
  return panels[flat];
}

void LayoutPlanner::setConfig(const LayoutPlannerConfig& cfg) {
  config_ = cfg;
}

FigureSize LayoutPlanner::figureSize(int rows, int totalColumns,
                                     float baseWidth, float baseHeight, int dpi) {
  FigureSize fs;
  fs.widthIn = baseWidth * static_cast<float>(totalColumns) / 2.0f;
  fs.heightIn = baseHeight * static_cast<float>(rows) / 2.0f;
  fs.dpi = dpi;
  fs.pixelWidth = static_cast<int>(std::lround(fs.widthIn * static_cast<float>(dpi)));
  fs.pixelHeight = static_cast<int>(std::lround(fs.heightIn * static_cast<float>(dpi)));
  return fs;
}

LayoutPlan LayoutPlanner::plan(const std::vector<std::string>& genes,
                               const std::vector<std::string>& layers,
                               bool stochastic) const {
  if (genes.empty()) {
    throw ConfigurationError("LayoutPlanner: no genes to lay out");
  }
  if (config_.ncols < 1) {
    throw ConfigurationError("LayoutPlanner: ncols must be >= 1, got " +
                             std::to_string(config_.ncols));
  }

  LayoutPlan plan;
  plan.panelsPerGene = panelsPerGene(layers.size(), stochastic);
  const int c = config_.ncols;
  plan.rows = static_cast<int>((genes.size() + static_cast<std::size_t>(c) - 1) /
                               static_cast<std::size_t>(c));
  plan.totalColumns = c * static_cast<int>(plan.panelsPerGene);
  plan.figure = figureSize(plan.rows, plan.totalColumns,
                           config_.baseWidth, config_.baseHeight, config_.dpi);

  auto regions = computeGridLayout(plan.rows, plan.totalColumns, config_.spacing);

  plan.panels.reserve(genes.size() * plan.panelsPerGene);
  for (std::size_t v = 0; v < genes.size(); v++) {
    for (std::size_t k = 0; k < plan.panelsPerGene; k++) {
      Panel p;
      p.geneIndex = v;
      p.offset = k;
      p.flatIndex = v * plan.panelsPerGene + k;
      p.row = static_cast<int>(p.flatIndex / static_cast<std::size_t>(plan.totalColumns));
      p.col = static_cast<int>(p.flatIndex % static_cast<std::size_t>(plan.totalColumns));
      p.gene = genes[v];
      p.region = regions[p.flatIndex];
      p.paneId = config_.paneIdBase + static_cast<Id>(p.flatIndex) * ID_SLOTS_PER_PANEL;
      p.layerId = p.paneId + 1;

      if (k == 0) {
        p.kind = PanelKind::PhasePortrait;
      } else if (k <= layers.size()) {
        p.kind = PanelKind::LayerEmbedding;
        p.layer = layers[k - 1];
      } else if (k == layers.size() + 1) {
        p.kind = PanelKind::Stochastic;
      } else {
        p.kind = PanelKind::Reserved;
      }
      plan.panels.push_back(std::move(p));
    }
  }

  return plan;
}

} // namespace vp
