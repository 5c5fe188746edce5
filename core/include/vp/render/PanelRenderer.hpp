#pragma once
#include "vp/collab/ScatterRenderer.hpp"
#include "vp/layout/LayoutPlanner.hpp"
#include "vp/render/PanelStyle.hpp"
#include "vp/select/LayerResolver.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace vp {

class Figure;

// Dense per-cell abundances of one gene (x and y of its phase portrait).
struct GeneAbundance {
  std::vector<float> s;
  std::vector<float> u;
};

struct PanelRendererConfig {
  PanelStyle style;
  std::string basis;  // embedding used by the layer panels
};

// Draws the phase portrait and the per-layer embedding panels of one gene.
// Every draw targets a panel of that gene only.
class PanelRenderer {
public:
  explicit PanelRenderer(ScatterRenderer& scatter) : scatter_(scatter) {}

  void setConfig(const PanelRendererConfig& cfg) { config_ = cfg; }
  const PanelRendererConfig& config() const { return config_; }

  GeneAbundance renderGene(Figure& figure, const Dataset& dataset,
                           const LayoutPlan& plan, std::size_t geneIndex,
                           const LayerResolution& resolution, bool lastGene);

  static GeneAbundance extract(const Dataset& dataset, const std::string& gene,
                               const LayerResolution& resolution);

  ScatterRequest phaseRequest(const std::string& gene, const GeneAbundance& abundance,
                              const LayerResolution& resolution, bool lastGene) const;

  ScatterRequest layerRequest(const std::string& gene, const std::string& layer,
                              const LayerResolution& resolution) const;

private:
  ScatterRenderer& scatter_;
  PanelRendererConfig config_;
};

} // namespace vp
