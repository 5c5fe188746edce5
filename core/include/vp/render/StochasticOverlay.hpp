#pragma once
#include "vp/collab/MomentEstimator.hpp"
#include "vp/collab/ScatterRenderer.hpp"
#include "vp/render/PanelRenderer.hpp"
#include "vp/render/PanelStyle.hpp"
#include "vp/select/LayerResolver.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace vp {

class Figure;

struct StochasticOverlayConfig {
  PanelStyle style;
  int lineSamples{50};
  float lineExtent{1.02f};  // lines run to lineExtent * max(x)
  std::string xlabel{"2 \xCE\xA3_s - <s>"};
  std::string ylabel{"2 \xCE\xA3_us + <u>"};
};

// Corrected (covariance) coordinates of one gene.
struct CorrectedCoordinates {
  std::vector<float> x;
  std::vector<float> y;
};

// Stochastic-mode panel: scatter of the moment-corrected coordinates plus one
// dashed steady-state line per stochastic fit.
class StochasticOverlay {
public:
  StochasticOverlay(ScatterRenderer& scatter, MomentEstimator& moments)
    : scatter_(scatter), moments_(moments) {}

  void setConfig(const StochasticOverlayConfig& cfg) { config_ = cfg; }

  // Renders into the gene's stochastic panel. Returns the number of lines drawn.
  std::size_t render(Figure& figure, const Dataset& dataset, const Panel& target,
                     const GeneAbundance& abundance, const LayerResolution& resolution);

  // x = 2*(ss - s^2) - s,  y = 2*(us - u*s) + u + 2*s*offset/beta
  static CorrectedCoordinates correct(const std::vector<float>& s,
                                      const std::vector<float>& u,
                                      const std::vector<float>& ss,
                                      const std::vector<float>& us,
                                      double offset, double beta);

  // y = gamma/beta * x + offset2/beta for every fit, sampled over
  // [min(x), extent * max(x)]. Empty when x has no finite value.
  static std::vector<LineRequest> fitLines(const Dataset& dataset, std::size_t gene,
                                           const std::vector<std::string>& fits,
                                           const std::vector<float>& x,
                                           int samples, float extent);

private:
  ScatterRenderer& scatter_;
  MomentEstimator& moments_;
  StochasticOverlayConfig config_;
};

} // namespace vp
