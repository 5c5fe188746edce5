#pragma once
#include "vp/collab/ScatterRenderer.hpp"
#include "vp/scene/Types.hpp"
#include "vp/style/Theme.hpp"

#include <string>
#include <vector>

namespace vp {

struct SceneScatterRendererConfig {
  Theme theme = lightTheme();
  float marginFraction{0.05f};  // padding around the data on each side
  int fitLineSamples{50};
};

// Resolved point colors for one scatter.
struct ColorValues {
  enum class Kind : unsigned char { Uniform, Continuous, Categorical };
  Kind kind{Kind::Uniform};
  std::vector<float> values;
  std::size_t categoryCount{0};
};

// Default scatter collaborator: emits scatter/line recipes into the figure.
class SceneScatterRenderer : public ScatterRenderer {
public:
  SceneScatterRenderer() = default;
  explicit SceneScatterRenderer(const SceneScatterRendererConfig& cfg) : config_(cfg) {}

  void setConfig(const SceneScatterRendererConfig& cfg) { config_ = cfg; }

  void renderScatter(Figure& figure, const Dataset& dataset,
                     const ScatterRequest& request, const Panel& target) override;

  void renderLine(Figure& figure, const LineRequest& request,
                  const Panel& target) override;

  static ColorValues resolveColor(const Dataset& dataset, const ScatterRequest& request);

  // Padded bounds of the finite points; degenerate spans are widened.
  static DataRange computeDataRange(const std::vector<float>& x,
                                    const std::vector<float>& y,
                                    float marginFraction);

private:
  void drawFitLines(Figure& figure, const Dataset& dataset,
                    const ScatterRequest& request, const Panel& target,
                    const std::vector<float>& x, const DataRange& range);

  SceneScatterRendererConfig config_;
};

} // namespace vp
