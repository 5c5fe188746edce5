#pragma once
#include "vp/collab/Finalizer.hpp"
#include "vp/collab/MomentEstimator.hpp"
#include "vp/collab/Ranker.hpp"
#include "vp/collab/ScatterRenderer.hpp"
#include "vp/render/Figure.hpp"
#include "vp/session/VelocityPlotConfig.hpp"
#include "vp/style/Theme.hpp"

#include <memory>
#include <string>

namespace vp {

// External collaborators of one plot call. A null scatter renderer or
// finalizer selects the scene-backed / JSON defaults; the ranker is only
// needed for groupby selection without a matching cache, the moment
// estimator only in stochastic mode.
struct VelocityPlotCollaborators {
  Ranker* ranker{nullptr};
  MomentEstimator* moments{nullptr};
  ScatterRenderer* scatter{nullptr};
  Finalizer* finalizer{nullptr};
};

// Phase portraits, per-layer embeddings and (optionally) stochastic panels
// for a set of genes. Every option is validated before the figure is
// created; a ConfigurationError leaves nothing drawn. Returns the figure
// when layout.show is false, nullptr otherwise.
std::unique_ptr<Figure> renderVelocityPanels(Dataset& dataset,
                                             const SelectionOptions& selection,
                                             const LayoutOptions& layout,
                                             const StyleOptions& style,
                                             const VelocityPlotCollaborators& collab);

inline std::unique_ptr<Figure> renderVelocityPanels(Dataset& dataset,
                                                    const VelocityPlotConfig& cfg,
                                                    const VelocityPlotCollaborators& collab) {
  return renderVelocityPanels(dataset, cfg.selection, cfg.layout, cfg.style, collab);
}

// Caller basis (or its "X_" spelling), else umap / tsne / pca, else the first
// embedding. Throws ConfigurationError when the dataset has none.
std::string resolveBasis(const Dataset& dataset, const std::string& requested);

// 120000 / n_cells, halved for the panel grid.
float defaultPointSize(const Dataset& dataset);

// "light" or "dark"; throws ConfigurationError otherwise.
Theme themeByName(const std::string& name);

} // namespace vp
