#include "vp/session/VelocityPlot.hpp"
#include "vp/export/FigureExport.hpp"
#include "vp/layout/LayoutPlanner.hpp"
#include "vp/render/PanelRenderer.hpp"
#include "vp/render/SceneScatterRenderer.hpp"
#include "vp/render/StochasticOverlay.hpp"
#include "vp/select/GeneSelector.hpp"
#include "vp/select/LayerResolver.hpp"
#include "vp/session/Errors.hpp"

#include <cstdio>
#include <initializer_list>

namespace vp {

std::string resolveBasis(const Dataset& dataset, const std::string& requested) {
  auto lookup = [&dataset](const std::string& name) -> std::string {
    if (dataset.hasEmbedding(name)) return name;
    if (dataset.hasEmbedding("X_" + name)) return "X_" + name;
    if (name.compare(0, 2, "X_") == 0 && dataset.hasEmbedding(name.substr(2))) {
      return name.substr(2);
    }
    return std::string();
  };

  if (!requested.empty()) {
    std::string found = lookup(requested);
    if (!found.empty()) return found;
    std::fprintf(stderr, "[VelocityPlot] basis '%s' not found; using default\n",
                 requested.c_str());
  }
  for (const char* name : {"umap", "tsne", "pca"}) {
    std::string found = lookup(name);
    if (!found.empty()) return found;
  }
  if (!dataset.embeddingNames().empty()) return dataset.embeddingNames().front();
  throw ConfigurationError("No basis specified and no embedding found in the dataset.");
}

float defaultPointSize(const Dataset& dataset) {
  if (dataset.nCells() == 0) return 1.0f;
  return 120000.0f / static_cast<float>(dataset.nCells()) / 2.0f;
}

Theme themeByName(const std::string& name) {
  if (name.empty() || name == "light") return lightTheme();
  if (name == "dark") return darkTheme();
  throw ConfigurationError("Unknown theme '" + name + "'");
}

std::unique_ptr<Figure> renderVelocityPanels(Dataset& dataset,
                                             const SelectionOptions& selection,
                                             const LayoutOptions& layout,
                                             const StyleOptions& style,
                                             const VelocityPlotCollaborators& collab) {
  // ---- validation: nothing is drawn before this block completes ----
  GeneSelectorConfig gsc;
  gsc.varNames = selection.varNames;
  gsc.groupBy = selection.groupBy;
  gsc.groups = selection.groups;
  gsc.rankLayer = selection.vkey;
  GeneSelector selector;
  selector.setConfig(gsc);
  selector.setRanker(collab.ranker);
  std::vector<std::string> genes = selector.select(dataset);

  LayerResolverConfig lrc;
  lrc.vkey = selection.vkey;
  lrc.useRaw = selection.useRaw;
  lrc.stochastic = layout.stochastic;
  lrc.allLayers = selection.allLayers;
  lrc.layers = selection.layers;
  lrc.allFits = selection.allFits;
  lrc.fits = selection.fits;
  LayerResolver resolver;
  resolver.setConfig(lrc);
  LayerResolution res = resolver.resolve(dataset);

  if (!dataset.hasLayer(res.skey) || !dataset.hasLayer(res.ukey)) {
    throw ConfigurationError("Dataset lacks the phase-portrait layers '" + res.skey +
                             "' / '" + res.ukey + "'");
  }

  std::string basis;
  if (!res.layers.empty()) basis = resolveBasis(dataset, selection.basis);

  if (layout.stochastic && !collab.moments) {
    throw ConfigurationError("Stochastic mode requires a moment estimator");
  }

  Theme theme = themeByName(style.theme);

  LayoutPlannerConfig lpc;
  lpc.ncols = layout.ncols;
  lpc.baseWidth = layout.figWidth;
  lpc.baseHeight = layout.figHeight;
  lpc.dpi = layout.dpi;
  LayoutPlanner planner;
  planner.setConfig(lpc);
  LayoutPlan plan = planner.plan(genes, res.layers, layout.stochastic);

  PanelStyle panelStyle = style.panel;
  if (!style.sizeSet) panelStyle.size = defaultPointSize(dataset);

  // ---- drawing ----
  SceneScatterRendererConfig ssc;
  ssc.theme = theme;
  SceneScatterRenderer defaultScatter(ssc);
  ScatterRenderer& scatter = collab.scatter ? *collab.scatter : defaultScatter;

  std::fprintf(stderr, "[VelocityPlot] %zu genes x %zu panels (%d x %d grid)%s\n",
               genes.size(), plan.panelsPerGene, plan.rows, plan.totalColumns,
               layout.stochastic ? " stochastic" : "");

  auto figure = std::make_unique<Figure>(plan.figure);
  figure->addPanels(plan);

  PanelRendererConfig prc;
  prc.style = panelStyle;
  prc.basis = basis;
  PanelRenderer panels(scatter);
  panels.setConfig(prc);

  std::unique_ptr<StochasticOverlay> overlay;
  if (layout.stochastic) {
    StochasticOverlayConfig soc;
    soc.style = panelStyle;
    overlay = std::make_unique<StochasticOverlay>(scatter, *collab.moments);
    overlay->setConfig(soc);
  }

  for (std::size_t g = 0; g < genes.size(); g++) {
    const bool last = g + 1 == genes.size();
    figure->beginFrame();
    GeneAbundance abundance = panels.renderGene(*figure, dataset, plan, g, res, last);
    if (overlay) {
      overlay->render(*figure, dataset, plan.panel(g, res.layers.size() + 1), abundance, res);
    }
    figure->commitFrame();
  }

  FinalizeOptions fo;
  fo.show = layout.show;
  fo.save = layout.save;
  fo.dpi = layout.dpi;
  JsonFigureFinalizer defaultFinalizer;
  Finalizer& finalizer = collab.finalizer ? *collab.finalizer : defaultFinalizer;
  return finalizer.finalize(std::move(figure), fo);
}

} // namespace vp
