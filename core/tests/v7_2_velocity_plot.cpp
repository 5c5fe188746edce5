// V7.2 — renderVelocityPanels end-to-end test (pure C++)
// Tests: full figure with default collaborators, stochastic mode with and
//        without stochastic fits, ranking-driven selection, default point
//        size and basis, validation before drawing, finalize options.

#include "vp/collab/Finalizer.hpp"
#include "vp/collab/MomentEstimator.hpp"
#include "vp/collab/Ranker.hpp"
#include "vp/collab/ScatterRenderer.hpp"
#include "vp/data/Dataset.hpp"
#include "vp/session/Errors.hpp"
#include "vp/session/VelocityPlot.hpp"
#include "vp/session/VelocityPlotConfig.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

class FakeRanker : public vp::Ranker {
public:
  vp::RankingResult rank(const vp::Dataset& dataset, const std::string&,
                         const std::string& groupBy, std::size_t) override {
    calls++;
    vp::RankingResult r;
    r.groups = dataset.obsCategorical(groupBy).categories;
    // reverse gene order for every group
    for (std::size_t g = 0; g < r.groups.size(); g++) {
      std::vector<std::string> names(dataset.varNames().rbegin(), dataset.varNames().rend());
      std::rotate(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(g), names.end());
      r.names.push_back(names);
    }
    return r;
  }
  int calls{0};
};

class FakeMoments : public vp::MomentEstimator {
public:
  vp::SecondOrderMoments compute(const vp::Dataset& dataset, std::size_t gene) override {
    calls++;
    vp::SecondOrderMoments m;
    auto s = dataset.layer("Ms").column(gene);
    for (float v : s) {
      m.ss.push_back(v * v + 0.5f);
      m.us.push_back(v * 0.25f);
    }
    return m;
  }
  int calls{0};
};

class CountingRenderer : public vp::ScatterRenderer {
public:
  void renderScatter(vp::Figure&, const vp::Dataset&, const vp::ScatterRequest& request,
                     const vp::Panel& target) override {
    requests.push_back(request);
    panels.push_back(target);
  }
  void renderLine(vp::Figure&, const vp::LineRequest&, const vp::Panel& target) override {
    lines++;
    lineKinds.push_back(target.kind);
  }
  std::vector<vp::ScatterRequest> requests;
  std::vector<vp::Panel> panels;
  int lines{0};
  std::vector<vp::PanelKind> lineKinds;
};

class RecordingFinalizer : public vp::Finalizer {
public:
  std::unique_ptr<vp::Figure> finalize(std::unique_ptr<vp::Figure> figure,
                                       const vp::FinalizeOptions& options) override {
    calls++;
    last = options;
    paneCount = figure->scene().paneIds().size();
    return options.show ? nullptr : std::move(figure);
  }
  int calls{0};
  vp::FinalizeOptions last;
  std::size_t paneCount{0};
};

static vp::LayerMatrix ramp(std::size_t cells, std::size_t genes, float scale) {
  std::vector<float> v;
  for (std::size_t c = 0; c < cells; c++) {
    for (std::size_t g = 0; g < genes; g++) {
      v.push_back(scale * static_cast<float>(c + 1) * static_cast<float>(g + 1));
    }
  }
  return vp::LayerMatrix::dense(cells, genes, v);
}

// 6 cells x 4 genes with smoothed layers, a velocity layer and one fit.
static vp::Dataset makeDataset(bool stochasticFit) {
  const std::size_t n = 6, g = 4;
  vp::Dataset ds(n, {"Sox2", "Pax6", "Neurod1", "Ins1"});
  ds.setX(ramp(n, g, 1.0f));
  ds.setLayer("spliced", ramp(n, g, 1.0f));
  ds.setLayer("unspliced", ramp(n, g, 0.5f));
  ds.setLayer("Ms", ramp(n, g, 1.0f));
  ds.setLayer("Mu", ramp(n, g, 0.5f));
  ds.setLayer("velocity", ramp(n, g, 0.1f));
  if (stochasticFit) ds.setLayer("variance_velocity", ramp(n, g, 0.01f));
  ds.setVarColumn("velocity_gamma", {0.5, 0.5, 0.5, 0.5});
  ds.setVarColumn("velocity_beta", {1.0, 1.0, 1.0, 1.0});
  ds.setEmbedding("X_pca", std::vector<float>(n * 2, 0.0f));
  std::vector<float> umap;
  for (std::size_t c = 0; c < n; c++) {
    umap.push_back(static_cast<float>(c));
    umap.push_back(static_cast<float>(c % 3));
  }
  ds.setEmbedding("umap", umap);

  vp::Categorical clusters;
  clusters.categories = {"Ductal", "Beta"};
  clusters.codes = {0, 0, 0, 1, 1, 1};
  ds.setObsCategorical("clusters", clusters);
  return ds;
}

template <typename Fn>
static bool throwsConfig(Fn fn) {
  try {
    fn();
  } catch (const vp::ConfigurationError&) {
    return true;
  }
  return false;
}

int main() {
  // --- Test 1: default collaborators build the whole figure ---
  {
    vp::Dataset ds = makeDataset(false);
    vp::VelocityPlotConfig cfg;
    cfg.selection.varNames = {"Pax6", "Sox2", "Pax6", "Missing"};
    cfg.style.panel.color = "clusters";
    cfg.style.panel.legendLoc = "upper right";
    cfg.layout.ncols = 2;
    cfg.layout.show = false;

    vp::VelocityPlotCollaborators collab;
    auto fig = vp::renderVelocityPanels(ds, cfg, collab);
    requireTrue(fig != nullptr, "figure returned when not shown");

    // genes [Pax6, Sox2], layers [velocity, Ms] -> 3 panels per gene
    const auto& scene = fig->scene();
    requireTrue(scene.paneIds().size() == 6, "2 genes x 3 panels");
    requireClose(fig->size().widthIn, 7.0f * 6 / 2, 1e-5f, "width from total columns");
    requireClose(fig->size().heightIn, 5.0f / 2, 1e-5f, "one row");

    const vp::Pane* phase0 = scene.getPane(1);
    const vp::Pane* phase1 = scene.getPane(1 + 3 * 2);
    requireTrue(phase0->style.title == "Pax6" && phase1->style.title == "Sox2", "gene order");
    requireTrue(phase0->style.legendLoc == "none", "legend hidden on first gene");
    requireTrue(phase1->style.legendLoc == "upper right", "legend on last gene");
    requireTrue(scene.getPane(3)->style.title == "velocity", "velocity panel title");
    requireTrue(scene.getPane(5)->style.title == "expression", "Ms panel title");
    requireTrue(!scene.getPane(5)->style.frameOn, "layer panels frameless");

    // phase panel: scatter + velocity fit line ("dynamics" has no fit_ columns)
    requireTrue(scene.drawItemsOfPane(1).size() == 2, "scatter + one fit line");
    requireTrue(scene.drawItemsOfPane(3).size() == 1, "layer panel scatter only");
    requireTrue(fig->commands().frameCount() == 2 && !fig->commands().inFrame(),
                "one committed frame per gene");

    std::printf("  Test 1 (default collaborators) PASS\n");
  }

  // --- Test 2: stochastic mode with a stochastic fit ---
  {
    vp::Dataset ds = makeDataset(true);
    vp::VelocityPlotConfig cfg;
    cfg.selection.varNames = {"Sox2", "Ins1", "Neurod1"};
    cfg.layout.stochastic = true;

    FakeMoments moments;
    CountingRenderer renderer;
    RecordingFinalizer finalizer;
    vp::VelocityPlotCollaborators collab;
    collab.moments = &moments;
    collab.scatter = &renderer;
    collab.finalizer = &finalizer;

    auto fig = vp::renderVelocityPanels(ds, cfg, collab);
    requireTrue(fig == nullptr, "shown -> no handle");
    requireTrue(finalizer.calls == 1 && finalizer.last.show, "finalized once, shown");
    requireTrue(finalizer.paneCount == 3 * 5, "3 genes x (1 + 2 + 2) panes");
    requireTrue(moments.calls == 3, "moments per gene");
    requireTrue(renderer.requests.size() == 3 * 4, "phase + 2 layers + stochastic per gene");
    requireTrue(renderer.lines == 3, "one dashed line per gene per stochastic fit");
    for (auto k : renderer.lineKinds) requireTrue(k == vp::PanelKind::Stochastic, "lines in stochastic panel");

    // gene-major, panel-minor order; the reserved slot is never drawn
    std::size_t prev = 0;
    for (std::size_t i = 0; i < renderer.panels.size(); i++) {
      const auto& p = renderer.panels[i];
      requireTrue(i == 0 || p.flatIndex > prev, "increasing slot order");
      requireTrue(p.kind != vp::PanelKind::Reserved, "reserved slot left empty");
      prev = p.flatIndex;
    }

    // default size 120000 / 6 / 2
    requireClose(renderer.requests[0].size, 10000.0f, 1e-2f, "default point size");
    requireTrue(renderer.requests[1].basis == "umap", "umap preferred over pca");
    requireTrue(renderer.requests[0].fitLines.size() == 2, "velocity + dynamics");

    std::printf("  Test 2 (stochastic with fit) PASS\n");
  }

  // --- Test 3: stochastic mode without any stochastic fit ---
  {
    vp::Dataset ds = makeDataset(false);
    vp::VelocityPlotConfig cfg;
    cfg.selection.varNames = {"Sox2", "Pax6"};
    cfg.selection.allLayers = false;
    cfg.layout.stochastic = true;
    cfg.layout.show = false;

    FakeMoments moments;
    CountingRenderer renderer;
    vp::VelocityPlotCollaborators collab;
    collab.moments = &moments;
    collab.scatter = &renderer;

    auto fig = vp::renderVelocityPanels(ds, cfg, collab);
    requireTrue(fig->scene().paneIds().size() == 2 * 3, "panels still allocated");
    requireTrue(renderer.lines == 0, "no overlay lines");
    requireTrue(renderer.requests.size() == 2 * 2, "phase + stochastic scatter per gene");

    std::printf("  Test 3 (stochastic without fit) PASS\n");
  }

  // --- Test 4: ranking-driven selection through the option bag ---
  {
    vp::Dataset ds = makeDataset(false);
    vp::VelocityPlotConfig cfg;
    std::string err;
    requireTrue(vp::parseVelocityPlotConfig(
      R"({"groupby":"clusters","layers":["velocity"],"basis":"pca","show":false,"theme":"dark"})",
      cfg, err), "config parsed");

    FakeRanker ranker;
    CountingRenderer renderer;
    vp::VelocityPlotCollaborators collab;
    collab.ranker = &ranker;
    collab.scatter = &renderer;

    auto fig = vp::renderVelocityPanels(ds, cfg, collab);
    requireTrue(ranker.calls == 1, "ranked once");
    // group 0 top = Ins1, group 1 top = Neurod1
    requireTrue(renderer.requests[0].title == "Ins1", "first group's top gene");
    requireTrue(renderer.requests[2].title == "Neurod1", "second group's top gene");
    requireTrue(renderer.requests[1].basis == "X_pca", "pca resolved to X_pca");

    vp::renderVelocityPanels(ds, cfg, collab);
    requireTrue(ranker.calls == 1, "cache reused on second call");

    std::printf("  Test 4 (ranking selection) PASS\n");
  }

  // --- Test 5: configuration errors happen before anything is drawn ---
  {
    vp::Dataset ds = makeDataset(false);
    CountingRenderer renderer;
    RecordingFinalizer finalizer;
    vp::VelocityPlotCollaborators collab;
    collab.scatter = &renderer;
    collab.finalizer = &finalizer;

    vp::VelocityPlotConfig none;
    requireTrue(throwsConfig([&] { vp::renderVelocityPanels(ds, none, collab); }),
                "no gene source");

    vp::VelocityPlotConfig stochastic;
    stochastic.selection.varNames = {"Sox2"};
    stochastic.layout.stochastic = true;
    requireTrue(throwsConfig([&] { vp::renderVelocityPanels(ds, stochastic, collab); }),
                "stochastic without moment estimator");

    vp::VelocityPlotConfig badCols;
    badCols.selection.varNames = {"Sox2"};
    badCols.layout.ncols = 0;
    requireTrue(throwsConfig([&] { vp::renderVelocityPanels(ds, badCols, collab); }), "ncols 0");

    vp::VelocityPlotConfig badTheme;
    badTheme.selection.varNames = {"Sox2"};
    badTheme.style.theme = "neon";
    requireTrue(throwsConfig([&] { vp::renderVelocityPanels(ds, badTheme, collab); }), "theme");

    vp::Dataset bare(2, {"a"});
    bare.setLayer("spliced", vp::LayerMatrix::dense(2, 1, {1, 2}));
    bare.setLayer("unspliced", vp::LayerMatrix::dense(2, 1, {1, 2}));
    bare.setLayer("velocity", vp::LayerMatrix::dense(2, 1, {1, 2}));
    vp::VelocityPlotConfig noBasis;
    noBasis.selection.varNames = {"a"};
    requireTrue(throwsConfig([&] { vp::renderVelocityPanels(bare, noBasis, collab); }),
                "layer panels need an embedding");

    vp::Dataset noLayers(2, {"a"});
    requireTrue(throwsConfig([&] { vp::renderVelocityPanels(noLayers, noBasis, collab); }),
                "phase layers missing");

    requireTrue(renderer.requests.empty() && renderer.lines == 0, "nothing drawn");
    requireTrue(finalizer.calls == 0, "nothing finalized");

    std::printf("  Test 5 (validation) PASS\n");
  }

  // --- Test 6: helpers ---
  {
    vp::Dataset ds = makeDataset(false);
    requireTrue(vp::resolveBasis(ds, "") == "umap", "umap first");
    requireTrue(vp::resolveBasis(ds, "X_umap") == "umap", "X_ prefix accepted");
    requireTrue(vp::resolveBasis(ds, "X_pca") == "X_pca", "exact name wins");
    requireTrue(vp::resolveBasis(ds, "tsne") == "umap", "unknown basis falls back");
    requireClose(vp::defaultPointSize(ds), 10000.0f, 1e-2f, "120000 / 6 / 2");
    requireTrue(vp::themeByName("dark").name == "Dark", "dark theme");
    requireTrue(vp::themeByName("").name == "Light", "light default");

    std::printf("  Test 6 (helpers) PASS\n");
  }

  std::printf("V7.2 velocity plot: ALL PASS\n");
  return 0;
}
