// Velocity Panels Demo
// Builds a synthetic two-lineage dataset, renders phase portraits, layer
// embeddings and stochastic panels for three genes, and saves the scene as
// JSON. An optional argument names a JSON options file.
//
// Usage: velocity_demo [options.json]

#include "vp/collab/MomentEstimator.hpp"
#include "vp/data/Dataset.hpp"
#include "vp/session/Errors.hpp"
#include "vp/session/VelocityPlot.hpp"
#include "vp/session/VelocityPlotConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// <s^2> and <u*s> from the smoothed layers plus a constant noise floor.
class SmoothedMoments : public vp::MomentEstimator {
public:
  vp::SecondOrderMoments compute(const vp::Dataset& dataset, std::size_t gene) override {
    auto s = dataset.layer("Ms").column(gene);
    auto u = dataset.layer("Mu").column(gene);
    vp::SecondOrderMoments m;
    m.ss.reserve(s.size());
    m.us.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); i++) {
      m.ss.push_back(s[i] * s[i] + 0.05f);
      m.us.push_back(u[i] * s[i] + 0.02f);
    }
    return m;
  }
};

static vp::Dataset buildDataset() {
  const std::size_t nCells = 300;
  const std::vector<std::string> genes = {"Sox2", "Pax6", "Neurod1", "Ins1"};
  const std::size_t nGenes = genes.size();
  const double gammas[] = {0.4, 0.7, 0.25, 0.9};

  std::vector<float> s(nCells * nGenes), u(nCells * nGenes), vel(nCells * nGenes);
  std::vector<float> umap;
  vp::Categorical clusters;
  clusters.categories = {"Progenitor", "Neuron", "Beta"};

  for (std::size_t c = 0; c < nCells; c++) {
    double t = static_cast<double>(c) / static_cast<double>(nCells - 1);
    int lineage = static_cast<int>(c % 2);
    for (std::size_t g = 0; g < nGenes; g++) {
      double phase = t * 3.0 + static_cast<double>(g) * 0.5;
      double sv = 1.0 - std::exp(-phase);
      double uv = std::exp(-phase * 0.5) * (0.6 + 0.1 * static_cast<double>(g));
      std::size_t k = c * nGenes + g;
      s[k] = static_cast<float>(sv);
      u[k] = static_cast<float>(uv);
      vel[k] = static_cast<float>(uv - gammas[g] * sv);
    }
    umap.push_back(static_cast<float>(t * 10.0));
    umap.push_back(static_cast<float>((lineage ? 1.0 : -1.0) * t * t * 4.0));
    clusters.codes.push_back(t < 0.3 ? 0 : 1 + lineage);
  }

  vp::Dataset ds(nCells, genes);
  ds.setX(vp::LayerMatrix::dense(nCells, nGenes, s));
  ds.setLayer("spliced", vp::LayerMatrix::dense(nCells, nGenes, s));
  ds.setLayer("unspliced", vp::LayerMatrix::dense(nCells, nGenes, u));
  ds.setLayer("Ms", vp::LayerMatrix::dense(nCells, nGenes, s));
  ds.setLayer("Mu", vp::LayerMatrix::dense(nCells, nGenes, u));
  ds.setLayer("velocity", vp::LayerMatrix::dense(nCells, nGenes, vel));

  std::vector<float> var(vel.size());
  for (std::size_t i = 0; i < vel.size(); i++) var[i] = vel[i] * vel[i];
  ds.setLayer("variance_velocity", vp::LayerMatrix::dense(nCells, nGenes, var));

  ds.setVarColumn("velocity_gamma", {gammas[0], gammas[1], gammas[2], gammas[3]});
  ds.setVarColumn("velocity_beta", {1.0, 1.0, 1.0, 1.0});
  ds.setVarColumn("velocity_offset2", {0.0, 0.01, 0.02, 0.0});

  ds.setEmbedding("X_umap", umap);
  ds.setObsCategorical("clusters", clusters);
  return ds;
}

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

int main(int argc, char** argv) {
  vp::VelocityPlotConfig cfg;
  cfg.selection.varNames = {"Sox2", "Pax6", "Ins1"};
  cfg.layout.stochastic = true;
  cfg.layout.ncols = 1;
  cfg.layout.show = false;
  cfg.layout.save = "demo";
  cfg.style.panel.color = "clusters";
  cfg.style.panel.legendLoc = "right margin";

  if (argc > 1) {
    std::string json;
    if (!readFile(argv[1], json)) {
      std::fprintf(stderr, "[Demo] cannot read %s\n", argv[1]);
      return 1;
    }
    std::string err;
    if (!vp::parseVelocityPlotConfig(json, cfg, err)) {
      std::fprintf(stderr, "[Demo] bad options: %s\n", err.c_str());
      return 1;
    }
  }

  vp::Dataset ds = buildDataset();
  SmoothedMoments moments;
  vp::VelocityPlotCollaborators collab;
  collab.moments = &moments;

  try {
    auto fig = vp::renderVelocityPanels(ds, cfg, collab);
    if (fig) {
      std::printf("Rendered %zu panes, %zu draw items (%dx%d px)\n",
                  fig->scene().paneIds().size(), fig->scene().drawItemIds().size(),
                  fig->size().pixelWidth, fig->size().pixelHeight);
    }
  } catch (const vp::ConfigurationError& e) {
    std::fprintf(stderr, "[Demo] configuration error: %s\n", e.what());
    return 1;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[Demo] render failed: %s\n", e.what());
    return 1;
  }
  return 0;
}
