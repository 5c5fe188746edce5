#include "vp/select/LayerResolver.hpp"
#include "vp/select/GeneSelector.hpp"

#include <cstdio>

namespace vp {

void LayerResolver::setConfig(const LayerResolverConfig& cfg) {
  config_ = cfg;
}

LayerResolution LayerResolver::resolve(const Dataset& dataset) const {
  LayerResolution res;

  if (config_.useRaw || !dataset.hasLayer("Ms")) {
    res.skey = "spliced";
    res.ukey = "unspliced";
  } else {
    res.skey = "Ms";
    res.ukey = "Mu";
  }

  // Extra layers
  std::vector<std::string> requested =
      config_.allLayers ? std::vector<std::string>{config_.vkey, res.skey} : config_.layers;
  for (const auto& layer : requested) {
    if (layer == "X" || dataset.hasLayer(layer)) {
      res.layers.push_back(layer);
    } else {
      std::fprintf(stderr, "[LayerResolver] dropping missing layer '%s'\n", layer.c_str());
    }
  }

  // Fits: keep "dynamics" or anything with a <fit>_gamma column; "dynamics" always last-appended.
  const std::vector<std::string>& fitRequest =
      config_.allFits ? dataset.layerNames() : config_.fits;
  std::vector<std::string> fits;
  for (const auto& fit : fitRequest) {
    if (fit == "dynamics" || dataset.hasVarColumn(fit + "_gamma")) fits.push_back(fit);
  }
  fits.push_back("dynamics");
  res.fits = GeneSelector::stableUnique(fits);

  if (config_.stochastic) {
    for (const auto& fit : res.fits) {
      if (dataset.hasLayer("variance_" + fit)) res.stochasticFits.push_back(fit);
    }
    if (res.stochasticFits.empty()) {
      std::fprintf(stderr, "[LayerResolver] no stochastic-capable fit (variance_<fit> layer) found\n");
    }
  }

  return res;
}

} // namespace vp
