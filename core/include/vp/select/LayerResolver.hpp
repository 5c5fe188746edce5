#pragma once
#include "vp/data/Dataset.hpp"

#include <string>
#include <vector>

namespace vp {

struct LayerResolverConfig {
  std::string vkey{"velocity"};
  bool useRaw{false};
  bool stochastic{false};

  bool allLayers{true};              // "all" = {vkey, skey}
  std::vector<std::string> layers;   // used when allLayers is false

  bool allFits{false};               // "all" = every layer name of the dataset
  std::vector<std::string> fits{"velocity", "dynamics"};
};

struct LayerResolution {
  std::string skey;   // x axis of the phase portrait ("spliced" or "Ms")
  std::string ukey;   // y axis of the phase portrait ("unspliced" or "Mu")
  std::vector<std::string> layers;          // extra per-gene embedding panels
  std::vector<std::string> fits;            // overlay lines on the phase portrait
  std::vector<std::string> stochasticFits;  // fits with a variance_<fit> layer (stochastic mode only)
};

class LayerResolver {
public:
  void setConfig(const LayerResolverConfig& cfg);

  // Missing layers and fits are dropped, never an error.
  LayerResolution resolve(const Dataset& dataset) const;

  static bool isExpressionLayer(const std::string& layer, const std::string& skey) {
    return layer == "X" || layer == skey;
  }

private:
  LayerResolverConfig config_;
};

} // namespace vp
