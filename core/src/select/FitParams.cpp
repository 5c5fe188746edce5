#include "vp/select/FitParams.hpp"

namespace vp {

FitParams lookupFitParams(const Dataset& dataset, const std::string& fit,
                          std::size_t gene) {
  FitParams p;
  if (auto v = dataset.varValue(fit + "_offset", gene)) p.offset = *v;
  if (auto v = dataset.varValue(fit + "_beta", gene)) p.beta = *v;
  if (auto v = dataset.varValue(fit + "_gamma", gene)) p.gamma = *v;
  if (auto v = dataset.varValue(fit + "_offset2", gene)) p.offset2 = *v;
  return p;
}

} // namespace vp
