#pragma once
#include "vp/data/Dataset.hpp"

#include <cstddef>
#include <string>

namespace vp {

// Per-gene parameters of one fitted model, read from var columns named
// "<fit>_<param>". Absent columns fall back to the defaults below.
struct FitParams {
  double offset{0.0};
  double beta{1.0};
  double gamma{1.0};
  double offset2{0.0};
};

FitParams lookupFitParams(const Dataset& dataset, const std::string& fit,
                          std::size_t gene);

} // namespace vp
