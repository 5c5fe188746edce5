#pragma once
#include "vp/data/Dataset.hpp"

#include <cstddef>
#include <vector>

namespace vp {

struct SecondOrderMoments {
  std::vector<float> ss;  // per cell, <s^2>
  std::vector<float> us;  // per cell, <u*s>
};

// Second-order moments for a single gene.
class MomentEstimator {
public:
  virtual ~MomentEstimator() = default;
  virtual SecondOrderMoments compute(const Dataset& dataset, std::size_t gene) = 0;
};

} // namespace vp
