#pragma once
#include "vp/data/Dataset.hpp"

#include <cstddef>
#include <string>

namespace vp {

// Per-group gene ranking. The result is cached on the dataset by the caller.
class Ranker {
public:
  virtual ~Ranker() = default;
  virtual RankingResult rank(const Dataset& dataset,
                             const std::string& layerKey,
                             const std::string& groupBy,
                             std::size_t nGenes) = 0;
};

} // namespace vp
