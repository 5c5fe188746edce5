#pragma once
#include "vp/data/Dataset.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace vp {

class Ranker;

struct GeneSelectorConfig {
  std::vector<std::string> varNames;  // explicit genes (a single name is a 1-element list)
  std::string groupBy;                // obs key; takes precedence when it names an obs column
  std::vector<std::string> groups;    // optional subset tokens (substring match)
  std::string rankLayer{"velocity"};  // layer handed to the ranker
  std::size_t rankGenes{10};          // genes requested per group
};

// Resolves the ordered, duplicate-free genes to plot. Throws
// ConfigurationError when no source is usable or nothing remains.
class GeneSelector {
public:
  void setConfig(const GeneSelectorConfig& cfg);
  void setRanker(Ranker* ranker);

  std::vector<std::string> select(Dataset& dataset) const;

  // Stable unique: keeps the first occurrence of each name.
  static std::vector<std::string> stableUnique(const std::vector<std::string>& names);

  // Names the dataset knows, in input order; the rest are logged and dropped.
  static std::vector<std::string> presentGenes(const Dataset& dataset,
                                               const std::vector<std::string>& names);

private:
  std::vector<std::string> selectByRanking(Dataset& dataset) const;
  const RankingResult& ensureRanking(Dataset& dataset) const;

  GeneSelectorConfig config_;
  Ranker* ranker_{nullptr};
};

} // namespace vp
