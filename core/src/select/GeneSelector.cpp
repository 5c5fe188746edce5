#include "vp/select/GeneSelector.hpp"
#include "vp/collab/Ranker.hpp"
#include "vp/session/Errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <unordered_set>

namespace vp {

void GeneSelector::setConfig(const GeneSelectorConfig& cfg) {
  config_ = cfg;
}

void GeneSelector::setRanker(Ranker* ranker) {
  ranker_ = ranker;
}

std::vector<std::string> GeneSelector::stableUnique(const std::vector<std::string>& names) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& n : names) {
    if (seen.insert(n).second) out.push_back(n);
  }
  return out;
}

std::vector<std::string> GeneSelector::select(Dataset& dataset) const {
  std::vector<std::string> genes;
  if (!config_.groupBy.empty() && dataset.hasObsKey(config_.groupBy)) {
    genes = presentGenes(dataset, selectByRanking(dataset));
  } else if (!config_.varNames.empty()) {
    genes = presentGenes(dataset, config_.varNames);
  } else {
    throw ConfigurationError("No var_names or groups specified.");
  }

  genes = stableUnique(genes);
  if (genes.empty()) {
    throw ConfigurationError("GeneSelector: none of the requested genes are present in the dataset");
  }
  return genes;
}

std::vector<std::string> GeneSelector::presentGenes(const Dataset& dataset,
                                                    const std::vector<std::string>& names) {
  std::vector<std::string> out;
  for (const auto& name : names) {
    if (dataset.hasGene(name)) {
      out.push_back(name);
    } else {
      std::fprintf(stderr, "[GeneSelector] skipping unknown gene '%s'\n", name.c_str());
    }
  }
  return out;
}

const RankingResult& GeneSelector::ensureRanking(Dataset& dataset) const {
  const auto& cached = dataset.rankingCache();
  if (cached && cached->groupBy == config_.groupBy) return *cached;

  if (!ranker_) {
    throw ConfigurationError("GeneSelector: groupby '" + config_.groupBy +
                             "' requires a ranker and no cached ranking exists");
  }

  std::fprintf(stderr, "[GeneSelector] ranking genes by '%s' (cache %s)\n",
               config_.groupBy.c_str(), cached ? "stale" : "empty");
  RankingResult r = ranker_->rank(dataset, config_.rankLayer, config_.groupBy,
                                  config_.rankGenes);
  r.groupBy = config_.groupBy;
  dataset.setRankingCache(std::move(r));
  return *dataset.rankingCache();
}

std::vector<std::string> GeneSelector::selectByRanking(Dataset& dataset) const {
  const RankingResult& ranking = ensureRanking(dataset);
  const std::size_t nGroups = std::min(ranking.groups.size(), ranking.names.size());

  std::vector<std::string> out;
  if (config_.groups.empty()) {
    for (std::size_t g = 0; g < nGroups; g++) {
      if (!ranking.names[g].empty()) out.push_back(ranking.names[g].front());
    }
    return out;
  }

  // A group matches when any requested token is a substring of its label.
  std::vector<std::size_t> matching;
  for (std::size_t g = 0; g < nGroups; g++) {
    const std::string& label = ranking.groups[g];
    bool hit = std::any_of(config_.groups.begin(), config_.groups.end(),
                           [&label](const std::string& token) {
                             return label.find(token) != std::string::npos;
                           });
    if (hit) matching.push_back(g);
  }

  if (matching.empty()) {
    throw ConfigurationError("GeneSelector: no group of '" + config_.groupBy +
                             "' matches the requested groups");
  }

  const std::size_t k = 10 / matching.size();
  for (std::size_t g : matching) {
    const auto& names = ranking.names[g];
    const std::size_t take = std::min(k, names.size());
    out.insert(out.end(), names.begin(), names.begin() + static_cast<std::ptrdiff_t>(take));
  }
  return out;
}

} // namespace vp
