#pragma once
#include "vp/data/LayerMatrix.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vp {

// Per-cell categorical annotation (e.g. cluster labels).
struct Categorical {
  std::vector<std::string> categories;  // ordered category labels
  std::vector<int> codes;               // per cell, index into categories (-1 = missing)
};

// Per-group ranked gene lists, cached on the dataset under the grouping key.
struct RankingResult {
  std::string groupBy;
  std::vector<std::string> groups;              // group labels, in group order
  std::vector<std::vector<std::string>> names;  // names[g] = ranked genes of groups[g]
};

// cells x genes matrix collection. Caller-owned; the plotting pipeline only
// reads it, apart from the ranking cache.
class Dataset {
public:
  Dataset(std::size_t nCells, std::vector<std::string> varNames);

  std::size_t nCells() const { return nCells_; }
  std::size_t nGenes() const { return varNames_.size(); }

  // ---- gene axis ----
  const std::vector<std::string>& varNames() const { return varNames_; }
  bool hasGene(const std::string& name) const;
  std::optional<std::size_t> findGene(const std::string& name) const;
  std::size_t geneIndex(const std::string& name) const;  // throws if absent

  // ---- matrices ----
  // The reserved name "X" addresses the primary matrix.
  void setX(LayerMatrix m);
  bool hasX() const { return hasX_; }
  void setLayer(const std::string& name, LayerMatrix m);
  bool hasLayer(const std::string& name) const;
  const LayerMatrix& layer(const std::string& name) const;
  const std::vector<std::string>& layerNames() const { return layerOrder_; }

  // ---- per-gene annotations (var) ----
  void setVarColumn(const std::string& key, std::vector<double> values);
  bool hasVarColumn(const std::string& key) const;
  const std::vector<double>& varColumn(const std::string& key) const;
  std::optional<double> varValue(const std::string& key, std::size_t gene) const;

  // ---- per-cell annotations (obs) ----
  void setObsCategorical(const std::string& key, Categorical c);
  bool hasObsKey(const std::string& key) const;
  const Categorical& obsCategorical(const std::string& key) const;

  // ---- embeddings (obsm), interleaved x,y per cell ----
  void setEmbedding(const std::string& basis, std::vector<float> xy);
  bool hasEmbedding(const std::string& basis) const;
  const std::vector<float>& embedding(const std::string& basis) const;
  const std::vector<std::string>& embeddingNames() const { return embeddingOrder_; }

  // ---- ranking cache (uns) ----
  const std::optional<RankingResult>& rankingCache() const { return ranking_; }
  void setRankingCache(RankingResult r) { ranking_ = std::move(r); }

private:
  void checkShape(const LayerMatrix& m, const std::string& what) const;

  std::size_t nCells_{0};
  std::vector<std::string> varNames_;
  std::unordered_map<std::string, std::size_t> geneIndex_;

  LayerMatrix x_;
  bool hasX_{false};
  std::unordered_map<std::string, LayerMatrix> layers_;
  std::vector<std::string> layerOrder_;

  std::unordered_map<std::string, std::vector<double>> var_;
  std::unordered_map<std::string, Categorical> obs_;

  std::unordered_map<std::string, std::vector<float>> embeddings_;
  std::vector<std::string> embeddingOrder_;

  std::optional<RankingResult> ranking_;
};

} // namespace vp
