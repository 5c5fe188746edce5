#include "vp/data/Dataset.hpp"

#include <stdexcept>

namespace vp {

Dataset::Dataset(std::size_t nCells, std::vector<std::string> varNames)
  : nCells_(nCells), varNames_(std::move(varNames)) {
  for (std::size_t i = 0; i < varNames_.size(); i++) {
    if (!geneIndex_.emplace(varNames_[i], i).second) {
      throw std::invalid_argument("Dataset: duplicate gene name '" + varNames_[i] + "'");
    }
  }
}

bool Dataset::hasGene(const std::string& name) const {
  return geneIndex_.find(name) != geneIndex_.end();
}

std::optional<std::size_t> Dataset::findGene(const std::string& name) const {
  auto it = geneIndex_.find(name);
  if (it == geneIndex_.end()) return std::nullopt;
  return it->second;
}

std::size_t Dataset::geneIndex(const std::string& name) const {
  auto it = geneIndex_.find(name);
  if (it == geneIndex_.end()) {
    throw std::out_of_range("Dataset: unknown gene '" + name + "'");
  }
  return it->second;
}

void Dataset::checkShape(const LayerMatrix& m, const std::string& what) const {
  if (m.nCells() != nCells_ || m.nGenes() != varNames_.size()) {
    throw std::invalid_argument("Dataset: shape mismatch for " + what);
  }
}

void Dataset::setX(LayerMatrix m) {
  checkShape(m, "X");
  x_ = std::move(m);
  hasX_ = true;
}

void Dataset::setLayer(const std::string& name, LayerMatrix m) {
  if (name == "X") {
    setX(std::move(m));
    return;
  }
  checkShape(m, "layer '" + name + "'");
  if (layers_.find(name) == layers_.end()) layerOrder_.push_back(name);
  layers_[name] = std::move(m);
}

bool Dataset::hasLayer(const std::string& name) const {
  return layers_.find(name) != layers_.end();
}

const LayerMatrix& Dataset::layer(const std::string& name) const {
  if (name == "X") {
    if (!hasX_) throw std::out_of_range("Dataset: primary matrix X not set");
    return x_;
  }
  auto it = layers_.find(name);
  if (it == layers_.end()) {
    throw std::out_of_range("Dataset: unknown layer '" + name + "'");
  }
  return it->second;
}

void Dataset::setVarColumn(const std::string& key, std::vector<double> values) {
  if (values.size() != varNames_.size()) {
    throw std::invalid_argument("Dataset: var column '" + key + "' has wrong length");
  }
  var_[key] = std::move(values);
}

bool Dataset::hasVarColumn(const std::string& key) const {
  return var_.find(key) != var_.end();
}

const std::vector<double>& Dataset::varColumn(const std::string& key) const {
  auto it = var_.find(key);
  if (it == var_.end()) {
    throw std::out_of_range("Dataset: unknown var column '" + key + "'");
  }
  return it->second;
}

std::optional<double> Dataset::varValue(const std::string& key, std::size_t gene) const {
  auto it = var_.find(key);
  if (it == var_.end() || gene >= it->second.size()) return std::nullopt;
  return it->second[gene];
}

void Dataset::setObsCategorical(const std::string& key, Categorical c) {
  if (c.codes.size() != nCells_) {
    throw std::invalid_argument("Dataset: obs column '" + key + "' has wrong length");
  }
  for (int code : c.codes) {
    if (code >= static_cast<int>(c.categories.size())) {
      throw std::invalid_argument("Dataset: obs column '" + key + "' code out of range");
    }
  }
  obs_[key] = std::move(c);
}

bool Dataset::hasObsKey(const std::string& key) const {
  return obs_.find(key) != obs_.end();
}

const Categorical& Dataset::obsCategorical(const std::string& key) const {
  auto it = obs_.find(key);
  if (it == obs_.end()) {
    throw std::out_of_range("Dataset: unknown obs key '" + key + "'");
  }
  return it->second;
}

void Dataset::setEmbedding(const std::string& basis, std::vector<float> xy) {
  if (xy.size() != nCells_ * 2) {
    throw std::invalid_argument("Dataset: embedding '" + basis + "' must hold 2 values per cell");
  }
  if (embeddings_.find(basis) == embeddings_.end()) embeddingOrder_.push_back(basis);
  embeddings_[basis] = std::move(xy);
}

bool Dataset::hasEmbedding(const std::string& basis) const {
  return embeddings_.find(basis) != embeddings_.end();
}

const std::vector<float>& Dataset::embedding(const std::string& basis) const {
  auto it = embeddings_.find(basis);
  if (it == embeddings_.end()) {
    throw std::out_of_range("Dataset: unknown embedding '" + basis + "'");
  }
  return it->second;
}

} // namespace vp
