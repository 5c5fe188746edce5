#include "vp/data/LayerMatrix.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vp {

LayerMatrix LayerMatrix::dense(std::size_t nCells, std::size_t nGenes,
                               std::vector<float> values) {
  if (values.size() != nCells * nGenes) {
    throw std::invalid_argument("LayerMatrix::dense: expected " +
                                std::to_string(nCells * nGenes) + " values, got " +
                                std::to_string(values.size()));
  }
  LayerMatrix m;
  m.nCells_ = nCells;
  m.nGenes_ = nGenes;
  m.sparse_ = false;
  m.values_ = std::move(values);
  return m;
}

LayerMatrix LayerMatrix::sparse(std::size_t nCells, std::size_t nGenes,
                                std::vector<std::uint32_t> indptr,
                                std::vector<std::uint32_t> indices,
                                std::vector<float> values) {
  if (indptr.size() != nCells + 1) {
    throw std::invalid_argument("LayerMatrix::sparse: indptr must have nCells + 1 entries");
  }
  if (indices.size() != values.size() || indptr.back() != values.size()) {
    throw std::invalid_argument("LayerMatrix::sparse: indices/values/indptr disagree");
  }
  for (std::size_t c = 0; c < nCells; c++) {
    if (indptr[c] > indptr[c + 1]) {
      throw std::invalid_argument("LayerMatrix::sparse: indptr not monotone");
    }
  }
  for (std::uint32_t g : indices) {
    if (g >= nGenes) throw std::invalid_argument("LayerMatrix::sparse: gene index out of range");
  }

  LayerMatrix m;
  m.nCells_ = nCells;
  m.nGenes_ = nGenes;
  m.sparse_ = true;
  m.indptr_ = std::move(indptr);
  m.indices_ = std::move(indices);
  m.values_ = std::move(values);
  return m;
}

float LayerMatrix::at(std::size_t cell, std::size_t gene) const {
  if (cell >= nCells_ || gene >= nGenes_) {
    throw std::out_of_range("LayerMatrix::at: index out of range");
  }
  if (!sparse_) return values_[cell * nGenes_ + gene];

  for (std::uint32_t k = indptr_[cell]; k < indptr_[cell + 1]; k++) {
    if (indices_[k] == gene) return values_[k];
  }
  return 0.0f;
}

std::vector<float> LayerMatrix::column(std::size_t gene) const {
  if (gene >= nGenes_) {
    throw std::out_of_range("LayerMatrix::column: gene index out of range");
  }

  std::vector<float> out(nCells_, 0.0f);
  if (!sparse_) {
    for (std::size_t c = 0; c < nCells_; c++) out[c] = values_[c * nGenes_ + gene];
    return out;
  }

  for (std::size_t c = 0; c < nCells_; c++) {
    for (std::uint32_t k = indptr_[c]; k < indptr_[c + 1]; k++) {
      if (indices_[k] == gene) { out[c] = values_[k]; break; }
    }
  }
  return out;
}

} // namespace vp
