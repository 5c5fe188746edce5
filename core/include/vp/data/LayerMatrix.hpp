#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vp {

// cells x genes matrix, stored dense (row-major) or sparse (CSR over cells).
class LayerMatrix {
public:
  LayerMatrix() = default;

  static LayerMatrix dense(std::size_t nCells, std::size_t nGenes,
                           std::vector<float> values);

  // indptr has nCells + 1 entries; indices are gene columns.
  static LayerMatrix sparse(std::size_t nCells, std::size_t nGenes,
                            std::vector<std::uint32_t> indptr,
                            std::vector<std::uint32_t> indices,
                            std::vector<float> values);

  bool isSparse() const { return sparse_; }
  std::size_t nCells() const { return nCells_; }
  std::size_t nGenes() const { return nGenes_; }

  float at(std::size_t cell, std::size_t gene) const;

  // Dense per-cell values of one gene (sparse storage is expanded).
  std::vector<float> column(std::size_t gene) const;


private:
  std::size_t nCells_{0};
  std::size_t nGenes_{0};
  bool sparse_{false};

  std::vector<float> values_;             // dense: nCells*nGenes; sparse: nnz
  std::vector<std::uint32_t> indptr_;
  std::vector<std::uint32_t> indices_;
};

} // namespace vp
