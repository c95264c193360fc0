/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <tuple>
#include <vector>
#include "batchol/batchol/BatchedArray.h"

namespace BatChol {

// Holds a sparse matrix in compressed column format (CSC): the row indices of the entries
// of the i-th column are inds[ptrs[i]:ptrs[i+1]], with values vals[ptrs[i]:ptrs[i+1]].
struct SparseMatrix {
  int64_t nRows = 0;
  std::vector<int64_t> ptrs{0};
  std::vector<int64_t> inds;
  std::vector<double> vals;

  SparseMatrix() {}
  SparseMatrix(int64_t nRows_, std::vector<int64_t>&& ptrs_, std::vector<int64_t>&& inds_,
               std::vector<double>&& vals_)
      : nRows(nRows_), ptrs(std::move(ptrs_)), inds(std::move(inds_)), vals(std::move(vals_)) {}

  int64_t numRows() const { return nRows; }

  int64_t numCols() const { return ptrs.size() - 1; }

  int64_t numNonZeros() const { return inds.size(); }

  // order of a square matrix
  int64_t order() const { return numCols(); }

  // makes sure row indices are sorted within each column
  void sortIndices();

  // transpose, result has sorted indices
  SparseMatrix transpose() const;

  // clear lower/upper half (of a square matrix)
  SparseMatrix clear(bool clearLower = true) const;

  // dense copy, shape (nRows, nCols)
  BatchedArray<double> toDense() const;

  // from (row, col, value) entries, duplicates are summed
  static SparseMatrix fromTriplets(int64_t nRows, int64_t nCols,
                                   const std::vector<std::tuple<int64_t, int64_t, double>>& entries);

  // from the non-zero entries of a dense matrix of shape (rows, cols)
  static SparseMatrix fromDense(const BatchedArray<double>& dense);
};

}  // end namespace BatChol
