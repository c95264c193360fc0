/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <vector>
#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/SparseMatrix.h"

namespace BatChol {

enum SparseOrdering {
  SparseOrderingAmd,      // approximate minimum degree, fill reducing
  SparseOrderingNatural,  // no reordering
};

enum SparseFactorType {
  SparseFactorSimplicial,  // simplicial LDL^T
  SparseFactorSupernodal,  // supernodal LL^T
  SparseFactorAuto,        // chosen by CHOLMOD from the fill-in
};

/**
 * Settings for the sparse factorization (CHOLMOD).
 */
struct SparseSettings {
  SparseOrdering ordering = SparseOrderingAmd;
  SparseFactorType factorType = SparseFactorSimplicial;
};

/**
 * @brief Sparse Cholesky factor of a symmetric positive definite matrix, computed by CHOLMOD.
 *
 * The factor is opaque: it can only be used to solve, and to read its diagonal. The internal
 * permutation is applied automatically by `solve`. Only the upper half of the matrix passed
 * to `factorize` is read.
 */
class SparseFactor {
 public:
  ~SparseFactor();

  SparseFactor(const SparseFactor&) = delete;
  SparseFactor& operator=(const SparseFactor&) = delete;

  // factor A, throws NotPositiveDefinite if A is not positive definite
  static std::unique_ptr<SparseFactor> factorize(const SparseMatrix& A,
                                                 const SparseSettings& settings = {});

  int64_t order() const;

  // solve A x = b for each b, last axis of `rhs` being the vector dimension
  BatchedArray<double> solve(const BatchedArray<double>& rhs) const;

  // diagonal entries of the factor (in the internal permuted order). This is D for an LDL^T
  // factor, and the diagonal of L for an LL^T factor
  std::vector<double> diagonal() const;

  // true if the factor is LL^T, false if LDL^T
  bool isLLt() const;

  // log-determinant of A
  double logDeterminant() const;

 private:
  struct Impl;

  explicit SparseFactor(std::unique_ptr<Impl>&& impl);

  std::unique_ptr<Impl> impl;
};

using SparseFactorPtr = std::unique_ptr<SparseFactor>;

}  // end namespace BatChol
