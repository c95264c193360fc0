/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>
#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/MatOps.h"
#include "batchol/batchol/Settings.h"
#include "batchol/batchol/SparseFactor.h"
#include "batchol/batchol/SparseMatrix.h"

namespace BatChol {

/**
 * @brief Single-matrix Cholesky kernels, with one entry point per operation.
 *
 * Dense entry points work on a single row-major n x n item (factor or matrix) and on a
 * row-major `nRHS x n` block of right-hand sides, dense factors being lower triangular.
 * Sparse entry points delegate to the SparseFactor. `batchIndex` is only used to report
 * which item of a batch failed.
 */
template <typename T>
class MatrixKernels {
 public:
  MatrixKernels(MatOpsPtr<T>&& ops, const Settings& settings);

  // factor in place, throws NotPositiveDefinite if not symmetric positive definite
  void factorize(int64_t n, T* data, const std::vector<int64_t>& batchIndex = {}) const;

  SparseFactorPtr factorize(const SparseMatrix& A) const;

  // solve op(A) x = b for each row of B, throws SingularMatrix on a zero diagonal entry
  void triangularSolve(int64_t n, const T* A, int64_t nRHS, T* B,
                       const TriangularSolveOptions& opts,
                       const std::vector<int64_t>& batchIndex = {}) const;

  // solve M x = b for each row of B, where L * L^T = M
  void factorSolve(int64_t n, const T* L, int64_t nRHS, T* B) const;

  BatchedArray<T> factorSolve(const SparseFactor& factor, const BatchedArray<T>& rhs) const;

  // inverse of M, out is n x n
  void invertFromFactor(int64_t n, const T* L, T* out) const;

  // always throws UnsupportedOperand
  [[noreturn]] void invertFromFactor(const SparseFactor& factor) const;

  // log-determinants of `numItems` contiguous factors L, written to out[0..numItems)
  void logDetFromFactor(int64_t n, int64_t numItems, const T* L, T* out) const;

  T logDetFromFactor(const SparseFactor& factor) const;

  MatOps<T>& ops() const { return *matOps; }

 private:
  bool isSymmetric(int64_t n, const T* data) const;

  MatOpsPtr<T> matOps;
  bool checkSymmetry;
  double symmetryTolerance;
  SparseSettings sparseSettings;
};

}  // end namespace BatChol
