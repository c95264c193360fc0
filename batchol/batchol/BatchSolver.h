/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <type_traits>
#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/Factor.h"
#include "batchol/batchol/Kernels.h"
#include "batchol/batchol/Settings.h"
#include "batchol/batchol/SparseFactor.h"
#include "batchol/batchol/SparseMatrix.h"

namespace BatChol {

/**
 * @brief Batched Cholesky factorization and solves, with broadcasting of batch axes.
 *
 * Batched matrices have shape `batch + (n, n)`, batched vectors `batch + (n)`. When solving,
 * the batch shape of the factor U and of the right-hand sides B are broadcast against each
 * other: all the right-hand sides that broadcast against the same item of U are collected
 * and solved in a single call, so the number of underlying solves is the number of items of
 * U, not the number of (matrix, right-hand side) pairs.
 *
 * The solver holds no data across calls, only the backend and call statistics.
 * Use `createBatchSolver` to create one.
 */
class BatchSolver {
 public:
  BatchSolver(const Settings& settings);

  // factor every item of C (shape batch + (n, n)), lower triangular factors. Throws
  // NotPositiveDefinite (with the item's batch index) if any item is not SPD
  template <typename T>
  Factor<T> factorize(const BatchedArray<T>& C) const;

  // sparse Cholesky factor, owned by the caller (use Factor<T>::fromSparse to solve with it)
  SparseFactorPtr factorize(const SparseMatrix& C) const;

  // solve U x = b for all the right-hand sides b, broadcasting U's batch against B's.
  // Result has shape broadcast(batch(U), batch(B)) + (n)
  template <typename T>
  BatchedArray<T> solve(const Factor<T>& U, const BatchedArray<T>& B) const;

  // sparse right-hand side (n x k), with a right-hand side per column. Result is (k, n)
  template <typename T>
  BatchedArray<T> solve(const Factor<T>& U, const SparseMatrix& B) const;

  // solve op(U) x = b for triangular U, broadcasting as in `solve`
  template <typename T>
  BatchedArray<T> triangularSolve(const BatchedArray<T>& U, const BatchedArray<T>& B,
                                  const TriangularSolveOptions& opts = {}) const;

  // inverse of every factored matrix, UnsupportedOperand for a sparse factor
  template <typename T>
  BatchedArray<T> invert(const Factor<T>& U) const;

  // log-determinant of every factored matrix, shape batch(U) (a scalar if sparse)
  template <typename T>
  BatchedArray<T> logDeterminant(const Factor<T>& U) const;

  // backend doing the numerical work for type T
  template <typename T>
  const MatOps<T>& backend() const {
    return kernels<T>().ops();
  }

  const Settings& settings() const { return solverSettings; }

  // log some statistics about timings
  void printStats() const;

  // reset statistics
  void resetStats() const;

  mutable OpStat<> factorStat;
  mutable OpStat<> solveStat;
  mutable OpStat<> triangularSolveStat;
  mutable OpStat<> invertStat;
  mutable OpStat<> logDetStat;

 private:
  template <typename T>
  const MatrixKernels<T>& kernels() const {
    if constexpr (std::is_same_v<T, float>) {
      return kernelsFloat;
    } else {
      return kernelsDouble;
    }
  }

  Settings solverSettings;
  MatrixKernels<double> kernelsDouble;
  MatrixKernels<float> kernelsFloat;
};

using BatchSolverPtr = std::unique_ptr<BatchSolver>;

BatchSolverPtr createBatchSolver(const Settings& settings = {});

}  // end namespace BatChol
