/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>

#include "batchol/batchol/Utils.h"

namespace BatChol {

/**
 * Options for triangular solves, `op(A) x = b`:
 * - lower: A is lower triangular (otherwise upper), the other triangle is never read
 * - transpose: op(A) = A^T (otherwise op(A) = A)
 * - unitDiagonal: diagonal of A is assumed to be all ones (and not read)
 */
struct TriangularSolveOptions {
  bool lower = true;
  bool transpose = false;
  bool unitDiagonal = false;
};

/**
 * @brief Dense single-matrix kernels, on row-major data.
 *
 * Right-hand sides are stored as a row-major `nRHS x n` block, one right-hand side per row.
 * This is the boundary with the numerical libraries: implementations are expected to be
 * correct, and only report failure (the leading minor not being positive) for `potrf`.
 */
template <typename T>
struct MatOps {
  virtual ~MatOps() {}

  virtual std::string name() const = 0;

  // dense Cholesky on row-major A (in place), lower half receives L such that L * L^T = A,
  // the strictly upper half is set to zero. Returns false if A is not positive definite
  virtual bool potrf(int64_t n, T* data) = 0;

  // solve op(A) * x_i = b_i for every row b_i of B (in place, B becomes X)
  virtual void trsm(int64_t n, int64_t nRHS, const T* A, T* B,
                    const TriangularSolveOptions& opts) = 0;

  mutable OpStat<int64_t> potrfStat;
  mutable int64_t potrfBiggestN = 0;
  mutable OpStat<int64_t, int64_t> trsmStat;
};

template <typename T>
using MatOpsPtr = std::unique_ptr<MatOps<T>>;

// simple ops implemented using Eigen
template <typename T>
MatOpsPtr<T> simpleOps();

// ops calling into BLAS/LAPACK
template <typename T>
MatOpsPtr<T> blasOps();

}  // end namespace BatChol
