/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "batchol/batchol/MatOps.h"
#include "batchol/batchol/SparseFactor.h"

namespace BatChol {

/**
 * The backend type selects the engine that will be used for dense numerical operations.
 **/
enum BackendType {
  BackendRef,  // reference implementation (Eigen)
  BackendFast,  // BLAS/LAPACK
};

/**
 * Settings for `createBatchSolver`.
 */
struct Settings {
  BackendType backend = BackendFast;
  // reject non-symmetric matrices in factorization (otherwise only the lower half is read)
  bool checkSymmetry = true;
  // relative tolerance for the symmetry check: |a_ij - a_ji| <= tol * max(|a_ij|, |a_ji|)
  double symmetryTolerance = 1e-6;
  // log a summary of each batched call
  bool verbose = false;
  SparseSettings sparse;
};

template <typename T>
MatOpsPtr<T> getBackend(const Settings& settings) {
  if (settings.backend == BackendRef) {
    return simpleOps<T>();
  }
  return blasOps<T>();
}

}  // end namespace BatChol
