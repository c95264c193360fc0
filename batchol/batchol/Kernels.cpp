/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchol/batchol/Kernels.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "batchol/batchol/DebugMacros.h"

namespace BatChol {

using namespace std;

template <typename T>
MatrixKernels<T>::MatrixKernels(MatOpsPtr<T>&& ops, const Settings& settings)
    : matOps(std::move(ops)),
      checkSymmetry(settings.checkSymmetry),
      symmetryTolerance(settings.symmetryTolerance),
      sparseSettings(settings.sparse) {
  BATCHOL_CHECK_NOTNULL(matOps.get());
}

template <typename T>
bool MatrixKernels<T>::isSymmetric(int64_t n, const T* data) const {
  for (int64_t i = 0; i < n; i++) {
    for (int64_t j = 0; j < i; j++) {
      T a = data[i * n + j];
      T b = data[j * n + i];
      if (std::abs(a - b) > symmetryTolerance * std::max(std::abs(a), std::abs(b))) {
        return false;
      }
    }
  }
  return true;
}

template <typename T>
void MatrixKernels<T>::factorize(int64_t n, T* data, const vector<int64_t>& batchIndex) const {
  if (n == 0) {
    return;
  }
  // NaN passes both the symmetry check and potrf's pivot test
  if (!Eigen::Map<const MatRMaj<T>>(data, n, n).allFinite()) {
    throw NotPositiveDefinite("matrix at batch index " + shapeToString(batchIndex) +
                                  " has non-finite entries",
                              batchIndex);
  }
  if (checkSymmetry && !isSymmetric(n, data)) {
    throw NotPositiveDefinite("matrix at batch index " + shapeToString(batchIndex) +
                                  " is not symmetric",
                              batchIndex);
  }
  MatRMaj<T> input;
  if (VLOG_IS_ON(1)) {
    input = Eigen::Map<const MatRMaj<T>>(data, n, n);
  }
  if (!matOps->potrf(n, data)) {
    VLOG(1) << "factorization failed at batch index " << shapeToString(batchIndex) << ":\n"
            << input;
    throw NotPositiveDefinite("matrix at batch index " + shapeToString(batchIndex) +
                                  " is not positive definite",
                              batchIndex);
  }
}

template <typename T>
SparseFactorPtr MatrixKernels<T>::factorize(const SparseMatrix& A) const {
  return SparseFactor::factorize(A, sparseSettings);
}

template <typename T>
void MatrixKernels<T>::triangularSolve(int64_t n, const T* A, int64_t nRHS, T* B,
                                       const TriangularSolveOptions& opts,
                                       const vector<int64_t>& batchIndex) const {
  if (!opts.unitDiagonal) {
    for (int64_t i = 0; i < n; i++) {
      if (A[i * (n + 1)] == T(0)) {
        BATCHOL_THROW(SingularMatrix, "triangular matrix at batch index "
                                          << shapeToString(batchIndex) << " has a zero at diagonal "
                                          << "position " << i);
      }
    }
  }
  if (n == 0 || nRHS == 0) {
    return;
  }
  matOps->trsm(n, nRHS, A, B, opts);
}

template <typename T>
void MatrixKernels<T>::factorSolve(int64_t n, const T* L, int64_t nRHS, T* B) const {
  if (n == 0 || nRHS == 0) {
    return;
  }
  TriangularSolveOptions opts;
  opts.lower = true;
  opts.transpose = false;
  matOps->trsm(n, nRHS, L, B, opts);  // L y = b
  opts.transpose = true;
  matOps->trsm(n, nRHS, L, B, opts);  // L^T x = y
}

// the sparse factor is double precision, float data is converted back and forth
template <typename T>
BatchedArray<T> MatrixKernels<T>::factorSolve(const SparseFactor& factor,
                                              const BatchedArray<T>& rhs) const {
  if constexpr (std::is_same_v<T, double>) {
    return factor.solve(rhs);
  } else {
    BatchedArray<double> rhsD(rhs.shape, vector<double>(rhs.data.begin(), rhs.data.end()));
    BatchedArray<double> xD = factor.solve(rhsD);
    return BatchedArray<T>(xD.shape, vector<T>(xD.data.begin(), xD.data.end()));
  }
}

template <typename T>
void MatrixKernels<T>::invertFromFactor(int64_t n, const T* L, T* out) const {
  Eigen::Map<MatRMaj<T>>(out, n, n).setIdentity();
  // M^-1 is symmetric, so solving with the rows of I yields M^-1's rows
  factorSolve(n, L, n, out);
}

template <typename T>
void MatrixKernels<T>::invertFromFactor(const SparseFactor& /* factor */) const {
  BATCHOL_THROW(UnsupportedOperand, "inversion of a sparse Cholesky factor is not supported");
}

template <typename T>
void MatrixKernels<T>::logDetFromFactor(int64_t n, int64_t numItems, const T* L, T* out) const {
  Eigen::Map<VecT<T>> retv(out, numItems);
  if (n == 0) {
    retv.setZero();
    return;
  }
  // row k holds the diagonal of the k-th factor
  using DiagStride = Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>;
  Eigen::Map<const MatRMaj<T>, 0, DiagStride> diags(L, numItems, n, DiagStride(n * n, n + 1));
  retv = (T(2) * diags.array().log().rowwise().sum()).matrix();
}

template <typename T>
T MatrixKernels<T>::logDetFromFactor(const SparseFactor& factor) const {
  VLOG(2) << "sparse log-determinant, " << (factor.isLLt() ? "LL'" : "LDL'") << " factor";
  return (T)factor.logDeterminant();
}

template class MatrixKernels<double>;
template class MatrixKernels<float>;

}  // end namespace BatChol
