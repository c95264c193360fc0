/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <Eigen/Core>
#include <limits>
#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/BlasDefs.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/MatOps.h"

namespace BatChol {

using namespace std;

// Row-major data is handed to BLAS/LAPACK as column-major: a row-major matrix is the
// column-major storage of its transpose, and the row-major `nRHS x n` block of right-hand
// sides is a column-major `n x nRHS` matrix with one right-hand side per column.
struct BlasTrsmArgs {
  char uplo;
  char transA;
  char diag;

  BlasTrsmArgs(const TriangularSolveOptions& opts)
      : uplo(opts.lower ? CblasUpper : CblasLower),  // col-major's upper = row-major's lower
        transA(opts.transpose ? CblasNoTrans : CblasTrans),
        diag(opts.unitDiagonal ? CblasUnit : CblasNonUnit) {}
};

// sizes and leading dimensions are passed as BLAS_INT
static void checkBlasSize(int64_t size) {
  BATCHOL_CHECK_LE(size, (int64_t)std::numeric_limits<BLAS_INT>::max());
}

// zero strictly upper half (row-major) after potrf, which leaves it untouched
template <typename T>
static void clearUpperHalf(int64_t n, T* data) {
  Eigen::Map<MatRMaj<T>>(data, n, n).template triangularView<Eigen::StrictlyUpper>().setZero();
}

// Blas ops aiming at high performance using BLAS/LAPACK
template <typename T>
struct BlasOps : MatOps<T> {
  virtual std::string name() const override { return "BlasOps"; }

  virtual bool potrf(int64_t n, T* data) override;

  virtual void trsm(int64_t n, int64_t nRHS, const T* A, T* B,
                    const TriangularSolveOptions& opts) override;
};

// A is symmetric, so col-major's upper U with U^T * U = A is row-major's lower L = U^T
template <>
bool BlasOps<double>::potrf(int64_t n, double* data) {
  checkBlasSize(n);
  auto timer = potrfStat.instance(n);
  potrfBiggestN = std::max(potrfBiggestN, n);

  BLAS_INT info = LAPACKE_dpotrf(LAPACK_COL_MAJOR, 'U', n, data, n);
  BATCHOL_CHECK_GE(info, 0);
  if (info > 0) {
    return false;
  }
  clearUpperHalf(n, data);
  return true;
}

template <>
bool BlasOps<float>::potrf(int64_t n, float* data) {
  checkBlasSize(n);
  auto timer = potrfStat.instance(n);
  potrfBiggestN = std::max(potrfBiggestN, n);

  BLAS_INT info = LAPACKE_spotrf(LAPACK_COL_MAJOR, 'U', n, data, n);
  BATCHOL_CHECK_GE(info, 0);
  if (info > 0) {
    return false;
  }
  clearUpperHalf(n, data);
  return true;
}

template <>
void BlasOps<double>::trsm(int64_t n, int64_t nRHS, const double* A, double* B,
                           const TriangularSolveOptions& opts) {
  checkBlasSize(n);
  checkBlasSize(nRHS);
  auto timer = trsmStat.instance(n, nRHS);
  BlasTrsmArgs args(opts);
  cblas_dtrsm(CblasColMajor, CblasLeft, args.uplo, args.transA, args.diag, n, nRHS, 1.0, A, n, B,
              n);
}

template <>
void BlasOps<float>::trsm(int64_t n, int64_t nRHS, const float* A, float* B,
                          const TriangularSolveOptions& opts) {
  checkBlasSize(n);
  checkBlasSize(nRHS);
  auto timer = trsmStat.instance(n, nRHS);
  BlasTrsmArgs args(opts);
  cblas_strsm(CblasColMajor, CblasLeft, args.uplo, args.transA, args.diag, n, nRHS, 1.0f, A, n, B,
              n);
}

template <typename T>
MatOpsPtr<T> blasOps() {
  return MatOpsPtr<T>(new BlasOps<T>());
}

template MatOpsPtr<double> blasOps<double>();
template MatOpsPtr<float> blasOps<float>();

}  // end namespace BatChol
