/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <Eigen/Cholesky>
#include <Eigen/Core>
#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/MatOps.h"

namespace BatChol {

using namespace std;

// solve X * M.triangularView<Mode>() = B in place, M being a (possibly transposed) map
template <int Mode, typename T, typename MatT>
static void solveOnTheRight(const MatT& matM, Eigen::Map<MatRMaj<T>>& matB) {
  matM.template triangularView<Mode>().template solveInPlace<Eigen::OnTheRight>(matB);
}

template <int Mode, typename T, typename MatT>
static void solveOnTheRight(const MatT& matM, bool unitDiagonal, Eigen::Map<MatRMaj<T>>& matB) {
  if (unitDiagonal) {
    solveOnTheRight<Mode | Eigen::UnitDiag, T>(matM, matB);
  } else {
    solveOnTheRight<Mode, T>(matM, matB);
  }
}

// simple ops implemented using Eigen (therefore single thread)
template <typename T>
struct SimpleOps : MatOps<T> {
  virtual std::string name() const override { return "SimpleOps"; }

  virtual bool potrf(int64_t n, T* data) override {
    auto timer = this->potrfStat.instance(n);
    this->potrfBiggestN = std::max(this->potrfBiggestN, n);

    Eigen::Map<MatRMaj<T>> matA(data, n, n);
    Eigen::LLT<Eigen::Ref<MatRMaj<T>>> llt(matA);
    if (llt.info() != Eigen::Success) {
      return false;
    }
    matA.template triangularView<Eigen::StrictlyUpper>().setZero();
    return true;
  }

  // rows of B are right-hand sides: op(A) * X^T = B^T is solved as X * op(A)^T = B
  virtual void trsm(int64_t n, int64_t nRHS, const T* A, T* B,
                    const TriangularSolveOptions& opts) override {
    auto timer = this->trsmStat.instance(n, nRHS);

    Eigen::Map<const MatRMaj<T>> matA(A, n, n);
    Eigen::Map<MatRMaj<T>> matB(B, nRHS, n);
    if (opts.transpose) {
      // X * A = B
      if (opts.lower) {
        solveOnTheRight<Eigen::Lower, T>(matA, opts.unitDiagonal, matB);
      } else {
        solveOnTheRight<Eigen::Upper, T>(matA, opts.unitDiagonal, matB);
      }
    } else {
      // X * A^T = B, lower's transpose is upper
      if (opts.lower) {
        solveOnTheRight<Eigen::Upper, T>(matA.transpose(), opts.unitDiagonal, matB);
      } else {
        solveOnTheRight<Eigen::Lower, T>(matA.transpose(), opts.unitDiagonal, matB);
      }
    }
  }
};

template <typename T>
MatOpsPtr<T> simpleOps() {
  return MatOpsPtr<T>(new SimpleOps<T>());
}

template MatOpsPtr<double> simpleOps<double>();
template MatOpsPtr<float> simpleOps<float>();

}  // end namespace BatChol
