/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchol/batchol/BatchSolver.h"

#include <glog/logging.h>

#include <algorithm>
#include <utility>

#include "batchol/batchol/BatchIndex.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/Utils.h"

namespace BatChol {

using namespace std;

BatchSolver::BatchSolver(const Settings& settings)
    : solverSettings(settings),
      kernelsDouble(getBackend<double>(settings), settings),
      kernelsFloat(getBackend<float>(settings), settings) {}

static void checkSquareMatrices(const vector<int64_t>& shape, const char* what) {
  BATCHOL_CHECK_SHAPE(shape.size() >= 2 && shape[shape.size() - 1] == shape[shape.size() - 2],
                      what << " must be a batch of square matrices, got shape "
                           << shapeToString(shape));
}

// The axes of an array of right-hand sides (or of the output) visited while U's batch index
// is fixed: `pins` are the axes fixed by U's index, as pairs (U's axis, stride), and the
// remaining free axes form a sub-array of right-hand sides, flattened row-major.
struct GroupAxes {
  vector<pair<int64_t, int64_t>> pins;
  BatchShape freeShape;
  vector<int64_t> freeStrides;

  void addPinned(int64_t uAxis, int64_t stride) { pins.emplace_back(uAxis, stride); }

  void addFree(int64_t size, int64_t stride) {
    freeShape.push_back(size);
    freeStrides.push_back(stride);
  }

  int64_t baseOffset(const vector<int64_t>& uIndex) const {
    int64_t offset = 0;
    for (const auto& [uAxis, stride] : pins) {
      offset += uIndex[uAxis] * stride;
    }
    return offset;
  }
};

/*
 * Solves for every item of U the group of right-hand sides of B which broadcast against it.
 * B's axes aligned with U (same size) are pinned to U's index, all other axes are free and
 * collected into one `nRHS x n` block. In the output, the axes where U is not broadcast are
 * pinned to U's index, and the free axes receive the block's solutions in the same order.
 * `solveGroup(uIndex, uItem, nRHS, block)` must solve in place.
 */
template <typename T, typename SolveGroup>
static BatchedArray<T> groupedSolve(const BatchedArray<T>& U, const BatchedArray<T>& B,
                                    bool verbose, const char* opName,
                                    const SolveGroup& solveGroup) {
  checkSquareMatrices(U.shape, "left-hand side");
  int64_t n = U.dim(-1);
  BATCHOL_CHECK_SHAPE(B.ndim() >= 1 && B.dim(-1) == n,
                      "right-hand side of shape " << shapeToString(B.shape)
                                                  << " does not match matrices of shape "
                                                  << shapeToString(U.shape));

  BatchShape shU = U.batchShape(2);
  BatchShape shB = B.batchShape(1);
  BatchShape sh = broadcastBatchShape(shU, shB);
  vector<int64_t> aligned = classifyAxes(shU, shB);
  int64_t lU = shU.size(), lB = shB.size(), lO = sh.size();

  GroupAxes bAxes;
  vector<bool> isAligned(lB, false);
  for (int64_t o : aligned) {
    isAligned[lB + o] = true;
  }
  vector<int64_t> bStrides = rowMajorStrides(shB, n);
  for (int64_t a = 0; a < lB; a++) {
    if (isAligned[a]) {
      bAxes.addPinned(lU + a - lB, bStrides[a]);
    } else {
      bAxes.addFree(shB[a], bStrides[a]);
    }
  }

  BatchShape outShape = sh;
  outShape.push_back(n);
  BatchedArray<T> out(outShape);

  GroupAxes outAxes;
  vector<int64_t> outStrides = rowMajorStrides(sh, n);
  for (int64_t c = 0; c < lO; c++) {
    int64_t uAxis = lU + c - lO;
    if (uAxis >= 0 && shU[uAxis] == sh[c]) {
      outAxes.addPinned(uAxis, outStrides[c]);
    } else {
      outAxes.addFree(sh[c], outStrides[c]);
    }
  }

  int64_t nRHS = numElements(bAxes.freeShape);
  BATCHOL_CHECK_EQ(nRHS, numElements(outAxes.freeShape));
  if (verbose) {
    LOG(INFO) << opName << ": U" << shapeToString(U.shape) << ", B" << shapeToString(B.shape)
              << " -> " << shapeToString(out.shape) << ", " << numElements(shU)
              << " group(s) of " << nRHS << " right-hand side(s)";
  }

  BatchIndexRange bGroup(bAxes.freeShape);
  BatchIndexRange outGroup(outAxes.freeShape);
  vector<T> block(nRHS * n);
  for (const auto& uIndex : enumerateBatch(shU)) {
    int64_t bBase = bAxes.baseOffset(uIndex);
    T* blockPtr = block.data();
    for (const auto& idx : bGroup) {
      const T* src = B.data.data() + bBase + linearOffset(idx, bAxes.freeStrides);
      blockPtr = std::copy(src, src + n, blockPtr);
    }

    solveGroup(uIndex, U.item(uIndex, 2), nRHS, block.data());

    int64_t outBase = outAxes.baseOffset(uIndex);
    const T* solPtr = block.data();
    for (const auto& idx : outGroup) {
      T* dst = out.data.data() + outBase + linearOffset(idx, outAxes.freeStrides);
      std::copy(solPtr, solPtr + n, dst);
      solPtr += n;
    }
  }

  return out;
}

template <typename T>
Factor<T> BatchSolver::factorize(const BatchedArray<T>& C) const {
  auto timer = factorStat.instance();
  checkSquareMatrices(C.shape, "matrix to factor");
  int64_t n = C.dim(-1);
  BatchShape batch = C.batchShape(2);
  if (solverSettings.verbose) {
    LOG(INFO) << "factorize: C" << shapeToString(C.shape) << ", " << numElements(batch)
              << " item(s)";
  }

  BatchedArray<T> L = C;
  const MatrixKernels<T>& kern = kernels<T>();
  for (const auto& index : enumerateBatch(batch)) {
    kern.factorize(n, L.item(index, 2), index);
  }
  return Factor<T>(std::move(L));
}

SparseFactorPtr BatchSolver::factorize(const SparseMatrix& C) const {
  auto timer = factorStat.instance();
  if (solverSettings.verbose) {
    LOG(INFO) << "factorize: sparse C of order " << C.order() << ", nz=" << C.numNonZeros();
  }
  return kernelsDouble.factorize(C);
}

template <typename T>
BatchedArray<T> BatchSolver::solve(const Factor<T>& U, const BatchedArray<T>& B) const {
  auto timer = solveStat.instance();
  const MatrixKernels<T>& kern = kernels<T>();
  if (U.isSparse()) {
    // the batch shape of a sparse factor is always empty
    return kern.factorSolve(U.sparse(), B);
  }

  int64_t n = U.order();
  return groupedSolve(U.dense(), B, solverSettings.verbose, "solve",
                      [&](const vector<int64_t>& /* uIndex */, const T* uItem, int64_t nRHS,
                          T* block) { kern.factorSolve(n, uItem, nRHS, block); });
}

template <typename T>
BatchedArray<T> BatchSolver::solve(const Factor<T>& U, const SparseMatrix& B) const {
  BatchedArray<double> rhs = B.transpose().toDense();
  return solve(U, BatchedArray<T>(rhs.shape, vector<T>(rhs.data.begin(), rhs.data.end())));
}

template <typename T>
BatchedArray<T> BatchSolver::triangularSolve(const BatchedArray<T>& U, const BatchedArray<T>& B,
                                             const TriangularSolveOptions& opts) const {
  auto timer = triangularSolveStat.instance();
  const MatrixKernels<T>& kern = kernels<T>();
  int64_t n = U.ndim() >= 1 ? U.dim(-1) : 0;
  return groupedSolve(U, B, solverSettings.verbose, "triangularSolve",
                      [&](const vector<int64_t>& uIndex, const T* uItem, int64_t nRHS, T* block) {
                        kern.triangularSolve(n, uItem, nRHS, block, opts, uIndex);
                      });
}

template <typename T>
BatchedArray<T> BatchSolver::invert(const Factor<T>& U) const {
  auto timer = invertStat.instance();
  const MatrixKernels<T>& kern = kernels<T>();
  if (U.isSparse()) {
    kern.invertFromFactor(U.sparse());
  }

  const BatchedArray<T>& L = U.dense();
  int64_t n = U.order();
  BatchedArray<T> retv(L.shape);
  for (const auto& index : enumerateBatch(L.batchShape(2))) {
    kern.invertFromFactor(n, L.item(index, 2), retv.item(index, 2));
  }
  return retv;
}

template <typename T>
BatchedArray<T> BatchSolver::logDeterminant(const Factor<T>& U) const {
  auto timer = logDetStat.instance();
  const MatrixKernels<T>& kern = kernels<T>();
  if (U.isSparse()) {
    return BatchedArray<T>(BatchShape(), vector<T>{kern.logDetFromFactor(U.sparse())});
  }

  // all items are contiguous, their diagonals are extracted in one go
  const BatchedArray<T>& L = U.dense();
  BatchShape batch = L.batchShape(2);
  BatchedArray<T> retv(batch);
  kern.logDetFromFactor(U.order(), numElements(batch), L.data.data(), retv.data.data());
  return retv;
}

void BatchSolver::printStats() const {
  LOG(INFO) << "Batched call stats:"
            << "\n  factorize: " << factorStat.toString()
            << "\n  solve: " << solveStat.toString()
            << "\n  triangularSolve: " << triangularSolveStat.toString()
            << "\n  invert: " << invertStat.toString()
            << "\n  logDeterminant: " << logDetStat.toString();
  LOG(INFO) << "Kernel stats (" << kernelsDouble.ops().name() << "):"
            << "\n  largest matrix size: " << kernelsDouble.ops().potrfBiggestN
            << "\n  potrf<double>: " << kernelsDouble.ops().potrfStat.toString()
            << "\n  trsm<double>: " << kernelsDouble.ops().trsmStat.toString()
            << "\n  potrf<float>: " << kernelsFloat.ops().potrfStat.toString()
            << "\n  trsm<float>: " << kernelsFloat.ops().trsmStat.toString();
}

void BatchSolver::resetStats() const {
  factorStat.reset();
  solveStat.reset();
  triangularSolveStat.reset();
  invertStat.reset();
  logDetStat.reset();
  kernelsDouble.ops().potrfStat.reset();
  kernelsDouble.ops().trsmStat.reset();
  kernelsDouble.ops().potrfBiggestN = 0;
  kernelsFloat.ops().potrfStat.reset();
  kernelsFloat.ops().trsmStat.reset();
  kernelsFloat.ops().potrfBiggestN = 0;
}

BatchSolverPtr createBatchSolver(const Settings& settings) {
  return BatchSolverPtr(new BatchSolver(settings));
}

template Factor<double> BatchSolver::factorize<double>(const BatchedArray<double>& C) const;
template Factor<float> BatchSolver::factorize<float>(const BatchedArray<float>& C) const;

template BatchedArray<double> BatchSolver::solve<double>(const Factor<double>& U,
                                                         const BatchedArray<double>& B) const;
template BatchedArray<float> BatchSolver::solve<float>(const Factor<float>& U,
                                                       const BatchedArray<float>& B) const;

template BatchedArray<double> BatchSolver::solve<double>(const Factor<double>& U,
                                                         const SparseMatrix& B) const;
template BatchedArray<float> BatchSolver::solve<float>(const Factor<float>& U,
                                                       const SparseMatrix& B) const;

template BatchedArray<double> BatchSolver::triangularSolve<double>(
    const BatchedArray<double>& U, const BatchedArray<double>& B,
    const TriangularSolveOptions& opts) const;
template BatchedArray<float> BatchSolver::triangularSolve<float>(
    const BatchedArray<float>& U, const BatchedArray<float>& B,
    const TriangularSolveOptions& opts) const;

template BatchedArray<double> BatchSolver::invert<double>(const Factor<double>& U) const;
template BatchedArray<float> BatchSolver::invert<float>(const Factor<float>& U) const;

template BatchedArray<double> BatchSolver::logDeterminant<double>(const Factor<double>& U) const;
template BatchedArray<float> BatchSolver::logDeterminant<float>(const Factor<float>& U) const;

}  // end namespace BatChol
