/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchol/batchol/BatchedProducts.h"

#include "batchol/batchol/BatchIndex.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/Shape.h"

namespace BatChol {

using namespace std;

template <typename T>
BatchedArray<T> outerBatch(const BatchedArray<T>& A, const BatchedArray<T>& B) {
  BATCHOL_CHECK_SHAPE(A.ndim() >= 1 && B.ndim() >= 1,
                      "outer product needs batches of vectors, got shapes "
                          << shapeToString(A.shape) << " and " << shapeToString(B.shape));
  int64_t n = A.dim(-1), m = B.dim(-1);
  BatchShape batchA = A.batchShape(1), batchB = B.batchShape(1);
  BatchShape batch = broadcastBatchShape(batchA, batchB);
  vector<int64_t> stridesA = broadcastStrides(batchA, batch, n);
  vector<int64_t> stridesB = broadcastStrides(batchB, batch, m);

  BatchShape outShape = batch;
  outShape.push_back(n);
  outShape.push_back(m);
  BatchedArray<T> retv(outShape);
  for (const auto& index : enumerateBatch(batch)) {
    Eigen::Map<const VecT<T>> a(A.data.data() + linearOffset(index, stridesA), n);
    Eigen::Map<const VecT<T>> b(B.data.data() + linearOffset(index, stridesB), m);
    retv.matrix(index) = a * b.transpose();
  }
  return retv;
}

template <typename T>
BatchedArray<T> matVecBatch(const BatchedArray<T>& A, const BatchedArray<T>& b) {
  BATCHOL_CHECK_SHAPE(A.ndim() >= 2 && b.ndim() >= 1 && A.dim(-1) == b.dim(-1),
                      "cannot multiply matrices of shape " << shapeToString(A.shape)
                                                           << " by vectors of shape "
                                                           << shapeToString(b.shape));
  int64_t m = A.dim(-2), n = A.dim(-1);
  BatchShape batchA = A.batchShape(2), batchB = b.batchShape(1);
  BatchShape batch = broadcastBatchShape(batchA, batchB);
  vector<int64_t> stridesA = broadcastStrides(batchA, batch, m * n);
  vector<int64_t> stridesB = broadcastStrides(batchB, batch, n);

  BatchShape outShape = batch;
  outShape.push_back(m);
  BatchedArray<T> retv(outShape);
  for (const auto& index : enumerateBatch(batch)) {
    Eigen::Map<const MatRMaj<T>> mat(A.data.data() + linearOffset(index, stridesA), m, n);
    Eigen::Map<const VecT<T>> vec(b.data.data() + linearOffset(index, stridesB), n);
    retv.vector(index) = mat * vec;
  }
  return retv;
}

template BatchedArray<double> outerBatch<double>(const BatchedArray<double>& A,
                                                 const BatchedArray<double>& B);
template BatchedArray<float> outerBatch<float>(const BatchedArray<float>& A,
                                               const BatchedArray<float>& B);

template BatchedArray<double> matVecBatch<double>(const BatchedArray<double>& A,
                                                  const BatchedArray<double>& b);
template BatchedArray<float> matVecBatch<float>(const BatchedArray<float>& A,
                                                const BatchedArray<float>& b);

}  // end namespace BatChol
