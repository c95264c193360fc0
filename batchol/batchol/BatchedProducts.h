/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "batchol/batchol/BatchedArray.h"

namespace BatChol {

// batched outer product of vectors: A (..., N) and B (..., M) give (broadcast..., N, M),
// with r[..., i, j] = A[..., i] * B[..., j]
template <typename T>
BatchedArray<T> outerBatch(const BatchedArray<T>& A, const BatchedArray<T>& B);

// batched matrix-vector product: A (..., M, N) and b (..., N) give (broadcast..., M)
template <typename T>
BatchedArray<T> matVecBatch(const BatchedArray<T>& A, const BatchedArray<T>& b);

}  // end namespace BatChol
