/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <variant>
#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/SparseFactor.h"

namespace BatChol {

/**
 * @brief Cholesky factor, either a stack of dense lower-triangular factors or a sparse factor.
 *
 * Dense: a batched matrix with the same batch shape as the factored matrix, each item holding
 * L with L * L^T = M and zeros strictly above the diagonal.
 * Sparse: a borrowed pointer to a SparseFactor, which must outlive this object.
 */
template <typename T>
class Factor {
 public:
  Factor(BatchedArray<T>&& dense) : value(std::move(dense)) {}

  static Factor fromSparse(const SparseFactor& sparseFactor) { return Factor(&sparseFactor); }

  bool isSparse() const { return std::holds_alternative<const SparseFactor*>(value); }

  const BatchedArray<T>& dense() const {
    BATCHOL_CHECK(!isSparse());
    return std::get<BatchedArray<T>>(value);
  }

  // move out the dense factor data
  BatchedArray<T> releaseDense() {
    BATCHOL_CHECK(!isSparse());
    return std::move(std::get<BatchedArray<T>>(value));
  }

  const SparseFactor& sparse() const {
    BATCHOL_CHECK(isSparse());
    return *std::get<const SparseFactor*>(value);
  }

  // batch shape of the dense factor, empty for a sparse one
  BatchShape batchShape() const { return isSparse() ? BatchShape() : dense().batchShape(2); }

  // matrix order
  int64_t order() const { return isSparse() ? sparse().order() : dense().dim(-1); }

 private:
  explicit Factor(const SparseFactor* sparseFactor) : value(sparseFactor) {}

  std::variant<BatchedArray<T>, const SparseFactor*> value;
};

}  // end namespace BatChol
