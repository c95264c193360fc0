/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace BatChol {

// base class of all errors reported to the caller of a batched operation
struct BatCholError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// batch shapes not broadcastable, or matrix/vector axes not matching
struct ShapeMismatch : BatCholError {
  using BatCholError::BatCholError;
};

// a factorization slice is not symmetric positive definite
struct NotPositiveDefinite : BatCholError {
  NotPositiveDefinite(const std::string& what, std::vector<int64_t> batchIndex = {})
      : BatCholError(what), index(std::move(batchIndex)) {}

  // batch index of the offending slice (empty for a single/sparse matrix)
  const std::vector<int64_t>& batchIndex() const { return index; }

 private:
  std::vector<int64_t> index;
};

// triangular solve hit a zero pivot
struct SingularMatrix : BatCholError {
  using BatCholError::BatCholError;
};

// operation not available for the given operand, eg. inverting a sparse factor
struct UnsupportedOperand : BatCholError {
  using BatCholError::BatCholError;
};

}  // end namespace BatChol
