/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace BatChol {

// shape of the leading (batch) axes of an array, trailing matrix/vector axes excluded.
// Shapes are right-aligned when broadcast.
using BatchShape = std::vector<int64_t>;

// number of elements of an array of given shape (1 for the empty shape)
int64_t numElements(const BatchShape& shape);

// row-major strides (in elements) of a contiguous array of the given shape, where each
// element has size `innerSize`
std::vector<int64_t> rowMajorStrides(const BatchShape& shape, int64_t innerSize = 1);

/**
 * @brief Broadcast shape of two batch shapes.
 *
 * The shorter shape is right-aligned with the longer one; for each aligned pair the result
 * is the common value if equal, the other value if one of them is 1. Leading axes of the
 * longer shape pass through. Throws ShapeMismatch if a pair differs and neither is 1.
 */
BatchShape broadcastBatchShape(const BatchShape& a, const BatchShape& b);

/**
 * @brief Aligned axes of a right-hand batch against a left-hand batch.
 *
 * Returns the negative offsets (counted from the end, ascending) of the axes present in both
 * `shapeU` and `shapeB` with equal size. Along those axes `B` must be indexed in lock-step
 * with `U`, all other axes of `B` are broadcast.
 */
std::vector<int64_t> classifyAxes(const BatchShape& shapeU, const BatchShape& shapeB);

// strides to read an array of shape `src` (right-aligned) when iterating over `target`,
// with 0 on axes where `src` is missing or singleton. `src` must broadcast to `target`.
std::vector<int64_t> broadcastStrides(const BatchShape& src, const BatchShape& target,
                                      int64_t innerSize = 1);

// shape (3, 1, 4) is printed as "(3, 1, 4)"
std::string shapeToString(const BatchShape& shape);

}  // end namespace BatChol
