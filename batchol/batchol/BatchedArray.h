/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <vector>
#include "batchol/batchol/BatchIndex.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/Shape.h"

namespace BatChol {

template <typename T>
using MatRMaj = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

template <typename T>
using VecT = Eigen::Matrix<T, Eigen::Dynamic, 1>;

/**
 * @brief Dense row-major n-dimensional array, holding a stack of matrices or vectors.
 *
 * The last two axes of a batched matrix are (rows, cols), the last axis of a batched vector
 * is the vector dimension; the remaining leading axes are the batch shape.
 */
template <typename T>
struct BatchedArray {
  std::vector<int64_t> shape;
  std::vector<T> data;

  BatchedArray() {}
  explicit BatchedArray(std::vector<int64_t> shape_, T value = T(0))
      : shape(std::move(shape_)), data(numElements(shape), value) {}
  BatchedArray(std::vector<int64_t> shape_, std::vector<T> data_)
      : shape(std::move(shape_)), data(std::move(data_)) {
    BATCHOL_CHECK_EQ((int64_t)data.size(), numElements(shape));
  }

  int64_t ndim() const { return shape.size(); }

  int64_t size() const { return data.size(); }

  // size of axis `i`, negative values count from the end
  int64_t dim(int64_t i) const {
    int64_t a = i < 0 ? (int64_t)shape.size() + i : i;
    BATCHOL_CHECK(a >= 0 && a < (int64_t)shape.size());
    return shape[a];
  }

  // leading axes, excluding the trailing `numInnerAxes` (2 for matrices, 1 for vectors)
  BatchShape batchShape(int64_t numInnerAxes) const {
    BATCHOL_CHECK_GE((int64_t)shape.size(), numInnerAxes);
    return BatchShape(shape.begin(), shape.end() - numInnerAxes);
  }

  // elements in each item of the batch
  int64_t innerSize(int64_t numInnerAxes) const {
    return productOf(shape, shape.size() - numInnerAxes, shape.size());
  }

  // pointer to the item with given batch index
  T* item(const std::vector<int64_t>& index, int64_t numInnerAxes) {
    return data.data() + itemOffset(index, numInnerAxes);
  }
  const T* item(const std::vector<int64_t>& index, int64_t numInnerAxes) const {
    return data.data() + itemOffset(index, numInnerAxes);
  }

  int64_t itemOffset(const std::vector<int64_t>& index, int64_t numInnerAxes) const {
    BATCHOL_CHECK_EQ((int64_t)index.size() + numInnerAxes, (int64_t)shape.size());
    return linearOffset(index, rowMajorStrides(batchShape(numInnerAxes),
                                               innerSize(numInnerAxes)));
  }

  // matrix view of the item at given batch index (requires ndim >= 2)
  Eigen::Map<MatRMaj<T>> matrix(const std::vector<int64_t>& index) {
    return Eigen::Map<MatRMaj<T>>(item(index, 2), dim(-2), dim(-1));
  }
  Eigen::Map<const MatRMaj<T>> matrix(const std::vector<int64_t>& index) const {
    return Eigen::Map<const MatRMaj<T>>(item(index, 2), dim(-2), dim(-1));
  }

  // vector view of the item at given batch index (requires ndim >= 1)
  Eigen::Map<VecT<T>> vector(const std::vector<int64_t>& index) {
    return Eigen::Map<VecT<T>>(item(index, 1), dim(-1));
  }
  Eigen::Map<const VecT<T>> vector(const std::vector<int64_t>& index) const {
    return Eigen::Map<const VecT<T>>(item(index, 1), dim(-1));
  }

  // scalar access by full multi-index
  T& operator()(const std::vector<int64_t>& index) {
    return data[linearOffset(index, rowMajorStrides(shape))];
  }
  const T& operator()(const std::vector<int64_t>& index) const {
    return data[linearOffset(index, rowMajorStrides(shape))];
  }

  // stack of identity matrices, of shape batch + (n, n)
  static BatchedArray identity(const BatchShape& batch, int64_t n) {
    BatchShape sh = batch;
    sh.push_back(n);
    sh.push_back(n);
    BatchedArray retv(sh);
    for (int64_t k = 0, numItems = numElements(batch); k < numItems; k++) {
      T* mat = retv.data.data() + k * n * n;
      for (int64_t i = 0; i < n; i++) {
        mat[i * (n + 1)] = T(1);
      }
    }
    return retv;
  }
};

}  // end namespace BatChol
