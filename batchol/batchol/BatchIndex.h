/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <iterator>
#include <vector>
#include "batchol/batchol/Shape.h"

namespace BatChol {

/**
 * @brief Lazy range of all the multi-indices of a batch shape.
 *
 * Indices are generated in row-major order (first axis slowest). The range holds no
 * iteration state, so it can be traversed any number of times with the same result.
 * The empty shape has exactly one (empty) index, a shape with a zero axis has none.
 */
class BatchIndexRange {
 public:
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::vector<int64_t>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    Iterator(const BatchShape* shape, bool atEnd)
        : shape(shape), index(shape->size(), 0), done(atEnd) {}

    reference operator*() const { return index; }
    pointer operator->() const { return &index; }

    Iterator& operator++() {
      // odometer increment, last axis fastest
      int64_t i = (int64_t)index.size() - 1;
      while (i >= 0) {
        if (++index[i] < (*shape)[i]) {
          return *this;
        }
        index[i] = 0;
        i--;
      }
      done = true;
      return *this;
    }

    Iterator operator++(int) {
      Iterator retv = *this;
      ++(*this);
      return retv;
    }

    bool operator==(const Iterator& that) const {
      return done == that.done && (done || index == that.index);
    }
    bool operator!=(const Iterator& that) const { return !(*this == that); }

   private:
    const BatchShape* shape;
    std::vector<int64_t> index;
    bool done;
  };

  explicit BatchIndexRange(BatchShape shape) : shape(std::move(shape)) {}

  Iterator begin() const { return Iterator(&shape, numElements(shape) == 0); }
  Iterator end() const { return Iterator(&shape, true); }

  // number of indices in the range
  int64_t size() const { return numElements(shape); }

  const BatchShape& batchShape() const { return shape; }

 private:
  BatchShape shape;
};

inline BatchIndexRange enumerateBatch(const BatchShape& shape) { return BatchIndexRange(shape); }

// linear (row-major) position of `index` in an array with the given strides
inline int64_t linearOffset(const std::vector<int64_t>& index,
                            const std::vector<int64_t>& strides) {
  int64_t offset = 0;
  for (size_t i = 0; i < index.size(); i++) {
    offset += index[i] * strides[i];
  }
  return offset;
}

}  // end namespace BatChol
