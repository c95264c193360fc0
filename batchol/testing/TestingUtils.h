/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "batchol/batchol/BatchedArray.h"
#include "batchol/batchol/Shape.h"

namespace BatChol::testing {

template <typename T>
std::vector<T> randomData(size_t size, T low, T high, int64_t seed);

template <typename T>
std::vector<T> randomData(size_t size, T low, T high, std::mt19937& gen);

// random batch of vectors, shape batch + (n)
template <typename T>
BatchedArray<T> randomVectors(const BatchShape& batch, int64_t n, int64_t seed);

// random batch of symmetric positive definite matrices, shape batch + (n, n). Each item is
// A * A^T + n * I, for A with entries in [-1, 1], and is exactly symmetric
template <typename T>
BatchedArray<T> randomSpdBatch(const BatchShape& batch, int64_t n, int64_t seed);

template <typename T>
std::string printVec(const std::vector<T>& ints) {
  std::stringstream ss;
  ss << "[";
  bool first = true;
  for (auto c : ints) {
    ss << (first ? "" : ", ") << c;
    first = false;
  }
  ss << "]";
  return ss.str();
}

}  // end namespace BatChol::testing
