/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "batchol/batchol/BatchedProducts.h"
#include "batchol/batchol/Errors.h"
#include "batchol/testing/TestingUtils.h"

using namespace BatChol;
using namespace ::BatChol::testing;
using namespace std;
using namespace ::testing;

template <typename T>
void testOuter() {
  BatchedArray<T> A = randomVectors<T>({4}, 3, 37);
  BatchedArray<T> B = randomVectors<T>({4}, 2, 39);
  BatchedArray<T> R = outerBatch(A, B);
  ASSERT_THAT(R.shape, ElementsAre(4, 3, 2));
  for (int64_t k = 0; k < 4; k++) {
    for (int64_t i = 0; i < 3; i++) {
      for (int64_t j = 0; j < 2; j++) {
        ASSERT_EQ(R({k, i, j}), A({k, i}) * B({k, j}));
      }
    }
  }
}

TEST(Products, Outer_double) { testOuter<double>(); }

TEST(Products, Outer_float) { testOuter<float>(); }

TEST(Products, OuterBroadcast) {
  BatchedArray<double> A = randomVectors<double>({2, 1}, 3, 37);
  BatchedArray<double> B = randomVectors<double>({5}, 4, 39);
  BatchedArray<double> R = outerBatch(A, B);
  ASSERT_THAT(R.shape, ElementsAre(2, 5, 3, 4));
  for (const auto& index : enumerateBatch({2, 5})) {
    MatRMaj<double> expected = A.vector({index[0], 0}) * B.vector({index[1]}).transpose();
    ASSERT_EQ((R.matrix(index) - expected).norm(), 0) << printVec(index);
  }
  ASSERT_THROW(outerBatch(randomVectors<double>({2}, 3, 37), randomVectors<double>({3}, 3, 39)),
               ShapeMismatch);
}

template <typename T>
void testMatVec() {
  vector<T> data{1, 2, 0, 0, 1, 0, 0, 0, 2, 2, 0, 0, 0, 2, 0, 1, 1, 1};
  BatchedArray<T> A({2, 3, 3}, data);
  vector<T> vecData{1, 2, 3};
  BatchedArray<T> b({3}, vecData);
  BatchedArray<T> r = matVecBatch(A, b);
  ASSERT_THAT(r.shape, ElementsAre(2, 3));
  ASSERT_THAT(r.data, ElementsAre(5, 2, 6, 2, 4, 6));
}

TEST(Products, MatVec_double) { testMatVec<double>(); }

TEST(Products, MatVec_float) { testMatVec<float>(); }

TEST(Products, MatVecBroadcast) {
  BatchedArray<double> A = randomVectors<double>({3, 1, 2}, 4, 37);
  BatchedArray<double> b = randomVectors<double>({5}, 4, 39);
  BatchedArray<double> r = matVecBatch(A, b);
  ASSERT_THAT(r.shape, ElementsAre(3, 5, 2));
  for (const auto& index : enumerateBatch({3, 5})) {
    VecT<double> expected = A.matrix({index[0], 0}) * b.vector({index[1]});
    ASSERT_NEAR((r.vector(index) - expected).norm(), 0, 1e-14) << printVec(index);
  }
  ASSERT_THROW(matVecBatch(A, randomVectors<double>({5}, 3, 39)), ShapeMismatch);
}
