/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

#include "batchol/batchol/BatchSolver.h"
#include "batchol/batchol/Errors.h"
#include "batchol/testing/TestingUtils.h"

using namespace BatChol;
using namespace ::BatChol::testing;
using namespace std;
using namespace ::testing;

template <typename T>
struct Epsilon;
template <>
struct Epsilon<double> {
  static constexpr double value = 1e-10;
};
template <>
struct Epsilon<float> {
  static constexpr float value = 1e-4;
};

static Settings settingsWith(BackendType backend) {
  Settings settings;
  settings.backend = backend;
  return settings;
}

template <typename T>
void testFactor(BackendType backend) {
  int64_t n = 5;
  BatchedArray<T> M = randomSpdBatch<T>({2, 3}, n, 37);
  BatchSolverPtr solver = createBatchSolver(settingsWith(backend));
  Factor<T> factor = solver->factorize(M);

  ASSERT_FALSE(factor.isSparse());
  ASSERT_EQ(factor.order(), n);
  ASSERT_THAT(factor.batchShape(), ElementsAre(2, 3));
  const BatchedArray<T>& L = factor.dense();
  ASSERT_THAT(L.shape, ElementsAre(2, 3, n, n));
  for (const auto& index : enumerateBatch({2, 3})) {
    MatRMaj<T> matL = L.matrix(index);
    ASSERT_EQ(matL.template triangularView<Eigen::StrictlyUpper>().toDenseMatrix().norm(), 0)
        << printVec(index);
    ASSERT_NEAR((matL * matL.transpose() - M.matrix(index)).norm() / M.matrix(index).norm(), 0,
                Epsilon<T>::value)
        << printVec(index);
  }
  ASSERT_EQ(solver->backend<T>().potrfStat.numRuns, 6);
  ASSERT_EQ(solver->factorStat.numRuns, 1);
}

TEST(Factor, Batch_Ref_double) { testFactor<double>(BackendRef); }

TEST(Factor, Batch_Blas_double) { testFactor<double>(BackendFast); }

TEST(Factor, Batch_Ref_float) { testFactor<float>(BackendRef); }

TEST(Factor, Batch_Blas_float) { testFactor<float>(BackendFast); }

template <typename T>
void testFactorFailure(BackendType backend) {
  int64_t n = 4;
  BatchedArray<T> M = randomSpdBatch<T>({3, 2}, n, 39);
  // negative diagonal entry in item (1, 0)
  M.matrix({1, 0})(2, 2) = -1;

  BatchSolverPtr solver = createBatchSolver(settingsWith(backend));
  try {
    solver->factorize(M);
    FAIL() << "factorization of a non positive definite item succeeded";
  } catch (const NotPositiveDefinite& e) {
    ASSERT_THAT(e.batchIndex(), ElementsAre(1, 0));
    ASSERT_THAT(e.what(), HasSubstr("(1, 0)"));
  }
  // items are factored in order, and the first failure stops the call
  ASSERT_EQ(solver->backend<T>().potrfStat.numRuns, 3);
}

TEST(Factor, Failure_Ref_double) { testFactorFailure<double>(BackendRef); }

TEST(Factor, Failure_Blas_double) { testFactorFailure<double>(BackendFast); }

TEST(Factor, Failure_Ref_float) { testFactorFailure<float>(BackendRef); }

TEST(Factor, Failure_Blas_float) { testFactorFailure<float>(BackendFast); }

template <typename T>
void testFactorNonFinite(BackendType backend) {
  int64_t n = 3;
  BatchedArray<T> M = randomSpdBatch<T>({3}, n, 43);
  M.matrix({1})(0, 0) = std::numeric_limits<T>::quiet_NaN();
  M.matrix({2})(1, 2) = M.matrix({2})(2, 1) = std::numeric_limits<T>::infinity();

  BatchSolverPtr solver = createBatchSolver(settingsWith(backend));
  try {
    solver->factorize(M);
    FAIL() << "factorization of an item with a NaN entry succeeded";
  } catch (const NotPositiveDefinite& e) {
    ASSERT_THAT(e.batchIndex(), ElementsAre(1));
    ASSERT_THAT(e.what(), HasSubstr("non-finite"));
  }
  // rejected before reaching the backend
  ASSERT_EQ(solver->backend<T>().potrfStat.numRuns, 1);

  BatchedArray<T> withInf(BatchShape{1, n, n});
  withInf.matrix({0}) = M.matrix({2});
  try {
    solver->factorize(withInf);
    FAIL() << "factorization of an item with an infinite entry succeeded";
  } catch (const NotPositiveDefinite& e) {
    ASSERT_THAT(e.batchIndex(), ElementsAre(0));
  }
}

TEST(Factor, NonFinite_Ref_double) { testFactorNonFinite<double>(BackendRef); }

TEST(Factor, NonFinite_Blas_double) { testFactorNonFinite<double>(BackendFast); }

TEST(Factor, NonFinite_Ref_float) { testFactorNonFinite<float>(BackendRef); }

TEST(Factor, NonFinite_Blas_float) { testFactorNonFinite<float>(BackendFast); }

template <typename T>
void testFactorNonSymmetric(BackendType backend) {
  BatchedArray<T> M = randomSpdBatch<T>({2}, 3, 41);
  M.matrix({1})(0, 2) += 1;

  BatchSolverPtr solver = createBatchSolver(settingsWith(backend));
  try {
    solver->factorize(M);
    FAIL() << "factorization of a non symmetric item succeeded";
  } catch (const NotPositiveDefinite& e) {
    ASSERT_THAT(e.batchIndex(), ElementsAre(1));
  }
}

TEST(Factor, NonSymmetric_Ref_double) { testFactorNonSymmetric<double>(BackendRef); }

TEST(Factor, NonSymmetric_Blas_float) { testFactorNonSymmetric<float>(BackendFast); }

TEST(Factor, ShapeErrors) {
  BatchSolverPtr solver = createBatchSolver();
  vector<double> data(2 * 3 * 4);
  ASSERT_THROW(solver->factorize(BatchedArray<double>({2, 3, 4}, data)), ShapeMismatch);
  vector<double> vec(3);
  ASSERT_THROW(solver->factorize(BatchedArray<double>({3}, vec)), ShapeMismatch);
}

TEST(Factor, EmptyBatch) {
  BatchSolverPtr solver = createBatchSolver();
  Factor<double> factor = solver->factorize(BatchedArray<double>(BatchShape{0, 3, 3}));
  ASSERT_THAT(factor.dense().shape, ElementsAre(0, 3, 3));
  ASSERT_EQ(solver->backend<double>().potrfStat.numRuns, 0);
}
