/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

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

// random batch of matrices with a dominant diagonal, both triangles filled
template <typename T>
BatchedArray<T> randomMatrices(const BatchShape& batch, int64_t n, int64_t seed) {
  BatchShape shape = batch;
  shape.push_back(n);
  shape.push_back(n);
  BatchedArray<T> retv(shape, randomData<T>(numElements(shape), -1.0, 1.0, seed));
  for (const auto& index : enumerateBatch(batch)) {
    retv.matrix(index).diagonal().array() += T(3);
  }
  return retv;
}

template <typename T>
void testTriangularSolve(BackendType backend, const TriangularSolveOptions& opts) {
  int64_t n = 5;
  BatchedArray<T> U = randomMatrices<T>({3, 1}, n, 37);
  BatchedArray<T> B = randomVectors<T>({3, 4}, n, 39);

  BatchSolverPtr solver = createBatchSolver(settingsWith(backend));
  BatchedArray<T> x = solver->triangularSolve(U, B, opts);
  ASSERT_THAT(x.shape, ElementsAre(3, 4, n));
  ASSERT_EQ(solver->backend<T>().trsmStat.numRuns, 3);

  for (const auto& index : enumerateBatch({3, 4})) {
    MatRMaj<T> tri;
    if (opts.lower) {
      tri = U.matrix({index[0], 0}).template triangularView<Eigen::Lower>();
    } else {
      tri = U.matrix({index[0], 0}).template triangularView<Eigen::Upper>();
    }
    if (opts.unitDiagonal) {
      tri.diagonal().setOnes();
    }
    MatRMaj<T> opU = opts.transpose ? MatRMaj<T>(tri.transpose()) : tri;
    ASSERT_NEAR((opU * x.vector(index) - B.vector(index)).norm(), 0, Epsilon<T>::value)
        << printVec(index);
  }
}

template <typename T>
void testTriangularSolveModes(BackendType backend) {
  for (bool lower : {true, false}) {
    for (bool transpose : {false, true}) {
      for (bool unitDiagonal : {false, true}) {
        TriangularSolveOptions opts;
        opts.lower = lower;
        opts.transpose = transpose;
        opts.unitDiagonal = unitDiagonal;
        SCOPED_TRACE(::testing::Message() << "lower=" << lower << ", transpose=" << transpose
                                          << ", unitDiagonal=" << unitDiagonal);
        testTriangularSolve<T>(backend, opts);
      }
    }
  }
}

TEST(TriangularSolve, Modes_Ref_double) { testTriangularSolveModes<double>(BackendRef); }

TEST(TriangularSolve, Modes_Blas_double) { testTriangularSolveModes<double>(BackendFast); }

TEST(TriangularSolve, Modes_Ref_float) { testTriangularSolveModes<float>(BackendRef); }

TEST(TriangularSolve, Modes_Blas_float) { testTriangularSolveModes<float>(BackendFast); }

// solving with the factor and its transpose is the same as solving with the matrix
template <typename T>
void testFactorThenTriangular(BackendType backend) {
  int64_t n = 6;
  BatchedArray<T> M = randomSpdBatch<T>({2}, n, 41);
  BatchedArray<T> B = randomVectors<T>({2}, n, 43);

  BatchSolverPtr solver = createBatchSolver(settingsWith(backend));
  Factor<T> factor = solver->factorize(M);
  BatchedArray<T> y = solver->triangularSolve(factor.dense(), B);
  TriangularSolveOptions transposed;
  transposed.transpose = true;
  BatchedArray<T> x = solver->triangularSolve(factor.dense(), y, transposed);

  BatchedArray<T> expected = solver->solve(factor, B);
  Eigen::Map<const VecT<T>> vx(x.data.data(), x.size());
  Eigen::Map<const VecT<T>> vExpected(expected.data.data(), expected.size());
  ASSERT_NEAR((vx - vExpected).norm(), 0, Epsilon<T>::value);
}

TEST(TriangularSolve, FactorThenTriangular_Ref_double) {
  testFactorThenTriangular<double>(BackendRef);
}

TEST(TriangularSolve, FactorThenTriangular_Blas_double) {
  testFactorThenTriangular<double>(BackendFast);
}

TEST(TriangularSolve, FactorThenTriangular_Ref_float) {
  testFactorThenTriangular<float>(BackendRef);
}

TEST(TriangularSolve, FactorThenTriangular_Blas_float) {
  testFactorThenTriangular<float>(BackendFast);
}

TEST(TriangularSolve, Singular) {
  int64_t n = 3;
  BatchedArray<double> U = randomMatrices<double>({2}, n, 37);
  U.matrix({1})(1, 1) = 0;
  BatchedArray<double> B = randomVectors<double>({2}, n, 39);

  BatchSolverPtr solver = createBatchSolver();
  try {
    solver->triangularSolve(U, B);
    FAIL() << "solve with a singular triangular matrix succeeded";
  } catch (const SingularMatrix& e) {
    ASSERT_THAT(e.what(), HasSubstr("(1)"));
  }

  TriangularSolveOptions unit;
  unit.unitDiagonal = true;
  BatchedArray<double> x = solver->triangularSolve(U, B, unit);
  ASSERT_THAT(x.shape, ElementsAre(2, n));
}

TEST(TriangularSolve, ShapeErrors) {
  BatchSolverPtr solver = createBatchSolver();
  vector<double> data(2 * 3 * 4);
  BatchedArray<double> notSquare({2, 3, 4}, data);
  ASSERT_THROW(solver->triangularSolve(notSquare, randomVectors<double>({2}, 4, 37)),
               ShapeMismatch);
  ASSERT_THROW(solver->triangularSolve(randomMatrices<double>({2}, 3, 37),
                                       randomVectors<double>({3}, 3, 39)),
               ShapeMismatch);
}
