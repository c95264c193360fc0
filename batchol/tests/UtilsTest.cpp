/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/Utils.h"

using namespace BatChol;
using namespace std;
using namespace ::testing;

TEST(Utils, SecondsToString) {
  ASSERT_EQ(secondsToString(0.0005), "500μs");
  ASSERT_EQ(secondsToString(0.0125), "12.50ms");
  ASSERT_EQ(secondsToString(2.5), "2.50s");
  ASSERT_EQ(secondsToString(125.0), "2m5s");
  ASSERT_EQ(secondsToString(180.0), "3m");
}

TEST(Utils, OpStat) {
  OpStat<int64_t, int64_t> stat;
  vector<int64_t> sizes;
  stat.callBack = [&](double runTime, int64_t n, int64_t nRHS) {
    ASSERT_GE(runTime, 0);
    sizes.push_back(n * nRHS);
  };
  { auto timer = stat.instance(3, 4); }
  { auto timer = stat.instance(5, 1); }
  ASSERT_EQ(stat.numRuns, 2);
  ASSERT_THAT(sizes, ElementsAre(12, 5));
  ASSERT_GE(stat.totTime, stat.maxTime);

  stat.enabled = false;
  { auto timer = stat.instance(7, 7); }
  ASSERT_EQ(stat.numRuns, 2);

  stat.reset();
  ASSERT_EQ(stat.numRuns, 0);
  ASSERT_EQ(stat.totTime, 0);
}

TEST(Utils, CumSumAndRewind) {
  vector<int64_t> v{2, 0, 3, 0};
  ASSERT_EQ(cumSumVec(v), 5);
  ASSERT_THAT(v, ElementsAre(0, 2, 2, 5));

  // pointers advanced past each column, as when filling a CSC structure
  vector<int64_t> advanced{2, 2, 5, 5};
  rewindVec(advanced);
  ASSERT_THAT(advanced, ElementsAre(0, 2, 2, 5));
}

TEST(Utils, CheckFailure) {
  int64_t a = 3, b = 2;
  try {
    BATCHOL_CHECK_LE(a, b);
    FAIL() << "check did not throw";
  } catch (const std::runtime_error& e) {
    ASSERT_THAT(e.what(), HasSubstr("a <= b (3 vs. 2)"));
  }
}
