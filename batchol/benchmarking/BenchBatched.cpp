/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "batchol/batchol/BatchSolver.h"
#include "batchol/batchol/DebugMacros.h"
#include "batchol/testing/TestingUtils.h"

using namespace BatChol;
using namespace BatChol::testing;
using namespace std;
using hrc = chrono::high_resolution_clock;
using tdelta = chrono::duration<double>;

struct BenchmarkSettings {
  int numIterations = 5;
  int64_t matrixSize = 16;
  int64_t numMatrices = 200;
  int64_t rhsPerMatrix = 20;
  BackendType backend = BackendFast;
  bool verbose = false;
};

static string timeString(double t) {
  stringstream ss;
  if (t > 0.1) {
    ss << fixed << setprecision(3) << t << "s";
  } else {
    ss << fixed << setprecision(1) << t * 1000 << "ms";
  }
  return ss.str();
}

// matrices of batch shape (k, 1) against right-hand sides of batch shape (k, r): solved in k
// groups of r right-hand sides, compared with the factor replicated to batch shape (k, r),
// which takes k * r solves with one right-hand side each
void runBenchmarks(const BenchmarkSettings& settings) {
  int64_t n = settings.matrixSize, k = settings.numMatrices, r = settings.rhsPerMatrix;
  Settings solverSettings;
  solverSettings.backend = settings.backend;
  BatchSolverPtr solver = createBatchSolver(solverSettings);

  cout << "Matrices: " << k << " of size " << n << "x" << n << ", " << r
       << " right-hand sides each, backend: " << solver->backend<double>().name() << endl;

  map<string, vector<double>> timings;
  for (int it = 0; it < settings.numIterations; it++) {
    BatchedArray<double> M = randomSpdBatch<double>({k, 1}, n, 37 + it);
    BatchedArray<double> B = randomVectors<double>({k, r}, n, 1000037 + it);

    auto startFactor = hrc::now();
    Factor<double> factor = solver->factorize(M);
    timings["factor"].push_back(tdelta(hrc::now() - startFactor).count());

    BatchedArray<double> replicated(BatchShape{k, r, n, n});
    for (const auto& index : enumerateBatch({k, r})) {
      replicated.matrix(index) = factor.dense().matrix({index[0], 0});
    }
    Factor<double> pairFactor(std::move(replicated));

    auto startGrouped = hrc::now();
    BatchedArray<double> xGrouped = solver->solve(factor, B);
    timings["solve-grouped"].push_back(tdelta(hrc::now() - startGrouped).count());

    auto startPairs = hrc::now();
    BatchedArray<double> xPairs = solver->solve(pairFactor, B);
    timings["solve-per-pair"].push_back(tdelta(hrc::now() - startPairs).count());

    BATCHOL_CHECK(xGrouped.shape == xPairs.shape);
    double maxDiff = 0;
    for (size_t i = 0; i < xGrouped.data.size(); i++) {
      maxDiff = std::max(maxDiff, std::abs(xGrouped.data[i] - xPairs.data[i]));
    }
    if (settings.verbose) {
      cout << "iteration " << it + 1 << ", max difference: " << maxDiff << endl;
    }
  }

  for (const auto& [label, times] : timings) {
    stringstream ss;
    ss << "- " << label << ":\n    ";
    for (size_t i = 0; i < times.size(); i++) {
      stringstream tss;
      tss << timeString(times[i]);
      if (label == "solve-per-pair") {
        double percent = (times[i] / timings["solve-grouped"][i] - 1.0) * 100.0;
        tss << " (" << (percent > 0 ? "+" : "") << fixed << setprecision(2) << percent << "%)";
      }
      tss << (i == times.size() - 1 ? "" : ", ");
      ss << left << setfill(' ') << setw(20) << tss.str();
    }
    cout << ss.str() << endl;
  }

  if (settings.verbose) {
    solver->printStats();
  }
}

void help() {
  cout << "This program compares grouped batched solves (one solve call per matrix, with"
       << "\nall the right-hand sides broadcast against it) with one solve per pair"
       << "\n -v           [v]erbose stats"
       << "\n -n number    [n]umber of iterations (default: 5)"
       << "\n -s size      matrix [s]ize (default: 16)"
       << "\n -k number    number of matrices (default: 200)"
       << "\n -r number    [r]ight-hand sides per matrix (default: 20)"
       << "\n -B backend   [B]ackend, 'ref' or 'blas' (default: blas)" << endl;
}

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  BenchmarkSettings settings;
  for (int i = 1; i < argc; i++) {
    if (!strcmp(argv[i], "-h")) {
      help();
      return 0;
    }
    if (!strcmp(argv[i], "-v")) {
      settings.verbose = true;
    } else if (!strcmp(argv[i], "-n") && i < argc - 1) {
      settings.numIterations = stoi(argv[++i]);
    } else if (!strcmp(argv[i], "-s") && i < argc - 1) {
      settings.matrixSize = stoi(argv[++i]);
    } else if (!strcmp(argv[i], "-k") && i < argc - 1) {
      settings.numMatrices = stoi(argv[++i]);
    } else if (!strcmp(argv[i], "-r") && i < argc - 1) {
      settings.rhsPerMatrix = stoi(argv[++i]);
    } else if (!strcmp(argv[i], "-B") && i < argc - 1) {
      string backend = argv[++i];
      if (backend == "ref") {
        settings.backend = BackendRef;
      } else if (backend == "blas") {
        settings.backend = BackendFast;
      } else {
        cerr << "Backend '" << backend << "' does not exist! (-h)" << endl;
        return 1;
      }
    }
  }

  runBenchmarks(settings);

  return 0;
}
