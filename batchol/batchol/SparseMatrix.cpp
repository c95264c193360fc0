/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchol/batchol/SparseMatrix.h"
#include <algorithm>
#include <numeric>
#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/Utils.h"

namespace BatChol {

using namespace std;

void SparseMatrix::sortIndices() {
  vector<int64_t> perm;
  vector<int64_t> tmpInds;
  vector<double> tmpVals;
  for (int64_t c = 0; c < numCols(); c++) {
    int64_t start = ptrs[c];
    int64_t end = ptrs[c + 1];
    if (is_sorted(inds.begin() + start, inds.begin() + end)) {
      continue;
    }
    perm.resize(end - start);
    iota(perm.begin(), perm.end(), start);
    sort(perm.begin(), perm.end(), [&](int64_t a, int64_t b) { return inds[a] < inds[b]; });
    tmpInds.clear();
    tmpVals.clear();
    for (int64_t k : perm) {
      tmpInds.push_back(inds[k]);
      tmpVals.push_back(vals[k]);
    }
    copy(tmpInds.begin(), tmpInds.end(), inds.begin() + start);
    copy(tmpVals.begin(), tmpVals.end(), vals.begin() + start);
  }
}

SparseMatrix SparseMatrix::transpose() const {
  SparseMatrix retv;
  retv.nRows = numCols();
  retv.ptrs.assign(nRows + 1, 0);

  for (int64_t c = 0; c < numCols(); c++) {
    for (int64_t k = ptrs[c], kEnd = ptrs[c + 1]; k < kEnd; k++) {
      int64_t r = inds[k];
      BATCHOL_CHECK_LT(r, nRows);
      retv.ptrs[r]++;
    }
  }

  int64_t tot = cumSumVec(retv.ptrs);
  retv.inds.resize(tot);
  retv.vals.resize(tot);

  // columns are visited in order, so row indices of the result come out sorted
  for (int64_t c = 0; c < numCols(); c++) {
    for (int64_t k = ptrs[c], kEnd = ptrs[c + 1]; k < kEnd; k++) {
      int64_t r = inds[k];
      int64_t q = retv.ptrs[r]++;
      retv.inds[q] = c;
      retv.vals[q] = vals[k];
    }
  }

  rewindVec(retv.ptrs);
  return retv;
}

SparseMatrix SparseMatrix::clear(bool clearLower) const {
  BATCHOL_CHECK_EQ(nRows, numCols());
  SparseMatrix retv;
  retv.nRows = nRows;
  retv.ptrs.assign(1, 0);
  for (int64_t c = 0; c < numCols(); c++) {
    for (int64_t k = ptrs[c], kEnd = ptrs[c + 1]; k < kEnd; k++) {
      int64_t r = inds[k];
      if (r != c && (r > c) == clearLower) {
        continue;
      }
      retv.inds.push_back(r);
      retv.vals.push_back(vals[k]);
    }
    retv.ptrs.push_back(retv.inds.size());
  }
  return retv;
}

BatchedArray<double> SparseMatrix::toDense() const {
  BatchedArray<double> retv({nRows, numCols()});
  for (int64_t c = 0; c < numCols(); c++) {
    for (int64_t k = ptrs[c], kEnd = ptrs[c + 1]; k < kEnd; k++) {
      retv.data[inds[k] * numCols() + c] += vals[k];
    }
  }
  return retv;
}

SparseMatrix SparseMatrix::fromTriplets(
    int64_t nRows, int64_t nCols, const vector<tuple<int64_t, int64_t, double>>& entries) {
  SparseMatrix retv;
  retv.nRows = nRows;
  retv.ptrs.assign(nCols + 1, 0);
  for (const auto& [r, c, v] : entries) {
    BATCHOL_CHECK(r >= 0 && r < nRows && c >= 0 && c < nCols);
    retv.ptrs[c]++;
  }

  int64_t tot = cumSumVec(retv.ptrs);
  retv.inds.resize(tot);
  retv.vals.resize(tot);
  for (const auto& [r, c, v] : entries) {
    int64_t q = retv.ptrs[c]++;
    retv.inds[q] = r;
    retv.vals[q] = v;
  }
  rewindVec(retv.ptrs);
  retv.sortIndices();

  // sum duplicates
  int64_t q = 0;
  for (int64_t c = 0; c < nCols; c++) {
    int64_t start = retv.ptrs[c];
    int64_t end = retv.ptrs[c + 1];
    retv.ptrs[c] = q;
    for (int64_t k = start; k < end; k++) {
      if (q > retv.ptrs[c] && retv.inds[q - 1] == retv.inds[k]) {
        retv.vals[q - 1] += retv.vals[k];
      } else {
        retv.inds[q] = retv.inds[k];
        retv.vals[q] = retv.vals[k];
        q++;
      }
    }
  }
  retv.ptrs[nCols] = q;
  retv.inds.resize(q);
  retv.vals.resize(q);
  return retv;
}

SparseMatrix SparseMatrix::fromDense(const BatchedArray<double>& dense) {
  BATCHOL_CHECK_EQ(dense.ndim(), 2);
  int64_t rows = dense.dim(0), cols = dense.dim(1);
  SparseMatrix retv;
  retv.nRows = rows;
  for (int64_t c = 0; c < cols; c++) {
    for (int64_t r = 0; r < rows; r++) {
      double v = dense.data[r * cols + c];
      if (v != 0.0) {
        retv.inds.push_back(r);
        retv.vals.push_back(v);
      }
    }
    retv.ptrs.push_back(retv.inds.size());
  }
  return retv;
}

}  // end namespace BatChol
