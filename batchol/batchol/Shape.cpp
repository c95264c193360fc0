/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchol/batchol/Shape.h"
#include <algorithm>
#include <sstream>
#include "batchol/batchol/DebugMacros.h"

namespace BatChol {

using namespace std;

int64_t numElements(const BatchShape& shape) { return productOf(shape, 0, shape.size()); }

vector<int64_t> rowMajorStrides(const BatchShape& shape, int64_t innerSize) {
  vector<int64_t> strides(shape.size());
  int64_t stride = innerSize;
  for (int64_t i = (int64_t)shape.size() - 1; i >= 0; i--) {
    strides[i] = stride;
    stride *= shape[i];
  }
  return strides;
}

BatchShape broadcastBatchShape(const BatchShape& a, const BatchShape& b) {
  const BatchShape& longer = a.size() >= b.size() ? a : b;
  const BatchShape& shorter = a.size() >= b.size() ? b : a;
  int64_t offset = longer.size() - shorter.size();

  BatchShape retv(longer);
  for (size_t i = 0; i < shorter.size(); i++) {
    int64_t dl = longer[offset + i];
    int64_t ds = shorter[i];
    if (dl == ds || ds == 1) {
      continue;
    }
    BATCHOL_CHECK_SHAPE(dl == 1, "batch shapes " << shapeToString(a) << " and "
                                                 << shapeToString(b) << " are not broadcastable");
    retv[offset + i] = ds;
  }
  return retv;
}

vector<int64_t> classifyAxes(const BatchShape& shapeU, const BatchShape& shapeB) {
  int64_t lU = shapeU.size();
  int64_t lB = shapeB.size();
  int64_t lMin = std::min(lU, lB);

  vector<int64_t> aligned;
  for (int64_t i = -lMin; i < 0; i++) {
    if (shapeB[lB + i] == shapeU[lU + i]) {
      aligned.push_back(i);
    }
  }
  return aligned;
}

vector<int64_t> broadcastStrides(const BatchShape& src, const BatchShape& target,
                                 int64_t innerSize) {
  BATCHOL_CHECK_LE(src.size(), target.size());
  vector<int64_t> srcStrides = rowMajorStrides(src, innerSize);
  vector<int64_t> retv(target.size(), 0);
  int64_t offset = target.size() - src.size();
  for (size_t i = 0; i < src.size(); i++) {
    if (src[i] == target[offset + i]) {
      retv[offset + i] = srcStrides[i];
    } else {
      BATCHOL_CHECK_SHAPE(src[i] == 1, "shape " << shapeToString(src) << " cannot broadcast to "
                                                << shapeToString(target));
    }
  }
  return retv;
}

string shapeToString(const BatchShape& shape) {
  stringstream ss;
  ss << "(";
  for (size_t i = 0; i < shape.size(); i++) {
    ss << (i > 0 ? ", " : "") << shape[i];
  }
  ss << ")";
  return ss.str();
}

}  // end namespace BatChol
