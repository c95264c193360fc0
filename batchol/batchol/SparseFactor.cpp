/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchol/batchol/SparseFactor.h"

#include <cholmod.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <cstring>

#include "batchol/batchol/DebugMacros.h"
#include "batchol/batchol/Utils.h"

namespace BatChol {

using namespace std;

static const char* cholmodStatusString(int status) {
  switch (status) {
    case CHOLMOD_NOT_INSTALLED:
      return "Method not installed";
    case CHOLMOD_OUT_OF_MEMORY:
      return "Out of memory";
    case CHOLMOD_TOO_LARGE:
      return "Integer overflow occured";
    case CHOLMOD_INVALID:
      return "Invalid input";
    case CHOLMOD_NOT_POSDEF:
      return "Matrix not positive definite";
    case CHOLMOD_DSMALL:
      return "D for LDL' or diag(L) or LL' has tiny absolute value";
    case CHOLMOD_OK:
      return "Ok";
    default:
      return "Unknown cholmod status";
  }
}

struct SparseFactor::Impl {
  Impl() { cholmod_l_start(&cc); }

  ~Impl() {
    if (factor != nullptr) {
      cholmod_l_free_factor(&factor, &cc);
    }
    cholmod_l_finish(&cc);
  }

  // throws on errors (negative status), warnings are logged
  void checkStatus(const char* what) const {
    if (cc.status < 0) {
      stringstream ss;
      ss << "CHOLMOD failure in " << what << ": " << cholmodStatusString(cc.status);
      throw std::runtime_error(ss.str());
    }
    if (cc.status > 0 && cc.status != CHOLMOD_NOT_POSDEF) {
      LOG(WARNING) << "CHOLMOD warning in " << what << ": " << cholmodStatusString(cc.status);
    }
  }

  mutable cholmod_common cc;
  cholmod_factor* factor = nullptr;
};

SparseFactor::SparseFactor(std::unique_ptr<Impl>&& impl_) : impl(std::move(impl_)) {}

SparseFactor::~SparseFactor() {}

std::unique_ptr<SparseFactor> SparseFactor::factorize(const SparseMatrix& A,
                                                      const SparseSettings& settings) {
  BATCHOL_CHECK_SHAPE(A.numRows() == A.numCols(),
                      "sparse matrix to factor must be square, got " << A.numRows() << "x"
                                                                     << A.numCols());
  BATCHOL_CHECK_EQ((int64_t)A.vals.size(), A.numNonZeros());

  // cholmod wants non-const pointers and sorted columns
  SparseMatrix sortedA = A;
  sortedA.sortIndices();
  int64_t nnz = sortedA.numNonZeros();
  vector<int64_t> colPtr = std::move(sortedA.ptrs);
  vector<int64_t> rowInd = std::move(sortedA.inds);
  vector<double> val = std::move(sortedA.vals);
  // a null array is rejected even when there are no entries
  rowInd.resize(std::max<int64_t>(nnz, 1));
  val.resize(std::max<int64_t>(nnz, 1));

  std::unique_ptr<Impl> impl(new Impl());
  cholmod_common& cc = impl->cc;
  cc.nmethods = 1;
  cc.method[0].ordering =
      settings.ordering == SparseOrderingNatural ? CHOLMOD_NATURAL : CHOLMOD_AMD;
  cc.postorder = settings.ordering != SparseOrderingNatural;
  switch (settings.factorType) {
    case SparseFactorSimplicial:
      cc.supernodal = CHOLMOD_SIMPLICIAL;
      break;
    case SparseFactorSupernodal:
      cc.supernodal = CHOLMOD_SUPERNODAL;
      break;
    default:
      cc.supernodal = CHOLMOD_AUTO;
  }
  cc.final_ll = 0;

  cholmod_sparse cA;
  memset(&cA, 0, sizeof(cA));
  cA.nzmax = rowInd.size();
  cA.nrow = A.numRows();
  cA.ncol = A.numCols();
  cA.p = colPtr.data();
  cA.i = rowInd.data();
  cA.x = val.data();
  cA.sorted = 1;
  cA.packed = 1;

  // 1: symmetric, stores upper triangular part (lower part is ignored)
  cA.stype = 1;
  cA.itype = CHOLMOD_LONG;
  cA.xtype = CHOLMOD_REAL;
  cA.dtype = CHOLMOD_DOUBLE;

  VLOG(1) << "CHOLMOD analysis (order=" << cA.ncol << ", nz=" << nnz << ")";
  impl->factor = cholmod_l_analyze(&cA, &cc);
  impl->checkStatus("cholmod_l_analyze");
  BATCHOL_CHECK_NOTNULL(impl->factor);

  cholmod_l_factorize(&cA, impl->factor, &cc);
  impl->checkStatus("cholmod_l_factorize");
  if (cc.status == CHOLMOD_NOT_POSDEF || impl->factor->minor < impl->factor->n) {
    BATCHOL_THROW(NotPositiveDefinite, "sparse matrix not positive definite (leading minor "
                                           << impl->factor->minor << " of " << impl->factor->n
                                           << ")");
  }
  VLOG(1) << "CHOLMOD factor: " << (impl->factor->is_super ? "supernodal" : "simplicial")
          << (impl->factor->is_ll ? " LL'" : " LDL'");

  return std::unique_ptr<SparseFactor>(new SparseFactor(std::move(impl)));
}

int64_t SparseFactor::order() const { return impl->factor->n; }

BatchedArray<double> SparseFactor::solve(const BatchedArray<double>& rhs) const {
  int64_t n = order();
  BATCHOL_CHECK_SHAPE(rhs.ndim() >= 1 && rhs.dim(-1) == n,
                      "right-hand side of shape " << shapeToString(rhs.shape)
                                                  << " does not match sparse factor of order "
                                                  << n);
  BatchedArray<double> retv(rhs.shape);
  if (n == 0 || rhs.size() == 0) {
    return retv;
  }
  int64_t nRHS = rhs.size() / n;

  // row-major nRHS x n block is the col-major n x nRHS matrix with a rhs per column
  vector<double> rhsData = rhs.data;
  cholmod_dense cB;
  memset(&cB, 0, sizeof(cB));
  cB.nrow = n;
  cB.ncol = nRHS;
  cB.nzmax = n * nRHS;
  cB.d = n;
  cB.x = rhsData.data();
  cB.xtype = CHOLMOD_REAL;
  cB.dtype = CHOLMOD_DOUBLE;

  cholmod_dense* cX = cholmod_l_solve(CHOLMOD_A, impl->factor, &cB, &impl->cc);
  impl->checkStatus("cholmod_l_solve");
  BATCHOL_CHECK_NOTNULL(cX);
  BATCHOL_CHECK_EQ((int64_t)cX->d, n);
  const double* x = (const double*)cX->x;
  std::copy(x, x + n * nRHS, retv.data.begin());
  cholmod_l_free_dense(&cX, &impl->cc);
  return retv;
}

vector<double> SparseFactor::diagonal() const {
  const cholmod_factor* L = impl->factor;
  const double* Lx = (const double*)L->x;
  vector<double> retv(L->n);
  if (!L->is_super) {
    // simplicial: the diagonal is the first entry of each column
    const int64_t* Lp = (const int64_t*)L->p;
    for (size_t j = 0; j < L->n; j++) {
      retv[j] = Lx[Lp[j]];
    }
  } else {
    // supernodal: each supernode is a dense col-major block of nsrow rows
    const int64_t* super = (const int64_t*)L->super;
    const int64_t* pi = (const int64_t*)L->pi;
    const int64_t* px = (const int64_t*)L->px;
    for (size_t s = 0; s < L->nsuper; s++) {
      int64_t k1 = super[s], k2 = super[s + 1];
      int64_t nsrow = pi[s + 1] - pi[s];
      for (int64_t j = k1; j < k2; j++) {
        retv[j] = Lx[px[s] + (j - k1) * (nsrow + 1)];
      }
    }
  }
  return retv;
}

bool SparseFactor::isLLt() const { return impl->factor->is_ll; }

double SparseFactor::logDeterminant() const {
  double sum = 0;
  for (double d : diagonal()) {
    sum += log(d);
  }
  return isLLt() ? 2 * sum : sum;
}

}  // end namespace BatChol
