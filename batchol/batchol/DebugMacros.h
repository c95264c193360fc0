/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <iostream>
#include <sstream>
#include "batchol/batchol/Errors.h"
#include "batchol/batchol/Utils.h"

#ifndef NO_BATCHOL_CHECKS
#define BATCHOL_CHECKS
#endif  // NO_BATCHOL_CHECKS

#define BATCHOL_CHECK_WHAT1(a, msg)                 \
  if (!(a)) {                                       \
    ::BatChol::throwError(__FILE__, __LINE__, msg); \
  }

#define BATCHOL_CHECK_WHAT2(a, what, v1, v2)                 \
  if (!(a)) {                                                \
    ::BatChol::throwError(__FILE__, __LINE__, what, v1, v2); \
  }

#if defined(BATCHOL_CHECKS)
#define BATCHOL_CHECK(a) BATCHOL_CHECK_WHAT1(a, #a)
#define BATCHOL_CHECK_OP(a, b, op)                                       \
  {                                                                      \
    auto aEval = a;                                                      \
    auto bEval = b;                                                      \
    BATCHOL_CHECK_WHAT2(aEval op bEval, #a " " #op " " #b, aEval, bEval) \
  }
#else
#define BATCHOL_CHECK(a) ::BatChol::UNUSED(a)
#define BATCHOL_CHECK_OP(a, b, op) ::BatChol::UNUSED(a, b)
#endif

#define BATCHOL_CHECK_EQ(a, b) BATCHOL_CHECK_OP(a, b, ==)
#define BATCHOL_CHECK_LE(a, b) BATCHOL_CHECK_OP(a, b, <=)
#define BATCHOL_CHECK_LT(a, b) BATCHOL_CHECK_OP(a, b, <)
#define BATCHOL_CHECK_GE(a, b) BATCHOL_CHECK_OP(a, b, >=)
#define BATCHOL_CHECK_GT(a, b) BATCHOL_CHECK_OP(a, b, >)

#define BATCHOL_CHECK_NOTNULL(a)                                       \
  {                                                                    \
    auto aEval = a;                                                    \
    BATCHOL_CHECK_WHAT1(aEval != nullptr, "'" #a "' Must be non NULL") \
  }

// throws a typed error (see Errors.h), message is a stream expression:
//   BATCHOL_THROW(ShapeMismatch, "got " << a << ", expected " << b);
#define BATCHOL_THROW(ErrorType, streamExpr)                                \
  {                                                                         \
    std::stringstream batcholMsg;                                           \
    batcholMsg << "[" << __FILE__ << ":" << __LINE__ << "] " << streamExpr; \
    throw ::BatChol::ErrorType(batcholMsg.str());                           \
  }

#define BATCHOL_CHECK_SHAPE(a, streamExpr)     \
  if (!(a)) {                                  \
    BATCHOL_THROW(ShapeMismatch, streamExpr); \
  }
