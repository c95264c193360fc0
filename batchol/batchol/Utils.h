/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace BatChol {

// printable timestamp
std::string timeStamp();

// human readable duration, eg "1.25ms"
std::string secondsToString(double secs, int precision = 2);

[[noreturn]] void throwError(const char* file, int line, const char* msg);

template <typename V1, typename V2>
[[noreturn]] void throwError(const char* file, int line, const char* what, const V1& v1,
                             const V2& v2) {
  std::stringstream s;
  s << what << " (" << v1 << " vs. " << v2 << ")";
  throwError(file, line, s.str().c_str());
}

using TimePoint = std::chrono::time_point<std::chrono::high_resolution_clock>;

using hrc = std::chrono::high_resolution_clock;
using tdelta = std::chrono::duration<double>;

// utility to collect timing stats
template <typename... Args>
struct OpStat {
  struct Instance {
    Instance() : stat(nullptr) {}

    Instance(Instance&& that) : stat(that.stat), start(that.start) { that.stat = nullptr; }

    Instance(OpStat* stat, const Args&... args)
        : stat(stat), start(stat ? hrc::now() : TimePoint()), argsTuple(args...) {}

    template <int i, int j, int... ns>
    inline typename std::enable_if<(i < j)>::type invokeCallback(double runTime) {
      invokeCallback<i + 1, j, ns..., i>(runTime);
    }

    template <int i, int j, int... ns>
    inline typename std::enable_if<(i == j)>::type invokeCallback(double runTime) {
      stat->callBack(runTime, std::get<ns>(argsTuple)...);
    }

    ~Instance() {
      if (!stat) {
        return;
      }
      double runTime = tdelta(hrc::now() - start).count();
      stat->numRuns++;
      stat->lastTime = runTime;
      stat->maxTime = std::max(stat->maxTime, runTime);
      stat->totTime += runTime;
      if (stat->callBack) {
        invokeCallback<0, sizeof...(Args)>(runTime);
      }
    }

    OpStat* stat;
    TimePoint start;
    std::tuple<Args...> argsTuple;
  };

  std::string toString() const {
    std::stringstream ss;
    ss << "#=" << numRuns << ", time=" << secondsToString(totTime)
       << ", last=" << secondsToString(lastTime) << ", max=" << secondsToString(maxTime);
    return ss.str();
  }

  void reset() {
    numRuns = 0;
    totTime = 0;
    maxTime = 0;
    lastTime = 0;
  }

  Instance instance(const Args&... args) { return enabled ? Instance(this, args...) : Instance(); }

  bool enabled = true;
  int64_t numRuns = 0;
  double totTime = 0;
  double maxTime = 0;
  double lastTime = 0;
  std::function<void(double, const Args&... args)> callBack;
};

template <typename... Args>
void UNUSED(const Args&... args) {
  (void)(sizeof...(args));
}

// product of all elements of v in range [begin, end)
inline int64_t productOf(const std::vector<int64_t>& v, std::size_t begin, std::size_t end) {
  int64_t retv = 1;
  for (std::size_t i = begin; i < end; i++) {
    retv *= v[i];
  }
  return retv;
}

// do cumulated sum of v's elements, starting from 0
int64_t cumSumVec(std::vector<int64_t>& v);

// set v[i+1] to v[i] for decreasing i, setting v[downTo] = value
void rewindVec(std::vector<int64_t>& v, int64_t downTo = 0, int64_t value = 0);

}  // end namespace BatChol
