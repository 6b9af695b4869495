/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef INCLUDE_BUGSIFT_BASE_TIME_H_
#define INCLUDE_BUGSIFT_BASE_TIME_H_

#include <stdint.h>
#include <time.h>

#include <chrono>

#include "bugsift/base/logging.h"

namespace bugsift {
namespace base {

using TimeSeconds = std::chrono::seconds;
using TimeMillis = std::chrono::milliseconds;
using TimeNanos = std::chrono::nanoseconds;

inline TimeNanos FromPosixTimespec(const struct timespec& ts) {
  return TimeNanos(ts.tv_sec * 1000000000LL + ts.tv_nsec);
}

inline TimeNanos GetTimeInternalNs(clockid_t clk_id) {
  struct timespec ts = {};
  BUGSIFT_CHECK(clock_gettime(clk_id, &ts) == 0);
  return FromPosixTimespec(ts);
}

// Monotonic clock. Only meaningful for intervals.
inline TimeNanos GetWallTimeNs() {
  return GetTimeInternalNs(CLOCK_MONOTONIC);
}

inline TimeMillis GetWallTimeMs() {
  return std::chrono::duration_cast<TimeMillis>(GetWallTimeNs());
}

// Real (calendar) time, used where log timestamps lack a year.
inline TimeSeconds GetRealTimeS() {
  return std::chrono::duration_cast<TimeSeconds>(
      GetTimeInternalNs(CLOCK_REALTIME));
}

// Converts a broken-down UTC date into seconds since the Epoch. |month| is
// 1-based, like it appears in logs. Out of range fields are normalized as per
// timegm(3) (e.g. Feb 30 becomes Mar 2).
int64_t MkTime(int year, int month, int day, int h, int m, int s);

// Returns the UTC calendar year of |epoch_secs|.
int GetYear(int64_t epoch_secs);

// Returns the UTC calendar year at the time of the call.
inline int GetCurrentYear() {
  return GetYear(GetRealTimeS().count());
}

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_BASE_TIME_H_
