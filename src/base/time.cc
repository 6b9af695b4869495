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

#include "bugsift/base/time.h"

#include <string.h>

namespace bugsift {
namespace base {

int64_t MkTime(int year, int month, int day, int h, int m, int s) {
  struct tm tms;
  memset(&tms, 0, sizeof(tms));
  tms.tm_year = year - 1900;
  tms.tm_mon = month - 1;
  tms.tm_mday = day;
  tms.tm_hour = h;
  tms.tm_min = m;
  tms.tm_sec = s;
  return static_cast<int64_t>(timegm(&tms));
}

int GetYear(int64_t epoch_secs) {
  time_t t = static_cast<time_t>(epoch_secs);
  struct tm tms;
  memset(&tms, 0, sizeof(tms));
  BUGSIFT_CHECK(gmtime_r(&t, &tms) != nullptr);
  return tms.tm_year + 1900;
}

}  // namespace base
}  // namespace bugsift
