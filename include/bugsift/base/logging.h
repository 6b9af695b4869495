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

#ifndef INCLUDE_BUGSIFT_BASE_LOGGING_H_
#define INCLUDE_BUGSIFT_BASE_LOGGING_H_

#include <errno.h>
#include <string.h>  // For strerror.

#include "bugsift/base/build_config.h"
#include "bugsift/base/compiler.h"

#if defined(NDEBUG) && !defined(BUGSIFT_DCHECK_ALWAYS_ON)
#define BUGSIFT_DCHECK_IS_ON() 0
#else
#define BUGSIFT_DCHECK_IS_ON() 1
#endif

#if !defined(BUGSIFT_FORCE_DLOG)
#define BUGSIFT_DLOG_IS_ON() BUGSIFT_DCHECK_IS_ON()
#else
#define BUGSIFT_DLOG_IS_ON() BUGSIFT_FORCE_DLOG
#endif

namespace bugsift {
namespace base {

// Constexpr functions to extract basename(__FILE__), e.g.: ../foo/f.c -> f.c .
constexpr const char* StrEnd(const char* s) {
  return *s ? StrEnd(s + 1) : s;
}

constexpr const char* BasenameRecursive(const char* s,
                                        const char* begin,
                                        const char* end) {
  return (*s == '/' && s < end)
             ? (s + 1)
             : ((s > begin) ? BasenameRecursive(s - 1, begin, end) : s);
}

constexpr const char* Basename(const char* str) {
  return BasenameRecursive(StrEnd(str), str, StrEnd(str));
}

enum LogLev { kLogDebug = 0, kLogInfo, kLogImportant, kLogError };

struct LogMessageCallbackArgs {
  LogLev level;
  int line;
  const char* filename;
  const char* message;
};

using LogMessageCallback = void (*)(LogMessageCallbackArgs);

// Routes log records to |callback| instead of stderr. Passing nullptr restores
// the default. Not thread safe: call it before parsing on other threads.
void SetLogMessageCallback(LogMessageCallback callback);

void LogMessage(LogLev,
                const char* fname,
                int line,
                const char* fmt,
                ...) BUGSIFT_PRINTF_FORMAT(4, 5);

#define BUGSIFT_XLOG(level, fmt, ...)                                       \
  ::bugsift::base::LogMessage(level, ::bugsift::base::Basename(__FILE__), \
                              __LINE__, fmt, ##__VA_ARGS__)

#define BUGSIFT_IMMEDIATE_CRASH() \
  do {                            \
    __builtin_trap();             \
    __builtin_unreachable();      \
  } while (0)

#define BUGSIFT_LOG(fmt, ...) \
  BUGSIFT_XLOG(::bugsift::base::kLogInfo, fmt, ##__VA_ARGS__)
#define BUGSIFT_ILOG(fmt, ...) \
  BUGSIFT_XLOG(::bugsift::base::kLogImportant, fmt, ##__VA_ARGS__)
#define BUGSIFT_ELOG(fmt, ...) \
  BUGSIFT_XLOG(::bugsift::base::kLogError, fmt, ##__VA_ARGS__)
#define BUGSIFT_FATAL(fmt, ...)       \
  do {                                \
    BUGSIFT_PLOG(fmt, ##__VA_ARGS__); \
    BUGSIFT_IMMEDIATE_CRASH();        \
  } while (0)

#define BUGSIFT_PLOG(x, ...) \
  BUGSIFT_ELOG(x " (errno: %d, %s)", ##__VA_ARGS__, errno, strerror(errno))

#if BUGSIFT_DLOG_IS_ON()

#define BUGSIFT_DLOG(fmt, ...) \
  BUGSIFT_XLOG(::bugsift::base::kLogDebug, fmt, ##__VA_ARGS__)

#else

#define BUGSIFT_DLOG(...) ::bugsift::base::ignore_result(__VA_ARGS__)

#endif  // BUGSIFT_DLOG_IS_ON()

#define BUGSIFT_CHECK(x)                            \
  do {                                              \
    if (BUGSIFT_UNLIKELY(!(x))) {                   \
      BUGSIFT_PLOG("%s", "BUGSIFT_CHECK(" #x ")"); \
      BUGSIFT_IMMEDIATE_CRASH();                    \
    }                                               \
  } while (0)

#if BUGSIFT_DCHECK_IS_ON()

#define BUGSIFT_DCHECK(x) BUGSIFT_CHECK(x)

#else

#define BUGSIFT_DCHECK(x) \
  do {                    \
  } while (false && (x))

#endif  // BUGSIFT_DCHECK_IS_ON()

}  // namespace base
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_BASE_LOGGING_H_
