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

#ifndef INCLUDE_BUGSIFT_BASE_BUILD_CONFIG_H_
#define INCLUDE_BUGSIFT_BASE_BUILD_CONFIG_H_

// Allows to define build flags that give a compiler error if the header that
// defined the flag is not included, instead of silently ignoring the #if block.
#define BUGSIFT_BUILDFLAG_CAT_INDIRECT(a, b) a##b
#define BUGSIFT_BUILDFLAG_CAT(a, b) BUGSIFT_BUILDFLAG_CAT_INDIRECT(a, b)
#define BUGSIFT_BUILDFLAG(flag) \
  (BUGSIFT_BUILDFLAG_CAT(BUGSIFT_BUILDFLAG_DEFINE_, flag)())

#if defined(__ANDROID__)
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_ANDROID() 1
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_APPLE() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_LINUX() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_WIN() 0
#elif defined(__APPLE__)
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_ANDROID() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_APPLE() 1
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_LINUX() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_WIN() 0
#elif defined(__linux__)
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_ANDROID() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_APPLE() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_LINUX() 1
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_WIN() 0
#elif defined(_WIN32)
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_ANDROID() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_APPLE() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_LINUX() 0
#define BUGSIFT_BUILDFLAG_DEFINE_BUGSIFT_OS_WIN() 1
#else
#error OS not supported (see build_config.h)
#endif

#endif  // INCLUDE_BUGSIFT_BASE_BUILD_CONFIG_H_
