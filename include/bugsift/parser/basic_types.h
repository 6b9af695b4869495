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

#ifndef INCLUDE_BUGSIFT_PARSER_BASIC_TYPES_H_
#define INCLUDE_BUGSIFT_PARSER_BASIC_TYPES_H_

#include <stddef.h>
#include <stdint.h>

#include <optional>

namespace bugsift {
namespace parser {

// Default number of raw logcat lines remembered to build preambles.
constexpr size_t kDefaultLogcatRingBufferSize = 500;

// Default number of lines in each of the two preambles attached to a logcat
// event.
constexpr size_t kDefaultPreambleSize = 15;

// Struct for configuring the parsers.
struct Config {
  // Logcat timestamps carry no year. When set, this year is used to build
  // absolute timestamps. When unset, the current wall-clock year is used and
  // the resulting LogcatItem is flagged with |year_inferred|.
  // Bugreports override this with the year of their dumpstate header.
  std::optional<int> logcat_year;

  // Maximum number of parsed logcat lines kept around for preambles. The
  // oldest line is dropped once the buffer grows past this size.
  size_t logcat_ring_buffer_size = kDefaultLogcatRingBufferSize;

  // Number of lines, regardless of their origin, preceding an event.
  size_t last_preamble_size = kDefaultPreambleSize;

  // Number of lines, from the same pid as the event, preceding an event.
  size_t process_preamble_size = kDefaultPreambleSize;
};

}  // namespace parser
}  // namespace bugsift

#endif  // INCLUDE_BUGSIFT_PARSER_BASIC_TYPES_H_
