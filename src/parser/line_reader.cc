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

#include "src/parser/line_reader.h"

#include <errno.h>
#include <string.h>

#include "bugsift/base/logging.h"
#include "bugsift/base/status.h"
#include "bugsift/ext/base/file_utils.h"
#include "src/parser/gzip_utils.h"

namespace bugsift {
namespace parser {

namespace {

base::StatusOr<std::string> Gunzip(const std::string& compressed) {
  util::GzipDecompressor decompressor;
  std::string out;
  using ResultCode = util::GzipDecompressor::ResultCode;
  ResultCode ret = decompressor.FeedAndExtract(
      reinterpret_cast<const uint8_t*>(compressed.data()), compressed.size(),
      [&out](const uint8_t* data, size_t size) {
        out.append(reinterpret_cast<const char*>(data), size);
      });
  if (ret == ResultCode::kError)
    return base::ErrStatus("Failed to decompress gzip data");
  if (ret == ResultCode::kNeedsMoreInput)
    return base::ErrStatus("Truncated gzip data");
  return out;
}

}  // namespace

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos)
      end = text.size();
    size_t len = end - start;
    if (len > 0 && text[end - 1] == '\r')
      len--;
    lines.emplace_back(text, start, len);
    start = end + 1;
  }
  return lines;
}

base::StatusOr<std::vector<std::string>> ReadFileLines(
    const std::string& path) {
  std::string contents;
  if (!base::ReadFile(path, &contents)) {
    return base::ErrStatus("Could not read %s: %s", path.c_str(),
                           strerror(errno));
  }
  if (util::IsGzipData(reinterpret_cast<const uint8_t*>(contents.data()),
                       contents.size())) {
    BUGSIFT_DLOG("Inflating gzip file %s", path.c_str());
    base::StatusOr<std::string> inflated = Gunzip(contents);
    if (!inflated.ok()) {
      return base::ErrStatus("%s: %s", path.c_str(),
                             inflated.status().c_message());
    }
    contents = std::move(inflated.value());
  }
  return SplitLines(contents);
}

}  // namespace parser
}  // namespace bugsift
