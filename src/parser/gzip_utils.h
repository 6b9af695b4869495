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

#ifndef SRC_PARSER_GZIP_UTILS_H_
#define SRC_PARSER_GZIP_UTILS_H_

#include <stddef.h>
#include <stdint.h>

#include <memory>

struct z_stream_s;

namespace bugsift {
namespace util {

// Returns true if |data| starts with the gzip magic bytes (1f 8b).
bool IsGzipData(const uint8_t* data, size_t size);

// Streaming inflater for gzip (and raw zlib) streams.
//
// Usage: feed the sequence of compressed blocks one by one by calling Feed().
// After each Feed(), call ExtractOutput() repeatedly to drain the available
// output until it returns kEof or kNeedsMoreInput.
class GzipDecompressor {
 public:
  enum class ResultCode {
    // Nothing bad happened so far. Keep calling ExtractOutput().
    kOk,
    // All the output has been extracted and the stream is complete.
    kEof,
    // Invalid compressed stream or corrupted data.
    kError,
    // All the output available so far has been extracted but the stream is
    // not complete: Feed() the next block.
    kNeedsMoreInput,
  };
  struct Result {
    ResultCode ret;

    // The amount of bytes written to output. Valid in all cases except
    // |ResultCode::kError|.
    size_t bytes_written;
  };

  GzipDecompressor();
  ~GzipDecompressor();
  GzipDecompressor(const GzipDecompressor&) = delete;
  GzipDecompressor& operator=(const GzipDecompressor&) = delete;

  // Feeds the next compressed block. |data| must outlive the subsequent
  // ExtractOutput() calls.
  void Feed(const uint8_t* data, size_t size);

  // Extracts the newly available output into |out|.
  Result ExtractOutput(uint8_t* out, size_t out_size);

  // Feeds |data| and hands all the output it produces to |output_consumer|.
  // Returns the last result code (kEof, kNeedsMoreInput or kError).
  template <typename Callback = void(const uint8_t* ptr, size_t size)>
  ResultCode FeedAndExtract(const uint8_t* data,
                            size_t size,
                            const Callback& output_consumer) {
    Feed(data, size);
    uint8_t buffer[4096];
    Result result;
    do {
      result = ExtractOutput(buffer, sizeof(buffer));
      if (result.ret != ResultCode::kError && result.bytes_written > 0)
        output_consumer(buffer, result.bytes_written);
    } while (result.ret == ResultCode::kOk);
    return result.ret;
  }

  // Resets the state to decompress another stream.
  void Reset();

 private:
  std::unique_ptr<z_stream_s> z_stream_;
};

}  // namespace util
}  // namespace bugsift

#endif  // SRC_PARSER_GZIP_UTILS_H_
