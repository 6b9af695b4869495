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

#include "src/parser/gzip_utils.h"

#include <zlib.h>

#include <string>

#include "bugsift/base/logging.h"
#include "test/gtest_and_gmock.h"

namespace bugsift {
namespace util {
namespace {

using ResultCode = GzipDecompressor::ResultCode;

// Compresses |input| in one shot. |window_bits| selects the container:
// MAX_WBITS for zlib, 16 + MAX_WBITS for gzip.
std::string TrivialCompress(const std::string& input, int window_bits) {
  constexpr size_t kBufferLen = 10000;
  std::unique_ptr<char[]> output_ptr(new char[kBufferLen]);
  char* output = output_ptr.get();
  z_stream defstream;
  defstream.zalloc = Z_NULL;
  defstream.zfree = Z_NULL;
  defstream.opaque = Z_NULL;
  defstream.avail_in = uint32_t(input.size());
  defstream.next_in =
      const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
  defstream.avail_out = kBufferLen;
  defstream.next_out = reinterpret_cast<Bytef*>(output);
  BUGSIFT_CHECK(deflateInit2(&defstream, Z_BEST_COMPRESSION, Z_DEFLATED,
                             window_bits, 8, Z_DEFAULT_STRATEGY) == Z_OK);
  BUGSIFT_CHECK(deflate(&defstream, Z_FINISH) == Z_STREAM_END);
  deflateEnd(&defstream);
  BUGSIFT_CHECK(defstream.avail_out > 0);
  return std::string(output, kBufferLen - defstream.avail_out);
}

struct DecompressResult {
  ResultCode ret;
  std::string output;
};

DecompressResult TrivialDecompress(const std::string& input) {
  DecompressResult result;
  GzipDecompressor decompressor;
  result.ret = decompressor.FeedAndExtract(
      reinterpret_cast<const uint8_t*>(input.data()), input.size(),
      [&result](const uint8_t* data, size_t len) {
        result.output.append(reinterpret_cast<const char*>(data), len);
      });
  return result;
}

TEST(GzipDecompressorTest, Gzip) {
  std::string input = "04-25 09:55:47.799  3064  3082 E AndroidRuntime: boom";
  std::string compressed = TrivialCompress(input, 16 + MAX_WBITS);
  EXPECT_TRUE(IsGzipData(reinterpret_cast<const uint8_t*>(compressed.data()),
                         compressed.size()));

  DecompressResult result = TrivialDecompress(compressed);
  EXPECT_EQ(result.ret, ResultCode::kEof);
  EXPECT_EQ(result.output, input);
}

TEST(GzipDecompressorTest, Zlib) {
  std::string input = "Abc..Def..Ghi";
  std::string compressed = TrivialCompress(input, MAX_WBITS);
  EXPECT_FALSE(IsGzipData(reinterpret_cast<const uint8_t*>(compressed.data()),
                          compressed.size()));

  DecompressResult result = TrivialDecompress(compressed);
  EXPECT_EQ(result.ret, ResultCode::kEof);
  EXPECT_EQ(result.output, input);
}

TEST(GzipDecompressorTest, Streaming) {
  std::string input;
  for (int i = 0; i < 1000; i++)
    input += "Abc..Def..Ghi.\n";
  std::string compressed = TrivialCompress(input, 16 + MAX_WBITS);
  ASSERT_GT(compressed.size(), 17u);

  std::string decompressed;
  auto consumer = [&decompressed](const uint8_t* data, size_t len) {
    decompressed.append(reinterpret_cast<const char*>(data), len);
  };
  GzipDecompressor decompressor;
  auto compressed_u8 = reinterpret_cast<const uint8_t*>(compressed.data());
  EXPECT_EQ(decompressor.FeedAndExtract(compressed_u8, 7, consumer),
            ResultCode::kNeedsMoreInput);
  EXPECT_EQ(decompressor.FeedAndExtract(compressed_u8 + 7, 10, consumer),
            ResultCode::kNeedsMoreInput);
  EXPECT_EQ(decompressor.FeedAndExtract(compressed_u8 + 17,
                                        compressed.size() - 17, consumer),
            ResultCode::kEof);
  EXPECT_EQ(decompressed, input);
}

TEST(GzipDecompressorTest, Reset) {
  std::string first = TrivialCompress("first", 16 + MAX_WBITS);
  std::string second = TrivialCompress("second", 16 + MAX_WBITS);
  std::string output;
  auto consumer = [&output](const uint8_t* data, size_t len) {
    output.append(reinterpret_cast<const char*>(data), len);
  };

  GzipDecompressor decompressor;
  EXPECT_EQ(decompressor.FeedAndExtract(
                reinterpret_cast<const uint8_t*>(first.data()), first.size(),
                consumer),
            ResultCode::kEof);
  decompressor.Reset();
  EXPECT_EQ(decompressor.FeedAndExtract(
                reinterpret_cast<const uint8_t*>(second.data()),
                second.size(), consumer),
            ResultCode::kEof);
  EXPECT_EQ(output, "firstsecond");
}

TEST(GzipDecompressorTest, CorruptStream) {
  std::string compressed = TrivialCompress("Abc..Def..Ghi", 16 + MAX_WBITS);
  // Clobber the compression method byte of the gzip header.
  compressed[2] = 0x42;
  EXPECT_EQ(TrivialDecompress(compressed).ret, ResultCode::kError);
}

TEST(GzipDecompressorTest, IsGzipData) {
  const uint8_t kGzip[] = {0x1f, 0x8b, 0x08};
  const uint8_t kText[] = {'-', '-', '-'};
  EXPECT_TRUE(IsGzipData(kGzip, sizeof(kGzip)));
  EXPECT_FALSE(IsGzipData(kGzip, 1));
  EXPECT_FALSE(IsGzipData(kText, sizeof(kText)));
  EXPECT_FALSE(IsGzipData(nullptr, 0));
}

}  // namespace
}  // namespace util
}  // namespace bugsift
