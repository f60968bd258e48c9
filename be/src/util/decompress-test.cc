// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <cstring>
#include <random>
#include <vector>

#include <boost/scoped_ptr.hpp>

#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"
#include "util/codec.h"
#include "util/compress.h"
#include "util/decompress.h"

#include "common/names.h"

using boost::scoped_ptr;

namespace strata {

// Fixture for testing the page compression codecs.
class DecompressorTest : public ::testing::Test {
 protected:
  DecompressorTest() {
    uint8_t* ip = input_;
    for (int i = 0; i < 1024; i++) {
      for (uint8_t ch = 'a'; ch <= 'z'; ++ch) {
        *ip++ = ch;
      }
      for (uint8_t ch = 'Z'; ch >= 'A'; --ch) {
        *ip++ = ch;
      }
    }
  }

  void RunTest(columnar::CompressionCodec::type format, int clevel = 0) {
    scoped_ptr<Codec> compressor;
    scoped_ptr<Codec> decompressor;

    ASSERT_OK(Codec::CreateCompressor(format, clevel, &compressor));
    ASSERT_OK(Codec::CreateDecompressor(format, &decompressor));
    ASSERT_TRUE(compressor != nullptr);
    ASSERT_TRUE(decompressor != nullptr);
    EXPECT_EQ(format, compressor->format());

    CompressAndDecompress(compressor.get(), decompressor.get(), sizeof(input_), input_);
    // Odd-length input.
    CompressAndDecompress(compressor.get(), decompressor.get(), sizeof(input_) - 1,
        input_);
    CompressAndDecompress(compressor.get(), decompressor.get(), 1024, input_);
    // Empty input.
    CompressAndDecompress(compressor.get(), decompressor.get(), 0, input_);
    DecompressUnderSizedOutputBuffer(compressor.get(), decompressor.get(),
        sizeof(input_), input_);
  }

  void CompressAndDecompress(Codec* compressor, Codec* decompressor,
      int64_t input_len, uint8_t* input) {
    vector<uint8_t> compressed;
    Compress(compressor, input_len, input, &compressed);

    vector<uint8_t> output(input_len + 1);
    int64_t output_len = input_len;
    EXPECT_OK(decompressor->ProcessBlock(compressed.size(), compressed.data(),
        &output_len, output.data()));
    EXPECT_EQ(output_len, input_len);
    EXPECT_EQ(memcmp(input, output.data(), input_len), 0);
  }

  // Decompressing into a buffer one byte too small must fail rather than overrun.
  void DecompressUnderSizedOutputBuffer(Codec* compressor, Codec* decompressor,
      int64_t input_len, uint8_t* input) {
    vector<uint8_t> compressed;
    Compress(compressor, input_len, input, &compressed);

    vector<uint8_t> output(input_len);
    int64_t output_len = input_len - 1;
    Status status = decompressor->ProcessBlock(compressed.size(), compressed.data(),
        &output_len, output.data());
    EXPECT_ERROR(status, TErrorCode::COMPRESSION_ERROR);
    EXPECT_EQ(output_len, 0);
  }

  void Compress(Codec* compressor, int64_t input_len, uint8_t* input,
      vector<uint8_t>* compressed) {
    int64_t max_compressed_length = compressor->MaxOutputLen(input_len, input);
    ASSERT_GT(max_compressed_length, 0);
    compressed->resize(max_compressed_length);
    int64_t compressed_length = max_compressed_length;
    ASSERT_OK(compressor->ProcessBlock(input_len, input, &compressed_length,
        compressed->data()));
    ASSERT_LE(compressed_length, max_compressed_length);
    compressed->resize(compressed_length);
  }

  uint8_t input_[2 * 26 * 1024];
};

TEST_F(DecompressorTest, Deflate) {
  RunTest(columnar::CompressionCodec::DEFLATE);
}

TEST_F(DecompressorTest, Gzip) {
  RunTest(columnar::CompressionCodec::GZIP);
  RunTest(columnar::CompressionCodec::GZIP, 9);
}

TEST_F(DecompressorTest, Snappy) {
  RunTest(columnar::CompressionCodec::SNAPPY);
}

TEST_F(DecompressorTest, LZ4) {
  RunTest(columnar::CompressionCodec::LZ4);
}

TEST_F(DecompressorTest, ZSTD) {
  RunTest(columnar::CompressionCodec::ZSTD);
  RunTest(columnar::CompressionCodec::ZSTD, 1);
  RunTest(columnar::CompressionCodec::ZSTD, 19);
}

TEST_F(DecompressorTest, Uncompressed) {
  scoped_ptr<Codec> codec;
  ASSERT_OK(Codec::CreateCompressor(columnar::CompressionCodec::UNCOMPRESSED, 0, &codec));
  EXPECT_TRUE(codec == nullptr);
  ASSERT_OK(Codec::CreateDecompressor(columnar::CompressionCodec::UNCOMPRESSED, &codec));
  EXPECT_TRUE(codec == nullptr);
}

// Random bytes compress poorly, which exercises the MaxOutputLen() bound.
TEST_F(DecompressorTest, RandomInput) {
  std::mt19937 rng;
  RandTestUtil::SeedRng("STRATA_DECOMPRESS_TEST_SEED", &rng);
  std::uniform_int_distribution<int> dist(0, 255);
  vector<uint8_t> random_input(64 * 1024);
  for (uint8_t& b : random_input) b = static_cast<uint8_t>(dist(rng));
  for (auto format : {columnar::CompressionCodec::GZIP,
           columnar::CompressionCodec::DEFLATE, columnar::CompressionCodec::SNAPPY,
           columnar::CompressionCodec::LZ4, columnar::CompressionCodec::ZSTD}) {
    scoped_ptr<Codec> compressor;
    scoped_ptr<Codec> decompressor;
    ASSERT_OK(Codec::CreateCompressor(format, 0, &compressor));
    ASSERT_OK(Codec::CreateDecompressor(format, &decompressor));
    CompressAndDecompress(compressor.get(), decompressor.get(), random_input.size(),
        random_input.data());
  }
}

TEST_F(DecompressorTest, CorruptSnappyInput) {
  scoped_ptr<Codec> decompressor;
  ASSERT_OK(Codec::CreateDecompressor(columnar::CompressionCodec::SNAPPY, &decompressor));
  // A varint length prefix that never terminates.
  uint8_t corrupt[] = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
  uint8_t output[16];
  int64_t output_len = sizeof(output);
  EXPECT_ERROR(decompressor->ProcessBlock(sizeof(corrupt), corrupt, &output_len, output),
      TErrorCode::COMPRESSION_ERROR);
}

TEST_F(DecompressorTest, CodecNames) {
  columnar::CompressionCodec::type format;
  ASSERT_OK(Codec::ParseCodecName("snappy", &format));
  EXPECT_EQ(columnar::CompressionCodec::SNAPPY, format);
  ASSERT_OK(Codec::ParseCodecName("NONE", &format));
  EXPECT_EQ(columnar::CompressionCodec::UNCOMPRESSED, format);
  ASSERT_OK(Codec::ParseCodecName(" Zstd ", &format));
  EXPECT_EQ(columnar::CompressionCodec::ZSTD, format);
  EXPECT_ERROR(Codec::ParseCodecName("bzip2", &format), TErrorCode::COMPRESSION_ERROR);
  EXPECT_EQ("lz4", Codec::GetCodecName(columnar::CompressionCodec::LZ4));
}

}

STRATA_TEST_MAIN();
