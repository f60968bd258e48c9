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

#include <random>
#include <vector>

#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"
#include "util/encoding-test-util.h"
#include "util/rle-encoding.h"

#include "common/names.h"

namespace strata {

/// Encodes 'values' with 'bit_width' and checks that decoding in batches of
/// 'batch_size' returns them.
static void ValidateRle(const vector<uint64_t>& values, int bit_width, int batch_size) {
  vector<uint8_t> buffer(RleEncoder::MaxBufferSize(bit_width, values.size()));
  RleEncoder encoder(buffer.data(), buffer.size(), bit_width);
  for (uint64_t v : values) ASSERT_TRUE(encoder.Put(v));
  int len = encoder.Flush();
  ASSERT_GT(len, 0);
  ASSERT_LE(len, buffer.size());

  RleBatchDecoder<uint64_t> decoder;
  decoder.Reset(buffer.data(), len, bit_width);
  vector<uint64_t> decoded(values.size());
  int64_t num_decoded = 0;
  while (num_decoded < values.size()) {
    int32_t n = decoder.GetValues(
        min<int64_t>(batch_size, values.size() - num_decoded), &decoded[num_decoded]);
    ASSERT_GT(n, 0) << "decoded " << num_decoded << " of " << values.size();
    num_decoded += n;
  }
  EXPECT_EQ(values, decoded);
  EXPECT_FALSE(decoder.corrupt());
}

TEST(RleTest, RepeatedRunLayout) {
  // 100 copies of 7 at bit width 3 are a single repeated run: header (100 << 1) as
  // ULEB128 followed by the value in one byte.
  uint8_t buffer[32];
  RleEncoder encoder(buffer, sizeof(buffer), 3);
  for (int i = 0; i < 100; ++i) ASSERT_TRUE(encoder.Put(7));
  int len = encoder.Flush();
  ASSERT_EQ(3, len);
  EXPECT_EQ(0xC8, buffer[0]);
  EXPECT_EQ(0x01, buffer[1]);
  EXPECT_EQ(0x07, buffer[2]);
}

TEST(RleTest, LiteralRunLayout) {
  // Eight distinct values form one bit-packed group: header ((1 << 1) | 1).
  uint8_t buffer[32];
  RleEncoder encoder(buffer, sizeof(buffer), 1);
  for (int i = 0; i < 8; ++i) ASSERT_TRUE(encoder.Put(i % 2));
  int len = encoder.Flush();
  ASSERT_EQ(2, len);
  EXPECT_EQ(0x03, buffer[0]);
  EXPECT_EQ(0xAA, buffer[1]);
}

TEST(RleTest, AllBitWidths) {
  std::mt19937 rng;
  RandTestUtil::SeedRng("RLE_TEST_SEED", &rng);
  for (int bit_width = 1; bit_width <= 32; ++bit_width) {
    for (int length : {1, 7, 8, 9, 100, 1000}) {
      vector<uint64_t> values = MakeRandomSequence(rng, length, 20, bit_width);
      ValidateRle(values, bit_width, 1);
      ValidateRle(values, bit_width, 32);
      ValidateRle(values, bit_width, 1024);
    }
  }
}

TEST(RleTest, MaxBitWidthValues) {
  for (int bit_width : {8, 16, 32, 64}) {
    const uint64_t max_value = bit_width == 64 ? ~0UL : (1UL << bit_width) - 1;
    vector<uint64_t> values;
    for (int i = 0; i < 50; ++i) values.push_back(i % 3 == 0 ? max_value : i);
    for (int i = 0; i < 50; ++i) values.push_back(max_value);
    ValidateRle(values, bit_width, 16);
  }
}

TEST(RleTest, TruncatedInput) {
  uint8_t buffer[64];
  RleEncoder encoder(buffer, sizeof(buffer), 5);
  for (int i = 0; i < 40; ++i) ASSERT_TRUE(encoder.Put(i % 32));
  int len = encoder.Flush();

  RleBatchDecoder<uint32_t> decoder;
  decoder.Reset(buffer, len - 3, 5);
  uint32_t values[40];
  EXPECT_LT(decoder.GetValues(40, values), 40);
}

TEST(RleTest, InvalidRuns) {
  uint32_t values[8];
  // A repeated run of length 0.
  const uint8_t zero_run[] = {0x00, 0x01};
  RleBatchDecoder<uint32_t> decoder;
  decoder.Reset(zero_run, sizeof(zero_run), 1);
  EXPECT_EQ(0, decoder.GetValues(8, values));
  EXPECT_TRUE(decoder.corrupt());

  // A repeated value that doesn't fit the bit width.
  const uint8_t wide_value[] = {0x10, 0x05};
  decoder.Reset(wide_value, sizeof(wide_value), 2);
  EXPECT_EQ(0, decoder.GetValues(8, values));
  EXPECT_TRUE(decoder.corrupt());
}

TEST(RleTest, BufferFull) {
  // The encoder refuses values once the buffer can't hold another run.
  vector<uint8_t> buffer(RleEncoder::MinBufferSize(8));
  RleEncoder encoder(buffer.data(), buffer.size(), 8);
  int num_put = 0;
  while (num_put < 10000 && encoder.Put(num_put % 256)) ++num_put;
  EXPECT_LT(num_put, 10000);
}

}

STRATA_TEST_MAIN();
