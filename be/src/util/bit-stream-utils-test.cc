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

#include <vector>

#include "testutil/gtest-util.h"
#include "util/bit-packing.inline.h"
#include "util/bit-stream-utils.inline.h"

#include "common/names.h"

namespace strata {

TEST(BitStreamTest, BoolLayout) {
  uint8_t buffer[2] = {0, 0};
  BitWriter writer(buffer, sizeof(buffer));
  // 1,0,1,0,... is written LSB first.
  for (int i = 0; i < 8; ++i) ASSERT_TRUE(writer.PutValue((i + 1) % 2, 1));
  for (int i = 0; i < 4; ++i) ASSERT_TRUE(writer.PutValue(1, 1));
  writer.Flush();
  EXPECT_EQ(2, writer.bytes_written());
  EXPECT_EQ(0x55, buffer[0]);
  EXPECT_EQ(0x0F, buffer[1]);

  BatchedBitReader reader(buffer, sizeof(buffer));
  uint8_t vals[12];
  EXPECT_EQ(12, reader.UnpackBatch(1, 12, vals));
  for (int i = 0; i < 8; ++i) EXPECT_EQ((i + 1) % 2, vals[i]) << i;
  for (int i = 8; i < 12; ++i) EXPECT_EQ(1, vals[i]) << i;
}

/// Writes 'num_vals' increasing values of 'bit_width' bits and reads them back both
/// in one batch and in batches of 32.
static void TestValues(int bit_width, uint64_t start, int num_vals) {
  const int len = BitUtil::Ceil(static_cast<int64_t>(bit_width) * num_vals, 8);
  const uint64_t mask = bit_width == 64 ? ~0UL : (1UL << bit_width) - 1;
  vector<uint8_t> buffer(max(len, 1));
  BitWriter writer(buffer.data(), len);
  for (int i = 0; i < num_vals; ++i) {
    ASSERT_TRUE(writer.PutValue((start + i) & mask, bit_width));
  }
  writer.Flush();
  ASSERT_EQ(len, writer.bytes_written());

  BatchedBitReader reader(buffer.data(), len);
  vector<uint64_t> all(num_vals);
  EXPECT_EQ(num_vals, reader.UnpackBatch(bit_width, num_vals, all.data()));
  EXPECT_EQ(0, reader.bytes_left());

  BatchedBitReader batch_reader(buffer.data(), len);
  vector<uint64_t> batch(32);
  for (int i = 0; i < num_vals; ++i) {
    if (i % 32 == 0) {
      int n = min(32, num_vals - i);
      ASSERT_EQ(n, batch_reader.UnpackBatch(bit_width, n, batch.data()));
    }
    EXPECT_EQ((start + i) & mask, all[i]) << "width " << bit_width << " value " << i;
    EXPECT_EQ((start + i) & mask, batch[i % 32]);
  }
}

TEST(BitStreamTest, AllWidths) {
  for (int width = 0; width <= BatchedBitReader::MAX_BITWIDTH; ++width) {
    TestValues(width, 0, 1);
    TestValues(width, 0, 33);
    TestValues(width, 0, 1000);
    TestValues(width, 1099511627775LL, 100);
  }
}

TEST(BitStreamTest, WriterFull) {
  uint8_t buffer[1];
  BitWriter writer(buffer, sizeof(buffer));
  for (int i = 0; i < 8; ++i) EXPECT_TRUE(writer.PutValue(1, 1));
  EXPECT_FALSE(writer.PutValue(1, 1));
}

TEST(BitStreamTest, UnpackPastEnd) {
  const uint8_t buffer[3] = {0xFF, 0xFF, 0xFF};
  BatchedBitReader reader(buffer, sizeof(buffer));
  uint32_t vals[10];
  // Only 4 complete 6 bit values fit in 3 bytes.
  EXPECT_EQ(4, reader.UnpackBatch(6, 10, vals));
  for (int i = 0; i < 4; ++i) EXPECT_EQ(63, vals[i]);
}

template<typename UINT_T>
static void TestUleb128(UINT_T value, const vector<uint8_t>& expected) {
  vector<uint8_t> buffer(BatchedBitReader::max_vlq_byte_len<UINT_T>(), 0);
  BitWriter writer(buffer.data(), buffer.size());
  ASSERT_TRUE(writer.PutUleb128(value));
  writer.Flush();
  ASSERT_EQ(expected.size(), writer.bytes_written());
  EXPECT_EQ(expected, vector<uint8_t>(buffer.begin(), buffer.begin() + expected.size()));

  BatchedBitReader reader(expected.data(), expected.size());
  UINT_T decoded;
  ASSERT_TRUE(reader.GetUleb128<UINT_T>(&decoded));
  EXPECT_EQ(value, decoded);

  // Every proper prefix is truncated.
  for (int len = 0; len < expected.size(); ++len) {
    BatchedBitReader truncated(expected.data(), len);
    EXPECT_FALSE(truncated.GetUleb128<UINT_T>(&decoded)) << len;
  }
}

TEST(BitStreamTest, Uleb128) {
  TestUleb128<uint32_t>(5, {0x05});
  TestUleb128<uint32_t>(200, {0xc8, 0x01});
  TestUleb128<uint32_t>(25248, {0xa0, 0xc5, 0x01});
  TestUleb128<uint32_t>(4294967295, {0xff, 0xff, 0xff, 0xff, 0x0f});
  TestUleb128<uint64_t>(1649267441664, {0x80, 0x80, 0x80, 0x80, 0x80, 0x30});
  TestUleb128<uint64_t>(18446744073709551615U,
      {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01});
}

template<typename INT_T>
static void TestZigZag(INT_T value, const vector<uint8_t>& expected) {
  vector<uint8_t> buffer(BatchedBitReader::max_vlq_byte_len<INT_T>(), 0);
  BitWriter writer(buffer.data(), buffer.size());
  ASSERT_TRUE(writer.PutZigZagInteger(value));
  writer.Flush();
  ASSERT_EQ(expected.size(), writer.bytes_written());
  EXPECT_EQ(expected, vector<uint8_t>(buffer.begin(), buffer.begin() + expected.size()));

  BatchedBitReader reader(expected.data(), expected.size());
  INT_T decoded;
  ASSERT_TRUE(reader.GetZigZagInteger<INT_T>(&decoded));
  EXPECT_EQ(value, decoded);
}

TEST(BitStreamTest, ZigZag) {
  TestZigZag<int32_t>(0, {0x00});
  TestZigZag<int32_t>(-1, {0x01});
  TestZigZag<int32_t>(1, {0x02});
  TestZigZag<int32_t>(-3, {0x05});
  TestZigZag<int32_t>(-2485, {0xe9, 0x26});
  TestZigZag<int64_t>(1629267541664, {0xc0, 0xfa, 0xcd, 0xfe, 0xea, 0x5e});
  TestZigZag<int64_t>(std::numeric_limits<int64_t>::min(),
      {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01});
}

TEST(BitStreamTest, GetBytes) {
  const uint8_t buffer[] = {0x01, 0x02, 0x03};
  BatchedBitReader reader(buffer, sizeof(buffer));
  uint16_t v;
  ASSERT_TRUE(reader.GetBytes(2, &v));
  EXPECT_EQ(0x0201, v);
  EXPECT_FALSE(reader.GetBytes(2, &v));
}

}

STRATA_TEST_MAIN();
