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

#include <algorithm>
#include <random>

#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"
#include "util/bit-packing.inline.h"
#include "util/bit-stream-utils.inline.h"

#include "common/names.h"

namespace strata {

template <typename UINT_T>
static UINT_T ComputeMask(int bit_width) {
  return bit_width < sizeof(UINT_T) * CHAR_BIT ?
      static_cast<UINT_T>((1UL << bit_width) - 1) : static_cast<UINT_T>(~0UL);
}

/// Packs the first 'num_values' of 'in' with 'bit_width' and unpacks them from a buffer
/// sized exactly to the packed bytes, at an offset of 'misalignment' bytes.
template <typename UINT_T>
static void PackUnpack(const vector<UINT_T>& in, int num_values, int bit_width,
    int misalignment) {
  const UINT_T mask = ComputeMask<UINT_T>(bit_width);
  const int packed_len = BitUtil::RoundUpNumBytes(bit_width * num_values);
  vector<uint8_t> storage(packed_len + misalignment + 1);
  uint8_t* packed = storage.data() + misalignment;
  BitWriter writer(packed, packed_len);
  for (int i = 0; i < num_values; ++i) {
    ASSERT_TRUE(writer.PutValue(in[i] & mask, bit_width));
  }
  writer.Flush();
  ASSERT_EQ(packed_len, writer.bytes_written());

  vector<UINT_T> out(num_values + 1);
  const auto result = BitPacking::UnpackValues<UINT_T>(
      bit_width, packed, packed_len, num_values, out.data());
  ASSERT_EQ(packed + packed_len, result.first);
  ASSERT_EQ(num_values, result.second);
  for (int i = 0; i < num_values; ++i) {
    ASSERT_EQ(in[i] & mask, out[i]) << "value " << i << " bit width " << bit_width;
  }
}

template <typename UINT_T>
static void RandomPackUnpack() {
  std::mt19937 rng;
  RandTestUtil::SeedRng("BIT_PACKING_TEST_RANDOM_SEED", &rng);
  std::uniform_int_distribution<UINT_T> dist;
  vector<UINT_T> in(4096);
  std::generate(in.begin(), in.end(), [&rng, &dist] { return dist(rng); });

  const int max_bit_width = min<int>(BitPacking::MAX_BITWIDTH, sizeof(UINT_T) * CHAR_BIT);
  for (int bit_width = 0; bit_width <= max_bit_width; ++bit_width) {
    // Cover full and partial batches of 32.
    for (int num_values : {0, 1, 5, 31, 32, 33, 100, 4096 - 19, 4096}) {
      PackUnpack(in, num_values, bit_width, 0);
      PackUnpack(in, num_values, bit_width, 1);
    }
  }
}

TEST(BitPackingTest, RandomUnpack8) {
  RandomPackUnpack<uint8_t>();
}

TEST(BitPackingTest, RandomUnpack16) {
  RandomPackUnpack<uint16_t>();
}

TEST(BitPackingTest, RandomUnpack32) {
  RandomPackUnpack<uint32_t>();
}

TEST(BitPackingTest, RandomUnpack64) {
  RandomPackUnpack<uint64_t>();
}

TEST(BitPackingTest, InputLimitsValues) {
  // Asking for more values than the input holds returns only the complete ones.
  const uint8_t packed[] = {0x1F, 0x00, 0xFF};
  uint32_t out[100];
  const auto result = BitPacking::UnpackValues<uint32_t>(5, packed, sizeof(packed), 100,
      out);
  EXPECT_EQ(4, result.second);
  EXPECT_EQ(31, out[0]);
  EXPECT_EQ(0, out[1]);
}

TEST(BitPackingTest, ZeroBitWidth) {
  uint16_t out[40];
  std::fill(out, out + 40, 7);
  const auto result = BitPacking::UnpackValues<uint16_t>(0, nullptr, 0, 40, out);
  EXPECT_EQ(40, result.second);
  for (uint16_t v : out) EXPECT_EQ(0, v);
}

}

STRATA_TEST_MAIN();
