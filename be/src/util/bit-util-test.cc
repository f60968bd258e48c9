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

#include "testutil/gtest-util.h"
#include "util/bit-util.h"

#include "common/names.h"

namespace strata {

TEST(BitUtil, Ceil) {
  EXPECT_EQ(0, BitUtil::Ceil(0, 1));
  EXPECT_EQ(1, BitUtil::Ceil(1, 1));
  EXPECT_EQ(1, BitUtil::Ceil(1, 2));
  EXPECT_EQ(1, BitUtil::Ceil(1, 8));
  EXPECT_EQ(1, BitUtil::Ceil(7, 8));
  EXPECT_EQ(1, BitUtil::Ceil(8, 8));
  EXPECT_EQ(2, BitUtil::Ceil(9, 8));
}

TEST(BitUtil, Rounding) {
  EXPECT_EQ(0, BitUtil::RoundUp(0, 8));
  EXPECT_EQ(8, BitUtil::RoundUp(1, 8));
  EXPECT_EQ(16, BitUtil::RoundUp(9, 8));
  EXPECT_EQ(0, BitUtil::RoundDown(7, 8));
  EXPECT_EQ(8, BitUtil::RoundDown(15, 8));
  EXPECT_EQ(0, BitUtil::RoundUpNumBytes(0));
  EXPECT_EQ(1, BitUtil::RoundUpNumBytes(1));
  EXPECT_EQ(1, BitUtil::RoundUpNumBytes(8));
  EXPECT_EQ(2, BitUtil::RoundUpNumBytes(9));
  EXPECT_TRUE(BitUtil::IsPowerOf2(64));
  EXPECT_FALSE(BitUtil::IsPowerOf2(65));
}

TEST(BitUtil, TrailingBits) {
  EXPECT_EQ(0, BitUtil::TrailingBits(0xFF, 0));
  EXPECT_EQ(1, BitUtil::TrailingBits(0xFF, 1));
  EXPECT_EQ(0x3F, BitUtil::TrailingBits(0xFF, 6));
  EXPECT_EQ(0xFF, BitUtil::TrailingBits(0xFF, 64));
  EXPECT_EQ(0xFF, BitUtil::TrailingBits(0xFF, 100));
}

TEST(BitUtil, Log2) {
  EXPECT_EQ(-1, BitUtil::Log2Floor64(0));
  EXPECT_EQ(0, BitUtil::Log2Floor64(1));
  EXPECT_EQ(1, BitUtil::Log2Floor64(3));
  EXPECT_EQ(63, BitUtil::Log2Floor64(~0UL));
  EXPECT_EQ(0, BitUtil::Log2Ceiling64(1));
  EXPECT_EQ(1, BitUtil::Log2Ceiling64(2));
  EXPECT_EQ(2, BitUtil::Log2Ceiling64(3));
  EXPECT_EQ(2, BitUtil::Log2Ceiling64(4));
  EXPECT_EQ(3, BitUtil::Log2Ceiling64(5));
  EXPECT_EQ(10, BitUtil::Log2Ceiling64(1024));
  EXPECT_EQ(11, BitUtil::Log2Ceiling64(1025));
}

TEST(BitUtil, NumRequiredBits) {
  EXPECT_EQ(0, BitUtil::NumRequiredBits(0));
  EXPECT_EQ(1, BitUtil::NumRequiredBits(1));
  EXPECT_EQ(2, BitUtil::NumRequiredBits(2));
  EXPECT_EQ(2, BitUtil::NumRequiredBits(3));
  EXPECT_EQ(8, BitUtil::NumRequiredBits(255));
  EXPECT_EQ(9, BitUtil::NumRequiredBits(256));
  EXPECT_EQ(64, BitUtil::NumRequiredBits(~0UL));
}

TEST(BitUtil, CountLeadingZeros) {
  EXPECT_EQ(32, BitUtil::CountLeadingZeros<uint32_t>(0));
  EXPECT_EQ(31, BitUtil::CountLeadingZeros<uint32_t>(1));
  EXPECT_EQ(64, BitUtil::CountLeadingZeros<uint64_t>(0));
  EXPECT_EQ(0, BitUtil::CountLeadingZeros<int64_t>(-1));
}

TEST(BitUtil, ByteSwapAndShift) {
  EXPECT_EQ(0x78563412U, BitUtil::ByteSwap(static_cast<uint32_t>(0x12345678)));
  EXPECT_EQ(0x0807060504030201UL,
      BitUtil::ByteSwap(static_cast<uint64_t>(0x0102030405060708UL)));
  EXPECT_EQ(0x7FFFFFFF, BitUtil::ShiftRightLogical<int32_t>(-1, 1));
  EXPECT_EQ(1, BitUtil::FromLittleEndian(BitUtil::ToLittleEndian(1)));
}

}

STRATA_TEST_MAIN();
