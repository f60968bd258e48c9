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

#include "exec/level-codec.h"
#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"

#include "common/names.h"

namespace strata {

typedef columnar::Encoding E;

static vector<int16_t> RandomLevels(int max_level, int num_levels, std::mt19937* rng) {
  std::uniform_int_distribution<int> dist(0, max_level);
  std::uniform_int_distribution<int> run_dist(1, 40);
  vector<int16_t> levels;
  // Mix long runs with noise so both RLE run kinds are exercised.
  while (levels.size() < num_levels) {
    int16_t level = dist(*rng);
    int run = run_dist(*rng);
    if (run % 2 == 0) run = 1;
    for (int i = 0; i < run && levels.size() < num_levels; ++i) levels.push_back(level);
  }
  return levels;
}

static void RoundTrip(E::type encoding, int max_level, const vector<int16_t>& levels) {
  LevelEncoder encoder(encoding, max_level);
  vector<uint8_t> encoded;
  ASSERT_OK(encoder.Encode(levels.data(), levels.size(), &encoded));
  EXPECT_LE(encoded.size(), encoder.MaxBufferSize(levels.size()));
  vector<int16_t> decoded;
  ASSERT_OK(LevelDecoder::Decode("a.b", encoding, max_level, encoded.data(),
      encoded.size(), levels.size(), 0, &decoded));
  EXPECT_EQ(levels, decoded);
}

TEST(LevelCodecTest, BitWidth) {
  EXPECT_EQ(0, LevelBitWidth(0));
  EXPECT_EQ(1, LevelBitWidth(1));
  EXPECT_EQ(2, LevelBitWidth(2));
  EXPECT_EQ(2, LevelBitWidth(3));
  EXPECT_EQ(3, LevelBitWidth(4));
  EXPECT_EQ(7, LevelBitWidth(100));
}

TEST(LevelCodecTest, RoundTrip) {
  std::mt19937 rng;
  RandTestUtil::SeedRng("LEVEL_CODEC_TEST_SEED", &rng);
  for (int max_level : {1, 2, 3, 7, 8, 100}) {
    for (int num_levels : {1, 7, 8, 9, 100, 1023, 5000}) {
      vector<int16_t> levels = RandomLevels(max_level, num_levels, &rng);
      RoundTrip(E::RLE, max_level, levels);
      RoundTrip(E::BIT_PACKED, max_level, levels);
    }
  }
}

TEST(LevelCodecTest, MaxLevelZero) {
  vector<int16_t> levels(10, 0);
  LevelEncoder encoder(E::RLE, 0);
  vector<uint8_t> encoded;
  ASSERT_OK(encoder.Encode(levels.data(), levels.size(), &encoded));
  EXPECT_TRUE(encoded.empty());

  vector<int16_t> decoded;
  ASSERT_OK(LevelDecoder::Decode("a", E::RLE, 0, nullptr, 0, 10, 0, &decoded));
  EXPECT_EQ(levels, decoded);

  uint8_t junk = 1;
  EXPECT_ERROR(LevelDecoder::Decode("a", E::RLE, 0, &junk, 1, 10, 0, &decoded),
      TErrorCode::MALFORMED_ENCODING);
}

TEST(LevelCodecTest, BitPackedLayout) {
  // Levels are packed LSB first.
  vector<int16_t> levels = {1, 0, 1, 1, 0, 0, 0, 1, 1};
  LevelEncoder encoder(E::BIT_PACKED, 1);
  vector<uint8_t> encoded;
  ASSERT_OK(encoder.Encode(levels.data(), levels.size(), &encoded));
  ASSERT_EQ(2, encoded.size());
  EXPECT_EQ(0x8D, encoded[0]);
  EXPECT_EQ(0x01, encoded[1]);
}

TEST(LevelCodecTest, RepeatedRun) {
  // Repeated run of 8 values, each stored in one byte.
  const uint8_t data[] = {0x10, 0x02};
  vector<int16_t> decoded;
  ASSERT_OK(LevelDecoder::Decode("a", E::RLE, 2, data, sizeof(data), 8, 0, &decoded));
  EXPECT_EQ(vector<int16_t>(8, 2), decoded);
}

TEST(LevelCodecTest, LevelAboveMax) {
  const uint8_t data[] = {0x10, 0x03};
  vector<int16_t> decoded;
  Status status = LevelDecoder::Decode("a.b", E::RLE, 2, data, sizeof(data), 8, 64,
      &decoded);
  EXPECT_ERROR(status, TErrorCode::MALFORMED_ENCODING);
  EXPECT_STR_CONTAINS(status.GetDetail(), "a.b");
  EXPECT_STR_CONTAINS(status.GetDetail(), "64");

  vector<int16_t> levels = {0, 1, 2, 3, 3, 1};
  LevelEncoder encoder(E::BIT_PACKED, 3);
  vector<uint8_t> encoded;
  ASSERT_OK(encoder.Encode(levels.data(), levels.size(), &encoded));
  EXPECT_ERROR(LevelDecoder::Decode("a", E::BIT_PACKED, 2, encoded.data(),
      encoded.size(), levels.size(), 0, &decoded), TErrorCode::MALFORMED_ENCODING);
}

TEST(LevelCodecTest, Truncated) {
  vector<int16_t> levels = {0, 1, 1, 0, 1, 0, 0, 1, 1, 1, 0, 1};
  for (E::type encoding : {E::RLE, E::BIT_PACKED}) {
    LevelEncoder encoder(encoding, 1);
    vector<uint8_t> encoded;
    ASSERT_OK(encoder.Encode(levels.data(), levels.size(), &encoded));
    vector<int16_t> decoded;
    EXPECT_ERROR(LevelDecoder::Decode("a", encoding, 1, encoded.data(), encoded.size(),
        1000, 0, &decoded), TErrorCode::MALFORMED_ENCODING);
    EXPECT_ERROR(LevelDecoder::Decode("a", encoding, 1, encoded.data(), 0,
        levels.size(), 0, &decoded), TErrorCode::MALFORMED_ENCODING);
  }
  // A repeated run header without its value.
  const uint8_t data[] = {0x10};
  vector<int16_t> decoded;
  EXPECT_ERROR(LevelDecoder::Decode("a", E::RLE, 1, data, sizeof(data), 8, 0, &decoded),
      TErrorCode::MALFORMED_ENCODING);
}

TEST(LevelCodecTest, ForgedCount) {
  const int64_t huge_count = 1L << 30;
  // One repeated run of 8 ones.
  const uint8_t run[] = {0x10, 0x01};
  vector<int16_t> decoded;
  Status status = LevelDecoder::Decode("a", E::RLE, 1, run, sizeof(run), huge_count, 0,
      &decoded);
  EXPECT_ERROR(status, TErrorCode::MALFORMED_ENCODING);
  EXPECT_STR_CONTAINS(status.GetDetail(), "decoded 8 of");
  EXPECT_TRUE(decoded.empty());

  const uint8_t packed[] = {0xFF, 0xFF};
  EXPECT_ERROR(LevelDecoder::Decode("a", E::BIT_PACKED, 1, packed, sizeof(packed),
      huge_count, 0, &decoded), TErrorCode::MALFORMED_ENCODING);
  EXPECT_TRUE(decoded.empty());
  ASSERT_OK(LevelDecoder::Decode("a", E::BIT_PACKED, 1, packed, sizeof(packed), 16, 0,
      &decoded));
  EXPECT_EQ(vector<int16_t>(16, 1), decoded);

  EXPECT_ERROR(LevelDecoder::Decode("a", E::RLE, 1, run, sizeof(run), -1, 0, &decoded),
      TErrorCode::MALFORMED_ENCODING);
}

TEST(LevelCodecTest, UnsupportedEncoding) {
  vector<int16_t> levels = {0, 1};
  LevelEncoder encoder(E::PLAIN, 1);
  vector<uint8_t> encoded;
  EXPECT_ERROR(encoder.Encode(levels.data(), levels.size(), &encoded),
      TErrorCode::UNSUPPORTED_ENCODING);
  vector<int16_t> decoded;
  const uint8_t data[] = {0x04, 0x01};
  EXPECT_ERROR(LevelDecoder::Decode("a", E::DELTA_BINARY_PACKED, 1, data, sizeof(data),
      2, 0, &decoded), TErrorCode::UNSUPPORTED_ENCODING);
}

}

STRATA_TEST_MAIN();
