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

#include <limits>
#include <random>

#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"
#include "util/delta-encoding.h"

#include "common/names.h"

namespace strata {

template <typename T>
static void ValidateDeltaBitPack(const vector<T>& values) {
  DeltaBitPackEncoder<T> encoder;
  for (T v : values) encoder.Put(v);
  EXPECT_EQ(values.size(), encoder.num_values());
  vector<uint8_t> encoded;
  encoder.FlushValues(&encoded);
  EXPECT_EQ(0, encoder.num_values());
  EXPECT_LE(encoded.size(), DeltaBitPackEncoder<T>::MaxBufferSize(values.size()));

  DeltaBitPackDecoder<T> decoder;
  ASSERT_TRUE(decoder.Init(encoded.data(), encoded.size()));
  ASSERT_EQ(values.size(), decoder.total_values());
  vector<T> decoded(values.size());
  // Decode in uneven batches to cross miniblock and block boundaries.
  int64_t pos = 0;
  int batch = 1;
  while (pos < values.size()) {
    int64_t n = min<int64_t>(batch, values.size() - pos);
    ASSERT_TRUE(decoder.GetValues(n, decoded.data() + pos));
    pos += n;
    batch = batch * 3 + 1;
  }
  EXPECT_EQ(values, decoded);
  EXPECT_EQ(encoded.data() + encoded.size(), decoder.buffer_pos());
  T extra;
  EXPECT_FALSE(decoder.GetValues(1, &extra));
}

TEST(DeltaBitPackTest, Layout) {
  DeltaBitPackEncoder<int32_t> encoder;
  for (int32_t v : {1, 2, 3, 4, 5}) encoder.Put(v);
  vector<uint8_t> encoded;
  encoder.FlushValues(&encoded);
  // Header: block size 128, 4 miniblocks, 5 values, first value 1. One block with a
  // min delta of 1 and all miniblocks of bit width 0.
  vector<uint8_t> expected = {0x80, 0x01, 0x04, 0x05, 0x02, 0x02, 0, 0, 0, 0};
  EXPECT_EQ(expected, encoded);
}

TEST(DeltaBitPackTest, SmallStreams) {
  ValidateDeltaBitPack<int32_t>({});
  ValidateDeltaBitPack<int32_t>({42});
  ValidateDeltaBitPack<int64_t>({-5, -5});
  ValidateDeltaBitPack<int32_t>(vector<int32_t>(129, 7));
}

TEST(DeltaBitPackTest, Extremes) {
  const int32_t min32 = std::numeric_limits<int32_t>::min();
  const int32_t max32 = std::numeric_limits<int32_t>::max();
  ValidateDeltaBitPack<int32_t>({min32, max32, min32, 0, max32, max32, min32});
  const int64_t min64 = std::numeric_limits<int64_t>::min();
  const int64_t max64 = std::numeric_limits<int64_t>::max();
  vector<int64_t> values;
  for (int i = 0; i < 300; ++i) values.push_back(i % 2 == 0 ? min64 : max64);
  ValidateDeltaBitPack<int64_t>(values);
}

TEST(DeltaBitPackTest, Random) {
  std::mt19937 rng;
  RandTestUtil::SeedRng("DELTA_TEST_SEED", &rng);
  for (int64_t range : {1L, 100L, 1L << 20, 1L << 40}) {
    std::uniform_int_distribution<int64_t> dist(-range, range);
    for (int length : {31, 32, 33, 127, 128, 129, 1000}) {
      vector<int64_t> longs(length);
      vector<int32_t> ints(length);
      for (int i = 0; i < length; ++i) {
        longs[i] = dist(rng);
        ints[i] = static_cast<int32_t>(longs[i]);
      }
      ValidateDeltaBitPack(longs);
      ValidateDeltaBitPack(ints);
    }
  }
}

TEST(DeltaBitPackTest, MalformedHeader) {
  DeltaBitPackDecoder<int32_t> decoder;
  // Truncated header.
  const uint8_t truncated[] = {0x80, 0x01, 0x04};
  EXPECT_FALSE(decoder.Init(truncated, sizeof(truncated)));
  // Block size not a multiple of the miniblock count.
  const uint8_t uneven[] = {0x7F, 0x04, 0x02, 0x00};
  EXPECT_FALSE(decoder.Init(uneven, sizeof(uneven)));
  // Miniblocks of 16 values.
  const uint8_t small_miniblocks[] = {0x40, 0x04, 0x02, 0x00};
  EXPECT_FALSE(decoder.Init(small_miniblocks, sizeof(small_miniblocks)));
  // Miniblock bit width above 32.
  const uint8_t wide[] = {0x80, 0x01, 0x04, 0x02, 0x00, 0x00, 33, 0, 0, 0};
  ASSERT_TRUE(decoder.Init(wide, sizeof(wide)));
  int32_t values[2];
  EXPECT_FALSE(decoder.GetValues(2, values));
}

TEST(DeltaBitPackTest, CountBeyondBuffer) {
  // Header: block size 128, 4 miniblocks, INT32_MAX values, first value 0, and no
  // blocks at all.
  const uint8_t huge[] = {0x80, 0x01, 0x04, 0xFF, 0xFF, 0xFF, 0xFF, 0x07, 0x00};
  DeltaBitPackDecoder<int32_t> decoder;
  EXPECT_FALSE(decoder.Init(huge, sizeof(huge)));
  // 129 values need one block of five bytes after the header.
  const uint8_t short_block[] = {0x80, 0x01, 0x04, 0x81, 0x01, 0x00, 0x02, 0, 0};
  EXPECT_FALSE(decoder.Init(short_block, sizeof(short_block)));
  const uint8_t full_block[] = {0x80, 0x01, 0x04, 0x81, 0x01, 0x00, 0x02, 0, 0, 0, 0};
  ASSERT_TRUE(decoder.Init(full_block, sizeof(full_block)));
  vector<int32_t> decoded(129);
  ASSERT_TRUE(decoder.GetValues(decoded.size(), decoded.data()));
  EXPECT_EQ(128, decoded.back());
}

TEST(DeltaBitPackTest, TruncatedBlock) {
  vector<int32_t> values;
  for (int i = 0; i < 200; ++i) values.push_back(i * i);
  DeltaBitPackEncoder<int32_t> encoder;
  for (int32_t v : values) encoder.Put(v);
  vector<uint8_t> encoded;
  encoder.FlushValues(&encoded);

  DeltaBitPackDecoder<int32_t> decoder;
  ASSERT_TRUE(decoder.Init(encoded.data(), encoded.size() - 10));
  vector<int32_t> decoded(values.size());
  EXPECT_FALSE(decoder.GetValues(values.size(), decoded.data()));
}

static void ValidateDeltaLength(const vector<string>& values) {
  DeltaLengthByteArrayEncoder encoder;
  for (const string& v : values) encoder.Put(v);
  vector<uint8_t> encoded;
  encoder.FlushValues(&encoded);

  DeltaLengthByteArrayDecoder decoder;
  ASSERT_TRUE(decoder.Init(encoded.data(), encoded.size(), values.size()));
  ASSERT_EQ(values.size(), decoder.total_values());
  vector<string> decoded(values.size());
  ASSERT_TRUE(decoder.GetValues(values.size(), decoded.data()));
  EXPECT_EQ(values, decoded);
  EXPECT_EQ(encoded.data() + encoded.size(), decoder.buffer_end());
}

static void ValidateDeltaByteArray(const vector<string>& values) {
  DeltaByteArrayEncoder encoder;
  for (const string& v : values) encoder.Put(v);
  vector<uint8_t> encoded;
  encoder.FlushValues(&encoded);

  DeltaByteArrayDecoder decoder;
  ASSERT_TRUE(decoder.Init(encoded.data(), encoded.size(), values.size()));
  ASSERT_EQ(values.size(), decoder.total_values());
  vector<string> decoded(values.size());
  ASSERT_TRUE(decoder.GetValues(values.size(), decoded.data()));
  EXPECT_EQ(values, decoded);
  EXPECT_EQ(encoded.data() + encoded.size(), decoder.buffer_end());
}

TEST(DeltaByteArrayTest, RoundTrip) {
  vector<string> values = {"", "a", "apple", "applesauce", "apply", "b", "", "banana",
      string(300, 'x'), string(301, 'x')};
  ValidateDeltaLength(values);
  ValidateDeltaByteArray(values);
  ValidateDeltaLength({});
  ValidateDeltaByteArray({});
  ValidateDeltaLength({"only"});
  ValidateDeltaByteArray({"only"});
}

TEST(DeltaByteArrayTest, SharedPrefixesAreSmaller) {
  vector<string> values;
  for (int i = 0; i < 100; ++i) {
    values.push_back("/usr/local/share/doc/" + std::to_string(i));
  }
  DeltaLengthByteArrayEncoder length_encoder;
  DeltaByteArrayEncoder prefix_encoder;
  for (const string& v : values) {
    length_encoder.Put(v);
    prefix_encoder.Put(v);
  }
  vector<uint8_t> length_encoded;
  vector<uint8_t> prefix_encoded;
  length_encoder.FlushValues(&length_encoded);
  prefix_encoder.FlushValues(&prefix_encoded);
  EXPECT_LT(prefix_encoded.size(), length_encoded.size());
  ValidateDeltaByteArray(values);
}

TEST(DeltaByteArrayTest, Malformed) {
  DeltaLengthByteArrayEncoder encoder;
  encoder.Put("hello");
  encoder.Put("world");
  vector<uint8_t> encoded;
  encoder.FlushValues(&encoded);
  // The value bytes are cut short.
  DeltaLengthByteArrayDecoder decoder;
  EXPECT_FALSE(decoder.Init(encoded.data(), encoded.size() - 1, 2));

  // A prefix longer than the previous value: prefix lengths {0, 3} with suffixes
  // {"ab", "c"}.
  DeltaBitPackEncoder<int32_t> prefixes;
  prefixes.Put(0);
  prefixes.Put(3);
  DeltaLengthByteArrayEncoder suffixes;
  suffixes.Put("ab");
  suffixes.Put("c");
  vector<uint8_t> bad;
  prefixes.FlushValues(&bad);
  suffixes.FlushValues(&bad);
  DeltaByteArrayDecoder prefix_decoder;
  ASSERT_TRUE(prefix_decoder.Init(bad.data(), bad.size(), 2));
  vector<string> values(2);
  EXPECT_FALSE(prefix_decoder.GetValues(2, values.data()));
}

TEST(DeltaByteArrayTest, ValueCountMismatch) {
  vector<string> values = {"abc", "abd", "b"};
  DeltaLengthByteArrayEncoder length_encoder;
  DeltaByteArrayEncoder prefix_encoder;
  for (const string& v : values) {
    length_encoder.Put(v);
    prefix_encoder.Put(v);
  }
  vector<uint8_t> length_encoded;
  vector<uint8_t> prefix_encoded;
  length_encoder.FlushValues(&length_encoded);
  prefix_encoder.FlushValues(&prefix_encoded);
  for (int64_t num_values : {0, 2, 4}) {
    DeltaLengthByteArrayDecoder length_decoder;
    EXPECT_FALSE(length_decoder.Init(length_encoded.data(), length_encoded.size(),
        num_values)) << num_values;
    DeltaByteArrayDecoder prefix_decoder;
    EXPECT_FALSE(prefix_decoder.Init(prefix_encoded.data(), prefix_encoded.size(),
        num_values)) << num_values;
  }
}

TEST(DeltaByteArrayTest, CountBeyondBuffer) {
  // A 9 byte lengths stream announcing INT32_MAX values, with no blocks or data.
  const uint8_t huge[] = {0x80, 0x01, 0x04, 0xFF, 0xFF, 0xFF, 0xFF, 0x07, 0x00};
  const int64_t num_values = std::numeric_limits<int32_t>::max();
  DeltaLengthByteArrayDecoder length_decoder;
  EXPECT_FALSE(length_decoder.Init(huge, sizeof(huge), num_values));
  DeltaByteArrayDecoder prefix_decoder;
  EXPECT_FALSE(prefix_decoder.Init(huge, sizeof(huge), num_values));
  EXPECT_EQ(0, length_decoder.total_values());
  EXPECT_EQ(0, prefix_decoder.total_values());
}

}

STRATA_TEST_MAIN();
