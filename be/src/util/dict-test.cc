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

#include <cmath>
#include <limits>
#include <set>

#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"
#include "util/dict-encoding.h"

#include "common/names.h"

namespace strata {

/// Decodes the PLAIN encoded dictionary of 'len' bytes at 'buffer' into 'dict'.
/// Returns false if the last entry is truncated.
template<typename T, columnar::Type::type TYPE>
bool DecodeDict(const uint8_t* buffer, int64_t len, int fixed_len_size, vector<T>* dict) {
  dict->clear();
  const uint8_t* end = buffer + len;
  while (buffer < end) {
    T value;
    int decoded_len =
        ColumnarPlainEncoder::Decode<T, TYPE>(buffer, end, fixed_len_size, &value);
    if (decoded_len <= 0) return false;
    buffer += decoded_len;
    dict->push_back(value);
  }
  return true;
}

/// Dictionary encodes 'values', checks the dictionary holds 'dict_values' in order and
/// that the indices decode back to 'values'.
template<typename T, columnar::Type::type TYPE>
void ValidateDict(const vector<T>& values, const vector<T>& dict_values,
    int fixed_len_size) {
  const int encoded_size = TYPE == columnar::Type::BYTE_ARRAY ? -1 :
      ColumnarPlainEncoder::EncodedByteSize(TYPE, fixed_len_size);
  DictEncoder<T> encoder(encoded_size, dict_values.size());
  for (const T& v : values) ASSERT_GE(encoder.Put(v), 0);
  EXPECT_EQ(dict_values.size(), encoder.num_entries());
  EXPECT_EQ(values.size(), encoder.num_buffered_indices());

  vector<uint8_t> dict_buffer(encoder.dict_encoded_size());
  encoder.WriteDict(dict_buffer.data());
  vector<uint8_t> data_buffer(encoder.EstimatedDataEncodedSize());
  int data_len = encoder.WriteData(data_buffer.data(), data_buffer.size());
  ASSERT_GT(data_len, 0);
  EXPECT_EQ(encoder.bit_width(), data_buffer[0]);
  encoder.ClearIndices();
  EXPECT_EQ(0, encoder.num_buffered_indices());

  vector<T> dict;
  ASSERT_TRUE((DecodeDict<T, TYPE>(dict_buffer.data(), dict_buffer.size(),
      fixed_len_size, &dict)));
  EXPECT_EQ(dict_values, dict);
  DictIndexDecoder decoder(dict.size());
  ASSERT_TRUE(decoder.SetData(data_buffer.data(), data_len));
  vector<DictIndexDecoder::IndexType> indices(values.size());
  ASSERT_TRUE(decoder.GetNextIndices(values.size(), indices.data()));
  vector<T> decoded;
  for (DictIndexDecoder::IndexType i : indices) decoded.push_back(dict[i]);
  EXPECT_EQ(values, decoded);
}

TEST(DictTest, TestStrings) {
  vector<string> dict_values = {"hello world", "foo", "bar", ""};
  vector<string> values = {"hello world", "hello world", "foo", "hello world", "foo",
      "bar", "bar", "", "bar", ""};
  ValidateDict<string, columnar::Type::BYTE_ARRAY>(values, dict_values, -1);
}

TEST(DictTest, TestFixedLenStrings) {
  vector<string> dict_values = {"abcd", "abce", "zzzz"};
  vector<string> values = {"abcd", "abce", "abcd", "zzzz", "zzzz", "abce"};
  ValidateDict<string, columnar::Type::FIXED_LEN_BYTE_ARRAY>(values, dict_values, 4);
}

TEST(DictTest, TestNumbers) {
  vector<int32_t> int_dict = {5, -1, 1 << 30, std::numeric_limits<int32_t>::min()};
  vector<int32_t> ints = {5, 5, -1, 1 << 30, std::numeric_limits<int32_t>::min(), 5};
  ValidateDict<int32_t, columnar::Type::INT32>(ints, int_dict, -1);

  vector<int64_t> long_dict = {1L << 40, 0, -7};
  vector<int64_t> longs = {1L << 40, 0, 0, -7, 1L << 40};
  ValidateDict<int64_t, columnar::Type::INT64>(longs, long_dict, -1);

  vector<double> double_dict = {1.5, -0.0, 0.0};
  vector<double> doubles = {1.5, -0.0, 0.0, 1.5};
  ValidateDict<double, columnar::Type::DOUBLE>(doubles, double_dict, -1);
}

TEST(DictTest, SingleEntry) {
  // A one entry dictionary still uses a bit width of 1.
  DictEncoder<int32_t> encoder(sizeof(int32_t), 10);
  for (int i = 0; i < 20; ++i) ASSERT_EQ(i == 0 ? 4 : 0, encoder.Put(42));
  EXPECT_EQ(1, encoder.bit_width());
  EXPECT_EQ(4, encoder.dict_encoded_size());
}

TEST(DictTest, NaNIsOneEntry) {
  DictEncoder<float> encoder(sizeof(float), 10);
  const float nan = std::numeric_limits<float>::quiet_NaN();
  ASSERT_EQ(4, encoder.Put(nan));
  ASSERT_EQ(0, encoder.Put(nan));
  EXPECT_EQ(1, encoder.num_entries());
}

TEST(DictTest, MaxEntries) {
  DictEncoder<int64_t> encoder(sizeof(int64_t), 3);
  EXPECT_EQ(8, encoder.Put(1));
  EXPECT_EQ(8, encoder.Put(2));
  EXPECT_EQ(8, encoder.Put(3));
  EXPECT_TRUE(encoder.IsFull());
  EXPECT_EQ(0, encoder.Put(2));
  EXPECT_EQ(-1, encoder.Put(4));
  EXPECT_EQ(3, encoder.num_entries());
  EXPECT_EQ(4, encoder.num_buffered_indices());
}

TEST(DictTest, ManyEntries) {
  std::mt19937 rng;
  RandTestUtil::SeedRng("DICT_TEST_SEED", &rng);
  std::uniform_int_distribution<int32_t> dist(0, 99999);
  vector<int32_t> values;
  vector<int32_t> dict_values;
  std::set<int32_t> seen;
  for (int i = 0; i < 5000; ++i) {
    int32_t v = dist(rng);
    values.push_back(v);
    if (seen.insert(v).second) dict_values.push_back(v);
  }
  ValidateDict<int32_t, columnar::Type::INT32>(values, dict_values, -1);
}

TEST(DictTest, InvalidData) {
  DictIndexDecoder decoder(3);

  // A bit width wider than the index type.
  const uint8_t wide[] = {33, 0x02, 0x01};
  EXPECT_FALSE(decoder.SetData(wide, sizeof(wide)));
  EXPECT_FALSE(decoder.SetData(wide, 0));

  // Index 5 is outside the dictionary: repeated run of 8 copies of 5 at bit width 3.
  const uint8_t out_of_range[] = {3, 0x10, 0x05};
  ASSERT_TRUE(decoder.SetData(out_of_range, sizeof(out_of_range)));
  DictIndexDecoder::IndexType indices[8];
  EXPECT_FALSE(decoder.GetNextIndices(8, indices));

  // Fewer indices than requested.
  const uint8_t short_run[] = {2, 0x04, 0x01};
  ASSERT_TRUE(decoder.SetData(short_run, sizeof(short_run)));
  EXPECT_FALSE(decoder.GetNextIndices(8, indices));
  ASSERT_TRUE(decoder.SetData(short_run, sizeof(short_run)));
  ASSERT_TRUE(decoder.GetNextIndices(2, indices));
  EXPECT_EQ(1U, indices[0]);
  EXPECT_EQ(1U, indices[1]);

  // A truncated dictionary page.
  vector<int32_t> dict_values = {1, 2, 3};
  vector<int32_t> dict;
  EXPECT_FALSE((DecodeDict<int32_t, columnar::Type::INT32>(
      reinterpret_cast<const uint8_t*>(dict_values.data()),
      dict_values.size() * sizeof(int32_t) - 1, -1, &dict)));
}

}

STRATA_TEST_MAIN();
