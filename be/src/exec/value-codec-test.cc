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

#include "exec/value-codec.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

typedef columnar::Encoding E;
typedef columnar::Type T;

static ColumnDescriptor MakeDescriptor(T::type type, int type_length = 0) {
  ColumnDescriptor desc;
  desc.col_idx = 0;
  desc.path = "a.b";
  desc.path_in_schema = {"a", "b"};
  desc.type = type;
  desc.type_length = type_length;
  return desc;
}

static Int96 MakeInt96(uint8_t seed) {
  Int96 v;
  for (int i = 0; i < 12; ++i) v.bytes[i] = seed + i;
  return v;
}

class ValueCodecTest : public ::testing::Test {
 protected:
  void RoundTrip(E::type encoding, const ColumnDescriptor& desc,
      const vector<PrimitiveValue>& values) {
    vector<uint8_t> encoded;
    ASSERT_OK(EncodeValues(encoding, desc, values.data(), values.size(), &encoded));
    vector<PrimitiveValue> decoded;
    ASSERT_OK(DecodeValues(encoding, desc, encoded.data(), encoded.size(), values.size(),
        nullptr, &decoded));
    ExpectValues(values, decoded);
  }

  void DictionaryRoundTrip(const ColumnDescriptor& desc,
      const vector<PrimitiveValue>& values, int expected_entries) {
    vector<uint8_t> dict_data;
    vector<uint8_t> indices;
    int num_entries;
    ASSERT_OK(EncodeDictionary(desc, values.data(), values.size(), &dict_data,
        &num_entries, &indices));
    EXPECT_EQ(expected_entries, num_entries);
    DictionaryTable dict;
    ASSERT_OK(dict.Init(desc, dict_data.data(), dict_data.size(), num_entries));
    ASSERT_EQ(num_entries, dict.num_entries());
    for (E::type encoding : {E::RLE_DICTIONARY, E::PLAIN_DICTIONARY}) {
      vector<PrimitiveValue> decoded;
      ASSERT_OK(DecodeValues(encoding, desc, indices.data(), indices.size(),
          values.size(), &dict, &decoded));
      ExpectValues(values, decoded);
    }
  }

  void ExpectValues(const vector<PrimitiveValue>& expected,
      const vector<PrimitiveValue>& actual) {
    ASSERT_EQ(expected.size(), actual.size());
    for (int i = 0; i < expected.size(); ++i) {
      EXPECT_TRUE(PrimitiveValueEquals(expected[i], actual[i]))
          << i << ": " << expected[i] << " vs " << actual[i];
    }
  }
};

TEST_F(ValueCodecTest, SupportedEncodings) {
  EXPECT_TRUE(IsEncodingSupported(E::PLAIN, T::BOOLEAN));
  EXPECT_TRUE(IsEncodingSupported(E::RLE, T::BOOLEAN));
  EXPECT_FALSE(IsEncodingSupported(E::RLE, T::INT32));
  EXPECT_FALSE(IsEncodingSupported(E::RLE_DICTIONARY, T::BOOLEAN));
  EXPECT_TRUE(IsEncodingSupported(E::PLAIN_DICTIONARY, T::INT96));
  EXPECT_TRUE(IsEncodingSupported(E::DELTA_BINARY_PACKED, T::INT64));
  EXPECT_FALSE(IsEncodingSupported(E::DELTA_BINARY_PACKED, T::DOUBLE));
  EXPECT_TRUE(IsEncodingSupported(E::DELTA_LENGTH_BYTE_ARRAY, T::BYTE_ARRAY));
  EXPECT_FALSE(IsEncodingSupported(E::DELTA_LENGTH_BYTE_ARRAY, T::FIXED_LEN_BYTE_ARRAY));
  EXPECT_TRUE(IsEncodingSupported(E::DELTA_BYTE_ARRAY, T::FIXED_LEN_BYTE_ARRAY));
  EXPECT_FALSE(IsEncodingSupported(E::BIT_PACKED, T::INT32));
}

TEST_F(ValueCodecTest, PlainLayout) {
  vector<uint8_t> encoded;
  vector<PrimitiveValue> ints = {PrimitiveValue(int32_t(1)), PrimitiveValue(int32_t(-2))};
  ASSERT_OK(EncodeValues(E::PLAIN, MakeDescriptor(T::INT32), ints.data(), ints.size(),
      &encoded));
  EXPECT_EQ(vector<uint8_t>({1, 0, 0, 0, 0xFE, 0xFF, 0xFF, 0xFF}), encoded);

  vector<PrimitiveValue> strings = {PrimitiveValue(string("hi"))};
  ASSERT_OK(EncodeValues(E::PLAIN, MakeDescriptor(T::BYTE_ARRAY), strings.data(), 1,
      &encoded));
  EXPECT_EQ(vector<uint8_t>({2, 0, 0, 0, 'h', 'i'}), encoded);

  vector<PrimitiveValue> bools;
  for (bool b : {true, false, true, true, false, false, false, false, true}) {
    bools.emplace_back(b);
  }
  ASSERT_OK(EncodeValues(E::PLAIN, MakeDescriptor(T::BOOLEAN), bools.data(),
      bools.size(), &encoded));
  EXPECT_EQ(vector<uint8_t>({0x0D, 0x01}), encoded);
}

TEST_F(ValueCodecTest, AllTypesRoundTrip) {
  vector<PrimitiveValue> bools;
  for (int i = 0; i < 100; ++i) bools.emplace_back(i % 3 == 0);
  RoundTrip(E::PLAIN, MakeDescriptor(T::BOOLEAN), bools);
  RoundTrip(E::RLE, MakeDescriptor(T::BOOLEAN), bools);
  RoundTrip(E::RLE, MakeDescriptor(T::BOOLEAN), vector<PrimitiveValue>(50, true));

  vector<PrimitiveValue> ints;
  for (int32_t v : {0, 1, -1, std::numeric_limits<int32_t>::min(),
       std::numeric_limits<int32_t>::max(), 17, 17, 17}) {
    ints.emplace_back(v);
  }
  RoundTrip(E::PLAIN, MakeDescriptor(T::INT32), ints);
  RoundTrip(E::DELTA_BINARY_PACKED, MakeDescriptor(T::INT32), ints);
  DictionaryRoundTrip(MakeDescriptor(T::INT32), ints, 6);

  vector<PrimitiveValue> longs;
  for (int64_t v : {std::numeric_limits<int64_t>::min(), int64_t(0),
       std::numeric_limits<int64_t>::max(), int64_t(-42)}) {
    longs.emplace_back(v);
  }
  RoundTrip(E::PLAIN, MakeDescriptor(T::INT64), longs);
  RoundTrip(E::DELTA_BINARY_PACKED, MakeDescriptor(T::INT64), longs);
  DictionaryRoundTrip(MakeDescriptor(T::INT64), longs, 4);

  vector<PrimitiveValue> int96s = {PrimitiveValue(MakeInt96(1)),
      PrimitiveValue(MakeInt96(100)), PrimitiveValue(MakeInt96(1))};
  RoundTrip(E::PLAIN, MakeDescriptor(T::INT96), int96s);
  DictionaryRoundTrip(MakeDescriptor(T::INT96), int96s, 2);

  vector<PrimitiveValue> floats = {PrimitiveValue(1.5f), PrimitiveValue(-0.0f),
      PrimitiveValue(std::numeric_limits<float>::quiet_NaN()),
      PrimitiveValue(std::numeric_limits<float>::infinity())};
  RoundTrip(E::PLAIN, MakeDescriptor(T::FLOAT), floats);
  DictionaryRoundTrip(MakeDescriptor(T::FLOAT), floats, 4);

  vector<PrimitiveValue> doubles = {PrimitiveValue(0.0), PrimitiveValue(-0.0),
      PrimitiveValue(std::numeric_limits<double>::lowest()), PrimitiveValue(0.0)};
  RoundTrip(E::PLAIN, MakeDescriptor(T::DOUBLE), doubles);
  DictionaryRoundTrip(MakeDescriptor(T::DOUBLE), doubles, 3);

  vector<PrimitiveValue> strings;
  for (const char* s : {"", "Dremel", "Dremel", "Drill", "", "x"}) {
    strings.emplace_back(std::in_place_type<string>, s);
  }
  for (E::type e : {E::PLAIN, E::DELTA_LENGTH_BYTE_ARRAY, E::DELTA_BYTE_ARRAY}) {
    RoundTrip(e, MakeDescriptor(T::BYTE_ARRAY), strings);
  }
  DictionaryRoundTrip(MakeDescriptor(T::BYTE_ARRAY), strings, 4);

  vector<PrimitiveValue> fixed;
  for (const char* s : {"abc", "abd", "abc", "zzz"}) {
    fixed.emplace_back(std::in_place_type<string>, s);
  }
  RoundTrip(E::PLAIN, MakeDescriptor(T::FIXED_LEN_BYTE_ARRAY, 3), fixed);
  RoundTrip(E::DELTA_BYTE_ARRAY, MakeDescriptor(T::FIXED_LEN_BYTE_ARRAY, 3), fixed);
  DictionaryRoundTrip(MakeDescriptor(T::FIXED_LEN_BYTE_ARRAY, 3), fixed, 3);
}

TEST_F(ValueCodecTest, ZeroValues) {
  vector<PrimitiveValue> none;
  for (T::type type : {T::BOOLEAN, T::INT32, T::BYTE_ARRAY}) {
    RoundTrip(E::PLAIN, MakeDescriptor(type), none);
  }
  RoundTrip(E::RLE, MakeDescriptor(T::BOOLEAN), none);
  RoundTrip(E::DELTA_BINARY_PACKED, MakeDescriptor(T::INT64), none);
  RoundTrip(E::DELTA_LENGTH_BYTE_ARRAY, MakeDescriptor(T::BYTE_ARRAY), none);
  RoundTrip(E::DELTA_BYTE_ARRAY, MakeDescriptor(T::BYTE_ARRAY), none);
  DictionaryRoundTrip(MakeDescriptor(T::INT32), none, 0);
}

TEST_F(ValueCodecTest, UnsupportedEncodings) {
  vector<PrimitiveValue> doubles = {PrimitiveValue(1.0)};
  vector<uint8_t> encoded;
  EXPECT_ERROR(EncodeValues(E::DELTA_BINARY_PACKED, MakeDescriptor(T::DOUBLE),
      doubles.data(), doubles.size(), &encoded), TErrorCode::UNSUPPORTED_ENCODING);
  EXPECT_ERROR(EncodeValues(E::RLE_DICTIONARY, MakeDescriptor(T::DOUBLE),
      doubles.data(), doubles.size(), &encoded), TErrorCode::UNSUPPORTED_ENCODING);

  vector<PrimitiveValue> decoded;
  const uint8_t data[8] = {0};
  Status status = DecodeValues(static_cast<E::type>(42), MakeDescriptor(T::INT64), data,
      sizeof(data), 1, nullptr, &decoded);
  EXPECT_ERROR(status, TErrorCode::UNSUPPORTED_ENCODING);
  EXPECT_STR_CONTAINS(status.GetDetail(), "a.b");

  vector<PrimitiveValue> bools = {PrimitiveValue(true)};
  vector<uint8_t> dict_data;
  vector<uint8_t> indices;
  int num_entries;
  EXPECT_ERROR(EncodeDictionary(MakeDescriptor(T::BOOLEAN), bools.data(), 1, &dict_data,
      &num_entries, &indices), TErrorCode::UNSUPPORTED_ENCODING);
}

TEST_F(ValueCodecTest, WrongValueType) {
  vector<PrimitiveValue> values = {PrimitiveValue(int64_t(1))};
  vector<uint8_t> encoded;
  EXPECT_ERROR(EncodeValues(E::PLAIN, MakeDescriptor(T::INT32), values.data(), 1,
      &encoded), TErrorCode::SCHEMA_VIOLATION);
  vector<PrimitiveValue> short_string = {PrimitiveValue(string("ab"))};
  EXPECT_ERROR(EncodeValues(E::PLAIN, MakeDescriptor(T::FIXED_LEN_BYTE_ARRAY, 3),
      short_string.data(), 1, &encoded), TErrorCode::SCHEMA_VIOLATION);
}

TEST_F(ValueCodecTest, MalformedPlain) {
  const ColumnDescriptor desc = MakeDescriptor(T::INT32);
  vector<PrimitiveValue> values = {
      PrimitiveValue(int32_t(1)), PrimitiveValue(int32_t(2))};
  vector<uint8_t> encoded;
  ASSERT_OK(EncodeValues(E::PLAIN, desc, values.data(), values.size(), &encoded));
  vector<PrimitiveValue> decoded;
  // Truncated.
  Status status = DecodeValues(E::PLAIN, desc, encoded.data(), encoded.size() - 1, 2,
      nullptr, &decoded, 4096);
  EXPECT_ERROR(status, TErrorCode::MALFORMED_ENCODING);
  EXPECT_STR_CONTAINS(status.GetDetail(), "4096");
  // Trailing bytes.
  EXPECT_ERROR(DecodeValues(E::PLAIN, desc, encoded.data(), encoded.size(), 1, nullptr,
      &decoded), TErrorCode::MALFORMED_ENCODING);
  // Booleans need exactly ceil(n / 8) bytes.
  EXPECT_ERROR(DecodeValues(E::PLAIN, MakeDescriptor(T::BOOLEAN), encoded.data(), 2, 3,
      nullptr, &decoded), TErrorCode::MALFORMED_ENCODING);
  // A byte array length running past the end.
  const uint8_t bad_length[] = {10, 0, 0, 0, 'a'};
  EXPECT_ERROR(DecodeValues(E::PLAIN, MakeDescriptor(T::BYTE_ARRAY), bad_length,
      sizeof(bad_length), 1, nullptr, &decoded), TErrorCode::MALFORMED_ENCODING);
}

TEST_F(ValueCodecTest, MalformedDelta) {
  const ColumnDescriptor desc = MakeDescriptor(T::INT64);
  vector<PrimitiveValue> values;
  for (int64_t i = 0; i < 300; ++i) values.emplace_back(i * i * 7 - 1000);
  vector<uint8_t> encoded;
  ASSERT_OK(EncodeValues(E::DELTA_BINARY_PACKED, desc, values.data(), values.size(),
      &encoded));
  vector<PrimitiveValue> decoded;
  // Count mismatch with the stream header.
  EXPECT_ERROR(DecodeValues(E::DELTA_BINARY_PACKED, desc, encoded.data(),
      encoded.size(), 299, nullptr, &decoded), TErrorCode::MALFORMED_ENCODING);
  EXPECT_ERROR(DecodeValues(E::DELTA_BINARY_PACKED, desc, encoded.data(),
      encoded.size() / 2, 300, nullptr, &decoded), TErrorCode::MALFORMED_ENCODING);
  EXPECT_ERROR(DecodeValues(E::DELTA_BINARY_PACKED, desc, encoded.data(), 0, 300,
      nullptr, &decoded), TErrorCode::MALFORMED_ENCODING);

  const ColumnDescriptor fixed = MakeDescriptor(T::FIXED_LEN_BYTE_ARRAY, 4);
  vector<PrimitiveValue> strings = {PrimitiveValue(string("abc"))};
  // Encoded as a BYTE_ARRAY column, then read as 4 byte fixed length values.
  ASSERT_OK(EncodeValues(E::DELTA_BYTE_ARRAY, MakeDescriptor(T::BYTE_ARRAY),
      strings.data(), 1, &encoded));
  EXPECT_ERROR(DecodeValues(E::DELTA_BYTE_ARRAY, fixed, encoded.data(), encoded.size(),
      1, nullptr, &decoded), TErrorCode::MALFORMED_ENCODING);
}

TEST_F(ValueCodecTest, ForgedDeltaValueCount) {
  // Lengths stream announcing INT32_MAX values in 9 bytes.
  const uint8_t huge[] = {0x80, 0x01, 0x04, 0xFF, 0xFF, 0xFF, 0xFF, 0x07, 0x00};
  const int64_t max_values = std::numeric_limits<int32_t>::max();
  const ColumnDescriptor desc = MakeDescriptor(T::BYTE_ARRAY);
  vector<PrimitiveValue> decoded;
  for (E::type e : {E::DELTA_LENGTH_BYTE_ARRAY, E::DELTA_BYTE_ARRAY}) {
    EXPECT_ERROR(DecodeValues(e, desc, huge, sizeof(huge), max_values, nullptr,
        &decoded), TErrorCode::MALFORMED_ENCODING);
    EXPECT_TRUE(decoded.empty());

    vector<PrimitiveValue> strings = {PrimitiveValue(string("ab")),
        PrimitiveValue(string("ac")), PrimitiveValue(string("b"))};
    vector<uint8_t> encoded;
    ASSERT_OK(EncodeValues(e, desc, strings.data(), strings.size(), &encoded));
    Status status = DecodeValues(e, desc, encoded.data(), encoded.size(), max_values,
        nullptr, &decoded);
    EXPECT_ERROR(status, TErrorCode::MALFORMED_ENCODING);
    EXPECT_STR_CONTAINS(status.GetDetail(), "the stream holds 3");
    EXPECT_ERROR(DecodeValues(e, desc, encoded.data(), encoded.size(), 2, nullptr,
        &decoded), TErrorCode::MALFORMED_ENCODING);
    EXPECT_TRUE(decoded.empty());
  }
}

TEST_F(ValueCodecTest, DictionaryErrors) {
  const ColumnDescriptor desc = MakeDescriptor(T::INT32);
  vector<PrimitiveValue> values = {PrimitiveValue(int32_t(1)), PrimitiveValue(int32_t(2)),
      PrimitiveValue(int32_t(3)), PrimitiveValue(int32_t(1))};
  vector<uint8_t> dict_data;
  vector<uint8_t> indices;
  int num_entries;
  ASSERT_OK(EncodeDictionary(desc, values.data(), values.size(), &dict_data,
      &num_entries, &indices));

  vector<PrimitiveValue> decoded;
  EXPECT_ERROR(DecodeValues(E::RLE_DICTIONARY, desc, indices.data(), indices.size(),
      values.size(), nullptr, &decoded), TErrorCode::STRUCTURAL_CORRUPTION);

  // A dictionary with fewer entries than the indices reference.
  DictionaryTable small;
  ASSERT_OK(small.Init(desc, dict_data.data(), 2 * sizeof(int32_t), 2));
  EXPECT_ERROR(DecodeValues(E::RLE_DICTIONARY, desc, indices.data(), indices.size(),
      values.size(), &small, &decoded), TErrorCode::MALFORMED_ENCODING);

  // The dictionary page must hold exactly the declared number of entries.
  DictionaryTable dict;
  EXPECT_ERROR(dict.Init(desc, dict_data.data(), dict_data.size(), 2),
      TErrorCode::MALFORMED_ENCODING);
  EXPECT_ERROR(dict.Init(desc, dict_data.data(), dict_data.size(), 4),
      TErrorCode::MALFORMED_ENCODING);
  EXPECT_ERROR(dict.Init(MakeDescriptor(T::BOOLEAN), dict_data.data(), 1, 1),
      TErrorCode::UNSUPPORTED_ENCODING);

  // Requesting more values than the indices hold.
  ASSERT_OK(dict.Init(desc, dict_data.data(), dict_data.size(), num_entries));
  EXPECT_ERROR(DecodeValues(E::RLE_DICTIONARY, desc, indices.data(), indices.size(),
      100, &dict, &decoded), TErrorCode::MALFORMED_ENCODING);
}

}

STRATA_TEST_MAIN();
