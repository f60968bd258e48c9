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

#include "exec/column-stats.inline.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

using columnar::Statistics;
using columnar::Type;

typedef ColumnStatsBase::StatsField StatsField;

static ColumnDescriptor MakeDescriptor(Type::type type, int type_length = 0) {
  ColumnDescriptor desc;
  desc.path = "col";
  desc.type = type;
  desc.type_length = type_length;
  return desc;
}

/// Encodes 'stats' and checks that the min and max read back from the thrift struct
/// are 'min' and 'max'.
template <typename T>
static void CheckMinMax(const ColumnStats<T>& stats, const ColumnDescriptor& desc,
    const T& min, const T& max) {
  Statistics thrift_stats;
  stats.EncodeToThrift(&thrift_stats);
  PrimitiveValue value;
  ASSERT_TRUE(ColumnStatsBase::ReadFromThrift(thrift_stats, desc, StatsField::MIN,
      &value));
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(std::in_place_type<T>, min), value))
      << value;
  ASSERT_TRUE(ColumnStatsBase::ReadFromThrift(thrift_stats, desc, StatsField::MAX,
      &value));
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(std::in_place_type<T>, max), value))
      << value;
}

TEST(ColumnStatsTest, Integers) {
  ColumnStats<int32_t> stats(sizeof(int32_t));
  for (int32_t v : {5, -3, 100, 0, std::numeric_limits<int32_t>::min()}) {
    stats.Update(v);
  }
  stats.IncrementNullCount(3);
  EXPECT_EQ(std::numeric_limits<int32_t>::min(), stats.min_value());
  EXPECT_EQ(100, stats.max_value());
  CheckMinMax<int32_t>(stats, MakeDescriptor(Type::INT32),
      std::numeric_limits<int32_t>::min(), 100);

  Statistics thrift_stats;
  stats.EncodeToThrift(&thrift_stats);
  int64_t null_count;
  ASSERT_TRUE(ColumnStatsBase::ReadNullCountStat(thrift_stats, &null_count));
  EXPECT_EQ(3, null_count);
  EXPECT_FALSE(thrift_stats.__isset.distinct_count);
  EXPECT_EQ(4, thrift_stats.min_value.size());
}

TEST(ColumnStatsTest, OnlyNulls) {
  ColumnStats<int64_t> stats(sizeof(int64_t));
  stats.IncrementNullCount(7);
  EXPECT_FALSE(stats.has_min_max_values());
  Statistics thrift_stats;
  stats.EncodeToThrift(&thrift_stats);
  EXPECT_FALSE(thrift_stats.__isset.min_value);
  EXPECT_FALSE(thrift_stats.__isset.max_value);
  EXPECT_EQ(7, thrift_stats.null_count);
  PrimitiveValue value;
  EXPECT_FALSE(ColumnStatsBase::ReadFromThrift(thrift_stats, MakeDescriptor(Type::INT64),
      StatsField::MIN, &value));
}

TEST(ColumnStatsTest, Booleans) {
  ColumnStats<bool> stats(-1);
  stats.Update(true);
  EXPECT_TRUE(stats.min_value());
  stats.Update(false);
  stats.Update(true);
  CheckMinMax<bool>(stats, MakeDescriptor(Type::BOOLEAN), false, true);
}

TEST(ColumnStatsTest, NaNIsIgnored) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  ColumnStats<double> stats(sizeof(double));
  stats.Update(nan);
  EXPECT_FALSE(stats.has_min_max_values());
  stats.Update(2.5);
  stats.Update(nan);
  stats.Update(-1.0);
  stats.Update(nan);
  CheckMinMax<double>(stats, MakeDescriptor(Type::DOUBLE), -1.0, 2.5);

  ColumnStats<float> float_stats(sizeof(float));
  float_stats.Update(std::numeric_limits<float>::quiet_NaN());
  float_stats.Update(-std::numeric_limits<float>::infinity());
  float_stats.Update(1.0f);
  CheckMinMax<float>(float_stats, MakeDescriptor(Type::FLOAT),
      -std::numeric_limits<float>::infinity(), 1.0f);

  // NaN stored in a file is not trusted.
  Statistics thrift_stats;
  thrift_stats.__set_min_value(string(reinterpret_cast<const char*>(&nan), sizeof(nan)));
  PrimitiveValue value;
  EXPECT_FALSE(ColumnStatsBase::ReadFromThrift(thrift_stats,
      MakeDescriptor(Type::DOUBLE), StatsField::MIN, &value));
}

TEST(ColumnStatsTest, ByteArraysCompareUnsigned) {
  ColumnStats<string> stats(-1);
  stats.Update(string("abc"));
  stats.Update(string("\xff\x01", 2));
  stats.Update(string("ab"));
  stats.Update(string("\x7f"));
  CheckMinMax<string>(stats, MakeDescriptor(Type::BYTE_ARRAY), "ab",
      string("\xff\x01", 2));
  stats.Update(string());
  EXPECT_EQ("", stats.min_value());
  CheckMinMax<string>(stats, MakeDescriptor(Type::BYTE_ARRAY), "",
      string("\xff\x01", 2));
  // Without a length prefix.
  Statistics thrift_stats;
  stats.EncodeToThrift(&thrift_stats);
  EXPECT_EQ(2, thrift_stats.max_value.size());
}

TEST(ColumnStatsTest, FixedLenByteArrays) {
  ColumnStats<string> stats(3);
  stats.Update(string("bcd"));
  stats.Update(string("abc"));
  const ColumnDescriptor desc = MakeDescriptor(Type::FIXED_LEN_BYTE_ARRAY, 3);
  CheckMinMax<string>(stats, desc, "abc", "bcd");

  Statistics thrift_stats;
  thrift_stats.__set_min_value("abcd");
  PrimitiveValue value;
  EXPECT_FALSE(ColumnStatsBase::ReadFromThrift(thrift_stats, desc, StatsField::MIN,
      &value));
}

TEST(ColumnStatsTest, Int96HasNoOrder) {
  ColumnStats<Int96> stats(12);
  Int96 v;
  v.bytes[0] = 1;
  stats.Update(v);
  stats.IncrementNullCount(1);
  EXPECT_FALSE(stats.has_min_max_values());
  Statistics thrift_stats;
  stats.EncodeToThrift(&thrift_stats);
  EXPECT_FALSE(thrift_stats.__isset.min_value);
  EXPECT_EQ(1, thrift_stats.null_count);
}

TEST(ColumnStatsTest, Merge) {
  ColumnStats<int64_t> chunk_stats(sizeof(int64_t));
  ColumnStats<int64_t> page_stats(sizeof(int64_t));
  page_stats.Update(10);
  page_stats.Update(20);
  page_stats.IncrementNullCount(2);
  chunk_stats.Merge(page_stats);

  page_stats.Reset();
  EXPECT_FALSE(page_stats.has_min_max_values());
  EXPECT_EQ(0, page_stats.null_count());
  page_stats.IncrementNullCount(5);
  chunk_stats.Merge(page_stats);

  page_stats.Reset();
  page_stats.Update(-4);
  chunk_stats.Merge(page_stats);

  EXPECT_EQ(-4, chunk_stats.min_value());
  EXPECT_EQ(20, chunk_stats.max_value());
  EXPECT_EQ(7, chunk_stats.null_count());
}

TEST(ColumnStatsTest, DistinctCount) {
  ColumnStats<int32_t> stats(sizeof(int32_t));
  stats.Update(1);
  stats.SetDistinctCount(1);
  Statistics thrift_stats;
  stats.EncodeToThrift(&thrift_stats);
  ASSERT_TRUE(thrift_stats.__isset.distinct_count);
  EXPECT_EQ(1, thrift_stats.distinct_count);
  stats.Reset();
  EXPECT_EQ(-1, stats.distinct_count());
}

TEST(ColumnStatsTest, BytesNeeded) {
  ColumnStats<string> stats(-1);
  stats.Update(string(100, 'x'));
  stats.Update(string(10, 'a'));
  EXPECT_EQ(100 + 10 + 2 * sizeof(int64_t), stats.BytesNeeded());
}

}

STRATA_TEST_MAIN();
