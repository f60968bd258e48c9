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

#include <atomic>
#include <memory>
#include <random>

#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>

#include "exec/row-group-reader.h"
#include "exec/row-group-writer.h"
#include "testutil/columnar-test-util.h"
#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"

#include "common/names.h"

namespace strata {

/// Source that records the ranges read through it.
class RecordingSource : public StorageSource {
 public:
  explicit RecordingSource(StorageSource* source) : source_(source) {}

  virtual Status Read(const ByteRange& range, vector<uint8_t>* out) override {
    {
      boost::lock_guard<boost::mutex> l(lock_);
      ranges_.push_back(range);
    }
    return source_->Read(range, out);
  }

  virtual int64_t Size() override { return source_->Size(); }

  const vector<ByteRange>& ranges() const { return ranges_; }

 private:
  StorageSource* source_;
  boost::mutex lock_;
  vector<ByteRange> ranges_;
};

class RowGroupTest : public ::testing::Test {
 protected:
  virtual void SetUp() override {
    ASSERT_OK(MakeDocumentSchema(&schema_));
  }

  /// Writes 'records' as one row group into 'storage_'.
  void WriteRowGroup(const vector<Value>& records, RowGroupSummary* summary) {
    RowGroupWriter writer(*schema_, props_, &storage_);
    ASSERT_OK(writer.Init());
    for (const Value& record : records) ASSERT_OK(writer.AppendRecord(record));
    EXPECT_EQ(records.size(), writer.num_rows());
    ASSERT_OK(writer.Close(0, summary));
  }

  void ReadRecords(const RowGroupSummary& summary, const vector<string>& paths,
      vector<Value>* records) {
    RowGroupReader reader(*schema_, read_options_);
    ASSERT_OK(reader.Init(summary, &storage_));
    ASSERT_OK(reader.ReadRecords(paths, records));
  }

  /// A Document with random DocId, links, names, languages and urls, including empty
  /// lists and absent optional fields.
  static Value RandomDocument(std::mt19937* rng) {
    std::uniform_int_distribution<int> count(0, 3);
    std::uniform_int_distribution<int64_t> id(0, 1000);
    std::bernoulli_distribution coin(0.5);
    auto random_ids = [&]() {
      vector<int64_t> ids(count(*rng));
      for (int64_t& v : ids) v = id(*rng);
      return MakeInt64List(ids);
    };
    Value links = Value::Null();
    if (coin(*rng)) links = Value::Group({random_ids(), random_ids()});
    vector<Value> names(count(*rng));
    for (Value& name : names) {
      vector<Value> languages(count(*rng));
      for (Value& language : languages) {
        language = MakeLanguage("code-" + std::to_string(id(*rng) % 20),
            coin(*rng) ? "c" + std::to_string(id(*rng)) : "");
      }
      Value url = Value::Null();
      if (coin(*rng)) url = Value::String("http://" + std::to_string(id(*rng)));
      name = Value::Group({Value::List(move(languages)), url});
    }
    return Value::Group({Value::Int64(id(*rng)), links, Value::List(move(names))});
  }

  unique_ptr<Schema> schema_;
  WriterProperties props_;
  ReaderOptions read_options_;
  MemoryStorage storage_;
};

// The records of the Dremel paper survive the way through pages and back.
TEST_F(RowGroupTest, DocumentRoundTrip) {
  vector<Value> records = MakeDocumentRecords();
  RowGroupSummary summary;
  WriteRowGroup(records, &summary);
  EXPECT_EQ(2, summary.num_rows);
  ASSERT_EQ(6, summary.columns.size());
  EXPECT_EQ(0, summary.file_offset);
  EXPECT_EQ(storage_.Size(), summary.total_byte_size);

  vector<Value> result;
  ReadRecords(summary, {}, &result);
  ASSERT_EQ(2, result.size());
  EXPECT_EQ(records[0], result[0]) << result[0];
  EXPECT_EQ(records[1], result[1]) << result[1];

  RowGroupReader reader(*schema_, read_options_);
  ASSERT_OK(reader.Init(summary, &storage_));
  vector<int> col_idxs;
  vector<ShreddedColumn> columns;
  ASSERT_OK(reader.ReadColumns({"Name.Language.Code", "Links.Backward"}, &col_idxs,
      &columns));
  ASSERT_EQ(vector<int>({1, 3}), col_idxs);

  EXPECT_EQ(vector<int16_t>({0, 0, 1}), columns[0].rep_levels);
  EXPECT_EQ(vector<int16_t>({1, 2, 2}), columns[0].def_levels);
  ASSERT_EQ(2, columns[0].values.size());
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(int64_t(10)), columns[0].values[0]));
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(int64_t(30)), columns[0].values[1]));

  EXPECT_EQ(vector<int16_t>({0, 2, 1, 1, 0}), columns[1].rep_levels);
  EXPECT_EQ(vector<int16_t>({2, 2, 1, 2, 1}), columns[1].def_levels);
  ASSERT_EQ(3, columns[1].values.size());
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(string("en-us")),
      columns[1].values[0]));
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(string("en")), columns[1].values[1]));
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(string("en-gb")),
      columns[1].values[2]));
}

// { required group Doc { repeated group Name { optional string url } } } keeps an
// absent url inside a non-empty list apart from an empty list.
TEST_F(RowGroupTest, NameUrlRoundTrip) {
  typedef columnar::FieldRepetitionType R;
  SchemaBuilder builder("Doc");
  builder.BeginGroup("Name", R::REPEATED)
      .AddLeaf("url", R::OPTIONAL, columnar::Type::BYTE_ARRAY)
      .EndGroup();
  ASSERT_OK(builder.Build(&schema_));

  vector<Value> records;
  records.push_back(Value::Group({Value::List({
      Value::Group({Value::String("a")}), Value::Group({Value::Null()})})}));
  records.push_back(Value::Group({Value::List({})}));
  RowGroupSummary summary;
  WriteRowGroup(records, &summary);
  EXPECT_EQ(2, summary.num_rows);
  ASSERT_EQ(1, summary.columns.size());

  vector<Value> result;
  ReadRecords(summary, {}, &result);
  ASSERT_EQ(2, result.size());
  EXPECT_EQ(records[0], result[0]) << result[0];
  EXPECT_EQ(records[1], result[1]) << result[1];

  RowGroupReader reader(*schema_, read_options_);
  ASSERT_OK(reader.Init(summary, &storage_));
  vector<int> col_idxs;
  vector<ShreddedColumn> columns;
  ASSERT_OK(reader.ReadColumns({"Name.url"}, &col_idxs, &columns));
  ASSERT_EQ(vector<int>({0}), col_idxs);
  EXPECT_EQ(vector<int16_t>({0, 1, 0}), columns[0].rep_levels);
  EXPECT_EQ(vector<int16_t>({2, 1, 0}), columns[0].def_levels);
  ASSERT_EQ(1, columns[0].values.size());
  EXPECT_TRUE(PrimitiveValueEquals(PrimitiveValue(string("a")), columns[0].values[0]));
}

TEST_F(RowGroupTest, RandomRoundTrip) {
  std::mt19937 rng;
  RandTestUtil::SeedRng("ROW_GROUP_TEST_SEED", &rng);
  vector<Value> records;
  for (int i = 0; i < 500; ++i) records.push_back(RandomDocument(&rng));

  // Small pages and dictionaries so that chunks have many pages and fall back.
  props_.data_page_max_values = 16;
  props_.dictionary_max_entries = 8;
  props_.fallback_encoding = columnar::Encoding::DELTA_BYTE_ARRAY;
  props_.codec = columnar::CompressionCodec::ZSTD;
  props_.num_threads = 4;
  read_options_.num_threads = 3;
  RowGroupSummary summary;
  WriteRowGroup(records, &summary);
  for (const ColumnChunkSummary& chunk : summary.columns) {
    EXPECT_EQ(500, chunk.num_rows) << chunk.path;
    EXPECT_GT(chunk.meta_data.page_locations.size(), 2) << chunk.path;
  }

  vector<Value> result;
  ReadRecords(summary, {}, &result);
  ASSERT_EQ(records.size(), result.size());
  for (int i = 0; i < records.size(); ++i) {
    ASSERT_EQ(records[i], result[i]) << "record " << i;
  }

  // Decoding on the calling thread gives the same records.
  read_options_.num_threads = 1;
  result.clear();
  ReadRecords(summary, {}, &result);
  ASSERT_EQ(records.size(), result.size());
  for (int i = 0; i < records.size(); ++i) {
    ASSERT_EQ(records[i], result[i]) << "record " << i;
  }
}

TEST_F(RowGroupTest, ColumnPruning) {
  RowGroupSummary summary;
  WriteRowGroup(MakeDocumentRecords(), &summary);

  for (int num_threads : {1, 2}) {
    read_options_.num_threads = num_threads;
    RecordingSource source(&storage_);
    RowGroupReader reader(*schema_, read_options_);
    ASSERT_OK(reader.Init(summary, &source));
    vector<Value> result;
    ASSERT_OK(reader.ReadRecords({"DocId", "Name.Url"}, &result));

    // Only the chunks of the two selected columns were read.
    ASSERT_EQ(2, source.ranges().size());
    vector<ByteRange> expected = {summary.columns[0].range(), summary.columns[5].range()};
    vector<ByteRange> ranges = source.ranges();
    if (ranges[0].offset > ranges[1].offset) std::swap(ranges[0], ranges[1]);
    EXPECT_TRUE(expected == ranges);

    ASSERT_EQ(2, result.size());
    Value expected_r1 = Value::Group({Value::Int64(10), Value::Null(),
        Value::List({Value::Group({Value::Null(), Value::String("http://A")}),
            Value::Group({Value::Null(), Value::String("http://B")}),
            Value::Group({Value::Null(), Value::Null()})})});
    Value expected_r2 = Value::Group({Value::Int64(20), Value::Null(),
        Value::List({Value::Group({Value::Null(), Value::String("http://C")})})});
    EXPECT_EQ(expected_r1, result[0]) << result[0];
    EXPECT_EQ(expected_r2, result[1]) << result[1];
  }

  // A group path selects all of its leaves.
  RecordingSource source(&storage_);
  RowGroupReader reader(*schema_, read_options_);
  ASSERT_OK(reader.Init(summary, &source));
  vector<int> col_idxs;
  vector<ShreddedColumn> columns;
  ASSERT_OK(reader.ReadColumns({"Links", "Links.Forward"}, &col_idxs, &columns));
  EXPECT_EQ(vector<int>({1, 2}), col_idxs);
  EXPECT_EQ(2, columns.size());
  EXPECT_EQ(2, source.ranges().size());
}

TEST_F(RowGroupTest, UnknownPath) {
  RowGroupSummary summary;
  WriteRowGroup(MakeDocumentRecords(), &summary);
  RecordingSource source(&storage_);
  RowGroupReader reader(*schema_, read_options_);
  ASSERT_OK(reader.Init(summary, &source));
  vector<Value> result;
  Status status = reader.ReadRecords({"DocId", "Name.Title"}, &result);
  EXPECT_ERROR(status, TErrorCode::SCHEMA_VIOLATION);
  EXPECT_STR_CONTAINS(status.GetDetail(), "Name.Title");
  vector<int> col_idxs;
  vector<ShreddedColumn> columns;
  EXPECT_ERROR(reader.ReadColumns({"Nme"}, &col_idxs, &columns),
      TErrorCode::SCHEMA_VIOLATION);
  EXPECT_TRUE(source.ranges().empty());
}

TEST_F(RowGroupTest, RejectedRecordLeavesRowGroupUnchanged) {
  vector<Value> records = MakeDocumentRecords();
  RowGroupWriter writer(*schema_, props_, &storage_);
  ASSERT_OK(writer.Init());
  ASSERT_OK(writer.AppendRecord(records[0]));
  // Missing required DocId.
  Value bad = Value::Group({Value::Null(), Value::Null(), Value::List({})});
  EXPECT_ERROR(writer.AppendRecord(bad), TErrorCode::SCHEMA_VIOLATION);
  // Too few fields.
  EXPECT_ERROR(writer.AppendRecord(Value::Group({Value::Int64(1)})),
      TErrorCode::SCHEMA_VIOLATION);
  EXPECT_EQ(1, writer.num_rows());
  ASSERT_OK(writer.AppendRecord(records[1]));

  RowGroupSummary summary;
  ASSERT_OK(writer.Close(3, &summary));
  EXPECT_EQ(3, summary.ordinal);
  vector<Value> result;
  ReadRecords(summary, {}, &result);
  ASSERT_EQ(2, result.size());
  EXPECT_EQ(records[0], result[0]);
  EXPECT_EQ(records[1], result[1]);
}

TEST_F(RowGroupTest, IsFull) {
  props_.row_group_max_rows = 2;
  RowGroupWriter writer(*schema_, props_, &storage_);
  ASSERT_OK(writer.Init());
  vector<Value> records = MakeDocumentRecords();
  EXPECT_FALSE(writer.IsFull());
  ASSERT_OK(writer.AppendRecord(records[0]));
  EXPECT_FALSE(writer.IsFull());
  EXPECT_GT(writer.EstimatedSize(), 0);
  ASSERT_OK(writer.AppendRecord(records[1]));
  EXPECT_TRUE(writer.IsFull());
}

TEST_F(RowGroupTest, MismatchedSummary) {
  RowGroupSummary summary;
  WriteRowGroup(MakeDocumentRecords(), &summary);

  RowGroupReader reader(*schema_, read_options_);
  RowGroupSummary missing_column = summary;
  missing_column.columns.pop_back();
  EXPECT_ERROR(reader.Init(missing_column, &storage_),
      TErrorCode::STRUCTURAL_CORRUPTION);

  RowGroupSummary swapped = summary;
  std::swap(swapped.columns[1], swapped.columns[2]);
  EXPECT_ERROR(reader.Init(swapped, &storage_), TErrorCode::STRUCTURAL_CORRUPTION);

  RowGroupSummary wrong_rows = summary;
  wrong_rows.num_rows = 3;
  EXPECT_ERROR(reader.Init(wrong_rows, &storage_), TErrorCode::STRUCTURAL_CORRUPTION);
}

TEST_F(RowGroupTest, Cancellation) {
  std::atomic<bool> cancelled(true);
  props_.data_page_max_values = 1;
  RowGroupWriter writer(*schema_, props_, &storage_, &cancelled);
  ASSERT_OK(writer.Init());
  vector<Value> records = MakeDocumentRecords();
  // The first record fills the pages; the second one finds them full.
  ASSERT_OK(writer.AppendRecord(records[0]));
  EXPECT_ERROR(writer.AppendRecord(records[1]), TErrorCode::CANCELLED);
  EXPECT_EQ(1, writer.num_rows());
  RowGroupSummary summary;
  EXPECT_FALSE(writer.Close(0, &summary).ok());
  EXPECT_EQ(0, storage_.Size());
}

}

STRATA_TEST_MAIN();
