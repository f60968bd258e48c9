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

#include "exec/column-chunk-reader.h"
#include "exec/column-chunk-writer.h"
#include "exec/column-stats.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

using columnar::ColumnMetaData;
using columnar::CompressionCodec;
using columnar::Encoding;
using columnar::PageType;
typedef columnar::FieldRepetitionType R;

class ColumnChunkWriterTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    props_.codec = CompressionCodec::UNCOMPRESSED;
  }

  /// Builds a schema with the single leaf 'v' and returns its descriptor.
  const ColumnDescriptor& MakeColumn(R::type repetition, columnar::Type::type type,
      int type_length = 0) {
    SchemaBuilder b;
    b.AddLeaf("v", repetition, type, type_length);
    EXPECT_OK(b.Build(&schema_));
    return schema_->column(0);
  }

  Status WriteColumn(const ColumnDescriptor& desc, const ShreddedColumn& column,
      ColumnChunkSummary* summary) {
    unique_ptr<ColumnChunkWriter> writer;
    RETURN_IF_ERROR(ColumnChunkWriter::Create(desc, props_, &storage_, nullptr, &writer));
    RETURN_IF_ERROR(writer->AppendColumn(column));
    return writer->Close(summary);
  }

  /// Returns the headers of the pages of the chunk, in order.
  vector<PageHeader> ReadPageHeaders(const ColumnChunkSummary& summary) {
    vector<PageHeader> headers;
    PageReader reader(summary.path);
    int64_t offset = summary.file_offset;
    const int64_t end = summary.range().end();
    while (offset < end) {
      PageHeader header;
      EXPECT_OK(reader.ParseHeader(storage_.bytes().data() + offset, end - offset,
          offset, &header));
      headers.push_back(header);
      offset += PageHeader::SIZE + header.compressed_size;
    }
    EXPECT_EQ(end, offset);
    return headers;
  }

  /// Reads the chunk back and compares it with 'expected'.
  void ExpectReadBack(const ColumnDescriptor& desc, const ColumnChunkSummary& summary,
      const ShreddedColumn& expected) {
    ColumnChunkReader reader(desc, ReaderOptions());
    ASSERT_OK(reader.Init(summary, &storage_));
    ShreddedColumn actual;
    ASSERT_OK(reader.ReadAll(&actual));
    EXPECT_EQ(expected.rep_levels, actual.rep_levels);
    EXPECT_EQ(expected.def_levels, actual.def_levels);
    ASSERT_EQ(expected.values.size(), actual.values.size());
    for (int i = 0; i < expected.values.size(); ++i) {
      EXPECT_TRUE(PrimitiveValueEquals(expected.values[i], actual.values[i]))
          << i << ": " << expected.values[i] << " != " << actual.values[i];
    }
  }

  /// A required column with one entry per value.
  template <typename T>
  static ShreddedColumn FlatColumn(const vector<T>& values) {
    ShreddedColumn column;
    for (const T& v : values) {
      PrimitiveValue value(v);
      column.Append(0, 0, &value);
    }
    return column;
  }

  /// A repeated int32 column with 'num_records' records of 'record_len' elements
  /// holding consecutive values.
  static ShreddedColumn RepeatedColumn(int num_records, int record_len) {
    ShreddedColumn column;
    int32_t next = 0;
    for (int r = 0; r < num_records; ++r) {
      for (int i = 0; i < record_len; ++i) {
        PrimitiveValue value(next++);
        column.Append(i == 0 ? 0 : 1, 1, &value);
      }
    }
    return column;
  }

  WriterProperties props_;
  MemoryStorage storage_;
  unique_ptr<Schema> schema_;
};

TEST_F(ColumnChunkWriterTest, DictionaryEncoded) {
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::INT64);
  vector<int64_t> values;
  for (int i = 0; i < 1000; ++i) values.push_back(i % 10);
  ShreddedColumn column = FlatColumn(values);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  const ColumnMetaData& meta = summary.meta_data;
  EXPECT_EQ("v", summary.path);
  EXPECT_EQ(1000, summary.num_rows);
  EXPECT_EQ(1000, meta.num_values);
  EXPECT_EQ(columnar::Type::INT64, meta.type);
  EXPECT_EQ(vector<string>({"v"}), meta.path_in_schema);
  EXPECT_EQ(storage_.Size(), meta.total_compressed_size);
  ASSERT_TRUE(meta.__isset.dictionary_page_offset);
  EXPECT_EQ(summary.file_offset, meta.dictionary_page_offset);
  EXPECT_GT(meta.data_page_offset, meta.dictionary_page_offset);
  EXPECT_EQ(vector<Encoding::type>({Encoding::RLE, Encoding::RLE_DICTIONARY}),
      meta.encodings);

  vector<PageHeader> headers = ReadPageHeaders(summary);
  ASSERT_EQ(2, headers.size());
  EXPECT_EQ(PageType::DICTIONARY_PAGE, headers[0].type);
  EXPECT_EQ(Encoding::PLAIN, headers[0].encoding);
  EXPECT_EQ(10, headers[0].num_values);
  EXPECT_EQ(PageType::DATA_PAGE, headers[1].type);
  EXPECT_EQ(Encoding::RLE_DICTIONARY, headers[1].encoding);
  EXPECT_EQ(1000, headers[1].num_values);
  EXPECT_EQ(1000, headers[1].num_rows);
  EXPECT_EQ(0, headers[1].num_nulls);

  const columnar::Statistics& stats = meta.statistics;
  EXPECT_EQ(0, stats.null_count);
  ASSERT_TRUE(stats.__isset.distinct_count);
  EXPECT_EQ(10, stats.distinct_count);
  PrimitiveValue min_value;
  PrimitiveValue max_value;
  ASSERT_TRUE(ColumnStatsBase::ReadFromThrift(
      stats, desc, ColumnStatsBase::StatsField::MIN, &min_value));
  ASSERT_TRUE(ColumnStatsBase::ReadFromThrift(
      stats, desc, ColumnStatsBase::StatsField::MAX, &max_value));
  EXPECT_EQ(0, std::get<int64_t>(min_value));
  EXPECT_EQ(9, std::get<int64_t>(max_value));

  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, PageLimits) {
  props_.data_page_max_values = 100;
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::INT32);
  vector<int32_t> values;
  for (int i = 0; i < 1000; ++i) values.push_back(i % 3);
  ShreddedColumn column = FlatColumn(values);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  const vector<columnar::PageLocation>& locations = summary.meta_data.page_locations;
  ASSERT_EQ(11, locations.size());
  EXPECT_EQ(PageType::DICTIONARY_PAGE, locations[0].page_type);
  int64_t offset = summary.file_offset;
  for (int i = 0; i < locations.size(); ++i) {
    EXPECT_EQ(offset, locations[i].offset);
    offset += locations[i].compressed_page_size;
    if (i == 0) continue;
    EXPECT_EQ(PageType::DATA_PAGE, locations[i].page_type);
    EXPECT_EQ((i - 1) * 100, locations[i].first_row_index);
  }
  EXPECT_EQ(summary.range().end(), offset);
  ExpectReadBack(desc, summary, column);

  // Byte size limit with PLAIN values.
  props_.enable_dictionary = false;
  props_.data_page_max_values = 20000;
  props_.data_page_size = 400;
  storage_.mutable_bytes()->clear();
  ASSERT_OK(WriteColumn(desc, column, &summary));
  vector<PageHeader> headers = ReadPageHeaders(summary);
  ASSERT_EQ(10, headers.size());
  for (const PageHeader& header : headers) {
    EXPECT_EQ(Encoding::PLAIN, header.encoding);
    EXPECT_EQ(100, header.num_values);
  }
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, RecordsNeverSpanPages) {
  props_.data_page_max_values = 10;
  const ColumnDescriptor& desc = MakeColumn(R::REPEATED, columnar::Type::INT32);
  ShreddedColumn column = RepeatedColumn(50, 7);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));
  EXPECT_EQ(50, summary.num_rows);
  EXPECT_EQ(350, summary.meta_data.num_values);

  int64_t num_rows = 0;
  for (const PageHeader& header : ReadPageHeaders(summary)) {
    if (header.type != PageType::DATA_PAGE) continue;
    EXPECT_EQ(7 * header.num_rows, header.num_values);
    num_rows += header.num_rows;
  }
  EXPECT_EQ(50, num_rows);
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, DictionaryFallbackAtRecordBoundary) {
  props_.dictionary_max_entries = 100;
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::INT32);
  vector<int32_t> values;
  for (int i = 0; i < 1000; ++i) values.push_back(i);
  ShreddedColumn column = FlatColumn(values);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  vector<PageHeader> headers = ReadPageHeaders(summary);
  ASSERT_EQ(3, headers.size());
  EXPECT_EQ(PageType::DICTIONARY_PAGE, headers[0].type);
  EXPECT_EQ(100, headers[0].num_values);
  EXPECT_EQ(Encoding::RLE_DICTIONARY, headers[1].encoding);
  EXPECT_EQ(100, headers[1].num_values);
  EXPECT_EQ(PageType::DATA_PAGE, headers[2].type);
  EXPECT_EQ(Encoding::PLAIN, headers[2].encoding);
  EXPECT_EQ(900, headers[2].num_values);

  // The distinct count is unknown after the fallback.
  EXPECT_FALSE(summary.meta_data.statistics.__isset.distinct_count);
  int num_dict_pages = 0;
  for (const columnar::PageEncodingStats& stats : summary.meta_data.encoding_stats) {
    if (stats.page_type == PageType::DICTIONARY_PAGE) num_dict_pages += stats.count;
  }
  EXPECT_EQ(1, num_dict_pages);
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, DictionaryFallbackInsideRecord) {
  props_.dictionary_max_entries = 10;
  props_.data_page_max_values = 6;
  props_.fallback_encoding = Encoding::DELTA_BINARY_PACKED;
  const ColumnDescriptor& desc = MakeColumn(R::REPEATED, columnar::Type::INT32);
  // The 11th distinct value is the second element of the fourth record, which starts
  // in the second page.
  ShreddedColumn column = RepeatedColumn(20, 3);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  vector<PageHeader> headers = ReadPageHeaders(summary);
  ASSERT_GE(headers.size(), 4);
  EXPECT_EQ(PageType::DICTIONARY_PAGE, headers[0].type);
  EXPECT_EQ(Encoding::RLE_DICTIONARY, headers[1].encoding);
  EXPECT_EQ(6, headers[1].num_values);
  for (int i = 2; i < headers.size(); ++i) {
    EXPECT_EQ(PageType::DATA_PAGE, headers[i].type);
    EXPECT_EQ(Encoding::DELTA_BINARY_PACKED, headers[i].encoding) << i;
  }
  ExpectReadBack(desc, summary, column);

  // Without a completed dictionary page no dictionary is written at all.
  props_.data_page_max_values = 1000;
  storage_.mutable_bytes()->clear();
  ASSERT_OK(WriteColumn(desc, column, &summary));
  EXPECT_FALSE(summary.meta_data.__isset.dictionary_page_offset);
  headers = ReadPageHeaders(summary);
  ASSERT_EQ(1, headers.size());
  EXPECT_EQ(Encoding::DELTA_BINARY_PACKED, headers[0].encoding);
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, DictionaryByteLimit) {
  props_.dictionary_page_size = 1000;
  props_.fallback_encoding = Encoding::DELTA_BYTE_ARRAY;
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::BYTE_ARRAY);
  vector<string> values;
  for (int i = 0; i < 500; ++i) values.push_back("value-" + std::to_string(i));
  ShreddedColumn column = FlatColumn(values);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  vector<PageHeader> headers = ReadPageHeaders(summary);
  ASSERT_EQ(3, headers.size());
  EXPECT_EQ(PageType::DICTIONARY_PAGE, headers[0].type);
  EXPECT_LE(headers[0].uncompressed_size, 1000 + 20);
  EXPECT_EQ(Encoding::RLE_DICTIONARY, headers[1].encoding);
  EXPECT_EQ(Encoding::DELTA_BYTE_ARRAY, headers[2].encoding);
  EXPECT_EQ(500, headers[1].num_values + headers[2].num_values);
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, Statistics) {
  props_.data_page_max_values = 4;
  const ColumnDescriptor& desc = MakeColumn(R::OPTIONAL, columnar::Type::BYTE_ARRAY);
  const vector<string> values = {"m", "", "\xff", "a", "zz", "b"};
  ShreddedColumn column;
  int num_nulls = 0;
  for (int i = 0; i < 12; ++i) {
    if (i % 2 == 1) {
      column.Append(0, 0, nullptr);
      ++num_nulls;
    } else {
      PrimitiveValue value(values[i / 2]);
      column.Append(0, 1, &value);
    }
  }
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  const columnar::Statistics& stats = summary.meta_data.statistics;
  EXPECT_EQ(num_nulls, stats.null_count);
  EXPECT_EQ(6, stats.distinct_count);
  // Byte arrays compare unsigned.
  EXPECT_EQ("", stats.min_value);
  EXPECT_EQ("\xff", stats.max_value);

  // Per page statistics: pages hold entries [0, 4), [4, 8) and [8, 12).
  const vector<columnar::PageLocation>& locations = summary.meta_data.page_locations;
  ASSERT_EQ(4, locations.size());
  const string expected_min[] = {"", "a", "b"};
  const string expected_max[] = {"m", "\xff", "zz"};
  for (int i = 0; i < 3; ++i) {
    const columnar::PageLocation& location = locations[i + 1];
    ASSERT_TRUE(location.__isset.statistics);
    EXPECT_EQ(2, location.statistics.null_count);
    EXPECT_EQ(expected_min[i], location.statistics.min_value) << i;
    EXPECT_EQ(expected_max[i], location.statistics.max_value) << i;
  }
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, AllNulls) {
  const ColumnDescriptor& desc = MakeColumn(R::OPTIONAL, columnar::Type::DOUBLE);
  ShreddedColumn column;
  for (int i = 0; i < 100; ++i) column.Append(0, 0, nullptr);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));

  // An all-NULL page is written as PLAIN and needs no dictionary.
  EXPECT_FALSE(summary.meta_data.__isset.dictionary_page_offset);
  vector<PageHeader> headers = ReadPageHeaders(summary);
  ASSERT_EQ(1, headers.size());
  EXPECT_EQ(Encoding::PLAIN, headers[0].encoding);
  EXPECT_EQ(100, headers[0].num_nulls);
  const columnar::Statistics& stats = summary.meta_data.statistics;
  EXPECT_EQ(100, stats.null_count);
  EXPECT_FALSE(stats.__isset.min_value);
  EXPECT_FALSE(stats.__isset.max_value);
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, Booleans) {
  props_.data_page_max_values = 64;
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::BOOLEAN);
  vector<bool> values;
  for (int i = 0; i < 300; ++i) values.push_back(i % 3 == 0);
  ShreddedColumn column = FlatColumn(values);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));
  EXPECT_FALSE(summary.meta_data.__isset.dictionary_page_offset);
  for (const PageHeader& header : ReadPageHeaders(summary)) {
    EXPECT_EQ(Encoding::PLAIN, header.encoding);
  }
  EXPECT_EQ(string(1, '\0'), summary.meta_data.statistics.min_value);
  EXPECT_EQ(string(1, '\1'), summary.meta_data.statistics.max_value);
  ExpectReadBack(desc, summary, column);

  props_.fallback_encoding = Encoding::RLE;
  storage_.mutable_bytes()->clear();
  ASSERT_OK(WriteColumn(desc, column, &summary));
  for (const PageHeader& header : ReadPageHeaders(summary)) {
    EXPECT_EQ(Encoding::RLE, header.encoding);
  }
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, CompressedWithChecksums) {
  props_.codec = CompressionCodec::GZIP;
  props_.data_page_max_values = 250;
  const ColumnDescriptor& desc =
      MakeColumn(R::REQUIRED, columnar::Type::FIXED_LEN_BYTE_ARRAY, 4);
  vector<string> values;
  for (int i = 0; i < 1000; ++i) values.push_back(i % 2 == 0 ? "abcd" : "wxyz");
  ShreddedColumn column = FlatColumn(values);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, column, &summary));
  EXPECT_EQ(CompressionCodec::GZIP, summary.meta_data.codec);
  EXPECT_TRUE(summary.meta_data.has_page_checksums);
  for (const PageHeader& header : ReadPageHeaders(summary)) {
    EXPECT_EQ(CompressionCodec::GZIP, header.codec);
    EXPECT_TRUE(header.has_checksum());
  }
  ExpectReadBack(desc, summary, column);
}

TEST_F(ColumnChunkWriterTest, EmptyChunk) {
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::INT32);
  ColumnChunkSummary summary;
  ASSERT_OK(WriteColumn(desc, ShreddedColumn(), &summary));
  EXPECT_EQ(0, summary.num_rows);
  EXPECT_EQ(0, summary.meta_data.num_values);
  EXPECT_EQ(0, summary.meta_data.total_compressed_size);
  ExpectReadBack(desc, summary, ShreddedColumn());
}

TEST_F(ColumnChunkWriterTest, InvalidEntries) {
  const ColumnDescriptor& desc = MakeColumn(R::REPEATED, columnar::Type::INT32);
  unique_ptr<ColumnChunkWriter> writer;
  ASSERT_OK(ColumnChunkWriter::Create(desc, props_, &storage_, nullptr, &writer));
  PrimitiveValue value(int32_t(1));
  PrimitiveValue wrong_type(int64_t(1));
  EXPECT_ERROR(writer->AppendEntry(1, 1, &value), TErrorCode::SCHEMA_VIOLATION);
  EXPECT_ERROR(writer->AppendEntry(0, 2, &value), TErrorCode::SCHEMA_VIOLATION);
  EXPECT_ERROR(writer->AppendEntry(2, 1, &value), TErrorCode::SCHEMA_VIOLATION);
  EXPECT_ERROR(writer->AppendEntry(0, 1, nullptr), TErrorCode::SCHEMA_VIOLATION);
  EXPECT_ERROR(writer->AppendEntry(0, 0, &value), TErrorCode::SCHEMA_VIOLATION);
  EXPECT_ERROR(writer->AppendEntry(0, 1, &wrong_type), TErrorCode::SCHEMA_VIOLATION);
  EXPECT_OK(writer->AppendEntry(0, 1, &value));
  EXPECT_OK(writer->AppendEntry(1, 1, &value));
  EXPECT_OK(writer->AppendEntry(0, 0, nullptr));
  EXPECT_EQ(3, writer->num_values());
  EXPECT_EQ(2, writer->num_rows());

  ShreddedColumn missing_value;
  missing_value.rep_levels = {0};
  missing_value.def_levels = {1};
  EXPECT_ERROR(writer->AppendColumn(missing_value), TErrorCode::SCHEMA_VIOLATION);
}

TEST_F(ColumnChunkWriterTest, CancelledAtPageBoundary) {
  props_.data_page_max_values = 10;
  const ColumnDescriptor& desc = MakeColumn(R::REQUIRED, columnar::Type::INT32);
  std::atomic<bool> cancelled(false);
  unique_ptr<ColumnChunkWriter> writer;
  ASSERT_OK(ColumnChunkWriter::Create(desc, props_, &storage_, &cancelled, &writer));
  for (int32_t i = 0; i < 15; ++i) {
    PrimitiveValue value(i);
    ASSERT_OK(writer->AppendEntry(0, 0, &value));
  }
  cancelled = true;
  // The current page is completed before cancellation takes effect.
  for (int32_t i = 15; i < 20; ++i) {
    PrimitiveValue value(i);
    EXPECT_OK(writer->AppendEntry(0, 0, &value));
  }
  PrimitiveValue value(int32_t(20));
  EXPECT_ERROR(writer->AppendEntry(0, 0, &value), TErrorCode::CANCELLED);
  EXPECT_EQ(0, storage_.Size());

  ASSERT_OK(ColumnChunkWriter::Create(desc, props_, &storage_, &cancelled, &writer));
  ASSERT_OK(writer->AppendEntry(0, 0, &value));
  ColumnChunkSummary summary;
  EXPECT_ERROR(writer->Close(&summary), TErrorCode::CANCELLED);
  EXPECT_EQ(0, storage_.Size());
}

}

STRATA_TEST_MAIN();
