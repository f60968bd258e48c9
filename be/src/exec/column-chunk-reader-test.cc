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


#include <string.h>
#include <memory>

#include "exec/column-chunk-reader.h"
#include "exec/column-chunk-writer.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

using columnar::CompressionCodec;
using columnar::Encoding;
typedef columnar::FieldRepetitionType R;

class ColumnChunkReaderTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    props_.codec = CompressionCodec::SNAPPY;
    SchemaBuilder b;
    b.AddLeaf("id", R::REQUIRED, columnar::Type::INT64)
     .BeginGroup("tags", R::REPEATED)
       .AddLeaf("name", R::OPTIONAL, columnar::Type::BYTE_ARRAY)
     .EndGroup();
    ASSERT_OK(b.Build(&schema_));
    // 'tags.name' entries of 100 records with i % 4 tags each, every third one NULL.
    for (int i = 0; i < 100; ++i) {
      if (i % 4 == 0) {
        tags_.Append(0, 0, nullptr);
        continue;
      }
      for (int j = 0; j < i % 4; ++j) {
        const int16_t rep = j == 0 ? 0 : 1;
        if ((i + j) % 3 == 0) {
          tags_.Append(rep, 1, nullptr);
        } else {
          PrimitiveValue value(string("tag") + std::to_string((i * j) % 17));
          tags_.Append(rep, 2, &value);
        }
      }
    }
  }

  const ColumnDescriptor& tags_desc() const { return schema_->column(1); }

  void WriteTags(ColumnChunkSummary* summary) {
    unique_ptr<ColumnChunkWriter> writer;
    ASSERT_OK(
        ColumnChunkWriter::Create(tags_desc(), props_, &storage_, nullptr, &writer));
    ASSERT_OK(writer->AppendColumn(tags_));
    ASSERT_OK(writer->Close(summary));
  }

  Status ReadTags(const ColumnChunkSummary& summary, StorageSource* source,
      ShreddedColumn* column, ReaderOptions options = ReaderOptions()) {
    ColumnChunkReader reader(tags_desc(), options);
    RETURN_IF_ERROR(reader.Init(summary, source));
    return reader.ReadAll(column);
  }

  void ExpectTags(const ShreddedColumn& actual) {
    EXPECT_EQ(tags_.rep_levels, actual.rep_levels);
    EXPECT_EQ(tags_.def_levels, actual.def_levels);
    EXPECT_EQ(tags_.values, actual.values);
  }

  WriterProperties props_;
  MemoryStorage storage_;
  unique_ptr<Schema> schema_;
  ShreddedColumn tags_;
};

TEST_F(ColumnChunkReaderTest, FallbackEncodings) {
  props_.data_page_max_values = 16;
  props_.dictionary_max_entries = 8;
  for (Encoding::type encoding : {Encoding::PLAIN, Encoding::DELTA_LENGTH_BYTE_ARRAY,
           Encoding::DELTA_BYTE_ARRAY}) {
    props_.fallback_encoding = encoding;
    for (bool enable_dictionary : {true, false}) {
      props_.enable_dictionary = enable_dictionary;
      storage_.mutable_bytes()->clear();
      ColumnChunkSummary summary;
      WriteTags(&summary);
      ShreddedColumn column;
      ASSERT_OK(ReadTags(summary, &storage_, &column));
      ExpectTags(column);
    }
  }
}

TEST_F(ColumnChunkReaderTest, BitPackedLevels) {
  props_.level_encoding = Encoding::BIT_PACKED;
  props_.data_page_max_values = 10;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  ShreddedColumn column;
  ASSERT_OK(ReadTags(summary, &storage_, &column));
  ExpectTags(column);
}

TEST_F(ColumnChunkReaderTest, Cursor) {
  props_.data_page_max_values = 5;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  ColumnChunkReader reader(tags_desc(), ReaderOptions());
  ASSERT_OK(reader.Init(summary, &storage_));
  int64_t value_idx = 0;
  for (int64_t i = 0; i < tags_.num_entries(); ++i) {
    int16_t rep = -1;
    int16_t def = -1;
    bool eos = true;
    ASSERT_OK(reader.PeekLevels(&rep, &def, &eos));
    ASSERT_FALSE(eos);
    EXPECT_EQ(tags_.rep_levels[i], rep);
    EXPECT_EQ(tags_.def_levels[i], def);
    // Peeking doesn't consume.
    ASSERT_OK(reader.PeekLevels(&rep, &def, &eos));
    EXPECT_EQ(tags_.rep_levels[i], rep);
    PrimitiveValue value;
    ASSERT_OK(reader.NextEntry(&rep, &def, &value));
    EXPECT_EQ(tags_.rep_levels[i], rep);
    EXPECT_EQ(tags_.def_levels[i], def);
    if (def == tags_desc().max_def_level) {
      EXPECT_EQ(tags_.values[value_idx++], value);
    }
  }
  bool eos = false;
  int16_t rep;
  int16_t def;
  ASSERT_OK(reader.PeekLevels(&rep, &def, &eos));
  EXPECT_TRUE(eos);
  EXPECT_TRUE(reader.has_dictionary());
  EXPECT_GT(reader.num_data_pages_read(), 10);
}

TEST_F(ColumnChunkReaderTest, ChecksumMismatch) {
  props_.codec = CompressionCodec::UNCOMPRESSED;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  // Corrupt the last byte of the data page.
  (*storage_.mutable_bytes())[summary.range().end() - 1] ^= 0x10;
  ShreddedColumn column;
  Status status = ReadTags(summary, &storage_, &column);
  EXPECT_ERROR(status, TErrorCode::CHECKSUM_MISMATCH);
  EXPECT_STR_CONTAINS(status.GetDetail(), "tags.name");
  std::stringstream offset;
  offset << "offset " << summary.meta_data.data_page_offset;
  EXPECT_STR_CONTAINS(status.GetDetail(), offset.str());
}

TEST_F(ColumnChunkReaderTest, MissingDictionary) {
  props_.codec = CompressionCodec::UNCOMPRESSED;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  ASSERT_TRUE(summary.meta_data.__isset.dictionary_page_offset);
  // Drop the dictionary page from the chunk.
  const int64_t dict_size = summary.meta_data.data_page_offset - summary.file_offset;
  summary.file_offset = summary.meta_data.data_page_offset;
  summary.meta_data.total_compressed_size -= dict_size;
  ShreddedColumn column;
  Status status = ReadTags(summary, &storage_, &column);
  EXPECT_ERROR(status, TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_STR_CONTAINS(status.GetDetail(), "no dictionary page");
}

TEST_F(ColumnChunkReaderTest, MisplacedDictionary) {
  props_.codec = CompressionCodec::UNCOMPRESSED;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  const vector<uint8_t>& bytes = storage_.bytes();
  const int64_t dict_size = summary.meta_data.data_page_offset - summary.file_offset;
  vector<uint8_t> dict_page(bytes.begin(), bytes.begin() + dict_size);
  vector<uint8_t> data_pages(bytes.begin() + dict_size, bytes.end());

  // Two dictionary pages.
  vector<uint8_t> chunk = dict_page;
  chunk.insert(chunk.end(), dict_page.begin(), dict_page.end());
  chunk.insert(chunk.end(), data_pages.begin(), data_pages.end());
  MemoryStorage twice(chunk);
  ColumnChunkSummary twice_summary = summary;
  twice_summary.meta_data.total_compressed_size = chunk.size();
  ShreddedColumn column;
  Status status = ReadTags(twice_summary, &twice, &column);
  EXPECT_ERROR(status, TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_STR_CONTAINS(status.GetDetail(), "multiple dictionary pages");

  // Dictionary page after an all-NULL data page, which needs no dictionary.
  ShreddedColumn nulls;
  nulls.Append(0, 0, nullptr);
  MemoryStorage null_storage;
  unique_ptr<ColumnChunkWriter> writer;
  ASSERT_OK(ColumnChunkWriter::Create(tags_desc(), props_, &null_storage, nullptr,
      &writer));
  ASSERT_OK(writer->AppendColumn(nulls));
  ColumnChunkSummary null_summary;
  ASSERT_OK(writer->Close(&null_summary));
  chunk = null_storage.bytes();
  chunk.insert(chunk.end(), dict_page.begin(), dict_page.end());
  MemoryStorage late(chunk);
  null_summary.meta_data.total_compressed_size = chunk.size();
  column.Clear();
  status = ReadTags(null_summary, &late, &column);
  EXPECT_ERROR(status, TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_STR_CONTAINS(status.GetDetail(), "not the first page");
}

TEST_F(ColumnChunkReaderTest, UnsupportedEncoding) {
  props_.codec = CompressionCodec::UNCOMPRESSED;
  props_.enable_dictionary = false;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  // Byte 1 of the page header holds the value encoding.
  (*storage_.mutable_bytes())[summary.file_offset + 1] = Encoding::DELTA_BINARY_PACKED;
  ShreddedColumn column;
  Status status = ReadTags(summary, &storage_, &column);
  EXPECT_ERROR(status, TErrorCode::UNSUPPORTED_ENCODING);
  EXPECT_STR_CONTAINS(status.GetDetail(), "DELTA_BINARY_PACKED");
  EXPECT_STR_CONTAINS(status.GetDetail(), "tags.name");
}

TEST_F(ColumnChunkReaderTest, InconsistentMetadata) {
  ColumnChunkSummary summary;
  WriteTags(&summary);
  ShreddedColumn column;

  ColumnChunkSummary bad = summary;
  bad.meta_data.num_values += 1;
  EXPECT_ERROR(ReadTags(bad, &storage_, &column), TErrorCode::STRUCTURAL_CORRUPTION);

  bad = summary;
  bad.num_rows -= 1;
  column.Clear();
  EXPECT_ERROR(ReadTags(bad, &storage_, &column), TErrorCode::STRUCTURAL_CORRUPTION);

  bad = summary;
  bad.meta_data.num_values -= 1;
  column.Clear();
  EXPECT_ERROR(ReadTags(bad, &storage_, &column), TErrorCode::STRUCTURAL_CORRUPTION);

  bad = summary;
  bad.meta_data.total_compressed_size += 1;
  column.Clear();
  EXPECT_ERROR(ReadTags(bad, &storage_, &column), TErrorCode::STRUCTURAL_CORRUPTION);

  bad = summary;
  bad.file_offset = storage_.Size() + 10;
  column.Clear();
  EXPECT_ERROR(ReadTags(bad, &storage_, &column), TErrorCode::STRUCTURAL_CORRUPTION);

  ColumnChunkReader reader(schema_->column(0), ReaderOptions());
  EXPECT_ERROR(reader.Init(summary, &storage_), TErrorCode::STRUCTURAL_CORRUPTION);
}

TEST_F(ColumnChunkReaderTest, PageCountBeyondChunk) {
  // 'id' is REQUIRED and not repeated, so its pages store no levels and only the chunk
  // metadata bounds the value count of a page.
  props_.codec = CompressionCodec::UNCOMPRESSED;
  props_.enable_dictionary = false;
  const ColumnDescriptor& id_desc = schema_->column(0);
  ShreddedColumn ids;
  for (int64_t i = 0; i < 10; ++i) {
    PrimitiveValue value(i);
    ids.Append(0, 0, &value);
  }
  unique_ptr<ColumnChunkWriter> writer;
  ASSERT_OK(ColumnChunkWriter::Create(id_desc, props_, &storage_, nullptr, &writer));
  ASSERT_OK(writer->AppendColumn(ids));
  ColumnChunkSummary summary;
  ASSERT_OK(writer->Close(&summary));
  ASSERT_EQ(summary.file_offset, summary.meta_data.data_page_offset);

  // Bytes 8-11 of the page header hold num_values, little endian.
  vector<uint8_t>& bytes = *storage_.mutable_bytes();
  for (int i = 0; i < 4; ++i) bytes[summary.file_offset + 8 + i] = i == 3 ? 0x7F : 0xFF;
  ColumnChunkReader reader(id_desc, ReaderOptions());
  ASSERT_OK(reader.Init(summary, &storage_));
  ShreddedColumn column;
  Status status = reader.ReadAll(&column);
  EXPECT_ERROR(status, TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_STR_CONTAINS(status.GetDetail(), "column metadata states there are 10 values");
}

TEST_F(ColumnChunkReaderTest, ChecksumVerificationDisabled) {
  props_.codec = CompressionCodec::UNCOMPRESSED;
  props_.enable_dictionary = false;
  ColumnChunkSummary summary;
  WriteTags(&summary);
  // Flip a bit inside the last value's bytes; the page stays decodable.
  (*storage_.mutable_bytes())[summary.range().end() - 1] ^= 0x01;
  ShreddedColumn column;
  EXPECT_ERROR(ReadTags(summary, &storage_, &column), TErrorCode::CHECKSUM_MISMATCH);
  ReaderOptions options;
  options.verify_page_checksum = false;
  column.Clear();
  ASSERT_OK(ReadTags(summary, &storage_, &column, options));
  EXPECT_EQ(tags_.rep_levels, column.rep_levels);
  EXPECT_NE(tags_.values, column.values);
}

}

STRATA_TEST_MAIN();
