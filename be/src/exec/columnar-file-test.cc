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
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include "common/version.h"
#include "exec/columnar-common.h"
#include "exec/columnar-file-reader.h"
#include "exec/columnar-file-writer.h"
#include "testutil/columnar-test-util.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

class ColumnarFileTest : public ::testing::Test {
 protected:
  virtual void SetUp() override {
    ASSERT_OK(MakeDocumentSchema(&schema_));
  }

  /// The Dremel records, alternating, with DocId set to the record index.
  static vector<Value> MakeRecords(int n) {
    vector<Value> documents = MakeDocumentRecords();
    vector<Value> records;
    for (int i = 0; i < n; ++i) {
      Value record = documents[i % 2];
      (*record.mutable_children())[0] = Value::Int64(i);
      records.push_back(move(record));
    }
    return records;
  }

  void WriteFile(const vector<Value>& records, StorageSink* sink) {
    ColumnarFileWriter writer(*schema_, props_, sink);
    ASSERT_OK(writer.Open());
    writer.AddKeyValueMetadata("origin", "columnar-file-test");
    for (const Value& record : records) ASSERT_OK(writer.AppendRecord(record));
    ASSERT_OK(writer.Close());
    EXPECT_EQ(records.size(), writer.num_rows());
  }

  /// Opens 'storage_' and expects it to be rejected with 'code'.
  void ExpectOpenFails(TErrorCode::type code) {
    ColumnarFileReader reader(&storage_, ReaderOptions());
    EXPECT_ERROR(reader.Open(), code);
  }

  unique_ptr<Schema> schema_;
  WriterProperties props_;
  MemoryStorage storage_;
};

TEST_F(ColumnarFileTest, RowGroupRollover) {
  props_.row_group_max_rows = 3;
  vector<Value> records = MakeRecords(10);
  WriteFile(records, &storage_);

  const vector<uint8_t>& bytes = storage_.bytes();
  EXPECT_EQ(0, memcmp(bytes.data(), COLUMNAR_MAGIC, COLUMNAR_MAGIC_LEN));
  EXPECT_EQ(0, memcmp(bytes.data() + bytes.size() - COLUMNAR_MAGIC_LEN, COLUMNAR_MAGIC,
      COLUMNAR_MAGIC_LEN));

  ColumnarFileReader reader(&storage_, ReaderOptions());
  ASSERT_OK(reader.Open());
  EXPECT_EQ(10, reader.num_rows());
  ASSERT_EQ(4, reader.num_row_groups());
  EXPECT_EQ(3, reader.row_group(0).num_rows);
  EXPECT_EQ(1, reader.row_group(3).num_rows);
  EXPECT_EQ(COLUMNAR_MAGIC_LEN, reader.row_group(0).file_offset);
  for (int i = 0; i < reader.num_row_groups(); ++i) {
    EXPECT_EQ(i, reader.row_group(i).ordinal);
  }
  EXPECT_EQ("columnar-file-test", reader.key_value_metadata().at("origin"));
  EXPECT_EQ(Version::CREATED_BY, reader.created_by());
  EXPECT_EQ(schema_->DebugString(), reader.schema().DebugString());

  vector<Value> result;
  ASSERT_OK(reader.ReadRecords({}, &result));
  ASSERT_EQ(records.size(), result.size());
  for (int i = 0; i < records.size(); ++i) {
    EXPECT_EQ(records[i], result[i]) << "record " << i;
  }

  unique_ptr<RowGroupReader> rg_reader;
  ASSERT_OK(reader.GetRowGroupReader(2, &rg_reader));
  vector<Value> doc_ids;
  ASSERT_OK(rg_reader->ReadRecords({"DocId"}, &doc_ids));
  ASSERT_EQ(3, doc_ids.size());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(Value::Int64(6 + i), doc_ids[i].children()[0]);
    EXPECT_TRUE(doc_ids[i].children()[1].is_null());
    EXPECT_TRUE(doc_ids[i].children()[2].is_null());
  }
}

TEST_F(ColumnarFileTest, FlushRowGroup) {
  vector<Value> records = MakeRecords(3);
  ColumnarFileWriter writer(*schema_, props_, &storage_);
  ASSERT_OK(writer.Open());
  ASSERT_OK(writer.FlushRowGroup());
  ASSERT_OK(writer.AppendRecord(records[0]));
  ASSERT_OK(writer.AppendRecord(records[1]));
  ASSERT_OK(writer.FlushRowGroup());
  ASSERT_OK(writer.FlushRowGroup());
  EXPECT_EQ(1, writer.row_groups().size());
  ASSERT_OK(writer.AppendRecord(records[2]));
  ASSERT_OK(writer.Close());
  EXPECT_EQ(2, writer.row_groups().size());

  ColumnarFileReader reader(&storage_, ReaderOptions());
  ASSERT_OK(reader.Open());
  ASSERT_EQ(2, reader.num_row_groups());
  EXPECT_EQ(2, reader.row_group(0).num_rows);
  EXPECT_EQ(1, reader.row_group(1).num_rows);
  vector<Value> result;
  ASSERT_OK(reader.ReadRecords({}, &result));
  EXPECT_EQ(records, result);
}

TEST_F(ColumnarFileTest, EmptyFile) {
  WriteFile({}, &storage_);
  ColumnarFileReader reader(&storage_, ReaderOptions());
  ASSERT_OK(reader.Open());
  EXPECT_EQ(0, reader.num_rows());
  EXPECT_EQ(0, reader.num_row_groups());
  EXPECT_EQ(6, reader.schema().num_columns());
  vector<Value> result;
  ASSERT_OK(reader.ReadRecords({}, &result));
  EXPECT_TRUE(result.empty());
}

TEST_F(ColumnarFileTest, LocalFile) {
  string path = "/tmp/columnar-file-test-" + std::to_string(getpid());
  vector<Value> records = MakeRecords(5);
  {
    LocalFileSink sink(path);
    ASSERT_OK(sink.Open());
    props_.num_threads = 3;
    WriteFile(records, &sink);
  }
  LocalFileSource source(path);
  ASSERT_OK(source.Open());
  ReaderOptions options;
  options.num_threads = 2;
  ColumnarFileReader reader(&source, options);
  ASSERT_OK(reader.Open());
  vector<Value> result;
  ASSERT_OK(reader.ReadRecords({}, &result));
  EXPECT_EQ(records, result);
  unlink(path.c_str());
}

TEST_F(ColumnarFileTest, BadMagic) {
  WriteFile(MakeRecords(2), &storage_);
  vector<uint8_t> original = storage_.bytes();

  (*storage_.mutable_bytes())[0] = 'X';
  ExpectOpenFails(TErrorCode::STRUCTURAL_CORRUPTION);

  *storage_.mutable_bytes() = original;
  storage_.mutable_bytes()->back() = '2';
  ExpectOpenFails(TErrorCode::STRUCTURAL_CORRUPTION);

  // Too small to hold both magic numbers and the footer length.
  storage_.mutable_bytes()->assign(original.begin(), original.begin() + 8);
  ExpectOpenFails(TErrorCode::STRUCTURAL_CORRUPTION);
  storage_.mutable_bytes()->clear();
  ExpectOpenFails(TErrorCode::STRUCTURAL_CORRUPTION);
}

TEST_F(ColumnarFileTest, CorruptFooter) {
  WriteFile(MakeRecords(2), &storage_);
  vector<uint8_t> original = storage_.bytes();
  int64_t len_pos = original.size() - COLUMNAR_MAGIC_LEN - COLUMNAR_FOOTER_LEN_SIZE;

  // Footer length pointing before the start of the file.
  *storage_.mutable_bytes() = original;
  (*storage_.mutable_bytes())[len_pos + 3] = 0x7f;
  ExpectOpenFails(TErrorCode::STRUCTURAL_CORRUPTION);

  // Garbage where the footer starts.
  uint32_t footer_len;
  memcpy(&footer_len, original.data() + len_pos, sizeof(footer_len));
  *storage_.mutable_bytes() = original;
  (*storage_.mutable_bytes())[len_pos - footer_len] = 0xff;
  ExpectOpenFails(TErrorCode::METADATA_SERIALIZATION_ERROR);
}

TEST_F(ColumnarFileTest, OpenErrors) {
  // The file must start at the beginning of the sink.
  ByteRange range;
  uint8_t byte = 0;
  ASSERT_OK(storage_.Write(-1, &byte, 1, &range));
  ColumnarFileWriter writer(*schema_, props_, &storage_);
  EXPECT_ERROR(writer.Open(), TErrorCode::STORAGE_IO_ERROR);

  props_.data_page_size = 0;
  ColumnarFileWriter invalid(*schema_, props_, &storage_);
  EXPECT_FALSE(invalid.Open().ok());
}

}

STRATA_TEST_MAIN();
