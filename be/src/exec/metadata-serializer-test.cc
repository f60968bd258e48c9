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

#include <memory>

#include "common/version.h"
#include "exec/columnar-common.h"
#include "exec/metadata-serializer.h"
#include "exec/row-group-reader.h"
#include "exec/row-group-writer.h"
#include "testutil/columnar-test-util.h"
#include "testutil/gtest-util.h"
#include "util/thrift-util.h"

#include "common/names.h"

using namespace strata::columnar;

namespace strata {

typedef FieldRepetitionType R;

class MetadataSerializerTest : public ::testing::Test {
 protected:
  virtual void SetUp() override {
    ASSERT_OK(MakeDocumentSchema(&schema_));
  }

  /// Writes the Document records into two row groups.
  void WriteRowGroups(vector<RowGroupSummary>* row_groups) {
    vector<Value> records = MakeDocumentRecords();
    for (int i = 0; i < records.size(); ++i) {
      RowGroupWriter writer(*schema_, props_, &storage_);
      ASSERT_OK(writer.Init());
      ASSERT_OK(writer.AppendRecord(records[i]));
      row_groups->emplace_back();
      ASSERT_OK(writer.Close(i, &row_groups->back()));
    }
  }

  /// Serializes 'file_metadata' as a footer and expects it to be rejected with 'code'.
  void ExpectRejected(const FileMetaData& file_metadata, TErrorCode::type code) {
    ThriftSerializer serializer;
    vector<uint8_t> footer;
    ASSERT_OK(serializer.SerializeToVector(&file_metadata, &footer));
    FileFooter result;
    EXPECT_ERROR(MetadataSerializer::DeserializeFooter(footer.data(), footer.size(),
        &result), code);
  }

  unique_ptr<Schema> schema_;
  WriterProperties props_;
  MemoryStorage storage_;
};

TEST_F(MetadataSerializerTest, SchemaRoundTrip) {
  vector<SchemaElement> elements;
  MetadataSerializer::SchemaToThrift(*schema_, &elements);
  // Depth-first: every group is followed by its children.
  ASSERT_EQ(10, elements.size());
  EXPECT_EQ("Document", elements[0].name);
  EXPECT_EQ(3, elements[0].num_children);
  EXPECT_EQ("DocId", elements[1].name);
  EXPECT_FALSE(elements[1].__isset.num_children);
  EXPECT_EQ("Links", elements[2].name);
  EXPECT_EQ(2, elements[2].num_children);
  EXPECT_EQ("Language", elements[6].name);
  EXPECT_EQ(R::REPEATED, elements[6].repetition_type);
  EXPECT_EQ("Code", elements[7].name);
  EXPECT_EQ(ConvertedType::UTF8, elements[7].converted_type);
  EXPECT_EQ("Url", elements[9].name);

  unique_ptr<Schema> result;
  ASSERT_OK(MetadataSerializer::SchemaFromThrift(elements, &result));
  EXPECT_EQ(schema_->DebugString(), result->DebugString());
  ASSERT_EQ(schema_->num_columns(), result->num_columns());
  for (int i = 0; i < result->num_columns(); ++i) {
    const ColumnDescriptor& expected = schema_->column(i);
    const ColumnDescriptor& actual = result->column(i);
    EXPECT_EQ(expected.path, actual.path);
    EXPECT_EQ(expected.max_def_level, actual.max_def_level);
    EXPECT_EQ(expected.max_rep_level, actual.max_rep_level);
    EXPECT_TRUE(expected.annotation == actual.annotation);
  }
}

TEST_F(MetadataSerializerTest, FixedLenAndDecimal) {
  SchemaBuilder b("t");
  b.AddLeaf("price", R::OPTIONAL, Type::FIXED_LEN_BYTE_ARRAY, 8,
      LogicalAnnotation::Decimal(18, 2));
  unique_ptr<Schema> schema;
  ASSERT_OK(b.Build(&schema));
  vector<SchemaElement> elements;
  MetadataSerializer::SchemaToThrift(*schema, &elements);
  ASSERT_EQ(2, elements.size());
  EXPECT_EQ(8, elements[1].type_length);
  EXPECT_EQ(18, elements[1].precision);
  EXPECT_EQ(2, elements[1].scale);

  unique_ptr<Schema> result;
  ASSERT_OK(MetadataSerializer::SchemaFromThrift(elements, &result));
  EXPECT_EQ(8, result->column(0).type_length);
  EXPECT_TRUE(LogicalAnnotation::Decimal(18, 2) == result->column(0).annotation);
}

TEST_F(MetadataSerializerTest, MalformedSchema) {
  vector<SchemaElement> elements;
  MetadataSerializer::SchemaToThrift(*schema_, &elements);
  unique_ptr<Schema> result;

  // Too many children.
  vector<SchemaElement> bad = elements;
  bad[0].__set_num_children(4);
  EXPECT_ERROR(MetadataSerializer::SchemaFromThrift(bad, &result),
      TErrorCode::SCHEMA_VIOLATION);

  bad = elements;
  bad[0].__set_num_children(-1);
  EXPECT_ERROR(MetadataSerializer::SchemaFromThrift(bad, &result),
      TErrorCode::SCHEMA_VIOLATION);

  // Elements left over after the tree.
  bad = elements;
  bad[0].__set_num_children(2);
  bad[5].__set_num_children(1);
  EXPECT_ERROR(MetadataSerializer::SchemaFromThrift(bad, &result),
      TErrorCode::SCHEMA_VIOLATION);

  // A leaf without a type.
  bad = elements;
  bad[1].__isset.type = false;
  Status status = MetadataSerializer::SchemaFromThrift(bad, &result);
  EXPECT_ERROR(status, TErrorCode::SCHEMA_VIOLATION);
  EXPECT_STR_CONTAINS(status.GetDetail(), "DocId");

  // Names are validated by the schema itself.
  bad = elements;
  bad[2].name = "Name";
  EXPECT_ERROR(MetadataSerializer::SchemaFromThrift(bad, &result),
      TErrorCode::SCHEMA_VIOLATION);

  EXPECT_ERROR(MetadataSerializer::SchemaFromThrift({}, &result),
      TErrorCode::SCHEMA_VIOLATION);
}

TEST_F(MetadataSerializerTest, FooterRoundTrip) {
  vector<RowGroupSummary> row_groups;
  WriteRowGroups(&row_groups);
  map<string, string> kv = {{"writer", "test"}, {"empty", ""}};
  vector<uint8_t> footer;
  ASSERT_OK(MetadataSerializer::SerializeFooter(*schema_, row_groups, kv, &footer));

  FileFooter result;
  ASSERT_OK(MetadataSerializer::DeserializeFooter(footer.data(), footer.size(),
      &result));
  EXPECT_EQ(2, result.num_rows);
  EXPECT_EQ(kv, result.key_value_metadata);
  EXPECT_EQ(Version::CREATED_BY, result.created_by);
  EXPECT_EQ(schema_->DebugString(), result.schema->DebugString());
  ASSERT_EQ(2, result.row_groups.size());
  for (int i = 0; i < row_groups.size(); ++i) {
    const RowGroupSummary& expected = row_groups[i];
    const RowGroupSummary& actual = result.row_groups[i];
    EXPECT_EQ(expected.num_rows, actual.num_rows);
    EXPECT_EQ(expected.file_offset, actual.file_offset);
    EXPECT_EQ(expected.total_byte_size, actual.total_byte_size);
    EXPECT_EQ(i, actual.ordinal);
    ASSERT_EQ(expected.columns.size(), actual.columns.size());
    for (int c = 0; c < expected.columns.size(); ++c) {
      EXPECT_EQ(expected.columns[c].path, actual.columns[c].path);
      EXPECT_EQ(expected.columns[c].file_offset, actual.columns[c].file_offset);
      EXPECT_EQ(expected.columns[c].num_rows, actual.columns[c].num_rows);
      EXPECT_TRUE(expected.columns[c].meta_data == actual.columns[c].meta_data);
    }
  }

  // The deserialized summaries are enough to read the data back.
  vector<Value> records = MakeDocumentRecords();
  for (int i = 0; i < result.row_groups.size(); ++i) {
    RowGroupReader reader(*result.schema, ReaderOptions());
    ASSERT_OK(reader.Init(result.row_groups[i], &storage_));
    vector<Value> read;
    ASSERT_OK(reader.ReadRecords({}, &read));
    ASSERT_EQ(1, read.size());
    EXPECT_EQ(records[i], read[0]);
  }
}

TEST_F(MetadataSerializerTest, CorruptFooter) {
  vector<RowGroupSummary> row_groups;
  WriteRowGroups(&row_groups);
  vector<uint8_t> footer;
  ASSERT_OK(MetadataSerializer::SerializeFooter(*schema_, row_groups, {}, &footer));
  FileFooter result;

  // Truncated.
  EXPECT_ERROR(MetadataSerializer::DeserializeFooter(footer.data(), footer.size() / 2,
      &result), TErrorCode::METADATA_SERIALIZATION_ERROR);

  // Trailing garbage.
  vector<uint8_t> padded = footer;
  padded.push_back(0);
  padded.push_back(0);
  EXPECT_ERROR(MetadataSerializer::DeserializeFooter(padded.data(), padded.size(),
      &result), TErrorCode::METADATA_SERIALIZATION_ERROR);

  FileMetaData file_metadata;
  MetadataSerializer::ToThrift(*schema_, row_groups, {}, &file_metadata);

  FileMetaData bad = file_metadata;
  bad.version = COLUMNAR_CURRENT_VERSION + 1;
  ExpectRejected(bad, TErrorCode::METADATA_SERIALIZATION_ERROR);

  bad = file_metadata;
  bad.num_rows = 3;
  ExpectRejected(bad, TErrorCode::STRUCTURAL_CORRUPTION);

  bad = file_metadata;
  bad.row_groups[1].columns.pop_back();
  ExpectRejected(bad, TErrorCode::STRUCTURAL_CORRUPTION);

  bad = file_metadata;
  bad.row_groups[0].columns[2].meta_data.path_in_schema = {"Links", "Backward"};
  ExpectRejected(bad, TErrorCode::STRUCTURAL_CORRUPTION);

  bad = file_metadata;
  bad.schema[3].__isset.type = false;
  ExpectRejected(bad, TErrorCode::SCHEMA_VIOLATION);
}

}

STRATA_TEST_MAIN();
