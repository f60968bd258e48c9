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

#include "exec/writer-properties.h"
#include "testutil/columnar-test-util.h"
#include "testutil/gtest-util.h"
#include "testutil/scoped-flag-setter.h"

#include "common/names.h"

DECLARE_string(fallback_encoding);
DECLARE_string(level_encoding);
DECLARE_string(compression_codec);
DECLARE_int32(data_page_max_values);
DECLARE_int32(chunk_io_threads);
DECLARE_bool(verify_page_checksum);

namespace strata {

typedef columnar::Encoding E;

TEST(WriterPropertiesTest, ParseEncodingName) {
  E::type encoding;
  EXPECT_OK(ParseEncodingName("DELTA_BYTE_ARRAY", &encoding));
  EXPECT_EQ(E::DELTA_BYTE_ARRAY, encoding);
  EXPECT_OK(ParseEncodingName(" delta_binary_packed ", &encoding));
  EXPECT_EQ(E::DELTA_BINARY_PACKED, encoding);
  Status status = ParseEncodingName("BYTE_STREAM_SPLIT", &encoding);
  EXPECT_FALSE(status.ok());
  EXPECT_STR_CONTAINS(status.GetDetail(), "BYTE_STREAM_SPLIT");
}

TEST(WriterPropertiesTest, FromFlags) {
  WriterProperties props;
  EXPECT_OK(WriterProperties::FromFlags(&props));
  EXPECT_EQ(E::PLAIN, props.fallback_encoding);
  EXPECT_EQ(E::RLE, props.level_encoding);
  EXPECT_EQ(columnar::CompressionCodec::SNAPPY, props.codec);
  EXPECT_EQ(20000, props.data_page_max_values);

  {
    auto s1 =
        ScopedFlagSetter<string>::Make(&FLAGS_fallback_encoding, "delta_byte_array");
    auto s2 = ScopedFlagSetter<string>::Make(&FLAGS_level_encoding, "BIT_PACKED");
    auto s3 = ScopedFlagSetter<string>::Make(&FLAGS_compression_codec, "none");
    auto s4 = ScopedFlagSetter<int32_t>::Make(&FLAGS_data_page_max_values, 10);
    EXPECT_OK(WriterProperties::FromFlags(&props));
    EXPECT_EQ(E::DELTA_BYTE_ARRAY, props.fallback_encoding);
    EXPECT_EQ(E::BIT_PACKED, props.level_encoding);
    EXPECT_EQ(columnar::CompressionCodec::UNCOMPRESSED, props.codec);
    EXPECT_EQ(10, props.data_page_max_values);
  }
  {
    auto s = ScopedFlagSetter<string>::Make(&FLAGS_fallback_encoding, "RLE_DICTIONARY");
    EXPECT_FALSE(WriterProperties::FromFlags(&props).ok());
  }
  {
    auto s = ScopedFlagSetter<string>::Make(&FLAGS_compression_codec, "brotli");
    EXPECT_ERROR(WriterProperties::FromFlags(&props), TErrorCode::COMPRESSION_ERROR);
  }
  {
    auto s = ScopedFlagSetter<int32_t>::Make(&FLAGS_data_page_max_values, 0);
    EXPECT_FALSE(WriterProperties::FromFlags(&props).ok());
  }
}

TEST(WriterPropertiesTest, Validate) {
  WriterProperties props;
  EXPECT_OK(props.Validate());
  props.level_encoding = E::PLAIN;
  EXPECT_FALSE(props.Validate().ok());
  props.level_encoding = E::RLE;
  props.column_fallback_encodings["a"] = E::PLAIN_DICTIONARY;
  Status status = props.Validate();
  EXPECT_FALSE(status.ok());
  EXPECT_STR_CONTAINS(status.GetDetail(), "'a'");
  props.column_fallback_encodings["a"] = E::DELTA_BINARY_PACKED;
  EXPECT_OK(props.Validate());
  props.num_threads = 0;
  EXPECT_FALSE(props.Validate().ok());
}

TEST(WriterPropertiesTest, PerColumnEncodings) {
  unique_ptr<Schema> schema;
  ASSERT_OK(MakeDocumentSchema(&schema));
  const ColumnDescriptor& doc_id = schema->column(schema->FindColumn("DocId"));
  const ColumnDescriptor& url = schema->column(schema->FindColumn("Name.Url"));

  WriterProperties props;
  props.fallback_encoding = E::DELTA_BINARY_PACKED;
  props.column_fallback_encodings["Name.Url"] = E::DELTA_BYTE_ARRAY;
  EXPECT_EQ(E::DELTA_BINARY_PACKED, props.GetFallbackEncoding(doc_id));
  EXPECT_EQ(E::DELTA_BYTE_ARRAY, props.GetFallbackEncoding(url));

  // Integer encodings don't apply to strings.
  props.column_fallback_encodings.clear();
  EXPECT_EQ(E::PLAIN, props.GetFallbackEncoding(url));

  EXPECT_TRUE(props.UseDictionary(doc_id));
  props.enable_dictionary = false;
  EXPECT_FALSE(props.UseDictionary(doc_id));

  ColumnDescriptor flag;
  flag.path = "flag";
  flag.type = columnar::Type::BOOLEAN;
  props.enable_dictionary = true;
  EXPECT_FALSE(props.UseDictionary(flag));
}

TEST(WriterPropertiesTest, ReaderOptions) {
  auto s1 = ScopedFlagSetter<bool>::Make(&FLAGS_verify_page_checksum, false);
  auto s2 = ScopedFlagSetter<int32_t>::Make(&FLAGS_chunk_io_threads, 4);
  ReaderOptions options = ReaderOptions::FromFlags();
  EXPECT_FALSE(options.verify_page_checksum);
  EXPECT_EQ(4, options.num_threads);
}

}

STRATA_TEST_MAIN();
