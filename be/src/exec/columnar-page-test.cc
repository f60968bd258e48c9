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

#include "exec/columnar-page.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

using columnar::CompressionCodec;
using columnar::Encoding;
using columnar::PageType;

class ColumnarPageTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    rep_levels_ = {0x02, 0x01, 0x05};
    def_levels_ = {0x04, 0x03, 0x00, 0x07};
    for (int i = 0; i < 500; ++i) values_.push_back(i % 7);
  }

  DataPageInput MakeInput() const {
    DataPageInput input;
    input.encoding = Encoding::PLAIN;
    input.num_values = 10;
    input.num_nulls = 2;
    input.num_rows = 4;
    input.rep_levels = rep_levels_.data();
    input.rep_levels_len = rep_levels_.size();
    input.def_levels = def_levels_.data();
    input.def_levels_len = def_levels_.size();
    input.values = values_.data();
    input.values_len = values_.size();
    return input;
  }

  /// Writes a data page with 'codec' and returns its bytes.
  vector<uint8_t> WritePage(CompressionCodec::type codec, bool checksum) {
    PageWriter writer(codec, 0, checksum);
    EXPECT_OK(writer.Init());
    ColumnarPage page;
    EXPECT_OK(writer.WriteDataPage(MakeInput(), &page));
    vector<uint8_t> bytes;
    page.AppendTo(&bytes);
    EXPECT_EQ(page.total_size(), bytes.size());
    return bytes;
  }

  void ExpectPayload(const DecodedPage& page) {
    ASSERT_EQ(rep_levels_.size(), page.rep_levels_len());
    ASSERT_EQ(def_levels_.size(), page.def_levels_len());
    ASSERT_EQ(values_.size(), page.values_len());
    EXPECT_EQ(0, memcmp(rep_levels_.data(), page.rep_levels(), rep_levels_.size()));
    EXPECT_EQ(0, memcmp(def_levels_.data(), page.def_levels(), def_levels_.size()));
    EXPECT_EQ(0, memcmp(values_.data(), page.values(), values_.size()));
  }

  /// Overwrites the int32 header field at 'offset' of a serialized page.
  static void SetHeaderField(vector<uint8_t>* bytes, int offset, int32_t value) {
    memcpy(bytes->data() + offset, &value, sizeof(value));
  }

  vector<uint8_t> rep_levels_;
  vector<uint8_t> def_levels_;
  vector<uint8_t> values_;
};

TEST_F(ColumnarPageTest, HeaderLayout) {
  PageHeader header;
  header.type = PageType::DICTIONARY_PAGE;
  header.encoding = Encoding::RLE_DICTIONARY;
  header.rep_level_encoding = Encoding::BIT_PACKED;
  header.def_level_encoding = Encoding::RLE;
  header.codec = CompressionCodec::ZSTD;
  header.flags = PageHeader::FLAG_CHECKSUM;
  header.num_values = 0x01020304;
  header.num_nulls = 5;
  header.num_rows = 6;
  header.rep_levels_byte_len = 7;
  header.def_levels_byte_len = 8;
  header.uncompressed_size = 300;
  header.compressed_size = 200;
  header.crc = 0xDEADBEEF;

  uint8_t buffer[PageHeader::SIZE];
  memset(buffer, 0xFF, sizeof(buffer));
  header.Serialize(buffer);
  EXPECT_EQ(2, buffer[0]);
  EXPECT_EQ(8, buffer[1]);
  EXPECT_EQ(4, buffer[2]);
  EXPECT_EQ(3, buffer[3]);
  EXPECT_EQ(6, buffer[4]);
  EXPECT_EQ(1, buffer[5]);
  EXPECT_EQ(0, buffer[6]);
  EXPECT_EQ(0, buffer[7]);
  EXPECT_EQ(0x04, buffer[8]);
  EXPECT_EQ(0x01, buffer[11]);
  EXPECT_EQ(5, buffer[12]);
  EXPECT_EQ(6, buffer[16]);
  EXPECT_EQ(7, buffer[20]);
  EXPECT_EQ(8, buffer[24]);
  EXPECT_EQ(300 & 0xFF, buffer[28]);
  EXPECT_EQ(300 >> 8, buffer[29]);
  EXPECT_EQ(200, buffer[32]);
  EXPECT_EQ(0xEF, buffer[36]);
  EXPECT_EQ(0xDE, buffer[39]);

  PageHeader result;
  result.Deserialize(buffer);
  EXPECT_EQ(header.type, result.type);
  EXPECT_EQ(header.encoding, result.encoding);
  EXPECT_EQ(header.rep_level_encoding, result.rep_level_encoding);
  EXPECT_EQ(header.def_level_encoding, result.def_level_encoding);
  EXPECT_EQ(header.codec, result.codec);
  EXPECT_TRUE(result.has_checksum());
  EXPECT_EQ(header.num_values, result.num_values);
  EXPECT_EQ(header.num_nulls, result.num_nulls);
  EXPECT_EQ(header.num_rows, result.num_rows);
  EXPECT_EQ(header.rep_levels_byte_len, result.rep_levels_byte_len);
  EXPECT_EQ(header.def_levels_byte_len, result.def_levels_byte_len);
  EXPECT_EQ(header.uncompressed_size, result.uncompressed_size);
  EXPECT_EQ(header.compressed_size, result.compressed_size);
  EXPECT_EQ(header.crc, result.crc);
}

TEST_F(ColumnarPageTest, AllCodecs) {
  for (CompressionCodec::type codec : {CompressionCodec::UNCOMPRESSED,
       CompressionCodec::GZIP, CompressionCodec::DEFLATE, CompressionCodec::SNAPPY,
       CompressionCodec::LZ4, CompressionCodec::ZSTD}) {
    SCOPED_TRACE(Codec::GetCodecName(codec));
    vector<uint8_t> bytes = WritePage(codec, true);
    PageReader reader("a.b");
    DecodedPage page;
    ASSERT_OK(reader.ReadPage(bytes.data(), bytes.size(), 1000, true, &page));
    EXPECT_EQ(PageType::DATA_PAGE, page.header.type);
    EXPECT_EQ(codec, page.header.codec);
    EXPECT_EQ(10, page.header.num_values);
    EXPECT_EQ(2, page.header.num_nulls);
    EXPECT_EQ(4, page.header.num_rows);
    EXPECT_EQ(1000, page.offset);
    EXPECT_EQ(bytes.size(), page.total_size());
    ExpectPayload(page);
    if (codec == CompressionCodec::UNCOMPRESSED) {
      EXPECT_EQ(page.header.uncompressed_size, page.header.compressed_size);
    }
  }
}

TEST_F(ColumnarPageTest, PagesBackToBack) {
  // A reader may be handed the rest of the chunk, not only one page.
  vector<uint8_t> bytes = WritePage(CompressionCodec::SNAPPY, false);
  vector<uint8_t> second = WritePage(CompressionCodec::GZIP, false);
  int64_t second_offset = bytes.size();
  bytes.insert(bytes.end(), second.begin(), second.end());

  PageReader reader("a.b");
  DecodedPage page;
  ASSERT_OK(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page));
  EXPECT_EQ(second_offset, page.total_size());
  ExpectPayload(page);
  ASSERT_OK(reader.ReadPage(bytes.data() + second_offset, second.size(), second_offset,
      true, &page));
  EXPECT_EQ(CompressionCodec::GZIP, page.header.codec);
  ExpectPayload(page);
}

TEST_F(ColumnarPageTest, DictionaryPage) {
  PageWriter writer(CompressionCodec::GZIP, 0, true);
  ASSERT_OK(writer.Init());
  ColumnarPage page;
  ASSERT_OK(writer.WriteDictionaryPage(values_.data(), values_.size(), 125, &page));
  EXPECT_EQ(PageType::DICTIONARY_PAGE, page.header.type);
  EXPECT_EQ(Encoding::PLAIN, page.header.encoding);
  vector<uint8_t> bytes;
  page.AppendTo(&bytes);

  PageReader reader("a.b");
  DecodedPage decoded;
  ASSERT_OK(reader.ReadPage(bytes.data(), bytes.size(), 4, true, &decoded));
  EXPECT_EQ(125, decoded.header.num_values);
  EXPECT_EQ(0, decoded.rep_levels_len());
  EXPECT_EQ(0, decoded.def_levels_len());
  EXPECT_EQ(values_, decoded.payload);
}

TEST_F(ColumnarPageTest, EmptyPage) {
  PageWriter writer(CompressionCodec::ZSTD, 0, true);
  ASSERT_OK(writer.Init());
  ColumnarPage page;
  ASSERT_OK(writer.WriteDataPage(DataPageInput(), &page));
  vector<uint8_t> bytes;
  page.AppendTo(&bytes);
  PageReader reader("a.b");
  DecodedPage decoded;
  ASSERT_OK(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &decoded));
  EXPECT_EQ(0, decoded.payload.size());
  EXPECT_EQ(0, decoded.values_len());
}

TEST_F(ColumnarPageTest, ChecksumDetectsEveryByteFlip) {
  for (CompressionCodec::type codec :
       {CompressionCodec::UNCOMPRESSED, CompressionCodec::GZIP}) {
    const vector<uint8_t> bytes = WritePage(codec, true);
    PageReader reader("a.b");
    for (int i = PageHeader::SIZE; i < bytes.size(); ++i) {
      vector<uint8_t> corrupt = bytes;
      corrupt[i] ^= 0x10;
      DecodedPage page;
      Status status = reader.ReadPage(corrupt.data(), corrupt.size(), 64, true, &page);
      ASSERT_TRUE(status.IsChecksumMismatch()) << i << ": " << status.GetDetail();
      EXPECT_STR_CONTAINS(status.GetDetail(), "'a.b'");
      EXPECT_STR_CONTAINS(status.GetDetail(), "offset 64");
    }
  }
}

TEST_F(ColumnarPageTest, ChecksumVerificationDisabled) {
  vector<uint8_t> bytes = WritePage(CompressionCodec::UNCOMPRESSED, true);
  bytes.back() ^= 0x01;
  PageReader reader("a.b");
  DecodedPage page;
  ASSERT_OK(reader.ReadPage(bytes.data(), bytes.size(), 0, false, &page));
  EXPECT_EQ(values_.back() ^ 0x01, page.values()[page.values_len() - 1]);
}

TEST_F(ColumnarPageTest, NoChecksum) {
  vector<uint8_t> bytes = WritePage(CompressionCodec::UNCOMPRESSED, false);
  PageReader reader("a.b");
  PageHeader header;
  ASSERT_OK(reader.ParseHeader(bytes.data(), bytes.size(), 0, &header));
  EXPECT_FALSE(header.has_checksum());
  EXPECT_EQ(0, header.crc);
  // Without a checksum, corruption is not detected at the page level.
  bytes.back() ^= 0x01;
  DecodedPage page;
  EXPECT_OK(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page));
}

TEST_F(ColumnarPageTest, CorruptHeader) {
  const vector<uint8_t> bytes = WritePage(CompressionCodec::UNCOMPRESSED, false);
  PageReader reader("a.b");
  PageHeader header;
  EXPECT_ERROR(reader.ParseHeader(bytes.data(), PageHeader::SIZE - 1, 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);
  // The payload runs past the supplied bytes.
  EXPECT_ERROR(reader.ParseHeader(bytes.data(), bytes.size() - 1, 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);

  vector<uint8_t> corrupt = bytes;
  corrupt[0] = 1;
  EXPECT_ERROR(reader.ParseHeader(corrupt.data(), corrupt.size(), 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);

  corrupt = bytes;
  corrupt[6] = 1;
  EXPECT_ERROR(reader.ParseHeader(corrupt.data(), corrupt.size(), 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);

  corrupt = bytes;
  SetHeaderField(&corrupt, 8, -1);
  EXPECT_ERROR(reader.ParseHeader(corrupt.data(), corrupt.size(), 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);

  corrupt = bytes;
  SetHeaderField(&corrupt, 12, 11);
  EXPECT_ERROR(reader.ParseHeader(corrupt.data(), corrupt.size(), 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);

  // Level lengths larger than the payload.
  corrupt = bytes;
  SetHeaderField(&corrupt, 24, 10000);
  EXPECT_ERROR(reader.ParseHeader(corrupt.data(), corrupt.size(), 0, &header),
      TErrorCode::STRUCTURAL_CORRUPTION);

  ASSERT_OK(reader.ParseHeader(bytes.data(), bytes.size(), 0, &header));
}

TEST_F(ColumnarPageTest, SizeMismatch) {
  PageReader reader("a.b");
  DecodedPage page;

  vector<uint8_t> bytes = WritePage(CompressionCodec::UNCOMPRESSED, true);
  SetHeaderField(&bytes, 28, values_.size());
  EXPECT_ERROR(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page),
      TErrorCode::MALFORMED_ENCODING);

  // The checksum only covers the payload, so a wrong size in the header is caught by
  // decompression.
  bytes = WritePage(CompressionCodec::GZIP, true);
  PageHeader header;
  ASSERT_OK(reader.ParseHeader(bytes.data(), bytes.size(), 0, &header));
  SetHeaderField(&bytes, 28, header.uncompressed_size + 10);
  EXPECT_ERROR(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page),
      TErrorCode::MALFORMED_ENCODING);

  bytes = WritePage(CompressionCodec::SNAPPY, true);
  SetHeaderField(&bytes, 28, header.uncompressed_size - 10);
  EXPECT_ERROR(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page),
      TErrorCode::MALFORMED_ENCODING);
}

TEST_F(ColumnarPageTest, CompressionErrors) {
  PageReader reader("a.b");
  DecodedPage page;
  vector<uint8_t> bytes = WritePage(CompressionCodec::GZIP, false);
  for (int i = PageHeader::SIZE; i < bytes.size(); ++i) bytes[i] = 0xAB;
  EXPECT_ERROR(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page),
      TErrorCode::COMPRESSION_ERROR);

  bytes = WritePage(CompressionCodec::UNCOMPRESSED, false);
  bytes[4] = 42;
  EXPECT_ERROR(reader.ReadPage(bytes.data(), bytes.size(), 0, true, &page),
      TErrorCode::COMPRESSION_ERROR);
}

}

STRATA_TEST_MAIN();
