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


#ifndef STRATA_EXEC_COLUMNAR_PAGE_H
#define STRATA_EXEC_COLUMNAR_PAGE_H

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <boost/scoped_ptr.hpp>

#include "common/status.h"
#include "gen-cpp/columnar_types.h"
#include "util/codec.h"

namespace strata {

/// Fixed size header in front of every page. All fields are stored little endian:
///   0  page type              1  value encoding        2  rep level encoding
///   3  def level encoding     4  compression codec     5  flags
///   6  reserved (2 bytes)     8  num_values           12  num_nulls
///  16  num_rows              20  rep levels length    24  def levels length
///  28  uncompressed size     32  compressed size      36  CRC-32 of the payload
/// The payload that follows is the rep level bytes, the def level bytes and the value
/// bytes, compressed as a single block.
struct PageHeader {
  static const int SIZE = 40;

  /// Bit of 'flags' set when 'crc' holds the checksum of the compressed payload.
  static const uint8_t FLAG_CHECKSUM = 1;

  columnar::PageType::type type = columnar::PageType::DATA_PAGE;
  columnar::Encoding::type encoding = columnar::Encoding::PLAIN;
  columnar::Encoding::type rep_level_encoding = columnar::Encoding::RLE;
  columnar::Encoding::type def_level_encoding = columnar::Encoding::RLE;
  columnar::CompressionCodec::type codec = columnar::CompressionCodec::UNCOMPRESSED;
  uint8_t flags = 0;

  /// Number of level slots of a data page, or of entries of a dictionary page.
  int32_t num_values = 0;
  int32_t num_nulls = 0;
  /// Number of slots with rep level 0, i.e. records starting in this page.
  int32_t num_rows = 0;
  int32_t rep_levels_byte_len = 0;
  int32_t def_levels_byte_len = 0;
  int32_t uncompressed_size = 0;
  int32_t compressed_size = 0;
  uint32_t crc = 0;

  bool has_checksum() const { return (flags & FLAG_CHECKSUM) != 0; }

  /// Writes the SIZE bytes of the header to 'buffer'.
  void Serialize(uint8_t* buffer) const;

  /// Reads the header from the SIZE bytes at 'buffer'. No validation is done; see
  /// PageReader::ParseHeader().
  void Deserialize(const uint8_t* buffer);

  std::string DebugString() const;
};

/// A page as written: the header and its (possibly compressed) payload.
struct ColumnarPage {
  PageHeader header;
  std::vector<uint8_t> data;

  int64_t total_size() const { return PageHeader::SIZE + data.size(); }

  /// Appends the serialized header and the payload to 'out'.
  void AppendTo(std::vector<uint8_t>* out) const;
};

/// Encoded contents of one data page. The buffers are not owned.
struct DataPageInput {
  columnar::Encoding::type encoding = columnar::Encoding::PLAIN;
  columnar::Encoding::type rep_level_encoding = columnar::Encoding::RLE;
  columnar::Encoding::type def_level_encoding = columnar::Encoding::RLE;
  int32_t num_values = 0;
  int32_t num_nulls = 0;
  int32_t num_rows = 0;
  const uint8_t* rep_levels = nullptr;
  int64_t rep_levels_len = 0;
  const uint8_t* def_levels = nullptr;
  int64_t def_levels_len = 0;
  const uint8_t* values = nullptr;
  int64_t values_len = 0;
};

/// Packages encoded levels and values into pages: concatenates them, compresses the
/// result with the column's codec and optionally checksums the compressed bytes.
class PageWriter {
 public:
  /// Pages larger than this can't be represented in the header.
  static const int64_t MAX_PAGE_SIZE = std::numeric_limits<int32_t>::max();

  PageWriter(columnar::CompressionCodec::type codec, int compression_level,
      bool enable_checksum)
    : codec_(codec), compression_level_(compression_level),
      enable_checksum_(enable_checksum) {}

  /// Creates the compressor. Must be called before writing any page.
  Status Init() WARN_UNUSED_RESULT;

  Status WriteDataPage(const DataPageInput& input, ColumnarPage* page)
      WARN_UNUSED_RESULT;

  /// Writes a dictionary page holding 'num_entries' PLAIN encoded entries.
  Status WriteDictionaryPage(const uint8_t* dict_data, int64_t len, int num_entries,
      ColumnarPage* page) WARN_UNUSED_RESULT;

  columnar::CompressionCodec::type codec() const { return codec_; }

 private:
  /// Compresses 'uncompressed_' into 'page' and fills in the sizes and checksum.
  Status FinalizePage(ColumnarPage* page) WARN_UNUSED_RESULT;

  const columnar::CompressionCodec::type codec_;
  const int compression_level_;
  const bool enable_checksum_;

  /// Null for UNCOMPRESSED.
  boost::scoped_ptr<Codec> compressor_;

  /// Staging buffer for the uncompressed payload, reused across pages.
  std::vector<uint8_t> uncompressed_;
};

/// A page after checksum verification and decompression.
struct DecodedPage {
  PageHeader header;

  /// Offset of the header in the file, used in error messages.
  int64_t offset = -1;

  /// Uncompressed payload.
  std::vector<uint8_t> payload;

  int64_t total_size() const { return PageHeader::SIZE + header.compressed_size; }

  const uint8_t* rep_levels() const { return payload.data(); }
  int64_t rep_levels_len() const { return header.rep_levels_byte_len; }
  const uint8_t* def_levels() const { return payload.data() + rep_levels_len(); }
  int64_t def_levels_len() const { return header.def_levels_byte_len; }
  const uint8_t* values() const { return def_levels() + def_levels_len(); }
  int64_t values_len() const {
    return payload.size() - rep_levels_len() - def_levels_len();
  }
};

/// Parses the pages of one column chunk.
class PageReader {
 public:
  explicit PageReader(const std::string& column_path) : column_path_(column_path) {}

  /// Parses and validates the page header at the start of the 'len' bytes at 'data'.
  /// 'page_offset' is the position of 'data' in the file. Returns STRUCTURAL_CORRUPTION
  /// if the header is truncated, has invalid fields or sizes exceeding 'len'.
  Status ParseHeader(const uint8_t* data, int64_t len, int64_t page_offset,
      PageHeader* header) WARN_UNUSED_RESULT;

  /// Reads the page starting at 'data'. 'len' is the number of bytes available from
  /// 'data' and may include pages that follow. Verifies the checksum if the page has
  /// one and 'verify_checksum' is true (CHECKSUM_MISMATCH), decompresses the payload
  /// (COMPRESSION_ERROR on codec failures, MALFORMED_ENCODING if the size differs from
  /// the header) and fills 'out'.
  Status ReadPage(const uint8_t* data, int64_t len, int64_t page_offset,
      bool verify_checksum, DecodedPage* out) WARN_UNUSED_RESULT;

 private:
  const std::string column_path_;

  /// Decompressor for the codec of the last page read. Null for UNCOMPRESSED.
  boost::scoped_ptr<Codec> decompressor_;
  columnar::CompressionCodec::type decompressor_codec_ =
      columnar::CompressionCodec::UNCOMPRESSED;
};

/// Returns the CRC-32 (zlib polynomial) of the 'len' bytes at 'data'.
uint32_t ComputePageChecksum(const uint8_t* data, int64_t len);

}

#endif
