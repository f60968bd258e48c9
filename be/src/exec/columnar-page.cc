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

#include "exec/columnar-page.h"

#include <string.h>
#include <sstream>

#include <zlib.h>

#include "exec/columnar-common.h"
#include "util/bit-util.h"

#include "common/names.h"

using namespace strata::columnar;

namespace strata {

namespace {

template <typename T>
inline void WriteLE(T value, uint8_t* buffer) {
  value = BitUtil::ToLittleEndian(value);
  memcpy(buffer, &value, sizeof(T));
}

template <typename T>
inline T ReadLE(const uint8_t* buffer) {
  T value;
  memcpy(&value, buffer, sizeof(T));
  return BitUtil::FromLittleEndian(value);
}

}

const int PageHeader::SIZE;
const uint8_t PageHeader::FLAG_CHECKSUM;
const int64_t PageWriter::MAX_PAGE_SIZE;

void PageHeader::Serialize(uint8_t* buffer) const {
  buffer[0] = static_cast<uint8_t>(type);
  buffer[1] = static_cast<uint8_t>(encoding);
  buffer[2] = static_cast<uint8_t>(rep_level_encoding);
  buffer[3] = static_cast<uint8_t>(def_level_encoding);
  buffer[4] = static_cast<uint8_t>(codec);
  buffer[5] = flags;
  buffer[6] = 0;
  buffer[7] = 0;
  WriteLE(num_values, buffer + 8);
  WriteLE(num_nulls, buffer + 12);
  WriteLE(num_rows, buffer + 16);
  WriteLE(rep_levels_byte_len, buffer + 20);
  WriteLE(def_levels_byte_len, buffer + 24);
  WriteLE(uncompressed_size, buffer + 28);
  WriteLE(compressed_size, buffer + 32);
  WriteLE(crc, buffer + 36);
}

void PageHeader::Deserialize(const uint8_t* buffer) {
  type = static_cast<PageType::type>(buffer[0]);
  encoding = static_cast<Encoding::type>(buffer[1]);
  rep_level_encoding = static_cast<Encoding::type>(buffer[2]);
  def_level_encoding = static_cast<Encoding::type>(buffer[3]);
  codec = static_cast<CompressionCodec::type>(buffer[4]);
  flags = buffer[5];
  num_values = ReadLE<int32_t>(buffer + 8);
  num_nulls = ReadLE<int32_t>(buffer + 12);
  num_rows = ReadLE<int32_t>(buffer + 16);
  rep_levels_byte_len = ReadLE<int32_t>(buffer + 20);
  def_levels_byte_len = ReadLE<int32_t>(buffer + 24);
  uncompressed_size = ReadLE<int32_t>(buffer + 28);
  compressed_size = ReadLE<int32_t>(buffer + 32);
  crc = ReadLE<uint32_t>(buffer + 36);
}

string PageHeader::DebugString() const {
  stringstream ss;
  ss << "PageHeader(type=" << PrintThriftEnum(type)
     << " encoding=" << PrintThriftEnum(encoding)
     << " levels=" << PrintThriftEnum(rep_level_encoding) << "/"
     << PrintThriftEnum(def_level_encoding)
     << " codec=" << PrintThriftEnum(codec)
     << " num_values=" << num_values << " num_nulls=" << num_nulls
     << " num_rows=" << num_rows
     << " level_bytes=" << rep_levels_byte_len << "/" << def_levels_byte_len
     << " size=" << uncompressed_size << "/" << compressed_size;
  if (has_checksum()) ss << " crc=" << crc;
  ss << ")";
  return ss.str();
}

void ColumnarPage::AppendTo(vector<uint8_t>* out) const {
  int64_t start = out->size();
  out->resize(start + total_size());
  header.Serialize(out->data() + start);
  if (!data.empty()) {
    memcpy(out->data() + start + PageHeader::SIZE, data.data(), data.size());
  }
}

uint32_t ComputePageChecksum(const uint8_t* data, int64_t len) {
  uLong crc = crc32(0L, Z_NULL, 0);
  // crc32() takes a 32 bit length.
  while (len > 0) {
    uInt chunk = static_cast<uInt>(min<int64_t>(len, 1 << 30));
    crc = crc32(crc, data, chunk);
    data += chunk;
    len -= chunk;
  }
  return static_cast<uint32_t>(crc);
}

Status PageWriter::Init() {
  return Codec::CreateCompressor(codec_, compression_level_, &compressor_);
}

Status PageWriter::WriteDataPage(const DataPageInput& input, ColumnarPage* page) {
  int64_t total_len = input.rep_levels_len + input.def_levels_len + input.values_len;
  if (UNLIKELY(total_len > MAX_PAGE_SIZE)) {
    stringstream ss;
    ss << "Cannot write a data page of " << total_len << " bytes, the limit is "
       << MAX_PAGE_SIZE << " bytes";
    return Status(ss.str());
  }
  PageHeader& header = page->header;
  header = PageHeader();
  header.type = PageType::DATA_PAGE;
  header.encoding = input.encoding;
  header.rep_level_encoding = input.rep_level_encoding;
  header.def_level_encoding = input.def_level_encoding;
  header.num_values = input.num_values;
  header.num_nulls = input.num_nulls;
  header.num_rows = input.num_rows;
  header.rep_levels_byte_len = input.rep_levels_len;
  header.def_levels_byte_len = input.def_levels_len;

  // At this point we know all the data for the data page. Combine them into one buffer.
  uncompressed_.resize(total_len);
  uint8_t* pos = uncompressed_.data();
  if (input.rep_levels_len > 0) {
    memcpy(pos, input.rep_levels, input.rep_levels_len);
    pos += input.rep_levels_len;
  }
  if (input.def_levels_len > 0) {
    memcpy(pos, input.def_levels, input.def_levels_len);
    pos += input.def_levels_len;
  }
  if (input.values_len > 0) memcpy(pos, input.values, input.values_len);
  return FinalizePage(page);
}

Status PageWriter::WriteDictionaryPage(const uint8_t* dict_data, int64_t len,
    int num_entries, ColumnarPage* page) {
  if (UNLIKELY(len > MAX_PAGE_SIZE)) {
    stringstream ss;
    ss << "Cannot write a dictionary page of " << len << " bytes, the limit is "
       << MAX_PAGE_SIZE << " bytes";
    return Status(ss.str());
  }
  PageHeader& header = page->header;
  header = PageHeader();
  header.type = PageType::DICTIONARY_PAGE;
  // Dictionary entries are always PLAIN encoded.
  header.encoding = Encoding::PLAIN;
  header.num_values = num_entries;
  uncompressed_.assign(dict_data, dict_data + len);
  return FinalizePage(page);
}

Status PageWriter::FinalizePage(ColumnarPage* page) {
  PageHeader& header = page->header;
  header.codec = codec_;
  header.uncompressed_size = uncompressed_.size();
  if (compressor_.get() == nullptr) {
    page->data = uncompressed_;
  } else {
    int64_t max_compressed_size =
        compressor_->MaxOutputLen(uncompressed_.size(), uncompressed_.data());
    DCHECK_GT(max_compressed_size, 0);
    page->data.resize(max_compressed_size);
    int64_t compressed_size = max_compressed_size;
    RETURN_IF_ERROR(compressor_->ProcessBlock(uncompressed_.size(),
        uncompressed_.data(), &compressed_size, page->data.data()));
    page->data.resize(compressed_size);
  }
  if (UNLIKELY(page->data.size() > MAX_PAGE_SIZE)) {
    stringstream ss;
    ss << "Compressed page of " << page->data.size() << " bytes exceeds the limit of "
       << MAX_PAGE_SIZE << " bytes";
    return Status(ss.str());
  }
  header.compressed_size = page->data.size();
  if (enable_checksum_) {
    header.flags |= PageHeader::FLAG_CHECKSUM;
    header.crc = ComputePageChecksum(page->data.data(), page->data.size());
  }
  VLOG_PAGE << "Wrote " << header.DebugString();
  return Status::OK();
}

Status PageReader::ParseHeader(const uint8_t* data, int64_t len, int64_t page_offset,
    PageHeader* header) {
  stringstream ss;
  ss << "page at offset " << page_offset << ": ";
  if (UNLIKELY(len < PageHeader::SIZE)) {
    ss << "truncated page header of " << len << " bytes";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, column_path_, ss.str());
  }
  header->Deserialize(data);
  if (header->type != PageType::DATA_PAGE && header->type != PageType::DICTIONARY_PAGE) {
    ss << "unknown page type " << static_cast<int>(header->type);
  } else if ((header->flags & ~PageHeader::FLAG_CHECKSUM) != 0
      || data[6] != 0 || data[7] != 0) {
    ss << "invalid flags or reserved bytes";
  } else if (header->num_values < 0 || header->num_nulls < 0 || header->num_rows < 0
      || header->rep_levels_byte_len < 0 || header->def_levels_byte_len < 0
      || header->uncompressed_size < 0 || header->compressed_size < 0) {
    ss << "negative count or size in " << header->DebugString();
  } else if (header->num_nulls > header->num_values
      || header->num_rows > header->num_values) {
    ss << "more nulls or rows than values in " << header->DebugString();
  } else if (static_cast<int64_t>(header->rep_levels_byte_len)
      + header->def_levels_byte_len > header->uncompressed_size) {
    ss << "level bytes exceed the payload in " << header->DebugString();
  } else if (header->type == PageType::DICTIONARY_PAGE
      && (header->rep_levels_byte_len != 0 || header->def_levels_byte_len != 0
          || header->num_nulls != 0)) {
    ss << "dictionary page with levels or nulls";
  } else if (header->compressed_size > len - PageHeader::SIZE) {
    ss << "payload of " << header->compressed_size << " bytes extends past the end of "
       << "the column chunk (" << (len - PageHeader::SIZE) << " bytes left)";
  } else {
    return Status::OK();
  }
  return Status(TErrorCode::STRUCTURAL_CORRUPTION, column_path_, ss.str());
}

Status PageReader::ReadPage(const uint8_t* data, int64_t len, int64_t page_offset,
    bool verify_checksum, DecodedPage* out) {
  RETURN_IF_ERROR(ParseHeader(data, len, page_offset, &out->header));
  const PageHeader& header = out->header;
  out->offset = page_offset;
  const uint8_t* payload = data + PageHeader::SIZE;
  VLOG_PAGE << "Read " << header.DebugString() << " at offset " << page_offset;

  if (header.has_checksum() && verify_checksum) {
    uint32_t computed = ComputePageChecksum(payload, header.compressed_size);
    if (UNLIKELY(computed != header.crc)) {
      LOG(WARNING) << "Corrupt page in column '" << column_path_ << "' at offset "
                   << page_offset;
      return Status(TErrorCode::CHECKSUM_MISMATCH, column_path_, page_offset,
          header.crc, computed);
    }
  }

  const string page_desc = Codec::GetCodecName(header.codec) + " page";
  if (header.codec == CompressionCodec::UNCOMPRESSED) {
    if (UNLIKELY(header.compressed_size != header.uncompressed_size)) {
      stringstream ss;
      ss << "expected " << header.uncompressed_size << " bytes but got "
         << header.compressed_size;
      return Status(TErrorCode::MALFORMED_ENCODING, page_desc, column_path_,
          page_offset, ss.str());
    }
    out->payload.assign(payload, payload + header.compressed_size);
    return Status::OK();
  }

  if (decompressor_.get() == nullptr || decompressor_codec_ != header.codec) {
    RETURN_IF_ERROR(Codec::CreateDecompressor(header.codec, &decompressor_));
    decompressor_codec_ = header.codec;
  }
  // Codecs may not accept an empty output buffer.
  out->payload.resize(max<int64_t>(header.uncompressed_size, 1));
  int64_t uncompressed_size = header.uncompressed_size;
  Status status = decompressor_->ProcessBlock(header.compressed_size, payload,
      &uncompressed_size, out->payload.data());
  if (!status.ok()) {
    // Report a payload that decompresses to a different size than the header claims
    // as malformed, if the codec can tell.
    int64_t actual_size =
        decompressor_->MaxOutputLen(header.compressed_size, payload);
    if (actual_size < 0 || actual_size == header.uncompressed_size) return status;
    uncompressed_size = actual_size;
  }
  VLOG_PAGE << "Decompressed " << header.compressed_size << " to " << uncompressed_size;
  if (UNLIKELY(uncompressed_size != header.uncompressed_size)) {
    stringstream ss;
    ss << "expected " << header.uncompressed_size << " uncompressed bytes but got "
       << uncompressed_size;
    return Status(TErrorCode::MALFORMED_ENCODING, page_desc, column_path_,
        page_offset, ss.str());
  }
  out->payload.resize(uncompressed_size);
  return Status::OK();
}

}
