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

#include "exec/columnar-file-reader.h"

#include <string.h>
#include <sstream>

#include "common/logging.h"
#include "exec/columnar-common.h"
#include "util/bit-util.h"

#include "common/names.h"

namespace strata {

Status ColumnarFileReader::Open() {
  DCHECK(!opened_);
  int64_t file_size = source_->Size();
  const int64_t trailer_size = COLUMNAR_FOOTER_LEN_SIZE + COLUMNAR_MAGIC_LEN;
  if (file_size < COLUMNAR_MAGIC_LEN + trailer_size) {
    stringstream ss;
    ss << "file of " << file_size << " bytes is too small to hold the magic numbers "
       << "and the footer length";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "file", ss.str());
  }

  vector<uint8_t> header;
  RETURN_IF_ERROR(source_->Read(ByteRange(0, COLUMNAR_MAGIC_LEN), &header));
  if (memcmp(header.data(), COLUMNAR_MAGIC, COLUMNAR_MAGIC_LEN) != 0) {
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "file",
        "invalid magic number at the start of the file: '"
        + string(reinterpret_cast<char*>(header.data()), COLUMNAR_MAGIC_LEN) + "'");
  }

  vector<uint8_t> trailer;
  RETURN_IF_ERROR(
      source_->Read(ByteRange(file_size - trailer_size, trailer_size), &trailer));
  const uint8_t* magic = trailer.data() + COLUMNAR_FOOTER_LEN_SIZE;
  if (memcmp(magic, COLUMNAR_MAGIC, COLUMNAR_MAGIC_LEN) != 0) {
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "file",
        "invalid magic number at the end of the file: '"
        + string(reinterpret_cast<const char*>(magic), COLUMNAR_MAGIC_LEN) + "'");
  }

  // The size of the footer is a 4 byte little endian value before the magic number.
  uint32_t footer_len;
  memcpy(&footer_len, trailer.data(), sizeof(footer_len));
  footer_len = BitUtil::FromLittleEndian(footer_len);
  int64_t footer_start = file_size - trailer_size - footer_len;
  if (footer_start < COLUMNAR_MAGIC_LEN) {
    stringstream ss;
    ss << "invalid footer size " << footer_len << " in a file of " << file_size
       << " bytes";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "file", ss.str());
  }

  vector<uint8_t> footer;
  RETURN_IF_ERROR(source_->Read(ByteRange(footer_start, footer_len), &footer));
  RETURN_IF_ERROR(
      MetadataSerializer::DeserializeFooter(footer.data(), footer_len, &footer_));
  RETURN_IF_ERROR(ValidateChunkRanges(footer_start));
  VLOG_FILE << "Opened file written by '" << footer_.created_by << "': "
            << footer_.row_groups.size() << " row groups, " << footer_.num_rows
            << " rows, schema:\n" << footer_.schema->DebugString();
  opened_ = true;
  return Status::OK();
}

Status ColumnarFileReader::ValidateChunkRanges(int64_t footer_start) const {
  for (const RowGroupSummary& rg : footer_.row_groups) {
    for (const ColumnChunkSummary& chunk : rg.columns) {
      ByteRange range = chunk.range();
      if (range.offset < COLUMNAR_MAGIC_LEN || range.len < 0
          || range.end() > footer_start) {
        stringstream ss;
        ss << "column chunk of row group " << rg.ordinal << " has invalid offsets "
           << "(offset=" << range.offset << ", size=" << range.len << ", footer_start="
           << footer_start << ")";
        return Status(TErrorCode::STRUCTURAL_CORRUPTION, chunk.path, ss.str());
      }
    }
  }
  return Status::OK();
}

Status ColumnarFileReader::GetRowGroupReader(int i, unique_ptr<RowGroupReader>* reader) {
  DCHECK(opened_);
  DCHECK_GE(i, 0);
  DCHECK_LT(i, footer_.row_groups.size());
  unique_ptr<RowGroupReader> result(new RowGroupReader(*footer_.schema, options_));
  RETURN_IF_ERROR(result->Init(footer_.row_groups[i], source_));
  *reader = move(result);
  return Status::OK();
}

Status ColumnarFileReader::ReadRecords(const vector<string>& paths,
    vector<Value>* records) {
  for (int i = 0; i < footer_.row_groups.size(); ++i) {
    unique_ptr<RowGroupReader> reader;
    RETURN_IF_ERROR(GetRowGroupReader(i, &reader));
    RETURN_IF_ERROR(reader->ReadRecords(paths, records));
  }
  return Status::OK();
}

}
