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

#include "exec/column-chunk-reader.h"

#include "common/logging.h"
#include "exec/columnar-common.h"
#include "exec/level-codec.h"

#include "common/names.h"

using namespace strata::columnar;

namespace strata {

Status ColumnChunkReader::Corruption(int64_t page_offset, const string& details) const {
  stringstream ss;
  ss << details;
  if (page_offset >= 0) ss << " (page offset " << page_offset << ")";
  return Status(TErrorCode::STRUCTURAL_CORRUPTION, desc_.path, ss.str());
}

Status ColumnChunkReader::Init(const ColumnChunkSummary& summary, StorageSource* source) {
  summary_ = summary;
  const ColumnMetaData& meta_data = summary.meta_data;
  if (meta_data.type != desc_.type) {
    return Corruption(-1, "chunk has type " + PrintThriftEnum(meta_data.type)
        + " but the column is " + PrintThriftEnum(desc_.type));
  }
  if (meta_data.path_in_schema != desc_.path_in_schema) {
    return Corruption(-1, "chunk belongs to a different column");
  }
  if (summary.file_offset < 0 || meta_data.total_compressed_size < 0
      || meta_data.num_values < 0 || summary.num_rows < 0) {
    stringstream ss;
    ss << "invalid chunk metadata: offset " << summary.file_offset << ", size "
       << meta_data.total_compressed_size << ", " << meta_data.num_values << " values, "
       << summary.num_rows << " rows";
    return Corruption(-1, ss.str());
  }
  chunk_offset_ = summary.file_offset;
  RETURN_IF_ERROR(source->Read(summary.range(), &chunk_data_));
  pos_ = 0;
  eos_ = false;
  rep_levels_.clear();
  def_levels_.clear();
  values_.clear();
  level_idx_ = value_idx_ = 0;
  num_values_read_ = num_rows_read_ = 0;
  num_data_pages_read_ = 0;
  dictionary_.reset();
  VLOG_FILE << "Reading column '" << desc_.path << "': " << chunk_data_.size()
            << " bytes at offset " << chunk_offset_;
  return Status::OK();
}

Status ColumnChunkReader::ReadDataPage() {
  rep_levels_.clear();
  def_levels_.clear();
  values_.clear();
  level_idx_ = value_idx_ = 0;

  // Read the next data page, decoding a dictionary page found on the way. We break out
  // of this loop on the non-error case (a data page was found or we read all the pages).
  while (true) {
    const int64_t page_offset = chunk_offset_ + pos_;
    if (pos_ == chunk_data_.size()) {
      if (num_values_read_ != summary_.meta_data.num_values
          || num_rows_read_ != summary_.num_rows) {
        stringstream ss;
        ss << "column metadata states there are " << summary_.meta_data.num_values
           << " values in " << summary_.num_rows << " rows, but the pages hold "
           << num_values_read_ << " values in " << num_rows_read_ << " rows";
        return Corruption(-1, ss.str());
      }
      eos_ = true;
      return Status::OK();
    }

    DecodedPage page;
    RETURN_IF_ERROR(page_reader_.ReadPage(chunk_data_.data() + pos_,
        chunk_data_.size() - pos_, page_offset, options_.verify_page_checksum, &page));
    const bool first_page = pos_ == 0;
    pos_ += page.total_size();
    VLOG_PAGE << "Column '" << desc_.path << "' page at offset " << page_offset << ": "
              << page.header.DebugString();

    if (page.header.type == PageType::DICTIONARY_PAGE) {
      // The dictionary must be the first page of the chunk.
      if (dictionary_ != nullptr) {
        return Corruption(page_offset, "multiple dictionary pages");
      } else if (!first_page) {
        return Corruption(page_offset, "dictionary page is not the first page");
      }
      RETURN_IF_ERROR(InitDictionary(page));
      continue;
    }
    DCHECK_EQ(page.header.type, PageType::DATA_PAGE);
    RETURN_IF_ERROR(DecodeDataPage(page));
    // Skip empty pages
    if (!rep_levels_.empty()) return Status::OK();
  }
}

Status ColumnChunkReader::InitDictionary(const DecodedPage& page) {
  if (desc_.type == Type::BOOLEAN) {
    return Status(TErrorCode::UNSUPPORTED_ENCODING,
        PrintThriftEnum(Encoding::RLE_DICTIONARY), desc_.path,
        PrintThriftEnum(desc_.type));
  }
  if (page.header.encoding != Encoding::PLAIN
      && page.header.encoding != Encoding::PLAIN_DICTIONARY) {
    return Status(TErrorCode::UNSUPPORTED_ENCODING,
        PrintThriftEnum(page.header.encoding), desc_.path, PrintThriftEnum(desc_.type));
  }
  dictionary_.reset(new DictionaryTable());
  RETURN_IF_ERROR(dictionary_->Init(desc_, page.values(), page.values_len(),
      page.header.num_values, page.offset));
  VLOG_PAGE << "Column '" << desc_.path << "' dictionary with "
            << dictionary_->num_entries() << " entries";
  return Status::OK();
}

Status ColumnChunkReader::DecodeDataPage(const DecodedPage& page) {
  const PageHeader& header = page.header;
  const int64_t num_values = header.num_values;
  if (num_values_read_ + num_values > summary_.meta_data.num_values) {
    stringstream ss;
    ss << "column metadata states there are " << summary_.meta_data.num_values
       << " values, but the pages hold at least " << num_values_read_ + num_values;
    return Corruption(page.offset, ss.str());
  }

  RETURN_IF_ERROR(LevelDecoder::Decode(desc_.path, header.rep_level_encoding,
      desc_.max_rep_level, page.rep_levels(), page.rep_levels_len(), num_values,
      page.offset, &rep_levels_));
  RETURN_IF_ERROR(LevelDecoder::Decode(desc_.path, header.def_level_encoding,
      desc_.max_def_level, page.def_levels(), page.def_levels_len(), num_values,
      page.offset, &def_levels_));

  int64_t num_non_null = 0;
  int64_t num_rows = 0;
  for (int64_t i = 0; i < num_values; ++i) {
    if (def_levels_[i] == desc_.max_def_level) ++num_non_null;
    if (rep_levels_[i] == 0) ++num_rows;
  }
  if (num_values > 0 && rep_levels_[0] != 0) {
    return Corruption(page.offset, "the page starts in the middle of a record");
  }
  if (num_values - num_non_null != header.num_nulls || num_rows != header.num_rows) {
    stringstream ss;
    ss << "page header states " << header.num_nulls << " nulls and " << header.num_rows
       << " rows, but the levels have " << num_values - num_non_null << " nulls and "
       << num_rows << " rows";
    return Corruption(page.offset, ss.str());
  }

  RETURN_IF_ERROR(DecodeValues(header.encoding, desc_, page.values(),
      page.values_len(), num_non_null, dictionary_.get(), &values_, page.offset));
  num_values_read_ += num_values;
  num_rows_read_ += num_rows;
  ++num_data_pages_read_;
  return Status::OK();
}

Status ColumnChunkReader::PeekLevels(int16_t* rep_level, int16_t* def_level, bool* eos) {
  RETURN_IF_ERROR(FillBuffer());
  *eos = eos_;
  if (eos_) return Status::OK();
  *rep_level = rep_levels_[level_idx_];
  *def_level = def_levels_[level_idx_];
  return Status::OK();
}

Status ColumnChunkReader::NextEntry(
    int16_t* rep_level, int16_t* def_level, PrimitiveValue* value) {
  RETURN_IF_ERROR(FillBuffer());
  if (UNLIKELY(eos_)) return Corruption(-1, "read past the end of the chunk");
  *rep_level = rep_levels_[level_idx_];
  *def_level = def_levels_[level_idx_];
  ++level_idx_;
  if (*def_level == desc_.max_def_level) {
    DCHECK_LT(value_idx_, values_.size());
    *value = std::move(values_[value_idx_++]);
  }
  return Status::OK();
}

Status ColumnChunkReader::ReadAll(ShreddedColumn* column) {
  while (true) {
    RETURN_IF_ERROR(FillBuffer());
    if (eos_) return Status::OK();
    for (; level_idx_ < rep_levels_.size(); ++level_idx_) {
      column->rep_levels.push_back(rep_levels_[level_idx_]);
      column->def_levels.push_back(def_levels_[level_idx_]);
      if (def_levels_[level_idx_] == desc_.max_def_level) {
        column->values.push_back(std::move(values_[value_idx_++]));
      }
    }
  }
}

}
