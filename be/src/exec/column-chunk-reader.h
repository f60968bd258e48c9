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



#ifndef STRATA_EXEC_COLUMN_CHUNK_READER_H
#define STRATA_EXEC_COLUMN_CHUNK_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include <boost/scoped_ptr.hpp>

#include "common/status.h"
#include "exec/column-chunk-writer.h"
#include "exec/columnar-page.h"
#include "exec/level-shredder.h"
#include "exec/record-assembler.h"
#include "exec/schema.h"
#include "exec/value-codec.h"
#include "exec/writer-properties.h"
#include "runtime/storage-io.h"

namespace strata {

/// Reads the entries of one column chunk. The bytes of the chunk are read from the
/// source by Init(); pages are verified, decompressed and decoded one at a time as the
/// entries are consumed. The dictionary page, if any, must be the first page of the
/// chunk and is decoded before the first data page.
///
/// Decoding errors name the column and the file offset of the page.
class ColumnChunkReader : public ColumnLevelCursor {
 public:
  /// 'desc' must outlive the reader.
  ColumnChunkReader(const ColumnDescriptor& desc, const ReaderOptions& options)
    : desc_(desc), options_(options), page_reader_(desc.path) {}

  /// Reads the chunk described by 'summary' from 'source'. Returns
  /// STRUCTURAL_CORRUPTION if the metadata doesn't match the column or the chunk is
  /// outside the source.
  Status Init(const ColumnChunkSummary& summary, StorageSource* source)
      WARN_UNUSED_RESULT;

  virtual Status PeekLevels(int16_t* rep_level, int16_t* def_level, bool* eos) override
      WARN_UNUSED_RESULT;
  virtual Status NextEntry(int16_t* rep_level, int16_t* def_level,
      PrimitiveValue* value) override WARN_UNUSED_RESULT;

  /// Appends all remaining entries to 'column'.
  Status ReadAll(ShreddedColumn* column) WARN_UNUSED_RESULT;

  const ColumnDescriptor& desc() const { return desc_; }
  int num_data_pages_read() const { return num_data_pages_read_; }
  bool has_dictionary() const { return dictionary_ != nullptr; }

 private:
  /// Makes the next data page current, decoding a leading dictionary page first. Sets
  /// 'eos_' if the chunk has no more pages.
  Status ReadDataPage() WARN_UNUSED_RESULT;

  /// Decodes the dictionary page 'page'.
  Status InitDictionary(const DecodedPage& page) WARN_UNUSED_RESULT;

  /// Decodes levels and values of the data page 'page' into the page buffers.
  Status DecodeDataPage(const DecodedPage& page) WARN_UNUSED_RESULT;

  /// Makes sure the current page has an unconsumed entry, reading the next page if
  /// needed. Sets 'eos_' at the end of the chunk.
  Status FillBuffer() WARN_UNUSED_RESULT {
    if (LIKELY(level_idx_ < rep_levels_.size()) || eos_) return Status::OK();
    return ReadDataPage();
  }

  Status Corruption(int64_t page_offset, const std::string& details) const;

  const ColumnDescriptor& desc_;
  const ReaderOptions options_;
  PageReader page_reader_;

  /// Metadata of the chunk.
  ColumnChunkSummary summary_;

  /// The bytes of the chunk and the file offset of the first one.
  std::vector<uint8_t> chunk_data_;
  int64_t chunk_offset_ = 0;

  /// Position of the next page in 'chunk_data_'.
  int64_t pos_ = 0;

  boost::scoped_ptr<DictionaryTable> dictionary_;

  /// Decoded entries of the current data page.
  std::vector<int16_t> rep_levels_;
  std::vector<int16_t> def_levels_;
  std::vector<PrimitiveValue> values_;
  int64_t level_idx_ = 0;
  int64_t value_idx_ = 0;

  /// Totals over the pages read so far.
  int64_t num_values_read_ = 0;
  int64_t num_rows_read_ = 0;
  int num_data_pages_read_ = 0;

  bool eos_ = false;
};

}

#endif
