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



#ifndef STRATA_EXEC_COLUMN_CHUNK_WRITER_H
#define STRATA_EXEC_COLUMN_CHUNK_WRITER_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "common/status.h"
#include "exec/column-stats.h"
#include "exec/columnar-page.h"
#include "exec/level-shredder.h"
#include "exec/schema.h"
#include "exec/writer-properties.h"
#include "gen-cpp/columnar_types.h"
#include "runtime/storage-io.h"

namespace strata {

/// Result of closing a column chunk writer: where the chunk landed and its footer
/// metadata.
struct ColumnChunkSummary {
  int col_idx = -1;
  std::string path;
  /// Offset of the first page of the chunk, which is the dictionary page if there is
  /// one.
  int64_t file_offset = -1;
  /// Number of records, i.e. entries with repetition level 0.
  int64_t num_rows = 0;
  columnar::ColumnMetaData meta_data;

  /// The bytes of all pages of the chunk.
  ByteRange range() const {
    return ByteRange(file_offset, meta_data.total_compressed_size);
  }
};

/// Class that encapsulates all the state for writing a single column chunk. It buffers
/// the entries of the current data page; when the page is full the levels and values
/// are encoded and handed to a PageWriter. Finished pages are kept in memory until
/// Close(), which writes the dictionary page (if any) and all data pages back to back
/// through the sink.
///
/// Data pages end only at record boundaries, so the entries of one record are never
/// split across pages. A page is full once the encoded size of its values reaches
/// 'data_page_size' or it holds 'data_page_max_values' entries.
///
/// Columns whose type supports it start out dictionary encoded. When the dictionary
/// reaches 'dictionary_max_entries' entries or 'dictionary_page_size' bytes, the chunk
/// falls back to the column's fallback encoding for good: if the overflowing entry
/// starts a record, the current page is finished with dictionary encoding, otherwise
/// the whole current page is encoded with the fallback encoding.
///
/// Implemented by per-type subclasses; use Create().
class ColumnChunkWriter {
 public:
  /// Upper bound of the encoded size of the min and max statistics values. Larger
  /// statistics are dropped, keeping only the counts.
  static const int64_t MAX_COLUMN_STATS_SIZE = 4 * 1024;

  /// Creates a writer for the column described by 'desc'. 'sink' receives the pages on
  /// Close(). 'cancelled' may be null; otherwise it is checked at page boundaries.
  /// 'desc', 'props', 'sink' and 'cancelled' must outlive the writer.
  static Status Create(const ColumnDescriptor& desc, const WriterProperties& props,
      StorageSink* sink, const std::atomic<bool>* cancelled,
      std::unique_ptr<ColumnChunkWriter>* writer) WARN_UNUSED_RESULT;

  virtual ~ColumnChunkWriter() {}

  /// Appends one entry. 'value' must be set iff 'def_level' is the column's max
  /// definition level. Entries with levels out of range or values of the wrong type
  /// fail with SCHEMA_VIOLATION. Returns CANCELLED if cancellation was requested when
  /// a page is finished.
  Status AppendEntry(int16_t rep_level, int16_t def_level, const PrimitiveValue* value)
      WARN_UNUSED_RESULT;

  /// Appends all entries of 'column'.
  Status AppendColumn(const ShreddedColumn& column) WARN_UNUSED_RESULT;

  /// Finishes the last page, writes the chunk through the sink and fills in 'summary'.
  /// The writer can't be used afterwards.
  Status Close(ColumnChunkSummary* summary) WARN_UNUSED_RESULT;

  const ColumnDescriptor& desc() const { return desc_; }

  /// Number of entries, including absent ones.
  int64_t num_values() const { return num_values_; }
  int64_t num_rows() const { return num_rows_; }

  /// Encoding of the page being filled.
  columnar::Encoding::type current_encoding() const { return current_encoding_; }

  /// Estimate of the bytes the chunk would occupy if closed now.
  int64_t EstimatedSize() const {
    return total_compressed_byte_size_ + page_values_size_;
  }

 protected:
  ColumnChunkWriter(const ColumnDescriptor& desc, const WriterProperties& props,
      StorageSink* sink, const std::atomic<bool>* cancelled);

  /// Called after the constructor to initialize the writer.
  virtual Status Init() WARN_UNUSED_RESULT;

  /// Adds 'value' to the current page and updates the page statistics. Returns false
  /// if the value was not added because the dictionary is full, in which case the
  /// caller switches to the fallback encoding and tries again. May set 'page_full_'.
  /// Implemented in the subclass.
  virtual bool ProcessValue(const PrimitiveValue& value) WARN_UNUSED_RESULT = 0;

  /// Encodes the values of the current page with 'encoding' into 'out' and clears them.
  virtual Status EncodePageValues(columnar::Encoding::type encoding,
      std::vector<uint8_t>* out) WARN_UNUSED_RESULT = 0;

  /// Drops the dictionary indices of the current page, whose values are going to be
  /// encoded with 'next_page_encoding_' instead.
  virtual void ConvertPageToFallback() {}

  /// Writes the dictionary page into 'page'. Sets 'has_dictionary' to false instead if
  /// the chunk has no dictionary.
  virtual Status WriteDictionaryPage(ColumnarPage* page, bool* has_dictionary)
      WARN_UNUSED_RESULT;

  /// Number of entries of the chunk's dictionary, or -1 if it has none.
  virtual int dictionary_size() const { return -1; }

  /// Encodes out all data for the current page and updates the metadata.
  Status FinalizeCurrentPage() WARN_UNUSED_RESULT;

  /// Resets the page state and switches to 'next_page_encoding_'.
  void NewPage();

  bool IsPageFull() const {
    return page_full_ || page_num_values_ >= props_.data_page_max_values;
  }

  const ColumnDescriptor& desc_;
  const WriterProperties& props_;
  StorageSink* const sink_;
  const std::atomic<bool>* const cancelled_;

  PageWriter page_writer_;

  /// Finished data pages, in order.
  std::vector<ColumnarPage> pages_;

  /// First row index and statistics of each page in 'pages_'.
  std::vector<int64_t> page_first_rows_;
  std::vector<columnar::Statistics> page_stats_thrift_;

  /// Levels of the current page.
  std::vector<int16_t> rep_levels_;
  std::vector<int16_t> def_levels_;

  /// Number of entries, non-null values and records of the current page.
  int32_t page_num_values_ = 0;
  int32_t page_num_non_null_ = 0;
  int32_t page_num_rows_ = 0;

  /// Estimated encoded size of the values of the current page.
  int64_t page_values_size_ = 0;

  /// Set by ProcessValue() once the values of the current page reach the page size.
  bool page_full_ = false;

  /// Totals across all pages, including NULL entries.
  int64_t num_values_ = 0;
  int64_t num_rows_ = 0;
  int64_t total_compressed_byte_size_ = 0;
  int64_t total_uncompressed_byte_size_ = 0;

  /// Encoding of the current page.
  columnar::Encoding::type current_encoding_;

  /// Encoding to use for the next page. Differs from 'current_encoding_' after the
  /// dictionary overflowed.
  columnar::Encoding::type next_page_encoding_;

  /// Number of data pages written with a dictionary encoding.
  int num_dict_data_pages_ = 0;

  /// Set of all encodings used in the column chunk.
  std::set<columnar::Encoding::type> column_encodings_;

  /// Number of pages per encoding, by page type.
  std::map<columnar::Encoding::type, int> dict_encoding_stats_;
  std::map<columnar::Encoding::type, int> data_encoding_stats_;

  /// Reused buffers for the encoded levels and values of a page.
  std::vector<uint8_t> rep_levels_buffer_;
  std::vector<uint8_t> def_levels_buffer_;
  std::vector<uint8_t> values_buffer_;

  /// Pointers to statistics, created, owned, and set by the derived class.
  ColumnStatsBase* page_stats_base_ = nullptr;
  ColumnStatsBase* chunk_stats_base_ = nullptr;

  bool closed_ = false;

 private:
  /// Returns SCHEMA_VIOLATION if the entry doesn't fit the column.
  Status CheckEntry(int16_t rep_level, int16_t def_level,
      const PrimitiveValue* value) const WARN_UNUSED_RESULT;

  /// Fills 'meta_data' from the accumulated state. 'pages_offset' is the offset of the
  /// first data page, 'dict_page_offset' the one of the dictionary page or -1.
  void BuildMetadata(int64_t pages_offset, int64_t dict_page_offset,
      const ColumnarPage* dict_page, columnar::ColumnMetaData* meta_data);
};

}

#endif
