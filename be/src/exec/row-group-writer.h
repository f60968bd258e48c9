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



#ifndef STRATA_EXEC_ROW_GROUP_WRITER_H
#define STRATA_EXEC_ROW_GROUP_WRITER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "common/status.h"
#include "exec/column-chunk-writer.h"
#include "exec/level-shredder.h"
#include "exec/schema.h"
#include "exec/writer-properties.h"
#include "runtime/storage-io.h"
#include "runtime/value.h"

namespace strata {

struct RowGroupSummary {
  int64_t num_rows = 0;
  /// Offset of the first byte of the row group, i.e. the lowest chunk offset.
  int64_t file_offset = -1;
  /// Sum of the compressed sizes of all chunks.
  int64_t total_byte_size = 0;
  int16_t ordinal = 0;
  /// One summary per leaf column, in column order.
  std::vector<ColumnChunkSummary> columns;
};

/// Writes one row group: a column chunk per leaf column of the schema, all covering
/// the same records. Records are shredded as they are appended; the chunks are
/// written to the sink together by Close(), possibly on several threads.
class RowGroupWriter {
 public:
  /// 'schema', 'props', 'sink' and 'cancelled' must outlive the writer. 'cancelled'
  /// may be null.
  RowGroupWriter(const Schema& schema, const WriterProperties& props,
      StorageSink* sink, const std::atomic<bool>* cancelled = nullptr);

  Status Init() WARN_UNUSED_RESULT;

  /// Shreds 'record' and appends its entries to every column chunk. A record that
  /// doesn't match the schema is rejected with SCHEMA_VIOLATION and leaves the row
  /// group unchanged.
  Status AppendRecord(const Value& record) WARN_UNUSED_RESULT;

  /// True once the row group holds 'row_group_max_rows' records.
  bool IsFull() const { return num_rows_ >= props_.row_group_max_rows; }

  int64_t num_rows() const { return num_rows_; }

  /// Estimate of the bytes the row group would occupy if closed now.
  int64_t EstimatedSize() const;

  /// Closes all column chunks, writing them through the sink, and fills in 'summary'.
  /// 'ordinal' is the position of the row group in its file.
  Status Close(int16_t ordinal, RowGroupSummary* summary) WARN_UNUSED_RESULT;

 private:
  /// Closes the chunks with index 'first', 'first' + 'stride', ... Run by each closing
  /// thread.
  void CloseColumns(int first, int stride, std::vector<ColumnChunkSummary>* summaries,
      std::vector<Status>* statuses);

  const Schema& schema_;
  const WriterProperties& props_;
  StorageSink* const sink_;
  const std::atomic<bool>* const cancelled_;

  LevelShredder shredder_;
  std::vector<std::unique_ptr<ColumnChunkWriter>> column_writers_;

  /// Entries of the record being appended, one per leaf.
  std::vector<ShreddedColumn> record_columns_;

  int64_t num_rows_ = 0;

  /// Set if appending failed part way, leaving the chunks out of step.
  bool failed_ = false;
  bool closed_ = false;
};

}

#endif
