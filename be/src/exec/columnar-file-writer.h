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



#ifndef STRATA_EXEC_COLUMNAR_FILE_WRITER_H
#define STRATA_EXEC_COLUMNAR_FILE_WRITER_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "exec/row-group-writer.h"
#include "exec/schema.h"
#include "exec/writer-properties.h"
#include "runtime/storage-io.h"
#include "runtime/value.h"

namespace strata {

/// Writes records into a columnar file:
///   magic, row group 0, ..., row group N-1, footer, footer length, magic
/// The magic is "STR1", the footer is serialized by MetadataSerializer and its length
/// is a 4 byte little endian integer. A row group is closed once it holds
/// 'row_group_max_rows' records or when FlushRowGroup() is called.
class ColumnarFileWriter {
 public:
  /// 'schema', 'props', 'sink' and 'cancelled' must outlive the writer. 'cancelled'
  /// may be null.
  ColumnarFileWriter(const Schema& schema, const WriterProperties& props,
      StorageSink* sink, const std::atomic<bool>* cancelled = nullptr);

  /// Validates the properties and writes the leading magic bytes. The sink must be
  /// empty.
  Status Open() WARN_UNUSED_RESULT;

  /// Appends 'record' to the current row group, closing the row group if it is full.
  Status AppendRecord(const Value& record) WARN_UNUSED_RESULT;

  /// Closes the current row group, if it has any records.
  Status FlushRowGroup() WARN_UNUSED_RESULT;

  /// Adds a key/value pair to the footer. Later values replace earlier ones.
  void AddKeyValueMetadata(const std::string& key, const std::string& value) {
    key_value_metadata_[key] = value;
  }

  /// Flushes the current row group, writes the footer and closes the sink.
  Status Close() WARN_UNUSED_RESULT;

  /// Number of records appended so far.
  int64_t num_rows() const { return num_rows_; }

  /// The row groups written so far.
  const std::vector<RowGroupSummary>& row_groups() const { return row_groups_; }

 private:
  const Schema& schema_;
  const WriterProperties& props_;
  StorageSink* const sink_;
  const std::atomic<bool>* const cancelled_;

  /// Row group being filled, or null if no record was appended since the last flush.
  std::unique_ptr<RowGroupWriter> current_row_group_;

  std::vector<RowGroupSummary> row_groups_;
  std::map<std::string, std::string> key_value_metadata_;
  int64_t num_rows_ = 0;

  bool opened_ = false;
  bool closed_ = false;
};

}

#endif
