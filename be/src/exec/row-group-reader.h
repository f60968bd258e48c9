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



#ifndef STRATA_EXEC_ROW_GROUP_READER_H
#define STRATA_EXEC_ROW_GROUP_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include "common/status.h"
#include "exec/level-shredder.h"
#include "exec/row-group-writer.h"
#include "exec/schema.h"
#include "exec/writer-properties.h"
#include "runtime/storage-io.h"
#include "runtime/value.h"

namespace strata {

/// Reads the column chunks of one row group. Columns are selected by path; the chunks
/// of columns that are not selected are never read from the source.
///
/// A path names a leaf column or a group, which selects all leaves below it. An empty
/// list of paths selects every column.
class RowGroupReader {
 public:
  /// 'schema' and 'source' must outlive the reader.
  RowGroupReader(const Schema& schema, const ReaderOptions& options)
    : schema_(schema), options_(options) {}

  /// Validates 'summary' against the schema. Returns STRUCTURAL_CORRUPTION if the
  /// row group doesn't have one chunk per leaf column with matching paths.
  Status Init(const RowGroupSummary& summary, StorageSource* source)
      WARN_UNUSED_RESULT;

  /// Resolves 'paths' to the sorted indices of the selected leaf columns. An unknown
  /// path fails with SCHEMA_VIOLATION.
  Status ResolvePaths(const std::vector<std::string>& paths,
      std::vector<int>* col_idxs) const WARN_UNUSED_RESULT;

  /// Reads all entries of the columns selected by 'paths'. On success 'col_idxs' holds
  /// the selected column indices and 'columns' their entries, in the same order.
  Status ReadColumns(const std::vector<std::string>& paths, std::vector<int>* col_idxs,
      std::vector<ShreddedColumn>* columns) WARN_UNUSED_RESULT;

  /// Assembles the records of the row group from the columns selected by 'paths' and
  /// appends them to 'records'. Subtrees without a selected column are NULL.
  Status ReadRecords(const std::vector<std::string>& paths, std::vector<Value>* records)
      WARN_UNUSED_RESULT;

  int64_t num_rows() const { return summary_.num_rows; }
  const RowGroupSummary& summary() const { return summary_; }

 private:
  /// Reads the chunks of 'col_idxs' into 'columns', on up to 'options_.num_threads'
  /// threads.
  Status DecodeColumns(const std::vector<int>& col_idxs,
      std::vector<ShreddedColumn>* columns) WARN_UNUSED_RESULT;

  /// Decodes the chunks with index 'first', 'first' + 'stride', ... of 'col_idxs'.
  /// Run by each decoding thread.
  void DecodeColumnRange(const std::vector<int>* col_idxs, int first, int stride,
      std::vector<ShreddedColumn>* columns, std::vector<Status>* statuses);

  /// Reads the complete chunk of column 'col_idx' into 'column'.
  Status DecodeColumn(int col_idx, ShreddedColumn* column) WARN_UNUSED_RESULT;

  const Schema& schema_;
  const ReaderOptions options_;
  StorageSource* source_ = nullptr;
  RowGroupSummary summary_;
};

}

#endif
