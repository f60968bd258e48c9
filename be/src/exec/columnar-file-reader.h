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



#ifndef STRATA_EXEC_COLUMNAR_FILE_READER_H
#define STRATA_EXEC_COLUMNAR_FILE_READER_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "exec/metadata-serializer.h"
#include "exec/row-group-reader.h"
#include "exec/schema.h"
#include "exec/writer-properties.h"
#include "runtime/storage-io.h"
#include "runtime/value.h"

namespace strata {

/// Reads a file written by ColumnarFileWriter. Open() reads and validates the footer;
/// column chunks are only read through the row group readers.
class ColumnarFileReader {
 public:
  /// 'source' must outlive the reader.
  ColumnarFileReader(StorageSource* source, const ReaderOptions& options)
    : source_(source), options_(options) {}

  /// Reads the footer. Returns STRUCTURAL_CORRUPTION if the file is too small, a magic
  /// number is wrong or the footer doesn't fit the file.
  Status Open() WARN_UNUSED_RESULT;

  const Schema& schema() const { return *footer_.schema; }
  int64_t num_rows() const { return footer_.num_rows; }
  int num_row_groups() const { return footer_.row_groups.size(); }
  const RowGroupSummary& row_group(int i) const { return footer_.row_groups[i]; }
  const std::map<std::string, std::string>& key_value_metadata() const {
    return footer_.key_value_metadata;
  }
  const std::string& created_by() const { return footer_.created_by; }

  /// Creates a reader for row group 'i'.
  Status GetRowGroupReader(int i, std::unique_ptr<RowGroupReader>* reader)
      WARN_UNUSED_RESULT;

  /// Appends the records of all row groups, projected to the columns selected by
  /// 'paths', to 'records'.
  Status ReadRecords(const std::vector<std::string>& paths, std::vector<Value>* records)
      WARN_UNUSED_RESULT;

 private:
  /// Returns STRUCTURAL_CORRUPTION if a column chunk is not between the leading magic
  /// and the footer, which starts at 'footer_start'.
  Status ValidateChunkRanges(int64_t footer_start) const WARN_UNUSED_RESULT;

  StorageSource* const source_;
  const ReaderOptions options_;
  FileFooter footer_;
  bool opened_ = false;
};

}

#endif
