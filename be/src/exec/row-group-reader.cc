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

#include "exec/row-group-reader.h"

#include <algorithm>
#include <set>
#include <sstream>

#include <boost/thread/thread.hpp>

#include "common/logging.h"
#include "exec/column-chunk-reader.h"
#include "exec/record-assembler.h"

#include "common/names.h"

namespace strata {

Status RowGroupReader::Init(const RowGroupSummary& summary, StorageSource* source) {
  if (summary.columns.size() != schema_.num_columns()) {
    stringstream ss;
    ss << "row group " << summary.ordinal << " has " << summary.columns.size()
       << " column chunks but the schema has " << schema_.num_columns() << " columns";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "row group", ss.str());
  }
  for (int i = 0; i < summary.columns.size(); ++i) {
    const ColumnChunkSummary& chunk = summary.columns[i];
    if (chunk.path != schema_.column(i).path) {
      stringstream ss;
      ss << "chunk " << i << " of row group " << summary.ordinal << " belongs to '"
         << chunk.path << "'";
      return Status(TErrorCode::STRUCTURAL_CORRUPTION, schema_.column(i).path,
          ss.str());
    }
    if (chunk.num_rows != summary.num_rows) {
      stringstream ss;
      ss << "column has " << chunk.num_rows << " rows but row group "
         << summary.ordinal << " has " << summary.num_rows;
      return Status(TErrorCode::STRUCTURAL_CORRUPTION, chunk.path, ss.str());
    }
  }
  summary_ = summary;
  source_ = source;
  return Status::OK();
}

Status RowGroupReader::ResolvePaths(const vector<string>& paths,
    vector<int>* col_idxs) const {
  col_idxs->clear();
  if (paths.empty()) {
    for (int i = 0; i < schema_.num_columns(); ++i) col_idxs->push_back(i);
    return Status::OK();
  }
  std::set<int> selected;
  for (const string& path : paths) {
    const SchemaNode* node = schema_.FindNode(path);
    if (node == nullptr) {
      return Status(TErrorCode::SCHEMA_VIOLATION, path, "no such column in the schema");
    }
    for (int i = node->first_col; i < node->first_col + node->num_leaves; ++i) {
      selected.insert(i);
    }
  }
  col_idxs->assign(selected.begin(), selected.end());
  return Status::OK();
}

Status RowGroupReader::DecodeColumn(int col_idx, ShreddedColumn* column) {
  ColumnChunkReader reader(schema_.column(col_idx), options_);
  RETURN_IF_ERROR(reader.Init(summary_.columns[col_idx], source_));
  return reader.ReadAll(column);
}

void RowGroupReader::DecodeColumnRange(const vector<int>* col_idxs, int first,
    int stride, vector<ShreddedColumn>* columns, vector<Status>* statuses) {
  for (int i = first; i < col_idxs->size(); i += stride) {
    (*statuses)[i] = DecodeColumn((*col_idxs)[i], &(*columns)[i]);
  }
}

Status RowGroupReader::DecodeColumns(const vector<int>& col_idxs,
    vector<ShreddedColumn>* columns) {
  DCHECK(source_ != nullptr);
  columns->clear();
  columns->resize(col_idxs.size());
  vector<Status> statuses(col_idxs.size());
  int num_threads = std::min<int>(options_.num_threads, col_idxs.size());
  if (num_threads > 1) {
    boost::thread_group threads;
    for (int t = 0; t < num_threads; ++t) {
      threads.add_thread(new boost::thread(&RowGroupReader::DecodeColumnRange, this,
          &col_idxs, t, num_threads, columns, &statuses));
    }
    threads.join_all();
  } else {
    DecodeColumnRange(&col_idxs, 0, 1, columns, &statuses);
  }
  for (const Status& status : statuses) RETURN_IF_ERROR(status);
  return Status::OK();
}

Status RowGroupReader::ReadColumns(const vector<string>& paths, vector<int>* col_idxs,
    vector<ShreddedColumn>* columns) {
  RETURN_IF_ERROR(ResolvePaths(paths, col_idxs));
  return DecodeColumns(*col_idxs, columns);
}

Status RowGroupReader::ReadRecords(const vector<string>& paths,
    vector<Value>* records) {
  DCHECK(source_ != nullptr);
  vector<int> col_idxs;
  RETURN_IF_ERROR(ResolvePaths(paths, &col_idxs));
  VLOG_FILE << "Reading " << col_idxs.size() << " of " << schema_.num_columns()
            << " columns of row group " << summary_.ordinal;

  vector<ColumnLevelCursor*> cursors(schema_.num_columns(), nullptr);
  // With several threads the chunks are decoded up front; otherwise the chunk readers
  // are consumed page by page during assembly.
  vector<ShreddedColumn> columns;
  vector<unique_ptr<ColumnLevelCursor>> owned_cursors;
  if (options_.num_threads > 1) {
    RETURN_IF_ERROR(DecodeColumns(col_idxs, &columns));
    for (int i = 0; i < col_idxs.size(); ++i) {
      int col_idx = col_idxs[i];
      owned_cursors.emplace_back(
          new ShreddedColumnCursor(schema_.column(col_idx), &columns[i]));
      cursors[col_idx] = owned_cursors.back().get();
    }
  } else {
    for (int col_idx : col_idxs) {
      unique_ptr<ColumnChunkReader> reader(
          new ColumnChunkReader(schema_.column(col_idx), options_));
      RETURN_IF_ERROR(reader->Init(summary_.columns[col_idx], source_));
      cursors[col_idx] = reader.get();
      owned_cursors.push_back(move(reader));
    }
  }

  RecordAssembler assembler(schema_);
  RETURN_IF_ERROR(assembler.Init(move(cursors)));
  int64_t num_records_before = records->size();
  RETURN_IF_ERROR(assembler.AssembleAll(records));
  int64_t num_records = records->size() - num_records_before;
  if (num_records != summary_.num_rows) {
    stringstream ss;
    ss << "assembled " << num_records << " records but row group " << summary_.ordinal
       << " has " << summary_.num_rows << " rows";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "row group", ss.str());
  }
  return Status::OK();
}

}
