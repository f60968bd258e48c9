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

#include "exec/row-group-writer.h"

#include <algorithm>
#include <sstream>

#include <boost/thread/thread.hpp>

#include "common/logging.h"

#include "common/names.h"

namespace strata {

RowGroupWriter::RowGroupWriter(const Schema& schema, const WriterProperties& props,
    StorageSink* sink, const std::atomic<bool>* cancelled)
  : schema_(schema),
    props_(props),
    sink_(sink),
    cancelled_(cancelled),
    shredder_(schema) {}

Status RowGroupWriter::Init() {
  DCHECK(column_writers_.empty());
  for (const ColumnDescriptor& desc : schema_.columns()) {
    unique_ptr<ColumnChunkWriter> writer;
    RETURN_IF_ERROR(ColumnChunkWriter::Create(desc, props_, sink_, cancelled_, &writer));
    column_writers_.push_back(move(writer));
  }
  record_columns_.resize(schema_.num_columns());
  return Status::OK();
}

Status RowGroupWriter::AppendRecord(const Value& record) {
  DCHECK(!closed_);
  if (UNLIKELY(failed_)) {
    return Status("Can't append to a row group after a failed append");
  }
  for (ShreddedColumn& column : record_columns_) column.Clear();
  // Shredding validates the whole record before any chunk sees an entry.
  RETURN_IF_ERROR(shredder_.Shred(record, &record_columns_));
  for (int i = 0; i < column_writers_.size(); ++i) {
    Status status = column_writers_[i]->AppendColumn(record_columns_[i]);
    if (UNLIKELY(!status.ok())) {
      failed_ = true;
      return status;
    }
  }
  ++num_rows_;
  VLOG_ROW << "Appended record " << num_rows_ << ": " << record.DebugString();
  return Status::OK();
}

int64_t RowGroupWriter::EstimatedSize() const {
  int64_t size = 0;
  for (const auto& writer : column_writers_) size += writer->EstimatedSize();
  return size;
}

void RowGroupWriter::CloseColumns(int first, int stride,
    vector<ColumnChunkSummary>* summaries, vector<Status>* statuses) {
  for (int i = first; i < column_writers_.size(); i += stride) {
    (*statuses)[i] = column_writers_[i]->Close(&(*summaries)[i]);
  }
}

Status RowGroupWriter::Close(int16_t ordinal, RowGroupSummary* summary) {
  DCHECK(!closed_);
  closed_ = true;
  if (UNLIKELY(failed_)) {
    return Status("Can't close a row group after a failed append");
  }
  int num_columns = column_writers_.size();
  vector<ColumnChunkSummary> summaries(num_columns);
  vector<Status> statuses(num_columns);
  int num_threads = std::min(props_.num_threads, num_columns);
  if (num_threads > 1) {
    boost::thread_group threads;
    for (int t = 0; t < num_threads; ++t) {
      threads.add_thread(new boost::thread(&RowGroupWriter::CloseColumns, this, t,
          num_threads, &summaries, &statuses));
    }
    threads.join_all();
  } else {
    CloseColumns(0, 1, &summaries, &statuses);
  }
  for (const Status& status : statuses) RETURN_IF_ERROR(status);

  summary->num_rows = num_rows_;
  summary->ordinal = ordinal;
  summary->total_byte_size = 0;
  summary->file_offset = -1;
  for (const ColumnChunkSummary& chunk : summaries) {
    if (chunk.num_rows != num_rows_) {
      stringstream ss;
      ss << "column has " << chunk.num_rows << " rows but the row group has "
         << num_rows_;
      return Status(TErrorCode::STRUCTURAL_CORRUPTION, chunk.path, ss.str());
    }
    summary->total_byte_size += chunk.meta_data.total_compressed_size;
    if (summary->file_offset < 0 || chunk.file_offset < summary->file_offset) {
      summary->file_offset = chunk.file_offset;
    }
  }
  summary->columns = move(summaries);
  VLOG_FILE << "Closed row group " << ordinal << ": " << num_rows_ << " rows, "
            << summary->total_byte_size << " bytes at offset " << summary->file_offset;
  return Status::OK();
}

}
