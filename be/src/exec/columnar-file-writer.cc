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

#include "exec/columnar-file-writer.h"

#include "common/logging.h"
#include "exec/columnar-common.h"
#include "exec/metadata-serializer.h"
#include "util/bit-util.h"

#include "common/names.h"

namespace strata {

ColumnarFileWriter::ColumnarFileWriter(const Schema& schema,
    const WriterProperties& props, StorageSink* sink,
    const std::atomic<bool>* cancelled)
  : schema_(schema), props_(props), sink_(sink), cancelled_(cancelled) {}

Status ColumnarFileWriter::Open() {
  DCHECK(!opened_);
  RETURN_IF_ERROR(props_.Validate());
  ByteRange range;
  RETURN_IF_ERROR(sink_->Write(0, COLUMNAR_MAGIC, COLUMNAR_MAGIC_LEN, &range));
  opened_ = true;
  return Status::OK();
}

Status ColumnarFileWriter::AppendRecord(const Value& record) {
  DCHECK(opened_);
  DCHECK(!closed_);
  if (current_row_group_ == nullptr) {
    current_row_group_.reset(new RowGroupWriter(schema_, props_, sink_, cancelled_));
    RETURN_IF_ERROR(current_row_group_->Init());
  }
  RETURN_IF_ERROR(current_row_group_->AppendRecord(record));
  ++num_rows_;
  if (current_row_group_->IsFull()) RETURN_IF_ERROR(FlushRowGroup());
  return Status::OK();
}

Status ColumnarFileWriter::FlushRowGroup() {
  DCHECK(opened_);
  if (current_row_group_ == nullptr) return Status::OK();
  unique_ptr<RowGroupWriter> row_group = move(current_row_group_);
  if (row_group->num_rows() == 0) return Status::OK();
  RowGroupSummary summary;
  RETURN_IF_ERROR(row_group->Close(row_groups_.size(), &summary));
  row_groups_.push_back(move(summary));
  return Status::OK();
}

Status ColumnarFileWriter::Close() {
  DCHECK(opened_);
  DCHECK(!closed_);
  closed_ = true;
  RETURN_IF_ERROR(FlushRowGroup());

  vector<uint8_t> footer;
  RETURN_IF_ERROR(MetadataSerializer::SerializeFooter(
      schema_, row_groups_, key_value_metadata_, &footer));
  uint32_t footer_len = BitUtil::ToLittleEndian(static_cast<uint32_t>(footer.size()));
  footer.resize(footer.size() + COLUMNAR_FOOTER_LEN_SIZE + COLUMNAR_MAGIC_LEN);
  uint8_t* trailer = footer.data() + footer.size() - COLUMNAR_FOOTER_LEN_SIZE
      - COLUMNAR_MAGIC_LEN;
  memcpy(trailer, &footer_len, COLUMNAR_FOOTER_LEN_SIZE);
  memcpy(trailer + COLUMNAR_FOOTER_LEN_SIZE, COLUMNAR_MAGIC, COLUMNAR_MAGIC_LEN);
  ByteRange range;
  RETURN_IF_ERROR(sink_->Write(-1, footer.data(), footer.size(), &range));
  RETURN_IF_ERROR(sink_->Close());
  VLOG_FILE << "Closed file: " << row_groups_.size() << " row groups, " << num_rows_
            << " rows, " << range.end() << " bytes";
  return Status::OK();
}

}
