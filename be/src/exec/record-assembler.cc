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

#include "exec/record-assembler.h"

#include "common/names.h"

namespace strata {

Status ShreddedColumnCursor::PeekLevels(int16_t* rep_level, int16_t* def_level,
    bool* eos) {
  if (UNLIKELY(column_->rep_levels.size() != column_->def_levels.size())) {
    stringstream ss;
    ss << column_->rep_levels.size() << " repetition levels but "
       << column_->def_levels.size() << " definition levels";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, desc_.path, ss.str());
  }
  if (entry_idx_ == column_->num_entries()) {
    if (UNLIKELY(value_idx_ != column_->values.size())) {
      stringstream ss;
      ss << column_->values.size() - value_idx_ << " values left after the last entry";
      return Status(TErrorCode::STRUCTURAL_CORRUPTION, desc_.path, ss.str());
    }
    *eos = true;
    return Status::OK();
  }
  *eos = false;
  *rep_level = column_->rep_levels[entry_idx_];
  *def_level = column_->def_levels[entry_idx_];
  return Status::OK();
}

Status ShreddedColumnCursor::NextEntry(int16_t* rep_level, int16_t* def_level,
    PrimitiveValue* value) {
  DCHECK_LT(entry_idx_, column_->num_entries());
  *rep_level = column_->rep_levels[entry_idx_];
  *def_level = column_->def_levels[entry_idx_];
  if (*def_level == desc_.max_def_level) {
    if (UNLIKELY(value_idx_ >= column_->values.size())) {
      return Status(TErrorCode::STRUCTURAL_CORRUPTION, desc_.path,
          "missing value for entry " + std::to_string(entry_idx_));
    }
    *value = column_->values[value_idx_++];
  }
  ++entry_idx_;
  return Status::OK();
}

Status RecordAssembler::Init(vector<ColumnLevelCursor*> cursors) {
  if (cursors.size() != schema_.num_columns()) {
    stringstream ss;
    ss << "expected " << schema_.num_columns() << " column cursors, got "
       << cursors.size();
    return Status(TErrorCode::SCHEMA_VIOLATION, schema_.root().name, ss.str());
  }
  cursors_ = std::move(cursors);
  if (FirstReadColumn(schema_.root()) < 0) {
    return Status(TErrorCode::SCHEMA_VIOLATION, schema_.root().name,
        "at least one column must be read");
  }
  num_records_ = 0;
  return Status::OK();
}

Status RecordAssembler::NextRecord(Value* record, bool* eos) {
  int first_eos_col = -1;
  bool all_eos = true;
  for (int i = 0; i < cursors_.size(); ++i) {
    if (cursors_[i] == nullptr) continue;
    int16_t rep_level, def_level;
    bool col_eos;
    RETURN_IF_ERROR(cursors_[i]->PeekLevels(&rep_level, &def_level, &col_eos));
    if (col_eos) {
      if (first_eos_col < 0) first_eos_col = i;
      continue;
    }
    all_eos = false;
    if (UNLIKELY(rep_level != 0)) {
      return Corruption(i, "record " + std::to_string(num_records_)
          + " starts with repetition level " + std::to_string(rep_level));
    }
  }
  if (all_eos) {
    *eos = true;
    return Status::OK();
  }
  if (UNLIKELY(first_eos_col >= 0)) {
    return Corruption(first_eos_col, "column has " + std::to_string(num_records_)
        + " records, other columns have more");
  }
  *eos = false;
  RETURN_IF_ERROR(ReadElement(schema_.root(), 0, record));

  // Every column must now be at a record boundary.
  for (int i = 0; i < cursors_.size(); ++i) {
    if (cursors_[i] == nullptr) continue;
    int16_t rep_level, def_level;
    bool col_eos;
    RETURN_IF_ERROR(cursors_[i]->PeekLevels(&rep_level, &def_level, &col_eos));
    if (UNLIKELY(!col_eos && rep_level != 0)) {
      return Corruption(i, "entries with repetition level " + std::to_string(rep_level)
          + " left at the end of record " + std::to_string(num_records_));
    }
  }
  ++num_records_;
  VLOG_ROW << "Assembled record: " << *record;
  return Status::OK();
}

Status RecordAssembler::AssembleAll(vector<Value>* records) {
  while (true) {
    Value record;
    bool eos;
    RETURN_IF_ERROR(NextRecord(&record, &eos));
    if (eos) break;
    records->push_back(std::move(record));
  }
  return Status::OK();
}

Status RecordAssembler::ReadNode(const SchemaNode& node, int16_t expected_rep,
    Value* out) {
  int col_idx = FirstReadColumn(node);
  if (col_idx < 0) {
    *out = Value::Null();
    return Status::OK();
  }
  int16_t rep_level, def_level;
  RETURN_IF_ERROR(PeekInRecord(col_idx, &rep_level, &def_level));
  // 'node' is read as part of an element of its closest repeated ancestor, so the
  // entry must at least define that element.
  if (UNLIKELY(def_level < node.def_level_of_immediate_repeated_ancestor)) {
    stringstream ss;
    ss << "definition level " << def_level << " of '" << node.path << "' is below "
       << node.def_level_of_immediate_repeated_ancestor
       << ", the level of its enclosing repeated element";
    return Corruption(col_idx, ss.str());
  }
  if (node.is_repeated()) {
    if (def_level < node.max_def_level) {
      RETURN_IF_ERROR(ConsumeAbsent(node, expected_rep, node.max_def_level - 1));
      *out = Value::List({});
      return Status::OK();
    }
    vector<Value> elements;
    int16_t element_rep = expected_rep;
    while (true) {
      elements.emplace_back();
      RETURN_IF_ERROR(ReadElement(node, element_rep, &elements.back()));
      bool eos;
      RETURN_IF_ERROR(cursors_[col_idx]->PeekLevels(&rep_level, &def_level, &eos));
      if (eos || rep_level < node.max_rep_level) break;
      if (UNLIKELY(rep_level > node.max_rep_level)) {
        return Corruption(col_idx, "unexpected repetition level "
            + std::to_string(rep_level) + " after an element of '" + node.path + "'");
      }
      element_rep = node.max_rep_level;
    }
    *out = Value::List(std::move(elements));
    return Status::OK();
  }
  if (node.is_optional() && def_level < node.max_def_level) {
    RETURN_IF_ERROR(ConsumeAbsent(node, expected_rep, node.max_def_level - 1));
    *out = Value::Null();
    return Status::OK();
  }
  return ReadElement(node, expected_rep, out);
}

Status RecordAssembler::ReadElement(const SchemaNode& node, int16_t expected_rep,
    Value* out) {
  if (node.is_leaf) {
    PrimitiveValue value;
    RETURN_IF_ERROR(ConsumeEntry(node.col_idx, expected_rep, node.max_def_level, &value));
    *out = Value::Primitive(std::move(value));
    return Status::OK();
  }
  vector<Value> children(node.children.size());
  for (int i = 0; i < node.children.size(); ++i) {
    RETURN_IF_ERROR(ReadNode(node.children[i], expected_rep, &children[i]));
  }
  *out = Value::Group(std::move(children));
  return Status::OK();
}

Status RecordAssembler::ConsumeAbsent(const SchemaNode& node, int16_t expected_rep,
    int16_t def_level) {
  for (int i = node.first_col; i < node.first_col + node.num_leaves; ++i) {
    if (cursors_[i] == nullptr) continue;
    PrimitiveValue unused;
    RETURN_IF_ERROR(ConsumeEntry(i, expected_rep, def_level, &unused));
  }
  return Status::OK();
}

int RecordAssembler::FirstReadColumn(const SchemaNode& node) const {
  for (int i = node.first_col; i < node.first_col + node.num_leaves; ++i) {
    if (cursors_[i] != nullptr) return i;
  }
  return -1;
}

Status RecordAssembler::PeekInRecord(int col_idx, int16_t* rep_level,
    int16_t* def_level) {
  bool eos;
  RETURN_IF_ERROR(cursors_[col_idx]->PeekLevels(rep_level, def_level, &eos));
  if (UNLIKELY(eos)) {
    return Corruption(col_idx, "column ended in the middle of record "
        + std::to_string(num_records_));
  }
  const ColumnDescriptor& desc = schema_.column(col_idx);
  if (UNLIKELY(*rep_level < 0 || *rep_level > desc.max_rep_level || *def_level < 0
          || *def_level > desc.max_def_level)) {
    stringstream ss;
    ss << "levels (" << *rep_level << ", " << *def_level << ") exceed the maximum ("
       << desc.max_rep_level << ", " << desc.max_def_level << ")";
    return Corruption(col_idx, ss.str());
  }
  return Status::OK();
}

Status RecordAssembler::ConsumeEntry(int col_idx, int16_t expected_rep,
    int16_t expected_def, PrimitiveValue* value) {
  int16_t rep_level, def_level;
  RETURN_IF_ERROR(PeekInRecord(col_idx, &rep_level, &def_level));
  if (UNLIKELY(rep_level != expected_rep || def_level != expected_def)) {
    stringstream ss;
    ss << "expected levels (" << expected_rep << ", " << expected_def << ") in record "
       << num_records_ << ", got (" << rep_level << ", " << def_level << ")";
    return Corruption(col_idx, ss.str());
  }
  return cursors_[col_idx]->NextEntry(&rep_level, &def_level, value);
}

Status RecordAssembler::Corruption(int col_idx, const string& details) const {
  return Status(TErrorCode::STRUCTURAL_CORRUPTION, schema_.column(col_idx).path, details);
}

}
