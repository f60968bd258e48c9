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

#ifndef STRATA_EXEC_RECORD_ASSEMBLER_H
#define STRATA_EXEC_RECORD_ASSEMBLER_H

#include <cstdint>
#include <vector>

#include "common/status.h"
#include "exec/level-shredder.h"
#include "exec/schema.h"
#include "runtime/value.h"

namespace strata {

/// Sequential access to the (repetition level, definition level, value) entries of one
/// leaf column.
class ColumnLevelCursor {
 public:
  virtual ~ColumnLevelCursor() {}

  /// Returns the levels of the next entry without consuming it. Sets *eos and leaves
  /// the levels unset when the column has no more entries.
  virtual Status PeekLevels(int16_t* rep_level, int16_t* def_level, bool* eos)
      WARN_UNUSED_RESULT = 0;

  /// Consumes the next entry. 'value' is set if the entry's definition level is the
  /// column's max definition level. Must not be called at end of stream.
  virtual Status NextEntry(int16_t* rep_level, int16_t* def_level, PrimitiveValue* value)
      WARN_UNUSED_RESULT = 0;
};

/// Cursor over an in-memory ShreddedColumn, which must outlive the cursor.
class ShreddedColumnCursor : public ColumnLevelCursor {
 public:
  ShreddedColumnCursor(const ColumnDescriptor& desc, const ShreddedColumn* column)
    : desc_(desc), column_(column) {}

  virtual Status PeekLevels(int16_t* rep_level, int16_t* def_level, bool* eos) override
      WARN_UNUSED_RESULT;
  virtual Status NextEntry(int16_t* rep_level, int16_t* def_level,
      PrimitiveValue* value) override WARN_UNUSED_RESULT;

 private:
  const ColumnDescriptor& desc_;
  const ShreddedColumn* column_;
  int64_t entry_idx_ = 0;
  int64_t value_idx_ = 0;
};

/// Rebuilds nested records from the entries of the leaf columns (Dremel record
/// assembly). It walks the schema top-down for every record, peeking at the first leaf
/// below a node to decide whether the node is absent, and reads lists element by
/// element until a leaf's repetition level leaves the list.
///
/// Column streams that disagree on the record structure are reported as
/// STRUCTURAL_CORRUPTION: a column ending before the others, a record starting with a
/// non-zero repetition level, levels above the column's maximum, or definition levels
/// that contradict those of the other columns.
class RecordAssembler {
 public:
  explicit RecordAssembler(const Schema& schema) : schema_(schema) {}

  /// 'cursors' has one entry per leaf column, in column order. A nullptr entry marks a
  /// column that is not read: every subtree without a read column is materialized as
  /// NULL. At least one column must be read. The cursors must outlive the assembler.
  Status Init(std::vector<ColumnLevelCursor*> cursors) WARN_UNUSED_RESULT;

  /// Assembles the next record into *record, or sets *eos if all columns are
  /// exhausted.
  Status NextRecord(Value* record, bool* eos) WARN_UNUSED_RESULT;

  /// Appends all remaining records to 'records'.
  Status AssembleAll(std::vector<Value>* records) WARN_UNUSED_RESULT;

  int64_t num_records() const { return num_records_; }

 private:
  /// Reads one occurrence of 'node': a list for REPEATED nodes, NULL for absent
  /// OPTIONAL nodes, else one element.
  Status ReadNode(const SchemaNode& node, int16_t expected_rep, Value* out);

  /// Reads one instance of 'node': a group or a primitive value.
  Status ReadElement(const SchemaNode& node, int16_t expected_rep, Value* out);

  /// Consumes the absent entry at definition level 'def_level' of every read leaf
  /// below 'node'.
  Status ConsumeAbsent(const SchemaNode& node, int16_t expected_rep, int16_t def_level);

  /// Returns the first read column below 'node', or -1 if none is read.
  int FirstReadColumn(const SchemaNode& node) const;

  /// Peeks the next levels of column 'col_idx', failing if the column is exhausted or
  /// the levels exceed the column's maximum.
  Status PeekInRecord(int col_idx, int16_t* rep_level, int16_t* def_level);

  /// Consumes the next entry of 'col_idx' and checks that it has the given levels.
  Status ConsumeEntry(int col_idx, int16_t expected_rep, int16_t expected_def,
      PrimitiveValue* value);

  Status Corruption(int col_idx, const std::string& details) const;

  const Schema& schema_;
  std::vector<ColumnLevelCursor*> cursors_;
  int64_t num_records_ = 0;
};

}

#endif
