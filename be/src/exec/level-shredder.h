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

#ifndef STRATA_EXEC_LEVEL_SHREDDER_H
#define STRATA_EXEC_LEVEL_SHREDDER_H

#include <cstdint>
#include <vector>

#include "common/status.h"
#include "exec/schema.h"
#include "runtime/value.h"

namespace strata {

/// The entries of one leaf column: a (repetition level, definition level) pair per slot
/// and the values of the slots whose definition level is the column's max definition
/// level, in slot order.
struct ShreddedColumn {
  std::vector<int16_t> rep_levels;
  std::vector<int16_t> def_levels;
  std::vector<PrimitiveValue> values;

  int64_t num_entries() const { return rep_levels.size(); }

  void Append(int16_t rep_level, int16_t def_level, const PrimitiveValue* value) {
    rep_levels.push_back(rep_level);
    def_levels.push_back(def_level);
    if (value != nullptr) values.push_back(*value);
  }

  void Clear() {
    rep_levels.clear();
    def_levels.clear();
    values.clear();
  }
};

/// Splits nested records into per-leaf level/value streams (Dremel record shredding).
///
/// For every leaf, a record contributes one entry per occurrence of the leaf, plus one
/// absent entry for every empty list or missing optional ancestor on the leaf's path.
/// The definition level of an entry counts the OPTIONAL and REPEATED nodes on the path
/// that are present; the repetition level is the depth, counted in REPEATED nodes, of
/// the list that received a new element since the previous entry, or 0 for the first
/// entry of a record.
///
/// Records that don't match the schema are rejected with SCHEMA_VIOLATION, in which
/// case nothing is appended to the output columns.
class LevelShredder {
 public:
  explicit LevelShredder(const Schema& schema) : schema_(schema) {}

  /// Appends the entries of 'record' to 'columns', which is resized to one
  /// ShreddedColumn per leaf if needed.
  Status Shred(const Value& record, std::vector<ShreddedColumn>* columns)
      WARN_UNUSED_RESULT;

  /// Appends the entries of 'record' for column 'col_idx' only. Only the parts of the
  /// record on the path to the leaf are validated.
  Status ShredColumn(const Value& record, int col_idx, ShreddedColumn* out)
      WARN_UNUSED_RESULT;

 private:
  /// The levels that the next entry emitted below a node inherits.
  struct ShredCursor {
    int16_t rep_level;
    int16_t def_level;
  };

  /// Output column for each leaf, or nullptr for leaves that are not shredded.
  typedef std::vector<ShreddedColumn*> ColumnSinks;

  /// Shreds 'value' as an occurrence of 'node' (a list for REPEATED nodes).
  Status ShredNode(const SchemaNode& node, const Value& value, ShredCursor cursor,
      const ColumnSinks& sinks);

  /// Shreds 'value' as one instance of 'node': a group or a primitive value.
  Status ShredElement(const SchemaNode& node, const Value& value, ShredCursor cursor,
      const ColumnSinks& sinks);

  /// Emits one absent entry at 'cursor' for every leaf below 'node'.
  void EmitAbsent(const SchemaNode& node, ShredCursor cursor, const ColumnSinks& sinks);

  /// Returns true if no leaf below 'node' has a sink.
  static bool IsSkipped(const SchemaNode& node, const ColumnSinks& sinks);

  /// Runs the shredding of 'record' into 'sinks', restoring the sinks' previous sizes
  /// if the record is rejected.
  Status ShredRecord(const Value& record, const ColumnSinks& sinks);

  const Schema& schema_;
};

}

#endif
