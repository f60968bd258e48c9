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

#include "exec/level-shredder.h"

#include "exec/columnar-common.h"

#include "common/names.h"

namespace strata {

static const char* KindName(Value::Kind kind) {
  switch (kind) {
    case Value::NULL_VALUE: return "NULL";
    case Value::PRIMITIVE: return "primitive";
    case Value::GROUP: return "group";
    case Value::LIST: return "list";
  }
  return "unknown";
}

static const string& NodePath(const SchemaNode& node) {
  return node.path.empty() ? node.name : node.path;
}

Status LevelShredder::Shred(const Value& record, vector<ShreddedColumn>* columns) {
  columns->resize(schema_.num_columns());
  ColumnSinks sinks(columns->size());
  for (int i = 0; i < columns->size(); ++i) sinks[i] = &(*columns)[i];
  return ShredRecord(record, sinks);
}

Status LevelShredder::ShredColumn(const Value& record, int col_idx, ShreddedColumn* out) {
  DCHECK_GE(col_idx, 0);
  DCHECK_LT(col_idx, schema_.num_columns());
  ColumnSinks sinks(schema_.num_columns(), nullptr);
  sinks[col_idx] = out;
  return ShredRecord(record, sinks);
}

Status LevelShredder::ShredRecord(const Value& record, const ColumnSinks& sinks) {
  vector<int64_t> num_entries(sinks.size());
  vector<int64_t> num_values(sinks.size());
  for (int i = 0; i < sinks.size(); ++i) {
    if (sinks[i] == nullptr) continue;
    num_entries[i] = sinks[i]->num_entries();
    num_values[i] = sinks[i]->values.size();
  }
  Status status = ShredElement(schema_.root(), record, ShredCursor{0, 0}, sinks);
  if (UNLIKELY(!status.ok())) {
    for (int i = 0; i < sinks.size(); ++i) {
      if (sinks[i] == nullptr) continue;
      sinks[i]->rep_levels.resize(num_entries[i]);
      sinks[i]->def_levels.resize(num_entries[i]);
      sinks[i]->values.resize(num_values[i]);
    }
  }
  return status;
}

bool LevelShredder::IsSkipped(const SchemaNode& node, const ColumnSinks& sinks) {
  for (int i = node.first_col; i < node.first_col + node.num_leaves; ++i) {
    if (sinks[i] != nullptr) return false;
  }
  return true;
}

Status LevelShredder::ShredNode(const SchemaNode& node, const Value& value,
    ShredCursor cursor, const ColumnSinks& sinks) {
  if (IsSkipped(node, sinks)) return Status::OK();
  if (node.is_repeated()) {
    if (value.kind() != Value::LIST) {
      return Status(TErrorCode::SCHEMA_VIOLATION, NodePath(node),
          string("expected a list for a REPEATED field, got ") + KindName(value.kind()));
    }
    const vector<Value>& elements = value.children();
    if (elements.empty()) {
      EmitAbsent(node, cursor, sinks);
      return Status::OK();
    }
    for (int i = 0; i < elements.size(); ++i) {
      // Only the first element continues the enclosing repetition; later elements
      // repeat at this node's depth.
      ShredCursor element_cursor{
          static_cast<int16_t>(i == 0 ? cursor.rep_level : node.max_rep_level),
          static_cast<int16_t>(node.max_def_level)};
      RETURN_IF_ERROR(ShredElement(node, elements[i], element_cursor, sinks));
    }
    return Status::OK();
  }
  if (value.is_null()) {
    if (!node.is_optional()) {
      return Status(TErrorCode::SCHEMA_VIOLATION, NodePath(node),
          "NULL value for a REQUIRED field");
    }
    EmitAbsent(node, cursor, sinks);
    return Status::OK();
  }
  ShredCursor element_cursor{cursor.rep_level, static_cast<int16_t>(node.max_def_level)};
  return ShredElement(node, value, element_cursor, sinks);
}

Status LevelShredder::ShredElement(const SchemaNode& node, const Value& value,
    ShredCursor cursor, const ColumnSinks& sinks) {
  if (node.is_leaf) {
    if (value.kind() != Value::PRIMITIVE) {
      return Status(TErrorCode::SCHEMA_VIOLATION, NodePath(node),
          string("expected a primitive value, got ") + KindName(value.kind()));
    }
    if (!PrimitiveValueMatchesType(value.primitive(), node.type, node.type_length)) {
      stringstream ss;
      ss << "value " << value.primitive() << " doesn't match type "
         << PrintThriftEnum(node.type);
      if (node.type == columnar::Type::FIXED_LEN_BYTE_ARRAY) {
        ss << "(" << node.type_length << ")";
      }
      return Status(TErrorCode::SCHEMA_VIOLATION, NodePath(node), ss.str());
    }
    DCHECK_EQ(cursor.def_level, node.max_def_level);
    sinks[node.col_idx]->Append(cursor.rep_level, cursor.def_level, &value.primitive());
    return Status::OK();
  }
  if (value.kind() != Value::GROUP) {
    return Status(TErrorCode::SCHEMA_VIOLATION, NodePath(node),
        string("expected a group, got ") + KindName(value.kind()));
  }
  const vector<Value>& children = value.children();
  if (children.size() != node.children.size()) {
    stringstream ss;
    ss << "expected " << node.children.size() << " fields, got " << children.size();
    return Status(TErrorCode::SCHEMA_VIOLATION, NodePath(node), ss.str());
  }
  for (int i = 0; i < children.size(); ++i) {
    RETURN_IF_ERROR(ShredNode(node.children[i], children[i], cursor, sinks));
  }
  return Status::OK();
}

void LevelShredder::EmitAbsent(
    const SchemaNode& node, ShredCursor cursor, const ColumnSinks& sinks) {
  for (int i = node.first_col; i < node.first_col + node.num_leaves; ++i) {
    if (sinks[i] == nullptr) continue;
    sinks[i]->Append(cursor.rep_level, cursor.def_level, nullptr);
  }
}

}
