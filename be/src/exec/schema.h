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

#ifndef STRATA_EXEC_SCHEMA_H
#define STRATA_EXEC_SCHEMA_H

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.h"
#include "gen-cpp/columnar_types.h"

namespace strata {

/// Optional logical type of a leaf. Stored in and restored from the footer, never
/// interpreted by the storage engine.
struct LogicalAnnotation {
  bool has_converted_type = false;
  columnar::ConvertedType::type converted_type = columnar::ConvertedType::UTF8;
  /// Only meaningful for DECIMAL.
  int32_t scale = 0;
  int32_t precision = 0;

  LogicalAnnotation() {}

  static LogicalAnnotation Of(columnar::ConvertedType::type t) {
    LogicalAnnotation result;
    result.has_converted_type = true;
    result.converted_type = t;
    return result;
  }

  static LogicalAnnotation Decimal(int32_t precision, int32_t scale) {
    LogicalAnnotation result = Of(columnar::ConvertedType::DECIMAL);
    result.precision = precision;
    result.scale = scale;
    return result;
  }

  bool operator==(const LogicalAnnotation& other) const;
  bool operator!=(const LogicalAnnotation& other) const { return !(*this == other); }
};

/// Node of a schema tree. A node is either a group (is_leaf == false, one or more
/// children) or a leaf with a physical type. The level fields are filled in by
/// Schema::Create().
struct SchemaNode {
  std::string name;
  columnar::FieldRepetitionType::type repetition =
      columnar::FieldRepetitionType::REQUIRED;

  bool is_leaf = false;
  columnar::Type::type type = columnar::Type::BOOLEAN;
  /// Byte length of FIXED_LEN_BYTE_ARRAY values; 0 for all other types.
  int type_length = 0;
  LogicalAnnotation annotation;

  std::vector<SchemaNode> children;

  /// Dotted path from the root, excluding the root's name.
  std::string path;

  /// max_def_level counts the OPTIONAL and REPEATED nodes on the path from the root
  /// to this node, including the node itself; max_rep_level counts the REPEATED ones.
  int max_def_level = 0;
  int max_rep_level = 0;

  /// The max_def_level of the closest REPEATED strict ancestor, or 0 if there is none.
  /// A definition level below this value means the entry does not belong to any
  /// element of that ancestor's list.
  int def_level_of_immediate_repeated_ancestor = 0;

  /// Index of the leaf column, for leaves only.
  int col_idx = -1;

  /// The leaves of this subtree are the columns [first_col, first_col + num_leaves).
  int first_col = 0;
  int num_leaves = 0;

  bool is_optional() const {
    return repetition == columnar::FieldRepetitionType::OPTIONAL;
  }
  bool is_repeated() const {
    return repetition == columnar::FieldRepetitionType::REPEATED;
  }

  std::string DebugString(int indent = 0) const;
};

/// Immutable description of one leaf column, derived from the schema tree.
struct ColumnDescriptor {
  int col_idx = -1;
  std::string path;
  std::vector<std::string> path_in_schema;
  columnar::Type::type type = columnar::Type::BOOLEAN;
  int type_length = 0;
  LogicalAnnotation annotation;
  int16_t max_def_level = 0;
  int16_t max_rep_level = 0;
  int16_t def_level_of_immediate_repeated_ancestor = 0;
  /// The leaf node; owned by the Schema.
  const SchemaNode* node = nullptr;
};

/// A validated schema tree together with its leaf column descriptors. Schemas are
/// immutable and shared read-only by writers and readers, which must not outlive it.
class Schema {
 public:
  /// Limit on the depth of the tree. Bounds the levels, and therefore the level bit
  /// widths, to small values.
  static const int MAX_NESTING_DEPTH = 100;

  /// Validates 'root' and computes the levels of every node. The root must be a
  /// REQUIRED group; every group has at least one child; sibling names are unique,
  /// non-empty and contain no '.'; FIXED_LEN_BYTE_ARRAY leaves have a positive type
  /// length. Returns SCHEMA_VIOLATION otherwise.
  static Status Create(SchemaNode root, std::unique_ptr<Schema>* schema)
      WARN_UNUSED_RESULT;

  const SchemaNode& root() const { return root_; }
  int num_columns() const { return columns_.size(); }
  const ColumnDescriptor& column(int i) const { return columns_[i]; }
  const std::vector<ColumnDescriptor>& columns() const { return columns_; }

  /// Returns the index of the leaf with dotted path 'path', or -1 if there is none.
  int FindColumn(const std::string& path) const;

  /// Returns the node with dotted path 'path' (a group or a leaf), or nullptr.
  const SchemaNode* FindNode(const std::string& path) const;

  std::string DebugString() const { return root_.DebugString(); }

 private:
  explicit Schema(SchemaNode root) : root_(std::move(root)) {}
  Schema(const Schema&) = delete;
  Schema& operator=(const Schema&) = delete;

  /// Validates 'node' and fills in its levels and leaf range, appending a descriptor
  /// for every leaf in its subtree.
  Status InitNode(const std::string& parent_path, int max_def_level, int max_rep_level,
      int ira_def_level, int depth, SchemaNode* node);

  SchemaNode root_;
  std::vector<ColumnDescriptor> columns_;
  std::unordered_map<std::string, int> column_index_;
};

/// Programmatic construction of a schema tree, e.g.
///   SchemaBuilder b;
///   b.AddLeaf("DocId", REQUIRED, Type::INT64)
///    .BeginGroup("Name", REPEATED)
///      .AddLeaf("Url", OPTIONAL, Type::BYTE_ARRAY, 0, LogicalAnnotation::Of(UTF8))
///    .EndGroup();
///   RETURN_IF_ERROR(b.Build(&schema));
/// Misuse (unbalanced groups) is reported by Build().
class SchemaBuilder {
 public:
  explicit SchemaBuilder(const std::string& root_name = "schema");

  SchemaBuilder& BeginGroup(
      const std::string& name, columnar::FieldRepetitionType::type repetition);
  SchemaBuilder& EndGroup();
  SchemaBuilder& AddLeaf(const std::string& name,
      columnar::FieldRepetitionType::type repetition, columnar::Type::type type,
      int type_length = 0, const LogicalAnnotation& annotation = LogicalAnnotation());

  /// Finishes the tree and validates it with Schema::Create(). The builder must not be
  /// used afterwards.
  Status Build(std::unique_ptr<Schema>* schema) WARN_UNUSED_RESULT;

 private:
  /// Returns the group new nodes are added to.
  SchemaNode* current();

  SchemaNode root_;
  /// Child indices from the root to the current group.
  std::vector<int> open_groups_;
  std::string error_;
};

}

#endif
