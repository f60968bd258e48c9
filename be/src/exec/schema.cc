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

#include "exec/schema.h"

#include <unordered_set>

#include "exec/columnar-common.h"

#include "common/names.h"

namespace strata {

bool LogicalAnnotation::operator==(const LogicalAnnotation& other) const {
  if (has_converted_type != other.has_converted_type) return false;
  if (!has_converted_type) return true;
  return converted_type == other.converted_type && scale == other.scale
      && precision == other.precision;
}

string SchemaNode::DebugString(int indent) const {
  stringstream ss;
  for (int i = 0; i < indent; ++i) ss << " ";
  ss << PrintThriftEnum(repetition) << " ";
  if (!is_leaf) {
    ss << "group";
  } else {
    ss << PrintThriftEnum(type);
    if (type == columnar::Type::FIXED_LEN_BYTE_ARRAY) ss << "(" << type_length << ")";
  }
  ss << " " << name;
  if (annotation.has_converted_type) {
    ss << " (" << PrintThriftEnum(annotation.converted_type) << ")";
  }
  ss << " [";
  if (is_leaf) ss << "i:" << col_idx << " ";
  ss << "d:" << max_def_level << " r:" << max_rep_level << "]";
  if (!is_leaf) {
    ss << " {" << endl;
    for (const SchemaNode& child : children) {
      ss << child.DebugString(indent + 2) << endl;
    }
    for (int i = 0; i < indent; ++i) ss << " ";
    ss << "}";
  }
  return ss.str();
}

Status Schema::Create(SchemaNode root, unique_ptr<Schema>* schema) {
  if (root.is_leaf) {
    return Status(TErrorCode::SCHEMA_VIOLATION, root.name, "the root must be a group");
  }
  if (root.repetition != columnar::FieldRepetitionType::REQUIRED) {
    return Status(TErrorCode::SCHEMA_VIOLATION, root.name, "the root must be REQUIRED");
  }
  unique_ptr<Schema> result(new Schema(std::move(root)));
  RETURN_IF_ERROR(result->InitNode("", 0, 0, 0, 0, &result->root_));
  for (const ColumnDescriptor& col : result->columns_) {
    result->column_index_[col.path] = col.col_idx;
  }
  VLOG_FILE << "Created schema:\n" << result->DebugString();
  *schema = std::move(result);
  return Status::OK();
}

Status Schema::InitNode(const string& parent_path, int max_def_level, int max_rep_level,
    int ira_def_level, int depth, SchemaNode* node) {
  bool is_root = depth == 0;
  if (!is_root) {
    if (node->name.empty()) {
      return Status(TErrorCode::SCHEMA_VIOLATION, parent_path, "empty field name");
    }
    if (node->name.find('.') != string::npos) {
      return Status(TErrorCode::SCHEMA_VIOLATION, parent_path,
          "field name '" + node->name + "' contains a '.'");
    }
    node->path = parent_path.empty() ? node->name : parent_path + "." + node->name;
  }
  if (depth > MAX_NESTING_DEPTH) {
    return Status(TErrorCode::SCHEMA_VIOLATION, node->path,
        "nesting is deeper than " + std::to_string(MAX_NESTING_DEPTH) + " levels");
  }

  // def_level_of_immediate_repeated_ancestor does not include this node, so set before
  // updating ira_def_level
  node->def_level_of_immediate_repeated_ancestor = ira_def_level;
  if (node->repetition == columnar::FieldRepetitionType::OPTIONAL) {
    ++max_def_level;
  } else if (node->repetition == columnar::FieldRepetitionType::REPEATED) {
    ++max_rep_level;
    // Repeated fields add a definition level. This is used to distinguish between an
    // empty list and a list with an item in it.
    ++max_def_level;
    // node is the new most immediate repeated ancestor
    ira_def_level = max_def_level;
  } else if (node->repetition != columnar::FieldRepetitionType::REQUIRED) {
    return Status(TErrorCode::SCHEMA_VIOLATION, node->path,
        "invalid repetition " + PrintThriftEnum(node->repetition));
  }
  node->max_def_level = max_def_level;
  node->max_rep_level = max_rep_level;
  node->first_col = columns_.size();

  if (node->is_leaf) {
    if (!node->children.empty()) {
      return Status(TErrorCode::SCHEMA_VIOLATION, node->path, "a leaf has children");
    }
    if (node->type < columnar::Type::BOOLEAN
        || node->type > columnar::Type::FIXED_LEN_BYTE_ARRAY) {
      return Status(TErrorCode::SCHEMA_VIOLATION, node->path,
          "invalid physical type " + std::to_string(node->type));
    }
    if (node->type == columnar::Type::FIXED_LEN_BYTE_ARRAY) {
      if (node->type_length <= 0) {
        return Status(TErrorCode::SCHEMA_VIOLATION, node->path,
            "FIXED_LEN_BYTE_ARRAY needs a positive type length");
      }
    } else {
      node->type_length = 0;
    }
    node->col_idx = columns_.size();
    node->num_leaves = 1;

    ColumnDescriptor desc;
    desc.col_idx = node->col_idx;
    desc.path = node->path;
    std::stringstream path_stream(node->path);
    string part;
    while (std::getline(path_stream, part, '.')) desc.path_in_schema.push_back(part);
    desc.type = node->type;
    desc.type_length = node->type_length;
    desc.annotation = node->annotation;
    desc.max_def_level = max_def_level;
    desc.max_rep_level = max_rep_level;
    desc.def_level_of_immediate_repeated_ancestor =
        node->def_level_of_immediate_repeated_ancestor;
    desc.node = node;
    columns_.push_back(std::move(desc));
    return Status::OK();
  }

  if (node->children.empty()) {
    return Status(TErrorCode::SCHEMA_VIOLATION, is_root ? node->name : node->path,
        "a group needs at least one child");
  }
  std::unordered_set<string> names;
  for (SchemaNode& child : node->children) {
    if (!names.insert(child.name).second) {
      return Status(TErrorCode::SCHEMA_VIOLATION, node->path,
          "duplicate field name '" + child.name + "'");
    }
    RETURN_IF_ERROR(InitNode(node->path, max_def_level, max_rep_level, ira_def_level,
        depth + 1, &child));
  }
  node->num_leaves = columns_.size() - node->first_col;
  return Status::OK();
}

int Schema::FindColumn(const string& path) const {
  auto it = column_index_.find(path);
  return it == column_index_.end() ? -1 : it->second;
}

const SchemaNode* Schema::FindNode(const string& path) const {
  const SchemaNode* node = &root_;
  std::stringstream path_stream(path);
  string part;
  while (std::getline(path_stream, part, '.')) {
    const SchemaNode* next = nullptr;
    for (const SchemaNode& child : node->children) {
      if (child.name == part) {
        next = &child;
        break;
      }
    }
    if (next == nullptr) return nullptr;
    node = next;
  }
  return node == &root_ ? nullptr : node;
}

SchemaBuilder::SchemaBuilder(const string& root_name) {
  root_.name = root_name;
  root_.repetition = columnar::FieldRepetitionType::REQUIRED;
}

SchemaNode* SchemaBuilder::current() {
  SchemaNode* node = &root_;
  for (int idx : open_groups_) node = &node->children[idx];
  return node;
}

SchemaBuilder& SchemaBuilder::BeginGroup(
    const string& name, columnar::FieldRepetitionType::type repetition) {
  SchemaNode* parent = current();
  SchemaNode group;
  group.name = name;
  group.repetition = repetition;
  parent->children.push_back(std::move(group));
  open_groups_.push_back(parent->children.size() - 1);
  return *this;
}

SchemaBuilder& SchemaBuilder::EndGroup() {
  if (open_groups_.empty()) {
    if (error_.empty()) error_ = "EndGroup() without a matching BeginGroup()";
  } else {
    open_groups_.pop_back();
  }
  return *this;
}

SchemaBuilder& SchemaBuilder::AddLeaf(const string& name,
    columnar::FieldRepetitionType::type repetition, columnar::Type::type type,
    int type_length, const LogicalAnnotation& annotation) {
  SchemaNode leaf;
  leaf.name = name;
  leaf.repetition = repetition;
  leaf.is_leaf = true;
  leaf.type = type;
  leaf.type_length = type_length;
  leaf.annotation = annotation;
  current()->children.push_back(std::move(leaf));
  return *this;
}

Status SchemaBuilder::Build(unique_ptr<Schema>* schema) {
  if (error_.empty() && !open_groups_.empty()) {
    error_ = std::to_string(open_groups_.size()) + " group(s) were not closed";
  }
  if (!error_.empty()) return Status(TErrorCode::SCHEMA_VIOLATION, root_.name, error_);
  return Schema::Create(std::move(root_), schema);
}

}
