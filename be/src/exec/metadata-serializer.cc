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

#include "exec/metadata-serializer.h"

#include <sstream>

#include <boost/algorithm/string/join.hpp>

#include "common/logging.h"
#include "common/version.h"
#include "exec/columnar-common.h"
#include "util/thrift-util.h"

#include "common/names.h"

using namespace strata::columnar;

namespace strata {

void MetadataSerializer::NodeToThrift(const SchemaNode& node,
    vector<SchemaElement>* elements) {
  elements->emplace_back();
  SchemaElement& element = elements->back();
  element.name = node.name;
  element.__set_repetition_type(node.repetition);
  if (node.is_leaf) {
    element.__set_type(node.type);
    if (node.type == Type::FIXED_LEN_BYTE_ARRAY) {
      element.__set_type_length(node.type_length);
    }
    const LogicalAnnotation& annotation = node.annotation;
    if (annotation.has_converted_type) {
      element.__set_converted_type(annotation.converted_type);
      if (annotation.converted_type == ConvertedType::DECIMAL) {
        element.__set_scale(annotation.scale);
        element.__set_precision(annotation.precision);
      }
    }
    return;
  }
  element.__set_num_children(node.children.size());
  for (const SchemaNode& child : node.children) NodeToThrift(child, elements);
}

void MetadataSerializer::SchemaToThrift(const Schema& schema,
    vector<SchemaElement>* elements) {
  elements->clear();
  NodeToThrift(schema.root(), elements);
}

Status MetadataSerializer::NodeFromThrift(const vector<SchemaElement>& elements,
    int depth, int* idx, SchemaNode* node) {
  if (*idx >= elements.size()) {
    return Status(TErrorCode::SCHEMA_VIOLATION, node->name.empty() ? "<root>" :
        node->name, "could not reconstruct schema tree from flattened schema");
  }
  const SchemaElement& element = elements[*idx];
  ++(*idx);
  if (depth > Schema::MAX_NESTING_DEPTH) {
    return Status(TErrorCode::SCHEMA_VIOLATION, element.name,
        "schema is nested too deeply");
  }
  node->name = element.name;
  if (element.__isset.repetition_type) node->repetition = element.repetition_type;

  int num_children = element.__isset.num_children ? element.num_children : 0;
  if (num_children < 0 || num_children > elements.size() - *idx) {
    stringstream ss;
    ss << "schema element has " << num_children << " children but only "
       << elements.size() - *idx << " elements follow";
    return Status(TErrorCode::SCHEMA_VIOLATION, element.name, ss.str());
  }
  if (num_children == 0) {
    if (!element.__isset.type) {
      return Status(TErrorCode::SCHEMA_VIOLATION, element.name,
          "leaf schema element has no type");
    }
    node->is_leaf = true;
    node->type = element.type;
    node->type_length = element.__isset.type_length ? element.type_length : 0;
    if (element.__isset.converted_type) {
      node->annotation = LogicalAnnotation::Of(element.converted_type);
      node->annotation.scale = element.__isset.scale ? element.scale : 0;
      node->annotation.precision = element.__isset.precision ? element.precision : 0;
    }
    return Status::OK();
  }
  node->children.resize(num_children);
  for (int i = 0; i < num_children; ++i) {
    RETURN_IF_ERROR(NodeFromThrift(elements, depth + 1, idx, &node->children[i]));
  }
  return Status::OK();
}

Status MetadataSerializer::SchemaFromThrift(const vector<SchemaElement>& elements,
    unique_ptr<Schema>* schema) {
  SchemaNode root;
  int idx = 0;
  RETURN_IF_ERROR(NodeFromThrift(elements, 0, &idx, &root));
  if (idx != elements.size()) {
    stringstream ss;
    ss << elements.size() - idx << " schema elements are not part of the tree";
    return Status(TErrorCode::SCHEMA_VIOLATION, root.name, ss.str());
  }
  return Schema::Create(move(root), schema);
}

void MetadataSerializer::ToThrift(const Schema& schema,
    const vector<RowGroupSummary>& row_groups,
    const map<string, string>& key_value_metadata, FileMetaData* file_metadata) {
  file_metadata->version = COLUMNAR_CURRENT_VERSION;
  SchemaToThrift(schema, &file_metadata->schema);
  file_metadata->num_rows = 0;
  file_metadata->row_groups.clear();
  for (const RowGroupSummary& summary : row_groups) {
    RowGroup rg;
    rg.num_rows = summary.num_rows;
    rg.total_byte_size = summary.total_byte_size;
    rg.__set_file_offset(summary.file_offset);
    rg.__set_ordinal(summary.ordinal);
    for (const ColumnChunkSummary& chunk : summary.columns) {
      ColumnChunk column;
      column.file_offset = chunk.file_offset;
      column.meta_data = chunk.meta_data;
      rg.columns.push_back(move(column));
    }
    file_metadata->num_rows += summary.num_rows;
    file_metadata->row_groups.push_back(move(rg));
  }
  if (!key_value_metadata.empty()) {
    vector<KeyValue> kvs;
    for (const auto& entry : key_value_metadata) {
      KeyValue kv;
      kv.key = entry.first;
      kv.__set_value(entry.second);
      kvs.push_back(move(kv));
    }
    file_metadata->__set_key_value_metadata(move(kvs));
  }
  file_metadata->__set_created_by(Version::CREATED_BY);
}

Status MetadataSerializer::RowGroupFromThrift(const Schema& schema, const RowGroup& rg,
    int idx, RowGroupSummary* summary) {
  if (rg.columns.size() != schema.num_columns()) {
    stringstream ss;
    ss << "row group " << idx << " has " << rg.columns.size()
       << " column chunks but the schema has " << schema.num_columns() << " columns";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "footer", ss.str());
  }
  if (rg.num_rows < 0) {
    stringstream ss;
    ss << "row group " << idx << " has " << rg.num_rows << " rows";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "footer", ss.str());
  }
  summary->num_rows = rg.num_rows;
  summary->total_byte_size = rg.total_byte_size;
  summary->ordinal = rg.__isset.ordinal ? rg.ordinal : idx;
  summary->file_offset = rg.__isset.file_offset ? rg.file_offset : -1;
  summary->columns.resize(rg.columns.size());
  for (int i = 0; i < rg.columns.size(); ++i) {
    const ColumnChunk& column = rg.columns[i];
    const ColumnDescriptor& desc = schema.column(i);
    string path = boost::algorithm::join(column.meta_data.path_in_schema, ".");
    if (path != desc.path) {
      stringstream ss;
      ss << "chunk " << i << " of row group " << idx << " belongs to '" << path << "'";
      return Status(TErrorCode::STRUCTURAL_CORRUPTION, desc.path, ss.str());
    }
    ColumnChunkSummary& chunk = summary->columns[i];
    chunk.col_idx = i;
    chunk.path = desc.path;
    chunk.file_offset = column.file_offset;
    chunk.num_rows = rg.num_rows;
    chunk.meta_data = column.meta_data;
  }
  return Status::OK();
}

Status MetadataSerializer::FromThrift(const FileMetaData& file_metadata,
    FileFooter* footer) {
  if (file_metadata.version > COLUMNAR_CURRENT_VERSION) {
    stringstream ss;
    ss << "unsupported version " << file_metadata.version;
    return Status(TErrorCode::METADATA_SERIALIZATION_ERROR, "deserialize", ss.str());
  }
  RETURN_IF_ERROR(SchemaFromThrift(file_metadata.schema, &footer->schema));
  footer->row_groups.resize(file_metadata.row_groups.size());
  int64_t num_rows = 0;
  for (int i = 0; i < file_metadata.row_groups.size(); ++i) {
    RETURN_IF_ERROR(RowGroupFromThrift(*footer->schema, file_metadata.row_groups[i], i,
        &footer->row_groups[i]));
    num_rows += footer->row_groups[i].num_rows;
  }
  if (num_rows != file_metadata.num_rows) {
    stringstream ss;
    ss << "file metadata states there are " << file_metadata.num_rows
       << " rows, but the row groups have " << num_rows;
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, "footer", ss.str());
  }
  footer->num_rows = num_rows;
  footer->key_value_metadata.clear();
  for (const KeyValue& kv : file_metadata.key_value_metadata) {
    footer->key_value_metadata[kv.key] = kv.value;
  }
  footer->created_by = file_metadata.created_by;
  return Status::OK();
}

Status MetadataSerializer::SerializeFooter(const Schema& schema,
    const vector<RowGroupSummary>& row_groups,
    const map<string, string>& key_value_metadata, vector<uint8_t>* footer) {
  FileMetaData file_metadata;
  ToThrift(schema, row_groups, key_value_metadata, &file_metadata);
  ThriftSerializer serializer;
  RETURN_IF_ERROR(serializer.SerializeToVector(&file_metadata, footer));
  VLOG_FILE << "Serialized footer: " << row_groups.size() << " row groups, "
            << file_metadata.num_rows << " rows, " << footer->size() << " bytes";
  return Status::OK();
}

Status MetadataSerializer::DeserializeFooter(const uint8_t* data, uint32_t len,
    FileFooter* footer) {
  FileMetaData file_metadata;
  uint32_t msg_len = len;
  RETURN_IF_ERROR(DeserializeThriftMsg(data, &msg_len, &file_metadata));
  if (msg_len != len) {
    stringstream ss;
    ss << len - msg_len << " trailing bytes after the file metadata";
    return Status(TErrorCode::METADATA_SERIALIZATION_ERROR, "deserialize", ss.str());
  }
  return FromThrift(file_metadata, footer);
}

}
