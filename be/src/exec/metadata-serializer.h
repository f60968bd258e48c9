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



#ifndef STRATA_EXEC_METADATA_SERIALIZER_H
#define STRATA_EXEC_METADATA_SERIALIZER_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "exec/row-group-writer.h"
#include "exec/schema.h"
#include "gen-cpp/columnar_types.h"

namespace strata {

/// Everything a file footer describes.
struct FileFooter {
  std::unique_ptr<Schema> schema;
  int64_t num_rows = 0;
  std::vector<RowGroupSummary> row_groups;
  std::map<std::string, std::string> key_value_metadata;
  std::string created_by;
};

/// Converts between the in-memory description of a file and its footer, the Thrift
/// compact encoding of a columnar::FileMetaData. The schema tree is stored flattened in
/// depth-first order, every group followed by its children.
class MetadataSerializer {
 public:
  /// Serializes the footer of a file with 'schema' and 'row_groups' into 'footer'.
  static Status SerializeFooter(const Schema& schema,
      const std::vector<RowGroupSummary>& row_groups,
      const std::map<std::string, std::string>& key_value_metadata,
      std::vector<uint8_t>* footer) WARN_UNUSED_RESULT;

  /// Parses the 'len' bytes at 'data' into 'footer'. Returns
  /// METADATA_SERIALIZATION_ERROR if the bytes are not a footer of a supported
  /// version, SCHEMA_VIOLATION if
  /// the schema can't be rebuilt and STRUCTURAL_CORRUPTION if the row groups don't
  /// fit the schema.
  static Status DeserializeFooter(const uint8_t* data, uint32_t len, FileFooter* footer)
      WARN_UNUSED_RESULT;

  static void ToThrift(const Schema& schema,
      const std::vector<RowGroupSummary>& row_groups,
      const std::map<std::string, std::string>& key_value_metadata,
      columnar::FileMetaData* file_metadata);

  static Status FromThrift(const columnar::FileMetaData& file_metadata,
      FileFooter* footer) WARN_UNUSED_RESULT;

  /// Flattens 'schema' into 'elements'.
  static void SchemaToThrift(const Schema& schema,
      std::vector<columnar::SchemaElement>* elements);

  /// Rebuilds a schema tree from its flattened 'elements'. Returns SCHEMA_VIOLATION if
  /// the elements don't form exactly one valid tree.
  static Status SchemaFromThrift(const std::vector<columnar::SchemaElement>& elements,
      std::unique_ptr<Schema>* schema) WARN_UNUSED_RESULT;

 private:
  static void NodeToThrift(const SchemaNode& node,
      std::vector<columnar::SchemaElement>* elements);

  /// Builds the subtree rooted at elements[*idx] into 'node' and advances *idx past it.
  static Status NodeFromThrift(const std::vector<columnar::SchemaElement>& elements,
      int depth, int* idx, SchemaNode* node) WARN_UNUSED_RESULT;

  /// Converts 'rg', the row group at position 'idx', checking it against 'schema'.
  static Status RowGroupFromThrift(const Schema& schema, const columnar::RowGroup& rg,
      int idx, RowGroupSummary* summary) WARN_UNUSED_RESULT;
};

}

#endif
