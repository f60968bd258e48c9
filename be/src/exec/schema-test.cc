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

#include <memory>

#include "exec/schema.h"
#include "testutil/columnar-test-util.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

typedef columnar::FieldRepetitionType R;

TEST(SchemaTest, DocumentLevels) {
  unique_ptr<Schema> schema;
  ASSERT_OK(MakeDocumentSchema(&schema));
  ASSERT_EQ(6, schema->num_columns());

  struct Expected {
    const char* path;
    int max_rep;
    int max_def;
    int ira_def;
  };
  const Expected expected[] = {
      {"DocId", 0, 0, 0},
      {"Links.Backward", 1, 2, 0},
      {"Links.Forward", 1, 2, 0},
      {"Name.Language.Code", 2, 2, 2},
      {"Name.Language.Country", 2, 3, 2},
      {"Name.Url", 1, 2, 1},
  };
  for (int i = 0; i < 6; ++i) {
    const ColumnDescriptor& col = schema->column(i);
    EXPECT_EQ(i, col.col_idx);
    EXPECT_EQ(expected[i].path, col.path);
    EXPECT_EQ(expected[i].max_rep, col.max_rep_level) << col.path;
    EXPECT_EQ(expected[i].max_def, col.max_def_level) << col.path;
    EXPECT_EQ(expected[i].ira_def, col.def_level_of_immediate_repeated_ancestor)
        << col.path;
    EXPECT_EQ(i, schema->FindColumn(col.path));
    EXPECT_EQ(col.node, schema->FindNode(col.path));
  }
  EXPECT_EQ(vector<string>({"Name", "Language", "Country"}),
      schema->column(4).path_in_schema);
  EXPECT_EQ(-1, schema->FindColumn("Name"));
  EXPECT_EQ(-1, schema->FindColumn("Name.Missing"));

  const SchemaNode* name = schema->FindNode("Name");
  ASSERT_TRUE(name != nullptr);
  EXPECT_FALSE(name->is_leaf);
  EXPECT_EQ(3, name->first_col);
  EXPECT_EQ(3, name->num_leaves);
  EXPECT_TRUE(schema->FindNode("Name.Nope") == nullptr);
  EXPECT_EQ(6, schema->root().num_leaves);
  EXPECT_STR_CONTAINS(schema->DebugString(), "REPEATED group Language");
}

TEST(SchemaTest, FixedLenByteArray) {
  SchemaBuilder b;
  b.AddLeaf("id", R::REQUIRED, columnar::Type::FIXED_LEN_BYTE_ARRAY, 16)
   .AddLeaf("amount", R::OPTIONAL, columnar::Type::FIXED_LEN_BYTE_ARRAY, 8,
       LogicalAnnotation::Decimal(18, 2));
  unique_ptr<Schema> schema;
  ASSERT_OK(b.Build(&schema));
  EXPECT_EQ(16, schema->column(0).type_length);
  EXPECT_EQ(LogicalAnnotation::Decimal(18, 2), schema->column(1).annotation);

  SchemaBuilder bad;
  bad.AddLeaf("id", R::REQUIRED, columnar::Type::FIXED_LEN_BYTE_ARRAY, 0);
  EXPECT_ERROR(bad.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
}

TEST(SchemaTest, InvalidTrees) {
  unique_ptr<Schema> schema;
  {
    // Empty root group.
    SchemaBuilder b;
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    // Empty nested group.
    SchemaBuilder b;
    b.BeginGroup("g", R::OPTIONAL).EndGroup();
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    // Duplicate sibling names.
    SchemaBuilder b;
    b.AddLeaf("a", R::REQUIRED, columnar::Type::INT32)
     .AddLeaf("a", R::OPTIONAL, columnar::Type::INT64);
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    // Dots in names would make paths ambiguous.
    SchemaBuilder b;
    b.AddLeaf("a.b", R::REQUIRED, columnar::Type::INT32);
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    SchemaBuilder b;
    b.AddLeaf("", R::REQUIRED, columnar::Type::INT32);
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    // Unbalanced groups.
    SchemaBuilder b;
    b.BeginGroup("g", R::OPTIONAL).AddLeaf("a", R::REQUIRED, columnar::Type::INT32);
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    SchemaBuilder b;
    b.AddLeaf("a", R::REQUIRED, columnar::Type::INT32).EndGroup();
    EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    // The root must be a REQUIRED group.
    SchemaNode root;
    root.name = "leaf";
    root.is_leaf = true;
    root.type = columnar::Type::INT32;
    EXPECT_ERROR(Schema::Create(root, &schema), TErrorCode::SCHEMA_VIOLATION);
  }
  {
    SchemaNode root;
    root.name = "root";
    root.repetition = R::OPTIONAL;
    SchemaNode leaf;
    leaf.name = "a";
    leaf.is_leaf = true;
    root.children.push_back(leaf);
    EXPECT_ERROR(Schema::Create(root, &schema), TErrorCode::SCHEMA_VIOLATION);
  }
}

TEST(SchemaTest, NestingLimit) {
  SchemaBuilder b;
  for (int i = 0; i <= Schema::MAX_NESTING_DEPTH; ++i) {
    b.BeginGroup("g" + std::to_string(i), R::OPTIONAL);
  }
  b.AddLeaf("leaf", R::OPTIONAL, columnar::Type::INT32);
  for (int i = 0; i <= Schema::MAX_NESTING_DEPTH; ++i) b.EndGroup();
  unique_ptr<Schema> schema;
  EXPECT_ERROR(b.Build(&schema), TErrorCode::SCHEMA_VIOLATION);
}

}

STRATA_TEST_MAIN();
