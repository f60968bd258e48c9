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
#include <random>

#include "exec/level-shredder.h"
#include "exec/record-assembler.h"
#include "testutil/columnar-test-util.h"
#include "testutil/gtest-util.h"
#include "testutil/rand-util.h"

#include "common/names.h"

namespace strata {

typedef columnar::FieldRepetitionType R;

class LevelShredderTest : public ::testing::Test {
 protected:
  virtual void SetUp() override {
    ASSERT_OK(MakeDocumentSchema(&schema_));
  }

  void ExpectLevels(const ShreddedColumn& col, const vector<int16_t>& reps,
      const vector<int16_t>& defs, const vector<PrimitiveValue>& values) {
    EXPECT_EQ(reps, col.rep_levels);
    EXPECT_EQ(defs, col.def_levels);
    ASSERT_EQ(values.size(), col.values.size());
    for (int i = 0; i < values.size(); ++i) {
      EXPECT_TRUE(PrimitiveValueEquals(values[i], col.values[i]))
          << values[i] << " vs " << col.values[i];
    }
  }

  /// Shreds 'records' and assembles them again from all columns.
  void RoundTrip(const Schema& schema, const vector<Value>& records) {
    LevelShredder shredder(schema);
    vector<ShreddedColumn> columns;
    for (const Value& record : records) ASSERT_OK(shredder.Shred(record, &columns));

    vector<unique_ptr<ShreddedColumnCursor>> cursors;
    vector<ColumnLevelCursor*> cursor_ptrs;
    for (int i = 0; i < schema.num_columns(); ++i) {
      cursors.emplace_back(new ShreddedColumnCursor(schema.column(i), &columns[i]));
      cursor_ptrs.push_back(cursors.back().get());
    }
    RecordAssembler assembler(schema);
    ASSERT_OK(assembler.Init(cursor_ptrs));
    vector<Value> result;
    ASSERT_OK(assembler.AssembleAll(&result));
    ASSERT_EQ(records.size(), result.size());
    for (int i = 0; i < records.size(); ++i) {
      EXPECT_EQ(records[i], result[i]) << records[i] << "\nvs\n" << result[i];
    }
  }

  unique_ptr<Schema> schema_;
};

static PrimitiveValue Str(const char* s) {
  return PrimitiveValue(std::in_place_type<string>, s);
}

TEST_F(LevelShredderTest, DocumentLevels) {
  LevelShredder shredder(*schema_);
  vector<ShreddedColumn> columns;
  for (const Value& record : MakeDocumentRecords()) {
    ASSERT_OK(shredder.Shred(record, &columns));
  }
  ASSERT_EQ(6, columns.size());
  ExpectLevels(columns[0], {0, 0}, {0, 0}, {int64_t(10), int64_t(20)});
  ExpectLevels(columns[1], {0, 0, 1}, {1, 2, 2}, {int64_t(10), int64_t(30)});
  ExpectLevels(columns[2], {0, 1, 1, 0}, {2, 2, 2, 2},
      {int64_t(20), int64_t(40), int64_t(60), int64_t(80)});
  ExpectLevels(columns[3], {0, 2, 1, 1, 0}, {2, 2, 1, 2, 1},
      {Str("en-us"), Str("en"), Str("en-gb")});
  ExpectLevels(columns[4], {0, 2, 1, 1, 0}, {3, 2, 1, 3, 1}, {Str("us"), Str("gb")});
  ExpectLevels(columns[5], {0, 1, 1, 0}, {2, 2, 1, 2},
      {Str("http://A"), Str("http://B"), Str("http://C")});

  ShreddedColumn url;
  ASSERT_OK(shredder.ShredColumn(MakeDocumentRecords()[0], 5, &url));
  ExpectLevels(url, {0, 1, 1}, {2, 2, 1}, {Str("http://A"), Str("http://B")});
}

TEST_F(LevelShredderTest, DocumentRoundTrip) {
  RoundTrip(*schema_, MakeDocumentRecords());
}

TEST_F(LevelShredderTest, AbsentBranches) {
  vector<Value> records;
  // Links absent, no names.
  records.push_back(Value::Group({Value::Int64(1), Value::Null(), Value::List({})}));
  // Links present with empty lists, one name with nothing in it.
  records.push_back(Value::Group({Value::Int64(2),
      Value::Group({MakeInt64List({}), MakeInt64List({})}),
      Value::List({Value::Group({Value::List({}), Value::Null()})})}));
  // Language with NULL country only.
  records.push_back(Value::Group({Value::Int64(3), Value::Null(),
      Value::List({Value::Group({Value::List({MakeLanguage("fr", "")}),
          Value::Null()})})}));
  RoundTrip(*schema_, records);

  LevelShredder shredder(*schema_);
  vector<ShreddedColumn> columns;
  ASSERT_OK(shredder.Shred(records[0], &columns));
  // One absent entry per column at the depth of the missing ancestor.
  for (int i = 1; i < 6; ++i) {
    ExpectLevels(columns[i], {0}, {0}, {});
  }
}

TEST_F(LevelShredderTest, SchemaViolations) {
  LevelShredder shredder(*schema_);
  vector<ShreddedColumn> columns;
  ASSERT_OK(shredder.Shred(MakeDocumentRecords()[0], &columns));

  vector<Value> bad_records;
  // NULL for the REQUIRED DocId.
  bad_records.push_back(Value::Group({Value::Null(), Value::Null(), Value::List({})}));
  // Wrong physical type.
  bad_records.push_back(
      Value::Group({Value::Int32(1), Value::Null(), Value::List({})}));
  // NULL instead of a list for a REPEATED group.
  bad_records.push_back(Value::Group({Value::Int64(1), Value::Null(), Value::Null()}));
  // Missing field.
  bad_records.push_back(Value::Group({Value::Int64(1), Value::Null()}));
  // A list where a group is expected.
  bad_records.push_back(
      Value::Group({Value::Int64(1), Value::List({}), Value::List({})}));
  // A primitive list element where a group is expected, after a valid element.
  bad_records.push_back(Value::Group({Value::Int64(1), Value::Null(),
      Value::List({Value::Group({Value::List({}), Value::Null()}),
          Value::String("oops")})}));
  // The record itself must be a group.
  bad_records.push_back(Value::Int64(1));

  for (const Value& record : bad_records) {
    EXPECT_ERROR(shredder.Shred(record, &columns), TErrorCode::SCHEMA_VIOLATION)
        << record;
    // Rejected records leave no partial entries behind.
    EXPECT_EQ(1, columns[0].num_entries());
    EXPECT_EQ(5, columns[3].num_entries());
    EXPECT_EQ(3, columns[5].num_entries());
  }
}

TEST_F(LevelShredderTest, FixedLenByteArrayLength) {
  SchemaBuilder b;
  b.AddLeaf("f", R::REQUIRED, columnar::Type::FIXED_LEN_BYTE_ARRAY, 4);
  unique_ptr<Schema> schema;
  ASSERT_OK(b.Build(&schema));
  LevelShredder shredder(*schema);
  vector<ShreddedColumn> columns;
  EXPECT_OK(shredder.Shred(Value::Group({Value::String("abcd")}), &columns));
  EXPECT_ERROR(shredder.Shred(Value::Group({Value::String("abc")}), &columns),
      TErrorCode::SCHEMA_VIOLATION);
}

// Random records over a schema with every repetition kind at several depths.
TEST_F(LevelShredderTest, RandomRoundTrip) {
  SchemaBuilder b;
  b.AddLeaf("a", R::OPTIONAL, columnar::Type::INT32)
   .BeginGroup("l1", R::REPEATED)
     .AddLeaf("b", R::REPEATED, columnar::Type::DOUBLE)
     .BeginGroup("o", R::OPTIONAL)
       .AddLeaf("c", R::REQUIRED, columnar::Type::BOOLEAN)
       .BeginGroup("l2", R::REPEATED)
         .AddLeaf("d", R::OPTIONAL, columnar::Type::BYTE_ARRAY)
       .EndGroup()
     .EndGroup()
   .EndGroup();
  unique_ptr<Schema> schema;
  ASSERT_OK(b.Build(&schema));

  std::mt19937 rng;
  RandTestUtil::SeedRng("LEVEL_SHREDDER_TEST_SEED", &rng);
  std::uniform_int_distribution<int> count(0, 3);
  std::bernoulli_distribution coin(0.5);
  auto maybe = [&](Value v) { return coin(rng) ? std::move(v) : Value::Null(); };

  vector<Value> records;
  for (int r = 0; r < 200; ++r) {
    vector<Value> l1;
    int n1 = count(rng);
    for (int i = 0; i < n1; ++i) {
      vector<Value> bs;
      int nb = count(rng);
      for (int j = 0; j < nb; ++j) bs.push_back(Value::Double(j * 0.5));
      vector<Value> l2;
      int n2 = count(rng);
      for (int j = 0; j < n2; ++j) {
        l2.push_back(Value::Group({maybe(Value::String(std::to_string(j)))}));
      }
      Value o = maybe(Value::Group({Value::Bool(coin(rng)), Value::List(l2)}));
      l1.push_back(Value::Group({Value::List(bs), o}));
    }
    records.push_back(Value::Group({maybe(Value::Int32(r)), Value::List(l1)}));
  }
  RoundTrip(*schema, records);
}

class RecordAssemblerTest : public LevelShredderTest {
 protected:
  /// Assembles records from 'columns' and expects STRUCTURAL_CORRUPTION.
  void ExpectCorruption(const Schema& schema, const vector<ShreddedColumn>& columns) {
    vector<unique_ptr<ShreddedColumnCursor>> cursors;
    vector<ColumnLevelCursor*> cursor_ptrs;
    for (int i = 0; i < schema.num_columns(); ++i) {
      cursors.emplace_back(new ShreddedColumnCursor(schema.column(i), &columns[i]));
      cursor_ptrs.push_back(cursors.back().get());
    }
    RecordAssembler assembler(schema);
    ASSERT_OK(assembler.Init(cursor_ptrs));
    vector<Value> result;
    EXPECT_ERROR(assembler.AssembleAll(&result), TErrorCode::STRUCTURAL_CORRUPTION);
  }

  vector<ShreddedColumn> ShredDocuments() {
    LevelShredder shredder(*schema_);
    vector<ShreddedColumn> columns;
    for (const Value& record : MakeDocumentRecords()) {
      Status status = shredder.Shred(record, &columns);
      EXPECT_OK(status);
    }
    return columns;
  }
};

TEST_F(RecordAssemblerTest, RaggedColumns) {
  // DocId has an extra record.
  vector<ShreddedColumn> columns = ShredDocuments();
  columns[0].Append(0, 0, &columns[0].values[0]);
  ExpectCorruption(*schema_, columns);

  // Url ends early.
  columns = ShredDocuments();
  columns[5].rep_levels.pop_back();
  columns[5].def_levels.pop_back();
  columns[5].values.pop_back();
  ExpectCorruption(*schema_, columns);
}

TEST_F(RecordAssemblerTest, InconsistentLevels) {
  // A record that starts with a continuation.
  vector<ShreddedColumn> columns = ShredDocuments();
  columns[5].rep_levels[0] = 1;
  ExpectCorruption(*schema_, columns);

  // A repetition level above the column's maximum.
  columns = ShredDocuments();
  columns[5].rep_levels[1] = 2;
  ExpectCorruption(*schema_, columns);

  // A definition level above the column's maximum.
  columns = ShredDocuments();
  columns[0].def_levels[0] = 1;
  ExpectCorruption(*schema_, columns);

  // Country claims that the Language list of the second name is absent while Code
  // has an element in it.
  columns = ShredDocuments();
  columns[3].def_levels[2] = 2;
  columns[3].values.insert(columns[3].values.begin() + 2, Str("xx"));
  ExpectCorruption(*schema_, columns);

  // The third Name of r1 continues the list but leaves its own element undefined.
  columns = ShredDocuments();
  ASSERT_EQ(1, columns[5].rep_levels[2]);
  columns[5].def_levels[2] = 0;
  {
    vector<unique_ptr<ShreddedColumnCursor>> cursors;
    vector<ColumnLevelCursor*> cursor_ptrs;
    for (int i = 0; i < schema_->num_columns(); ++i) {
      cursors.emplace_back(new ShreddedColumnCursor(schema_->column(i), &columns[i]));
      cursor_ptrs.push_back(cursors.back().get());
    }
    RecordAssembler assembler(*schema_);
    ASSERT_OK(assembler.Init(cursor_ptrs));
    vector<Value> result;
    Status status = assembler.AssembleAll(&result);
    EXPECT_ERROR(status, TErrorCode::STRUCTURAL_CORRUPTION);
    EXPECT_STR_CONTAINS(status.GetDetail(), "enclosing repeated element");
  }

  // A defined slot without a value.
  columns = ShredDocuments();
  columns[2].values.pop_back();
  ExpectCorruption(*schema_, columns);

  // A value without a defined slot.
  columns = ShredDocuments();
  columns[2].values.push_back(int64_t(1));
  ExpectCorruption(*schema_, columns);
}

TEST_F(RecordAssemblerTest, PrunedColumns) {
  vector<ShreddedColumn> columns = ShredDocuments();
  ShreddedColumnCursor doc_id(schema_->column(0), &columns[0]);
  ShreddedColumnCursor url(schema_->column(5), &columns[5]);
  vector<ColumnLevelCursor*> cursors(6, nullptr);
  cursors[0] = &doc_id;
  cursors[5] = &url;

  RecordAssembler assembler(*schema_);
  ASSERT_OK(assembler.Init(cursors));
  vector<Value> result;
  ASSERT_OK(assembler.AssembleAll(&result));
  ASSERT_EQ(2, result.size());

  // Links is not read at all, Language is pruned inside each Name.
  Value expected_r1 = Value::Group({Value::Int64(10), Value::Null(),
      Value::List({Value::Group({Value::Null(), Value::String("http://A")}),
          Value::Group({Value::Null(), Value::String("http://B")}),
          Value::Group({Value::Null(), Value::Null()})})});
  Value expected_r2 = Value::Group({Value::Int64(20), Value::Null(),
      Value::List({Value::Group({Value::Null(), Value::String("http://C")})})});
  EXPECT_EQ(expected_r1, result[0]) << result[0];
  EXPECT_EQ(expected_r2, result[1]) << result[1];
  EXPECT_EQ(2, assembler.num_records());

  RecordAssembler no_columns(*schema_);
  EXPECT_ERROR(no_columns.Init(vector<ColumnLevelCursor*>(6, nullptr)),
      TErrorCode::SCHEMA_VIOLATION);
  EXPECT_ERROR(no_columns.Init(vector<ColumnLevelCursor*>(2, &url)),
      TErrorCode::SCHEMA_VIOLATION);
}

}

STRATA_TEST_MAIN();
