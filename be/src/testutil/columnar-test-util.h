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

#ifndef STRATA_TESTUTIL_COLUMNAR_TEST_UTIL_H
#define STRATA_TESTUTIL_COLUMNAR_TEST_UTIL_H

#include <memory>
#include <string>
#include <vector>

#include "exec/schema.h"
#include "runtime/value.h"

namespace strata {

/// The Document schema from the Dremel paper:
///   required int64 DocId;
///   optional group Links { repeated int64 Backward; repeated int64 Forward; }
///   repeated group Name {
///     repeated group Language { required string Code; optional string Country; }
///     optional string Url; }
inline Status MakeDocumentSchema(std::unique_ptr<Schema>* schema) {
  typedef columnar::FieldRepetitionType R;
  SchemaBuilder b("Document");
  b.AddLeaf("DocId", R::REQUIRED, columnar::Type::INT64)
   .BeginGroup("Links", R::OPTIONAL)
     .AddLeaf("Backward", R::REPEATED, columnar::Type::INT64)
     .AddLeaf("Forward", R::REPEATED, columnar::Type::INT64)
   .EndGroup()
   .BeginGroup("Name", R::REPEATED)
     .BeginGroup("Language", R::REPEATED)
       .AddLeaf("Code", R::REQUIRED, columnar::Type::BYTE_ARRAY, 0,
           LogicalAnnotation::Of(columnar::ConvertedType::UTF8))
       .AddLeaf("Country", R::OPTIONAL, columnar::Type::BYTE_ARRAY, 0,
           LogicalAnnotation::Of(columnar::ConvertedType::UTF8))
     .EndGroup()
     .AddLeaf("Url", R::OPTIONAL, columnar::Type::BYTE_ARRAY, 0,
         LogicalAnnotation::Of(columnar::ConvertedType::UTF8))
   .EndGroup();
  return b.Build(schema);
}

inline Value MakeInt64List(const std::vector<int64_t>& values) {
  std::vector<Value> elements;
  for (int64_t v : values) elements.push_back(Value::Int64(v));
  return Value::List(std::move(elements));
}

/// A Language element; an empty 'country' stands for NULL.
inline Value MakeLanguage(const std::string& code, const std::string& country) {
  return Value::Group({Value::String(code),
      country.empty() ? Value::Null() : Value::String(country)});
}

/// The two records of the Dremel paper.
inline std::vector<Value> MakeDocumentRecords() {
  Value r1 = Value::Group({
      Value::Int64(10),
      Value::Group({MakeInt64List({}), MakeInt64List({20, 40, 60})}),
      Value::List({
          Value::Group({
              Value::List({MakeLanguage("en-us", "us"), MakeLanguage("en", "")}),
              Value::String("http://A")}),
          Value::Group({Value::List({}), Value::String("http://B")}),
          Value::Group({Value::List({MakeLanguage("en-gb", "gb")}), Value::Null()})})});
  Value r2 = Value::Group({
      Value::Int64(20),
      Value::Group({MakeInt64List({10, 30}), MakeInt64List({80})}),
      Value::List({Value::Group({Value::List({}), Value::String("http://C")})})});
  return {r1, r2};
}

}

#endif
