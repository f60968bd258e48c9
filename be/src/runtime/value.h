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


#ifndef STRATA_RUNTIME_VALUE_H
#define STRATA_RUNTIME_VALUE_H

#include <string.h>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "common/logging.h"

namespace strata {

/// Raw 12 byte value of an INT96 column. The bytes are opaque to the storage engine.
struct Int96 {
  uint8_t bytes[12];

  Int96() { memset(bytes, 0, sizeof(bytes)); }

  bool operator==(const Int96& other) const {
    return memcmp(bytes, other.bytes, sizeof(bytes)) == 0;
  }
  bool operator!=(const Int96& other) const { return !(*this == other); }
};

/// One primitive value of any physical type. The alternative used for each physical
/// type is:
///   BOOLEAN -> bool, INT32 -> int32_t, INT64 -> int64_t, INT96 -> Int96,
///   FLOAT -> float, DOUBLE -> double, BYTE_ARRAY/FIXED_LEN_BYTE_ARRAY -> std::string.
typedef std::variant<bool, int32_t, int64_t, Int96, float, double, std::string>
    PrimitiveValue;

/// Compares two primitive values for identity. Floating point values are compared by
/// their bit patterns, so NaN equals NaN and 0.0 differs from -0.0.
bool PrimitiveValueEquals(const PrimitiveValue& a, const PrimitiveValue& b);

std::ostream& operator<<(std::ostream& os, const PrimitiveValue& v);
std::ostream& operator<<(std::ostream& os, const Int96& v);

/// In-memory representation of one node of a logical (nested) record. A record is a
/// GROUP value for the schema root. The shape of a value follows its schema node:
///  - a REPEATED node is a LIST whose elements have the shape of the node itself,
///  - an OPTIONAL node may be NULL,
///  - a group node is a GROUP with one child per schema child, in schema order,
///  - a leaf is a PRIMITIVE.
class Value {
 public:
  enum Kind { NULL_VALUE, PRIMITIVE, GROUP, LIST };

  Value() : kind_(NULL_VALUE) {}

  static Value Null() { return Value(); }

  static Value Primitive(PrimitiveValue v) {
    Value result;
    result.kind_ = PRIMITIVE;
    result.primitive_ = std::move(v);
    return result;
  }

  static Value Bool(bool v) { return Primitive(PrimitiveValue(v)); }
  static Value Int32(int32_t v) { return Primitive(PrimitiveValue(v)); }
  static Value Int64(int64_t v) { return Primitive(PrimitiveValue(v)); }
  static Value Float(float v) { return Primitive(PrimitiveValue(v)); }
  static Value Double(double v) { return Primitive(PrimitiveValue(v)); }
  static Value String(std::string v) {
    return Primitive(PrimitiveValue(std::in_place_type<std::string>, std::move(v)));
  }

  static Value Group(std::vector<Value> children) {
    Value result;
    result.kind_ = GROUP;
    result.children_ = std::move(children);
    return result;
  }

  static Value List(std::vector<Value> elements) {
    Value result;
    result.kind_ = LIST;
    result.children_ = std::move(elements);
    return result;
  }

  Kind kind() const { return kind_; }
  bool is_null() const { return kind_ == NULL_VALUE; }

  const PrimitiveValue& primitive() const {
    DCHECK_EQ(kind_, PRIMITIVE);
    return primitive_;
  }

  /// Children of a GROUP or elements of a LIST.
  const std::vector<Value>& children() const {
    DCHECK(kind_ == GROUP || kind_ == LIST);
    return children_;
  }
  std::vector<Value>* mutable_children() {
    DCHECK(kind_ == GROUP || kind_ == LIST);
    return &children_;
  }

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

  std::string DebugString() const;

 private:
  Kind kind_;
  PrimitiveValue primitive_;
  std::vector<Value> children_;
};

std::ostream& operator<<(std::ostream& os, const Value& v);

}

#endif
