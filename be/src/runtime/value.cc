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

#include "runtime/value.h"

#include <iomanip>
#include <ostream>
#include <sstream>

#include "common/names.h"

namespace strata {

bool PrimitiveValueEquals(const PrimitiveValue& a, const PrimitiveValue& b) {
  if (a.index() != b.index()) return false;
  if (const float* fa = std::get_if<float>(&a)) {
    const float fb = std::get<float>(b);
    return memcmp(fa, &fb, sizeof(float)) == 0;
  }
  if (const double* da = std::get_if<double>(&a)) {
    const double db = std::get<double>(b);
    return memcmp(da, &db, sizeof(double)) == 0;
  }
  return a == b;
}

ostream& operator<<(ostream& os, const Int96& v) {
  std::ios_base::fmtflags flags = os.flags();
  os << "0x" << std::hex << std::setfill('0');
  for (int i = 0; i < 12; ++i) os << std::setw(2) << static_cast<int>(v.bytes[i]);
  os.flags(flags);
  return os;
}

ostream& operator<<(ostream& os, const PrimitiveValue& v) {
  switch (v.index()) {
    case 0: return os << (std::get<bool>(v) ? "true" : "false");
    case 1: return os << std::get<int32_t>(v);
    case 2: return os << std::get<int64_t>(v);
    case 3: return os << std::get<Int96>(v);
    case 4: return os << std::get<float>(v);
    case 5: return os << std::get<double>(v);
    case 6: return os << "\"" << std::get<string>(v) << "\"";
    default: return os << "<valueless>";
  }
}

bool Value::operator==(const Value& other) const {
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case NULL_VALUE: return true;
    case PRIMITIVE: return PrimitiveValueEquals(primitive_, other.primitive_);
    case GROUP:
    case LIST:
      if (children_.size() != other.children_.size()) return false;
      for (int i = 0; i < children_.size(); ++i) {
        if (children_[i] != other.children_[i]) return false;
      }
      return true;
  }
  return false;
}

string Value::DebugString() const {
  stringstream ss;
  ss << *this;
  return ss.str();
}

ostream& operator<<(ostream& os, const Value& v) {
  switch (v.kind()) {
    case Value::NULL_VALUE: return os << "NULL";
    case Value::PRIMITIVE: return os << v.primitive();
    case Value::GROUP:
    case Value::LIST: {
      const bool is_list = v.kind() == Value::LIST;
      os << (is_list ? "[" : "{");
      for (int i = 0; i < v.children().size(); ++i) {
        if (i > 0) os << ", ";
        os << v.children()[i];
      }
      return os << (is_list ? "]" : "}");
    }
  }
  return os;
}

}
