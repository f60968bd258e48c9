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

#include "exec/columnar-common.h"

#include <map>

#include "common/names.h"

namespace strata {

int PrimitiveValueIndex(columnar::Type::type type) {
  switch (type) {
    case columnar::Type::BOOLEAN: return 0;
    case columnar::Type::INT32: return 1;
    case columnar::Type::INT64: return 2;
    case columnar::Type::INT96: return 3;
    case columnar::Type::FLOAT: return 4;
    case columnar::Type::DOUBLE: return 5;
    case columnar::Type::BYTE_ARRAY:
    case columnar::Type::FIXED_LEN_BYTE_ARRAY:
      return 6;
  }
  DCHECK(false) << "Unexpected physical type " << type;
  return -1;
}

bool PrimitiveValueMatchesType(
    const PrimitiveValue& v, columnar::Type::type type, int type_length) {
  if (v.index() != PrimitiveValueIndex(type)) return false;
  if (type == columnar::Type::FIXED_LEN_BYTE_ARRAY) {
    return std::get<string>(v).size() == static_cast<size_t>(type_length);
  }
  return true;
}

template <typename T>
static string PrintEnum(const std::map<int, const char*>& names, const T& value) {
  auto it = names.find(static_cast<int>(value));
  if (it == names.end()) return "UNKNOWN(" + std::to_string(value) + ")";
  return it->second;
}

string PrintThriftEnum(const columnar::Type::type& value) {
  return PrintEnum(columnar::_Type_VALUES_TO_NAMES, value);
}

string PrintThriftEnum(const columnar::Encoding::type& value) {
  return PrintEnum(columnar::_Encoding_VALUES_TO_NAMES, value);
}

string PrintThriftEnum(const columnar::CompressionCodec::type& value) {
  return PrintEnum(columnar::_CompressionCodec_VALUES_TO_NAMES, value);
}

string PrintThriftEnum(const columnar::FieldRepetitionType::type& value) {
  return PrintEnum(columnar::_FieldRepetitionType_VALUES_TO_NAMES, value);
}

string PrintThriftEnum(const columnar::PageType::type& value) {
  return PrintEnum(columnar::_PageType_VALUES_TO_NAMES, value);
}

string PrintThriftEnum(const columnar::ConvertedType::type& value) {
  return PrintEnum(columnar::_ConvertedType_VALUES_TO_NAMES, value);
}

}
