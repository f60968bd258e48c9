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

#include "exec/column-stats.inline.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "common/names.h"

using namespace strata::columnar;

namespace strata {

template <typename T>
bool ColumnStatsBase::DecodeValue(const string& buffer, PrimitiveValue* value) {
  T v;
  if (!ColumnStats<T>::DecodePlainValue(buffer, &v)) return false;
  *value = PrimitiveValue(std::in_place_type<T>, std::move(v));
  return true;
}

bool ColumnStatsBase::ReadFromThrift(const Statistics& stats,
    const ColumnDescriptor& desc, StatsField stats_field, PrimitiveValue* value) {
  const string* stat_value = nullptr;
  switch (stats_field) {
    case StatsField::MIN:
      if (stats.__isset.min_value) stat_value = &stats.min_value;
      break;
    case StatsField::MAX:
      if (stats.__isset.max_value) stat_value = &stats.max_value;
      break;
    default:
      DCHECK(false) << "Unsupported statistics field requested";
  }
  if (stat_value == nullptr) return false;

  switch (desc.type) {
    case Type::BOOLEAN:
      return DecodeValue<bool>(*stat_value, value);
    case Type::INT32:
      return DecodeValue<int32_t>(*stat_value, value);
    case Type::INT64:
      return DecodeValue<int64_t>(*stat_value, value);
    case Type::INT96:
      // No order is defined for INT96 values.
      return false;
    case Type::FLOAT:
      return DecodeValue<float>(*stat_value, value)
          && !std::isnan(std::get<float>(*value));
    case Type::DOUBLE:
      return DecodeValue<double>(*stat_value, value)
          && !std::isnan(std::get<double>(*value));
    case Type::FIXED_LEN_BYTE_ARRAY:
      if (stat_value->size() != desc.type_length) return false;
      return DecodeValue<string>(*stat_value, value);
    case Type::BYTE_ARRAY:
      return DecodeValue<string>(*stat_value, value);
    default:
      DCHECK(false) << PrintThriftEnum(desc.type);
  }
  return false;
}

bool ColumnStatsBase::ReadNullCountStat(const Statistics& stats, int64_t* null_count) {
  if (stats.__isset.null_count) {
    *null_count = stats.null_count;
    return true;
  }
  return false;
}

}
