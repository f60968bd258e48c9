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

#ifndef STRATA_EXEC_VALUE_CODEC_H
#define STRATA_EXEC_VALUE_CODEC_H

#include <cstdint>
#include <vector>

#include "common/status.h"
#include "exec/schema.h"
#include "gen-cpp/columnar_types.h"
#include "runtime/value.h"

namespace strata {

/// Returns true if values of 'type' can be stored with 'encoding'. PLAIN supports every
/// type; RLE is only used for BOOLEAN values; the dictionary encodings support every
/// type except BOOLEAN; DELTA_BINARY_PACKED supports INT32 and INT64;
/// DELTA_LENGTH_BYTE_ARRAY supports BYTE_ARRAY and DELTA_BYTE_ARRAY supports both byte
/// array types. BIT_PACKED is only valid for levels.
bool IsEncodingSupported(columnar::Encoding::type encoding, columnar::Type::type type);

/// The decoded entries of a dictionary page.
class DictionaryTable {
 public:
  /// Decodes the 'len' bytes of PLAIN encoded values at 'data', which must hold exactly
  /// 'num_entries' values of the column's type. Returns MALFORMED_ENCODING otherwise.
  Status Init(const ColumnDescriptor& desc, const uint8_t* data, int64_t len,
      int num_entries, int64_t page_offset = -1) WARN_UNUSED_RESULT;

  int num_entries() const { return values_.size(); }

  const PrimitiveValue& value(int index) const {
    DCHECK_GE(index, 0);
    DCHECK_LT(index, values_.size());
    return values_[index];
  }

 private:
  std::vector<PrimitiveValue> values_;
};

/// Encodes 'num_values' non-null values of the column described by 'desc' into 'out',
/// replacing its contents. T is the C++ type of the physical type (see PrimitiveValue).
/// Dictionary encodings are produced incrementally by DictEncoder and are rejected
/// here, like any encoding the type doesn't support, with UNSUPPORTED_ENCODING.
template <typename T>
Status EncodeValues(columnar::Encoding::type encoding, const ColumnDescriptor& desc,
    const T* values, int64_t num_values, std::vector<uint8_t>* out) WARN_UNUSED_RESULT;

/// Same as above for values held as PrimitiveValue. Values that don't match the
/// column's type fail with SCHEMA_VIOLATION.
Status EncodeValues(columnar::Encoding::type encoding, const ColumnDescriptor& desc,
    const PrimitiveValue* values, int64_t num_values, std::vector<uint8_t>* out)
    WARN_UNUSED_RESULT;

/// Dictionary encodes 'values': 'dict_data' receives the PLAIN encoded dictionary
/// entries, 'num_entries' their count and 'indices' the bit width byte followed by the
/// RLE/bit-packed hybrid indices.
Status EncodeDictionary(const ColumnDescriptor& desc, const PrimitiveValue* values,
    int64_t num_values, std::vector<uint8_t>* dict_data, int* num_entries,
    std::vector<uint8_t>* indices) WARN_UNUSED_RESULT;

/// Decodes exactly 'num_values' values from the 'len' bytes at 'data' and appends
/// them to 'out'. 'dict' is the chunk's dictionary; it is required for the dictionary
/// encodings and may be null otherwise. The whole slice must be consumed by the
/// PLAIN and DELTA encodings.
/// Returns UNSUPPORTED_ENCODING if the type can't use 'encoding', STRUCTURAL_CORRUPTION
/// if a dictionary is needed but missing and MALFORMED_ENCODING if the data is
/// inconsistent with 'num_values'. Errors include the column path and 'page_offset'.
Status DecodeValues(columnar::Encoding::type encoding, const ColumnDescriptor& desc,
    const uint8_t* data, int64_t len, int64_t num_values, const DictionaryTable* dict,
    std::vector<PrimitiveValue>* out, int64_t page_offset = -1) WARN_UNUSED_RESULT;

}

#endif
