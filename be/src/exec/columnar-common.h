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


#ifndef STRATA_EXEC_COLUMNAR_COMMON_H
#define STRATA_EXEC_COLUMNAR_COMMON_H

#include <string.h>
#include <string>

#include "common/compiler-util.h"
#include "common/logging.h"
#include "gen-cpp/columnar_types.h"
#include "runtime/value.h"
#include "util/bit-util.h"

/// This file contains common elements between the columnar writer and reader.
namespace strata {

const uint8_t COLUMNAR_MAGIC[4] = {'S', 'T', 'R', '1'};
const int COLUMNAR_MAGIC_LEN = sizeof(COLUMNAR_MAGIC);
const uint32_t COLUMNAR_CURRENT_VERSION = 1;

/// Size of the footer length field that precedes the trailing magic bytes.
const int COLUMNAR_FOOTER_LEN_SIZE = sizeof(uint32_t);

/// Returns true if 'encoding' is one of the two dictionary encodings.
inline bool IsDictionaryEncoding(columnar::Encoding::type encoding) {
  return encoding == columnar::Encoding::PLAIN_DICTIONARY
      || encoding == columnar::Encoding::RLE_DICTIONARY;
}

/// Returns the index of the PrimitiveValue alternative that holds values of 'type'.
int PrimitiveValueIndex(columnar::Type::type type);

/// Returns true if 'v' holds the alternative for 'type'. For FIXED_LEN_BYTE_ARRAY,
/// 'type_length' must also match the string length.
bool PrimitiveValueMatchesType(
    const PrimitiveValue& v, columnar::Type::type type, int type_length);

/// Returns the name of a thrift enum value, e.g. PrintThriftEnum(Encoding::PLAIN)
/// returns "PLAIN".
std::string PrintThriftEnum(const columnar::Type::type& value);
std::string PrintThriftEnum(const columnar::Encoding::type& value);
std::string PrintThriftEnum(const columnar::CompressionCodec::type& value);
std::string PrintThriftEnum(const columnar::FieldRepetitionType::type& value);
std::string PrintThriftEnum(const columnar::PageType::type& value);
std::string PrintThriftEnum(const columnar::ConvertedType::type& value);

/// The plain encoding does not maintain any state so all these functions
/// are static helpers. Values are written little endian with their natural width.
/// BYTE_ARRAY values carry a 4 byte little endian length prefix; FIXED_LEN_BYTE_ARRAY
/// values are written as 'fixed_len_size' raw bytes. Booleans are bit-packed and are
/// handled by the value codec, not here.
class ColumnarPlainEncoder {
 public:
  /// Returns the encoded byte size of 'v'. 'fixed_len_size' is only applicable to
  /// FIXED_LEN_BYTE_ARRAY and is <= 0 otherwise.
  template <typename T>
  static int ByteSize(const T& v, int fixed_len_size) { return sizeof(T); }

  /// Returns the encoded size of values of 'type', or -1 if it is variable length.
  static int EncodedByteSize(columnar::Type::type type, int type_length) {
    switch (type) {
      case columnar::Type::INT32:
      case columnar::Type::FLOAT:
        return 4;
      case columnar::Type::INT64:
      case columnar::Type::DOUBLE:
        return 8;
      case columnar::Type::INT96:
        return 12;
      case columnar::Type::FIXED_LEN_BYTE_ARRAY:
        return type_length;
      case columnar::Type::BYTE_ARRAY:
        return -1;
      case columnar::Type::BOOLEAN: // Booleans are bit-packed.
      default:
        DCHECK(false);
        return -1;
    }
  }

  /// Encodes 'v' into 'buffer'. Returns the number of bytes added. 'buffer' must
  /// be preallocated and big enough. Buffer need not be aligned.
  template <typename T>
  static int Encode(const T& v, int fixed_len_size, uint8_t* buffer) {
    memcpy(buffer, &v, sizeof(T));
    return sizeof(T);
  }

  /// Decodes 'v' from 'buffer', reading up to the byte before 'buffer_end'. 'buffer'
  /// need not be aligned. If TYPE is FIXED_LEN_BYTE_ARRAY then 'fixed_len_size'
  /// is the size of the object. Otherwise, it is unused.
  /// Returns the number of bytes read or -1 if the value was not decoded successfully.
  template <typename T, columnar::Type::type TYPE>
  static int Decode(const uint8_t* buffer, const uint8_t* buffer_end, int fixed_len_size,
      T* v) {
    if (UNLIKELY(buffer_end - buffer < static_cast<int64_t>(sizeof(T)))) return -1;
    memcpy(v, buffer, sizeof(T));
    return sizeof(T);
  }
};

/// Disable for bools. Plain encoding of single booleans is not used.
template <> int ColumnarPlainEncoder::ByteSize(const bool& b, int fixed_len_size);
template <> int ColumnarPlainEncoder::Encode(const bool&, int fixed_len_size, uint8_t*);

template <>
inline int ColumnarPlainEncoder::ByteSize(const std::string& v, int fixed_len_size) {
  if (fixed_len_size > 0) return fixed_len_size;
  return sizeof(int32_t) + v.size();
}

template <>
inline int ColumnarPlainEncoder::Encode(
    const std::string& v, int fixed_len_size, uint8_t* buffer) {
  if (fixed_len_size > 0) {
    DCHECK_EQ(v.size(), fixed_len_size);
    memcpy(buffer, v.data(), fixed_len_size);
    return fixed_len_size;
  }
  const int32_t len = BitUtil::ToLittleEndian(static_cast<int32_t>(v.size()));
  memcpy(buffer, &len, sizeof(int32_t));
  memcpy(buffer + sizeof(int32_t), v.data(), v.size());
  return sizeof(int32_t) + v.size();
}

template <>
inline int ColumnarPlainEncoder::Decode<std::string, columnar::Type::BYTE_ARRAY>(
    const uint8_t* buffer, const uint8_t* buffer_end, int fixed_len_size,
    std::string* v) {
  if (UNLIKELY(buffer_end - buffer < static_cast<int64_t>(sizeof(int32_t)))) return -1;
  int32_t len;
  memcpy(&len, buffer, sizeof(int32_t));
  len = BitUtil::FromLittleEndian(len);
  if (UNLIKELY(len < 0 || buffer_end - buffer - sizeof(int32_t) < len)) return -1;
  v->assign(reinterpret_cast<const char*>(buffer) + sizeof(int32_t), len);
  return sizeof(int32_t) + len;
}

template <>
inline int ColumnarPlainEncoder::Decode<std::string,
    columnar::Type::FIXED_LEN_BYTE_ARRAY>(const uint8_t* buffer,
    const uint8_t* buffer_end, int fixed_len_size, std::string* v) {
  if (UNLIKELY(fixed_len_size < 0 || buffer_end - buffer < fixed_len_size)) return -1;
  v->assign(reinterpret_cast<const char*>(buffer), fixed_len_size);
  return fixed_len_size;
}

}

#endif
