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



#ifndef STRATA_UTIL_BIT_STREAM_UTILS_INLINE_H
#define STRATA_UTIL_BIT_STREAM_UTILS_INLINE_H

#include "util/bit-stream-utils.h"

#include <limits>
#include <tuple>
#include <type_traits>

#include "util/bit-packing.inline.h"

namespace strata {

inline bool BitWriter::PutValue(uint64_t v, int num_bits) {
  DCHECK_LE(num_bits, MAX_BITWIDTH);
  DCHECK(num_bits == MAX_BITWIDTH || v >> num_bits == 0)
      << "v = " << v << ", num_bits = " << num_bits;
  int64_t total_bits = static_cast<int64_t>(byte_offset_) * 8 + bit_offset_ + num_bits;
  if (UNLIKELY(total_bits > static_cast<int64_t>(max_bytes_) * 8)) return false;

  buffered_values_ |= v << bit_offset_;
  bit_offset_ += num_bits;
  if (LIKELY(bit_offset_ < 64)) return true;

  // The word is full: copy it out and keep the bits of 'v' that spilled over.
  memcpy(buffer_ + byte_offset_, &buffered_values_, sizeof(buffered_values_));
  byte_offset_ += sizeof(buffered_values_);
  bit_offset_ -= 64;
  int consumed = num_bits - bit_offset_;
  buffered_values_ = consumed == 64 ? 0 : v >> consumed;
  return true;
}

inline void BitWriter::Flush(bool align) {
  int pending_bytes = BitUtil::Ceil(bit_offset_, 8);
  DCHECK_LE(byte_offset_ + pending_bytes, max_bytes_);
  memcpy(buffer_ + byte_offset_, &buffered_values_, pending_bytes);
  if (!align) return;
  byte_offset_ += pending_bytes;
  buffered_values_ = 0;
  bit_offset_ = 0;
}

inline uint8_t* BitWriter::GetNextBytePtr(int num_bytes) {
  Flush(true);
  if (byte_offset_ + num_bytes > max_bytes_) return nullptr;
  uint8_t* result = buffer_ + byte_offset_;
  byte_offset_ += num_bytes;
  return result;
}

template <typename T>
inline bool BitWriter::PutAligned(T v, int num_bytes) {
  DCHECK_LE(num_bytes, sizeof(T));
  uint8_t* dst = GetNextBytePtr(num_bytes);
  if (dst == nullptr) return false;
  memcpy(dst, &v, num_bytes);
  return true;
}

template <typename UINT_T>
inline bool BitWriter::PutUleb128(UINT_T v) {
  static_assert(std::is_unsigned<UINT_T>::value && !std::is_same<UINT_T, bool>::value,
      "ULEB-128 needs an unsigned integer type");
  do {
    uint8_t byte = v & 0x7F;
    v >>= 7;
    if (v != 0) byte |= 0x80;
    if (!PutAligned<uint8_t>(byte, 1)) return false;
  } while (v != 0);
  return true;
}

template <typename INT_T>
inline bool BitWriter::PutZigZagInteger(INT_T v) {
  static_assert(std::is_signed<INT_T>::value, "zigzag needs a signed integer type");
  using UINT_T = std::make_unsigned_t<INT_T>;
  // Shift the unsigned bit pattern left; the arithmetic right shift of 'v' yields all
  // ones for negative values.
  UINT_T bits = static_cast<UINT_T>(v);
  UINT_T sign = static_cast<UINT_T>(v >> (sizeof(INT_T) * 8 - 1));
  return PutUleb128<UINT_T>((bits << 1) ^ sign);
}

template <typename T>
inline int BatchedBitReader::UnpackBatch(int bit_width, int num_values, T* v) {
  DCHECK(buffer_pos_ != nullptr);
  DCHECK_GE(bit_width, 0);
  DCHECK_LE(bit_width, sizeof(T) * 8);
  DCHECK_GE(num_values, 0);
  int64_t num_unpacked;
  std::tie(buffer_pos_, num_unpacked) = BitPacking::UnpackValues(
      bit_width, buffer_pos_, bytes_left(), num_values, v);
  DCHECK_LE(buffer_pos_, buffer_end_);
  return static_cast<int>(num_unpacked);
}

template <typename T>
inline bool BatchedBitReader::GetBytes(int num_bytes, T* v) {
  DCHECK(buffer_pos_ != nullptr);
  DCHECK_LE(num_bytes, sizeof(T));
  if (UNLIKELY(num_bytes > bytes_left())) return false;
  *v = 0;
  // A zero byte read may happen at the very end of the buffer.
  if (num_bytes == 0) return true;
  memcpy(v, buffer_pos_, num_bytes);
  buffer_pos_ += num_bytes;
  return true;
}

template <typename UINT_T>
inline bool BatchedBitReader::GetUleb128(UINT_T* v) {
  static_assert(std::is_unsigned<UINT_T>::value && !std::is_same<UINT_T, bool>::value,
      "ULEB-128 needs an unsigned integer type");
  constexpr int MAX_LEN = max_vlq_byte_len<UINT_T>();
  UINT_T result = 0;
  for (int i = 0; i < MAX_LEN; ++i) {
    if (UNLIKELY(buffer_pos_ == buffer_end_)) return false;
    uint8_t byte = *buffer_pos_++;
    result |= static_cast<UINT_T>(byte & 0x7F) << (7 * i);
    if ((byte & 0x80) == 0) {
      *v = result;
      return true;
    }
  }
  return false;
}

template <typename INT_T>
inline bool BatchedBitReader::GetZigZagInteger(INT_T* v) {
  static_assert(std::is_signed<INT_T>::value, "zigzag needs a signed integer type");
  using UINT_T = std::make_unsigned_t<INT_T>;
  UINT_T zigzag;
  if (UNLIKELY(!GetUleb128<UINT_T>(&zigzag))) return false;
  *v = static_cast<INT_T>((zigzag >> 1) ^ (~(zigzag & 1) + 1));
  return true;
}

}

#endif
