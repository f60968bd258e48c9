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



#ifndef STRATA_UTIL_BIT_STREAM_UTILS_H
#define STRATA_UTIL_BIT_STREAM_UTILS_H

#include <string.h>
#include <cstdint>

#include "common/compiler-util.h"
#include "common/logging.h"
#include "util/bit-packing.h"
#include "util/bit-util.h"

namespace strata {

/// Writes a mix of bit-packed values and byte-aligned values (raw bytes, ULEB-128 and
/// zigzag integers) into a caller-owned buffer of fixed size. Level runs, dictionary
/// indices and the delta encodings are all produced through this class.
///
/// Bit-packed values are accumulated LSB-first in a 64 bit word that is copied out once
/// it fills up, so the buffer only holds all values after Flush().
class BitWriter {
 public:
  /// 'buffer' must hold 'buffer_len' bytes and outlive the writer.
  BitWriter(uint8_t* buffer, int buffer_len)
    : buffer_(buffer), max_bytes_(buffer_len) {
    Clear();
  }

  /// Rewinds to the start of the buffer. Previously written bytes are not zeroed.
  void Clear() {
    buffered_values_ = 0;
    byte_offset_ = 0;
    bit_offset_ = 0;
  }

  /// Bytes used so far, counting a partially filled trailing byte as a whole byte.
  int bytes_written() const { return byte_offset_ + BitUtil::Ceil(bit_offset_, 8); }
  uint8_t* buffer() const { return buffer_; }
  int buffer_len() const { return max_bytes_; }

  /// Appends the low 'num_bits' bits of 'v' (num_bits <= 64). The high bits of 'v' must
  /// be zero. Returns false if the buffer is full.
  WARN_UNUSED_RESULT bool PutValue(uint64_t v, int num_bits);

  /// Appends the 'num_bytes' low-order bytes of 'v' at the next byte
  /// boundary. Returns false if the buffer is full.
  template <typename T>
  WARN_UNUSED_RESULT bool PutAligned(T v, int num_bytes);

  /// Appends 'v' as ULEB-128 at the next byte boundary. UINT_T must be unsigned.
  template <typename UINT_T>
  WARN_UNUSED_RESULT bool PutUleb128(UINT_T v);

  /// Appends 'v' zigzag mapped and ULEB-128 encoded. INT_T must be signed.
  template <typename INT_T>
  WARN_UNUSED_RESULT bool PutZigZagInteger(INT_T v);

  /// Reserves 'num_bytes' bytes at the next byte boundary and returns a pointer to them,
  /// or nullptr if they don't fit.
  uint8_t* GetNextBytePtr(int num_bytes = 1);

  /// Copies the pending bit-packed values into the buffer. With 'align' set, the next
  /// value starts on a fresh byte.
  void Flush(bool align = false);

  static constexpr int MAX_BITWIDTH = 64;

 private:
  uint8_t* buffer_;
  int max_bytes_;

  /// Pending bit-packed values not yet copied to 'buffer_'.
  uint64_t buffered_values_;

  /// Byte position in 'buffer_' where 'buffered_values_' will be copied.
  int byte_offset_;

  /// Number of valid bits in 'buffered_values_'.
  int bit_offset_;
};

/// Reads streams produced by BitWriter. Bit-packed values are only read in batches
/// through BitPacking::UnpackValues(). A batch that ends mid-byte drops the remaining
/// bits of that byte, so batches should cover whole groups of 8 values or the tail of a
/// run.
///
/// Copies of a reader are independent cursors over the same buffer.
class BatchedBitReader {
 public:
  /// The reader does not own 'buffer'.
  BatchedBitReader(const uint8_t* buffer, int64_t buffer_len) {
    Reset(buffer, buffer_len);
  }

  BatchedBitReader() {}

  void Reset(const uint8_t* buffer, int64_t buffer_len) {
    DCHECK(buffer != nullptr);
    DCHECK_GE(buffer_len, 0);
    buffer_pos_ = buffer;
    buffer_end_ = buffer + buffer_len;
  }

  /// Unpacks up to 'num_values' values of 'bit_width' bits into 'v', which must be an
  /// unsigned type at least 'bit_width' bits wide. Returns the number unpacked, which is
  /// smaller than 'num_values' only when the buffer runs out.
  template <typename T>
  int UnpackBatch(int bit_width, int num_values, T* v);

  /// Reads 'num_bytes' bytes into the low-order bytes of 'v'. Returns false if
  /// the buffer is too short.
  template <typename T>
  WARN_UNUSED_RESULT bool GetBytes(int num_bytes, T* v);

  /// Reads a ULEB-128 integer. Returns false on truncation or when the encoding is
  /// longer than UINT_T allows.
  template <typename UINT_T>
  WARN_UNUSED_RESULT bool GetUleb128(UINT_T* v);

  /// Reads a zigzag mapped ULEB-128 integer.
  template <typename INT_T>
  WARN_UNUSED_RESULT bool GetZigZagInteger(INT_T* v);

  int64_t bytes_left() const { return buffer_end_ - buffer_pos_; }
  const uint8_t* buffer_pos() const { return buffer_pos_; }

  /// Longest ULEB-128 encoding of a T.
  template <typename T>
  static constexpr int max_vlq_byte_len() {
    return BitUtil::Ceil(sizeof(T) * 8, 7);
  }

  static const int MAX_BITWIDTH = BitPacking::MAX_BITWIDTH;

 private:
  const uint8_t* buffer_pos_ = nullptr;
  const uint8_t* buffer_end_ = nullptr;
};

}

#endif
