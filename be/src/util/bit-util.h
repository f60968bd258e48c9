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


#pragma once

#include <endian.h>

#include <climits>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "common/compiler-util.h"
#include "common/logging.h"

namespace strata {

/// Utility class to do standard bit tricks
class BitUtil {
 public:
  /// Returns the ceil of value/divisor
  constexpr static inline int64_t Ceil(int64_t value, int64_t divisor) {
    return value / divisor + (value % divisor != 0);
  }

  /// Returns 'value' rounded up to the nearest multiple of 'factor'
  constexpr static inline int64_t RoundUp(int64_t value, int64_t factor) {
    return (value + (factor - 1)) / factor * factor;
  }

  /// Returns 'value' rounded down to the nearest multiple of 'factor'
  constexpr static inline int64_t RoundDown(int64_t value, int64_t factor) {
    return (value / factor) * factor;
  }

  constexpr static inline bool IsPowerOf2(int64_t value) {
    return (value & (value - 1)) == 0;
  }

  /// Returns the rounded up number of bytes that fit the number of bits.
  constexpr static inline uint32_t RoundUpNumBytes(uint32_t bits) {
    return (bits + 7) >> 3;
  }

  /// Returns the 'num_bits' least-significant bits of 'v'.
  /// Force inlining - GCC does not always inline this into hot loops.
  static ALWAYS_INLINE uint64_t TrailingBits(uint64_t v, int num_bits) {
    if (UNLIKELY(num_bits == 0)) return 0;
    if (UNLIKELY(num_bits >= 64)) return v;
    int n = 64 - num_bits;
    return (v << n) >> n;
  }

  /// Swaps the byte order (i.e. endianess)
  static inline int64_t ByteSwap(int64_t value) { return __builtin_bswap64(value); }
  static inline uint64_t ByteSwap(uint64_t value) { return __builtin_bswap64(value); }
  static inline int32_t ByteSwap(int32_t value) { return __builtin_bswap32(value); }
  static inline uint32_t ByteSwap(uint32_t value) { return __builtin_bswap32(value); }

/// Converts to little endian format (if not already in little endian) from the
/// machine's native endian format. The on-disk format is little endian throughout.
#if __BYTE_ORDER == __LITTLE_ENDIAN
  template <typename T>
  static inline T ToLittleEndian(T value) { return value; }
  template <typename T>
  static inline T FromLittleEndian(T value) { return value; }
#else
  template <typename T>
  static inline T ToLittleEndian(T value) { return ByteSwap(value); }
  template <typename T>
  static inline T FromLittleEndian(T value) { return ByteSwap(value); }
#endif

  /// Logical right shift for signed integer types
  /// This is needed because the C >> operator does arithmetic right shift
  /// Negative shift amounts lead to undefined behavior
  template <typename T>
  constexpr static T ShiftRightLogical(T v, int shift) {
    // Conversion to unsigned ensures most significant bits always filled with 0's
    return static_cast<std::make_unsigned_t<T>>(v) >> shift;
  }

  template<typename T>
  static constexpr inline int CountLeadingZeros(T v) {
    static_assert(sizeof(T) == 4 || sizeof(T) == 8);
    // __builtin_clz() and __builtin_clzll() is undefined for 0.
    if (UNLIKELY(v == 0)) return sizeof(T) * CHAR_BIT;
    if (sizeof(T) == 4) {
      return __builtin_clz(static_cast<uint32_t>(v));
    } else {
      return __builtin_clzll(static_cast<uint64_t>(v));
    }
  }

  /// Returns floor(log2(n)), or -1 for n == 0.
  static inline int Log2Floor64(uint64_t n) {
    return n == 0 ? -1 : 63 - __builtin_clzll(n);
  }

  static inline int Log2Ceiling64(uint64_t n) {
    int floor = Log2Floor64(n);
    // Check if zero or a power of two. This pattern is recognised by gcc and optimised
    // into branch-free code.
    if (0 == (n & (n - 1))) {
      return floor;
    } else {
      return floor + 1;
    }
  }

  /// Returns the minimum number of bits needed to represent every value in
  /// [0, max_value]. Returns 0 for max_value == 0.
  static inline int NumRequiredBits(uint64_t max_value) {
    return max_value == 0 ? 0 : 64 - __builtin_clzll(max_value);
  }
};

}
