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


#ifndef STRATA_UTIL_DELTA_ENCODING_H
#define STRATA_UTIL_DELTA_ENCODING_H

#include <string.h>
#include <algorithm>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

#include "common/compiler-util.h"
#include "common/logging.h"
#include "util/bit-stream-utils.inline.h"
#include "util/bit-util.h"

namespace strata {

/// Delta encodings for integer and byte array columns.
///
/// DELTA_BINARY_PACKED:
///   stream := header block*
///   header := uleb(block_size) uleb(num_miniblocks) uleb(total_values)
///             zigzag(first_value)
///   block  := zigzag(min_delta) <num_miniblocks bit width bytes> miniblock*
/// Each miniblock holds (block_size / num_miniblocks) values, each being
/// (delta - min_delta) bit-packed with the miniblock's bit width. The last used
/// miniblock of the last block is padded with zeros; trailing unused miniblocks have a
/// bit width of 0 and no data. The first value is stored in the header, so a stream
/// with zero or one value has no blocks. Deltas are computed with wrapping arithmetic
/// in the unsigned domain of T.
///
/// DELTA_LENGTH_BYTE_ARRAY: the value lengths DELTA_BINARY_PACKED, followed by the
/// concatenated value bytes.
///
/// DELTA_BYTE_ARRAY: for each value, the length of the prefix it shares with the
/// previous value, DELTA_BINARY_PACKED, followed by the remaining suffixes encoded as
/// DELTA_LENGTH_BYTE_ARRAY.

/// Encoder for DELTA_BINARY_PACKED. T must be int32_t or int64_t.
template <typename T>
class DeltaBitPackEncoder {
 public:
  static constexpr int BLOCK_SIZE = 128;
  static constexpr int NUM_MINIBLOCKS = 4;
  static constexpr int MINIBLOCK_SIZE = BLOCK_SIZE / NUM_MINIBLOCKS;

  DeltaBitPackEncoder() { Clear(); }

  void Put(T value);

  /// Appends the encoding of all values added since the last Clear() to 'out' and
  /// clears the encoder.
  void FlushValues(std::vector<uint8_t>* out);

  /// Resets all the state in the encoder.
  void Clear() {
    total_values_ = 0;
    first_value_ = 0;
    last_value_ = 0;
    num_deltas_ = 0;
    blocks_.clear();
  }

  int64_t num_values() const { return total_values_; }

  /// Upper bound of the encoded size of 'num_values' values.
  static int64_t MaxBufferSize(int64_t num_values) {
    const int64_t num_blocks = BitUtil::Ceil(num_values, BLOCK_SIZE);
    const int64_t block_header = MAX_ZIGZAG_LEN + NUM_MINIBLOCKS;
    return MAX_HEADER_LEN + num_blocks * (block_header + BLOCK_SIZE * sizeof(T));
  }

 private:
  typedef std::make_unsigned_t<T> UT;

  static constexpr int MAX_ZIGZAG_LEN = BatchedBitReader::max_vlq_byte_len<uint64_t>();
  static constexpr int MAX_HEADER_LEN = 4 * MAX_ZIGZAG_LEN;

  /// Encodes the buffered deltas as one block and appends it to 'blocks_'.
  void FlushBlock();

  int64_t total_values_;
  T first_value_;
  T last_value_;

  /// Deltas of the current block.
  T deltas_[BLOCK_SIZE];
  int num_deltas_;

  /// Encoded blocks. The header can only be written once the total count is known.
  std::vector<uint8_t> blocks_;
};

/// Decoder for DELTA_BINARY_PACKED. T must be int32_t or int64_t. The input buffer
/// must be valid as long as this object is.
template <typename T>
class DeltaBitPackDecoder {
 public:
  DeltaBitPackDecoder() {}

  /// Reads the stream header. Returns false if the header is truncated or invalid, or
  /// if the buffer is too short to hold the blocks for the value count it announces.
  bool Init(const uint8_t* buffer, int64_t buffer_len) WARN_UNUSED_RESULT;

  /// Total number of values in the stream.
  int64_t total_values() const { return total_values_; }

  /// Number of values not yet returned by GetValues().
  int64_t values_left() const { return total_values_ - values_read_; }

  /// Decodes the next 'count' values into 'values'. Returns false if the stream holds
  /// fewer than 'count' more values or is malformed.
  bool GetValues(int64_t count, T* values) WARN_UNUSED_RESULT;

  /// Position of the first byte after the encoded stream. Only valid once all values
  /// have been decoded.
  const uint8_t* buffer_pos() const {
    DCHECK_EQ(values_left(), 0);
    return reader_.buffer_pos();
  }

 private:
  typedef std::make_unsigned_t<T> UT;

  /// Upper bound on the miniblock size accepted from the header.
  static constexpr int64_t MAX_MINIBLOCK_SIZE = 4096;

  /// Reads the header of the next block.
  bool InitBlock();

  /// Unpacks the values of the next miniblock into 'miniblock_values_'.
  bool InitMiniBlock();

  BatchedBitReader reader_;

  int64_t block_size_ = 0;
  int64_t num_miniblocks_ = 0;
  int64_t miniblock_size_ = 0;
  int64_t total_values_ = 0;
  int64_t values_read_ = 0;

  T last_value_ = 0;
  T min_delta_ = 0;

  /// Bit widths of the miniblocks of the current block.
  std::vector<uint8_t> bit_widths_;
  int64_t miniblock_idx_ = 0;

  /// Values left in the current block, not counting unpacked ones.
  int64_t values_left_in_block_ = 0;

  std::vector<UT> miniblock_values_;
  int64_t miniblock_pos_ = 0;
  int64_t miniblock_len_ = 0;
};

/// Encoder for DELTA_LENGTH_BYTE_ARRAY.
class DeltaLengthByteArrayEncoder {
 public:
  void Put(const std::string& value) {
    lengths_.Put(value.size());
    data_.append(value);
  }

  /// Appends the encoding of all values added since the last Clear() to 'out' and
  /// clears the encoder.
  void FlushValues(std::vector<uint8_t>* out) {
    lengths_.FlushValues(out);
    out->insert(out->end(), data_.begin(), data_.end());
    Clear();
  }

  void Clear() {
    lengths_.Clear();
    data_.clear();
  }

  int64_t num_values() const { return lengths_.num_values(); }

 private:
  DeltaBitPackEncoder<int32_t> lengths_;
  std::string data_;
};

/// Decoder for DELTA_LENGTH_BYTE_ARRAY.
class DeltaLengthByteArrayDecoder {
 public:
  /// Decodes all lengths up front. Returns false if the stream does not hold exactly
  /// 'num_values' values, if the lengths are malformed or if the buffer is too short
  /// for the values they describe.
  bool Init(const uint8_t* buffer, int64_t buffer_len, int64_t num_values)
      WARN_UNUSED_RESULT;

  int64_t total_values() const { return lengths_.size(); }

  /// Decodes the next 'count' values. Returns false if fewer remain.
  bool GetValues(int64_t count, std::string* values) WARN_UNUSED_RESULT;

  /// Position of the first byte after the value data.
  const uint8_t* buffer_end() const { return data_end_; }

 private:
  std::vector<int32_t> lengths_;
  int64_t next_idx_ = 0;
  const uint8_t* data_ = nullptr;
  const uint8_t* data_end_ = nullptr;
};

/// Encoder for DELTA_BYTE_ARRAY.
class DeltaByteArrayEncoder {
 public:
  void Put(const std::string& value) {
    const size_t max_prefix = std::min(value.size(), last_value_.size());
    size_t prefix = 0;
    while (prefix < max_prefix && value[prefix] == last_value_[prefix]) ++prefix;
    prefix_lengths_.Put(prefix);
    suffixes_.Put(value.substr(prefix));
    last_value_ = value;
  }

  void FlushValues(std::vector<uint8_t>* out) {
    prefix_lengths_.FlushValues(out);
    suffixes_.FlushValues(out);
    Clear();
  }

  void Clear() {
    prefix_lengths_.Clear();
    suffixes_.Clear();
    last_value_.clear();
  }

  int64_t num_values() const { return prefix_lengths_.num_values(); }

 private:
  DeltaBitPackEncoder<int32_t> prefix_lengths_;
  DeltaLengthByteArrayEncoder suffixes_;
  std::string last_value_;
};

/// Decoder for DELTA_BYTE_ARRAY.
class DeltaByteArrayDecoder {
 public:
  /// Returns false if the stream does not hold exactly 'num_values' values or is
  /// malformed.
  bool Init(const uint8_t* buffer, int64_t buffer_len, int64_t num_values)
      WARN_UNUSED_RESULT;

  int64_t total_values() const { return prefix_lengths_.size(); }

  /// Decodes the next 'count' values. Returns false if fewer remain or a prefix is
  /// longer than the previous value.
  bool GetValues(int64_t count, std::string* values) WARN_UNUSED_RESULT;

  const uint8_t* buffer_end() const { return suffixes_.buffer_end(); }

 private:
  std::vector<int32_t> prefix_lengths_;
  DeltaLengthByteArrayDecoder suffixes_;
  int64_t next_idx_ = 0;
  std::string last_value_;
};

template <typename T>
inline void DeltaBitPackEncoder<T>::Put(T value) {
  if (total_values_++ == 0) {
    first_value_ = value;
    last_value_ = value;
    return;
  }
  deltas_[num_deltas_++] = static_cast<T>(
      static_cast<UT>(value) - static_cast<UT>(last_value_));
  last_value_ = value;
  if (num_deltas_ == BLOCK_SIZE) FlushBlock();
}

template <typename T>
void DeltaBitPackEncoder<T>::FlushBlock() {
  if (num_deltas_ == 0) return;
  T min_delta = *std::min_element(deltas_, deltas_ + num_deltas_);

  uint8_t header[MAX_ZIGZAG_LEN + NUM_MINIBLOCKS];
  BitWriter header_writer(header, sizeof(header));
  bool ok = header_writer.PutZigZagInteger(min_delta);
  DCHECK(ok);
  uint8_t* bit_widths = header_writer.GetNextBytePtr(NUM_MINIBLOCKS);
  DCHECK(bit_widths != nullptr);
  memset(bit_widths, 0, NUM_MINIBLOCKS);
  header_writer.Flush();
  const int64_t header_pos = blocks_.size();
  blocks_.insert(blocks_.end(), header, header + header_writer.bytes_written());

  for (int i = 0; i < NUM_MINIBLOCKS; ++i) {
    const int start = i * MINIBLOCK_SIZE;
    const int n = std::min(MINIBLOCK_SIZE, num_deltas_ - start);
    if (n <= 0) break;
    UT max_packed = 0;
    for (int j = start; j < start + n; ++j) {
      max_packed = std::max(max_packed,
          static_cast<UT>(static_cast<UT>(deltas_[j]) - static_cast<UT>(min_delta)));
    }
    const int bit_width = BitUtil::NumRequiredBits(max_packed);
    blocks_[header_pos + header_writer.bytes_written() - NUM_MINIBLOCKS + i] = bit_width;

    uint8_t packed[MINIBLOCK_SIZE * sizeof(T)];
    BitWriter writer(packed, sizeof(packed));
    for (int j = start; j < start + MINIBLOCK_SIZE; ++j) {
      UT v = j < start + n ?
          static_cast<UT>(deltas_[j]) - static_cast<UT>(min_delta) : 0;
      ok = writer.PutValue(v, bit_width);
      DCHECK(ok);
    }
    writer.Flush();
    DCHECK_EQ(writer.bytes_written(), MINIBLOCK_SIZE * bit_width / 8);
    blocks_.insert(blocks_.end(), packed, packed + writer.bytes_written());
  }
  num_deltas_ = 0;
}

template <typename T>
void DeltaBitPackEncoder<T>::FlushValues(std::vector<uint8_t>* out) {
  FlushBlock();
  uint8_t header[MAX_HEADER_LEN];
  BitWriter writer(header, sizeof(header));
  bool ok = writer.PutUleb128<uint32_t>(BLOCK_SIZE);
  ok &= writer.PutUleb128<uint32_t>(NUM_MINIBLOCKS);
  ok &= writer.PutUleb128<uint64_t>(total_values_);
  ok &= writer.PutZigZagInteger(first_value_);
  DCHECK(ok);
  writer.Flush();
  out->insert(out->end(), header, header + writer.bytes_written());
  out->insert(out->end(), blocks_.begin(), blocks_.end());
  Clear();
}

template <typename T>
bool DeltaBitPackDecoder<T>::Init(const uint8_t* buffer, int64_t buffer_len) {
  reader_.Reset(buffer, buffer_len);
  uint64_t block_size, num_miniblocks, total_values;
  if (!reader_.GetUleb128(&block_size)) return false;
  if (!reader_.GetUleb128(&num_miniblocks)) return false;
  if (!reader_.GetUleb128(&total_values)) return false;
  if (!reader_.GetZigZagInteger(&last_value_)) return false;
  if (block_size == 0 || num_miniblocks == 0 || block_size % num_miniblocks != 0) {
    return false;
  }
  miniblock_size_ = block_size / num_miniblocks;
  if (miniblock_size_ % 32 != 0 || miniblock_size_ > MAX_MINIBLOCK_SIZE) return false;
  if (total_values > std::numeric_limits<int32_t>::max()) return false;
  // Every value after the first lives in a block of at least one min delta byte and
  // one bit width byte per miniblock.
  if (total_values > 1) {
    const int64_t num_blocks = BitUtil::Ceil(total_values - 1, block_size);
    if (num_blocks > reader_.bytes_left() / (1 + static_cast<int64_t>(num_miniblocks))) {
      return false;
    }
  }
  block_size_ = block_size;
  num_miniblocks_ = num_miniblocks;
  total_values_ = total_values;
  values_read_ = 0;
  values_left_in_block_ = 0;
  miniblock_idx_ = 0;
  miniblock_pos_ = 0;
  miniblock_len_ = 0;
  bit_widths_.resize(num_miniblocks_);
  miniblock_values_.resize(miniblock_size_);
  return true;
}

template <typename T>
bool DeltaBitPackDecoder<T>::InitBlock() {
  if (!reader_.GetZigZagInteger(&min_delta_)) return false;
  for (int64_t i = 0; i < num_miniblocks_; ++i) {
    if (!reader_.GetBytes(1, &bit_widths_[i])) return false;
  }
  // The first value is not part of any block.
  values_left_in_block_ = std::min(block_size_, total_values_ - values_read_);
  miniblock_idx_ = 0;
  return true;
}

template <typename T>
bool DeltaBitPackDecoder<T>::InitMiniBlock() {
  if (values_left_in_block_ == 0 && !InitBlock()) return false;
  DCHECK_LT(miniblock_idx_, num_miniblocks_);
  const int bit_width = bit_widths_[miniblock_idx_++];
  if (bit_width > sizeof(T) * 8) return false;
  if (reader_.UnpackBatch(bit_width, miniblock_size_, miniblock_values_.data())
      != miniblock_size_) {
    return false;
  }
  miniblock_len_ = std::min(miniblock_size_, values_left_in_block_);
  values_left_in_block_ -= miniblock_len_;
  miniblock_pos_ = 0;
  return true;
}

template <typename T>
bool DeltaBitPackDecoder<T>::GetValues(int64_t count, T* values) {
  if (count > values_left()) return false;
  for (int64_t i = 0; i < count; ++i) {
    if (values_read_ > 0) {
      if (miniblock_pos_ == miniblock_len_ && !InitMiniBlock()) return false;
      const UT delta = static_cast<UT>(min_delta_) + miniblock_values_[miniblock_pos_++];
      last_value_ = static_cast<T>(static_cast<UT>(last_value_) + delta);
    }
    values[i] = last_value_;
    ++values_read_;
  }
  return true;
}

inline bool DeltaLengthByteArrayDecoder::Init(const uint8_t* buffer,
    int64_t buffer_len, int64_t num_values) {
  DeltaBitPackDecoder<int32_t> lengths;
  if (!lengths.Init(buffer, buffer_len)) return false;
  if (lengths.total_values() != num_values) return false;
  lengths_.resize(num_values);
  if (!lengths.GetValues(lengths_.size(), lengths_.data())) return false;
  data_ = lengths.buffer_pos();
  int64_t total_len = 0;
  for (int32_t len : lengths_) {
    if (len < 0) return false;
    total_len += len;
  }
  if (total_len > buffer + buffer_len - data_) return false;
  data_end_ = data_ + total_len;
  next_idx_ = 0;
  return true;
}

inline bool DeltaLengthByteArrayDecoder::GetValues(int64_t count, std::string* values) {
  if (count > static_cast<int64_t>(lengths_.size()) - next_idx_) return false;
  for (int64_t i = 0; i < count; ++i) {
    const int32_t len = lengths_[next_idx_++];
    values[i].assign(reinterpret_cast<const char*>(data_), len);
    data_ += len;
  }
  return true;
}

inline bool DeltaByteArrayDecoder::Init(const uint8_t* buffer, int64_t buffer_len,
    int64_t num_values) {
  DeltaBitPackDecoder<int32_t> prefix_lengths;
  if (!prefix_lengths.Init(buffer, buffer_len)) return false;
  if (prefix_lengths.total_values() != num_values) return false;
  prefix_lengths_.resize(num_values);
  if (!prefix_lengths.GetValues(prefix_lengths_.size(), prefix_lengths_.data())) {
    return false;
  }
  const uint8_t* suffix_start = prefix_lengths.buffer_pos();
  if (!suffixes_.Init(suffix_start, buffer + buffer_len - suffix_start, num_values)) {
    return false;
  }
  next_idx_ = 0;
  last_value_.clear();
  return true;
}

inline bool DeltaByteArrayDecoder::GetValues(int64_t count, std::string* values) {
  if (count > static_cast<int64_t>(prefix_lengths_.size()) - next_idx_) return false;
  for (int64_t i = 0; i < count; ++i) {
    const int32_t prefix = prefix_lengths_[next_idx_++];
    if (prefix < 0 || prefix > last_value_.size()) return false;
    std::string suffix;
    if (!suffixes_.GetValues(1, &suffix)) return false;
    values[i] = last_value_.substr(0, prefix) + suffix;
    last_value_ = values[i];
  }
  return true;
}

}

#endif
