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


#ifndef STRATA_UTIL_DICT_ENCODING_H
#define STRATA_UTIL_DICT_ENCODING_H

#include <string.h>
#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

#include "common/compiler-util.h"
#include "common/logging.h"
#include "exec/columnar-common.h"
#include "util/bit-util.h"
#include "util/hash-util.h"
#include "util/rle-encoding.h"

namespace strata {

/// This class supports dictionary encoding of all physical types except BOOLEAN.
/// The encoding supports streaming encoding. Values are encoded as they are added while
/// the dictionary is being constructed. At any time, the buffered values can be
/// written out with the current dictionary size. More values can then be added to
/// the encoder, including new dictionary entries.
/// Dictionary entries are kept in insertion order. The dictionary page holds the
/// entries PLAIN encoded; a data page holds a one byte bit width followed by the
/// RLE/bit-packed hybrid encoded indices.

/// Base class for encoders. This is convenient so users can have a type that
/// abstracts over the actual dictionary type.
/// Note: it does not provide a virtual Put(). Users are expected to know the subclass
/// type when using Put().
class DictEncoderBase {
 public:
  virtual ~DictEncoderBase() {}

  /// Writes out the encoded dictionary to buffer. buffer must be preallocated to
  /// dict_encoded_size() bytes.
  virtual void WriteDict(uint8_t* buffer) = 0;

  /// The number of entries in the dictionary.
  virtual int num_entries() const = 0;

  /// Returns true if no more distinct values can be added.
  virtual bool IsFull() const = 0;

  /// Clears all the indices (but leaves the dictionary).
  void ClearIndices() { buffered_indices_.clear(); }

  int num_buffered_indices() const { return buffered_indices_.size(); }

  /// Returns a conservative estimate of the number of bytes needed to encode the buffered
  /// indices. Used to size the buffer passed to WriteData().
  int EstimatedDataEncodedSize() const {
    return 1 + RleEncoder::MaxBufferSize(bit_width(), buffered_indices_.size());
  }

  /// The minimum bit width required to encode the currently buffered indices.
  int bit_width() const {
    if (UNLIKELY(num_entries() == 0)) return 0;
    if (UNLIKELY(num_entries() == 1)) return 1;
    return BitUtil::Log2Ceiling64(num_entries());
  }

  /// Writes out any buffered indices to buffer preceded by the bit width of this data.
  /// Returns the number of bytes written.
  /// If the supplied buffer is not big enough, returns -1.
  /// buffer must be preallocated with buffer_len bytes. Use EstimatedDataEncodedSize()
  /// to size buffer.
  int WriteData(uint8_t* buffer, int buffer_len);

  int64_t dict_encoded_size() const { return dict_encoded_size_; }

 protected:
  DictEncoderBase() {}

  /// Indices that have not yet be written out by WriteData().
  std::vector<int> buffered_indices_;

  /// The number of bytes needed to encode the dictionary.
  int64_t dict_encoded_size_ = 0;
};

template<typename T>
class DictEncoder : public DictEncoderBase {
 public:
  /// 'encoded_value_size' is the PLAIN encoded size of one value, or -1 for BYTE_ARRAY.
  /// 'max_entries' is the largest number of distinct values the dictionary accepts.
  DictEncoder(int encoded_value_size, int max_entries)
    : buckets_(HashTableSize(max_entries), INVALID_INDEX),
      encoded_value_size_(encoded_value_size),
      max_entries_(max_entries) {
    DCHECK_GT(max_entries_, 0);
  }

  /// Encode value. Returns the number of bytes added to the dictionary page length
  /// (will be 0 if this value is already in the dictionary) or -1 if adding the value
  /// would exceed 'max_entries' distinct values (in which case the caller should give
  /// up on dictionary encoding). Note that this does not actually write any data, just
  /// buffers the value's index to be written later.
  int Put(const T& value);

  void WriteDict(uint8_t* buffer) override;

  int num_entries() const override { return nodes_.size(); }

  bool IsFull() const override { return nodes_.size() >= max_entries_; }

  /// Returns the dictionary entry at 'index'.
  const T& value(int index) const {
    DCHECK_GE(index, 0);
    DCHECK_LT(index, nodes_.size());
    return nodes_[index].value;
  }

 private:
  typedef uint32_t NodeIndex;
  static constexpr NodeIndex INVALID_INDEX = 0xFFFFFFFF;

  /// Number of buckets for 'max_entries'. Chosen so that the dictionary is never more
  /// than around 60% of the table to limit the expected length of the chains. Always a
  /// power of 2.
  static int HashTableSize(int max_entries) {
    int64_t size = 1024;
    while (size * 3 / 5 < max_entries) size *= 2;
    return size;
  }

  /// Hash table mapping value to dictionary index (i.e. the number used to encode this
  /// value in the data). Each table entry is a index into the nodes_ vector (giving the
  /// first node of a chain for this bucket) or INVALID_INDEX for an empty bucket.
  std::vector<NodeIndex> buckets_;

  /// Node in the chained hash table.
  struct Node {
    Node(const T& v, const NodeIndex& n) : value(v), next(n) { }

    /// The dictionary value.
    T value;

    /// Index into nodes_ for the next Node in the chain. INVALID_INDEX indicates end.
    NodeIndex next;
  };

  /// The nodes of the hash table. Ordered by dictionary index (and so also represents
  /// the reverse mapping from encoded index to value).
  std::vector<Node> nodes_;

  /// Size of each encoded dictionary value. -1 for variable-length types.
  const int encoded_value_size_;

  const int max_entries_;

  /// Hash function for mapping a value to a bucket.
  inline uint32_t Hash(const T& value) const;

  /// Returns true if 'a' and 'b' are the same dictionary entry. Floating point values
  /// are compared by bit pattern so that NaN and -0.0 keep their own entries.
  static bool KeyEquals(const T& a, const T& b) {
    if constexpr (std::is_floating_point<T>::value) {
      return memcmp(&a, &b, sizeof(T)) == 0;
    } else {
      return a == b;
    }
  }

  /// Adds value to the hash table and updates dict_encoded_size_. Returns the
  /// number of bytes added to dict_encoded_size_.
  /// bucket gives a pointer to the location (i.e. chain) to add the value
  /// so that the hash for value doesn't need to be recomputed.
  int AddToTable(const T& value, NodeIndex* bucket);
};

/// Number of indices to decode at a time.
static constexpr int32_t DICT_DECODER_BUFFER_SIZE = 128;

/// Decoder for the RLE/bit-packed hybrid indices of a dictionary encoded page. The
/// dictionary values themselves are decoded by the caller, which maps the indices onto
/// them. The input buffer must be maintained by the caller and valid as long as this
/// object is.
class DictIndexDecoder {
 public:
  using IndexType = uint32_t;

  /// Indices must be below 'num_entries'.
  explicit DictIndexDecoder(int num_entries) : num_entries_(num_entries) {}

  /// The rle encoded indices into the dictionary. Returns false if the buffer
  /// is empty or the bit_width metadata in the buffer is invalid.
  bool SetData(const uint8_t* buffer, int64_t buffer_len) WARN_UNUSED_RESULT {
    DCHECK_GE(buffer_len, 0);
    if (UNLIKELY(buffer_len == 0)) return false;
    int bit_width = *buffer;
    if (UNLIKELY(bit_width > sizeof(IndexType) * 8)) return false;
    ++buffer;
    --buffer_len;
    data_decoder_.Reset(buffer, buffer_len, bit_width);
    return true;
  }

  int num_entries() const { return num_entries_; }

  /// Decodes the next 'count' indices into 'indices'. Returns false if the data was
  /// truncated or an index is outside the dictionary.
  bool GetNextIndices(int count, IndexType* indices) WARN_UNUSED_RESULT;

 private:
  const int num_entries_;
  RleBatchDecoder<IndexType> data_decoder_;
};

template<typename T>
inline int DictEncoder<T>::Put(const T& value) {
  NodeIndex* bucket = &buckets_[Hash(value) & (buckets_.size() - 1)];
  NodeIndex i = *bucket;
  // Look for the value in the dictionary.
  while (i != INVALID_INDEX) {
    const Node* n = &nodes_[i];
    if (LIKELY(KeyEquals(n->value, value))) {
      // Value already in dictionary.
      buffered_indices_.push_back(i);
      return 0;
    }
    i = n->next;
  }
  // Value not found. Add it to the dictionary if there's space.
  i = nodes_.size();
  if (UNLIKELY(i >= max_entries_)) return -1;
  buffered_indices_.push_back(i);
  return AddToTable(value, bucket);
}

template<typename T>
inline uint32_t DictEncoder<T>::Hash(const T& value) const {
  return HashUtil::Hash(&value, sizeof(value), 0);
}

template<>
inline uint32_t DictEncoder<std::string>::Hash(const std::string& value) const {
  return HashUtil::Hash(value.data(), value.size(), 0);
}

template<typename T>
inline int DictEncoder<T>::AddToTable(const T& value, NodeIndex* bucket) {
  DCHECK_GT(encoded_value_size_, 0);
  // Prepend the new node to this bucket's chain.
  nodes_.emplace_back(value, *bucket);
  *bucket = nodes_.size() - 1;
  dict_encoded_size_ += encoded_value_size_;
  return encoded_value_size_;
}

template<>
inline int DictEncoder<std::string>::AddToTable(const std::string& value,
    NodeIndex* bucket) {
  nodes_.emplace_back(value, *bucket);
  *bucket = nodes_.size() - 1;
  int bytes_added = ColumnarPlainEncoder::ByteSize(value, encoded_value_size_);
  dict_encoded_size_ += bytes_added;
  return bytes_added;
}

template<typename T>
inline void DictEncoder<T>::WriteDict(uint8_t* buffer) {
  for (const Node& node: nodes_) {
    buffer += ColumnarPlainEncoder::Encode(node.value, encoded_value_size_, buffer);
  }
}

inline int DictEncoderBase::WriteData(uint8_t* buffer, int buffer_len) {
  if (UNLIKELY(buffer_len < 1 + RleEncoder::MinBufferSize(bit_width()))) return -1;
  // Write bit width in first byte
  *buffer = bit_width();
  ++buffer;
  --buffer_len;

  RleEncoder encoder(buffer, buffer_len, bit_width());
  for (int index: buffered_indices_) {
    if (!encoder.Put(index)) return -1;
  }
  encoder.Flush();
  return 1 + encoder.len();
}

inline bool DictIndexDecoder::GetNextIndices(int count, IndexType* indices) {
  if (UNLIKELY(data_decoder_.GetValues(count, indices) != count)) return false;
  for (int i = 0; i < count; ++i) {
    if (UNLIKELY(indices[i] >= num_entries_)) return false;
  }
  return true;
}

}
#endif
