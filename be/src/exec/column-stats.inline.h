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

#ifndef STRATA_EXEC_COLUMN_STATS_INLINE_H
#define STRATA_EXEC_COLUMN_STATS_INLINE_H

#include "exec/column-stats.h"
#include "exec/columnar-common.h"

namespace strata {

inline void ColumnStatsBase::Reset() {
  has_min_max_values_ = false;
  null_count_ = 0;
  distinct_count_ = -1;
}

template <typename T>
inline void ColumnStats<T>::Update(const T& min_value, const T& max_value) {
  if (!has_min_max_values_) {
    has_min_max_values_ = true;
    min_value_ = min_value;
    max_value_ = max_value;
  } else {
    min_value_ = MinMaxTrait<T>::MinValue(min_value_, min_value);
    max_value_ = MinMaxTrait<T>::MaxValue(max_value_, max_value);
  }
}

template <typename T>
inline void ColumnStats<T>::Merge(const ColumnStatsBase& other) {
  DCHECK(dynamic_cast<const ColumnStats<T>*>(&other));
  const ColumnStats<T>* cs = static_cast<const ColumnStats<T>*>(&other);
  if (cs->has_min_max_values_) Update(cs->min_value_, cs->max_value_);
  IncrementNullCount(cs->null_count_);
}

template <typename T>
inline int64_t ColumnStats<T>::BytesNeeded() const {
  return BytesNeeded(min_value_) + BytesNeeded(max_value_)
      + 2 * ColumnarPlainEncoder::ByteSize(null_count_, -1);
}

template <typename T>
inline void ColumnStats<T>::EncodeToThrift(columnar::Statistics* out) const {
  if (has_min_max_values_) {
    std::string min_str;
    EncodePlainValue(min_value_, BytesNeeded(min_value_), &min_str);
    out->__set_min_value(std::move(min_str));
    std::string max_str;
    EncodePlainValue(max_value_, BytesNeeded(max_value_), &max_str);
    out->__set_max_value(std::move(max_str));
  }
  out->__set_null_count(null_count_);
  if (distinct_count_ >= 0) out->__set_distinct_count(distinct_count_);
}

template <typename T>
inline void ColumnStats<T>::EncodePlainValue(
    const T& v, int64_t bytes_needed, std::string* out) {
  DCHECK_GT(bytes_needed, 0);
  out->resize(bytes_needed);
  const int64_t bytes_written = ColumnarPlainEncoder::Encode(
      v, bytes_needed, reinterpret_cast<uint8_t*>(&(*out)[0]));
  DCHECK_EQ(bytes_needed, bytes_written);
}

template <typename T>
inline bool ColumnStats<T>::DecodePlainValue(const std::string& buffer, T* result) {
  if (buffer.size() != sizeof(T)) return false;
  memcpy(result, buffer.data(), sizeof(T));
  return true;
}

template <typename T>
inline int64_t ColumnStats<T>::BytesNeeded(const T& v) const {
  return plain_encoded_value_size_ < 0 ? ColumnarPlainEncoder::ByteSize<T>(v, -1) :
      plain_encoded_value_size_;
}

/// NaN values have no place in the order and are skipped.
template <>
inline void ColumnStats<float>::Update(const float& min_value, const float& max_value) {
  if (std::isnan(min_value) || std::isnan(max_value)) return;
  if (!has_min_max_values_) {
    has_min_max_values_ = true;
    min_value_ = min_value;
    max_value_ = max_value;
  } else {
    min_value_ = MinMaxTrait<float>::MinValue(min_value_, min_value);
    max_value_ = MinMaxTrait<float>::MaxValue(max_value_, max_value);
  }
}

template <>
inline void ColumnStats<double>::Update(
    const double& min_value, const double& max_value) {
  if (std::isnan(min_value) || std::isnan(max_value)) return;
  if (!has_min_max_values_) {
    has_min_max_values_ = true;
    min_value_ = min_value;
    max_value_ = max_value;
  } else {
    min_value_ = MinMaxTrait<double>::MinValue(min_value_, min_value);
    max_value_ = MinMaxTrait<double>::MaxValue(max_value_, max_value);
  }
}

/// INT96 values are unordered.
template <>
inline void ColumnStats<Int96>::Update(const Int96& min_value, const Int96& max_value) {}

/// Plain encoding for Boolean values is not handled by the ColumnarPlainEncoder and thus
/// needs special handling here.
template <>
inline void ColumnStats<bool>::EncodePlainValue(
    const bool& v, int64_t bytes_needed, std::string* out) {
  char c = v;
  out->assign(1, c);
}

template <>
inline bool ColumnStats<bool>::DecodePlainValue(const std::string& buffer,
    bool* result) {
  if (buffer.size() != 1) return false;
  *result = (buffer[0] != 0);
  return true;
}

template <>
inline int64_t ColumnStats<bool>::BytesNeeded(const bool& v) const {
  return 1;
}

/// Byte arrays are stored directly and do not use plain encoding. std::string compares
/// bytes as unsigned char.
template <>
inline void ColumnStats<std::string>::EncodePlainValue(
    const std::string& v, int64_t bytes_needed, std::string* out) {
  *out = v;
}

template <>
inline bool ColumnStats<std::string>::DecodePlainValue(
    const std::string& buffer, std::string* result) {
  *result = buffer;
  return true;
}

template <>
inline int64_t ColumnStats<std::string>::BytesNeeded(const std::string& v) const {
  return v.size();
}

}
#endif
