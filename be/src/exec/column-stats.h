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

#ifndef STRATA_EXEC_COLUMN_STATS_H
#define STRATA_EXEC_COLUMN_STATS_H

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>

#include "exec/schema.h"
#include "gen-cpp/columnar_types.h"
#include "runtime/value.h"

namespace strata {

/// This class, together with its derivatives, is used to update column statistics when
/// writing columnar files. It provides an interface to populate a columnar::Statistics
/// object and attach it to an object supplied by the caller. It can also be used to
/// decode columnar::Statistics into values.
///
/// Regarding the ordering of values:
///
/// - Numeric values (BOOLEAN, INT32, INT64, FLOAT, DOUBLE) are ordered by their numeric
///   value (as opposed to their binary representation), with false < true. NaN values
///   are ignored.
///
/// - Byte arrays are ordered using bytewise, unsigned comparison.
///
/// - INT96 values have no defined order; only their null count is tracked.
///
/// NULL values are not considered for min/max statistics, and if a column consists only
/// of NULL values, then no min/max statistics are written.
///
/// Updating the statistics is handled in derived classes to alleviate the need for
/// virtual function calls.
class ColumnStatsBase {
 public:
  /// Enum to select whether to read minimum or maximum statistics.
  enum class StatsField { MIN, MAX };

  /// min and max functions for types that are not floating point numbers
  template <typename T, typename Enable = void>
  struct MinMaxTrait {
    static decltype(auto) MinValue(const T& a, const T& b) { return std::min(a, b); }
    static decltype(auto) MaxValue(const T& a, const T& b) { return std::max(a, b); }
  };

  /// min and max functions for floating point types
  template <typename T>
  struct MinMaxTrait<T, std::enable_if_t<std::is_floating_point<T>::value>> {
    static decltype(auto) MinValue(const T& a, const T& b) { return std::fmin(a, b); }
    static decltype(auto) MaxValue(const T& a, const T& b) { return std::fmax(a, b); }
  };

  ColumnStatsBase() : has_min_max_values_(false), null_count_(0), distinct_count_(-1) {}
  virtual ~ColumnStatsBase() {}

  /// Decodes the min or max value, as selected by 'stats_field', of the column
  /// described by 'desc' from 'stats' into 'value'. Returns false if the value is not
  /// set or can't be decoded.
  static bool ReadFromThrift(const columnar::Statistics& stats,
      const ColumnDescriptor& desc, StatsField stats_field, PrimitiveValue* value);

  /// Gets the null_count statistics from 'stats' and returns it via an output
  /// parameter. Returns true if the null_count stats were read successfully.
  static bool ReadNullCountStat(const columnar::Statistics& stats, int64_t* null_count);

  /// Merges this statistics object with values from 'other'. If other has not been
  /// initialized, then this object will not be changed. The distinct count is not
  /// merged.
  virtual void Merge(const ColumnStatsBase& other) = 0;

  /// Returns the number of bytes needed to encode the current statistics into a
  /// columnar::Statistics object.
  virtual int64_t BytesNeeded() const = 0;

  /// Encodes the current values into a Statistics thrift message.
  virtual void EncodeToThrift(columnar::Statistics* out) const = 0;

  /// Resets the state of this object.
  void Reset();

  /// Update the statistics by incrementing the null_count. It is called each time a null
  /// value is appended to the column or the statistics are merged.
  void IncrementNullCount(int64_t count) { null_count_ += count; }

  /// Sets the number of distinct non-null values. Only known while a column chunk is
  /// entirely dictionary encoded.
  void SetDistinctCount(int64_t count) { distinct_count_ = count; }

  bool has_min_max_values() const { return has_min_max_values_; }
  int64_t null_count() const { return null_count_; }
  int64_t distinct_count() const { return distinct_count_; }

 protected:
  /// Stores whether the min and max values of the current object have been initialized.
  bool has_min_max_values_;

  // Number of null values since the last call to Reset().
  int64_t null_count_;

  // Number of distinct values, or -1 if unknown.
  int64_t distinct_count_;

 private:
  /// Decodes the stats value in 'buffer' as a T into 'value'.
  template <typename T>
  static bool DecodeValue(const std::string& buffer, PrimitiveValue* value);
};

/// This class contains behavior specific to the C++ type of each physical type.
template <typename T>
class ColumnStats : public ColumnStatsBase {
  friend class ColumnStatsBase;
  using value_type = typename std::enable_if<
      std::is_arithmetic<T>::value
        || std::is_same<Int96, T>::value
        || std::is_same<std::string, T>::value,
      T>::type;

 public:
  /// 'plain_encoded_value_size' specifies the size of each encoded value in plain
  /// encoding, -1 if the type is variable-length.
  explicit ColumnStats(int plain_encoded_value_size)
    : ColumnStatsBase(),
      plain_encoded_value_size_(plain_encoded_value_size) {}

  /// Updates the statistics based on the values min_value and max_value. If necessary,
  /// initializes the statistics.
  void Update(const T& min_value, const T& max_value);

  /// Wrapper to call the Update function which takes in the min_value and max_value.
  void Update(const T& v) { Update(v, v); }

  virtual void Merge(const ColumnStatsBase& other) override;
  virtual int64_t BytesNeeded() const override;
  virtual void EncodeToThrift(columnar::Statistics* out) const override;

  const T& min_value() const { return min_value_; }
  const T& max_value() const { return max_value_; }

 protected:
  /// Encodes a single value using plain encoding and stores it into the binary
  /// string 'out'. Byte array values are stored without a length prefix.
  /// 'bytes_needed' must be positive.
  static void EncodePlainValue(const T& v, int64_t bytes_needed, std::string* out);

  /// Decodes the plain encoded stats value from 'buffer' into 'result'. Returns true if
  /// decoding was successful, false otherwise.
  static bool DecodePlainValue(const std::string& buffer, T* result);

  /// Returns the number of bytes needed to encode value 'v'.
  int64_t BytesNeeded(const T& v) const;

  // Size of each encoded value in plain encoding, -1 if the type is variable-length.
  int plain_encoded_value_size_;

  // Minimum value since the last call to Reset().
  T min_value_;

  // Maximum value since the last call to Reset().
  T max_value_;
};

}
#endif
