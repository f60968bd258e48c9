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

#ifndef STRATA_EXEC_LEVEL_CODEC_H
#define STRATA_EXEC_LEVEL_CODEC_H

#include <cstdint>
#include <string>
#include <vector>

#include "common/status.h"
#include "gen-cpp/columnar_types.h"

namespace strata {

/// Returns the number of bits used to encode levels in [0, max_level].
int LevelBitWidth(int max_level);

/// Encodes the repetition or definition levels of a page. Two encodings are supported:
///  - RLE: the RLE/bit-packed hybrid at LevelBitWidth(max_level) bits.
///  - BIT_PACKED: the levels packed back to back LSB first without run headers.
/// No bytes are produced for a max level of 0.
class LevelEncoder {
 public:
  LevelEncoder(columnar::Encoding::type encoding, int max_level);

  /// Encodes 'num_levels' levels from 'levels' into 'out', replacing its contents.
  /// Returns UNSUPPORTED_ENCODING if the encoding is not a level encoding.
  Status Encode(const int16_t* levels, int64_t num_levels, std::vector<uint8_t>* out)
      WARN_UNUSED_RESULT;

  /// Upper bound of the encoded size of 'num_levels' levels.
  int64_t MaxBufferSize(int64_t num_levels) const;

 private:
  columnar::Encoding::type encoding_;
  int max_level_;
  int bit_width_;
};

/// Decodes the repetition or definition levels of a page.
class LevelDecoder {
 public:
  /// Decodes exactly 'num_levels' levels from the 'len' bytes at 'data' into 'levels'.
  /// Input that ends early, has invalid runs, or holds levels above 'max_level' fails
  /// with MALFORMED_ENCODING; 'column_path' and 'page_offset' identify the page in
  /// errors. Data for a max level of 0 must be empty, so nothing in the input bounds
  /// 'num_levels' in that case; callers check it against the chunk metadata first.
  static Status Decode(const std::string& column_path, columnar::Encoding::type encoding,
      int max_level, const uint8_t* data, int64_t len, int64_t num_levels,
      int64_t page_offset, std::vector<int16_t>* levels) WARN_UNUSED_RESULT;

  /// Returns true if 'encoding' can encode levels.
  static bool IsLevelEncoding(columnar::Encoding::type encoding) {
    return encoding == columnar::Encoding::RLE
        || encoding == columnar::Encoding::BIT_PACKED;
  }
};

}

#endif
