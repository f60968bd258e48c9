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

#include <cstdint>
#include <string>

#include <boost/scoped_ptr.hpp>

#include "common/status.h"
#include "gen-cpp/columnar_types.h"

namespace strata {

/// Create a compression object.  This is the base class for all compression algorithms. A
/// compression algorithm is either a compressor or a decompressor.  Each of these objects
/// inherits from this class and is instantiated by the Create static methods defined
/// here. The type of compression is the page codec id of columnar.thrift.
///
/// Pages are compressed and decompressed as single blocks, so the caller always owns
/// the output buffer: it sizes it with MaxOutputLen() when compressing, and with the
/// uncompressed size stored in the page header when decompressing.
class Codec {
 public:
  /// Create a decompressor for 'format'. Sets *decompressor to nullptr for
  /// UNCOMPRESSED.
  static Status CreateDecompressor(columnar::CompressionCodec::type format,
      boost::scoped_ptr<Codec>* decompressor) WARN_UNUSED_RESULT;

  /// Create a compressor for 'format'. 'compression_level' is only used by ZSTD and the
  /// zlib formats; 0 selects the library default. Sets *compressor to nullptr for
  /// UNCOMPRESSED.
  static Status CreateCompressor(columnar::CompressionCodec::type format,
      int compression_level, boost::scoped_ptr<Codec>* compressor) WARN_UNUSED_RESULT;

  /// Parses a codec name as used by --compression_codec (case-insensitive; NONE and
  /// UNCOMPRESSED are synonyms).
  static Status ParseCodecName(
      const std::string& name, columnar::CompressionCodec::type* format)
      WARN_UNUSED_RESULT;

  /// Return the name of a compression algorithm.
  static std::string GetCodecName(columnar::CompressionCodec::type format);

  virtual ~Codec() {}

  /// Initialize the codec. This should only be called once.
  virtual Status Init() WARN_UNUSED_RESULT { return Status::OK(); }

  /// Process a block of data, either compressing or decompressing it.
  ///
  /// *output_length must be the length of 'output' and data will be written directly to
  /// 'output'. If the transformation succeeds, *output_length will be set to the actual
  /// length of the transformed output. Otherwise it will be set to 0.
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) WARN_UNUSED_RESULT = 0;

  /// Returns the maximum result length from applying the codec to input.
  /// Note this is not the exact result length, simply a bound to allow preallocating
  /// a buffer. Decompressors that can't tell without decoding the input return -1.
  virtual int64_t MaxOutputLen(int64_t input_len, const uint8_t* input = nullptr) = 0;

  columnar::CompressionCodec::type format() const { return format_; }

 protected:
  explicit Codec(columnar::CompressionCodec::type format) : format_(format) {}

  columnar::CompressionCodec::type format_;
};

}
