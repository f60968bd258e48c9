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

/// We need zlib.h here to declare stream_ below.
#include <zlib.h>
#include <zstd.h>

#include "common/status.h"
#include "util/codec.h"

namespace strata {

/// Decompressor for both the gzip and the zlib wrapper of deflate.
class GzipDecompressor : public Codec {
 public:
  explicit GzipDecompressor(columnar::CompressionCodec::type format);
  virtual ~GzipDecompressor();

  virtual Status Init() override WARN_UNUSED_RESULT;
  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;

  std::string DebugStreamState() const;

 private:
  /// Structure used to communicate with the library.
  z_stream stream_;

  /// Use a mask of 32 for the window bits to let zlib detect the wrapper.
  const static int WINDOW_BITS = 15;    // Maximum window size
  const static int DETECT_CODEC = 32;   // Determine if this is libz or gzip from header.
};

class SnappyDecompressor : public Codec {
 public:
  SnappyDecompressor();
  virtual ~SnappyDecompressor() { }

  /// Returns the uncompressed length stored in the snappy preamble, or -1 if the
  /// preamble is malformed.
  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;
};

class Lz4Decompressor : public Codec {
 public:
  Lz4Decompressor();
  virtual ~Lz4Decompressor() { }

  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;
};

class ZstandardDecompressor : public Codec {
 public:
  ZstandardDecompressor();
  virtual ~ZstandardDecompressor();

  /// Returns the content size recorded in the frame header, or -1 if it is unknown.
  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;

 private:
  ZSTD_DCtx* stream_ = nullptr;
};
}
