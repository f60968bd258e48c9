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

/// Different compression classes.  The classes all expose the same API and
/// abstracts the underlying calls to the compression libraries.

class GzipCompressor : public Codec {
 public:
  /// Compression formats supported by the zlib library
  enum Format {
    ZLIB,
    GZIP,
  };

  GzipCompressor(Format format, int compression_level = 0);
  virtual ~GzipCompressor();

  virtual Status Init() override WARN_UNUSED_RESULT;
  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;

 private:
  Format zlib_format_;
  int compression_level_;

  /// Structure used to communicate with the library.
  z_stream stream_;

  /// These are magic numbers from zlib.h.  Not clear why they are not defined there.
  const static int WINDOW_BITS = 15;    // Maximum window size
  const static int GZIP_CODEC = 16;     // Output Gzip.
};

class SnappyCompressor : public Codec {
 public:
  SnappyCompressor();
  virtual ~SnappyCompressor() { }

  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;
};

/// Lz4 is a compression codec with similar compression ratios as snappy but much faster
/// decompression. Pages hold the raw LZ4 block format without a frame.
class Lz4Compressor : public Codec {
 public:
  Lz4Compressor();
  virtual ~Lz4Compressor() { }

  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;
};

/// ZStandard compression codec.
class ZstandardCompressor : public Codec {
 public:
  explicit ZstandardCompressor(int clevel = ZSTD_CLEVEL_DEFAULT);
  virtual ~ZstandardCompressor();

  virtual int64_t MaxOutputLen(
      int64_t input_len, const uint8_t* input = nullptr) override;
  virtual Status ProcessBlock(int64_t input_length, const uint8_t* input,
      int64_t* output_length, uint8_t* output) override WARN_UNUSED_RESULT;

 private:
  int clevel_;
  ZSTD_CCtx* stream_ = nullptr;
};
}
