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

#include "util/compress.h"

#include <strings.h>

#include <lz4.h>
#include <snappy.h>
#include <zlib.h>
#include <zstd.h>

#include "common/logging.h"

#include "common/names.h"

using namespace strata;

GzipCompressor::GzipCompressor(Format format, int compression_level)
  : Codec(format == GZIP ? columnar::CompressionCodec::GZIP
                         : columnar::CompressionCodec::DEFLATE),
    zlib_format_(format),
    compression_level_(compression_level == 0 ? Z_DEFAULT_COMPRESSION
                                              : compression_level) {
  bzero(&stream_, sizeof(stream_));
}

GzipCompressor::~GzipCompressor() {
  (void)deflateEnd(&stream_);
}

Status GzipCompressor::Init() {
  int ret;
  // Initialize to run specified format
  int window_bits = WINDOW_BITS;
  if (zlib_format_ == GZIP) window_bits += GZIP_CODEC;
  if ((ret = deflateInit2(&stream_, compression_level_, Z_DEFLATED,
                          window_bits, 9, Z_DEFAULT_STRATEGY)) != Z_OK) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Gzip",
        string("deflateInit2() failed: ") + (stream_.msg != nullptr ? stream_.msg : ""));
  }
  return Status::OK();
}

int64_t GzipCompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  return deflateBound(&stream_, input_len);
}

Status GzipCompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  DCHECK_GE(input_length, 0);
  int64_t max_compressed_len = MaxOutputLen(input_length);
  if (*output_length < max_compressed_len) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Gzip", "output buffer is too small");
  }
  stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input));
  stream_.avail_in = input_length;
  stream_.next_out = reinterpret_cast<Bytef*>(output);
  stream_.avail_out = *output_length;

  int ret = deflate(&stream_, Z_FINISH);
  if (ret != Z_STREAM_END) {
    *output_length = 0;
    stringstream ss;
    ss << "deflate() failed with " << ret;
    if (stream_.msg != nullptr) ss << ": " << stream_.msg;
    return Status(TErrorCode::COMPRESSION_ERROR, "Gzip", ss.str());
  }
  *output_length = *output_length - stream_.avail_out;

  if (deflateReset(&stream_) != Z_OK) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Gzip", "deflateReset() failed");
  }
  return Status::OK();
}

SnappyCompressor::SnappyCompressor() : Codec(columnar::CompressionCodec::SNAPPY) {}

int64_t SnappyCompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  return snappy::MaxCompressedLength(input_len);
}

Status SnappyCompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  DCHECK_GE(input_length, 0);
  int64_t max_compressed_len = MaxOutputLen(input_length);
  if (*output_length < max_compressed_len) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Snappy", "output buffer is too small");
  }
  size_t out_len = 0;
  snappy::RawCompress(reinterpret_cast<const char*>(input),
      static_cast<size_t>(input_length), reinterpret_cast<char*>(output), &out_len);
  *output_length = out_len;
  return Status::OK();
}

Lz4Compressor::Lz4Compressor() : Codec(columnar::CompressionCodec::LZ4) {}

int64_t Lz4Compressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  return LZ4_compressBound(input_len);
}

Status Lz4Compressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  DCHECK_GE(input_length, 0);
  if (MaxOutputLen(input_length, input) == 0) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Lz4",
        "input of " + std::to_string(input_length) + " bytes is too large");
  }
  int ret = LZ4_compress_default(reinterpret_cast<const char*>(input),
      reinterpret_cast<char*>(output), input_length, *output_length);
  if (ret <= 0) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Lz4", "LZ4_compress_default() failed");
  }
  *output_length = ret;
  return Status::OK();
}

ZstandardCompressor::ZstandardCompressor(int clevel)
  : Codec(columnar::CompressionCodec::ZSTD),
    clevel_(clevel == 0 ? ZSTD_CLEVEL_DEFAULT : clevel) {}

ZstandardCompressor::~ZstandardCompressor() {
  if (stream_ != nullptr) {
    static_cast<void>(ZSTD_freeCCtx(stream_));
  }
}

int64_t ZstandardCompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  return ZSTD_compressBound(input_len);
}

Status ZstandardCompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  DCHECK_GE(input_length, 0);
  if (stream_ == nullptr) {
    stream_ = ZSTD_createCCtx();
    if (stream_ == nullptr) {
      *output_length = 0;
      return Status(TErrorCode::COMPRESSION_ERROR, "Zstd", "ZSTD_createCCtx() failed");
    }
  }
  size_t ret = ZSTD_compressCCtx(stream_, output, *output_length, input,
      input_length, clevel_);
  if (ZSTD_isError(ret)) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Zstd", ZSTD_getErrorName(ret));
  }
  *output_length = ret;
  return Status::OK();
}
