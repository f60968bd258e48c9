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

#include "util/decompress.h"

#include <strings.h>

#include <lz4.h>
#include <snappy.h>
#include <zlib.h>
#include <zstd.h>

#include "common/logging.h"

#include "common/names.h"

using namespace strata;

GzipDecompressor::GzipDecompressor(columnar::CompressionCodec::type format)
  : Codec(format) {
  bzero(&stream_, sizeof(stream_));
}

GzipDecompressor::~GzipDecompressor() {
  (void)inflateEnd(&stream_);
}

Status GzipDecompressor::Init() {
  int ret = inflateInit2(&stream_, WINDOW_BITS | DETECT_CODEC);
  if (ret != Z_OK) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Gzip",
        "inflateInit2() failed with " + std::to_string(ret));
  }
  return Status::OK();
}

int64_t GzipDecompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  return -1;
}

string GzipDecompressor::DebugStreamState() const {
  stringstream ss;
  ss << "next_in=" << (void*)stream_.next_in;
  ss << " avail_in=" << stream_.avail_in;
  ss << " total_in=" << stream_.total_in;
  ss << " next_out=" << (void*)stream_.next_out;
  ss << " avail_out=" << stream_.avail_out;
  ss << " total_out=" << stream_.total_out;
  return ss.str();
}

Status GzipDecompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  int64_t output_length_local = *output_length;
  *output_length = 0;

  // Reset the stream for this block
  int ret = inflateReset(&stream_);
  if (ret != Z_OK) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Gzip",
        "inflateReset() failed with " + std::to_string(ret));
  }

  // zlib does not accept an empty output buffer, so a one byte scratch buffer stands in
  // for it when no output is expected.
  uint8_t scratch;
  bool use_scratch = output_length_local == 0;
  int64_t capacity = use_scratch ? 1 : output_length_local;
  stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input));
  stream_.avail_in = input_length;
  stream_.next_out = reinterpret_cast<Bytef*>(use_scratch ? &scratch : output);
  stream_.avail_out = capacity;

  // We know the output size, so we can use Z_FINISH which is more efficient.
  ret = inflate(&stream_, Z_FINISH);
  int64_t produced = capacity - stream_.avail_out;
  if (ret == Z_STREAM_END && produced <= output_length_local) {
    *output_length = produced;
    return Status::OK();
  }
  stringstream ss;
  if (ret == Z_DATA_ERROR) {
    ss << "block is corrupted";
  } else if (ret == Z_BUF_ERROR || ret == Z_OK || ret == Z_STREAM_END) {
    ss << "output buffer of " << output_length_local << " bytes is too small";
  } else {
    ss << "inflate() failed with " << ret;
  }
  if (stream_.msg != nullptr) ss << ": " << stream_.msg;
  VLOG_PAGE << "Gzip inflate failed: " << DebugStreamState();
  return Status(TErrorCode::COMPRESSION_ERROR, "Gzip", ss.str());
}

SnappyDecompressor::SnappyDecompressor() : Codec(columnar::CompressionCodec::SNAPPY) {}

int64_t SnappyDecompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  if (input_len <= 0) return -1;
  DCHECK(input != nullptr);
  size_t result;
  if (!snappy::GetUncompressedLength(reinterpret_cast<const char*>(input),
          input_len, &result)) {
    return -1;
  }
  return result;
}

Status SnappyDecompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  int64_t output_length_local = *output_length;
  *output_length = 0;
  int64_t uncompressed_length = MaxOutputLen(input_length, input);
  if (uncompressed_length < 0) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Snappy",
        "couldn't read the uncompressed length");
  }
  // If the preallocated buffer is too small (e.g. if the page header is corrupt),
  // bail out early. Otherwise, this could result in a buffer overrun.
  if (uncompressed_length > output_length_local) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Snappy",
        "uncompressed length " + std::to_string(uncompressed_length)
        + " exceeds the output buffer of " + std::to_string(output_length_local)
        + " bytes");
  }
  if (!snappy::RawUncompress(reinterpret_cast<const char*>(input),
          static_cast<size_t>(input_length), reinterpret_cast<char*>(output))) {
    return Status(TErrorCode::COMPRESSION_ERROR, "Snappy", "RawUncompress failed");
  }
  *output_length = uncompressed_length;
  return Status::OK();
}

Lz4Decompressor::Lz4Decompressor() : Codec(columnar::CompressionCodec::LZ4) {}

int64_t Lz4Decompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  return -1;
}

Status Lz4Decompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  int ret = LZ4_decompress_safe(reinterpret_cast<const char*>(input),
      reinterpret_cast<char*>(output), input_length, *output_length);
  if (ret < 0) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Lz4", "uncompress failed");
  }
  *output_length = ret;
  return Status::OK();
}

ZstandardDecompressor::ZstandardDecompressor()
  : Codec(columnar::CompressionCodec::ZSTD) {}

ZstandardDecompressor::~ZstandardDecompressor() {
  if (stream_ != nullptr) {
    static_cast<void>(ZSTD_freeDCtx(stream_));
  }
}

int64_t ZstandardDecompressor::MaxOutputLen(int64_t input_len, const uint8_t* input) {
  if (input_len <= 0) return -1;
  unsigned long long size = ZSTD_getFrameContentSize(input, input_len);
  if (size == ZSTD_CONTENTSIZE_UNKNOWN || size == ZSTD_CONTENTSIZE_ERROR) return -1;
  return static_cast<int64_t>(size);
}

Status ZstandardDecompressor::ProcessBlock(int64_t input_length, const uint8_t* input,
    int64_t* output_length, uint8_t* output) {
  if (stream_ == nullptr) {
    stream_ = ZSTD_createDCtx();
    if (stream_ == nullptr) {
      *output_length = 0;
      return Status(TErrorCode::COMPRESSION_ERROR, "Zstd", "ZSTD_createDCtx() failed");
    }
  }
  size_t ret = ZSTD_decompressDCtx(stream_, output, *output_length, input, input_length);
  if (ZSTD_isError(ret)) {
    *output_length = 0;
    return Status(TErrorCode::COMPRESSION_ERROR, "Zstd", ZSTD_getErrorName(ret));
  }
  *output_length = ret;
  return Status::OK();
}
