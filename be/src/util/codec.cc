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

#include "util/codec.h"

#include <boost/algorithm/string.hpp>

#include "common/compiler-util.h"
#include "common/logging.h"
#include "util/compress.h"
#include "util/decompress.h"

#include "common/names.h"

using namespace strata;

string Codec::GetCodecName(columnar::CompressionCodec::type format) {
  auto it = columnar::_CompressionCodec_VALUES_TO_NAMES.find(format);
  if (it == columnar::_CompressionCodec_VALUES_TO_NAMES.end()) {
    return "unknown(" + std::to_string(format) + ")";
  }
  return boost::algorithm::to_lower_copy(string(it->second));
}

Status Codec::ParseCodecName(
    const string& name, columnar::CompressionCodec::type* format) {
  string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
  if (upper == "NONE") upper = "UNCOMPRESSED";
  for (const auto& entry : columnar::_CompressionCodec_VALUES_TO_NAMES) {
    if (upper == entry.second) {
      *format = static_cast<columnar::CompressionCodec::type>(entry.first);
      return Status::OK();
    }
  }
  return Status(TErrorCode::COMPRESSION_ERROR, name, "unknown codec name");
}

Status Codec::CreateCompressor(columnar::CompressionCodec::type format,
    int compression_level, boost::scoped_ptr<Codec>* compressor) {
  switch (format) {
    case columnar::CompressionCodec::UNCOMPRESSED:
      compressor->reset(nullptr);
      return Status::OK();
    case columnar::CompressionCodec::GZIP:
      compressor->reset(new GzipCompressor(GzipCompressor::GZIP, compression_level));
      break;
    case columnar::CompressionCodec::DEFLATE:
      compressor->reset(new GzipCompressor(GzipCompressor::ZLIB, compression_level));
      break;
    case columnar::CompressionCodec::SNAPPY:
      compressor->reset(new SnappyCompressor());
      break;
    case columnar::CompressionCodec::LZ4:
      compressor->reset(new Lz4Compressor());
      break;
    case columnar::CompressionCodec::ZSTD:
      compressor->reset(new ZstandardCompressor(compression_level));
      break;
    default:
      return Status(TErrorCode::COMPRESSION_ERROR, GetCodecName(format),
          "unsupported compression codec");
  }
  return (*compressor)->Init();
}

Status Codec::CreateDecompressor(columnar::CompressionCodec::type format,
    boost::scoped_ptr<Codec>* decompressor) {
  switch (format) {
    case columnar::CompressionCodec::UNCOMPRESSED:
      decompressor->reset(nullptr);
      return Status::OK();
    case columnar::CompressionCodec::GZIP:
    case columnar::CompressionCodec::DEFLATE:
      // The zlib decompressor detects the gzip and zlib wrappers itself.
      decompressor->reset(new GzipDecompressor(format));
      break;
    case columnar::CompressionCodec::SNAPPY:
      decompressor->reset(new SnappyDecompressor());
      break;
    case columnar::CompressionCodec::LZ4:
      decompressor->reset(new Lz4Decompressor());
      break;
    case columnar::CompressionCodec::ZSTD:
      decompressor->reset(new ZstandardDecompressor());
      break;
    default:
      return Status(TErrorCode::COMPRESSION_ERROR, GetCodecName(format),
          "unsupported compression codec");
  }
  return (*decompressor)->Init();
}
