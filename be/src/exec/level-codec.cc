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

#include "exec/level-codec.h"

#include "exec/columnar-common.h"
#include "util/bit-stream-utils.inline.h"
#include "util/bit-util.h"
#include "util/rle-encoding.h"

#include "common/names.h"

namespace strata {

int LevelBitWidth(int max_level) {
  return BitUtil::Log2Ceiling64(max_level + 1);
}

LevelEncoder::LevelEncoder(columnar::Encoding::type encoding, int max_level)
  : encoding_(encoding), max_level_(max_level), bit_width_(LevelBitWidth(max_level)) {
  DCHECK_GE(max_level, 0);
}

int64_t LevelEncoder::MaxBufferSize(int64_t num_levels) const {
  if (max_level_ == 0) return 0;
  if (encoding_ == columnar::Encoding::BIT_PACKED) {
    return BitUtil::Ceil(num_levels * bit_width_, 8);
  }
  return RleEncoder::MaxBufferSize(bit_width_, num_levels);
}

Status LevelEncoder::Encode(const int16_t* levels, int64_t num_levels,
    vector<uint8_t>* out) {
  out->clear();
  if (!LevelDecoder::IsLevelEncoding(encoding_)) {
    return Status(TErrorCode::UNSUPPORTED_ENCODING, PrintThriftEnum(encoding_),
        "<levels>", "INT16");
  }
  if (max_level_ == 0 || num_levels == 0) return Status::OK();
  out->resize(MaxBufferSize(num_levels));
  int len;
  if (encoding_ == columnar::Encoding::BIT_PACKED) {
    BitWriter writer(out->data(), out->size());
    for (int64_t i = 0; i < num_levels; ++i) {
      DCHECK_LE(levels[i], max_level_);
      bool ok = writer.PutValue(levels[i], bit_width_);
      DCHECK(ok) << "buffer sized by MaxBufferSize() is too small";
    }
    writer.Flush();
    len = writer.bytes_written();
  } else {
    RleEncoder encoder(out->data(), out->size(), bit_width_);
    for (int64_t i = 0; i < num_levels; ++i) {
      DCHECK_LE(levels[i], max_level_);
      bool ok = encoder.Put(levels[i]);
      DCHECK(ok) << "buffer sized by MaxBufferSize() is too small";
    }
    len = encoder.Flush();
  }
  out->resize(len);
  return Status::OK();
}

static Status MalformedLevels(const string& column_path,
    columnar::Encoding::type encoding, int64_t page_offset, const string& details) {
  return Status(TErrorCode::MALFORMED_ENCODING, PrintThriftEnum(encoding) + " level",
      column_path, page_offset, details);
}

Status LevelDecoder::Decode(const string& column_path, columnar::Encoding::type encoding,
    int max_level, const uint8_t* data, int64_t len, int64_t num_levels,
    int64_t page_offset, vector<int16_t>* levels) {
  if (!IsLevelEncoding(encoding)) {
    return Status(TErrorCode::UNSUPPORTED_ENCODING, PrintThriftEnum(encoding),
        column_path, "levels");
  }
  levels->clear();
  if (UNLIKELY(num_levels < 0 || len < 0)) {
    stringstream ss;
    ss << "invalid level count " << num_levels << " or length " << len;
    return MalformedLevels(column_path, encoding, page_offset, ss.str());
  }
  if (max_level == 0) {
    if (len != 0) {
      return MalformedLevels(column_path, encoding, page_offset,
          std::to_string(len) + " bytes of levels for a max level of 0");
    }
    levels->assign(num_levels, 0);
    return Status::OK();
  }
  if (num_levels == 0) return Status::OK();
  if (len == 0) {
    return MalformedLevels(column_path, encoding, page_offset,
        "no level data for " + std::to_string(num_levels) + " levels");
  }
  int bit_width = LevelBitWidth(max_level);
  // 'decoded' only grows by what the input actually holds, so a forged level count
  // fails before it is allocated.
  vector<uint16_t> decoded;
  if (encoding == columnar::Encoding::BIT_PACKED) {
    if (num_levels > len * 8 / bit_width) {
      stringstream ss;
      ss << len << " bytes are too few for " << num_levels << " levels of "
         << bit_width << " bits";
      return MalformedLevels(column_path, encoding, page_offset, ss.str());
    }
    decoded.resize(num_levels);
    BatchedBitReader reader(data, len);
    int64_t num_read = reader.UnpackBatch(bit_width, num_levels, decoded.data());
    DCHECK_EQ(num_read, num_levels);
  } else {
    RleBatchDecoder<uint16_t> decoder;
    decoder.Reset(data, len, bit_width);
    int64_t num_read = 0;
    while (num_read < num_levels) {
      int32_t batch = min<int64_t>(num_levels - num_read, 1024);
      decoded.resize(num_read + batch);
      int32_t n = decoder.GetValues(batch, decoded.data() + num_read);
      if (n == 0) break;
      num_read += n;
    }
    if (num_read != num_levels) {
      stringstream ss;
      ss << "decoded " << num_read << " of " << num_levels << " levels";
      if (decoder.corrupt()) ss << " before an invalid run header";
      return MalformedLevels(column_path, encoding, page_offset, ss.str());
    }
  }
  levels->resize(num_levels);
  for (int64_t i = 0; i < num_levels; ++i) {
    if (UNLIKELY(decoded[i] > max_level)) {
      stringstream ss;
      ss << "level " << decoded[i] << " at position " << i << " exceeds the max level "
         << max_level;
      return MalformedLevels(column_path, encoding, page_offset, ss.str());
    }
    (*levels)[i] = decoded[i];
  }
  return Status::OK();
}

}
