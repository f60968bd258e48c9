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

#include "exec/writer-properties.h"

#include <boost/algorithm/string.hpp>

#include "common/logging.h"
#include "exec/columnar-common.h"
#include "exec/value-codec.h"
#include "util/codec.h"

#include "common/names.h"

DECLARE_int64(data_page_size);
DECLARE_int32(data_page_max_values);
DECLARE_int64(dictionary_page_size);
DECLARE_int32(dictionary_max_entries);
DECLARE_bool(enable_dictionary);
DECLARE_string(fallback_encoding);
DECLARE_string(level_encoding);
DECLARE_string(compression_codec);
DECLARE_int32(compression_level);
DECLARE_bool(enable_page_checksum);
DECLARE_bool(verify_page_checksum);
DECLARE_int64(row_group_max_rows);
DECLARE_int32(chunk_io_threads);

using namespace strata::columnar;

namespace strata {

Status ParseEncodingName(const string& name, Encoding::type* encoding) {
  string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
  for (const auto& entry : _Encoding_VALUES_TO_NAMES) {
    if (upper == entry.second) {
      *encoding = static_cast<Encoding::type>(entry.first);
      return Status::OK();
    }
  }
  return Status("Unknown encoding name '" + name + "'");
}

Status WriterProperties::FromFlags(WriterProperties* props) {
  *props = WriterProperties();
  props->data_page_size = FLAGS_data_page_size;
  props->data_page_max_values = FLAGS_data_page_max_values;
  props->dictionary_page_size = FLAGS_dictionary_page_size;
  props->dictionary_max_entries = FLAGS_dictionary_max_entries;
  props->enable_dictionary = FLAGS_enable_dictionary;
  RETURN_IF_ERROR(ParseEncodingName(FLAGS_fallback_encoding, &props->fallback_encoding));
  RETURN_IF_ERROR(ParseEncodingName(FLAGS_level_encoding, &props->level_encoding));
  RETURN_IF_ERROR(Codec::ParseCodecName(FLAGS_compression_codec, &props->codec));
  props->compression_level = FLAGS_compression_level;
  props->enable_page_checksum = FLAGS_enable_page_checksum;
  props->row_group_max_rows = FLAGS_row_group_max_rows;
  props->num_threads = FLAGS_chunk_io_threads;
  return props->Validate();
}

static bool IsValueEncoding(Encoding::type encoding) {
  return encoding != Encoding::BIT_PACKED && !IsDictionaryEncoding(encoding);
}

Status WriterProperties::Validate() const {
  stringstream ss;
  if (data_page_size <= 0 || data_page_max_values <= 0) {
    ss << "Invalid data page limits: " << data_page_size << " bytes, "
       << data_page_max_values << " values";
  } else if (dictionary_page_size <= 0 || dictionary_max_entries <= 0) {
    ss << "Invalid dictionary limits: " << dictionary_page_size << " bytes, "
       << dictionary_max_entries << " entries";
  } else if (row_group_max_rows <= 0) {
    ss << "Invalid row group size: " << row_group_max_rows << " rows";
  } else if (num_threads <= 0) {
    ss << "Invalid number of threads: " << num_threads;
  } else if (level_encoding != Encoding::RLE && level_encoding != Encoding::BIT_PACKED) {
    ss << "Invalid level encoding " << PrintThriftEnum(level_encoding);
  } else if (!IsValueEncoding(fallback_encoding)) {
    ss << "Invalid fallback encoding " << PrintThriftEnum(fallback_encoding);
  } else {
    for (const auto& entry : column_fallback_encodings) {
      if (IsValueEncoding(entry.second)) continue;
      ss << "Invalid fallback encoding " << PrintThriftEnum(entry.second)
         << " for column '" << entry.first << "'";
      break;
    }
  }
  if (ss.str().empty()) return Status::OK();
  return Status(ss.str());
}

Encoding::type WriterProperties::GetFallbackEncoding(const ColumnDescriptor& desc) const {
  Encoding::type encoding = fallback_encoding;
  auto it = column_fallback_encodings.find(desc.path);
  if (it != column_fallback_encodings.end()) encoding = it->second;
  if (!IsValueEncoding(encoding) || !IsEncodingSupported(encoding, desc.type)) {
    VLOG_FILE << "Column '" << desc.path << "' of type " << PrintThriftEnum(desc.type)
              << " can't use " << PrintThriftEnum(encoding) << ", using PLAIN";
    return Encoding::PLAIN;
  }
  return encoding;
}

bool WriterProperties::UseDictionary(const ColumnDescriptor& desc) const {
  return enable_dictionary && IsEncodingSupported(Encoding::RLE_DICTIONARY, desc.type);
}

ReaderOptions ReaderOptions::FromFlags() {
  ReaderOptions options;
  options.verify_page_checksum = FLAGS_verify_page_checksum;
  options.num_threads = max(1, FLAGS_chunk_io_threads);
  return options;
}

}
