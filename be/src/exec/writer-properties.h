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


#ifndef STRATA_EXEC_WRITER_PROPERTIES_H
#define STRATA_EXEC_WRITER_PROPERTIES_H

#include <cstdint>
#include <map>
#include <string>

#include "common/status.h"
#include "exec/schema.h"
#include "gen-cpp/columnar_types.h"

namespace strata {

/// Settings of the column chunk, row group and file writers. Defaults match the
/// defaults of the corresponding command line flags.
struct WriterProperties {
  /// Target size of the encoded values of a data page. Pages end at the first record
  /// boundary after the target is reached.
  int64_t data_page_size = 64 * 1024;

  /// Maximum number of level slots of a data page, also enforced at record boundaries.
  int32_t data_page_max_values = 20000;

  /// Limits of a column chunk's dictionary. Exceeding either one makes the chunk fall
  /// back to 'fallback_encoding'.
  int64_t dictionary_page_size = 1024 * 1024;
  int32_t dictionary_max_entries = 40000;

  bool enable_dictionary = true;

  /// Value encoding of chunks that are not, or no longer, dictionary encoded.
  columnar::Encoding::type fallback_encoding = columnar::Encoding::PLAIN;

  /// Per column overrides of 'fallback_encoding', keyed by column path.
  std::map<std::string, columnar::Encoding::type> column_fallback_encodings;

  /// Encoding of repetition and definition levels: RLE or BIT_PACKED.
  columnar::Encoding::type level_encoding = columnar::Encoding::RLE;

  columnar::CompressionCodec::type codec = columnar::CompressionCodec::SNAPPY;
  int compression_level = 0;

  bool enable_page_checksum = true;

  /// Number of records after which a file writer starts a new row group.
  int64_t row_group_max_rows = 1000000;

  /// Number of threads closing the column chunks of a row group.
  int num_threads = 1;

  /// Reads the settings from the command line flags. Returns an error if a flag has an
  /// invalid value.
  static Status FromFlags(WriterProperties* props) WARN_UNUSED_RESULT;

  /// Returns an error if a setting is out of range or names an encoding that can't
  /// be used for its purpose.
  Status Validate() const WARN_UNUSED_RESULT;

  /// Returns the non-dictionary value encoding of the column described by 'desc': its
  /// override or 'fallback_encoding' if the column's type supports it, otherwise PLAIN.
  columnar::Encoding::type GetFallbackEncoding(const ColumnDescriptor& desc) const;

  /// Returns true if the column described by 'desc' starts out dictionary encoded.
  bool UseDictionary(const ColumnDescriptor& desc) const;
};

/// Settings of the column chunk and row group readers.
struct ReaderOptions {
  /// Verify the checksums of pages that have one.
  bool verify_page_checksum = true;

  /// Number of threads decoding the column chunks of a row group.
  int num_threads = 1;

  static ReaderOptions FromFlags();
};

/// Parses an encoding name, e.g. "DELTA_BYTE_ARRAY" (case-insensitive).
Status ParseEncodingName(const std::string& name, columnar::Encoding::type* encoding)
    WARN_UNUSED_RESULT;

}

#endif
