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


//
// This file contains global flags, ie, flags which don't belong to a particular
// component, or flags that are referenced from multiple places and having them here
// calms the linker errors that would otherwise ensue. The writer and reader read them
// through WriterProperties::FromFlags() and ReaderOptions::FromFlags().

#include <string>

#include "common/logging.h"

#include "common/names.h"

DEFINE_int64(data_page_size, 64 * 1024, "Target size in bytes of the encoded values of a "
    "data page. A page is finalized at the first record boundary after the size is "
    "reached.");
DEFINE_int32(data_page_max_values, 20000, "Maximum number of level slots in a data page. "
    "A page is finalized at the first record boundary after the limit is reached.");
DEFINE_int64(dictionary_page_size, 1024 * 1024, "(Advanced) Maximum size in bytes of a "
    "column chunk's dictionary. A column chunk whose dictionary would grow beyond it "
    "falls back to a non-dictionary encoding.");
DEFINE_int32(dictionary_max_entries, 40000, "Maximum number of distinct values in a "
    "column chunk's dictionary. Once a column chunk sees more distinct values it falls "
    "back to --fallback_encoding for the rest of the chunk.");
DEFINE_bool(enable_dictionary, true, "If true, column chunks start out dictionary "
    "encoded when the physical type supports it.");
DEFINE_string(fallback_encoding, "PLAIN", "Value encoding used by column chunks that "
    "are not dictionary encoded. One of PLAIN, DELTA_BINARY_PACKED (INT32/INT64 only), "
    "DELTA_LENGTH_BYTE_ARRAY or DELTA_BYTE_ARRAY (BYTE_ARRAY only). Columns whose type "
    "doesn't support it use PLAIN.");
DEFINE_string(level_encoding, "RLE", "Encoding of repetition and definition levels. "
    "One of RLE or BIT_PACKED.");
DEFINE_string(compression_codec, "SNAPPY", "Compression codec for pages. One of NONE, "
    "SNAPPY, GZIP, DEFLATE, LZ4 or ZSTD.");
DEFINE_int32(compression_level, 0, "(Advanced) Compression level for codecs that "
    "support it. 0 uses the codec's default.");
DEFINE_bool(enable_page_checksum, true, "If true, writers store a CRC-32 of every "
    "page's compressed payload in the page header.");
DEFINE_bool(verify_page_checksum, true, "If true, readers verify page checksums when "
    "they are present.");
DEFINE_int64(row_group_max_rows, 1000000, "Number of records after which the file "
    "writer closes the current row group and starts a new one.");
DEFINE_int32(chunk_io_threads, 1, "Number of threads used to close or decode the "
    "column chunks of one row group. 1 processes column chunks serially.");
