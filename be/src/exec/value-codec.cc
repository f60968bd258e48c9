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

#include "exec/value-codec.h"

#include <type_traits>

#include "exec/columnar-common.h"
#include "util/bit-stream-utils.inline.h"
#include "util/delta-encoding.h"
#include "util/dict-encoding.h"
#include "util/rle-encoding.h"

#include "common/names.h"

using namespace strata::columnar;

namespace strata {

static int FixedLenSize(const ColumnDescriptor& desc) {
  return desc.type == Type::FIXED_LEN_BYTE_ARRAY ? desc.type_length : -1;
}

static Status UnsupportedEncoding(Encoding::type encoding, const ColumnDescriptor& desc) {
  return Status(TErrorCode::UNSUPPORTED_ENCODING, PrintThriftEnum(encoding), desc.path,
      PrintThriftEnum(desc.type));
}

static Status MalformedValues(Encoding::type encoding, const ColumnDescriptor& desc,
    int64_t page_offset, const string& details) {
  return Status(TErrorCode::MALFORMED_ENCODING, PrintThriftEnum(encoding), desc.path,
      page_offset, details);
}

static string CountMismatch(int64_t expected, int64_t actual) {
  stringstream ss;
  ss << "expected " << expected << " values but the stream holds " << actual;
  return ss.str();
}

/// Describes why the delta stream at 'data' was rejected: a value count that differs
/// from 'num_values' is reported as such, anything else as 'other'.
static string StreamHeaderError(const uint8_t* data, int64_t len, int64_t num_values,
    const string& other) {
  DeltaBitPackDecoder<int32_t> header;
  if (len > 0 && header.Init(data, len) && header.total_values() != num_values) {
    return CountMismatch(num_values, header.total_values());
  }
  return other;
}

bool IsEncodingSupported(Encoding::type encoding, Type::type type) {
  switch (encoding) {
    case Encoding::PLAIN:
      return true;
    case Encoding::PLAIN_DICTIONARY:
    case Encoding::RLE_DICTIONARY:
      return type != Type::BOOLEAN;
    case Encoding::RLE:
      return type == Type::BOOLEAN;
    case Encoding::DELTA_BINARY_PACKED:
      return type == Type::INT32 || type == Type::INT64;
    case Encoding::DELTA_LENGTH_BYTE_ARRAY:
      return type == Type::BYTE_ARRAY;
    case Encoding::DELTA_BYTE_ARRAY:
      return type == Type::BYTE_ARRAY || type == Type::FIXED_LEN_BYTE_ARRAY;
    case Encoding::BIT_PACKED:
    default:
      return false;
  }
}

template <typename T>
static void EncodePlain(const ColumnDescriptor& desc, const T* values,
    int64_t num_values, vector<uint8_t>* out) {
  const int fixed_len_size = FixedLenSize(desc);
  int64_t size = 0;
  for (int64_t i = 0; i < num_values; ++i) {
    size += ColumnarPlainEncoder::ByteSize(values[i], fixed_len_size);
  }
  out->resize(size);
  uint8_t* pos = out->data();
  for (int64_t i = 0; i < num_values; ++i) {
    pos += ColumnarPlainEncoder::Encode(values[i], fixed_len_size, pos);
  }
  DCHECK_EQ(pos - out->data(), size);
}

/// Booleans are bit-packed, LSB first.
static void EncodePlain(const ColumnDescriptor& desc, const bool* values,
    int64_t num_values, vector<uint8_t>* out) {
  if (num_values == 0) return;
  out->resize(BitUtil::Ceil(num_values, 8));
  BitWriter writer(out->data(), out->size());
  for (int64_t i = 0; i < num_values; ++i) {
    bool ok = writer.PutValue(values[i], 1);
    DCHECK(ok);
  }
  writer.Flush();
  DCHECK_EQ(writer.bytes_written(), out->size());
}

static void EncodeBoolRle(const bool* values, int64_t num_values,
    vector<uint8_t>* out) {
  if (num_values == 0) return;
  out->resize(RleEncoder::MaxBufferSize(1, num_values));
  RleEncoder encoder(out->data(), out->size(), 1);
  for (int64_t i = 0; i < num_values; ++i) {
    bool ok = encoder.Put(values[i]);
    DCHECK(ok);
  }
  out->resize(encoder.Flush());
}

template <typename T>
Status EncodeValues(Encoding::type encoding, const ColumnDescriptor& desc,
    const T* values, int64_t num_values, vector<uint8_t>* out) {
  out->clear();
  if (!IsEncodingSupported(encoding, desc.type)) {
    return UnsupportedEncoding(encoding, desc);
  }
  switch (encoding) {
    case Encoding::PLAIN:
      EncodePlain(desc, values, num_values, out);
      return Status::OK();
    case Encoding::RLE:
      if constexpr (std::is_same<T, bool>::value) {
        EncodeBoolRle(values, num_values, out);
        return Status::OK();
      }
      break;
    case Encoding::DELTA_BINARY_PACKED:
      if constexpr (std::is_same<T, int32_t>::value || std::is_same<T, int64_t>::value) {
        DeltaBitPackEncoder<T> encoder;
        for (int64_t i = 0; i < num_values; ++i) encoder.Put(values[i]);
        encoder.FlushValues(out);
        return Status::OK();
      }
      break;
    case Encoding::DELTA_LENGTH_BYTE_ARRAY:
      if constexpr (std::is_same<T, string>::value) {
        DeltaLengthByteArrayEncoder encoder;
        for (int64_t i = 0; i < num_values; ++i) encoder.Put(values[i]);
        encoder.FlushValues(out);
        return Status::OK();
      }
      break;
    case Encoding::DELTA_BYTE_ARRAY:
      if constexpr (std::is_same<T, string>::value) {
        DeltaByteArrayEncoder encoder;
        for (int64_t i = 0; i < num_values; ++i) encoder.Put(values[i]);
        encoder.FlushValues(out);
        return Status::OK();
      }
      break;
    default:
      // Dictionary pages are built by DictEncoder.
      break;
  }
  return UnsupportedEncoding(encoding, desc);
}

template Status EncodeValues<bool>(Encoding::type, const ColumnDescriptor&,
    const bool*, int64_t, vector<uint8_t>*);
template Status EncodeValues<int32_t>(Encoding::type, const ColumnDescriptor&,
    const int32_t*, int64_t, vector<uint8_t>*);
template Status EncodeValues<int64_t>(Encoding::type, const ColumnDescriptor&,
    const int64_t*, int64_t, vector<uint8_t>*);
template Status EncodeValues<Int96>(Encoding::type, const ColumnDescriptor&,
    const Int96*, int64_t, vector<uint8_t>*);
template Status EncodeValues<float>(Encoding::type, const ColumnDescriptor&,
    const float*, int64_t, vector<uint8_t>*);
template Status EncodeValues<double>(Encoding::type, const ColumnDescriptor&,
    const double*, int64_t, vector<uint8_t>*);
template Status EncodeValues<string>(Encoding::type, const ColumnDescriptor&,
    const string*, int64_t, vector<uint8_t>*);

static Status CheckValueTypes(const ColumnDescriptor& desc,
    const PrimitiveValue* values, int64_t num_values) {
  for (int64_t i = 0; i < num_values; ++i) {
    if (UNLIKELY(!PrimitiveValueMatchesType(values[i], desc.type, desc.type_length))) {
      stringstream ss;
      ss << "value " << values[i] << " is not a valid " << PrintThriftEnum(desc.type);
      return Status(TErrorCode::SCHEMA_VIOLATION, desc.path, ss.str());
    }
  }
  return Status::OK();
}

template <typename T>
static Status EncodeUnwrapped(Encoding::type encoding, const ColumnDescriptor& desc,
    const PrimitiveValue* values, int64_t num_values, vector<uint8_t>* out) {
  // vector<bool> has no contiguous storage.
  unique_ptr<T[]> typed(new T[num_values]);
  for (int64_t i = 0; i < num_values; ++i) typed[i] = std::get<T>(values[i]);
  return EncodeValues<T>(encoding, desc, typed.get(), num_values, out);
}

Status EncodeValues(Encoding::type encoding, const ColumnDescriptor& desc,
    const PrimitiveValue* values, int64_t num_values, vector<uint8_t>* out) {
  RETURN_IF_ERROR(CheckValueTypes(desc, values, num_values));
  switch (desc.type) {
    case Type::BOOLEAN:
      return EncodeUnwrapped<bool>(encoding, desc, values, num_values, out);
    case Type::INT32:
      return EncodeUnwrapped<int32_t>(encoding, desc, values, num_values, out);
    case Type::INT64:
      return EncodeUnwrapped<int64_t>(encoding, desc, values, num_values, out);
    case Type::INT96:
      return EncodeUnwrapped<Int96>(encoding, desc, values, num_values, out);
    case Type::FLOAT:
      return EncodeUnwrapped<float>(encoding, desc, values, num_values, out);
    case Type::DOUBLE:
      return EncodeUnwrapped<double>(encoding, desc, values, num_values, out);
    case Type::BYTE_ARRAY:
    case Type::FIXED_LEN_BYTE_ARRAY:
      return EncodeUnwrapped<string>(encoding, desc, values, num_values, out);
  }
  return UnsupportedEncoding(encoding, desc);
}

template <typename T>
static Status EncodeDictionaryTyped(const ColumnDescriptor& desc,
    const PrimitiveValue* values, int64_t num_values, vector<uint8_t>* dict_data,
    int* num_entries, vector<uint8_t>* indices) {
  DictEncoder<T> encoder(
      ColumnarPlainEncoder::EncodedByteSize(desc.type, desc.type_length), num_values);
  for (int64_t i = 0; i < num_values; ++i) {
    int bytes_added = encoder.Put(std::get<T>(values[i]));
    DCHECK_GE(bytes_added, 0);
  }
  *num_entries = encoder.num_entries();
  dict_data->resize(encoder.dict_encoded_size());
  encoder.WriteDict(dict_data->data());
  indices->resize(encoder.EstimatedDataEncodedSize());
  int len = encoder.WriteData(indices->data(), indices->size());
  while (UNLIKELY(len < 0)) {
    indices->resize(indices->size() * 2);
    len = encoder.WriteData(indices->data(), indices->size());
  }
  indices->resize(len);
  return Status::OK();
}

Status EncodeDictionary(const ColumnDescriptor& desc, const PrimitiveValue* values,
    int64_t num_values, vector<uint8_t>* dict_data, int* num_entries,
    vector<uint8_t>* indices) {
  dict_data->clear();
  indices->clear();
  *num_entries = 0;
  if (!IsEncodingSupported(Encoding::RLE_DICTIONARY, desc.type)) {
    return UnsupportedEncoding(Encoding::RLE_DICTIONARY, desc);
  }
  RETURN_IF_ERROR(CheckValueTypes(desc, values, num_values));
  if (num_values == 0) return Status::OK();
  switch (desc.type) {
    case Type::INT32:
      return EncodeDictionaryTyped<int32_t>(
          desc, values, num_values, dict_data, num_entries, indices);
    case Type::INT64:
      return EncodeDictionaryTyped<int64_t>(
          desc, values, num_values, dict_data, num_entries, indices);
    case Type::INT96:
      return EncodeDictionaryTyped<Int96>(
          desc, values, num_values, dict_data, num_entries, indices);
    case Type::FLOAT:
      return EncodeDictionaryTyped<float>(
          desc, values, num_values, dict_data, num_entries, indices);
    case Type::DOUBLE:
      return EncodeDictionaryTyped<double>(
          desc, values, num_values, dict_data, num_entries, indices);
    case Type::BYTE_ARRAY:
    case Type::FIXED_LEN_BYTE_ARRAY:
      return EncodeDictionaryTyped<string>(
          desc, values, num_values, dict_data, num_entries, indices);
    default:
      break;
  }
  return UnsupportedEncoding(Encoding::RLE_DICTIONARY, desc);
}

static Status DecodeDictionaryIndices(Encoding::type encoding,
    const ColumnDescriptor& desc, const uint8_t* data, int64_t len, int64_t num_values,
    const DictionaryTable* dict, vector<PrimitiveValue>* out, int64_t page_offset) {
  if (dict == nullptr) {
    stringstream ss;
    ss << PrintThriftEnum(encoding) << " page at offset " << page_offset
       << " has no dictionary page";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, desc.path, ss.str());
  }
  DictIndexDecoder decoder(dict->num_entries());
  if (!decoder.SetData(data, len)) {
    return MalformedValues(encoding, desc, page_offset, "missing or invalid bit width");
  }
  DictIndexDecoder::IndexType indices[DICT_DECODER_BUFFER_SIZE];
  int64_t num_decoded = 0;
  while (num_decoded < num_values) {
    int batch = min<int64_t>(num_values - num_decoded, DICT_DECODER_BUFFER_SIZE);
    if (UNLIKELY(!decoder.GetNextIndices(batch, indices))) {
      stringstream ss;
      ss << "truncated or out of range dictionary index after " << num_decoded
         << " of " << num_values << " values (dictionary has " << dict->num_entries()
         << " entries)";
      return MalformedValues(encoding, desc, page_offset, ss.str());
    }
    for (int i = 0; i < batch; ++i) out->push_back(dict->value(indices[i]));
    num_decoded += batch;
  }
  return Status::OK();
}

static Status DecodeBool(Encoding::type encoding, const ColumnDescriptor& desc,
    const uint8_t* data, int64_t len, int64_t num_values, vector<PrimitiveValue>* out,
    int64_t page_offset) {
  vector<uint8_t> bits;
  if (encoding == Encoding::PLAIN) {
    if (len != BitUtil::Ceil(num_values, 8)) {
      stringstream ss;
      ss << len << " bytes for " << num_values << " bit-packed values";
      return MalformedValues(encoding, desc, page_offset, ss.str());
    }
    if (num_values == 0) return Status::OK();
    bits.resize(num_values);
    BatchedBitReader reader(data, len);
    int num_read = reader.UnpackBatch(1, num_values, bits.data());
    DCHECK_EQ(num_read, num_values);
  } else {
    DCHECK_EQ(encoding, Encoding::RLE);
    if (len == 0) {
      return MalformedValues(encoding, desc, page_offset, CountMismatch(num_values, 0));
    }
    RleBatchDecoder<uint8_t> decoder;
    decoder.Reset(data, len, 1);
    int64_t num_read = 0;
    while (num_read < num_values) {
      int32_t batch = min<int64_t>(num_values - num_read, 1024);
      bits.resize(num_read + batch);
      int32_t n = decoder.GetValues(batch, bits.data() + num_read);
      if (n == 0) break;
      num_read += n;
    }
    if (num_read != num_values) {
      return MalformedValues(encoding, desc, page_offset,
          CountMismatch(num_values, num_read));
    }
  }
  for (uint8_t bit : bits) out->emplace_back(bit != 0);
  return Status::OK();
}

template <typename T, Type::type TYPE>
static Status DecodeTyped(Encoding::type encoding, const ColumnDescriptor& desc,
    const uint8_t* data, int64_t len, int64_t num_values, vector<PrimitiveValue>* out,
    int64_t page_offset) {
  const uint8_t* end = data + len;
  switch (encoding) {
    case Encoding::PLAIN: {
      const int fixed_len_size = FixedLenSize(desc);
      const uint8_t* pos = data;
      for (int64_t i = 0; i < num_values; ++i) {
        T v;
        int decoded_len = ColumnarPlainEncoder::Decode<T, TYPE>(pos, end,
            fixed_len_size, &v);
        if (UNLIKELY(decoded_len < 0)) {
          stringstream ss;
          ss << "value " << i << " of " << num_values << " is truncated";
          return MalformedValues(encoding, desc, page_offset, ss.str());
        }
        pos += decoded_len;
        out->emplace_back(std::in_place_type<T>, std::move(v));
      }
      if (pos != end) {
        stringstream ss;
        ss << (end - pos) << " bytes left after " << num_values << " values";
        return MalformedValues(encoding, desc, page_offset, ss.str());
      }
      return Status::OK();
    }
    case Encoding::DELTA_BINARY_PACKED:
      if constexpr (std::is_same<T, int32_t>::value || std::is_same<T, int64_t>::value) {
        DeltaBitPackDecoder<T> decoder;
        if (len == 0 || !decoder.Init(data, len)) {
          return MalformedValues(encoding, desc, page_offset, "invalid stream header");
        }
        if (decoder.total_values() != num_values) {
          return MalformedValues(encoding, desc, page_offset,
              CountMismatch(num_values, decoder.total_values()));
        }
        vector<T> values(num_values);
        if (!decoder.GetValues(num_values, values.data())) {
          return MalformedValues(encoding, desc, page_offset, "truncated block");
        }
        if (decoder.buffer_pos() != end) {
          return MalformedValues(encoding, desc, page_offset, "trailing bytes");
        }
        for (T v : values) out->emplace_back(std::in_place_type<T>, v);
        return Status::OK();
      }
      break;
    case Encoding::DELTA_LENGTH_BYTE_ARRAY:
    case Encoding::DELTA_BYTE_ARRAY:
      if constexpr (std::is_same<T, string>::value) {
        // The decoders bound 'num_values' by the stream size, so 'values' is only
        // sized once Init() has succeeded.
        vector<string> values;
        const uint8_t* stream_end;
        if (encoding == Encoding::DELTA_LENGTH_BYTE_ARRAY) {
          DeltaLengthByteArrayDecoder decoder;
          if (len == 0 || !decoder.Init(data, len, num_values)) {
            return MalformedValues(encoding, desc, page_offset,
                StreamHeaderError(data, len, num_values, "invalid lengths"));
          }
          values.resize(num_values);
          if (!decoder.GetValues(num_values, values.data())) {
            return MalformedValues(encoding, desc, page_offset, "truncated values");
          }
          stream_end = decoder.buffer_end();
        } else {
          DeltaByteArrayDecoder decoder;
          if (len == 0 || !decoder.Init(data, len, num_values)) {
            return MalformedValues(encoding, desc, page_offset, StreamHeaderError(
                data, len, num_values, "invalid prefix or suffix lengths"));
          }
          values.resize(num_values);
          if (!decoder.GetValues(num_values, values.data())) {
            return MalformedValues(encoding, desc, page_offset,
                "prefix longer than the previous value");
          }
          stream_end = decoder.buffer_end();
        }
        if (stream_end != end) {
          return MalformedValues(encoding, desc, page_offset, "trailing bytes");
        }
        for (string& v : values) {
          if (TYPE == Type::FIXED_LEN_BYTE_ARRAY && v.size() != desc.type_length) {
            stringstream ss;
            ss << "value of " << v.size() << " bytes in a column of length "
               << desc.type_length;
            return MalformedValues(encoding, desc, page_offset, ss.str());
          }
          out->emplace_back(std::in_place_type<string>, std::move(v));
        }
        return Status::OK();
      }
      break;
    default:
      break;
  }
  return UnsupportedEncoding(encoding, desc);
}

Status DecodeValues(Encoding::type encoding, const ColumnDescriptor& desc,
    const uint8_t* data, int64_t len, int64_t num_values, const DictionaryTable* dict,
    vector<PrimitiveValue>* out, int64_t page_offset) {
  if (!IsEncodingSupported(encoding, desc.type)) {
    return UnsupportedEncoding(encoding, desc);
  }
  if (UNLIKELY(num_values < 0 || len < 0)) {
    stringstream ss;
    ss << "invalid value count " << num_values << " or length " << len;
    return MalformedValues(encoding, desc, page_offset, ss.str());
  }
  if (num_values == 0 && len == 0) return Status::OK();
  // 'num_values' comes from the page header; only reserve what 'len' bytes could
  // plausibly hold and let run-length encoded pages grow the output as they decode.
  out->reserve(out->size() + min<int64_t>(num_values, len * 8));
  if (IsDictionaryEncoding(encoding)) {
    return DecodeDictionaryIndices(encoding, desc, data, len, num_values, dict, out,
        page_offset);
  }
  switch (desc.type) {
    case Type::BOOLEAN:
      return DecodeBool(encoding, desc, data, len, num_values, out, page_offset);
    case Type::INT32:
      return DecodeTyped<int32_t, Type::INT32>(
          encoding, desc, data, len, num_values, out, page_offset);
    case Type::INT64:
      return DecodeTyped<int64_t, Type::INT64>(
          encoding, desc, data, len, num_values, out, page_offset);
    case Type::INT96:
      return DecodeTyped<Int96, Type::INT96>(
          encoding, desc, data, len, num_values, out, page_offset);
    case Type::FLOAT:
      return DecodeTyped<float, Type::FLOAT>(
          encoding, desc, data, len, num_values, out, page_offset);
    case Type::DOUBLE:
      return DecodeTyped<double, Type::DOUBLE>(
          encoding, desc, data, len, num_values, out, page_offset);
    case Type::BYTE_ARRAY:
      return DecodeTyped<string, Type::BYTE_ARRAY>(
          encoding, desc, data, len, num_values, out, page_offset);
    case Type::FIXED_LEN_BYTE_ARRAY:
      return DecodeTyped<string, Type::FIXED_LEN_BYTE_ARRAY>(
          encoding, desc, data, len, num_values, out, page_offset);
  }
  return UnsupportedEncoding(encoding, desc);
}

Status DictionaryTable::Init(const ColumnDescriptor& desc, const uint8_t* data,
    int64_t len, int num_entries, int64_t page_offset) {
  values_.clear();
  if (!IsEncodingSupported(Encoding::PLAIN_DICTIONARY, desc.type)) {
    return UnsupportedEncoding(Encoding::PLAIN_DICTIONARY, desc);
  }
  // Dictionary entries are PLAIN encoded.
  return DecodeValues(Encoding::PLAIN, desc, data, len, num_entries, nullptr, &values_,
      page_offset);
}

}
