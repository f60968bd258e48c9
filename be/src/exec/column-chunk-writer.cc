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

#include "exec/column-chunk-writer.h"

#include <boost/scoped_ptr.hpp>

#include "common/logging.h"
#include "exec/column-stats.inline.h"
#include "exec/columnar-common.h"
#include "exec/level-codec.h"
#include "exec/value-codec.h"
#include "util/bit-util.h"
#include "util/dict-encoding.h"

#include "common/names.h"

using boost::scoped_ptr;
using namespace strata::columnar;

namespace strata {

// Per type column chunk writer.
template <typename T>
class ColumnWriter : public ColumnChunkWriter {
 public:
  ColumnWriter(const ColumnDescriptor& desc, const WriterProperties& props,
      StorageSink* sink, const std::atomic<bool>* cancelled)
    : ColumnChunkWriter(desc, props, sink, cancelled),
      plain_encoded_value_size_(
          ColumnarPlainEncoder::EncodedByteSize(desc.type, desc.type_length)),
      page_stats_(plain_encoded_value_size_),
      chunk_stats_(plain_encoded_value_size_) {
    DCHECK_NE(desc.type, Type::BOOLEAN);
    page_stats_base_ = &page_stats_;
    chunk_stats_base_ = &chunk_stats_;
  }

 protected:
  virtual Status Init() override {
    RETURN_IF_ERROR(ColumnChunkWriter::Init());
    if (props_.UseDictionary(desc_)) {
      // Default to dictionary encoding. If the cardinality ends up being too high,
      // it will fall back to the fallback encoding.
      current_encoding_ = Encoding::RLE_DICTIONARY;
      next_page_encoding_ = Encoding::RLE_DICTIONARY;
      dict_encoder_.reset(
          new DictEncoder<T>(plain_encoded_value_size_, props_.dictionary_max_entries));
    }
    return Status::OK();
  }

  virtual bool ProcessValue(const PrimitiveValue& value) override {
    const T& v = std::get<T>(value);
    if (current_encoding_ == Encoding::RLE_DICTIONARY) {
      if (UNLIKELY(dict_encoder_->dict_encoded_size() >= props_.dictionary_page_size)) {
        return false;
      }
      if (UNLIKELY(dict_encoder_->Put(v) < 0)) return false;
      if (UNLIKELY(++num_values_since_dict_size_check_ >=
                   DICTIONARY_DATA_PAGE_SIZE_CHECK_PERIOD)) {
        num_values_since_dict_size_check_ = 0;
        page_values_size_ = dict_encoder_->EstimatedDataEncodedSize();
        if (page_values_size_ >= props_.data_page_size) page_full_ = true;
      }
    } else {
      page_values_size_ += ColumnarPlainEncoder::ByteSize(v, plain_encoded_value_size_);
      if (page_values_size_ >= props_.data_page_size) page_full_ = true;
    }
    page_values_.push_back(v);
    page_stats_.Update(v);
    return true;
  }

  virtual Status EncodePageValues(
      Encoding::type encoding, vector<uint8_t>* out) override {
    if (IsDictionaryEncoding(encoding)) {
      DCHECK(dict_encoder_ != nullptr);
      out->resize(dict_encoder_->EstimatedDataEncodedSize());
      int len = dict_encoder_->WriteData(out->data(), out->size());
      while (UNLIKELY(len < 0)) {
        // len < 0 indicates the data doesn't fit into the buffer.
        out->resize(out->size() * 2);
        len = dict_encoder_->WriteData(out->data(), out->size());
      }
      out->resize(len);
      dict_encoder_->ClearIndices();
    } else {
      RETURN_IF_ERROR(EncodeValues<T>(
          encoding, desc_, page_values_.data(), page_values_.size(), out));
    }
    page_values_.clear();
    num_values_since_dict_size_check_ = 0;
    return Status::OK();
  }

  virtual void ConvertPageToFallback() override {
    DCHECK(dict_encoder_ != nullptr);
    dict_encoder_->ClearIndices();
    page_values_size_ = 0;
    for (const T& v : page_values_) {
      page_values_size_ += ColumnarPlainEncoder::ByteSize(v, plain_encoded_value_size_);
    }
    page_full_ = page_values_size_ >= props_.data_page_size;
  }

  virtual Status WriteDictionaryPage(ColumnarPage* page, bool* has_dictionary) override {
    *has_dictionary = dict_encoder_ != nullptr && num_dict_data_pages_ > 0;
    if (!*has_dictionary) return Status::OK();
    vector<uint8_t> dict_buffer(dict_encoder_->dict_encoded_size());
    dict_encoder_->WriteDict(dict_buffer.data());
    return page_writer_.WriteDictionaryPage(
        dict_buffer.data(), dict_buffer.size(), dict_encoder_->num_entries(), page);
  }

  virtual int dictionary_size() const override {
    return dict_encoder_ == nullptr ? -1 : dict_encoder_->num_entries();
  }

 private:
  // The period, in # of values, to check the estimated size of the dictionary indices
  // against the data page size. The estimate is not cheap to compute and the page may
  // go over the target size by a few bytes.
  static const int DICTIONARY_DATA_PAGE_SIZE_CHECK_PERIOD = 100;

  // Size of each encoded value in plain encoding. -1 if the type is variable-length.
  const int plain_encoded_value_size_;

  // Null if the column is not dictionary encoded.
  scoped_ptr<DictEncoder<T>> dict_encoder_;

  // The number of values added since we last checked the dictionary.
  int num_values_since_dict_size_check_ = 0;

  // Non-null values of the current page, kept to encode them with the fallback
  // encoding if the dictionary overflows mid-page.
  vector<T> page_values_;

  // Tracks statistics per page. These are written to the page locations and merged
  // into the chunk stats.
  ColumnStats<T> page_stats_;

  // Tracks statistics of the whole chunk.
  ColumnStats<T> chunk_stats_;
};

// Bools are encoded a bit differently so subclass it explicitly.
class BoolColumnWriter : public ColumnChunkWriter {
 public:
  BoolColumnWriter(const ColumnDescriptor& desc, const WriterProperties& props,
      StorageSink* sink, const std::atomic<bool>* cancelled)
    : ColumnChunkWriter(desc, props, sink, cancelled),
      page_stats_(-1),
      chunk_stats_(-1) {
    DCHECK_EQ(desc.type, Type::BOOLEAN);
    // Dictionary encoding doesn't make sense for bools.
    page_stats_base_ = &page_stats_;
    chunk_stats_base_ = &chunk_stats_;
  }

 protected:
  virtual bool ProcessValue(const PrimitiveValue& value) override {
    bool v = std::get<bool>(value);
    page_values_.push_back(v);
    page_values_size_ = BitUtil::Ceil(page_values_.size(), 8);
    if (page_values_size_ >= props_.data_page_size) page_full_ = true;
    page_stats_.Update(v);
    return true;
  }

  virtual Status EncodePageValues(
      Encoding::type encoding, vector<uint8_t>* out) override {
    // vector<bool> has no contiguous storage.
    unique_ptr<bool[]> values(new bool[page_values_.size()]);
    for (int i = 0; i < page_values_.size(); ++i) values[i] = page_values_[i] != 0;
    RETURN_IF_ERROR(
        EncodeValues<bool>(encoding, desc_, values.get(), page_values_.size(), out));
    page_values_.clear();
    return Status::OK();
  }

 private:
  // Values of the current page, one byte each.
  vector<uint8_t> page_values_;

  ColumnStats<bool> page_stats_;
  ColumnStats<bool> chunk_stats_;
};

Status ColumnChunkWriter::Create(const ColumnDescriptor& desc,
    const WriterProperties& props, StorageSink* sink, const std::atomic<bool>* cancelled,
    unique_ptr<ColumnChunkWriter>* writer) {
  DCHECK(sink != nullptr);
  switch (desc.type) {
    case Type::BOOLEAN:
      writer->reset(new BoolColumnWriter(desc, props, sink, cancelled));
      break;
    case Type::INT32:
      writer->reset(new ColumnWriter<int32_t>(desc, props, sink, cancelled));
      break;
    case Type::INT64:
      writer->reset(new ColumnWriter<int64_t>(desc, props, sink, cancelled));
      break;
    case Type::INT96:
      writer->reset(new ColumnWriter<Int96>(desc, props, sink, cancelled));
      break;
    case Type::FLOAT:
      writer->reset(new ColumnWriter<float>(desc, props, sink, cancelled));
      break;
    case Type::DOUBLE:
      writer->reset(new ColumnWriter<double>(desc, props, sink, cancelled));
      break;
    case Type::BYTE_ARRAY:
    case Type::FIXED_LEN_BYTE_ARRAY:
      writer->reset(new ColumnWriter<string>(desc, props, sink, cancelled));
      break;
    default:
      return Status(TErrorCode::SCHEMA_VIOLATION, desc.path,
          "unknown physical type " + PrintThriftEnum(desc.type));
  }
  return (*writer)->Init();
}

ColumnChunkWriter::ColumnChunkWriter(const ColumnDescriptor& desc,
    const WriterProperties& props, StorageSink* sink, const std::atomic<bool>* cancelled)
  : desc_(desc),
    props_(props),
    sink_(sink),
    cancelled_(cancelled),
    page_writer_(props.codec, props.compression_level, props.enable_page_checksum) {
  current_encoding_ = props.GetFallbackEncoding(desc);
  next_page_encoding_ = current_encoding_;
}

Status ColumnChunkWriter::Init() {
  RETURN_IF_ERROR(props_.Validate());
  RETURN_IF_ERROR(page_writer_.Init());
  // Repetition/definition level encodings are constant. Incorporate them here.
  column_encodings_.insert(props_.level_encoding);
  return Status::OK();
}

Status ColumnChunkWriter::CheckEntry(
    int16_t rep_level, int16_t def_level, const PrimitiveValue* value) const {
  stringstream ss;
  if (rep_level < 0 || rep_level > desc_.max_rep_level) {
    ss << "repetition level " << rep_level << " is outside [0, " << desc_.max_rep_level
       << "]";
  } else if (def_level < 0 || def_level > desc_.max_def_level) {
    ss << "definition level " << def_level << " is outside [0, " << desc_.max_def_level
       << "]";
  } else if (num_values_ == 0 && rep_level != 0) {
    ss << "the first entry of a chunk has repetition level " << rep_level;
  } else if ((value != nullptr) != (def_level == desc_.max_def_level)) {
    ss << "entry with definition level " << def_level
       << (value == nullptr ? " has no value" : " has a value");
  } else if (value != nullptr
      && !PrimitiveValueMatchesType(*value, desc_.type, desc_.type_length)) {
    ss << "value " << *value << " is not a valid " << PrintThriftEnum(desc_.type);
  } else {
    return Status::OK();
  }
  return Status(TErrorCode::SCHEMA_VIOLATION, desc_.path, ss.str());
}

Status ColumnChunkWriter::AppendEntry(
    int16_t rep_level, int16_t def_level, const PrimitiveValue* value) {
  DCHECK(!closed_);
  RETURN_IF_ERROR(CheckEntry(rep_level, def_level, value));

  // Pages only end before the first entry of a record.
  if (rep_level == 0 && page_num_values_ > 0 && IsPageFull()) {
    RETURN_IF_ERROR(FinalizeCurrentPage());
    NewPage();
  }

  if (value == nullptr) {
    // Nulls don't get encoded. Increment the null count of the page statistics.
    page_stats_base_->IncrementNullCount(1);
  } else {
    if (UNLIKELY(!ProcessValue(*value))) {
      // The dictionary is full. Switch to the fallback encoding for good.
      next_page_encoding_ = props_.GetFallbackEncoding(desc_);
      LOG(WARNING) << "Dictionary of column '" << desc_.path << "' is full after "
                   << dictionary_size() << " entries, falling back to "
                   << PrintThriftEnum(next_page_encoding_);
      if (rep_level == 0 && page_num_values_ > 0) {
        RETURN_IF_ERROR(FinalizeCurrentPage());
        NewPage();
      } else {
        // The page already holds entries of this record and can't be ended here.
        ConvertPageToFallback();
        current_encoding_ = next_page_encoding_;
      }
      bool ret = ProcessValue(*value);
      // Appending with a non-dictionary encoding always succeeds.
      DCHECK(ret);
    }
    ++page_num_non_null_;
  }

  rep_levels_.push_back(rep_level);
  def_levels_.push_back(def_level);
  ++page_num_values_;
  ++num_values_;
  if (rep_level == 0) {
    ++page_num_rows_;
    ++num_rows_;
  }
  return Status::OK();
}

Status ColumnChunkWriter::AppendColumn(const ShreddedColumn& column) {
  DCHECK_EQ(column.rep_levels.size(), column.def_levels.size());
  int64_t value_idx = 0;
  for (int64_t i = 0; i < column.num_entries(); ++i) {
    const PrimitiveValue* value = nullptr;
    if (column.def_levels[i] == desc_.max_def_level) {
      if (UNLIKELY(value_idx >= column.values.size())) {
        return Status(TErrorCode::SCHEMA_VIOLATION, desc_.path,
            "fewer values than defined entries");
      }
      value = &column.values[value_idx++];
    }
    RETURN_IF_ERROR(AppendEntry(column.rep_levels[i], column.def_levels[i], value));
  }
  if (UNLIKELY(value_idx != column.values.size())) {
    return Status(TErrorCode::SCHEMA_VIOLATION, desc_.path,
        "more values than defined entries");
  }
  return Status::OK();
}

void ColumnChunkWriter::NewPage() {
  rep_levels_.clear();
  def_levels_.clear();
  page_num_values_ = 0;
  page_num_non_null_ = 0;
  page_num_rows_ = 0;
  page_values_size_ = 0;
  page_full_ = false;
  page_stats_base_->Reset();
  current_encoding_ = next_page_encoding_;
}

Status ColumnChunkWriter::FinalizeCurrentPage() {
  if (cancelled_ != nullptr && cancelled_->load()) {
    VLOG_FILE << "Column '" << desc_.path << "' cancelled after " << pages_.size()
              << " pages";
    return Status(TErrorCode::CANCELLED);
  }
  DCHECK_GT(page_num_values_, 0);

  // If the entire page was NULL, encode it as PLAIN since there is no data anyway.
  Encoding::type encoding =
      page_num_non_null_ == 0 ? Encoding::PLAIN : current_encoding_;
  RETURN_IF_ERROR(EncodePageValues(encoding, &values_buffer_));

  LevelEncoder rep_encoder(props_.level_encoding, desc_.max_rep_level);
  RETURN_IF_ERROR(
      rep_encoder.Encode(rep_levels_.data(), rep_levels_.size(), &rep_levels_buffer_));
  LevelEncoder def_encoder(props_.level_encoding, desc_.max_def_level);
  RETURN_IF_ERROR(
      def_encoder.Encode(def_levels_.data(), def_levels_.size(), &def_levels_buffer_));

  DataPageInput input;
  input.encoding = encoding;
  input.rep_level_encoding = props_.level_encoding;
  input.def_level_encoding = props_.level_encoding;
  input.num_values = page_num_values_;
  input.num_nulls = page_num_values_ - page_num_non_null_;
  input.num_rows = page_num_rows_;
  input.rep_levels = rep_levels_buffer_.data();
  input.rep_levels_len = rep_levels_buffer_.size();
  input.def_levels = def_levels_buffer_.data();
  input.def_levels_len = def_levels_buffer_.size();
  input.values = values_buffer_.data();
  input.values_len = values_buffer_.size();

  ColumnarPage page;
  RETURN_IF_ERROR(page_writer_.WriteDataPage(input, &page));

  // Accumulate encoding statistics
  column_encodings_.insert(encoding);
  ++data_encoding_stats_[encoding];
  if (IsDictionaryEncoding(encoding)) ++num_dict_data_pages_;

  // Update chunk statistics from page statistics.
  DCHECK(page_stats_base_ != nullptr);
  DCHECK(chunk_stats_base_ != nullptr);
  chunk_stats_base_->Merge(*page_stats_base_);
  columnar::Statistics page_stats;
  if (page_stats_base_->BytesNeeded() <= MAX_COLUMN_STATS_SIZE) {
    page_stats_base_->EncodeToThrift(&page_stats);
  } else {
    page_stats.__set_null_count(page_stats_base_->null_count());
  }

  VLOG_PAGE << "Column '" << desc_.path << "' page " << pages_.size() << ": "
            << page.header.DebugString();
  total_compressed_byte_size_ += page.total_size();
  total_uncompressed_byte_size_ += PageHeader::SIZE + page.header.uncompressed_size;
  page_first_rows_.push_back(num_rows_ - page_num_rows_);
  page_stats_thrift_.push_back(std::move(page_stats));
  pages_.push_back(std::move(page));
  return Status::OK();
}

Status ColumnChunkWriter::WriteDictionaryPage(ColumnarPage* page, bool* has_dictionary) {
  *has_dictionary = false;
  return Status::OK();
}

Status ColumnChunkWriter::Close(ColumnChunkSummary* summary) {
  DCHECK(!closed_);
  closed_ = true;
  if (page_num_values_ > 0) {
    RETURN_IF_ERROR(FinalizeCurrentPage());
  } else if (cancelled_ != nullptr && cancelled_->load()) {
    return Status(TErrorCode::CANCELLED);
  }

  // First write the dictionary page before any of the data pages.
  ColumnarPage dict_page;
  bool has_dictionary = false;
  RETURN_IF_ERROR(WriteDictionaryPage(&dict_page, &has_dictionary));
  if (has_dictionary) {
    ++dict_encoding_stats_[dict_page.header.encoding];
    total_compressed_byte_size_ += dict_page.total_size();
    total_uncompressed_byte_size_ +=
        PageHeader::SIZE + dict_page.header.uncompressed_size;
  }

  // The chunk is written with a single call so that it is contiguous in the sink.
  vector<uint8_t> chunk;
  chunk.reserve(total_compressed_byte_size_);
  if (has_dictionary) dict_page.AppendTo(&chunk);
  for (const ColumnarPage& page : pages_) page.AppendTo(&chunk);
  DCHECK_EQ(chunk.size(), total_compressed_byte_size_);
  ByteRange range;
  RETURN_IF_ERROR(sink_->Write(-1, chunk.data(), chunk.size(), &range));

  const int64_t dict_page_offset = has_dictionary ? range.offset : -1;
  const int64_t pages_offset =
      range.offset + (has_dictionary ? dict_page.total_size() : 0);
  summary->col_idx = desc_.col_idx;
  summary->path = desc_.path;
  summary->file_offset = range.offset;
  summary->num_rows = num_rows_;
  summary->meta_data = ColumnMetaData();
  BuildMetadata(pages_offset, dict_page_offset, has_dictionary ? &dict_page : nullptr,
      &summary->meta_data);
  VLOG_FILE << "Closed column '" << desc_.path << "': " << pages_.size()
            << " data pages, " << num_values_ << " values, " << num_rows_ << " rows, "
            << range.len << " bytes at offset " << range.offset;
  pages_.clear();
  return Status::OK();
}

void ColumnChunkWriter::BuildMetadata(int64_t pages_offset, int64_t dict_page_offset,
    const ColumnarPage* dict_page, ColumnMetaData* meta_data) {
  meta_data->type = desc_.type;
  meta_data->encodings.assign(column_encodings_.begin(), column_encodings_.end());
  meta_data->path_in_schema = desc_.path_in_schema;
  meta_data->codec = props_.codec;
  meta_data->num_values = num_values_;
  meta_data->total_uncompressed_size = total_uncompressed_byte_size_;
  meta_data->total_compressed_size = total_compressed_byte_size_;
  meta_data->data_page_offset = pages_offset;
  if (dict_page_offset >= 0) meta_data->__set_dictionary_page_offset(dict_page_offset);
  meta_data->__set_has_page_checksums(props_.enable_page_checksum);

  // The distinct count is only known while every value went through the dictionary.
  if (next_page_encoding_ == Encoding::RLE_DICTIONARY) {
    chunk_stats_base_->SetDistinctCount(dictionary_size());
  }
  Statistics stats;
  if (chunk_stats_base_->BytesNeeded() <= MAX_COLUMN_STATS_SIZE) {
    chunk_stats_base_->EncodeToThrift(&stats);
  } else {
    stats.__set_null_count(chunk_stats_base_->null_count());
    if (chunk_stats_base_->distinct_count() >= 0) {
      stats.__set_distinct_count(chunk_stats_base_->distinct_count());
    }
  }
  meta_data->__set_statistics(stats);

  vector<PageEncodingStats> encoding_stats;
  for (const auto& entry : dict_encoding_stats_) {
    PageEncodingStats dict_enc_stat;
    dict_enc_stat.page_type = PageType::DICTIONARY_PAGE;
    dict_enc_stat.encoding = entry.first;
    dict_enc_stat.count = entry.second;
    encoding_stats.push_back(dict_enc_stat);
  }
  for (const auto& entry : data_encoding_stats_) {
    PageEncodingStats data_enc_stat;
    data_enc_stat.page_type = PageType::DATA_PAGE;
    data_enc_stat.encoding = entry.first;
    data_enc_stat.count = entry.second;
    encoding_stats.push_back(data_enc_stat);
  }
  meta_data->__set_encoding_stats(encoding_stats);

  vector<PageLocation> locations;
  int64_t offset = pages_offset;
  if (dict_page != nullptr) {
    PageLocation location;
    location.offset = dict_page_offset;
    location.compressed_page_size = dict_page->total_size();
    location.first_row_index = 0;
    location.page_type = PageType::DICTIONARY_PAGE;
    locations.push_back(location);
  }
  for (int i = 0; i < pages_.size(); ++i) {
    PageLocation location;
    location.offset = offset;
    location.compressed_page_size = pages_[i].total_size();
    location.first_row_index = page_first_rows_[i];
    location.page_type = PageType::DATA_PAGE;
    location.__set_statistics(page_stats_thrift_[i]);
    locations.push_back(location);
    offset += pages_[i].total_size();
  }
  meta_data->__set_page_locations(locations);
}

}
