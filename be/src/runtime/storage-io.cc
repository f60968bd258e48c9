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

#include "runtime/storage-io.h"

#include <errno.h>

#include <boost/thread/lock_guard.hpp>

#include "util/error-util.h"

#include "common/names.h"

using boost::lock_guard;
using boost::mutex;

namespace strata {

Status StorageSource::CheckRange(
    const string& name, const ByteRange& range, int64_t size) {
  if (range.offset < 0 || range.len < 0 || range.offset > size
      || range.len > size - range.offset) {
    stringstream ss;
    ss << "byte range [" << range.offset << ", " << range.end()
       << ") is outside the " << size << " stored bytes";
    return Status(TErrorCode::STRUCTURAL_CORRUPTION, name, ss.str());
  }
  return Status::OK();
}

static Status CheckOffsetHint(int64_t offset_hint, int64_t position) {
  if (offset_hint >= 0 && offset_hint != position) {
    stringstream ss;
    ss << "write expected at offset " << offset_hint << " would land at " << position;
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  return Status::OK();
}

Status MemoryStorage::Write(int64_t offset_hint, const uint8_t* data, int64_t len,
    ByteRange* range) {
  DCHECK_GE(len, 0);
  lock_guard<mutex> l(lock_);
  int64_t position = bytes_.size();
  RETURN_IF_ERROR(CheckOffsetHint(offset_hint, position));
  bytes_.insert(bytes_.end(), data, data + len);
  *range = ByteRange(position, len);
  return Status::OK();
}

int64_t MemoryStorage::Position() {
  lock_guard<mutex> l(lock_);
  return bytes_.size();
}

Status MemoryStorage::Read(const ByteRange& range, vector<uint8_t>* out) {
  lock_guard<mutex> l(lock_);
  RETURN_IF_ERROR(CheckRange("memory", range, bytes_.size()));
  out->assign(bytes_.begin() + range.offset, bytes_.begin() + range.end());
  return Status::OK();
}

int64_t MemoryStorage::Size() {
  lock_guard<mutex> l(lock_);
  return bytes_.size();
}

LocalFileSink::~LocalFileSink() {
  if (file_ != nullptr) {
    LOG(WARNING) << "LocalFileSink for " << path_ << " was not closed";
    fclose(file_);
  }
}

Status LocalFileSink::Open() {
  DCHECK(file_ == nullptr);
  file_ = fopen(path_.c_str(), "wb");
  if (file_ == nullptr) {
    stringstream ss;
    ss << "fopen(" << path_ << ", \"wb\") failed with errno=" << errno
       << " description=" << GetStrErrMsg();
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  position_ = 0;
  return Status::OK();
}

Status LocalFileSink::Write(int64_t offset_hint, const uint8_t* data, int64_t len,
    ByteRange* range) {
  lock_guard<mutex> l(lock_);
  if (file_ == nullptr) {
    return Status(TErrorCode::STORAGE_IO_ERROR, "write to closed file " + path_);
  }
  RETURN_IF_ERROR(CheckOffsetHint(offset_hint, position_));
  int64_t bytes_written = fwrite(data, 1, len, file_);
  if (bytes_written < len) {
    stringstream ss;
    ss << "fwrite(buffer, 1, " << len << ", " << path_ << ") failed with errno="
       << errno << " description=" << GetStrErrMsg();
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  *range = ByteRange(position_, len);
  position_ += len;
  return Status::OK();
}

int64_t LocalFileSink::Position() {
  lock_guard<mutex> l(lock_);
  return position_;
}

Status LocalFileSink::Close() {
  lock_guard<mutex> l(lock_);
  if (file_ == nullptr) return Status::OK();
  int success = fclose(file_);
  file_ = nullptr;
  if (success != 0) {
    stringstream ss;
    ss << "fclose(" << path_ << ") failed with errno=" << errno
       << " description=" << GetStrErrMsg();
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  return Status::OK();
}

LocalFileSource::~LocalFileSource() {
  if (file_ != nullptr) fclose(file_);
}

Status LocalFileSource::Open() {
  DCHECK(file_ == nullptr);
  file_ = fopen(path_.c_str(), "rb");
  if (file_ == nullptr) {
    stringstream ss;
    ss << "fopen(" << path_ << ", \"rb\") failed with errno=" << errno
       << " description=" << GetStrErrMsg();
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  if (fseeko(file_, 0, SEEK_END) == -1 || (size_ = ftello(file_)) < 0) {
    stringstream ss;
    ss << "couldn't determine the size of " << path_ << ": " << GetStrErrMsg();
    fclose(file_);
    file_ = nullptr;
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  return Status::OK();
}

Status LocalFileSource::Read(const ByteRange& range, vector<uint8_t>* out) {
  RETURN_IF_ERROR(CheckRange(path_, range, size_));
  lock_guard<mutex> l(lock_);
  if (file_ == nullptr) {
    return Status(TErrorCode::STORAGE_IO_ERROR, "read from unopened file " + path_);
  }
  if (fseeko(file_, range.offset, SEEK_SET) == -1) {
    stringstream ss;
    ss << "couldn't seek to offset " << range.offset << " in file " << path_
       << ": " << GetStrErrMsg();
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  out->resize(range.len);
  int64_t bytes_read = fread(out->data(), 1, range.len, file_);
  if (bytes_read < range.len) {
    stringstream ss;
    ss << "fread(buffer, 1, " << range.len << ", " << path_ << ") returned "
       << bytes_read << " bytes";
    if (ferror(file_)) ss << ": " << GetStrErrMsg();
    clearerr(file_);
    return Status(TErrorCode::STORAGE_IO_ERROR, ss.str());
  }
  return Status::OK();
}

}
