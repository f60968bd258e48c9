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

#ifndef STRATA_RUNTIME_STORAGE_IO_H
#define STRATA_RUNTIME_STORAGE_IO_H

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>

#include "common/status.h"

namespace strata {

/// A contiguous span of bytes in a sink or source.
struct ByteRange {
  int64_t offset = 0;
  int64_t len = 0;

  ByteRange() {}
  ByteRange(int64_t offset, int64_t len) : offset(offset), len(len) {}

  int64_t end() const { return offset + len; }
  bool operator==(const ByteRange& other) const {
    return offset == other.offset && len == other.len;
  }
};

/// Append-only destination for the bytes of a file. Implementations must be safe for
/// concurrent Write() calls; every call receives a non-overlapping range.
class StorageSink {
 public:
  virtual ~StorageSink() {}

  /// Appends 'len' bytes of 'data' and returns where they landed in *range.
  /// 'offset_hint' is -1 or the offset the caller expects the bytes to land at; a
  /// write that would land elsewhere fails with STORAGE_IO_ERROR.
  virtual Status Write(int64_t offset_hint, const uint8_t* data, int64_t len,
      ByteRange* range) WARN_UNUSED_RESULT = 0;

  /// Number of bytes written so far.
  virtual int64_t Position() = 0;

  /// Flushes buffered bytes. No writes are allowed afterwards.
  virtual Status Close() WARN_UNUSED_RESULT { return Status::OK(); }
};

/// Random access source of the bytes of a file.
class StorageSource {
 public:
  virtual ~StorageSource() {}

  /// Reads the bytes of 'range' into *out, replacing its contents. A range that is not
  /// entirely inside the stored bytes fails with STRUCTURAL_CORRUPTION.
  virtual Status Read(const ByteRange& range, std::vector<uint8_t>* out)
      WARN_UNUSED_RESULT = 0;

  virtual int64_t Size() = 0;

 protected:
  /// Returns STRUCTURAL_CORRUPTION if 'range' is not within [0, size). 'name'
  /// identifies the source in the error.
  static Status CheckRange(
      const std::string& name, const ByteRange& range, int64_t size);
};

/// In-memory sink and source. Appends are serialized by a mutex so that chunk writers
/// on different threads can share one instance.
class MemoryStorage : public StorageSink, public StorageSource {
 public:
  MemoryStorage() {}
  explicit MemoryStorage(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  virtual Status Write(int64_t offset_hint, const uint8_t* data, int64_t len,
      ByteRange* range) override WARN_UNUSED_RESULT;
  virtual int64_t Position() override;
  virtual Status Read(const ByteRange& range, std::vector<uint8_t>* out) override
      WARN_UNUSED_RESULT;
  virtual int64_t Size() override;

  /// Direct access to the stored bytes, e.g. for tests that corrupt them. Not
  /// synchronized with concurrent writers.
  std::vector<uint8_t>* mutable_bytes() { return &bytes_; }
  const std::vector<uint8_t>& bytes() const { return bytes_; }

 private:
  boost::mutex lock_;
  std::vector<uint8_t> bytes_;
};

/// Sink writing a local file through stdio. The file is created or truncated by Open().
class LocalFileSink : public StorageSink {
 public:
  explicit LocalFileSink(const std::string& path) : path_(path) {}
  virtual ~LocalFileSink();

  Status Open() WARN_UNUSED_RESULT;

  virtual Status Write(int64_t offset_hint, const uint8_t* data, int64_t len,
      ByteRange* range) override WARN_UNUSED_RESULT;
  virtual int64_t Position() override;
  virtual Status Close() override WARN_UNUSED_RESULT;

  const std::string& path() const { return path_; }

 private:
  const std::string path_;

  /// Protects 'file_' and 'position_'.
  boost::mutex lock_;
  FILE* file_ = nullptr;
  int64_t position_ = 0;
};

/// Source reading a local file through stdio.
class LocalFileSource : public StorageSource {
 public:
  explicit LocalFileSource(const std::string& path) : path_(path) {}
  virtual ~LocalFileSource();

  Status Open() WARN_UNUSED_RESULT;

  virtual Status Read(const ByteRange& range, std::vector<uint8_t>* out) override
      WARN_UNUSED_RESULT;
  virtual int64_t Size() override { return size_; }

  const std::string& path() const { return path_; }

 private:
  const std::string path_;

  /// Protects 'file_', whose position is shared by all readers.
  boost::mutex lock_;
  FILE* file_ = nullptr;
  int64_t size_ = 0;
};

}

#endif
