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

#include <unistd.h>

#include <string>
#include <vector>

#include <boost/thread/thread.hpp>

#include "runtime/storage-io.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace strata {

TEST(StorageIoTest, MemoryStorageAppendsAndReads) {
  MemoryStorage storage;
  const string first = "hello ";
  const string second = "world";
  ByteRange r1, r2;
  ASSERT_OK(storage.Write(0, reinterpret_cast<const uint8_t*>(first.data()),
      first.size(), &r1));
  ASSERT_OK(storage.Write(-1, reinterpret_cast<const uint8_t*>(second.data()),
      second.size(), &r2));
  EXPECT_EQ(ByteRange(0, 6), r1);
  EXPECT_EQ(ByteRange(6, 5), r2);
  EXPECT_EQ(11, storage.Size());
  EXPECT_EQ(11, storage.Position());

  vector<uint8_t> out;
  ASSERT_OK(storage.Read(r2, &out));
  EXPECT_EQ(second, string(out.begin(), out.end()));
  ASSERT_OK(storage.Read(ByteRange(11, 0), &out));
  EXPECT_TRUE(out.empty());
}

TEST(StorageIoTest, OutOfRangeReads) {
  MemoryStorage storage(vector<uint8_t>(10, 7));
  vector<uint8_t> out;
  EXPECT_ERROR(storage.Read(ByteRange(5, 6), &out), TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_ERROR(storage.Read(ByteRange(-1, 2), &out), TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_ERROR(storage.Read(ByteRange(11, 0), &out), TErrorCode::STRUCTURAL_CORRUPTION);
  EXPECT_ERROR(storage.Read(ByteRange(2, -1), &out), TErrorCode::STRUCTURAL_CORRUPTION);
}

TEST(StorageIoTest, OffsetHintMismatch) {
  MemoryStorage storage;
  uint8_t byte = 1;
  ByteRange range;
  ASSERT_OK(storage.Write(0, &byte, 1, &range));
  EXPECT_ERROR(storage.Write(0, &byte, 1, &range), TErrorCode::STORAGE_IO_ERROR);
  EXPECT_EQ(1, storage.Size());
}

// Concurrent writers receive disjoint ranges that together cover the storage.
TEST(StorageIoTest, ConcurrentWrites) {
  MemoryStorage storage;
  const int NUM_THREADS = 8;
  const int WRITES_PER_THREAD = 100;
  vector<vector<ByteRange>> ranges(NUM_THREADS);
  boost::thread_group threads;
  for (int t = 0; t < NUM_THREADS; ++t) {
    threads.add_thread(new boost::thread([&storage, &ranges, t]() {
      vector<uint8_t> data(t + 1, static_cast<uint8_t>(t));
      for (int i = 0; i < WRITES_PER_THREAD; ++i) {
        ByteRange range;
        Status status = storage.Write(-1, data.data(), data.size(), &range);
        CHECK(status.ok()) << status.GetDetail();
        ranges[t].push_back(range);
      }
    }));
  }
  threads.join_all();

  int64_t total = 0;
  for (int t = 0; t < NUM_THREADS; ++t) {
    ASSERT_EQ(WRITES_PER_THREAD, ranges[t].size());
    for (const ByteRange& range : ranges[t]) {
      vector<uint8_t> out;
      ASSERT_OK(storage.Read(range, &out));
      EXPECT_EQ(vector<uint8_t>(t + 1, static_cast<uint8_t>(t)), out);
      total += range.len;
    }
  }
  EXPECT_EQ(total, storage.Size());
}

TEST(StorageIoTest, LocalFileRoundTrip) {
  string path = "/tmp/storage-io-test-" + std::to_string(getpid());
  {
    LocalFileSink sink(path);
    ASSERT_OK(sink.Open());
    vector<uint8_t> data = {1, 2, 3, 4, 5};
    ByteRange range;
    ASSERT_OK(sink.Write(0, data.data(), data.size(), &range));
    ASSERT_OK(sink.Write(5, data.data(), 2, &range));
    EXPECT_EQ(ByteRange(5, 2), range);
    EXPECT_EQ(7, sink.Position());
    ASSERT_OK(sink.Close());
    EXPECT_ERROR(sink.Write(-1, data.data(), 1, &range), TErrorCode::STORAGE_IO_ERROR);
  }
  {
    LocalFileSource source(path);
    ASSERT_OK(source.Open());
    EXPECT_EQ(7, source.Size());
    vector<uint8_t> out;
    ASSERT_OK(source.Read(ByteRange(3, 4), &out));
    EXPECT_EQ(vector<uint8_t>({4, 5, 1, 2}), out);
    EXPECT_ERROR(source.Read(ByteRange(3, 5), &out), TErrorCode::STRUCTURAL_CORRUPTION);
  }
  unlink(path.c_str());
}

TEST(StorageIoTest, MissingLocalFile) {
  LocalFileSource source("/nonexistent-dir/strata-missing-file");
  EXPECT_ERROR(source.Open(), TErrorCode::STORAGE_IO_ERROR);
}

}

STRATA_TEST_MAIN();
