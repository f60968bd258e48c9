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

#ifndef STRATA_TESTUTIL_GTEST_UTIL_H_
#define STRATA_TESTUTIL_GTEST_UTIL_H_

#include <gtest/gtest.h>
#include "common/init.h"
#include "common/status.h"

namespace strata {

// Macros for backend tests to be used when we expect the status to be OK.
#define EXPECT_OK(status)                                          \
  do {                                                             \
    const Status& status_ = (status);                              \
    EXPECT_TRUE(status_.ok()) << "Error: " << status_.GetDetail(); \
  } while (0)

#define ASSERT_OK(status)                                          \
  do {                                                             \
    const Status& status_ = (status);                              \
    ASSERT_TRUE(status_.ok()) << "Error: " << status_.GetDetail(); \
  } while (0)

// Substring matches.
#define EXPECT_STR_CONTAINS(str, substr) \
  EXPECT_PRED_FORMAT2(testing::IsSubstring, substr, str)

// Error code matches.
#define EXPECT_ERROR(status, err)                                       \
  do {                                                                  \
    const Status& status_ = (status);                                   \
    EXPECT_EQ(status_.code(), err) << "Error: " << status_.GetDetail(); \
  } while (0)

// Basic main() function to be used in gtest unit tests. Initializes flags and logging.
#define STRATA_TEST_MAIN() \
  int main(int argc, char** argv) { \
    ::testing::InitGoogleTest(&argc, argv); \
    strata::InitCommonRuntime(argc, argv); \
    return RUN_ALL_TESTS(); \
  } \

}
#endif // STRATA_TESTUTIL_GTEST_UTIL_H_
