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


#ifndef STRATA_COMMON_LOGGING_H
#define STRATA_COMMON_LOGGING_H

#include <string>

#include <glog/logging.h>
#include <gflags/gflags.h>

/// Define verbose logging levels. Per-value logging is more verbose than per-page
/// logging which is more verbose than per-file / per-row-group logging.
#define VLOG_FILE       VLOG(2)
#define VLOG_PAGE       VLOG(3)
#define VLOG_ROW        VLOG(3)

#define VLOG_FILE_IS_ON VLOG_IS_ON(2)
#define VLOG_PAGE_IS_ON VLOG_IS_ON(3)
#define VLOG_ROW_IS_ON VLOG_IS_ON(3)

// Define a range check macro to test x in the inclusive range from low to high.
#define DCHECK_IN_RANGE(x, low, high) \
  {                                   \
    DCHECK_GE(x, low);                \
    DCHECK_LE(x, high);               \
  }

/// Define DCHECK_OK that evaluates an expression that has type 'Status' and checks
/// that the returning status is OK. If not OK, it logs the error and aborts the process.
/// In release builds the given expression is not evaluated.
#ifndef NDEBUG
#  define DCHECK_OK(status)                \
     do {                                  \
       const Status& _s = (status);        \
       DCHECK(_s.ok()) << _s.GetDetail();  \
     } while (0)
#else
#  define DCHECK_OK(status) {}
#endif // NDEBUG

namespace strata {

/// glog doesn't allow multiple invocations of InitGoogleLogging(). This method
/// conditionally calls InitGoogleLogging() only if it hasn't been called before.
void InitGoogleLoggingSafe(const char* arg);

/// Shuts down the google logging library. Call before exit to ensure that log files are
/// flushed. May only be called once.
void ShutdownLogging();

/// Writes all command-line flags to the log at level INFO.
void LogCommandLineFlags();

} // namespace strata
#endif
