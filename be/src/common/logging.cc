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


#include "common/logging.h"

#include <mutex>

#include "common/names.h"

namespace {
bool logging_initialized = false;
std::mutex logging_mutex;
}

void strata::InitGoogleLoggingSafe(const char* arg) {
  std::lock_guard<std::mutex> logging_lock(logging_mutex);
  if (logging_initialized) return;

  // Log to stderr unless a log directory was given explicitly. The engine is
  // embedded in other processes and doesn't own a log directory.
  if (FLAGS_log_dir.empty()) FLAGS_logtostderr = true;

  google::InitGoogleLogging(arg);
  logging_initialized = true;
}

void strata::ShutdownLogging() {
  std::lock_guard<std::mutex> logging_lock(logging_mutex);
  google::ShutdownGoogleLogging();
}

void strata::LogCommandLineFlags() {
  vector<google::CommandLineFlagInfo> flags;
  google::GetAllFlags(&flags);
  stringstream ss;
  for (const auto& flag : flags) {
    if (flag.is_default) continue;
    ss << "--" << flag.name << "=" << flag.current_value << "\n";
  }
  LOG(INFO) << "Flags:" << endl << ss.str();
}
