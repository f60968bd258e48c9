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


#ifndef STRATA_UTIL_ERROR_UTIL_H
#define STRATA_UTIL_ERROR_UTIL_H

#include <sstream>
#include <string>
#include <vector>

#include "gen-cpp/ErrorCodes_types.h"

namespace strata {

/// Returns the error message for errno. Use this rather than strerror() which is not
/// thread safe.
std::string GetStrErrMsg();

/// Returns the error message for 'err_no'.
std::string GetStrErrMsg(int err_no);

/// Class that holds a formatted error message and a list of details. The message is
/// built from the template for the error code in ErrorCodes.thrift by substituting
/// '$0'..'$9' with the stringified arguments.
class ErrorMsg {
 public:
  static constexpr int MAX_ERROR_MESSAGE_LEN = 128 * 1024; // 128kb

  ErrorMsg() : error_(TErrorCode::OK) {}

  explicit ErrorMsg(TErrorCode::type error) : error_(error) {
    SetErrorMsg(Substitute(error, {}));
  }

  template <typename Arg0, typename... Args>
  ErrorMsg(TErrorCode::type error, const Arg0& arg0, const Args&... args)
    : error_(error) {
    SetErrorMsg(Substitute(error, {ToArg(arg0), ToArg(args)...}));
  }

  TErrorCode::type error() const { return error_; }

  /// Add detail string message.
  void AddDetail(const std::string& d) { details_.push_back(d); }

  void SetErrorCode(TErrorCode::type e) { error_ = e; }

  const std::string& msg() const { return message_; }

  const std::vector<std::string>& details() const { return details_; }

  /// Set a specific error message. Truncated to MAX_ERROR_MESSAGE_LEN.
  void SetErrorMsg(const std::string& msg);

  /// Return the formatted error string followed by all details.
  std::string GetFullMessageDetails() const;

 private:
  template <typename T>
  static std::string ToArg(const T& arg) {
    std::stringstream ss;
    ss << arg;
    return ss.str();
  }

  /// Fills in the message template of 'error' with 'args'. Placeholders without a
  /// matching argument are dropped.
  static std::string Substitute(
      TErrorCode::type error, const std::vector<std::string>& args);

  TErrorCode::type error_;
  std::string message_;
  std::vector<std::string> details_;
};

}

#endif
