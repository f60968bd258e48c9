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


#include "util/error-util.h"

#include <ctype.h>
#include <errno.h>
#include <string.h>

#include "common/logging.h"
#include "gen-cpp/ErrorCodes_constants.h"

#include "common/names.h"

namespace strata {

string GetStrErrMsg() {
  // Save errno. "<<" could reset it.
  int e = errno;
  return GetStrErrMsg(e);
}

string GetStrErrMsg(int err_no) {
  if (err_no == 0) return "";
  stringstream ss;
  char buf[1024];
  ss << "Error(" << err_no << "): " << strerror_r(err_no, buf, 1024);
  return ss.str();
}

string ErrorMsg::Substitute(TErrorCode::type error, const vector<string>& args) {
  DCHECK_GE(error, 0);
  DCHECK_LT(error, g_ErrorCodes_constants.TErrorMessage.size());
  const string& format = g_ErrorCodes_constants.TErrorMessage[error];
  string result;
  result.reserve(format.size());
  for (int i = 0; i < format.size(); ++i) {
    char c = format[i];
    if (c == '$' && i + 1 < format.size() && isdigit(format[i + 1])) {
      int idx = format[i + 1] - '0';
      if (idx < args.size()) result.append(args[idx]);
      ++i;
    } else {
      result.push_back(c);
    }
  }
  return result;
}

void ErrorMsg::SetErrorMsg(const string& msg) {
  if (msg.size() > MAX_ERROR_MESSAGE_LEN) {
    message_ = msg.substr(0, MAX_ERROR_MESSAGE_LEN);
  } else {
    message_ = msg;
  }
}

string ErrorMsg::GetFullMessageDetails() const {
  stringstream ss;
  ss << message_ << "\n";
  for (size_t i = 0, end = details_.size(); i < end; ++i) {
    ss << details_[i] << "\n";
  }
  return ss.str();
}

}
