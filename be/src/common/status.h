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


#ifndef STRATA_COMMON_STATUS_H
#define STRATA_COMMON_STATUS_H

#include <iosfwd>
#include <string>

#include "common/compiler-util.h"
#include "common/logging.h"
#include "gen-cpp/ErrorCodes_types.h"  // for TErrorCode
#include "util/error-util.h"           // for ErrorMsg

namespace strata {

/// Status is used as a function return type to indicate success, failure or cancellation
/// of the function. In case of successful completion, it only occupies sizeof(void*)
/// statically allocated memory and therefore no more members should be added to this
/// class.
///
/// A Status may either be OK (represented by passing a default constructed Status
/// instance, created via Status::OK()), or it may represent an error condition. In the
/// latter case, a Status has both an error code (which belongs to the TErrorCode enum)
/// and an error string, which is constructed from the code's message template in
/// ErrorCodes.thrift and up to ten arguments.
///
/// The error kinds used by the storage engine are:
///  - SCHEMA_VIOLATION: a value tree does not match the schema, or a schema is invalid.
///  - STRUCTURAL_CORRUPTION: column streams disagree on record boundaries, or the file
///    layout is inconsistent.
///  - MALFORMED_ENCODING: encoded bytes are inconsistent with the value count or the
///    bit width.
///  - CHECKSUM_MISMATCH: a page's payload does not match its stored CRC.
///  - UNSUPPORTED_ENCODING: an encoding id is unknown or invalid for the type.
/// None of them are retried inside the engine.
///
/// Example:
///   Status s(TErrorCode::SCHEMA_VIOLATION, "Doc.Name", "expected a list value");
///
/// Status is 'nodiscard' so that callers must check or propagate the result.
class [[nodiscard]] Status {
 public:
  ALWAYS_INLINE Status() : msg_(NULL) {}

  /// Return a default constructed Status instance in the OK case.
  static ALWAYS_INLINE Status OK() { return Status(); }

  static const Status CANCELLED;

  /// Copy c'tor makes copy of error detail so Status can be returned by value.
  ALWAYS_INLINE Status(const Status& status) : msg_(NULL) {
    if (UNLIKELY(status.msg_ != NULL)) CopyMessageFrom(status);
  }

  /// Move constructor that moves the error message (if any) and resets 'other' to the
  /// default OK Status.
  ALWAYS_INLINE Status(Status&& other) noexcept : msg_(other.msg_) { other.msg_ = NULL; }

  /// Status using only the error code as a parameter. This can be used for error
  /// messages that don't take format parameters.
  explicit Status(TErrorCode::type code);

  /// Status using the error code and message template arguments. Arguments are
  /// converted to strings with operator<<.
  template <typename Arg0, typename... Args>
  Status(TErrorCode::type error, const Arg0& arg0, const Args&... args)
    : msg_(new ErrorMsg(error, arg0, args...)) {
    VLOG(1) << msg_->msg();
  }

  explicit Status(const ErrorMsg& e);

  /// This constructor creates a Status with a default error code of GENERAL and is
  /// used for errors that don't fit any of the more specific codes.
  explicit Status(const std::string& error_msg);

  /// same as copy c'tor
  ALWAYS_INLINE Status& operator=(const Status& status) {
    if (UNLIKELY(msg_ != status.msg_)) CopyMessageFrom(status);
    return *this;
  }

  /// Move assignment that moves the error message (if any) and resets 'other' to the
  /// default OK Status.
  ALWAYS_INLINE Status& operator=(Status&& other) {
    if (UNLIKELY(msg_ != NULL)) FreeMessage();
    msg_ = other.msg_;
    other.msg_ = NULL;
    return *this;
  }

  ALWAYS_INLINE ~Status() {
    if (UNLIKELY(msg_ != NULL)) FreeMessage();
  }

  bool ALWAYS_INLINE ok() const { return msg_ == NULL; }

  bool IsCancelled() const {
    return msg_ != NULL && msg_->error() == TErrorCode::CANCELLED;
  }

  bool IsChecksumMismatch() const {
    return msg_ != NULL && msg_->error() == TErrorCode::CHECKSUM_MISMATCH;
  }

  /// Returns the error message associated with a non-successful status.
  const ErrorMsg& msg() const {
    DCHECK(msg_ != NULL);
    return *msg_;
  }

  /// Add a detail string. Calling this method is only defined on a non-OK message.
  void AddDetail(const std::string& msg);

  /// Does nothing if status.ok().
  /// Otherwise: if 'this' is an error status, adds the error msg from 'status'
  /// to 'this' as a detail. If 'this' is OK, assigns 'status' to 'this'.
  void MergeStatus(const Status& status);

  /// Returns the formatted message of the error message and the individual details of
  /// the additional messages as a single string. This should only be called internally
  /// and not to report an error back to the client.
  const std::string GetDetail() const;

  TErrorCode::type code() const {
    return msg_ == NULL ? TErrorCode::OK : msg_->error();
  }

 private:
  /// Silent general error, this cannot be used with typed error messages as it would
  /// defeat the cost of the verbose logging.
  Status(const ErrorMsg& error_msg, bool silent);

  /// A non-inline function for copying status' message.
  void CopyMessageFrom(const Status& status) noexcept;

  /// A non-inline function for freeing status' message.
  void FreeMessage() noexcept;

  /// Status uses a naked pointer to ensure the size of an instance on the stack is only
  /// the sizeof(ErrorMsg*). Every Status owns its ErrorMsg instance.
  ErrorMsg* msg_;
};

/// for debugging
std::ostream& operator<<(std::ostream& os, const Status& status);

/// some generally useful macros
#define RETURN_IF_ERROR(stmt)                          \
  do {                                                 \
    const ::strata::Status& _status = (stmt);          \
    if (UNLIKELY(!_status.ok())) return _status;       \
  } while (false)

#define LOG_AND_RETURN_IF_ERROR(stmt)                  \
  do {                                                 \
    const ::strata::Status& _status = (stmt);          \
    if (UNLIKELY(!_status.ok())) {                     \
      LOG(INFO) << _status.GetDetail();                \
      return _status;                                  \
    }                                                  \
  } while (false)

}

#endif
