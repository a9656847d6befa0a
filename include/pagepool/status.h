//  Copyright (c) 2011-present, Facebook, Inc.  All rights reserved.
//  This source code is licensed under both the GPLv2 (found in the
//  COPYING file in the root directory) and Apache 2.0 License
//  (found in the LICENSE.Apache file in the root directory).
//
// A Status encapsulates the result of an operation.  It may indicate success,
// or it may indicate an error with an associated error message.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.

#pragma once

#include <memory>
#include <string>

#include "pagepool/pagepool_namespace.h"

namespace PAGEPOOL_NAMESPACE {

class Status {
 public:
  // Create a success status.
  Status() : code_(kOk), state_(nullptr) {}
  ~Status() {}

  // Copy the specified status.
  Status(const Status& s);
  Status& operator=(const Status& s);
  Status(Status&& s) noexcept;
  Status& operator=(Status&& s) noexcept;
  bool operator==(const Status& rhs) const;
  bool operator!=(const Status& rhs) const;

  // Marks a result that the caller deliberately ignores.
  inline void PermitUncheckedError() const {}

  enum Code : unsigned char {
    kOk = 0,
    kNotFound = 1,
    kNotSupported = 3,
    kInvalidArgument = 4,
    kIOError = 5,
    kIncomplete = 6,
    kShutdownInProgress = 7,
    kAborted = 8,
    kMaxCode
  };

  Code code() const { return code_; }

  // Returns a C style string indicating the message of the Status
  const char* getState() const { return state_.get(); }

  // Return a success status.
  static Status OK() { return Status(); }

  // Return error status of an appropriate type.
  static Status NotFound(const std::string& msg, const std::string& msg2 = "") {
    return Status(kNotFound, msg, msg2);
  }
  static Status NotFound() { return Status(kNotFound); }

  static Status NotSupported(const std::string& msg,
                             const std::string& msg2 = "") {
    return Status(kNotSupported, msg, msg2);
  }
  static Status NotSupported() { return Status(kNotSupported); }

  static Status InvalidArgument(const std::string& msg,
                                const std::string& msg2 = "") {
    return Status(kInvalidArgument, msg, msg2);
  }

  static Status IOError(const std::string& msg, const std::string& msg2 = "") {
    return Status(kIOError, msg, msg2);
  }

  static Status Incomplete(const std::string& msg,
                           const std::string& msg2 = "") {
    return Status(kIncomplete, msg, msg2);
  }
  static Status Incomplete() { return Status(kIncomplete); }

  static Status ShutdownInProgress(const std::string& msg,
                                   const std::string& msg2 = "") {
    return Status(kShutdownInProgress, msg, msg2);
  }
  static Status ShutdownInProgress() { return Status(kShutdownInProgress); }

  static Status Aborted(const std::string& msg, const std::string& msg2 = "") {
    return Status(kAborted, msg, msg2);
  }

  // Returns true iff the status indicates success.
  bool ok() const { return code() == kOk; }

  // Returns true iff the status indicates a NotFound error.
  bool IsNotFound() const { return code() == kNotFound; }

  // Returns true iff the status indicates a NotSupported error.
  bool IsNotSupported() const { return code() == kNotSupported; }

  // Returns true iff the status indicates an InvalidArgument error.
  bool IsInvalidArgument() const { return code() == kInvalidArgument; }

  // Returns true iff the status indicates an IOError.
  bool IsIOError() const { return code() == kIOError; }

  bool IsIncomplete() const { return code() == kIncomplete; }

  // Returns true iff the status indicates Shutdown In progress
  bool IsShutdownInProgress() const { return code() == kShutdownInProgress; }

  bool IsAborted() const { return code() == kAborted; }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

 protected:
  Code code_;
  // A nullptr state_ (which is at least the case for OK) means the extra
  // message is empty.
  std::unique_ptr<const char[]> state_;

  explicit Status(Code _code) : code_(_code) {}
  Status(Code _code, const std::string& msg, const std::string& msg2);

  static std::unique_ptr<const char[]> CopyState(const char* s);
};

inline Status::Status(const Status& s) : code_(s.code_) {
  state_ = (s.state_ == nullptr) ? nullptr : CopyState(s.state_.get());
}

inline Status& Status::operator=(const Status& s) {
  if (this != &s) {
    code_ = s.code_;
    state_ = (s.state_ == nullptr) ? nullptr : CopyState(s.state_.get());
  }
  return *this;
}

inline Status::Status(Status&& s) noexcept : Status() {
  *this = std::move(s);
}

inline Status& Status::operator=(Status&& s) noexcept {
  if (this != &s) {
    code_ = s.code_;
    s.code_ = kOk;
    state_ = std::move(s.state_);
  }
  return *this;
}

inline bool Status::operator==(const Status& rhs) const {
  return code_ == rhs.code_;
}

inline bool Status::operator!=(const Status& rhs) const {
  return !(*this == rhs);
}

}  // namespace PAGEPOOL_NAMESPACE
