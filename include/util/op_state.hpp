// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace notekeep {
namespace util {

/**
 * Failure taxonomy shared by the record store and the file writer
 */
enum class ErrorKind {
  None,
  ValidationFailed, // Empty field, oversized body, malformed text
  NotFound,         // Operation referenced a missing id
  StoreBusy,        // Write lock not acquired within the busy timeout
  StoreUnavailable, // Database inaccessible, not opened, disk error
  IOFailure,        // Atomic file write failed
};

/**
 * Operation state - tracks why a store or file operation failed
 * Modelled after the header ValidationState: functions return bool or
 * std::optional and record the failure here.
 *
 * reject_reason names the offending field or path, debug_message carries
 * the lower-level detail (sqlite errmsg, strerror).
 */
class OpState {
public:
  OpState() = default;

  bool IsValid() const { return kind_ == ErrorKind::None; }
  bool IsError() const { return kind_ != ErrorKind::None; }
  ErrorKind GetKind() const { return kind_; }

  bool Fail(ErrorKind kind, const std::string &reject_reason,
            const std::string &debug_message = "") {
    kind_ = kind;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  void Reset() {
    kind_ = ErrorKind::None;
    reject_reason_.clear();
    debug_message_.clear();
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  // "kind: reason (debug)" for logs
  std::string ToString() const;

  // Message suitable for an end user. Validation failures give corrective
  // guidance; store and I/O failures stay opaque.
  std::string UserMessage() const;

private:
  ErrorKind kind_{ErrorKind::None};
  std::string reject_reason_;
  std::string debug_message_;
};

const char *ErrorKindName(ErrorKind kind);

} // namespace util
} // namespace notekeep
