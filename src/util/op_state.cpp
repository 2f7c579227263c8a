// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "util/op_state.hpp"

namespace notekeep {
namespace util {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::ValidationFailed:
    return "ValidationFailed";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::StoreBusy:
    return "StoreBusy";
  case ErrorKind::StoreUnavailable:
    return "StoreUnavailable";
  case ErrorKind::IOFailure:
    return "IOFailure";
  }
  return "Unknown";
}

std::string OpState::ToString() const {
  if (IsValid()) {
    return "ok";
  }
  std::string out = ErrorKindName(kind_);
  if (!reject_reason_.empty()) {
    out += ": " + reject_reason_;
  }
  if (!debug_message_.empty()) {
    out += " (" + debug_message_ + ")";
  }
  return out;
}

std::string OpState::UserMessage() const {
  switch (kind_) {
  case ErrorKind::None:
    return "";
  case ErrorKind::ValidationFailed:
    // Reject reasons from the store are already phrased as guidance
    return reject_reason_.empty() ? "title and note cannot be empty"
                                  : reject_reason_;
  case ErrorKind::NotFound:
    return "note not found";
  case ErrorKind::StoreBusy:
    return "the note store is busy, please try again";
  case ErrorKind::StoreUnavailable:
  case ErrorKind::IOFailure:
    break;
  }
  return "a technical error occurred, please try again";
}

} // namespace util
} // namespace notekeep
