// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include "util/op_state.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace notekeep {
namespace store {

// Maximum body length in Unicode code points (enforced after trimming)
static constexpr size_t MAX_BODY_CHARS = 2000;

/**
 * Persisted note record
 *
 * id and created_at are assigned by the store and never change. A Note held
 * by a caller is a snapshot: it is stale after any write to the store.
 */
struct Note {
  int64_t id{0};
  std::string title;
  std::string body;
  int64_t created_at{0}; // Unix seconds

  bool operator==(const Note &) const = default;
};

/**
 * Title and body after normalization
 */
struct NoteFields {
  std::string title;
  std::string body;
};

/**
 * Trim surrounding whitespace from both fields and validate them
 *
 * Rejects with ErrorKind::ValidationFailed when:
 * - title or body is empty after trimming
 * - either field is not valid UTF-8
 * - body exceeds MAX_BODY_CHARS code points
 *
 * The reject reason names the offending field.
 */
std::optional<NoteFields> NormalizeNoteFields(const std::string &title,
                                              const std::string &body,
                                              util::OpState &state);

} // namespace store
} // namespace notekeep
