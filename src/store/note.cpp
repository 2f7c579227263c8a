// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "store/note.hpp"
#include "util/string_parsing.hpp"

namespace notekeep {
namespace store {

std::optional<NoteFields> NormalizeNoteFields(const std::string &title,
                                              const std::string &body,
                                              util::OpState &state) {
  using util::ErrorKind;

  if (!util::IsValidUtf8(title)) {
    state.Fail(ErrorKind::ValidationFailed, "title must be valid UTF-8",
               "title");
    return std::nullopt;
  }
  if (!util::IsValidUtf8(body)) {
    state.Fail(ErrorKind::ValidationFailed, "note must be valid UTF-8",
               "body");
    return std::nullopt;
  }

  NoteFields fields{util::TrimWhitespace(title), util::TrimWhitespace(body)};

  if (fields.title.empty() && fields.body.empty()) {
    state.Fail(ErrorKind::ValidationFailed, "title and note cannot be empty",
               "title,body");
    return std::nullopt;
  }
  if (fields.title.empty()) {
    state.Fail(ErrorKind::ValidationFailed, "title cannot be empty", "title");
    return std::nullopt;
  }
  if (fields.body.empty()) {
    state.Fail(ErrorKind::ValidationFailed, "note cannot be empty", "body");
    return std::nullopt;
  }

  size_t length = util::Utf8Length(fields.body);
  if (length > MAX_BODY_CHARS) {
    state.Fail(ErrorKind::ValidationFailed,
               "note cannot exceed " + std::to_string(MAX_BODY_CHARS) +
                   " characters",
               "body has " + std::to_string(length) + " characters");
    return std::nullopt;
  }

  return fields;
}

} // namespace store
} // namespace notekeep
