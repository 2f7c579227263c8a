// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include "app/data_version.hpp"
#include "util/op_state.hpp"
#include <cstdint>
#include <string>

namespace notekeep {
namespace store {
class NoteStore;
}

namespace app {

/**
 * Outcome of a mutating store call, tagged with the caller's version
 *
 * ok      : the store accepted the change
 * note_id : id that was inserted, updated or deleted (0 on failed insert)
 * version : current.Next() on success, current unchanged on failure
 */
struct MutationResult {
  bool ok{false};
  int64_t note_id{0};
  DataVersion version;
  util::OpState state;
};

// Mutations bump the version by exactly one and only on success.
MutationResult AddNote(store::NoteStore &store, DataVersion current,
                       const std::string &title, const std::string &body);

MutationResult EditNote(store::NoteStore &store, DataVersion current,
                        int64_t id, const std::string &title,
                        const std::string &body);

MutationResult RemoveNote(store::NoteStore &store, DataVersion current,
                          int64_t id);

} // namespace app
} // namespace notekeep
