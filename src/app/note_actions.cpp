// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "app/note_actions.hpp"
#include "store/note_store.hpp"
#include "util/logging.hpp"

namespace notekeep {
namespace app {

namespace {

MutationResult Finish(MutationResult result, DataVersion current,
                      const char *action) {
  if (result.ok) {
    result.version = current.Next();
    LOG_APP_DEBUG("{} note {} -> version {}", action, result.note_id,
                  result.version.value());
  } else {
    result.version = current;
    LOG_APP_DEBUG("{} failed: {}", action, result.state.ToString());
  }
  return result;
}

} // anonymous namespace

MutationResult AddNote(store::NoteStore &store, DataVersion current,
                       const std::string &title, const std::string &body) {
  MutationResult result;
  auto id = store.Insert(title, body, result.state);
  if (id) {
    result.ok = true;
    result.note_id = *id;
  }
  return Finish(std::move(result), current, "add");
}

MutationResult EditNote(store::NoteStore &store, DataVersion current,
                        int64_t id, const std::string &title,
                        const std::string &body) {
  MutationResult result;
  result.note_id = id;
  result.ok = store.Update(id, title, body, result.state);
  return Finish(std::move(result), current, "edit");
}

MutationResult RemoveNote(store::NoteStore &store, DataVersion current,
                          int64_t id) {
  MutationResult result;
  result.note_id = id;
  result.ok = store.Delete(id, result.state);
  return Finish(std::move(result), current, "remove");
}

} // namespace app
} // namespace notekeep
