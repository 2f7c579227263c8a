// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "app/note_list_view.hpp"
#include "store/note_store.hpp"
#include "util/logging.hpp"

namespace notekeep {
namespace app {

bool NoteListView::Refresh(const store::NoteStore &store, DataVersion latest,
                           util::OpState &state) {
  if (!IsStale(latest)) {
    return false;
  }

  auto notes = store.ListAll(state);
  if (!notes) {
    LOG_APP_WARN("list refresh at version {} failed: {}", latest.value(),
                 state.ToString());
    return false;
  }

  notes_ = std::move(*notes);
  rendered_version_ = latest;
  has_rendered_ = true;
  ++fetch_count_;
  LOG_APP_DEBUG("list refreshed at version {} ({} notes)", latest.value(),
                notes_.size());
  return true;
}

} // namespace app
} // namespace notekeep
