// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include "app/data_version.hpp"
#include "store/note.hpp"
#include "util/op_state.hpp"
#include <cstddef>
#include <vector>

namespace notekeep {
namespace store {
class NoteStore;
}

namespace app {

/**
 * NoteListView - pull-based snapshot of NoteStore::ListAll()
 *
 * The view remembers the DataVersion it last rendered. Refresh() compares
 * it against the caller's latest version by inequality and re-fetches only
 * when they differ, so several mutations between renders cost one fetch
 * and the fetch always shows the store's latest content.
 *
 * A failed fetch keeps the previous snapshot and rendered version; the
 * next Refresh() with the same latest version tries again.
 */
class NoteListView {
public:
  NoteListView() = default;

  /**
   * Re-fetch the list if latest differs from the rendered version
   * @return true if the store was read and the snapshot replaced
   */
  bool Refresh(const store::NoteStore &store, DataVersion latest,
               util::OpState &state);

  bool IsStale(DataVersion latest) const {
    return !has_rendered_ || latest != rendered_version_;
  }

  const std::vector<store::Note> &notes() const { return notes_; }
  DataVersion rendered_version() const { return rendered_version_; }
  size_t fetch_count() const { return fetch_count_; }

private:
  std::vector<store::Note> notes_;
  DataVersion rendered_version_;
  bool has_rendered_{false};
  size_t fetch_count_{0};
};

} // namespace app
} // namespace notekeep
