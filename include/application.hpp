// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include "app/command_dispatcher.hpp"
#include "app/note_list_view.hpp"
#include "store/note_store.hpp"
#include "util/files.hpp"
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace notekeep {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory
  std::filesystem::path datadir;

  // Database file name inside datadir
  std::string db_name = "notes.db";

  // How long a write waits for the database lock (0..600000 ms)
  int busy_timeout_ms = 5000;

  AppConfig() : datadir(util::get_default_datadir()) {}

  std::filesystem::path db_path() const { return datadir / db_name; }
};

// Application - wires the note store to the command front end
// Owns the store and the dispatcher; single-shot commands go through
// RunCommand(), the interactive loop through RunShell().
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  void shutdown();

  // Run one command. Requires a successful initialize().
  CommandResponse RunCommand(const std::string &method,
                             const std::vector<std::string> &params);

  // Read commands line by line until EOF, "quit" or "exit".
  // Results go to out; after each command the note list is refreshed if
  // the session's data version moved.
  int RunShell(std::istream &in, std::ostream &out);

  // Component access
  store::NoteStore &note_store() { return *store_; }
  CommandDispatcher &dispatcher() { return *dispatcher_; }
  const NoteListView &list_view() const { return view_; }

  bool is_initialized() const { return initialized_; }

private:
  AppConfig config_;
  bool initialized_{false};

  std::unique_ptr<store::NoteStore> store_;
  std::unique_ptr<CommandDispatcher> dispatcher_;
  NoteListView view_;

  // Initialization steps
  bool init_datadir();
  bool init_store();

  void refresh_view(std::ostream &out);
};

} // namespace app
} // namespace notekeep
