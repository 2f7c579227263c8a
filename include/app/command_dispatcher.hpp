// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include "app/data_version.hpp"
#include "util/op_state.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace notekeep {

namespace store {
class NoteStore;
}

namespace app {

/**
 * Result of one command: a JSON document plus success flag
 */
struct CommandResponse {
  bool ok{true};
  nlohmann::json body;

  // Pretty-printed JSON with trailing newline
  std::string Render() const;
};

/**
 * CommandDispatcher - named command handlers over one NoteStore
 *
 * Owns the session's DataVersion: each successful add/edit/delete replaces
 * it with the version returned by the mutation. Front ends read version()
 * after every command to decide whether their list view is stale.
 *
 * The draft document lives at <datadir>/draft.json as {"text": "..."} and
 * is written through the atomic file writer.
 */
class CommandDispatcher {
public:
  using CommandHandler =
      std::function<CommandResponse(const std::vector<std::string> &)>;

  CommandDispatcher(store::NoteStore &store, std::filesystem::path datadir);

  CommandResponse Execute(const std::string &method,
                          const std::vector<std::string> &params);

  bool HasCommand(const std::string &method) const;

  DataVersion version() const { return version_; }
  std::filesystem::path draft_path() const { return datadir_ / "draft.json"; }

private:
  void RegisterHandlers();

  // Notes
  CommandResponse HandleAdd(const std::vector<std::string> &params);
  CommandResponse HandleEdit(const std::vector<std::string> &params);
  CommandResponse HandleDelete(const std::vector<std::string> &params);
  CommandResponse HandleList(const std::vector<std::string> &params);
  CommandResponse HandleShow(const std::vector<std::string> &params);
  CommandResponse HandleSearch(const std::vector<std::string> &params);
  CommandResponse HandleCount(const std::vector<std::string> &params);

  // Files
  CommandResponse HandleExport(const std::vector<std::string> &params);
  CommandResponse HandleSaveDraft(const std::vector<std::string> &params);
  CommandResponse HandleLoadDraft(const std::vector<std::string> &params);

  CommandResponse HandleVersion(const std::vector<std::string> &params);

  static CommandResponse Error(const std::string &message);
  static CommandResponse Error(const util::OpState &state);

  store::NoteStore &store_;
  std::filesystem::path datadir_;
  DataVersion version_;
  std::map<std::string, CommandHandler> handlers_;
};

} // namespace app
} // namespace notekeep
