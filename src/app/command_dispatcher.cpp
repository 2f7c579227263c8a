// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "app/command_dispatcher.hpp"
#include "app/note_actions.hpp"
#include "store/note_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace notekeep {
namespace app {

namespace {

json NoteToJson(const store::Note &note) {
  return {{"id", note.id},
          {"title", note.title},
          {"body", note.body},
          {"created_at", note.created_at},
          {"created", util::FormatTime(note.created_at)}};
}

json NotesToJson(const std::vector<store::Note> &notes) {
  json arr = json::array();
  for (const auto &note : notes) {
    arr.push_back(NoteToJson(note));
  }
  return arr;
}

std::optional<int64_t> ParseNoteId(const std::string &str) {
  return util::SafeParseInt64(str, 1, std::numeric_limits<int64_t>::max());
}

std::string JoinParams(const std::vector<std::string> &params, size_t from) {
  std::string joined;
  for (size_t i = from; i < params.size(); ++i) {
    if (i > from) {
      joined += ' ';
    }
    joined += params[i];
  }
  return joined;
}

std::string DumpJson(const json &j, int indent) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

std::string CommandResponse::Render() const { return DumpJson(body, 2) + "\n"; }

CommandDispatcher::CommandDispatcher(store::NoteStore &store,
                                     std::filesystem::path datadir)
    : store_(store), datadir_(std::move(datadir)) {
  RegisterHandlers();
}

void CommandDispatcher::RegisterHandlers() {
  handlers_["add"] = [this](const auto &p) { return HandleAdd(p); };
  handlers_["edit"] = [this](const auto &p) { return HandleEdit(p); };
  handlers_["delete"] = [this](const auto &p) { return HandleDelete(p); };
  handlers_["list"] = [this](const auto &p) { return HandleList(p); };
  handlers_["show"] = [this](const auto &p) { return HandleShow(p); };
  handlers_["search"] = [this](const auto &p) { return HandleSearch(p); };
  handlers_["count"] = [this](const auto &p) { return HandleCount(p); };

  handlers_["export"] = [this](const auto &p) { return HandleExport(p); };
  handlers_["savedraft"] = [this](const auto &p) { return HandleSaveDraft(p); };
  handlers_["loaddraft"] = [this](const auto &p) { return HandleLoadDraft(p); };

  handlers_["version"] = [this](const auto &p) { return HandleVersion(p); };
}

bool CommandDispatcher::HasCommand(const std::string &method) const {
  return handlers_.count(method) > 0;
}

CommandResponse
CommandDispatcher::Execute(const std::string &method,
                           const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return Error("Unknown command: " + method);
  }

  try {
    return it->second(params);
  } catch (const std::exception &e) {
    // Log full error internally, return an opaque message
    LOG_APP_ERROR("command '{}' failed: {}", method, e.what());
    return Error("a technical error occurred, please try again");
  }
}

CommandResponse CommandDispatcher::Error(const std::string &message) {
  return CommandResponse{false, {{"error", message}}};
}

CommandResponse CommandDispatcher::Error(const util::OpState &state) {
  if (state.GetKind() == util::ErrorKind::StoreUnavailable ||
      state.GetKind() == util::ErrorKind::IOFailure) {
    LOG_APP_ERROR("{}", state.ToString());
  }
  return CommandResponse{false,
                         {{"error", state.UserMessage()},
                          {"kind", util::ErrorKindName(state.GetKind())}}};
}

CommandResponse
CommandDispatcher::HandleAdd(const std::vector<std::string> &params) {
  if (params.size() != 2) {
    return Error("Usage: add <title> <body>");
  }

  MutationResult result = AddNote(store_, version_, params[0], params[1]);
  if (!result.ok) {
    return Error(result.state);
  }
  version_ = result.version;
  return CommandResponse{
      true, {{"id", result.note_id}, {"version", version_.value()}}};
}

CommandResponse
CommandDispatcher::HandleEdit(const std::vector<std::string> &params) {
  if (params.size() != 3) {
    return Error("Usage: edit <id> <title> <body>");
  }
  auto id = ParseNoteId(params[0]);
  if (!id) {
    return Error("Invalid note id: " + params[0]);
  }

  MutationResult result = EditNote(store_, version_, *id, params[1], params[2]);
  if (!result.ok) {
    return Error(result.state);
  }
  version_ = result.version;
  return CommandResponse{
      true, {{"id", result.note_id}, {"version", version_.value()}}};
}

CommandResponse
CommandDispatcher::HandleDelete(const std::vector<std::string> &params) {
  if (params.size() != 1) {
    return Error("Usage: delete <id>");
  }
  auto id = ParseNoteId(params[0]);
  if (!id) {
    return Error("Invalid note id: " + params[0]);
  }

  MutationResult result = RemoveNote(store_, version_, *id);
  if (!result.ok) {
    return Error(result.state);
  }
  version_ = result.version;
  return CommandResponse{true,
                         {{"id", result.note_id},
                          {"deleted", true},
                          {"version", version_.value()}}};
}

CommandResponse
CommandDispatcher::HandleList(const std::vector<std::string> &params) {
  util::OpState state;
  auto notes = store_.ListAll(state);
  if (!notes) {
    return Error(state);
  }
  return CommandResponse{true, NotesToJson(*notes)};
}

CommandResponse
CommandDispatcher::HandleShow(const std::vector<std::string> &params) {
  if (params.size() != 1) {
    return Error("Usage: show <id>");
  }
  auto id = ParseNoteId(params[0]);
  if (!id) {
    return Error("Invalid note id: " + params[0]);
  }

  util::OpState state;
  auto note = store_.Get(*id, state);
  if (!note) {
    return Error(state);
  }
  return CommandResponse{true, NoteToJson(*note)};
}

CommandResponse
CommandDispatcher::HandleSearch(const std::vector<std::string> &params) {
  util::OpState state;
  auto notes = store_.Search(JoinParams(params, 0), state);
  if (!notes) {
    return Error(state);
  }
  return CommandResponse{true, NotesToJson(*notes)};
}

CommandResponse
CommandDispatcher::HandleCount(const std::vector<std::string> &params) {
  util::OpState state;
  auto count = store_.Count(state);
  if (!count) {
    return Error(state);
  }
  return CommandResponse{true, {{"count", *count}}};
}

CommandResponse
CommandDispatcher::HandleExport(const std::vector<std::string> &params) {
  if (params.size() != 1) {
    return Error("Usage: export <path>");
  }

  util::OpState state;
  auto notes = store_.ListAll(state);
  if (!notes) {
    return Error(state);
  }

  std::filesystem::path path(params[0]);
  if (!util::atomic_write_file(path, DumpJson(NotesToJson(*notes), 2) + "\n",
                               state)) {
    return Error(state);
  }

  LOG_APP_INFO("exported {} notes to {}", notes->size(), path.string());
  return CommandResponse{true,
                         {{"path", path.string()}, {"notes", notes->size()}}};
}

CommandResponse
CommandDispatcher::HandleSaveDraft(const std::vector<std::string> &params) {
  std::string text = JoinParams(params, 0);
  std::string data = DumpJson(json{{"text", text}}, 2) + "\n";

  util::OpState state;
  if (!util::atomic_write_file(draft_path(), data, 0600, state)) {
    return Error(state);
  }
  return CommandResponse{
      true, {{"path", draft_path().string()}, {"bytes", data.size()}}};
}

CommandResponse
CommandDispatcher::HandleLoadDraft(const std::vector<std::string> &params) {
  std::error_code ec;
  if (!std::filesystem::exists(draft_path(), ec)) {
    return CommandResponse{true, {{"text", ""}}};
  }

  std::string data = util::read_file_string(draft_path());
  try {
    json j = json::parse(data);
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
      util::OpState state;
      state.Fail(util::ErrorKind::IOFailure, draft_path().string(),
                 "draft has no text field");
      return Error(state);
    }
    return CommandResponse{true, {{"text", j["text"].get<std::string>()}}};
  } catch (const json::exception &e) {
    util::OpState state;
    state.Fail(util::ErrorKind::IOFailure, draft_path().string(),
               std::string("draft parse error: ") + e.what());
    return Error(state);
  }
}

CommandResponse
CommandDispatcher::HandleVersion(const std::vector<std::string> &params) {
  return CommandResponse{true,
                         {{"client", GetVersionString()},
                          {"data_version", version_.value()}}};
}

} // namespace app
} // namespace notekeep
