// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <istream>
#include <ostream>

namespace notekeep {
namespace app {

Application::Application(const AppConfig &config) : config_(config) {}

Application::~Application() { shutdown(); }

bool Application::initialize() {
  if (initialized_) {
    return true;
  }

  LOG_APP_INFO("Initializing {}...", GetFullVersionString());

  // Create data directory
  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  // Open the note store (creates the schema on first run)
  if (!init_store()) {
    LOG_APP_ERROR("Failed to initialize note store");
    return false;
  }

  dispatcher_ = std::make_unique<CommandDispatcher>(*store_, config_.datadir);
  initialized_ = true;

  LOG_APP_INFO("Initialization complete");
  return true;
}

void Application::shutdown() {
  if (!initialized_) {
    return;
  }

  LOG_APP_DEBUG("Shutting down...");
  initialized_ = false;

  // Dispatcher holds a reference to the store
  dispatcher_.reset();
  if (store_) {
    store_->Close();
    store_.reset();
  }

  LOG_APP_DEBUG("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}",
                  config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_store() {
  store::NoteStore::Options options;
  options.db_path = config_.db_path();
  options.busy_timeout = std::chrono::milliseconds(config_.busy_timeout_ms);

  LOG_APP_INFO("Opening note store: {} (busy timeout {} ms)",
               options.db_path.string(), config_.busy_timeout_ms);

  store_ = std::make_unique<store::NoteStore>(options);

  util::OpState state;
  if (!store_->Init(state)) {
    LOG_APP_ERROR("Note store unavailable: {}", state.ToString());
    store_.reset();
    return false;
  }
  return true;
}

CommandResponse Application::RunCommand(const std::string &method,
                                        const std::vector<std::string> &params) {
  if (!initialized_) {
    util::OpState state;
    state.Fail(util::ErrorKind::StoreUnavailable, config_.db_path().string(),
               "application not initialized");
    return CommandResponse{false,
                           {{"error", state.UserMessage()},
                            {"kind", util::ErrorKindName(state.GetKind())}}};
  }
  return dispatcher_->Execute(method, params);
}

void Application::refresh_view(std::ostream &out) {
  util::OpState state;
  if (view_.Refresh(*store_, dispatcher_->version(), state)) {
    out << "list refreshed (version " << view_.rendered_version().value()
        << ", " << view_.notes().size() << " notes)\n";
  } else if (state.IsError()) {
    out << "list refresh failed: " << state.UserMessage() << "\n";
  }
}

int Application::RunShell(std::istream &in, std::ostream &out) {
  if (!initialized_) {
    LOG_APP_ERROR("RunShell called before initialize()");
    return 1;
  }

  // Render the initial list
  refresh_view(out);

  std::string line;
  while (std::getline(in, line)) {
    auto args = util::SplitCommandLine(line);
    if (!args) {
      out << CommandResponse{false, {{"error", "unterminated quote"}}}.Render();
      continue;
    }
    if (args->empty()) {
      continue;
    }

    std::string method = args->front();
    if (method == "quit" || method == "exit") {
      break;
    }
    if (method == "shell") {
      out << CommandResponse{false, {{"error", "already in shell"}}}.Render();
      continue;
    }

    std::vector<std::string> params(args->begin() + 1, args->end());
    out << dispatcher_->Execute(method, params).Render();
    refresh_view(out);
  }

  out.flush();
  return 0;
}

} // namespace app
} // namespace notekeep
