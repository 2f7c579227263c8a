// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [params]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.notekeep)\n"
      << "  --db=<file>          Database file inside the data directory (default: notes.db)\n"
      << "  --busytimeout=<ms>   How long a write waits for the database lock (default: 5000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: store, files, app, all\n"
      << "                       Can be comma-separated: --debug=store,files\n"
      << "  --logfile            Log to <datadir>/debug.log instead of stderr\n"
      << "\n"
      << "Commands:\n"
      << "  add <title> <body>         Create a note\n"
      << "  edit <id> <title> <body>   Replace a note's title and body\n"
      << "  delete <id>                Delete a note\n"
      << "  list                       List all notes, newest first\n"
      << "  show <id>                  Show one note\n"
      << "  search <text>              Notes whose title or body contains text\n"
      << "  count                      Number of notes\n"
      << "  export <path>              Write all notes to a JSON file\n"
      << "  savedraft <text>           Save the draft document\n"
      << "  loaddraft                  Print the draft document\n"
      << "  version                    Show version and data version\n"
      << "  shell                      Read commands from stdin\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    notekeep::app::AppConfig config;
    std::string log_level = "warn";
    bool log_to_file = false;
    std::vector<std::string> debug_components;

    int i = 1;
    for (; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg.rfind("--", 0) != 0) {
        break; // first command word
      }

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << notekeep::GetFullVersionString() << std::endl;
        std::cout << notekeep::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--db=") == 0) {
        config.db_name = arg.substr(5);
        if (config.db_name.empty()) {
          std::cerr << "Error: --db requires a file name" << std::endl;
          return 1;
        }
      } else if (arg.find("--busytimeout=") == 0) {
        auto timeout_opt = notekeep::util::SafeParseInt(arg.substr(14), 0, 600000);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid busy timeout: " << arg.substr(14) << std::endl;
          std::cerr << "Timeout must be a number of milliseconds between 0 and 600000" << std::endl;
          return 1;
        }
        config.busy_timeout_ms = *timeout_opt;
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg == "--logfile") {
        log_to_file = true;
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=store,files
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (i >= argc) {
      print_usage(argv[0]);
      return 1;
    }

    std::string method = argv[i++];
    std::vector<std::string> params(argv + i, argv + argc);

    // Ensure datadir exists before initializing file logger
    if (log_to_file && !notekeep::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory: "
                << config.datadir.string() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    notekeep::util::LogManager::Initialize(log_level, log_to_file, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        notekeep::util::LogManager::SetLogLevel("trace");
      } else if (!notekeep::util::LogManager::SetComponentLevel(component,
                                                                "trace")) {
        std::cerr << "WARNING: unknown debug component: " << component
                  << std::endl;
      }
    }

    int exit_code = 0;

    // Nested scope so the store closes before LogManager::Shutdown()
    {
      notekeep::app::Application app(config);

      if (!app.initialize()) {
        std::cout << notekeep::app::CommandResponse{
                         false,
                         {{"error", "a technical error occurred, please try again"},
                          {"kind", "StoreUnavailable"}}}
                         .Render();
        notekeep::util::LogManager::Shutdown();
        return 1;
      }

      if (method == "shell") {
        exit_code = app.RunShell(std::cin, std::cout);
      } else {
        auto response = app.RunCommand(method, params);
        std::cout << response.Render();
        exit_code = response.ok ? 0 : 1;
      }
    }

    notekeep::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    notekeep::util::LogManager::Shutdown();
    return 1;
  }
}
