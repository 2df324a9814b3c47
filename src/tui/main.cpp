#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

#include "tinydc/Commands.hpp"
#include "tinydc/Config.hpp"
#include "tinydc/EntrySource.hpp"
#include "tinydc/FrecencyIndex.hpp"
#include "tinydc/Navigator.hpp"
#include "tui/BrowserScreen.hpp"
#include "tui/HelpScreen.hpp"
#include "tui/Signal.hpp"
#include "tui/StateMachine.hpp"

namespace {
void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [command]\n"
              << "  (no command)     browse interactively, print the chosen directory\n"
              << "  push <path>      record a visit to <path>\n"
              << "  z [query...]     print the best frecent match for query\n"
              << "  prune            forget directories that no longer exist\n"
              << "  init <shell>     print wrapper functions for bash, zsh or fish\n";
}

// Runs the browser and returns the chosen directory, if any. Returns false when the
// terminal cannot be driven at all.
bool RunBrowser(const AppConfig& config, const FrecencyIndex& index, std::optional<std::string>& chosen) {
    std::error_code ec;
    std::filesystem::path start = std::filesystem::current_path(ec);
    if (ec) {
        start = HomeDirectory();
    }

    FilesystemEntrySource source(index, config.GetBool("show_hidden", true));
    NavigatorOptions options;
    options.frecent_limit = static_cast<std::size_t>(std::max(0, config.GetInt("frecent_limit", 200)));
    options.key_sequence_timeout = std::chrono::milliseconds(std::max(1, config.GetInt("key_sequence_timeout_ms", 1000)));
    Navigator navigator(source, start, options);

    // stdout belongs to the shell wrapper, so the interface is drawn on the controlling terminal.
    std::FILE* tty = std::fopen("/dev/tty", "w");
    if (tty == nullptr) {
        std::cerr << "Error: could not open /dev/tty\n";
        return false;
    }

    InitStopSignalHandlers();

    try {
        notcurses_options nc_options = ncpp::NotCurses::default_notcurses_options;
        nc_options.flags |= NCOPTION_SUPPRESS_BANNERS | NCOPTION_NO_QUIT_SIGHANDLERS;
        ncpp::NotCurses nc(nc_options, tty);
        std::unique_ptr<ncpp::Plane> stdplane{nc.get_stdplane()};

        StateMachine machine;
        machine.AddState("browser", std::make_shared<BrowserScreen>(navigator));
        machine.AddState("help", std::make_shared<HelpScreen>(navigator));
        machine.TransitionTo("browser", *stdplane);
        machine.Run(nc, *stdplane);
        // NotCurses restores the terminal when it goes out of scope.
    } catch (const ncpp::init_error& e) {
        std::fclose(tty);
        std::cerr << "Error: could not initialize the terminal: " << e.what() << "\n";
        return false;
    }
    std::fclose(tty);

    if (navigator.Finished()) {
        chosen = navigator.ExitPath();
    }
    return true;
}

std::string JoinArgs(int argc, char** argv, int first) {
    std::string joined;
    for (int i = first; i < argc; ++i) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += argv[i];
    }
    return joined;
}
}

int main(int argc, char** argv) {
    const std::string command = argc > 1 ? argv[1] : "";

    if (command == "-h" || command == "--help") {
        PrintUsage(argv[0]);
        return 0;
    }
    if (command == "init") {
        if (argc != 3) {
            PrintUsage(argv[0]);
            return 2;
        }
        return RunInit(argv[2], std::cout, std::cerr);
    }
    if (!command.empty() && command != "push" && command != "z" && command != "prune") {
        std::cerr << "Unknown command '" << command << "'\n";
        PrintUsage(argv[0]);
        return 2;
    }

    AppConfig config;
    const std::filesystem::path config_path = AppConfig::DefaultPath();
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec) && !config.LoadFromFile(config_path)) {
        std::cerr << "Warning: could not load config from " << config_path << "; using defaults.\n";
    }

    FrecencyIndex index(config.IndexFile());
    // A broken index only degrades ranking; every command keeps going with an empty one.
    const bool loaded = index.Load();

    if (command == "push") {
        if (argc != 3) {
            PrintUsage(argv[0]);
            return 2;
        }
        if (!loaded) {
            // Rewriting now would replace the unreadable file with a near-empty one.
            std::cerr << "Error: index " << index.File() << " is unreadable; visit not recorded.\n";
            return 1;
        }
        return RunPush(index, argv[2], std::cerr);
    }
    if (command == "z") {
        return RunJump(index, JoinArgs(argc, argv, 2), std::cout);
    }
    if (command == "prune") {
        if (!loaded) {
            return 1;
        }
        return RunPrune(index, std::cerr);
    }

    std::optional<std::string> chosen;
    if (!RunBrowser(config, index, chosen)) {
        return 1;
    }
    if (chosen) {
        std::cout << *chosen << "\n";
    }
    return 0;
}
