#include "repl.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>

#include "colors.hpp"
#include "linenoise.h"

namespace fs = std::filesystem;

static std::optional<fs::path> get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return fs::path(home);
    return std::nullopt;
}

static fs::path history_file() {
    const char* override_path = std::getenv("DIYLISP_HISTORY");
    if (override_path && override_path[0] != '\0') {
        return fs::path(override_path);
    }
    auto home = get_home_dir();
    if (home.has_value()) {
        return home.value() / ".diylisp_history";
    }
    return fs::current_path() / ".diylisp_history";
}

void run_repl_mode() {
    ReplSession session(std::cout, std::cerr, Color::supports_color(STDERR_FILENO));

    std::cout << "diylisp v" << DIYLISP_VERSION << " | built on " << __DATE__ << "\n";
    std::cout << "diylisp REPL - type 'exit' or 'quit' or Ctrl-D to quit\n";

    fs::path history_path = history_file();
    linenoiseHistoryLoad(history_path.string().c_str());

    std::string last_added_history;

    while (true) {
        std::string prompt = session.pending() ? "... " : ">>> ";
        char* raw = linenoise(prompt.c_str());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        if (!session.pending() && (line == "exit" || line == "quit")) break;

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        session.feed(line);
    }

    if (linenoiseHistorySave(history_path.string().c_str()) != 0) {
        std::cerr << "warning: could not save history to " << history_path << std::endl;
    }
}
