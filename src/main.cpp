#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "colors.hpp"
#include "repl.hpp"

/**
 * diylisp: a small Lisp evaluator.
 *
 *   diylisp                 start the REPL
 *   diylisp file.dl         run a script
 *   diylisp init|start|run  project commands (see --help)
 */

int main(int argc, char* argv[]) {
    auto print_usage = []() {
        std::cout << "Usage: diylisp [options] [file]\n"
                  << "       diylisp <command> [args]\n"
                  << "Options:\n"
                  << "  -v, --version    Print version and exit\n"
                  << "  -i               Start REPL (interactive)\n"
                  << "  -h, --help       Show this help message\n"
                  << "  --tokens         Dump the token stream to stderr before running\n"
                  << "  --no-color       Disable colored diagnostics\n"
                  << "Commands:\n"
                  << "  init [name]      Create diylisp.json and main.dl in the current directory\n"
                  << "  start            Run the entry file named in the nearest diylisp.json\n"
                  << "  run <file>       Run a script\n"
                  << "\n"
                  << "If a filename starts with '-', use `--` to end options:\n"
                  << "  diylisp -- -weird.dl\n";
    };

    if (argc == 1) {
        run_repl_mode();
        return 0;
    }

    diylisp::cli::RunOptions opts;
    std::string potential;
    bool seen_double_dash = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (seen_double_dash) {
            potential = arg;
            break;
        }

        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            if (arg == "-v" || arg == "--version") {
                std::cout << "diylisp v" << DIYLISP_VERSION << std::endl;
                return 0;
            } else if (arg == "-i") {
                run_repl_mode();
                return 0;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else if (arg == "--tokens") {
                opts.dump_tokens = true;
                continue;
            } else if (arg == "--no-color") {
                Color::enabled() = false;
                continue;
            } else {
                std::cerr << "diylisp: unknown option '" << arg << "'\n";
                std::cerr << "Try 'diylisp --help' for more information.\n";
                return 1;
            }
        }

        if (diylisp::cli::is_command(arg)) {
            std::vector<std::string> args(argv + i, argv + argc);
            diylisp::cli::CommandResult result = diylisp::cli::execute_command(args);
            if (!result.message.empty()) {
                (result.exit_code == 0 ? std::cout : std::cerr) << result.message << std::endl;
            }
            return result.exit_code;
        }

        // First non-option argument is treated as filename
        potential = arg;
        break;
    }

    if (potential.empty()) {
        run_repl_mode();
        return 0;
    }

    std::vector<std::string> tried;
    auto script = diylisp::cli::resolve_script(potential, &tried);
    if (!script) {
        std::cerr << "Error: Could not find file '" << potential << "'. Tried:\n";
        for (const auto& t : tried) std::cerr << "  " << t << "\n";
        return 1;
    }

    return diylisp::cli::run_file(*script, opts);
}
