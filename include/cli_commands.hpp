#ifndef DIYLISP_CLI_COMMANDS_HPP
#define DIYLISP_CLI_COMMANDS_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace diylisp {
namespace cli {

// Structure to hold parsed diylisp.json data
struct ProjectConfig {
    std::string name;
    std::string version;
    std::string entry;  // script run by `diylisp start`, relative to the project root
    std::string description;
    std::string author;
    std::string license;

    std::vector<std::string> keywords;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Options that affect how a script is run
struct RunOptions {
    bool dump_tokens = false;  // --tokens
    bool color = false;        // ANSI colors in diagnostics
};

// Subcommand dispatcher; args[0] is the subcommand name
bool is_command(const std::string& name);
CommandResult execute_command(const std::vector<std::string>& args);

// Individual command implementations
CommandResult cmd_init(const std::vector<std::string>& args);
CommandResult cmd_start(const std::vector<std::string>& args);
CommandResult cmd_run(const std::vector<std::string>& args);

// Project file helpers
std::optional<ProjectConfig> find_and_parse_project_json(const std::string& start_dir = ".");
std::optional<ProjectConfig> parse_project_json(const std::string& filepath);
bool write_project_json(const std::string& filepath, const ProjectConfig& config);
std::string get_project_root(const std::string& start_dir = ".");

// Script helpers
// Resolves a script argument: the path as given, else with .dl, else with .lisp.
// On failure the candidates that were tried are appended to `tried`.
std::optional<std::string> resolve_script(const std::string& potential, std::vector<std::string>* tried = nullptr);

// Parse and evaluate every form of `source` in one fresh root environment.
// Program output goes to `out`, diagnostics to `err`. Returns the exit status.
// run_file writes to std::cout/std::cerr and colors diagnostics when stderr supports it.
int run_source(const std::string& source,
    const std::string& filename,
    std::ostream& out,
    std::ostream& err,
    const RunOptions& opts = {});
int run_file(const std::string& filename, const RunOptions& opts = {});

}  // namespace cli
}  // namespace diylisp

#endif  // DIYLISP_CLI_COMMANDS_HPP
