#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "LispError.hpp"
#include "SourceManager.hpp"
#include "colors.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace diylisp {
namespace cli {

static const char* const kProjectFile = "diylisp.json";

// Parse diylisp.json with nlohmann/json
std::optional<ProjectConfig> parse_project_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            std::cerr << "JSON error in " << filepath << ": top-level value must be an object" << std::endl;
            return std::nullopt;
        }

        ProjectConfig config;

        // Extract basic fields with defaults
        config.name = j.value("name", "");
        config.version = j.value("version", "");
        config.entry = j.value("entry", "");
        config.description = j.value("description", "");
        config.author = j.value("author", "");
        config.license = j.value("license", "");

        if (j.contains("keywords") && j["keywords"].is_array()) {
            for (const auto& keyword : j["keywords"]) {
                if (keyword.is_string()) {
                    config.keywords.push_back(keyword.get<std::string>());
                }
            }
        }

        return config;

    } catch (const json::parse_error& e) {
        std::cerr << "JSON parse error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const json::exception& e) {
        std::cerr << "JSON error in " << filepath << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool write_project_json(const std::string& filepath, const ProjectConfig& config) {
    json j;
    j["name"] = config.name;
    j["version"] = config.version;
    j["entry"] = config.entry;
    j["description"] = config.description;
    j["author"] = config.author;
    j["license"] = config.license;
    j["keywords"] = config.keywords;

    std::ofstream file(filepath);
    if (!file.is_open()) return false;
    file << j.dump(2) << "\n";
    return static_cast<bool>(file);
}

std::string get_project_root(const std::string& start_dir) {
    fs::path current = fs::absolute(start_dir);

    while (true) {
        fs::path config_path = current / kProjectFile;
        if (fs::exists(config_path)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ProjectConfig> find_and_parse_project_json(const std::string& start_dir) {
    std::string root = get_project_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return parse_project_json((fs::path(root) / kProjectFile).string());
}

std::optional<std::string> resolve_script(const std::string& potential, std::vector<std::string>* tried) {
    fs::path p(potential);
    if (fs::exists(p) && !fs::is_directory(p)) {
        return p.string();
    }
    if (tried) tried->push_back(p.string());
    if (p.has_extension()) {
        return std::nullopt;
    }

    for (const char* ext : {".dl", ".lisp"}) {  // order matters
        fs::path candidate = p;
        candidate += ext;
        if (fs::exists(candidate)) return candidate.string();
        if (tried) tried->push_back(candidate.string());
    }
    return std::nullopt;
}

int run_source(const std::string& source,
    const std::string& filename,
    std::ostream& out,
    std::ostream& err,
    const RunOptions& opts) {
    SourceManager mgr(filename, source);

    try {
        Lexer lexer(source, filename, &mgr);
        std::vector<Token> tokens = lexer.tokenize();

        if (opts.dump_tokens) print_tokens(tokens, err);

        Parser parser(tokens);
        std::vector<Value> program = parser.parse();

        Evaluator evaluator(out);
        evaluator.evaluate_program(program);
    } catch (const ParseError& e) {
        err << Evaluator::cerr_colored(e.what(), opts.color) << std::endl;
        return 1;
    } catch (const LispError& e) {
        err << Evaluator::cerr_colored(std::string(filename) + ": " + e.what(), opts.color) << std::endl;
        return 1;
    }
    return 0;
}

int run_file(const std::string& filename, const RunOptions& opts) {
    RunOptions file_opts = opts;
    file_opts.color = Color::supports_color(STDERR_FILENO);

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << Evaluator::cerr_colored("Could not open file " + filename, file_opts.color) << std::endl;
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return run_source(buffer.str(), filename, std::cout, std::cerr, file_opts);
}

// ----------------- subcommands -----------------

CommandResult cmd_init(const std::vector<std::string>& args) {
    fs::path config_path = fs::current_path() / kProjectFile;
    if (fs::exists(config_path)) {
        return {1, std::string(kProjectFile) + " already exists in " + fs::current_path().string()};
    }

    ProjectConfig config;
    config.name = args.size() > 1 ? args[1] : fs::current_path().filename().string();
    config.version = "0.1.0";
    config.entry = "main.dl";
    config.license = "MIT";

    if (!write_project_json(config_path.string(), config)) {
        return {1, "Could not write " + config_path.string()};
    }

    fs::path entry_path = fs::current_path() / config.entry;
    if (!fs::exists(entry_path)) {
        std::ofstream entry(entry_path);
        entry << "; " << config.name << "\n"
              << "(print 'hello)\n";
    }

    return {0, "Initialized project '" + config.name + "'"};
}

CommandResult cmd_start(const std::vector<std::string>& args) {
    (void)args;
    std::string root = get_project_root(".");
    if (root.empty()) {
        return {1, std::string("No ") + kProjectFile + " found in this directory or any parent"};
    }

    auto config = find_and_parse_project_json(root);
    if (!config) {
        return {1, std::string("Invalid ") + kProjectFile + " in " + root};
    }
    if (config->entry.empty()) {
        return {1, std::string(kProjectFile) + " has no \"entry\" field"};
    }

    fs::path entry = fs::path(root) / config->entry;
    if (!fs::exists(entry)) {
        return {1, "Entry file not found: " + entry.string()};
    }
    return {run_file(entry.string()), ""};
}

CommandResult cmd_run(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return {1, "Usage: diylisp run <file>"};
    }

    std::vector<std::string> tried;
    auto script = resolve_script(args[1], &tried);
    if (!script) {
        std::string msg = "Could not find file '" + args[1] + "'. Tried:";
        for (const auto& t : tried) msg += "\n  " + t;
        return {1, msg};
    }
    return {run_file(*script), ""};
}

bool is_command(const std::string& name) {
    return name == "init" || name == "start" || name == "run";
}

CommandResult execute_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        return {1, "No command given"};
    }

    const std::string& cmd = args[0];
    if (cmd == "init") return cmd_init(args);
    if (cmd == "start") return cmd_start(args);
    if (cmd == "run") return cmd_run(args);

    return {1, "Unknown command '" + cmd + "'"};
}

}  // namespace cli
}  // namespace diylisp
