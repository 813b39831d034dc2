#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "Presenter.hpp"
#include "SourceManager.hpp"
#include "colors.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace useless {
namespace cli {

static const char* CONFIG_FILE = "useless.json";

static bool err_is_terminal(const std::ostream& err) {
    return &err == &std::cerr && Color::supports_color(STDERR_FILENO);
}

static std::optional<uint64_t> read_unsigned(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_number_unsigned()) {
        throw std::runtime_error(std::string("'") + key + "' must be a non-negative integer");
    }
    return j[key].get<uint64_t>();
}

static std::optional<bool> read_bool(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<bool>();
}

ProjectConfig parse_config(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file " + filepath);
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            throw std::runtime_error("top level must be an object");
        }

        ProjectConfig config;
        config.name = j.value("name", "");
        config.entry = j.value("entry", "");
        config.seed = read_unsigned(j, "seed");
        config.tick_ms = read_unsigned(j, "tick_ms");
        config.default_timeout_ms = read_unsigned(j, "default_timeout_ms");
        config.mischief = read_bool(j, "mischief");
        config.trace = read_bool(j, "trace");

        config.root = fs::absolute(filepath).parent_path().string();
        config.is_valid = true;
        return config;

    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error in " + filepath + ": " + e.what());
    } catch (const json::exception& e) {
        throw std::runtime_error("JSON error in " + filepath + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config " + filepath + ": " + e.what());
    }
}

std::string get_project_root(const std::string& start_dir) {
    fs::path current = fs::absolute(start_dir.empty() ? "." : start_dir);

    while (true) {
        if (fs::exists(current / CONFIG_FILE)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ProjectConfig> find_and_parse_config(const std::string& start_dir) {
    std::string root = get_project_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return parse_config((fs::path(root) / CONFIG_FILE).string());
}

RuntimeOptions merge_options(const CliOptions& cli, const std::optional<ProjectConfig>& project) {
    RuntimeOptions opts;
    if (project) {
        opts.seed = project->seed;
        if (project->tick_ms) opts.tick_ms = *project->tick_ms;
        if (project->default_timeout_ms) opts.default_timeout_ms = *project->default_timeout_ms;
        opts.mischief = project->mischief.value_or(false);
        opts.trace = project->trace.value_or(false);
    }

    if (cli.seed) opts.seed = cli.seed;
    if (cli.mischief) opts.mischief = true;
    if (cli.trace) opts.trace = true;
    return opts;
}

std::string resolve_script(const std::string& name) {
    fs::path p(name);
    if (fs::exists(p) && !fs::is_directory(p)) return p.string();
    if (p.has_extension()) return "";

    fs::path candidate = p;
    candidate += ".upl";
    if (fs::exists(candidate)) return candidate.string();
    return "";
}

int run_source(const std::string& source, const std::string& filename, const RuntimeOptions& options,
    std::ostream& out, std::ostream& err) {
    std::string code = source;
    if (code.empty() || code.back() != '\n') code.push_back('\n');

    // tokens point into the manager for error context; it outlives the run
    SourceManager src_mgr(filename, code);
    std::unique_ptr<ProgramNode> ast;
    try {
        Lexer lexer(code, filename, &src_mgr);
        std::vector<Token> tokens = lexer.tokenize();

        Parser parser(tokens);
        ast = parser.parse();
    } catch (const std::runtime_error& e) {
        err << Color::paint(e.what(), Color::bright_red, err_is_terminal(err)) << std::endl;
        return EXIT_SETUP_ERROR;
    }

    ConsolePresenter presenter(out, err);
    Evaluator evaluator(presenter, options);
    return static_cast<int>(evaluator.run(ast.get()));
}

int run_file(const std::string& path, const RuntimeOptions& options, std::ostream& out, std::ostream& err) {
    std::ifstream file(path);
    if (!file.is_open()) {
        err << Color::paint("Error: Could not open file " + path, Color::bright_red, err_is_terminal(err)) << std::endl;
        return EXIT_SETUP_ERROR;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return run_source(buffer.str(), path, options, out, err);
}

int execute(const CliOptions& cli, std::ostream& out, std::ostream& err) {
    bool color = err_is_terminal(err);
    bool no_script = cli.file.empty() || fs::is_directory(cli.file);

    std::optional<ProjectConfig> project;
    std::string script;
    try {
        if (cli.config_path) project = parse_config(*cli.config_path);

        if (no_script) {
            if (!project) project = find_and_parse_config(cli.file.empty() ? "." : cli.file);
            if (!project || project->entry.empty()) {
                err << Color::paint("Error: No script given and no entry in " + std::string(CONFIG_FILE), Color::bright_red, color) << std::endl;
                return EXIT_SETUP_ERROR;
            }
            script = resolve_script((fs::path(project->root) / project->entry).string());
        } else {
            script = resolve_script(cli.file);
            if (!script.empty() && !project) {
                std::string dir = fs::path(script).parent_path().string();
                project = find_and_parse_config(dir.empty() ? "." : dir);
            }
        }
    } catch (const std::runtime_error& e) {
        err << Color::paint(e.what(), Color::bright_red, color) << std::endl;
        return EXIT_SETUP_ERROR;
    }

    if (script.empty()) {
        std::string wanted = no_script ? project->entry : cli.file;
        err << Color::paint("Error: Could not find file '" + wanted + "' (also tried '" + wanted + ".upl')", Color::bright_red, color) << std::endl;
        return EXIT_SETUP_ERROR;
    }

    return run_file(script, merge_options(cli, project), out, err);
}

}  // namespace cli
}  // namespace useless
