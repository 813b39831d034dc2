#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "config.hpp"

namespace useless {
namespace cli {

// Exit code for usage errors, unreadable files, bad configuration and syntax errors.
constexpr int EXIT_SETUP_ERROR = 3;
// Exit code for defects in the runtime itself (never raised by a script).
constexpr int EXIT_INTERNAL_ERROR = 4;

// Parsed useless.json. Absent keys stay empty so the command line can fill them.
struct ProjectConfig {
    std::string name;
    std::string entry;
    std::optional<uint64_t> seed;
    std::optional<uint64_t> tick_ms;
    std::optional<uint64_t> default_timeout_ms;
    std::optional<bool> mischief;
    std::optional<bool> trace;

    std::string root;  // directory holding the file

    bool is_valid = false;
};

// What the command line asked for.
struct CliOptions {
    std::optional<uint64_t> seed;
    std::optional<std::string> config_path;
    bool mischief = false;
    bool trace = false;
    std::string file;
};

// Throws std::runtime_error on unreadable files, malformed JSON or wrongly typed keys.
ProjectConfig parse_config(const std::string& filepath);

// Nearest directory at or above start_dir holding useless.json, or "".
std::string get_project_root(const std::string& start_dir = ".");
std::optional<ProjectConfig> find_and_parse_config(const std::string& start_dir = ".");

// Command-line values win over project values.
RuntimeOptions merge_options(const CliOptions& cli, const std::optional<ProjectConfig>& project);

// Resolves `name`, falling back to `name.upl` when it has no extension. Empty when nothing exists.
std::string resolve_script(const std::string& name);

// Lexes, parses and runs one script. Returns the process exit code.
int run_source(const std::string& source, const std::string& filename, const RuntimeOptions& options,
    std::ostream& out = std::cout, std::ostream& err = std::cerr);
int run_file(const std::string& path, const RuntimeOptions& options,
    std::ostream& out = std::cout, std::ostream& err = std::cerr);

// Full command: config lookup, script resolution and execution.
int execute(const CliOptions& cli, std::ostream& out = std::cout, std::ostream& err = std::cerr);

}  // namespace cli
}  // namespace useless

#endif  // CLI_COMMANDS_HPP
