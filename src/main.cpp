#include <iostream>
#include <stdexcept>
#include <string>

#include "cli_commands.hpp"
#include "colors.hpp"

#ifndef USELESS_VERSION
#define USELESS_VERSION "0.0.0"
#endif

using useless::cli::CliOptions;
using useless::cli::EXIT_SETUP_ERROR;

int main(int argc, char* argv[]) {
  auto print_usage = []() {
    std::cout << "Usage: useless [options] [file]\n"
    << "Options:\n"
    << "  -s, --seed <n>     Seed the chaos (same seed, same run)\n"
    << "  -c, --config <f>   Project file (default: nearest useless.json)\n"
    << "      --mischief     Enable extra chaos\n"
    << "      --trace        Log chaos decisions and scheduler ticks to stderr\n"
    << "  -v, --version      Print version and exit\n"
    << "  -h, --help         Show this help message\n"
    << "\n"
    << "Without a file the project's entry from useless.json is run.\n"
    << "A file without extension falls back to <file>.upl.\n"
    << "If a filename starts with '-', use `--` to end options:\n"
    << "  useless -- -weird.upl\n";
  };

  auto usage_error = [](const std::string &msg) {
    std::cerr << "useless: " << msg << "\n";
    std::cerr << "Try 'useless --help' for more information.\n";
    return EXIT_SETUP_ERROR;
  };

  CliOptions options;
  bool seen_double_dash = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (seen_double_dash) {
      options.file = arg;
      break;
    }

    if (arg == "--") {
      seen_double_dash = true;
      continue;
    }

    if (!arg.empty() && arg[0] == '-') {
      if (arg == "-v" || arg == "--version") {
        std::cout << "useless v" << USELESS_VERSION << std::endl;
        return 0;
      } else if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      } else if (arg == "-s" || arg == "--seed") {
        if (i + 1 >= argc) return usage_error("option '" + arg + "' needs a number");
        std::string value = argv[++i];
        try {
          size_t used = 0;
          if (value.empty() || value[0] == '-') throw std::invalid_argument(value);
          options.seed = std::stoull(value, &used);
          if (used != value.size()) throw std::invalid_argument(value);
        } catch (const std::logic_error &) {
          return usage_error("invalid seed '" + value + "'");
        }
      } else if (arg == "-c" || arg == "--config") {
        if (i + 1 >= argc) return usage_error("option '" + arg + "' needs a path");
        options.config_path = std::string(argv[++i]);
      } else if (arg == "--mischief") {
        options.mischief = true;
      } else if (arg == "--trace") {
        options.trace = true;
      } else {
        return usage_error("unknown option '" + arg + "'");
      }
      continue;
    }

    // First non-option argument is the script
    options.file = arg;
    break;
  }

  try {
    return useless::cli::execute(options);
  } catch (const std::exception &e) {
    bool color = Color::supports_color(STDERR_FILENO);
    std::cerr << Color::paint(std::string("Internal error: ") + e.what(), Color::bright_red, color) << std::endl;
    return useless::cli::EXIT_INTERNAL_ERROR;
  }
}
