#pragma once
#include <unistd.h>  // for isatty(), STDOUT_FILENO, STDERR_FILENO

#include <string>  // for std::string

namespace Color {
inline bool supports_color(int fd = STDOUT_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";
const std::string green = "\033[32m";
const std::string yellow = "\033[33m";
const std::string magenta = "\033[35m";
const std::string cyan = "\033[36m";

const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";
const std::string bright_yellow = "\033[93m";

// Wrap text in a colour only when `enabled`.
inline std::string paint(const std::string& text, const std::string& color, bool enabled) {
    return enabled ? color + text + reset : text;
}
}  // namespace Color
