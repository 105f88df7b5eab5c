#pragma once
#include <unistd.h>  // for isatty(), STDOUT_FILENO

#include <cstdlib>
#include <string>  // for std::string

namespace Color {

// Turned off by --no-color.
inline bool& enabled() {
    static bool on = true;
    return on;
}

inline bool supports_color(int fd = STDOUT_FILENO) {
    if (!enabled()) return false;
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color && no_color[0] != '\0') return false;
    return isatty(fd);
}

const std::string reset = "\033[0m";

const std::string cyan = "\033[36m";

const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";
}  // namespace Color
