#pragma once
#include <unistd.h>  // for isatty(), STDOUT_FILENO

#include <string>  // for std::string

namespace Color {
inline bool supports_color() {
    return isatty(STDOUT_FILENO);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";
const std::string cyan = "\033[36m";

const std::string bright_red = "\033[91m";
}  // namespace Color
