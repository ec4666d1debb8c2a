#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace bdf::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// BDF_COLOR forces colors on or off; otherwise NO_COLOR or a non-TTY stream turns them off
bool ColorsEnabled(std::ostream& os = std::cerr);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cerr);

}  // namespace bdf::cli
