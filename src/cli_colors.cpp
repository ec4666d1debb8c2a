#include "bdf/cli_colors.hpp"

#include "bdf/env.hpp"

#include <cstdio>
#include <iostream>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace bdf::cli {

namespace {

bool IsTerminal(std::ostream& os) {
    if (&os == &std::cout) {
        return isatty(fileno(stdout)) != 0;
    }
    if (&os == &std::cerr || &os == &std::clog) {
        return isatty(fileno(stderr)) != 0;
    }
    return false;
}

}  // namespace

bool ColorsEnabled(std::ostream& os) {
    if (env::IsSet("BDF_COLOR")) {
        return env::IsEnabled("BDF_COLOR");
    }
    if (env::IsSet("NO_COLOR")) {
        return false;
    }
    return IsTerminal(os);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace bdf::cli
