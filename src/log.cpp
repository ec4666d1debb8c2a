#include "bdf/log.hpp"

#include "bdf/cli_colors.hpp"
#include "bdf/env.hpp"

#include <iostream>

namespace bdf::log {

namespace {

void Emit(Level level, const char* label, const char* color, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    std::cerr << cli::Colorize(label, color) << ": " << message << "\n";
}

}  // namespace

Level Threshold() {
    std::string value = env::GetLower("BDF_LOG_LEVEL");
    if (value == "debug") {
        return Level::Debug;
    }
    if (value == "info") {
        return Level::Info;
    }
    if (value == "off" || value == "none") {
        return Level::Off;
    }
    return Level::Warn;
}

bool Enabled(Level level) {
    return level != Level::Off && static_cast<int>(level) >= static_cast<int>(Threshold());
}

void Debug(const std::string& message) {
    Emit(Level::Debug, "DEBUG", cli::color::BRIGHT_BLACK, message);
}

void Info(const std::string& message) {
    Emit(Level::Info, "INFO", cli::color::CYAN, message);
}

void Warn(const std::string& message) {
    Emit(Level::Warn, "WARN", cli::color::YELLOW, message);
}

}  // namespace bdf::log
