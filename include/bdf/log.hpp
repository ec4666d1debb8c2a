#pragma once

#include <string>

namespace bdf::log {

enum class Level {
    Debug,
    Info,
    Warn,
    Off
};

// Threshold from BDF_LOG_LEVEL (debug, info, warn, off); warn when unset.
Level Threshold();
bool Enabled(Level level);

void Debug(const std::string& message);
void Info(const std::string& message);
void Warn(const std::string& message);

}  // namespace bdf::log
