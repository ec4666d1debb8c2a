#include "bdf/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace bdf::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool AllDigits(const std::string& value) {
    return !value.empty()
           && std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

std::string GetLower(std::string_view name) {
    return ToLower(Get(name));
}

bool IsSet(std::string_view name) {
    return !Get(name).empty();
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = GetLower(name);
    if (value.empty()) {
        return default_value;
    }
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint32_t GetU32(std::string_view name, std::uint32_t fallback) {
    std::string raw = Get(name);
    if (!AllDigits(raw)) {
        return fallback;
    }
    try {
        unsigned long long parsed = std::stoull(raw);
        if (parsed > std::numeric_limits<std::uint32_t>::max()) {
            return std::numeric_limits<std::uint32_t>::max();
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::out_of_range&) {
        return std::numeric_limits<std::uint32_t>::max();
    }
}

}  // namespace bdf::env
