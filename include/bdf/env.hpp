#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bdf::env {

std::string Get(std::string_view name);
std::string GetLower(std::string_view name);
bool IsSet(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Unset or unparsable values give the fallback; values above u32 range saturate.
std::uint32_t GetU32(std::string_view name, std::uint32_t fallback);

}  // namespace bdf::env
