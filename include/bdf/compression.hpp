#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bdf::compression {

using Bytes = std::vector<std::uint8_t>;

enum class Method {
    None,
    Lzma
};

// Maps the META compression name onto a known method; unknown names give no value.
std::optional<Method> MethodFromName(const std::optional<std::string>& name);
std::optional<std::string> MethodName(Method method);

bool IsAvailable(Method method);

// xz container, as written by the reference `lzma` method.
Bytes Compress(Method method, const Bytes& data, std::uint32_t level);
Bytes Decompress(Method method, const Bytes& data);

}  // namespace bdf::compression
