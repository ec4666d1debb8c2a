#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace bdf::format {

using Bytes = std::vector<std::uint8_t>;

// Callers guarantee at least 4 (resp. 8) readable bytes at `data`.
std::uint32_t ReadU32BE(const std::uint8_t* data);
std::uint64_t ReadU64BE(const std::uint8_t* data);

void AppendU32BE(Bytes& out, std::uint32_t value);
void AppendU64BE(Bytes& out, std::uint64_t value);
void AppendBytes(Bytes& out, std::string_view text);

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size);
std::uint32_t Crc32(const Bytes& data);

bool IsValidUtf8(const std::uint8_t* data, std::size_t size);

// Fails with FieldTooLarge when `size` does not fit a u32 length field.
std::uint32_t CheckedLength(std::size_t size, std::string_view what);

}  // namespace bdf::format
