#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "bdf/env.hpp"

namespace bdf::constants {

struct FormatConstants {
    std::array<std::uint8_t, 3> magic{{'B', 'D', 'F'}};
    std::uint8_t version = 1;
    std::array<std::uint8_t, 7> tag{{'R', 'A', 'I', 'N', 'B', 'O', 'W'}};
    std::size_t header_size = 11;
    std::size_t chunk_length_size = 4;
    std::size_t chunk_name_size = 4;
    std::size_t chunk_crc_size = 4;
    std::size_t meta_size = 20;
    std::size_t compression_name_size = 4;
    std::size_t descriptor_fixed_size = 12;
    std::size_t row_length_size = 4;
};

inline constexpr FormatConstants kFormat{};

inline constexpr std::string_view kMetaChunkName = "META";
inline constexpr std::string_view kLookupChunkName = "HTBL";
inline constexpr std::string_view kDataChunkName = "DTBL";

inline constexpr std::string_view kLzmaMethod = "lzma";

inline constexpr std::uint32_t kDefaultEntriesPerChunk = 100000;
inline constexpr std::uint32_t kDefaultCompressionLevel = 1;
inline constexpr std::uint32_t kMaxCompressionLevel = 9;

inline constexpr std::size_t kReadBlockSize = 1u << 16;

inline std::uint32_t DefaultEntriesPerChunk() {
    std::uint32_t value = bdf::env::GetU32("BDF_ENTRIES_PER_CHUNK", kDefaultEntriesPerChunk);
    return value == 0 ? kDefaultEntriesPerChunk : value;
}

inline std::uint32_t DefaultCompressionLevel() {
    std::uint32_t value = bdf::env::GetU32("BDF_COMPRESSION_LEVEL", kDefaultCompressionLevel);
    return value > kMaxCompressionLevel ? kMaxCompressionLevel : value;
}

}  // namespace bdf::constants
