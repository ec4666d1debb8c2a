#pragma once

#include "bdf/format.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace bdf::meta {

struct MetaRecord {
    std::uint32_t chunk_count = 0;
    std::uint32_t entries_per_chunk = 0;
    std::uint64_t total_entries = 0;
    // No value means the field holds four zero bytes.
    std::optional<std::string> compression_method;

    bool operator==(const MetaRecord& other) const {
        return chunk_count == other.chunk_count
               && entries_per_chunk == other.entries_per_chunk
               && total_entries == other.total_entries
               && compression_method == other.compression_method;
    }
    bool operator!=(const MetaRecord& other) const { return !(*this == other); }
};

format::Bytes EncodeMeta(const MetaRecord& meta);
MetaRecord DecodeMeta(const format::Bytes& payload);

std::uint32_t ChunkCountFor(std::uint64_t total_entries, std::uint32_t entries_per_chunk);

}  // namespace bdf::meta
