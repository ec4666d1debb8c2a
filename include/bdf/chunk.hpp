#pragma once

#include "bdf/compression.hpp"
#include "bdf/file_stream.hpp"
#include "bdf/format.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace bdf::chunk {

using Bytes = format::Bytes;

enum class ChunkType {
    Meta,
    Lookup,
    Data
};

std::string_view ChunkName(ChunkType type);
std::optional<ChunkType> ChunkTypeFromName(std::string_view name);

// `data` is always the uncompressed payload; `length` is the size stored on disk.
struct Chunk {
    ChunkType type = ChunkType::Data;
    std::uint32_t length = 0;
    Bytes data;
    std::uint32_t crc = 0;
};

// length(4) | name(4) | data | crc(4). The CRC covers the uncompressed data;
// only DTBL payloads are compressed.
Bytes EncodeChunk(ChunkType type,
                  const Bytes& data,
                  compression::Method method = compression::Method::None,
                  std::uint32_t level = 0);

void WriteChunk(filestream::ByteSink& sink,
                ChunkType type,
                const Bytes& data,
                compression::Method method = compression::Method::None,
                std::uint32_t level = 0);

// Returns no chunk when the source ends cleanly before the first length byte.
std::optional<Chunk> ReadChunk(filestream::ByteSource& source,
                               compression::Method method = compression::Method::None);

}  // namespace bdf::chunk
