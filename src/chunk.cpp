#include "bdf/chunk.hpp"

#include "bdf/constants.hpp"
#include "bdf/errors.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <string>

namespace bdf::chunk {

namespace {

void ReadExact(filestream::ByteSource& source, std::uint8_t* buffer, std::size_t size, const char* what) {
    std::size_t got = source.Read(buffer, size);
    if (got != size) {
        throw FormatError(ErrorCode::UnexpectedEof,
                          std::string("Stream ended inside chunk ") + what
                              + " (" + std::to_string(got) + " of " + std::to_string(size) + " bytes)");
    }
}

// Grows the buffer block by block so a bogus length on a short stream fails
// before allocating the declared size.
Bytes ReadPayload(filestream::ByteSource& source, std::uint32_t length) {
    Bytes data;
    std::size_t remaining = length;
    while (remaining > 0) {
        std::size_t step = std::min(remaining, constants::kReadBlockSize);
        std::size_t offset = data.size();
        data.resize(offset + step);
        ReadExact(source, data.data() + offset, step, "data");
        remaining -= step;
    }
    return data;
}

std::string HexCrc(std::uint32_t crc) {
    std::ostringstream out;
    out << "0x" << std::hex << crc;
    return out.str();
}

}  // namespace

std::string_view ChunkName(ChunkType type) {
    switch (type) {
        case ChunkType::Meta:
            return constants::kMetaChunkName;
        case ChunkType::Lookup:
            return constants::kLookupChunkName;
        case ChunkType::Data:
            return constants::kDataChunkName;
    }
    return {};
}

std::optional<ChunkType> ChunkTypeFromName(std::string_view name) {
    if (name == constants::kMetaChunkName) {
        return ChunkType::Meta;
    }
    if (name == constants::kLookupChunkName) {
        return ChunkType::Lookup;
    }
    if (name == constants::kDataChunkName) {
        return ChunkType::Data;
    }
    return std::nullopt;
}

Bytes EncodeChunk(ChunkType type, const Bytes& data, compression::Method method, std::uint32_t level) {
    std::uint32_t crc = format::Crc32(data);
    const Bytes* stored = &data;
    Bytes compressed;
    if (type == ChunkType::Data && method != compression::Method::None) {
        compressed = compression::Compress(method, data, level);
        stored = &compressed;
    }
    std::uint32_t length = format::CheckedLength(stored->size(), "Chunk payload");

    Bytes out;
    out.reserve(constants::kFormat.chunk_length_size + constants::kFormat.chunk_name_size
                + stored->size() + constants::kFormat.chunk_crc_size);
    format::AppendU32BE(out, length);
    format::AppendBytes(out, ChunkName(type));
    out.insert(out.end(), stored->begin(), stored->end());
    format::AppendU32BE(out, crc);
    return out;
}

void WriteChunk(filestream::ByteSink& sink,
                ChunkType type,
                const Bytes& data,
                compression::Method method,
                std::uint32_t level) {
    sink.Write(EncodeChunk(type, data, method, level));
}

std::optional<Chunk> ReadChunk(filestream::ByteSource& source, compression::Method method) {
    std::array<std::uint8_t, 4> field{};
    std::size_t got = source.Read(field.data(), field.size());
    if (got == 0) {
        return std::nullopt;
    }
    if (got != field.size()) {
        throw FormatError(ErrorCode::UnexpectedEof, "Stream ended inside chunk length");
    }
    Chunk chunk;
    chunk.length = format::ReadU32BE(field.data());

    ReadExact(source, field.data(), field.size(), "name");
    std::string name(field.begin(), field.end());
    std::optional<ChunkType> type = ChunkTypeFromName(name);
    if (!type.has_value()) {
        throw FormatError(ErrorCode::UnexpectedChunk, "Unknown chunk name '" + name + "'");
    }
    chunk.type = *type;

    chunk.data = ReadPayload(source, chunk.length);
    ReadExact(source, field.data(), field.size(), "crc");
    chunk.crc = format::ReadU32BE(field.data());

    if (chunk.type == ChunkType::Data && method != compression::Method::None) {
        try {
            chunk.data = compression::Decompress(method, chunk.data);
        } catch (const FormatError& err) {
            if (err.code() != ErrorCode::CompressionFailed) {
                throw;
            }
            throw FormatError(ErrorCode::CorruptChunk, name + " chunk payload does not decompress: " + err.what());
        }
    }
    std::uint32_t actual = format::Crc32(chunk.data);
    if (actual != chunk.crc) {
        throw FormatError(ErrorCode::CorruptChunk,
                          name + " chunk checksum mismatch (stored " + HexCrc(chunk.crc)
                              + ", computed " + HexCrc(actual) + ")");
    }
    return chunk;
}

}  // namespace bdf::chunk
