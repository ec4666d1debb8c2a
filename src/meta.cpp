#include "bdf/meta.hpp"

#include "bdf/constants.hpp"
#include "bdf/errors.hpp"

#include <algorithm>
#include <limits>

namespace bdf::meta {

format::Bytes EncodeMeta(const MetaRecord& meta) {
    const std::size_t name_size = constants::kFormat.compression_name_size;
    format::Bytes out;
    out.reserve(constants::kFormat.meta_size);
    format::AppendU32BE(out, meta.chunk_count);
    format::AppendU32BE(out, meta.entries_per_chunk);
    format::AppendU64BE(out, meta.total_entries);
    std::string name = meta.compression_method.value_or(std::string());
    if (name.size() > name_size) {
        throw FormatError(ErrorCode::FieldTooLarge,
                          "Compression method name '" + name + "' is longer than "
                              + std::to_string(name_size) + " bytes");
    }
    format::AppendBytes(out, name);
    out.resize(constants::kFormat.meta_size, 0);
    return out;
}

MetaRecord DecodeMeta(const format::Bytes& payload) {
    if (payload.size() < constants::kFormat.meta_size) {
        throw FormatError(ErrorCode::TruncatedMeta,
                          "META payload is " + std::to_string(payload.size()) + " bytes, expected "
                              + std::to_string(constants::kFormat.meta_size));
    }
    MetaRecord meta;
    meta.chunk_count = format::ReadU32BE(payload.data());
    meta.entries_per_chunk = format::ReadU32BE(payload.data() + 4);
    meta.total_entries = format::ReadU64BE(payload.data() + 8);

    auto name_begin = payload.begin() + 16;
    auto name_end = name_begin + static_cast<std::ptrdiff_t>(constants::kFormat.compression_name_size);
    bool all_zero = std::all_of(name_begin, name_end, [](std::uint8_t b) { return b == 0; });
    if (!all_zero) {
        std::string name(name_begin, name_end);
        name.erase(name.find_last_not_of('\0') + 1);
        meta.compression_method = name;
    }
    return meta;
}

std::uint32_t ChunkCountFor(std::uint64_t total_entries, std::uint32_t entries_per_chunk) {
    if (entries_per_chunk == 0) {
        return 0;
    }
    std::uint64_t count = total_entries / entries_per_chunk + (total_entries % entries_per_chunk != 0 ? 1 : 0);
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(count, std::numeric_limits<std::uint32_t>::max()));
}

}  // namespace bdf::meta
