#include "bdf/writer.hpp"

#include "bdf/chunk.hpp"
#include "bdf/errors.hpp"
#include "bdf/header.hpp"
#include "bdf/log.hpp"

#include <string>
#include <utility>

namespace bdf {

Writer::Writer(filestream::ByteSink& sink, WriterOptions options)
    : sink_(sink), options_(std::move(options)) {
    if (options_.entries_per_chunk == 0) {
        throw FormatError(ErrorCode::InvalidArgument, "entries_per_chunk must be at least 1");
    }
    if (!compression::IsAvailable(options_.compression)) {
        throw FormatError(ErrorCode::UnsupportedCompression, "XZ support unavailable (liblzma missing)");
    }
}

void Writer::RequireOpen(const char* operation) const {
    if (finished_) {
        throw FormatError(ErrorCode::InvalidState,
                          std::string(operation) + " called after FlushWriter");
    }
}

void Writer::AddLookupEntry(lookup::HashDescriptor descriptor) {
    RequireOpen("AddLookupEntry");
    if (head_written_) {
        throw FormatError(ErrorCode::InvalidState, "The lookup table has already been written");
    }
    table_.Add(std::move(descriptor));
}

std::uint32_t Writer::AddLookupEntry(std::string name, std::uint32_t output_length) {
    lookup::HashDescriptor descriptor;
    descriptor.id = table_.NextId();
    descriptor.output_length = output_length;
    descriptor.name = std::move(name);
    std::uint32_t id = descriptor.id;
    AddLookupEntry(std::move(descriptor));
    return id;
}

void Writer::CheckEntry(const data::DataEntry& entry) const {
    for (const auto& hash : entry.hashes) {
        const lookup::HashDescriptor* descriptor = table_.FindByName(hash.first);
        if (!descriptor) {
            throw FormatError(ErrorCode::UnresolvedHashType,
                              "Hash function '" + hash.first + "' is not in the lookup table");
        }
        if (hash.second.size() != descriptor->output_length) {
            throw FormatError(ErrorCode::HashLengthMismatch,
                              "Hash value for '" + hash.first + "' is " + std::to_string(hash.second.size())
                                  + " bytes, expected " + std::to_string(descriptor->output_length));
        }
    }
}

void Writer::AddDataEntry(data::DataEntry entry) {
    RequireOpen("AddDataEntry");
    CheckEntry(entry);
    std::size_t rows = data::RowCount(entry);
    if (rows > options_.entries_per_chunk) {
        throw FormatError(ErrorCode::InvalidArgument,
                          "Entry '" + entry.password + "' has " + std::to_string(rows)
                              + " hash values but a chunk holds at most "
                              + std::to_string(options_.entries_per_chunk) + " rows");
    }
    if (rows == 0) {
        log::Debug("Entry '" + entry.password + "' has no hash values and produces no rows");
        return;
    }
    if (pending_rows_ > 0 && pending_rows_ + rows > options_.entries_per_chunk) {
        FrameChunk();
    }
    pending_.push_back(std::move(entry));
    pending_rows_ += rows;
    if (pending_rows_ >= options_.entries_per_chunk) {
        FrameChunk();
    }
}

void Writer::Flush() {
    RequireOpen("Flush");
    if (pending_rows_ > 0) {
        FrameChunk();
    }
}

void Writer::FrameChunk() {
    format::Bytes payload = data::EncodeEntries(pending_, table_);
    if (streaming()) {
        if (!head_written_) {
            WriteHead();
        }
        chunk::WriteChunk(sink_, chunk::ChunkType::Data, payload, options_.compression,
                          options_.compression_level);
    } else {
        queue_.push_back(chunk::EncodeChunk(chunk::ChunkType::Data, payload, options_.compression,
                                            options_.compression_level));
    }
    ++chunk_count_;
    row_count_ += pending_rows_;
    log::Debug("Framed DTBL #" + std::to_string(chunk_count_) + " with " + std::to_string(pending_rows_)
               + " rows (" + std::to_string(payload.size()) + " bytes)");
    pending_.clear();
    pending_rows_ = 0;
}

meta::MetaRecord Writer::BuildMeta() const {
    meta::MetaRecord meta;
    meta.entries_per_chunk = options_.entries_per_chunk;
    meta.compression_method = compression::MethodName(options_.compression);
    if (streaming()) {
        meta.total_entries = *options_.expected_entries;
        meta.chunk_count = meta::ChunkCountFor(meta.total_entries, options_.entries_per_chunk);
    } else {
        meta.total_entries = row_count_;
        meta.chunk_count = chunk_count_;
    }
    return meta;
}

void Writer::WriteHead() {
    header::WriteHeader(sink_);
    chunk::WriteChunk(sink_, chunk::ChunkType::Meta, meta::EncodeMeta(BuildMeta()));
    chunk::WriteChunk(sink_, chunk::ChunkType::Lookup, lookup::EncodeLookupTable(table_));
    head_written_ = true;
}

void Writer::FlushWriter() {
    Flush();
    // A failed write leaves the sink in an unknown position; no retry.
    finished_ = true;
    if (!head_written_) {
        WriteHead();
    }
    for (const auto& encoded : queue_) {
        sink_.Write(encoded);
    }
    queue_.clear();
    sink_.Flush();
    log::Info("Wrote " + std::to_string(row_count_) + " rows in " + std::to_string(chunk_count_)
              + " DTBL chunks");
    if (streaming() && *options_.expected_entries != row_count_) {
        log::Warn("Writer expected " + std::to_string(*options_.expected_entries) + " entries but wrote "
                  + std::to_string(row_count_));
    }
}

}  // namespace bdf
