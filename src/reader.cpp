#include "bdf/reader.hpp"

#include "bdf/errors.hpp"
#include "bdf/header.hpp"
#include "bdf/log.hpp"

#include <exception>
#include <string>

namespace bdf {

std::string_view ReaderStateName(ReaderState state) {
    switch (state) {
        case ReaderState::Start:
            return "Start";
        case ReaderState::MetaRead:
            return "MetaRead";
        case ReaderState::LookupRead:
            return "LookupRead";
        case ReaderState::ChunkPending:
            return "ChunkPending";
        case ReaderState::Done:
            return "Done";
        case ReaderState::Failed:
            return "Failed";
    }
    return "Unknown";
}

std::vector<data::DataRow> DataChunk::Rows(const lookup::LookupTable& table) const {
    return data::DecodeRows(raw_.data, table);
}

std::vector<data::DataEntry> DataChunk::DataEntries(const lookup::LookupTable& table) const {
    return data::DecodeEntries(raw_.data, table);
}

Reader::Reader(filestream::ByteSource& source) : source_(source) {}

void Reader::Require(bool allowed, std::string_view operation) const {
    if (!allowed) {
        throw FormatError(ErrorCode::InvalidState,
                          std::string(operation) + " is not allowed in reader state "
                              + std::string(ReaderStateName(state_)));
    }
}

chunk::Chunk Reader::ReadExpected(chunk::ChunkType type) {
    std::optional<chunk::Chunk> next = chunk::ReadChunk(source_);
    if (!next.has_value()) {
        throw FormatError(ErrorCode::UnexpectedEof,
                          "Stream ended before the " + std::string(chunk::ChunkName(type)) + " chunk");
    }
    if (next->type != type) {
        throw FormatError(ErrorCode::UnexpectedChunk,
                          "Expected " + std::string(chunk::ChunkName(type)) + " chunk, found "
                              + std::string(chunk::ChunkName(next->type)));
    }
    return std::move(*next);
}

const meta::MetaRecord& Reader::ReadMetadata() {
    Require(state_ == ReaderState::Start, "ReadMetadata");
    try {
        header::ReadHeader(source_);
        metadata_ = meta::DecodeMeta(ReadExpected(chunk::ChunkType::Meta).data);
    } catch (const std::exception&) {
        state_ = ReaderState::Failed;
        throw;
    }
    compression_ = compression::MethodFromName(metadata_->compression_method);
    if (!compression_.has_value()) {
        log::Warn("Unknown compression method '" + *metadata_->compression_method
                  + "'; data chunks will not be readable");
    }
    log::Debug("META: " + std::to_string(metadata_->chunk_count) + " chunks, "
               + std::to_string(metadata_->total_entries) + " entries");
    state_ = ReaderState::MetaRead;
    return *metadata_;
}

const lookup::LookupTable& Reader::ReadLookupTable() {
    Require(state_ == ReaderState::MetaRead, "ReadLookupTable");
    try {
        lookup_table_ = lookup::DecodeLookupTable(ReadExpected(chunk::ChunkType::Lookup).data);
    } catch (const std::exception&) {
        state_ = ReaderState::Failed;
        throw;
    }
    log::Debug("HTBL: " + std::to_string(lookup_table_->size()) + " hash functions");
    state_ = ReaderState::LookupRead;
    return *lookup_table_;
}

void Reader::ReadStart() {
    ReadMetadata();
    ReadLookupTable();
}

std::optional<DataChunk> Reader::NextChunk() {
    Require(state_ == ReaderState::LookupRead || state_ == ReaderState::ChunkPending, "NextChunk");
    if (!compression_.has_value()) {
        state_ = ReaderState::Failed;
        throw FormatError(ErrorCode::UnsupportedCompression,
                          "Cannot decode data chunks compressed with '" + *metadata_->compression_method + "'");
    }
    std::optional<chunk::Chunk> next;
    try {
        next = chunk::ReadChunk(source_, *compression_);
        if (next.has_value() && next->type != chunk::ChunkType::Data) {
            throw FormatError(ErrorCode::UnexpectedChunk,
                              "Expected DTBL chunk, found " + std::string(chunk::ChunkName(next->type)));
        }
    } catch (const std::exception&) {
        state_ = ReaderState::Failed;
        throw;
    }
    if (!next.has_value()) {
        if (metadata_->chunk_count != chunks_read_) {
            log::Warn("META announced " + std::to_string(metadata_->chunk_count) + " data chunks, stream held "
                      + std::to_string(chunks_read_));
        }
        state_ = ReaderState::Done;
        return std::nullopt;
    }
    ++chunks_read_;
    log::Debug("DTBL #" + std::to_string(chunks_read_) + ": " + std::to_string(next->data.size()) + " bytes");
    state_ = ReaderState::ChunkPending;
    return DataChunk(std::move(*next));
}

}  // namespace bdf
