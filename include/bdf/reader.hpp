#pragma once

#include "bdf/chunk.hpp"
#include "bdf/compression.hpp"
#include "bdf/data.hpp"
#include "bdf/file_stream.hpp"
#include "bdf/lookup.hpp"
#include "bdf/meta.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bdf {

enum class ReaderState {
    Start,
    MetaRead,
    LookupRead,
    ChunkPending,
    Done,
    Failed
};

std::string_view ReaderStateName(ReaderState state);

// One DTBL chunk pulled from the stream. Rows are decoded on request and the
// decode can be repeated.
class DataChunk {
public:
    explicit DataChunk(chunk::Chunk raw) : raw_(std::move(raw)) {}

    std::vector<data::DataRow> Rows(const lookup::LookupTable& table) const;
    std::vector<data::DataEntry> DataEntries(const lookup::LookupTable& table) const;

private:
    chunk::Chunk raw_;
};

// Forward-only cursor: header and META, then HTBL, then DTBL chunks one by one.
// The source is borrowed and must outlive the reader.
class Reader {
public:
    explicit Reader(filestream::ByteSource& source);

    const meta::MetaRecord& ReadMetadata();
    const lookup::LookupTable& ReadLookupTable();
    void ReadStart();

    // No value once the stream is exhausted; the reader is Done afterwards.
    std::optional<DataChunk> NextChunk();

    ReaderState state() const noexcept { return state_; }
    const std::optional<meta::MetaRecord>& metadata() const noexcept { return metadata_; }
    const std::optional<lookup::LookupTable>& lookup_table() const noexcept { return lookup_table_; }
    std::size_t chunks_read() const noexcept { return chunks_read_; }

private:
    void Require(bool allowed, std::string_view operation) const;
    chunk::Chunk ReadExpected(chunk::ChunkType type);

    filestream::ByteSource& source_;
    ReaderState state_ = ReaderState::Start;
    std::optional<meta::MetaRecord> metadata_;
    std::optional<lookup::LookupTable> lookup_table_;
    std::optional<compression::Method> compression_;
    std::size_t chunks_read_ = 0;
};

}  // namespace bdf
