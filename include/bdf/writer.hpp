#pragma once

#include "bdf/compression.hpp"
#include "bdf/constants.hpp"
#include "bdf/data.hpp"
#include "bdf/file_stream.hpp"
#include "bdf/lookup.hpp"
#include "bdf/meta.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bdf {

struct WriterOptions {
    std::uint32_t entries_per_chunk = constants::DefaultEntriesPerChunk();
    compression::Method compression = compression::Method::None;
    std::uint32_t compression_level = constants::DefaultCompressionLevel();
    // When set, META is built from this row count and chunks are streamed to
    // the sink as soon as they fill instead of being queued until FlushWriter.
    std::optional<std::uint64_t> expected_entries;
};

class Writer {
public:
    explicit Writer(filestream::ByteSink& sink, WriterOptions options = {});

    void AddLookupEntry(lookup::HashDescriptor descriptor);
    std::uint32_t AddLookupEntry(std::string name, std::uint32_t output_length);

    void AddDataEntry(data::DataEntry entry);

    // Frames buffered rows into a DTBL chunk; a short chunk is fine.
    void Flush();
    // Writes header, META, HTBL and every DTBL chunk, then flushes the sink.
    void FlushWriter();

    const lookup::LookupTable& lookup_table() const noexcept { return table_; }
    const WriterOptions& options() const noexcept { return options_; }
    std::uint32_t chunk_count() const noexcept { return chunk_count_; }
    std::uint64_t row_count() const noexcept { return row_count_; }
    std::size_t pending_rows() const noexcept { return pending_rows_; }
    bool finished() const noexcept { return finished_; }

private:
    bool streaming() const noexcept { return options_.expected_entries.has_value(); }
    void RequireOpen(const char* operation) const;
    void CheckEntry(const data::DataEntry& entry) const;
    void FrameChunk();
    meta::MetaRecord BuildMeta() const;
    void WriteHead();

    filestream::ByteSink& sink_;
    WriterOptions options_;
    lookup::LookupTable table_;
    std::vector<data::DataEntry> pending_;
    std::size_t pending_rows_ = 0;
    std::vector<format::Bytes> queue_;
    std::uint32_t chunk_count_ = 0;
    std::uint64_t row_count_ = 0;
    bool head_written_ = false;
    bool finished_ = false;
};

}  // namespace bdf
