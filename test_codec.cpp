#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "bdf/chunk.hpp"
#include "bdf/compression.hpp"
#include "bdf/data.hpp"
#include "bdf/header.hpp"
#include "bdf/lookup.hpp"
#include "bdf/meta.hpp"
#include "test_support.hpp"

using namespace bdf_test;
using bdf::ErrorCode;

namespace {

bdf::lookup::LookupTable FakeTable() {
    bdf::lookup::LookupTable table;
    table.Add({3, 3, "fakehash"});
    table.Add({5, 1, "tiny"});
    return table;
}

// total_length | password_length | "foo" | id 3 | 00 02 03
Bytes FooRow() {
    return {0, 0, 0, 14, 0, 0, 0, 3, 'f', 'o', 'o', 0, 0, 0, 3, 0, 2, 3};
}

void TestCrc32() {
    Check(bdf::format::Crc32(Text("123456789")) == 0xCBF43926u, "CRC-32 check value");
    Check(bdf::format::Crc32(Bytes{}) == 0u, "CRC-32 of nothing");
}

void TestChunkLayout() {
    Bytes encoded = bdf::chunk::EncodeChunk(bdf::chunk::ChunkType::Meta, {1, 2, 3});
    Check(encoded.size() == 15, "frame size");
    Check(Bytes(encoded.begin(), encoded.begin() + 4) == Bytes{0, 0, 0, 3}, "length prefix");
    Check(Bytes(encoded.begin() + 4, encoded.begin() + 8) == Text("META"), "chunk name");
    Check(Bytes(encoded.begin() + 8, encoded.begin() + 11) == Bytes{1, 2, 3}, "payload");
    std::uint32_t crc = bdf::format::ReadU32BE(encoded.data() + 11);
    Check(crc == bdf::format::Crc32(Bytes{1, 2, 3}), "trailing crc");

    bdf::filestream::MemorySource source(encoded);
    auto chunk = bdf::chunk::ReadChunk(source);
    Check(chunk.has_value(), "chunk decoded");
    Check(chunk->type == bdf::chunk::ChunkType::Meta, "chunk type");
    Check(chunk->data == Bytes({1, 2, 3}), "chunk data");
    Check(!bdf::chunk::ReadChunk(source).has_value(), "clean end of stream gives no chunk");
}

void TestChunkBitFlips() {
    Bytes payload = Text("some payload bytes");
    Bytes encoded = bdf::chunk::EncodeChunk(bdf::chunk::ChunkType::Data, payload);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            Bytes damaged = encoded;
            damaged[8 + i] ^= static_cast<std::uint8_t>(1u << bit);
            bdf::filestream::MemorySource source(damaged);
            ExpectError(ErrorCode::CorruptChunk, [&] { bdf::chunk::ReadChunk(source); },
                        "flip byte " + std::to_string(i) + " bit " + std::to_string(bit));
        }
    }
}

void TestChunkTruncation() {
    Bytes encoded = bdf::chunk::EncodeChunk(bdf::chunk::ChunkType::Lookup, Text("abcdef"));
    for (std::size_t cut = 1; cut < encoded.size(); ++cut) {
        bdf::filestream::MemorySource source(Bytes(encoded.begin(), encoded.begin() + static_cast<long>(cut)));
        ExpectError(ErrorCode::UnexpectedEof, [&] { bdf::chunk::ReadChunk(source); },
                    "chunk cut at " + std::to_string(cut));
    }

    // Declared length far beyond what the stream holds.
    Bytes bogus = {0xFF, 0xFF, 0xFF, 0xF0, 'D', 'T', 'B', 'L', 1, 2};
    bdf::filestream::MemorySource source(bogus);
    ExpectError(ErrorCode::UnexpectedEof, [&] { bdf::chunk::ReadChunk(source); }, "bogus length");

    Bytes unknown = {0, 0, 0, 0, 'X', 'T', 'R', 'A', 0, 0, 0, 0};
    bdf::filestream::MemorySource unknown_source(unknown);
    ExpectError(ErrorCode::UnexpectedChunk, [&] { bdf::chunk::ReadChunk(unknown_source); }, "unknown name");
}

void TestHeader() {
    Bytes encoded = bdf::header::EncodeHeader();
    Check(encoded == Bytes({'B', 'D', 'F', 1, 'R', 'A', 'I', 'N', 'B', 'O', 'W'}), "header bytes");
    Check(bdf::header::DecodeHeader(encoded).version == 1, "header version");

    Bytes bad_magic = encoded;
    bad_magic[0] = 'X';
    ExpectError(ErrorCode::InvalidFormat, [&] { bdf::header::DecodeHeader(bad_magic); }, "bad magic");

    Bytes bad_tag = encoded;
    bad_tag[10] = 'X';
    ExpectError(ErrorCode::InvalidFormat, [&] { bdf::header::DecodeHeader(bad_tag); }, "bad tag");

    Bytes future = encoded;
    future[3] = 2;
    ExpectError(ErrorCode::UnsupportedVersion, [&] { bdf::header::DecodeHeader(future); }, "future version");

    bdf::filestream::MemorySource short_source(Bytes(encoded.begin(), encoded.begin() + 5));
    ExpectError(ErrorCode::UnexpectedEof, [&] { bdf::header::ReadHeader(short_source); }, "short header");
}

void TestMeta() {
    bdf::meta::MetaRecord meta;
    meta.chunk_count = 2;
    meta.entries_per_chunk = 100000;
    meta.total_entries = 123456;
    Bytes encoded = bdf::meta::EncodeMeta(meta);
    Check(encoded.size() == 20, "meta is 20 bytes");
    Check(Bytes(encoded.begin() + 16, encoded.end()) == Bytes({0, 0, 0, 0}), "no compression is zeroed");
    Check(bdf::meta::DecodeMeta(encoded) == meta, "meta round trip");

    meta.compression_method = "lzma";
    Bytes compressed = bdf::meta::EncodeMeta(meta);
    Check(Bytes(compressed.begin() + 16, compressed.end()) == Text("lzma"), "method name bytes");
    Check(bdf::meta::DecodeMeta(compressed).compression_method == std::optional<std::string>("lzma"),
          "method name decoded");

    // Unknown names pass through untouched.
    Bytes opaque = encoded;
    std::copy_n("zstd", 4, opaque.begin() + 16);
    Check(bdf::meta::DecodeMeta(opaque).compression_method == std::optional<std::string>("zstd"),
          "opaque method name");

    ExpectError(ErrorCode::TruncatedMeta, [&] { bdf::meta::DecodeMeta(Bytes(encoded.begin(), encoded.begin() + 19)); },
                "short meta");
    meta.compression_method = "brotli";
    ExpectError(ErrorCode::FieldTooLarge, [&] { bdf::meta::EncodeMeta(meta); }, "long method name");

    Check(bdf::meta::ChunkCountFor(0, 10) == 0, "no entries, no chunks");
    Check(bdf::meta::ChunkCountFor(10, 10) == 1, "exact fill");
    Check(bdf::meta::ChunkCountFor(11, 10) == 2, "partial last chunk");
}

void TestLookupTable() {
    bdf::lookup::LookupTable table = FakeTable();
    Bytes encoded = bdf::lookup::EncodeLookupTable(table);
    Bytes first = {0, 0, 0, 3, 0, 0, 0, 3, 0, 0, 0, 8, 'f', 'a', 'k', 'e', 'h', 'a', 's', 'h'};
    Check(Bytes(encoded.begin(), encoded.begin() + 20) == first, "descriptor layout");

    bdf::lookup::LookupTable decoded = bdf::lookup::DecodeLookupTable(encoded);
    Check(decoded == table, "lookup round trip keeps order");
    Check(decoded.Find(5) && decoded.Find(5)->name == "tiny", "find by id");
    Check(decoded.FindByName("fakehash") && decoded.FindByName("fakehash")->id == 3, "find by name");
    Check(decoded.Find(4) == nullptr, "missing id");
    Check(decoded.NextId() == 6, "next free id");

    ExpectError(ErrorCode::DuplicateHashId, [&] { table.Add({3, 16, "md5"}); }, "duplicate add");
    Check(table.size() == 2 && table.Find(3)->name == "fakehash", "duplicate add leaves table alone");

    Bytes duplicated = Concat(encoded, first);
    ExpectError(ErrorCode::DuplicateHashId, [&] { bdf::lookup::DecodeLookupTable(duplicated); },
                "duplicate id in HTBL");
    ExpectError(ErrorCode::TruncatedEntry,
                [&] { bdf::lookup::DecodeLookupTable(Bytes(encoded.begin(), encoded.end() - 1)); },
                "cut name");
    ExpectError(ErrorCode::TruncatedEntry,
                [&] { bdf::lookup::DecodeLookupTable(Concat(encoded, {0, 0, 0, 9, 0})); },
                "partial fixed fields");
    Check(bdf::lookup::DecodeLookupTable(Bytes{}).empty(), "empty HTBL");
}

void TestRowEncoding() {
    bdf::lookup::LookupTable table = FakeTable();
    bdf::data::DataRow row{"foo", 3, {0, 2, 3}};
    Check(bdf::data::EncodeRow(row, table) == FooRow(), "row layout");

    std::size_t offset = 0;
    Bytes payload = FooRow();
    Check(bdf::data::DecodeRow(payload, offset, table) == row, "row decode");
    Check(offset == payload.size(), "offset advanced past row");

    bdf::data::DataRow unknown{"foo", 9, {1}};
    ExpectError(ErrorCode::UnresolvedHashType, [&] { bdf::data::EncodeRow(unknown, table); }, "encode unknown id");
    bdf::data::DataRow wrong_width{"foo", 3, {1, 2}};
    ExpectError(ErrorCode::HashLengthMismatch, [&] { bdf::data::EncodeRow(wrong_width, table); }, "wrong width");
}

void TestRowDecodeFailures() {
    bdf::lookup::LookupTable table = FakeTable();

    bdf::lookup::LookupTable empty;
    ExpectError(ErrorCode::UnresolvedHashType, [&] { bdf::data::DecodeRows(FooRow(), empty); }, "unknown id");

    Bytes longer = Concat(FooRow(), {9});
    longer[3] = 15;
    ExpectError(ErrorCode::RowLengthMismatch, [&] { bdf::data::DecodeRows(longer, table); }, "declared too long");

    Bytes shorter = FooRow();
    shorter[3] = 13;
    ExpectError(ErrorCode::RowLengthMismatch, [&] { bdf::data::DecodeRows(shorter, table); }, "declared too short");

    Bytes cut = FooRow();
    cut.pop_back();
    ExpectError(ErrorCode::TruncatedEntry, [&] { bdf::data::DecodeRows(cut, table); }, "row past payload");

    Bytes trailing = Concat(FooRow(), {0, 0});
    ExpectError(ErrorCode::TrailingBytes, [&] { bdf::data::DecodeRows(trailing, table); }, "stray bytes");

    Bytes bad_utf8 = FooRow();
    bad_utf8[9] = 0xFF;
    ExpectError(ErrorCode::InvalidUtf8, [&] { bdf::data::DecodeRows(bad_utf8, table); }, "invalid utf-8");

    Check(bdf::data::DecodeRows(Bytes{}, table).empty(), "empty DTBL");
}

void TestGrouping() {
    bdf::lookup::LookupTable table = FakeTable();
    std::vector<bdf::data::DataRow> rows = {
        {"foo", 3, {0, 2, 3}},
        {"foo", 5, {7}},
        {"bar", 3, {1, 1, 1}},
        {"foo", 3, {4, 5, 6}},
        {"foo", 3, {9, 9, 9}},
    };
    auto entries = bdf::data::GroupRows(rows, table);
    Check(entries.size() == 4, "contiguous runs become entries");
    Check(entries[0].password == "foo" && entries[0].hashes.size() == 2, "first run holds two hashes");
    Check(entries[0].hashes[0].first == "fakehash" && entries[0].hashes[1].first == "tiny", "hash order");
    Check(entries[1].password == "bar", "second run");
    Check(entries[2].HashValue("fakehash") && *entries[2].HashValue("fakehash") == Bytes({4, 5, 6}),
          "repeated hash name splits the run");
    Check(*entries[3].HashValue("fakehash") == Bytes({9, 9, 9}), "split entry value");

    Bytes payload = bdf::data::EncodeEntries(entries, table);
    Check(bdf::data::DecodeEntries(payload, table) == entries, "entries round trip");

    bdf::data::DataEntry entry("baz");
    entry.AddHashValue("tiny", {1});
    entry.AddHashValue("tiny", {2});
    Check(entry.hashes.size() == 1 && *entry.HashValue("tiny") == Bytes({2}), "AddHashValue replaces");
    Check(bdf::data::RowCount(entry) == 1, "row count");
    bdf::data::DataEntry missing("qux");
    missing.AddHashValue("sha1", Bytes(20, 0));
    ExpectError(ErrorCode::UnresolvedHashType, [&] { bdf::data::EncodeEntries({missing}, table); },
                "unknown hash name");
}

void TestUtf8() {
    Check(bdf::format::IsValidUtf8(reinterpret_cast<const std::uint8_t*>("p\xC3\xA4ss"), 5), "two-byte sequence");
    Check(bdf::format::IsValidUtf8(reinterpret_cast<const std::uint8_t*>("\xF0\x9F\x94\x91"), 4), "four-byte sequence");
    Check(!bdf::format::IsValidUtf8(reinterpret_cast<const std::uint8_t*>("\xC3"), 1), "cut sequence");
    Check(!bdf::format::IsValidUtf8(reinterpret_cast<const std::uint8_t*>("\xC0\xAF"), 2), "overlong form");
    Check(!bdf::format::IsValidUtf8(reinterpret_cast<const std::uint8_t*>("\xED\xA0\x80"), 3), "surrogate");
}

void TestCompressedChunk() {
    if (!bdf::compression::IsAvailable(bdf::compression::Method::Lzma)) {
        std::cout << "    (lzma unavailable, skipped)" << std::endl;
        return;
    }
    Bytes payload;
    for (int i = 0; i < 64; ++i) {
        payload = Concat(payload, FooRow());
    }
    Bytes encoded = bdf::chunk::EncodeChunk(bdf::chunk::ChunkType::Data, payload, bdf::compression::Method::Lzma, 1);
    Check(bdf::format::ReadU32BE(encoded.data()) == encoded.size() - 12, "length is the stored size");
    Check(bdf::format::ReadU32BE(encoded.data() + encoded.size() - 4) == bdf::format::Crc32(payload),
          "crc covers uncompressed data");

    bdf::filestream::MemorySource source(encoded);
    auto chunk = bdf::chunk::ReadChunk(source, bdf::compression::Method::Lzma);
    Check(chunk.has_value() && chunk->data == payload, "compressed chunk round trip");

    Bytes damaged = encoded;
    damaged[encoded.size() / 2] ^= 0x10;
    bdf::filestream::MemorySource damaged_source(damaged);
    ExpectError(ErrorCode::CorruptChunk,
                [&] { bdf::chunk::ReadChunk(damaged_source, bdf::compression::Method::Lzma); },
                "damaged compressed chunk");

    Check(bdf::compression::MethodFromName(std::string("lzma")) == bdf::compression::Method::Lzma, "lzma name");
    Check(!bdf::compression::MethodFromName(std::string("zstd")).has_value(), "unknown method name");
}

}  // namespace

int main() {
    std::cout << "bdf codec tests:" << std::endl;
    Run("crc32", TestCrc32);
    Run("chunk layout", TestChunkLayout);
    Run("chunk bit flips", TestChunkBitFlips);
    Run("chunk truncation", TestChunkTruncation);
    Run("header", TestHeader);
    Run("meta", TestMeta);
    Run("lookup table", TestLookupTable);
    Run("row encoding", TestRowEncoding);
    Run("row decode failures", TestRowDecodeFailures);
    Run("grouping", TestGrouping);
    Run("utf-8", TestUtf8);
    Run("compressed chunk", TestCompressedChunk);
    std::cout << (g_failures == 0 ? "All tests passed" : "Failures: " + std::to_string(g_failures)) << std::endl;
    return g_failures == 0 ? 0 : 1;
}
