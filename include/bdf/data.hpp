#pragma once

#include "bdf/format.hpp"
#include "bdf/lookup.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bdf::data {

using Bytes = format::Bytes;

// One on-disk record: a password and a single hash value.
struct DataRow {
    std::string password;
    std::uint32_t hash_type_id = 0;
    Bytes hash_value;

    bool operator==(const DataRow& other) const {
        return password == other.password && hash_type_id == other.hash_type_id
               && hash_value == other.hash_value;
    }
    bool operator!=(const DataRow& other) const { return !(*this == other); }
};

// A password with its hash values keyed by hash-function name, in insertion order.
struct DataEntry {
    std::string password;
    std::vector<std::pair<std::string, Bytes>> hashes;

    DataEntry() = default;
    explicit DataEntry(std::string plain) : password(std::move(plain)) {}

    // Replaces the value in place when the name is already present.
    void AddHashValue(std::string name, Bytes value);
    const Bytes* HashValue(std::string_view name) const;

    bool operator==(const DataEntry& other) const {
        return password == other.password && hashes == other.hashes;
    }
    bool operator!=(const DataEntry& other) const { return !(*this == other); }
};

inline std::size_t RowCount(const DataEntry& entry) {
    return entry.hashes.size();
}

// total_length | password_length | password | hash_type_id | hash_value
void AppendRow(Bytes& out, const DataRow& row, const lookup::LookupTable& table);
Bytes EncodeRow(const DataRow& row, const lookup::LookupTable& table);

// Decodes the row starting at `offset` and advances it past the row.
DataRow DecodeRow(const Bytes& payload, std::size_t& offset, const lookup::LookupTable& table);
std::vector<DataRow> DecodeRows(const Bytes& payload, const lookup::LookupTable& table);

// Contiguous rows with the same password form one entry; a hash name seen
// twice in a run starts a new entry.
std::vector<DataEntry> GroupRows(const std::vector<DataRow>& rows, const lookup::LookupTable& table);

void AppendEntry(Bytes& out, const DataEntry& entry, const lookup::LookupTable& table);
Bytes EncodeEntries(const std::vector<DataEntry>& entries, const lookup::LookupTable& table);
std::vector<DataEntry> DecodeEntries(const Bytes& payload, const lookup::LookupTable& table);

}  // namespace bdf::data
