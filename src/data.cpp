#include "bdf/data.hpp"

#include "bdf/constants.hpp"
#include "bdf/errors.hpp"

#include <string>

namespace bdf::data {

namespace {

constexpr std::size_t kFieldSize = 4;

void AppendRowFields(Bytes& out,
                     std::string_view password,
                     const lookup::HashDescriptor& descriptor,
                     const Bytes& value) {
    if (value.size() != descriptor.output_length) {
        throw FormatError(ErrorCode::HashLengthMismatch,
                          "Hash value for '" + descriptor.name + "' is " + std::to_string(value.size())
                              + " bytes, expected " + std::to_string(descriptor.output_length));
    }
    std::uint32_t password_length = format::CheckedLength(password.size(), "Password");
    std::uint32_t total_length = format::CheckedLength(
        kFieldSize + static_cast<std::size_t>(password_length) + kFieldSize + value.size(), "Data row");
    format::AppendU32BE(out, total_length);
    format::AppendU32BE(out, password_length);
    format::AppendBytes(out, password);
    format::AppendU32BE(out, descriptor.id);
    out.insert(out.end(), value.begin(), value.end());
}

void RequireBytes(const Bytes& payload, std::size_t offset, std::size_t count, const char* field) {
    if (payload.size() - offset < count) {
        throw FormatError(ErrorCode::TruncatedEntry,
                          std::string("Data row ") + field + " at offset " + std::to_string(offset)
                              + " runs past the chunk");
    }
}

}  // namespace

void DataEntry::AddHashValue(std::string name, Bytes value) {
    for (auto& hash : hashes) {
        if (hash.first == name) {
            hash.second = std::move(value);
            return;
        }
    }
    hashes.emplace_back(std::move(name), std::move(value));
}

const Bytes* DataEntry::HashValue(std::string_view name) const {
    for (const auto& hash : hashes) {
        if (hash.first == name) {
            return &hash.second;
        }
    }
    return nullptr;
}

void AppendRow(Bytes& out, const DataRow& row, const lookup::LookupTable& table) {
    const lookup::HashDescriptor* descriptor = table.Find(row.hash_type_id);
    if (!descriptor) {
        throw FormatError(ErrorCode::UnresolvedHashType,
                          "Hash id " + std::to_string(row.hash_type_id) + " is not in the lookup table");
    }
    AppendRowFields(out, row.password, *descriptor, row.hash_value);
}

Bytes EncodeRow(const DataRow& row, const lookup::LookupTable& table) {
    Bytes out;
    AppendRow(out, row, table);
    return out;
}

DataRow DecodeRow(const Bytes& payload, std::size_t& offset, const lookup::LookupTable& table) {
    std::size_t pos = offset;
    RequireBytes(payload, pos, kFieldSize, "length");
    std::uint32_t total_length = format::ReadU32BE(payload.data() + pos);
    pos += kFieldSize;
    const std::size_t row_start = pos;
    RequireBytes(payload, pos, total_length, "body");

    RequireBytes(payload, pos, kFieldSize, "password length");
    std::uint32_t password_length = format::ReadU32BE(payload.data() + pos);
    pos += kFieldSize;
    RequireBytes(payload, pos, password_length, "password");
    const std::uint8_t* password_ptr = payload.data() + pos;
    if (!format::IsValidUtf8(password_ptr, password_length)) {
        throw FormatError(ErrorCode::InvalidUtf8,
                          "Data row at offset " + std::to_string(offset) + " has a non UTF-8 password");
    }
    DataRow row;
    row.password.assign(password_ptr, password_ptr + password_length);
    pos += password_length;

    RequireBytes(payload, pos, kFieldSize, "hash id");
    row.hash_type_id = format::ReadU32BE(payload.data() + pos);
    pos += kFieldSize;
    const lookup::HashDescriptor* descriptor = table.Find(row.hash_type_id);
    if (!descriptor) {
        throw FormatError(ErrorCode::UnresolvedHashType,
                          "Data row at offset " + std::to_string(offset) + " references unknown hash id "
                              + std::to_string(row.hash_type_id));
    }
    RequireBytes(payload, pos, descriptor->output_length, "hash value");
    auto value_begin = payload.begin() + static_cast<std::ptrdiff_t>(pos);
    row.hash_value.assign(value_begin, value_begin + static_cast<std::ptrdiff_t>(descriptor->output_length));
    pos += descriptor->output_length;

    if (pos - row_start != total_length) {
        throw FormatError(ErrorCode::RowLengthMismatch,
                          "Data row at offset " + std::to_string(offset) + " declares "
                              + std::to_string(total_length) + " bytes but holds "
                              + std::to_string(pos - row_start));
    }
    offset = pos;
    return row;
}

std::vector<DataRow> DecodeRows(const Bytes& payload, const lookup::LookupTable& table) {
    std::vector<DataRow> rows;
    std::size_t offset = 0;
    while (offset < payload.size()) {
        if (payload.size() - offset < constants::kFormat.row_length_size) {
            throw FormatError(ErrorCode::TrailingBytes,
                              std::to_string(payload.size() - offset) + " stray bytes after the last data row");
        }
        rows.push_back(DecodeRow(payload, offset, table));
    }
    return rows;
}

std::vector<DataEntry> GroupRows(const std::vector<DataRow>& rows, const lookup::LookupTable& table) {
    std::vector<DataEntry> entries;
    for (const auto& row : rows) {
        const lookup::HashDescriptor* descriptor = table.Find(row.hash_type_id);
        if (!descriptor) {
            throw FormatError(ErrorCode::UnresolvedHashType,
                              "Hash id " + std::to_string(row.hash_type_id) + " is not in the lookup table");
        }
        if (entries.empty() || entries.back().password != row.password
            || entries.back().HashValue(descriptor->name) != nullptr) {
            entries.emplace_back(row.password);
        }
        entries.back().hashes.emplace_back(descriptor->name, row.hash_value);
    }
    return entries;
}

void AppendEntry(Bytes& out, const DataEntry& entry, const lookup::LookupTable& table) {
    for (const auto& hash : entry.hashes) {
        const lookup::HashDescriptor* descriptor = table.FindByName(hash.first);
        if (!descriptor) {
            throw FormatError(ErrorCode::UnresolvedHashType,
                              "Hash function '" + hash.first + "' is not in the lookup table");
        }
        AppendRowFields(out, entry.password, *descriptor, hash.second);
    }
}

Bytes EncodeEntries(const std::vector<DataEntry>& entries, const lookup::LookupTable& table) {
    Bytes out;
    for (const auto& entry : entries) {
        AppendEntry(out, entry, table);
    }
    return out;
}

std::vector<DataEntry> DecodeEntries(const Bytes& payload, const lookup::LookupTable& table) {
    return GroupRows(DecodeRows(payload, table), table);
}

}  // namespace bdf::data
