#include "bdf/lookup.hpp"

#include "bdf/constants.hpp"
#include "bdf/errors.hpp"

#include <limits>
#include <utility>

namespace bdf::lookup {

void LookupTable::Add(HashDescriptor descriptor) {
    if (by_id_.count(descriptor.id) != 0) {
        throw FormatError(ErrorCode::DuplicateHashId,
                          "Hash id " + std::to_string(descriptor.id) + " is already registered as '"
                              + descriptors_[by_id_.at(descriptor.id)].name + "'");
    }
    by_id_.emplace(descriptor.id, descriptors_.size());
    descriptors_.push_back(std::move(descriptor));
}

const HashDescriptor* LookupTable::Find(std::uint32_t id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return nullptr;
    }
    return &descriptors_[it->second];
}

const HashDescriptor* LookupTable::FindByName(std::string_view name) const {
    for (const auto& descriptor : descriptors_) {
        if (descriptor.name == name) {
            return &descriptor;
        }
    }
    return nullptr;
}

std::uint32_t LookupTable::NextId() const {
    std::uint32_t next = 0;
    for (const auto& descriptor : descriptors_) {
        if (descriptor.id >= next) {
            if (descriptor.id == std::numeric_limits<std::uint32_t>::max()) {
                throw FormatError(ErrorCode::FieldTooLarge, "Hash id space exhausted");
            }
            next = descriptor.id + 1;
        }
    }
    return next;
}

format::Bytes EncodeDescriptor(const HashDescriptor& descriptor) {
    format::Bytes out;
    out.reserve(constants::kFormat.descriptor_fixed_size + descriptor.name.size());
    format::AppendU32BE(out, descriptor.id);
    format::AppendU32BE(out, descriptor.output_length);
    format::AppendU32BE(out, format::CheckedLength(descriptor.name.size(), "Hash function name"));
    format::AppendBytes(out, descriptor.name);
    return out;
}

format::Bytes EncodeLookupTable(const LookupTable& table) {
    format::Bytes out;
    for (const auto& descriptor : table) {
        format::Bytes encoded = EncodeDescriptor(descriptor);
        out.insert(out.end(), encoded.begin(), encoded.end());
    }
    return out;
}

LookupTable DecodeLookupTable(const format::Bytes& payload) {
    const std::size_t fixed = constants::kFormat.descriptor_fixed_size;
    LookupTable table;
    std::size_t offset = 0;
    while (offset < payload.size()) {
        if (payload.size() - offset < fixed) {
            throw FormatError(ErrorCode::TruncatedEntry,
                              "HTBL ends with a partial descriptor at offset " + std::to_string(offset));
        }
        HashDescriptor descriptor;
        descriptor.id = format::ReadU32BE(payload.data() + offset);
        descriptor.output_length = format::ReadU32BE(payload.data() + offset + 4);
        std::uint32_t name_length = format::ReadU32BE(payload.data() + offset + 8);
        offset += fixed;
        if (payload.size() - offset < name_length) {
            throw FormatError(ErrorCode::TruncatedEntry,
                              "HTBL descriptor " + std::to_string(descriptor.id) + " name runs past the chunk");
        }
        const std::uint8_t* name_ptr = payload.data() + offset;
        if (!format::IsValidUtf8(name_ptr, name_length)) {
            throw FormatError(ErrorCode::InvalidUtf8,
                              "HTBL descriptor " + std::to_string(descriptor.id) + " has a non UTF-8 name");
        }
        descriptor.name.assign(name_ptr, name_ptr + name_length);
        offset += name_length;
        table.Add(std::move(descriptor));
    }
    return table;
}

}  // namespace bdf::lookup
