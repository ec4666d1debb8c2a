#pragma once

#include "bdf/format.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bdf::lookup {

struct HashDescriptor {
    std::uint32_t id = 0;
    std::uint32_t output_length = 0;
    std::string name;

    bool operator==(const HashDescriptor& other) const {
        return id == other.id && output_length == other.output_length && name == other.name;
    }
    bool operator!=(const HashDescriptor& other) const { return !(*this == other); }
};

// Hash-function descriptors in insertion order, indexed by id.
class LookupTable {
public:
    using const_iterator = std::vector<HashDescriptor>::const_iterator;

    // Throws DuplicateHashId and leaves the table untouched when the id exists.
    void Add(HashDescriptor descriptor);

    const HashDescriptor* Find(std::uint32_t id) const;
    const HashDescriptor* FindByName(std::string_view name) const;

    // Smallest id greater than every id in the table.
    std::uint32_t NextId() const;

    std::size_t size() const noexcept { return descriptors_.size(); }
    bool empty() const noexcept { return descriptors_.empty(); }
    const_iterator begin() const noexcept { return descriptors_.begin(); }
    const_iterator end() const noexcept { return descriptors_.end(); }

    bool operator==(const LookupTable& other) const { return descriptors_ == other.descriptors_; }
    bool operator!=(const LookupTable& other) const { return !(*this == other); }

private:
    std::vector<HashDescriptor> descriptors_;
    std::unordered_map<std::uint32_t, std::size_t> by_id_;
};

format::Bytes EncodeDescriptor(const HashDescriptor& descriptor);
format::Bytes EncodeLookupTable(const LookupTable& table);
LookupTable DecodeLookupTable(const format::Bytes& payload);

}  // namespace bdf::lookup
