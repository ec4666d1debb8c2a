#pragma once

#include "bdf/file_stream.hpp"
#include "bdf/format.hpp"

#include <cstdint>

namespace bdf::header {

struct Header {
    std::uint8_t version = 0;
};

// "BDF" | version(u8) | "RAINBOW"
format::Bytes EncodeHeader();
void WriteHeader(filestream::ByteSink& sink);

Header DecodeHeader(const format::Bytes& raw);
Header ReadHeader(filestream::ByteSource& source);

}  // namespace bdf::header
