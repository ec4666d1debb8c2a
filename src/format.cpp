#include "bdf/format.hpp"

#include "bdf/errors.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <zlib.h>

namespace bdf::format {

std::uint32_t ReadU32BE(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24)
           | (static_cast<std::uint32_t>(data[1]) << 16)
           | (static_cast<std::uint32_t>(data[2]) << 8)
           | static_cast<std::uint32_t>(data[3]);
}

std::uint64_t ReadU64BE(const std::uint8_t* data) {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(data[i]);
    }
    return value;
}

void AppendU32BE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void AppendU64BE(Bytes& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void AppendBytes(Bytes& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

std::uint32_t Crc32(const std::uint8_t* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    while (size > 0) {
        std::size_t step = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
        crc = crc32(crc, data, static_cast<uInt>(step));
        data += step;
        size -= step;
    }
    return static_cast<std::uint32_t>(crc);
}

std::uint32_t Crc32(const Bytes& data) {
    return Crc32(data.data(), data.size());
}

bool IsValidUtf8(const std::uint8_t* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size) {
        std::uint8_t lead = data[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= size) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            std::uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) {
            return false;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::uint32_t CheckedLength(std::size_t size, std::string_view what) {
    if (size > std::numeric_limits<std::uint32_t>::max()) {
        throw FormatError(ErrorCode::FieldTooLarge,
                          std::string(what) + " exceeds the 32-bit length field");
    }
    return static_cast<std::uint32_t>(size);
}

}  // namespace bdf::format
