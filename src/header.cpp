#include "bdf/header.hpp"

#include "bdf/constants.hpp"
#include "bdf/errors.hpp"

#include <algorithm>
#include <string>

namespace bdf::header {

format::Bytes EncodeHeader() {
    const auto& fmt = constants::kFormat;
    format::Bytes out;
    out.reserve(fmt.header_size);
    out.insert(out.end(), fmt.magic.begin(), fmt.magic.end());
    out.push_back(fmt.version);
    out.insert(out.end(), fmt.tag.begin(), fmt.tag.end());
    return out;
}

void WriteHeader(filestream::ByteSink& sink) {
    sink.Write(EncodeHeader());
}

Header DecodeHeader(const format::Bytes& raw) {
    const auto& fmt = constants::kFormat;
    if (raw.size() < fmt.header_size) {
        throw FormatError(ErrorCode::UnexpectedEof,
                          "Header needs " + std::to_string(fmt.header_size) + " bytes, got "
                              + std::to_string(raw.size()));
    }
    auto tag_begin = raw.begin() + static_cast<std::ptrdiff_t>(fmt.magic.size() + 1);
    if (!std::equal(fmt.magic.begin(), fmt.magic.end(), raw.begin())
        || !std::equal(fmt.tag.begin(), fmt.tag.end(), tag_begin)) {
        throw FormatError(ErrorCode::InvalidFormat, "Not a BDF file (bad magic or tag)");
    }
    Header header;
    header.version = raw[fmt.magic.size()];
    if (header.version != fmt.version) {
        throw FormatError(ErrorCode::UnsupportedVersion,
                          "Unsupported BDF version " + std::to_string(header.version)
                              + " (supported: " + std::to_string(fmt.version) + ")");
    }
    return header;
}

Header ReadHeader(filestream::ByteSource& source) {
    format::Bytes raw(constants::kFormat.header_size);
    std::size_t got = source.Read(raw.data(), raw.size());
    raw.resize(got);
    return DecodeHeader(raw);
}

}  // namespace bdf::header
