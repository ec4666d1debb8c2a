#include "bdf/compression.hpp"

#include "bdf/constants.hpp"
#include "bdf/errors.hpp"

#include <array>
#include <cstdint>
#include <string>

#if BDF_HAS_LZMA
#include <lzma.h>
#endif

namespace bdf::compression {

namespace {

#if BDF_HAS_LZMA
Bytes RunLzma(lzma_stream& strm, const Bytes& input, const char* what) {
    Bytes out;
    std::array<std::uint8_t, 1 << 16> out_buf{};
    strm.next_in = input.data();
    strm.avail_in = input.size();
    lzma_ret ret = LZMA_OK;
    while (true) {
        strm.next_out = out_buf.data();
        strm.avail_out = out_buf.size();
        ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
            lzma_end(&strm);
            throw FormatError(ErrorCode::CompressionFailed,
                              std::string(what) + " failed (lzma error " + std::to_string(ret) + ")");
        }
        std::size_t write_size = out_buf.size() - strm.avail_out;
        out.insert(out.end(), out_buf.begin(), out_buf.begin() + static_cast<std::ptrdiff_t>(write_size));
        if (ret == LZMA_STREAM_END) {
            break;
        }
        if (write_size == 0 && strm.avail_in == 0) {
            lzma_end(&strm);
            throw FormatError(ErrorCode::CompressionFailed, std::string(what) + " hit a truncated xz stream");
        }
    }
    lzma_end(&strm);
    return out;
}

Bytes CompressXz(const Bytes& data, std::uint32_t level) {
    if (level > constants::kMaxCompressionLevel) {
        level = constants::kMaxCompressionLevel;
    }
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_easy_encoder(&strm, level, LZMA_CHECK_CRC64);
    if (ret != LZMA_OK) {
        throw FormatError(ErrorCode::CompressionFailed, "Failed to initialize xz encoder");
    }
    return RunLzma(strm, data, "XZ compression");
}

Bytes DecompressXz(const Bytes& data) {
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_stream_decoder(&strm, UINT64_MAX, 0);
    if (ret != LZMA_OK) {
        throw FormatError(ErrorCode::CompressionFailed, "Failed to initialize xz decoder");
    }
    return RunLzma(strm, data, "XZ decompression");
}
#else
[[noreturn]] void ThrowUnavailable() {
    throw FormatError(ErrorCode::UnsupportedCompression, "XZ support unavailable (liblzma missing)");
}
#endif

}  // namespace

std::optional<Method> MethodFromName(const std::optional<std::string>& name) {
    if (!name.has_value()) {
        return Method::None;
    }
    if (*name == constants::kLzmaMethod) {
        return Method::Lzma;
    }
    return std::nullopt;
}

std::optional<std::string> MethodName(Method method) {
    if (method == Method::Lzma) {
        return std::string(constants::kLzmaMethod);
    }
    return std::nullopt;
}

bool IsAvailable(Method method) {
    if (method == Method::None) {
        return true;
    }
#if BDF_HAS_LZMA
    return true;
#else
    return false;
#endif
}

Bytes Compress(Method method, const Bytes& data, std::uint32_t level) {
    if (method == Method::None) {
        return data;
    }
#if BDF_HAS_LZMA
    return CompressXz(data, level);
#else
    (void)level;
    ThrowUnavailable();
#endif
}

Bytes Decompress(Method method, const Bytes& data) {
    if (method == Method::None) {
        return data;
    }
#if BDF_HAS_LZMA
    return DecompressXz(data);
#else
    ThrowUnavailable();
#endif
}

}  // namespace bdf::compression
