#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for transfer chunks
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest; LAN links rarely benefit from more
static constexpr int ZSTD_LEVEL = 1;

// Returns the maximum compressed size for a given input size
inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

// Compress src -> dst (dst must be pre-sized to at least max_compressed_size(src_len))
inline size_t compress(void* dst, size_t dst_cap, const void* src, size_t src_len) {
    size_t result = ZSTD_compress(dst, dst_cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    return result;
}

// Decompress src -> dst (dst_cap must be the original size)
inline size_t decompress(void* dst, size_t dst_cap, const void* src, size_t src_len) {
    size_t result = ZSTD_decompress(dst, dst_cap, src, src_len);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(result));
    }
    return result;
}

// Compress into a fresh buffer. Returns an empty vector when the result
// would not be smaller than the input (caller then sends the raw bytes).
inline std::vector<u8> compress_if_smaller(const void* src, size_t src_len) {
    if (src_len == 0) return {};
    size_t cap = max_compressed_size(src_len);
    std::vector<u8> buf(cap);
    size_t sz = compress(buf.data(), cap, src, src_len);
    if (sz >= src_len) return {};
    buf.resize(sz);
    return buf;
}

// Decompress to a buffer of known original size; throws if the frame
// does not expand to exactly that size
inline std::vector<u8> decompress_exact(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size);
    size_t sz = decompress(buf.data(), original_size, src, src_len);
    if (sz != original_size) {
        throw std::runtime_error("ZSTD decompress size mismatch: " + std::to_string(sz) +
                                 " != " + std::to_string(original_size));
    }
    return buf;
}

// Extension blacklist: already-compressed formats are sent as-is
inline bool should_compress(const std::string& path) {
    static const char* const no_compress[] = {
        ".gz", ".bz2", ".xz", ".zst", ".lz4", ".br",
        ".zip", ".7z", ".rar",
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".avif", ".heic",
        ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm",
        ".mp3", ".aac", ".ogg", ".flac", ".opus", ".m4a",
        ".pdf", ".apk", ".docx", ".xlsx", ".pptx",
        nullptr
    };

    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) return true;

    std::string ext = path.substr(dot_pos);
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }

    for (int i = 0; no_compress[i]; ++i) {
        if (ext == no_compress[i]) return false;
    }
    return true;
}

} // namespace compress
