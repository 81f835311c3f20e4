#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for transfer checksums
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 streaming state type
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) hash result, big-endian so it compares byte-wise on the wire
using Hash128 = std::array<u8, 16>;

inline Hash128 to_hash128(XXH128_hash_t h) {
    Hash128 result;
    u64 lo = h.low64;
    u64 hi = h.high64;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(hi >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(lo >> (56 - 8 * i));
    }
    return result;
}

// Compute xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    return to_hash128(XXH3_128bits(data, len));
}

// Lower 32 bits of xxh3_64; per-chunk integrity tag
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

// Streaming hasher for xxh3_128 (whole files, whole transfer streams)
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return to_hash128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(32);
    for (u8 b : h) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace hash
