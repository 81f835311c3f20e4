#pragma once

// ============================================================
// protocol_io.hpp -- Byte-order helpers and field cursors
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <string>
#include <stdexcept>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[LANLINK_HEADER_LEN]) {
    u32 mg = hton32(h.magic);
    u16 rs = hton16(h.reserved);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,      &mg, 4);
    buf[4] = h.version;
    buf[5] = h.frame_type;
    std::memcpy(buf + 6,  &rs, 2);
    std::memcpy(buf + 8,  &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[LANLINK_HEADER_LEN]) {
    FrameHeader h;
    u32 mg, pl; u16 rs;
    std::memcpy(&mg, buf,     4);
    std::memcpy(&rs, buf + 6, 2);
    std::memcpy(&pl, buf + 8, 4);
    h.magic       = ntoh32(mg);
    h.version     = buf[4];
    h.frame_type  = buf[5];
    h.reserved    = ntoh16(rs);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- ByteWriter: appends big-endian fields to a buffer ----
class ByteWriter {
public:
    explicit ByteWriter(std::vector<u8>& out) : out_(out) {}

    void u8v(u8 v) { out_.push_back(v); }

    void u16v(u16 v) { v = hton16(v); raw(&v, 2); }
    void u32v(u32 v) { v = hton32(v); raw(&v, 4); }
    void u64v(u64 v) { v = hton64(v); raw(&v, 8); }

    void raw(const void* p, size_t n) {
        const u8* b = static_cast<const u8*>(p);
        out_.insert(out_.end(), b, b + n);
    }

    // u16 length prefix + bytes
    void str16(const std::string& s) {
        if (s.size() > 0xFFFF) throw MalformedFrame("string field too long");
        u16v((u16)s.size());
        raw(s.data(), s.size());
    }

    // u32 length prefix + bytes
    void bytes32(const std::vector<u8>& b) {
        u32v((u32)b.size());
        raw(b.data(), b.size());
    }

private:
    std::vector<u8>& out_;
};

// ---- ByteReader: bounds-checked big-endian cursor; throws MalformedFrame ----
class ByteReader {
public:
    ByteReader(const u8* data, size_t len) : p_(data), end_(data + len) {}

    size_t remaining() const { return (size_t)(end_ - p_); }

    u8 u8v() { need(1, "u8"); return *p_++; }

    u16 u16v() { u16 v; take(&v, 2, "u16"); return ntoh16(v); }
    u32 u32v() { u32 v; take(&v, 4, "u32"); return ntoh32(v); }
    u64 u64v() { u64 v; take(&v, 8, "u64"); return ntoh64(v); }

    void raw(void* dst, size_t n) { take(dst, n, "bytes"); }

    std::string str16() {
        u16 n = u16v();
        need(n, "string");
        std::string s(reinterpret_cast<const char*>(p_), n);
        p_ += n;
        return s;
    }

    std::vector<u8> bytes32() {
        u32 n = u32v();
        need(n, "byte field");
        std::vector<u8> b(p_, p_ + n);
        p_ += n;
        return b;
    }

    void expect_end() const {
        if (p_ != end_) {
            throw MalformedFrame(std::to_string(remaining()) + " trailing bytes");
        }
    }

private:
    void need(size_t n, const char* what) const {
        if (remaining() < n) {
            throw MalformedFrame(std::string("truncated ") + what);
        }
    }

    void take(void* dst, size_t n, const char* what) {
        need(n, what);
        std::memcpy(dst, p_, n);
        p_ += n;
    }

    const u8* p_;
    const u8* end_;
};

} // namespace proto
