#pragma once

// ============================================================
// codec.hpp -- Frame <-> bytes
// ============================================================

#include "protocol.hpp"
#include <vector>

namespace codec {

// Header + payload for `frame`. Throws MalformedFrame when a field
// cannot be represented (oversized string, payload above the limit).
std::vector<u8> encode(const Frame& frame);

// Strict decode of one complete frame; throws MalformedFrame.
Frame decode(const u8* data, size_t len);

inline Frame decode(const std::vector<u8>& buf) {
    return decode(buf.data(), buf.size());
}

// Decode without throwing; malformed input is logged at DEBUG and dropped.
bool try_decode(const u8* data, size_t len, Frame& out);

// Validate a header read off a stream. Returns the frame type; throws
// MalformedFrame on bad magic/version/type or an oversized payload.
FrameType check_header(const FrameHeader& hdr);

// Payload-only helpers, used by the stream reader after the header.
std::vector<u8> encode_payload(const Frame& frame, FrameType& type_out);
Frame decode_payload(FrameType type, const u8* payload, size_t len);

FrameType type_of(const Frame& frame);

} // namespace codec
