// ============================================================
// codec.cpp -- Frame encode/decode
// ============================================================

#include "codec.hpp"
#include "protocol_io.hpp"
#include "logger.hpp"
#include <string>

using proto::ByteWriter;
using proto::ByteReader;

// ---- Field helpers ----

static void put_hash(ByteWriter& w, const hash::Hash128& h) {
    w.raw(h.data(), h.size());
}

static hash::Hash128 get_hash(ByteReader& r) {
    hash::Hash128 h;
    r.raw(h.data(), h.size());
    return h;
}

static HandshakeKind to_handshake_kind(u8 v) {
    if (v < (u8)HandshakeKind::HK_JOIN_REQUEST || v > (u8)HandshakeKind::HK_CLOSED) {
        throw MalformedFrame("bad handshake kind " + std::to_string(v));
    }
    return (HandshakeKind)v;
}

static AckStatus to_ack_status(u8 v) {
    if (v < (u8)AckStatus::AS_ACCEPTED || v > (u8)AckStatus::AS_FAILED) {
        throw MalformedFrame("bad ack status " + std::to_string(v));
    }
    return (AckStatus)v;
}

static TransferError to_transfer_error(u8 v) {
    if (v > (u8)TransferError::DISK_ERROR) {
        throw MalformedFrame("bad transfer error " + std::to_string(v));
    }
    return (TransferError)v;
}

static CompressAlgo to_compress_algo(u8 v) {
    if (v > (u8)CompressAlgo::ZSTD) {
        throw MalformedFrame("bad compress algo " + std::to_string(v));
    }
    return (CompressAlgo)v;
}

// ============================================================
// Encoding
// ============================================================

namespace {

struct PayloadEncoder {
    ByteWriter& w;

    FrameType operator()(const DiscoveryFrame& f) {
        w.u64v(f.node_id);
        w.u16v(f.discovery_port);
        w.u16v(f.transfer_port);
        w.str16(f.display_name);
        return FrameType::FT_DISCOVERY;
    }

    FrameType operator()(const ChatMessageFrame& f) {
        w.u64v(f.sender_id);
        w.u64v(f.seq);
        w.u64v(f.timestamp_ms);
        w.str16(f.text);
        return FrameType::FT_CHAT_MESSAGE;
    }

    FrameType operator()(const ChannelHandshakeFrame& f) {
        w.u8v((u8)f.kind);
        w.u64v(f.request_id);
        w.u64v(f.sender_id);
        w.u64v(f.channel_id);
        w.raw(f.salt.data(), f.salt.size());
        w.bytes32(f.proof);
        return FrameType::FT_CHANNEL_HANDSHAKE;
    }

    FrameType operator()(const ChannelPayloadFrame& f) {
        w.u64v(f.channel_id);
        w.u64v(f.sender_id);
        w.u64v(f.seq);
        w.bytes32(f.sealed);
        return FrameType::FT_CHANNEL_PAYLOAD;
    }

    FrameType operator()(const TransferOfferFrame& f) {
        if (f.entries.size() > 0xFFFF) throw MalformedFrame("too many offer entries");
        w.u64v(f.job_id);
        w.u64v(f.sender_id);
        w.str16(f.sender_name);
        w.u8v(f.bundled);
        w.u64v(f.total_size);
        put_hash(w, f.stream_xxh3_128);
        w.u16v((u16)f.entries.size());
        for (auto& e : f.entries) {
            w.str16(e.name);
            w.u64v(e.size);
            put_hash(w, e.xxh3_128);
        }
        return FrameType::FT_TRANSFER_OFFER;
    }

    FrameType operator()(const TransferChunkFrame& f) {
        w.u64v(f.job_id);
        w.u64v(f.offset);
        w.u32v(f.raw_len);
        w.u32v(f.raw_xxh3_32);
        w.u8v((u8)f.compress_algo);
        w.bytes32(f.data);
        return FrameType::FT_TRANSFER_CHUNK;
    }

    FrameType operator()(const TransferAckFrame& f) {
        w.u64v(f.job_id);
        w.u8v((u8)f.status);
        w.u8v((u8)f.error);
        return FrameType::FT_TRANSFER_ACK;
    }

    FrameType operator()(const TransferCancelFrame& f) {
        w.u64v(f.job_id);
        return FrameType::FT_TRANSFER_CANCEL;
    }
};

} // namespace

std::vector<u8> codec::encode_payload(const Frame& frame, FrameType& type_out) {
    std::vector<u8> payload;
    ByteWriter w(payload);
    type_out = std::visit(PayloadEncoder{w}, frame);
    if (payload.size() > LANLINK_MAX_PAYLOAD) {
        throw MalformedFrame("payload too large: " + std::to_string(payload.size()));
    }
    return payload;
}

std::vector<u8> codec::encode(const Frame& frame) {
    FrameType type;
    std::vector<u8> payload = encode_payload(frame, type);

    FrameHeader hdr;
    hdr.magic       = LANLINK_MAGIC;
    hdr.version     = LANLINK_VERSION;
    hdr.frame_type  = (u8)type;
    hdr.reserved    = 0;
    hdr.payload_len = (u32)payload.size();

    std::vector<u8> out(LANLINK_HEADER_LEN + payload.size());
    proto::encode_header(hdr, out.data());
    if (!payload.empty()) {
        std::memcpy(out.data() + LANLINK_HEADER_LEN, payload.data(), payload.size());
    }
    return out;
}

FrameType codec::type_of(const Frame& frame) {
    switch (frame.index()) {
        case 0: return FrameType::FT_DISCOVERY;
        case 1: return FrameType::FT_CHAT_MESSAGE;
        case 2: return FrameType::FT_CHANNEL_HANDSHAKE;
        case 3: return FrameType::FT_CHANNEL_PAYLOAD;
        case 4: return FrameType::FT_TRANSFER_OFFER;
        case 5: return FrameType::FT_TRANSFER_CHUNK;
        case 6: return FrameType::FT_TRANSFER_ACK;
        default: return FrameType::FT_TRANSFER_CANCEL;
    }
}

// ============================================================
// Decoding
// ============================================================

FrameType codec::check_header(const FrameHeader& hdr) {
    if (hdr.magic != LANLINK_MAGIC) {
        throw MalformedFrame("bad magic");
    }
    if (hdr.version != LANLINK_VERSION) {
        throw MalformedFrame("unsupported version " + std::to_string(hdr.version));
    }
    if (hdr.reserved != 0) {
        throw MalformedFrame("reserved field not zero");
    }
    if (hdr.payload_len > LANLINK_MAX_PAYLOAD) {
        throw MalformedFrame("payload too large: " + std::to_string(hdr.payload_len));
    }
    switch ((FrameType)hdr.frame_type) {
        case FrameType::FT_DISCOVERY:
        case FrameType::FT_CHAT_MESSAGE:
        case FrameType::FT_CHANNEL_HANDSHAKE:
        case FrameType::FT_CHANNEL_PAYLOAD:
        case FrameType::FT_TRANSFER_OFFER:
        case FrameType::FT_TRANSFER_CHUNK:
        case FrameType::FT_TRANSFER_ACK:
        case FrameType::FT_TRANSFER_CANCEL:
            return (FrameType)hdr.frame_type;
    }
    throw MalformedFrame("unknown frame type " + std::to_string(hdr.frame_type));
}

Frame codec::decode_payload(FrameType type, const u8* payload, size_t len) {
    ByteReader r(payload, len);
    Frame out;

    switch (type) {
        case FrameType::FT_DISCOVERY: {
            DiscoveryFrame f;
            f.node_id        = r.u64v();
            f.discovery_port = r.u16v();
            f.transfer_port  = r.u16v();
            f.display_name   = r.str16();
            out = std::move(f);
            break;
        }
        case FrameType::FT_CHAT_MESSAGE: {
            ChatMessageFrame f;
            f.sender_id    = r.u64v();
            f.seq          = r.u64v();
            f.timestamp_ms = r.u64v();
            f.text         = r.str16();
            out = std::move(f);
            break;
        }
        case FrameType::FT_CHANNEL_HANDSHAKE: {
            ChannelHandshakeFrame f;
            f.kind       = to_handshake_kind(r.u8v());
            f.request_id = r.u64v();
            f.sender_id  = r.u64v();
            f.channel_id = r.u64v();
            r.raw(f.salt.data(), f.salt.size());
            f.proof      = r.bytes32();
            out = std::move(f);
            break;
        }
        case FrameType::FT_CHANNEL_PAYLOAD: {
            ChannelPayloadFrame f;
            f.channel_id = r.u64v();
            f.sender_id  = r.u64v();
            f.seq        = r.u64v();
            f.sealed     = r.bytes32();
            out = std::move(f);
            break;
        }
        case FrameType::FT_TRANSFER_OFFER: {
            TransferOfferFrame f;
            f.job_id          = r.u64v();
            f.sender_id       = r.u64v();
            f.sender_name     = r.str16();
            f.bundled         = r.u8v();
            if (f.bundled > 1) throw MalformedFrame("bad bundled flag");
            f.total_size      = r.u64v();
            f.stream_xxh3_128 = get_hash(r);
            u16 count = r.u16v();
            f.entries.reserve(count);
            for (u16 i = 0; i < count; ++i) {
                TransferEntry e;
                e.name     = r.str16();
                e.size     = r.u64v();
                e.xxh3_128 = get_hash(r);
                f.entries.push_back(std::move(e));
            }
            out = std::move(f);
            break;
        }
        case FrameType::FT_TRANSFER_CHUNK: {
            TransferChunkFrame f;
            f.job_id        = r.u64v();
            f.offset        = r.u64v();
            f.raw_len       = r.u32v();
            f.raw_xxh3_32   = r.u32v();
            f.compress_algo = to_compress_algo(r.u8v());
            f.data          = r.bytes32();
            out = std::move(f);
            break;
        }
        case FrameType::FT_TRANSFER_ACK: {
            TransferAckFrame f;
            f.job_id = r.u64v();
            f.status = to_ack_status(r.u8v());
            f.error  = to_transfer_error(r.u8v());
            out = std::move(f);
            break;
        }
        case FrameType::FT_TRANSFER_CANCEL: {
            TransferCancelFrame f;
            f.job_id = r.u64v();
            out = std::move(f);
            break;
        }
        default:
            throw MalformedFrame("unknown frame type " + std::to_string((int)type));
    }

    r.expect_end();
    return out;
}

Frame codec::decode(const u8* data, size_t len) {
    if (!data || len < LANLINK_HEADER_LEN) {
        throw MalformedFrame("short header (" + std::to_string(len) + " bytes)");
    }
    FrameHeader hdr = proto::decode_header(data);
    FrameType type = check_header(hdr);
    size_t body = len - LANLINK_HEADER_LEN;
    if (hdr.payload_len != body) {
        throw MalformedFrame("payload length " + std::to_string(hdr.payload_len) +
                             " != " + std::to_string(body));
    }
    return decode_payload(type, data + LANLINK_HEADER_LEN, body);
}

bool codec::try_decode(const u8* data, size_t len, Frame& out) {
    try {
        out = decode(data, len);
        return true;
    } catch (const MalformedFrame& e) {
        LOG_DEBUG(std::string("Dropping frame: ") + e.what());
        return false;
    }
}
