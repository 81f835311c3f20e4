#pragma once

// protocol.hpp -- Wire protocol definitions for LanLink

#include "platform.hpp"
#include "hash.hpp"
#include <cstring>
#include <string>
#include <vector>
#include <variant>
#include <array>
#include <stdexcept>

// Magic number: "LNK1"
static constexpr u32 LANLINK_MAGIC   = 0x4C4E4B31u;
static constexpr u8  LANLINK_VERSION = 1;

static constexpr u32 LANLINK_HEADER_LEN  = 12;
// Largest payload accepted on either transport (chunks stay well below).
static constexpr u32 LANLINK_MAX_PAYLOAD = 2u * 1024u * 1024u;
// Datagrams are kept below a typical Ethernet MTU.
static constexpr u32 LANLINK_MAX_DATAGRAM = 1400;

static constexpr u16 DEFAULT_DISCOVERY_PORT = 3000;
static constexpr u16 DEFAULT_TRANSFER_PORT  = 3001;
static constexpr u32 DEFAULT_CHUNK_SIZE     = 256u * 1024u;

static constexpr size_t CHANNEL_SALT_LEN = 16;

// ---- Frame types (all prefixed FT_ to avoid Windows macro collisions) ----
enum class FrameType : u8 {
    FT_DISCOVERY         = 0x01,
    FT_CHAT_MESSAGE      = 0x02,

    FT_CHANNEL_HANDSHAKE = 0x10,
    FT_CHANNEL_PAYLOAD   = 0x11,

    FT_TRANSFER_OFFER    = 0x20,
    FT_TRANSFER_CHUNK    = 0x21,
    FT_TRANSFER_ACK      = 0x22,
    FT_TRANSFER_CANCEL   = 0x23,
};

// ---- Channel handshake steps ----
enum class HandshakeKind : u8 {
    HK_JOIN_REQUEST = 1,  // joiner -> all: "who owns a channel?"
    HK_ANNOUNCE     = 2,  // owner -> joiner: channel id, salt, key confirmation
    HK_JOIN_CONFIRM = 3,  // joiner -> owner: proof of the derived key
    HK_WELCOME      = 4,  // owner -> joiner: membership granted
    HK_CLOSED       = 5,  // owner -> all: channel no longer exists
};

// ---- Transfer acknowledgement status ----
enum class AckStatus : u8 {
    AS_ACCEPTED  = 1,
    AS_REJECTED  = 2,
    AS_COMPLETED = 3,
    AS_FAILED    = 4,
};

// ---- Transfer failure reason ----
enum class TransferError : u8 {
    NONE              = 0,
    CHECKSUM_MISMATCH = 1,
    CONNECTION_LOST   = 2,
    DISK_ERROR        = 3,
};

// ---- Compress algo ----
enum class CompressAlgo : u8 {
    NONE = 0,
    ZSTD = 1,
};

// ============================================================
// Frame header (12 bytes, big-endian on wire)
// ============================================================
#pragma pack(push, 1)
struct FrameHeader {
    u32 magic;
    u8  version;
    u8  frame_type;
    u16 reserved;
    u32 payload_len;
};
#pragma pack(pop)
static_assert(sizeof(FrameHeader) == LANLINK_HEADER_LEN, "FrameHeader must be 12 bytes");

// ============================================================
// Frames (decoded form). Field order is wire order.
// ============================================================

// UDP: periodic presence beacon
struct DiscoveryFrame {
    u64         node_id{0};
    u16         discovery_port{DEFAULT_DISCOVERY_PORT};
    u16         transfer_port{DEFAULT_TRANSFER_PORT};
    std::string display_name;

    bool operator==(const DiscoveryFrame& o) const {
        return node_id == o.node_id && discovery_port == o.discovery_port &&
               transfer_port == o.transfer_port && display_name == o.display_name;
    }
};

// UDP: plaintext broadcast chat
struct ChatMessageFrame {
    u64         sender_id{0};
    u64         seq{0};
    u64         timestamp_ms{0};
    std::string text;

    bool operator==(const ChatMessageFrame& o) const {
        return sender_id == o.sender_id && seq == o.seq &&
               timestamp_ms == o.timestamp_ms && text == o.text;
    }
};

// UDP: secure channel join/close signalling
struct ChannelHandshakeFrame {
    HandshakeKind kind{HandshakeKind::HK_JOIN_REQUEST};
    u64           request_id{0};
    u64           sender_id{0};
    u64           channel_id{0};
    std::array<u8, CHANNEL_SALT_LEN> salt{};
    std::vector<u8> proof;  // AEAD key confirmation (nonce || ciphertext || tag)

    bool operator==(const ChannelHandshakeFrame& o) const {
        return kind == o.kind && request_id == o.request_id && sender_id == o.sender_id &&
               channel_id == o.channel_id && salt == o.salt && proof == o.proof;
    }
};

// UDP: encrypted channel message
struct ChannelPayloadFrame {
    u64             channel_id{0};
    u64             sender_id{0};
    u64             seq{0};
    std::vector<u8> sealed;  // nonce || ciphertext || tag

    bool operator==(const ChannelPayloadFrame& o) const {
        return channel_id == o.channel_id && sender_id == o.sender_id &&
               seq == o.seq && sealed == o.sealed;
    }
};

// One file announced in a TransferOffer
struct TransferEntry {
    std::string   name;
    u64           size{0};
    hash::Hash128 xxh3_128{};

    bool operator==(const TransferEntry& o) const {
        return name == o.name && size == o.size && xxh3_128 == o.xxh3_128;
    }
};

// TCP: first frame on a transfer connection
struct TransferOfferFrame {
    u64           job_id{0};
    u64           sender_id{0};
    std::string   sender_name;
    u8            bundled{0};
    u64           total_size{0};
    hash::Hash128 stream_xxh3_128{};  // checksum of the whole byte stream
    std::vector<TransferEntry> entries;

    bool operator==(const TransferOfferFrame& o) const {
        return job_id == o.job_id && sender_id == o.sender_id && sender_name == o.sender_name &&
               bundled == o.bundled && total_size == o.total_size &&
               stream_xxh3_128 == o.stream_xxh3_128 && entries == o.entries;
    }
};

// TCP: one slice of the transfer stream
struct TransferChunkFrame {
    u64             job_id{0};
    u64             offset{0};
    u32             raw_len{0};
    u32             raw_xxh3_32{0};
    CompressAlgo    compress_algo{CompressAlgo::NONE};
    std::vector<u8> data;

    bool operator==(const TransferChunkFrame& o) const {
        return job_id == o.job_id && offset == o.offset && raw_len == o.raw_len &&
               raw_xxh3_32 == o.raw_xxh3_32 && compress_algo == o.compress_algo && data == o.data;
    }
};

struct TransferAckFrame {
    u64           job_id{0};
    AckStatus     status{AckStatus::AS_ACCEPTED};
    TransferError error{TransferError::NONE};

    bool operator==(const TransferAckFrame& o) const {
        return job_id == o.job_id && status == o.status && error == o.error;
    }
};

struct TransferCancelFrame {
    u64 job_id{0};

    bool operator==(const TransferCancelFrame& o) const { return job_id == o.job_id; }
};

using Frame = std::variant<
    DiscoveryFrame,
    ChatMessageFrame,
    ChannelHandshakeFrame,
    ChannelPayloadFrame,
    TransferOfferFrame,
    TransferChunkFrame,
    TransferAckFrame,
    TransferCancelFrame>;

// Thrown by the codec for any input it cannot accept
class MalformedFrame : public std::runtime_error {
public:
    explicit MalformedFrame(const std::string& what)
        : std::runtime_error("malformed frame: " + what) {}
};

inline const char* frame_type_name(FrameType t) {
    switch (t) {
        case FrameType::FT_DISCOVERY:         return "Discovery";
        case FrameType::FT_CHAT_MESSAGE:      return "ChatMessage";
        case FrameType::FT_CHANNEL_HANDSHAKE: return "ChannelHandshake";
        case FrameType::FT_CHANNEL_PAYLOAD:   return "ChannelPayload";
        case FrameType::FT_TRANSFER_OFFER:    return "TransferOffer";
        case FrameType::FT_TRANSFER_CHUNK:    return "TransferChunk";
        case FrameType::FT_TRANSFER_ACK:      return "TransferAck";
        case FrameType::FT_TRANSFER_CANCEL:   return "TransferCancel";
    }
    return "Unknown";
}

inline const char* transfer_error_name(TransferError e) {
    switch (e) {
        case TransferError::NONE:              return "none";
        case TransferError::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case TransferError::CONNECTION_LOST:   return "connection_lost";
        case TransferError::DISK_ERROR:        return "disk_error";
    }
    return "unknown";
}
