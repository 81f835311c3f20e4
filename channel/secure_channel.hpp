#pragma once

// ============================================================
// secure_channel.hpp -- PIN-keyed encrypted group channels
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

enum class ChannelState {
    CREATED,
    ACTIVE,
    CLOSED,
};

enum class JoinError {
    NONE,
    NO_MATCH,        // no channel answered for this PIN in time
    CHANNEL_CLOSED,  // matched channel was closed by its owner
    LOCKED_OUT,      // too many failed attempts, try again later
};

struct JoinResult {
    JoinError error{JoinError::NONE};
    u64       channel_id{0};

    bool ok() const { return error == JoinError::NONE; }
};

// Snapshot handed to callers; never carries key material
struct ChannelInfo {
    u64              channel_id{0};
    ChannelState     state{ChannelState::CREATED};
    bool             owner{false};
    std::string      masked_pin;
    std::vector<u64> members;
    u64              created_ms{0};
};

struct SecureMessage {
    u64         channel_id{0};
    u64         sender_id{0};
    u64         seq{0};
    std::string text;
};

struct ChannelCallbacks {
    // Broadcast a handshake or payload frame; returns false if not sent
    std::function<bool(const Frame&)>          send_frame;
    std::function<void(const SecureMessage&)>  on_message;
    std::function<void(const ChannelInfo&)>    on_channel_changed;
};

const char* channel_state_name(ChannelState s);
const char* join_error_name(JoinError e);

// "****" followed by the last four characters
std::string mask_pin(const std::string& pin);

class SecureChannelEngine {
public:
    SecureChannelEngine(const LanConfig& cfg, u64 node_id);
    ~SecureChannelEngine();

    SecureChannelEngine(const SecureChannelEngine&) = delete;
    SecureChannelEngine& operator=(const SecureChannelEngine&) = delete;

    void set_callbacks(ChannelCallbacks cb);

    // New owned channel with a random numeric PIN: (channel_id, pin)
    std::pair<u64, std::string> create_channel();

    // Same with a caller-chosen PIN (4-16 alphanumerics); throws
    // std::invalid_argument otherwise.
    std::pair<u64, std::string> create_channel(const std::string& pin);

    // Blocks up to join_timeout. Joining a channel id already held
    // re-keys it in place (after the owner regenerated the PIN).
    JoinResult join_channel(const std::string& pin);

    // Owner only: new PIN, salt and key; id and members unchanged.
    // Throws std::runtime_error for unknown, closed or foreign channels.
    std::string regenerate_pin(u64 channel_id);

    // Encrypt and broadcast; returns the channel sequence number.
    // Throws std::runtime_error for unknown or closed channels.
    u64 send(u64 channel_id, const std::string& text);

    // -> CLOSED, keys wiped. The owner also tells the members.
    void close_channel(u64 channel_id);

    // Close everything (engine stop)
    void shutdown();

    // Inbound ChannelHandshake / ChannelPayload
    void on_frame(const Frame& frame);

    std::vector<ChannelInfo> channels() const;
    bool channel_info(u64 channel_id, ChannelInfo& out) const;
    std::string masked_pin(u64 channel_id) const;

    u64 node_id() const { return node_id_; }

private:
    struct Channel {
        u64           id{0};
        std::string   pin;
        crypto::Salt  salt{};
        crypto::Key   key{};
        std::set<u64> members;
        u64           created_ms{0};
        ChannelState  state{ChannelState::CREATED};
        bool          owner{false};
        u64           next_seq{0};
        std::unordered_map<u64, u64> last_seq;  // per sender replay window
    };

    // State of the one join in flight
    struct PendingJoin {
        u64  request_id{0};
        std::vector<ChannelHandshakeFrame> announces;
        u64  matched_channel{0};
        u64  matched_owner{0};
        bool welcomed{false};
        bool closed{false};
    };

    std::pair<u64, std::string> create_with_pin(const std::string& pin);

    void handle_handshake(const ChannelHandshakeFrame& f);
    void handle_payload(const ChannelPayloadFrame& f);

    void answer_join_request(const ChannelHandshakeFrame& f);
    void handle_join_confirm(const ChannelHandshakeFrame& f);
    void handle_closed(const ChannelHandshakeFrame& f);

    void install_joined(u64 channel_id, u64 owner_id, const std::string& pin,
                        const crypto::Salt& salt, const crypto::Key& key);
    void record_join_failure();

    ChannelInfo snapshot(const Channel& c) const;
    void emit_changed(const ChannelInfo& info);
    bool send_frame(const Frame& f);

    static void wipe_channel(Channel& c);

    LanConfig cfg_;
    u64       node_id_;
    ChannelCallbacks cb_;

    mutable std::mutex      mutex_;
    std::map<u64, Channel>  channels_;
    // Last sequence number we sent per channel id, kept after the channel
    // is dropped so a later rejoin continues above it
    std::map<u64, u64>      spent_seq_;

    // Join in flight (one at a time)
    std::mutex              join_mutex_;
    std::condition_variable join_cv_;
    PendingJoin*            pending_{nullptr};

    // Brute-force lockout (guarded by mutex_)
    int consecutive_failures_{0};
    u64 locked_until_ms_{0};
};
