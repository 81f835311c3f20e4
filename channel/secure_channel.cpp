// ============================================================
// secure_channel.cpp -- Join handshake, re-keying, AEAD payloads
// ============================================================

#include "secure_channel.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <stdexcept>

// Key-confirmation plaintexts
static const std::string CONFIRM_TEXT = "SECURE_OK";
static const std::string CLOSED_TEXT  = "CLOSED";

// Header + channel id + sender + seq + length prefix + nonce + tag
static constexpr size_t PAYLOAD_OVERHEAD =
    LANLINK_HEADER_LEN + 8 + 8 + 8 + 4 + crypto::NONCE_LEN + crypto::TAG_LEN;

static std::vector<u8> aad_of(std::initializer_list<u64> fields) {
    std::vector<u8> out;
    proto::ByteWriter w(out);
    for (u64 v : fields) w.u64v(v);
    return out;
}

static std::vector<u8> to_bytes(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

static bool proof_matches(const crypto::Key& key, const std::vector<u8>& proof,
                          const std::string& expected, const std::vector<u8>& aad) {
    std::vector<u8> plain;
    if (!crypto::open(key, proof, aad, plain)) return false;
    return plain.size() == expected.size() &&
           std::equal(plain.begin(), plain.end(), expected.begin());
}

const char* channel_state_name(ChannelState s) {
    switch (s) {
        case ChannelState::CREATED: return "created";
        case ChannelState::ACTIVE:  return "active";
        case ChannelState::CLOSED:  return "closed";
    }
    return "?";
}

const char* join_error_name(JoinError e) {
    switch (e) {
        case JoinError::NONE:           return "none";
        case JoinError::NO_MATCH:       return "no_match";
        case JoinError::CHANNEL_CLOSED: return "closed";
        case JoinError::LOCKED_OUT:     return "locked_out";
    }
    return "?";
}

std::string mask_pin(const std::string& pin) {
    if (pin.size() <= 4) return "****" + pin;
    return "****" + pin.substr(pin.size() - 4);
}

// ============================================================
// Lifecycle
// ============================================================

SecureChannelEngine::SecureChannelEngine(const LanConfig& cfg, u64 node_id)
    : cfg_(cfg), node_id_(node_id) {}

SecureChannelEngine::~SecureChannelEngine() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& kv : channels_) wipe_channel(kv.second);
}

void SecureChannelEngine::set_callbacks(ChannelCallbacks cb) {
    cb_ = std::move(cb);
}

void SecureChannelEngine::wipe_channel(Channel& c) {
    crypto::wipe(c.key);
    crypto::wipe(c.pin);
    c.salt.fill(0);
}

bool SecureChannelEngine::send_frame(const Frame& f) {
    if (!cb_.send_frame) return false;
    try {
        return cb_.send_frame(f);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Channel frame not sent: ") + e.what());
        return false;
    }
}

void SecureChannelEngine::emit_changed(const ChannelInfo& info) {
    if (cb_.on_channel_changed) cb_.on_channel_changed(info);
}

ChannelInfo SecureChannelEngine::snapshot(const Channel& c) const {
    ChannelInfo info;
    info.channel_id = c.id;
    info.state      = c.state;
    info.owner      = c.owner;
    info.masked_pin = c.pin.empty() ? std::string() : mask_pin(c.pin);
    info.members.assign(c.members.begin(), c.members.end());
    info.created_ms = c.created_ms;
    return info;
}

// ============================================================
// Create / regenerate
// ============================================================

std::pair<u64, std::string> SecureChannelEngine::create_channel() {
    return create_with_pin(crypto::random_pin(cfg_.pin_digits));
}

std::pair<u64, std::string> SecureChannelEngine::create_channel(const std::string& pin) {
    bool valid = pin.size() >= 4 && pin.size() <= 16 &&
                 std::all_of(pin.begin(), pin.end(),
                             [](char c) { return std::isalnum((unsigned char)c) != 0; });
    if (!valid) {
        throw std::invalid_argument("PIN must be 4-16 letters or digits");
    }
    return create_with_pin(pin);
}

std::pair<u64, std::string> SecureChannelEngine::create_with_pin(const std::string& pin) {
    Channel c;
    c.id         = crypto::random_id();
    c.pin        = pin;
    c.salt       = crypto::random_salt();
    c.key        = crypto::derive_key(pin, c.salt, cfg_.kdf_iterations);
    c.members    = {node_id_};
    c.created_ms = utils::now_ms();
    c.state      = ChannelState::CREATED;
    c.owner      = true;

    ChannelInfo info = snapshot(c);
    u64 id = c.id;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        channels_.emplace(id, std::move(c));
    }
    LOG_INFO("Created channel " + utils::to_hex(id) + " (PIN " + mask_pin(pin) + ")");
    emit_changed(info);
    return {id, pin};
}

std::string SecureChannelEngine::regenerate_pin(u64 channel_id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = channels_.find(channel_id);
        if (it == channels_.end() || it->second.state == ChannelState::CLOSED) {
            throw std::runtime_error("No open channel " + utils::to_hex(channel_id));
        }
        if (!it->second.owner) {
            throw std::runtime_error("Only the owner can regenerate the PIN of " +
                                     utils::to_hex(channel_id));
        }
    }

    std::string pin  = crypto::random_pin(cfg_.pin_digits);
    crypto::Salt salt = crypto::random_salt();
    crypto::Key key  = crypto::derive_key(pin, salt, cfg_.kdf_iterations);

    ChannelInfo info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = channels_.find(channel_id);
        if (it == channels_.end() || it->second.state == ChannelState::CLOSED) {
            crypto::wipe(key);
            throw std::runtime_error("Channel " + utils::to_hex(channel_id) + " closed meanwhile");
        }
        Channel& c = it->second;
        wipe_channel(c);
        c.pin  = pin;
        c.salt = salt;
        c.key  = key;
        info = snapshot(c);
    }
    crypto::wipe(key);

    LOG_INFO("Regenerated PIN of channel " + utils::to_hex(channel_id) + " (" + mask_pin(pin) + ")");
    emit_changed(info);
    return pin;
}

// ============================================================
// Join
// ============================================================

JoinResult SecureChannelEngine::join_channel(const std::string& pin) {
    std::lock_guard<std::mutex> serial(join_mutex_);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        u64 now = utils::steady_ms();
        if (now < locked_until_ms_) {
            LOG_WARN("Join refused: locked out for another " +
                     std::to_string((locked_until_ms_ - now + 999) / 1000) + " s");
            return JoinResult{JoinError::LOCKED_OUT, 0};
        }
    }

    PendingJoin pending;
    pending.request_id = crypto::random_id();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pending_ = &pending;
    }

    ChannelHandshakeFrame req;
    req.kind       = HandshakeKind::HK_JOIN_REQUEST;
    req.request_id = pending.request_id;
    req.sender_id  = node_id_;
    send_frame(req);

    const u64 deadline = utils::steady_ms() + (u64)cfg_.join_timeout_ms;
    JoinResult result{JoinError::NO_MATCH, 0};
    crypto::Key  matched_key{};
    crypto::Salt matched_salt{};
    bool have_key = false;
    size_t tried = 0;

    std::unique_lock<std::mutex> lk(mutex_);
    while (true) {
        if (pending.closed) {
            result.error = JoinError::CHANNEL_CLOSED;
            break;
        }
        if (pending.welcomed) {
            result.error      = JoinError::NONE;
            result.channel_id = pending.matched_channel;
            break;
        }

        if (!have_key && tried < pending.announces.size()) {
            ChannelHandshakeFrame a = pending.announces[tried++];
            lk.unlock();

            crypto::Key key = crypto::derive_key(pin, a.salt, cfg_.kdf_iterations);
            bool ok = proof_matches(key, a.proof, CONFIRM_TEXT,
                                    aad_of({a.channel_id, pending.request_id}));
            if (ok) {
                matched_key  = key;
                matched_salt = a.salt;
                have_key     = true;
            }
            crypto::wipe(key);

            lk.lock();
            if (ok) {
                pending.matched_channel = a.channel_id;
                pending.matched_owner   = a.sender_id;
                lk.unlock();

                ChannelHandshakeFrame confirm;
                confirm.kind       = HandshakeKind::HK_JOIN_CONFIRM;
                confirm.request_id = pending.request_id;
                confirm.sender_id  = node_id_;
                confirm.channel_id = a.channel_id;
                confirm.proof      = crypto::seal(matched_key, to_bytes(CONFIRM_TEXT),
                                                  aad_of({a.channel_id, node_id_}));
                send_frame(confirm);

                lk.lock();
            }
            continue;
        }

        u64 now = utils::steady_ms();
        if (now >= deadline) break;
        join_cv_.wait_for(lk, std::chrono::milliseconds(deadline - now));
    }
    u64 owner_id = pending.matched_owner;
    pending_ = nullptr;
    lk.unlock();

    if (result.ok()) {
        install_joined(result.channel_id, owner_id, pin, matched_salt, matched_key);
        std::lock_guard<std::mutex> g(mutex_);
        consecutive_failures_ = 0;
    } else if (result.error == JoinError::NO_MATCH) {
        record_join_failure();
    } else {
        LOG_WARN("Join failed: channel " + utils::to_hex(pending.matched_channel) + " is closed");
    }
    crypto::wipe(matched_key);
    return result;
}

void SecureChannelEngine::record_join_failure() {
    std::lock_guard<std::mutex> lk(mutex_);
    ++consecutive_failures_;
    LOG_WARN("Join failed: no channel matched (" + std::to_string(consecutive_failures_) + "/" +
             std::to_string(cfg_.join_max_failures) + ")");
    if (consecutive_failures_ >= cfg_.join_max_failures) {
        locked_until_ms_ = utils::steady_ms() + (u64)cfg_.join_lockout_ms;
        consecutive_failures_ = 0;
        LOG_WARN("Joining locked for " + std::to_string(cfg_.join_lockout_ms / 1000) + " s");
    }
}

void SecureChannelEngine::install_joined(u64 channel_id, u64 owner_id, const std::string& pin,
                                         const crypto::Salt& salt, const crypto::Key& key) {
    ChannelInfo info;
    bool rekeyed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = channels_.find(channel_id);
        if (it != channels_.end() && it->second.state != ChannelState::CLOSED) {
            // Owner regenerated the PIN: same channel, new key
            Channel& c = it->second;
            wipe_channel(c);
            c.pin  = pin;
            c.salt = salt;
            c.key  = key;
            c.members.insert(owner_id);
            c.state = ChannelState::ACTIVE;
            info = snapshot(c);
            rekeyed = true;
        } else {
            Channel c;
            if (it != channels_.end()) {
                // Left earlier: members still remember our old sequence numbers
                c.next_seq = it->second.next_seq;
                channels_.erase(it);
            } else {
                auto spent = spent_seq_.find(channel_id);
                if (spent != spent_seq_.end()) c.next_seq = spent->second;
            }
            c.id         = channel_id;
            c.pin        = pin;
            c.salt       = salt;
            c.key        = key;
            c.members    = {node_id_, owner_id};
            c.created_ms = utils::now_ms();
            c.state      = ChannelState::ACTIVE;
            c.owner      = false;
            info = snapshot(c);
            channels_.emplace(channel_id, std::move(c));
        }
    }
    LOG_INFO(std::string(rekeyed ? "Re-keyed" : "Joined") + " channel " + utils::to_hex(channel_id));
    emit_changed(info);
}

// ============================================================
// Send / close
// ============================================================

u64 SecureChannelEngine::send(u64 channel_id, const std::string& text) {
    if (text.size() + PAYLOAD_OVERHEAD > LANLINK_MAX_DATAGRAM) {
        throw std::invalid_argument("Secure message too long: " + std::to_string(text.size()) +
                                    " bytes");
    }

    crypto::Key key;
    u64 seq;
    bool activated = false;
    ChannelInfo info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = channels_.find(channel_id);
        if (it == channels_.end() || it->second.state == ChannelState::CLOSED) {
            throw std::runtime_error("No open channel " + utils::to_hex(channel_id));
        }
        Channel& c = it->second;
        seq = ++c.next_seq;
        key = c.key;
        if (c.state == ChannelState::CREATED) {
            c.state = ChannelState::ACTIVE;
            activated = true;
            info = snapshot(c);
        }
    }

    ChannelPayloadFrame f;
    f.channel_id = channel_id;
    f.sender_id  = node_id_;
    f.seq        = seq;
    f.sealed     = crypto::seal(key, to_bytes(text), aad_of({channel_id, node_id_, seq}));
    crypto::wipe(key);

    if (activated) emit_changed(info);
    if (!send_frame(f)) {
        LOG_WARN("Secure message #" + std::to_string(seq) + " on " + utils::to_hex(channel_id) +
                 " not sent");
    }
    return seq;
}

void SecureChannelEngine::close_channel(u64 channel_id) {
    ChannelHandshakeFrame closed;
    bool announce = false;
    ChannelInfo info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = channels_.find(channel_id);
        if (it == channels_.end()) {
            throw std::runtime_error("Unknown channel " + utils::to_hex(channel_id));
        }
        Channel& c = it->second;
        if (c.state == ChannelState::CLOSED) return;

        if (c.owner) {
            closed.kind       = HandshakeKind::HK_CLOSED;
            closed.sender_id  = node_id_;
            closed.channel_id = channel_id;
            closed.proof      = crypto::seal(c.key, to_bytes(CLOSED_TEXT),
                                             aad_of({channel_id, node_id_}));
            announce = true;
        }
        c.state = ChannelState::CLOSED;
        wipe_channel(c);
        info = snapshot(c);
    }
    LOG_INFO("Closed channel " + utils::to_hex(channel_id));
    if (announce) send_frame(closed);
    emit_changed(info);
}

void SecureChannelEngine::shutdown() {
    std::vector<u64> open_ids;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& kv : channels_) {
            if (kv.second.state != ChannelState::CLOSED) open_ids.push_back(kv.first);
        }
    }
    for (u64 id : open_ids) {
        try {
            close_channel(id);
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Close on shutdown: ") + e.what());
        }
    }
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& kv : channels_) spent_seq_[kv.first] = kv.second.next_seq;
    channels_.clear();
    consecutive_failures_ = 0;
    locked_until_ms_ = 0;
}

// ============================================================
// Inbound
// ============================================================

void SecureChannelEngine::on_frame(const Frame& frame) {
    if (auto* h = std::get_if<ChannelHandshakeFrame>(&frame)) {
        if (h->sender_id == node_id_) return;
        handle_handshake(*h);
    } else if (auto* p = std::get_if<ChannelPayloadFrame>(&frame)) {
        if (p->sender_id == node_id_) return;
        handle_payload(*p);
    }
}

void SecureChannelEngine::handle_handshake(const ChannelHandshakeFrame& f) {
    switch (f.kind) {
        case HandshakeKind::HK_JOIN_REQUEST:
            answer_join_request(f);
            break;

        case HandshakeKind::HK_ANNOUNCE: {
            std::lock_guard<std::mutex> lk(mutex_);
            if (pending_ && f.request_id == pending_->request_id &&
                pending_->matched_channel == 0) {
                pending_->announces.push_back(f);
                join_cv_.notify_all();
            }
            break;
        }

        case HandshakeKind::HK_JOIN_CONFIRM:
            handle_join_confirm(f);
            break;

        case HandshakeKind::HK_WELCOME: {
            std::lock_guard<std::mutex> lk(mutex_);
            if (pending_ && f.request_id == pending_->request_id &&
                f.channel_id == pending_->matched_channel) {
                pending_->welcomed = true;
                join_cv_.notify_all();
            }
            break;
        }

        case HandshakeKind::HK_CLOSED:
            handle_closed(f);
            break;
    }
}

void SecureChannelEngine::answer_join_request(const ChannelHandshakeFrame& f) {
    std::vector<ChannelHandshakeFrame> answers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& kv : channels_) {
            const Channel& c = kv.second;
            if (!c.owner || c.state == ChannelState::CLOSED) continue;
            ChannelHandshakeFrame a;
            a.kind       = HandshakeKind::HK_ANNOUNCE;
            a.request_id = f.request_id;
            a.sender_id  = node_id_;
            a.channel_id = c.id;
            a.salt       = c.salt;
            a.proof      = crypto::seal(c.key, to_bytes(CONFIRM_TEXT),
                                        aad_of({c.id, f.request_id}));
            answers.push_back(std::move(a));
        }
    }
    for (auto& a : answers) send_frame(a);
}

void SecureChannelEngine::handle_join_confirm(const ChannelHandshakeFrame& f) {
    ChannelHandshakeFrame reply;
    reply.request_id = f.request_id;
    reply.sender_id  = node_id_;
    reply.channel_id = f.channel_id;

    ChannelInfo info;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = channels_.find(f.channel_id);
        if (it == channels_.end() || !it->second.owner) return;
        Channel& c = it->second;

        if (c.state == ChannelState::CLOSED) {
            reply.kind = HandshakeKind::HK_CLOSED;
        } else if (proof_matches(c.key, f.proof, CONFIRM_TEXT, aad_of({c.id, f.sender_id}))) {
            reply.kind = HandshakeKind::HK_WELCOME;
            bool added = c.members.insert(f.sender_id).second;
            bool activated = c.state == ChannelState::CREATED;
            c.state = ChannelState::ACTIVE;
            changed = added || activated;
            info = snapshot(c);
        } else {
            LOG_DEBUG("Join confirm for " + utils::to_hex(f.channel_id) + " from " +
                      utils::to_hex(f.sender_id) + " did not authenticate");
            return;
        }
    }

    if (reply.kind == HandshakeKind::HK_WELCOME) {
        LOG_INFO("Member " + utils::to_hex(f.sender_id) + " joined channel " +
                 utils::to_hex(f.channel_id));
    }
    send_frame(reply);
    if (changed) emit_changed(info);
}

void SecureChannelEngine::handle_closed(const ChannelHandshakeFrame& f) {
    ChannelInfo info;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);

        if (pending_ && pending_->matched_channel != 0 && f.channel_id == pending_->matched_channel &&
            (f.request_id == pending_->request_id || f.sender_id == pending_->matched_owner)) {
            pending_->closed = true;
            join_cv_.notify_all();
        }

        auto it = channels_.find(f.channel_id);
        if (it != channels_.end() && !it->second.owner &&
            it->second.state != ChannelState::CLOSED &&
            proof_matches(it->second.key, f.proof, CLOSED_TEXT, aad_of({f.channel_id, f.sender_id}))) {
            Channel& c = it->second;
            c.state = ChannelState::CLOSED;
            wipe_channel(c);
            info = snapshot(c);
            changed = true;
        }
    }
    if (changed) {
        LOG_INFO("Channel " + utils::to_hex(f.channel_id) + " was closed by its owner");
        emit_changed(info);
    }
}

void SecureChannelEngine::handle_payload(const ChannelPayloadFrame& f) {
    SecureMessage msg;
    bool delivered = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);

        // Hinted channel first, then every other open channel
        std::vector<Channel*> candidates;
        auto hinted = channels_.find(f.channel_id);
        if (hinted != channels_.end()) candidates.push_back(&hinted->second);
        for (auto& kv : channels_) {
            if (kv.first != f.channel_id) candidates.push_back(&kv.second);
        }

        for (Channel* c : candidates) {
            if (c->state == ChannelState::CLOSED) continue;
            std::vector<u8> plain;
            if (!crypto::open(c->key, f.sealed, aad_of({c->id, f.sender_id, f.seq}), plain)) {
                continue;
            }
            auto last = c->last_seq.find(f.sender_id);
            if (last != c->last_seq.end() && f.seq <= last->second) {
                LOG_DEBUG("Dropping replayed message #" + std::to_string(f.seq) + " on " +
                          utils::to_hex(c->id));
                return;
            }
            c->last_seq[f.sender_id] = f.seq;
            c->members.insert(f.sender_id);
            msg.channel_id = c->id;
            msg.sender_id  = f.sender_id;
            msg.seq        = f.seq;
            msg.text.assign(plain.begin(), plain.end());
            crypto::wipe(plain.data(), plain.size());
            delivered = true;
            break;
        }
    }
    if (!delivered) {
        LOG_DEBUG("Secure payload from " + utils::to_hex(f.sender_id) +
                  " matched no channel key; dropped");
        return;
    }
    if (cb_.on_message) cb_.on_message(msg);
}

// ============================================================
// Queries
// ============================================================

std::vector<ChannelInfo> SecureChannelEngine::channels() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<ChannelInfo> out;
    out.reserve(channels_.size());
    for (auto& kv : channels_) out.push_back(snapshot(kv.second));
    return out;
}

bool SecureChannelEngine::channel_info(u64 channel_id, ChannelInfo& out) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = channels_.find(channel_id);
    if (it == channels_.end()) return false;
    out = snapshot(it->second);
    return true;
}

std::string SecureChannelEngine::masked_pin(u64 channel_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = channels_.find(channel_id);
    if (it == channels_.end() || it->second.pin.empty()) return std::string();
    return mask_pin(it->second.pin);
}
