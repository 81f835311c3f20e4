// ============================================================
// broadcast_engine.cpp -- Discovery / chat over UDP broadcast
// ============================================================

#include "broadcast_engine.hpp"
#include "../common/codec.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <stdexcept>

static constexpr int RECV_POLL_MS   = 200;
static constexpr int IDLE_SLEEP_MS  = 100;

BroadcastEngine::BroadcastEngine(const LanConfig& cfg, u64 node_id,
                                 std::unique_ptr<DatagramTransport> transport,
                                 std::shared_ptr<InterfaceProvider> interfaces)
    : cfg_(cfg)
    , node_id_(node_id)
    , transport_(std::move(transport))
    , interfaces_(std::move(interfaces))
    , transfer_port_(cfg.transfer_port)
{
    if (!transport_ || !interfaces_) {
        throw std::invalid_argument("BroadcastEngine needs a transport and an interface provider");
    }
}

BroadcastEngine::~BroadcastEngine() {
    stop();
}

void BroadcastEngine::set_callbacks(BroadcastCallbacks cb) {
    cb_ = std::move(cb);
}

void BroadcastEngine::start() {
    if (running_.exchange(true)) return;

    check_interface();
    if (!has_interface()) {
        LOG_WARN("No active network interface; broadcasting paused until one appears");
    }

    receive_thread_  = std::thread([this] { receive_loop(); });
    announce_thread_ = std::thread([this] { announce_loop(); });
}

void BroadcastEngine::stop() {
    {
        std::lock_guard<std::mutex> lk(wake_mutex_);
        if (!running_.exchange(false)) return;
    }
    wake_cv_.notify_all();
    if (receive_thread_.joinable())  receive_thread_.join();
    if (announce_thread_.joinable()) announce_thread_.join();
    transport_->close();
    {
        std::lock_guard<std::mutex> lk(iface_mutex_);
        iface_    = InterfaceInfo{};
        iface_up_ = false;
    }
    chat_seen_.clear();
}

bool BroadcastEngine::has_interface() const {
    std::lock_guard<std::mutex> lk(iface_mutex_);
    return iface_up_;
}

InterfaceInfo BroadcastEngine::current_interface() const {
    std::lock_guard<std::mutex> lk(iface_mutex_);
    return iface_;
}

// ---- Sending ----

bool BroadcastEngine::broadcast_frame(const Frame& frame) {
    std::vector<u8> bytes = codec::encode(frame);
    if (bytes.size() > LANLINK_MAX_DATAGRAM) {
        throw std::invalid_argument("Datagram too large: " + std::to_string(bytes.size()) +
                                    " > " + std::to_string(LANLINK_MAX_DATAGRAM) + " bytes");
    }
    if (!has_interface() || !transport_->is_open()) {
        LOG_DEBUG(std::string("No interface, dropping ") +
                  frame_type_name(codec::type_of(frame)));
        return false;
    }
    try {
        transport_->broadcast(bytes);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Broadcast failed: ") + e.what());
        return false;
    }
    return true;
}

void BroadcastEngine::announce() {
    DiscoveryFrame f;
    f.node_id        = node_id_;
    f.discovery_port = cfg_.discovery_port;
    f.transfer_port  = transfer_port_.load();
    f.display_name   = cfg_.display_name;
    broadcast_frame(f);
}

u64 BroadcastEngine::send(const std::string& text) {
    std::lock_guard<std::mutex> lk(send_mutex_);

    ChatMessageFrame f;
    f.sender_id    = node_id_;
    f.seq          = next_seq_ + 1;
    f.timestamp_ms = utils::now_ms();
    f.text         = text;

    // broadcast_frame() throws on oversize before touching the sequence
    if (!broadcast_frame(f)) {
        LOG_WARN("Chat message #" + std::to_string(f.seq) + " not sent: no interface");
    }
    next_seq_ = f.seq;
    return f.seq;
}

// ---- Receiving ----

void BroadcastEngine::on_receive(const u8* data, size_t len, const std::string& from_ip) {
    Frame frame;
    if (!codec::try_decode(data, len, frame)) return;

    if (auto* d = std::get_if<DiscoveryFrame>(&frame)) {
        if (d->node_id == node_id_) return;
        if (cb_.on_discovery) cb_.on_discovery(*d, from_ip, proto::decode_header(data).version);
    } else if (auto* c = std::get_if<ChatMessageFrame>(&frame)) {
        if (c->sender_id == node_id_) return;
        if (!chat_seen_.accept(c->sender_id, c->seq)) {
            LOG_DEBUG("Dropping duplicate chat #" + std::to_string(c->seq) +
                      " from " + utils::to_hex(c->sender_id));
            return;
        }
        if (cb_.on_chat) cb_.on_chat(*c);
    } else if (auto* h = std::get_if<ChannelHandshakeFrame>(&frame)) {
        if (h->sender_id == node_id_) return;
        if (cb_.on_channel_frame) cb_.on_channel_frame(frame, from_ip);
    } else if (auto* p = std::get_if<ChannelPayloadFrame>(&frame)) {
        if (p->sender_id == node_id_) return;
        if (cb_.on_channel_frame) cb_.on_channel_frame(frame, from_ip);
    } else {
        LOG_DEBUG(std::string("Ignoring ") + frame_type_name(codec::type_of(frame)) +
                  " datagram from " + from_ip);
    }
}

void BroadcastEngine::receive_loop() {
    std::vector<u8> buf;
    std::string from_ip;
    while (running_) {
        if (!transport_->is_open()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(IDLE_SLEEP_MS));
            continue;
        }
        try {
            if (transport_->receive(buf, from_ip, RECV_POLL_MS)) {
                on_receive(buf.data(), buf.size(), from_ip);
            }
        } catch (const std::exception& e) {
            LOG_WARN(std::string("UDP receive error: ") + e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(IDLE_SLEEP_MS));
        }
    }
}

// ---- Interface watch ----

bool BroadcastEngine::check_interface() {
    InterfaceInfo now;
    bool up = interfaces_->active(now);

    InterfaceInfo previous;
    bool was_up;
    {
        std::lock_guard<std::mutex> lk(iface_mutex_);
        previous = iface_;
        was_up   = iface_up_;
    }

    if (!up) {
        if (!was_up) return false;
        LOG_WARN("Interface " + previous.name + " (" + previous.address +
                 ") went away; broadcasting paused");
        transport_->close();
        {
            std::lock_guard<std::mutex> lk(iface_mutex_);
            iface_up_ = false;
        }
        if (cb_.on_network_changed) cb_.on_network_changed(previous, InterfaceInfo{}, false);
        return true;
    }

    if (was_up && now == previous) return false;

    try {
        transport_->open(now, cfg_.discovery_port, cfg_.broadcast_addr);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Cannot open broadcast transport: ") + e.what());
        transport_->close();
        std::lock_guard<std::mutex> lk(iface_mutex_);
        iface_up_ = false;
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(iface_mutex_);
        iface_    = now;
        iface_up_ = true;
    }

    // Only a switch counts as a change; the first interface is plain startup
    bool changed = was_up || !previous.address.empty();
    if (changed) {
        LOG_INFO("Network changed: " + previous.address + " -> " + now.address);
        if (cb_.on_network_changed) cb_.on_network_changed(previous, now, true);
    }
    announce();
    return changed;
}

void BroadcastEngine::announce_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lk(wake_mutex_);
            wake_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.announce_interval_ms),
                              [this] { return !running_; });
        }
        if (!running_) break;

        try {
            // check_interface() announces by itself after a change
            if (!check_interface() && has_interface()) {
                announce();
            }
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Announce failed: ") + e.what());
        }
    }
}
