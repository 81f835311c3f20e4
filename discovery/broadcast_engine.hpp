#pragma once

// ============================================================
// broadcast_engine.hpp -- Presence announcements and plaintext chat
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/config.hpp"
#include "../common/sequence_tracker.hpp"
#include "datagram_transport.hpp"
#include "interface_provider.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct BroadcastCallbacks {
    // `version` is the protocol version from the frame header
    std::function<void(const DiscoveryFrame&, const std::string& from_ip,
                       u8 version)>                                        on_discovery;
    std::function<void(const ChatMessageFrame&)>                           on_chat;
    // ChannelHandshake / ChannelPayload frames from other nodes
    std::function<void(const Frame&, const std::string& from_ip)>          on_channel_frame;
    // Active interface changed; `now_up` is false when none is left
    std::function<void(const InterfaceInfo& previous, const InterfaceInfo& current,
                       bool now_up)>                                       on_network_changed;
};

class BroadcastEngine {
public:
    BroadcastEngine(const LanConfig& cfg, u64 node_id,
                    std::unique_ptr<DatagramTransport> transport,
                    std::shared_ptr<InterfaceProvider> interfaces);
    ~BroadcastEngine();

    BroadcastEngine(const BroadcastEngine&) = delete;
    BroadcastEngine& operator=(const BroadcastEngine&) = delete;

    // Must be called before start()
    void set_callbacks(BroadcastCallbacks cb);

    // Opens the transport on the active interface (if any) and starts the
    // receive and announce workers.
    void start();
    void stop();

    // Broadcast one Discovery frame now
    void announce();

    // Broadcast a chat message; returns its sequence number. Throws
    // std::invalid_argument if the datagram would exceed the limit.
    u64 send(const std::string& text);

    // Encode and broadcast. Throws std::invalid_argument for oversized
    // frames; returns false when no interface is available.
    bool broadcast_frame(const Frame& frame);

    // Entry point for every received datagram
    void on_receive(const u8* data, size_t len, const std::string& from_ip);

    // Poll the interface provider; reopens the transport and announces
    // when the active interface changed. Returns true on change.
    bool check_interface();

    // Advertised TCP port (after the transfer listener picked one)
    void set_transfer_port(u16 port) { transfer_port_ = port; }

    bool has_interface() const;
    InterfaceInfo current_interface() const;
    u64 node_id() const { return node_id_; }

private:
    void receive_loop();
    void announce_loop();

    LanConfig                          cfg_;
    u64                                node_id_;
    std::unique_ptr<DatagramTransport> transport_;
    std::shared_ptr<InterfaceProvider> interfaces_;
    BroadcastCallbacks                 cb_;

    std::atomic<u16>  transfer_port_;
    std::atomic<bool> running_{false};

    mutable std::mutex iface_mutex_;
    InterfaceInfo      iface_;
    bool               iface_up_{false};

    std::mutex send_mutex_;
    u64        next_seq_{0};

    SequenceTracker chat_seen_;

    std::mutex              wake_mutex_;
    std::condition_variable wake_cv_;

    std::thread receive_thread_;
    std::thread announce_thread_;
};
