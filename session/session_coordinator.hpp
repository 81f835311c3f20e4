#pragma once

// ============================================================
// session_coordinator.hpp -- Single entry point of a LanLink node
//
// Owns the three engines and the peer / channel / job tables.
// Engines post events to one queue; a single dispatcher thread
// applies them to the tables and fans them out to the sinks.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/event_queue.hpp"
#include "../discovery/broadcast_engine.hpp"
#include "../channel/secure_channel.hpp"
#include "../transfer/transfer_engine.hpp"
#include "ui_sink.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace session_event {

struct PeerSeen {
    DiscoveryFrame frame;
    std::string    ip;
    u8             version;
};
struct ChatReceived {
    ChatMessageFrame msg;
};
struct SecureReceived {
    SecureMessage msg;
};
struct ChannelChanged {
    ChannelInfo info;
};
struct JoinFailed {
    JoinError error;
};
struct OfferReceived {
    TransferJobInfo job;
};
struct JobProgress {
    u64 job_id;
    u64 done;
    u64 total;
};
struct JobChanged {
    TransferJobInfo job;
};
struct NetworkChanged {
    InterfaceInfo previous;
    InterfaceInfo current;
    bool          up;
};

} // namespace session_event

using SessionEvent = std::variant<
    session_event::PeerSeen,
    session_event::ChatReceived,
    session_event::SecureReceived,
    session_event::ChannelChanged,
    session_event::JoinFailed,
    session_event::OfferReceived,
    session_event::JobProgress,
    session_event::JobChanged,
    session_event::NetworkChanged>;

// Stable notification kind for a terminal job, e.g. "transfer.rejected"
std::string notification_kind(const TransferJobInfo& job);
std::string notification_kind(JoinError err);

class SessionCoordinator {
public:
    // Null transport / interfaces select UDP broadcast on the system's
    // active interface (pinned by cfg.interface_name).
    explicit SessionCoordinator(const LanConfig& cfg,
                                std::unique_ptr<DatagramTransport> transport = nullptr,
                                std::shared_ptr<InterfaceProvider> interfaces = nullptr);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    void start();
    void stop();

    // Sinks registered before start() see every event
    void add_sink(std::shared_ptr<UiSink> sink);

    u64 node_id() const { return node_id_; }
    u16 transfer_port() const { return transfer_.listen_port(); }

    // Most recently seen first
    std::vector<Peer> peers() const;
    std::vector<ChannelInfo> channels() const;
    std::vector<TransferJobInfo> jobs() const;

    // ---- Broadcast chat ----
    u64 send_chat(const std::string& text);

    // ---- Secure channels ----
    std::pair<u64, std::string> create_channel();
    std::pair<u64, std::string> create_channel(const std::string& pin);
    JoinResult join_channel(const std::string& pin);
    std::string regenerate_pin(u64 channel_id);
    u64 send_secure(u64 channel_id, const std::string& text);
    void close_channel(u64 channel_id);

    // ---- File transfer ----
    // Throws std::invalid_argument for an unknown peer or bad paths
    u64 offer_files(u64 peer_id, const std::vector<std::string>& paths);
    bool accept_offer(u64 job_id);
    bool reject_offer(u64 job_id);
    bool cancel_transfer(u64 job_id);

private:
    // Apply one event to the tables and fan it out (dispatcher thread)
    void dispatch(const SessionEvent& ev);
    void dispatcher_loop();
    void expire_peers();
    void post(SessionEvent ev);

    std::vector<std::shared_ptr<UiSink>> sinks() const;
    void notify(const std::string& kind, const std::string& message, u64 ref_id);
    void publish_peers();

    LanConfig cfg_;
    u64       node_id_;

    BroadcastEngine     broadcast_;
    SecureChannelEngine channel_;
    TransferEngine      transfer_;

    EventQueue<SessionEvent> queue_;
    std::atomic<bool>        running_{false};
    std::thread              dispatcher_;
    u64                      last_expiry_ms_{0};

    mutable std::mutex                  tables_mutex_;
    std::map<u64, Peer>                 peers_;
    std::map<u64, u64>                  peer_heard_ms_;  // steady clock, drives expiry
    std::map<u64, ChannelInfo>          channels_;
    std::map<u64, TransferJobInfo>      jobs_;

    mutable std::mutex                   sinks_mutex_;
    std::vector<std::shared_ptr<UiSink>> sinks_;
};
