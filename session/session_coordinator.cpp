// ============================================================
// session_coordinator.cpp -- Event routing and session tables
// ============================================================

#include "session_coordinator.hpp"
#include "../common/crypto.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>

// Dispatcher wake-up period; also the peer expiry cadence
static constexpr int DISPATCH_TICK_MS = 1000;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string notification_kind(const TransferJobInfo& job) {
    switch (job.state) {
        case JobState::COMPLETED: return "transfer.completed";
        case JobState::REJECTED:  return "transfer.rejected";
        case JobState::CANCELLED: return "transfer.cancelled";
        case JobState::FAILED:
            switch (job.error) {
                case TransferError::CHECKSUM_MISMATCH: return "transfer.failed.checksum_mismatch";
                case TransferError::DISK_ERROR:        return "transfer.failed.disk_error";
                default:                               return "transfer.failed.connection_lost";
            }
        default: break;
    }
    return "";
}

std::string notification_kind(JoinError err) {
    switch (err) {
        case JoinError::NO_MATCH:       return "channel.join.no_match";
        case JoinError::CHANNEL_CLOSED: return "channel.join.closed";
        case JoinError::LOCKED_OUT:     return "channel.join.locked_out";
        case JoinError::NONE:           break;
    }
    return "";
}

static std::unique_ptr<DatagramTransport> default_transport(std::unique_ptr<DatagramTransport> t) {
    if (t) return t;
    return std::make_unique<UdpBroadcastTransport>();
}

static std::shared_ptr<InterfaceProvider> default_interfaces(std::shared_ptr<InterfaceProvider> p,
                                                             const LanConfig& cfg) {
    if (p) return p;
    return std::make_shared<SystemInterfaceProvider>(cfg.interface_name);
}

// ============================================================
// Construction / lifecycle
// ============================================================

SessionCoordinator::SessionCoordinator(const LanConfig& cfg,
                                       std::unique_ptr<DatagramTransport> transport,
                                       std::shared_ptr<InterfaceProvider> interfaces)
    : cfg_(cfg)
    , node_id_(crypto::random_id())
    , broadcast_(cfg, node_id_, default_transport(std::move(transport)),
                 default_interfaces(std::move(interfaces), cfg))
    , channel_(cfg, node_id_)
    , transfer_(cfg, node_id_)
{
    namespace ev = session_event;

    BroadcastCallbacks bcb;
    bcb.on_discovery = [this](const DiscoveryFrame& f, const std::string& ip, u8 version) {
        post(ev::PeerSeen{f, ip, version});
    };
    bcb.on_chat = [this](const ChatMessageFrame& f) {
        post(ev::ChatReceived{f});
    };
    // Channel frames go straight to the channel engine; a blocked
    // join_channel() is waiting on exactly these
    bcb.on_channel_frame = [this](const Frame& f, const std::string&) {
        channel_.on_frame(f);
    };
    bcb.on_network_changed = [this](const InterfaceInfo& prev, const InterfaceInfo& cur, bool up) {
        post(ev::NetworkChanged{prev, cur, up});
    };
    broadcast_.set_callbacks(std::move(bcb));

    ChannelCallbacks ccb;
    ccb.send_frame = [this](const Frame& f) {
        return broadcast_.broadcast_frame(f);
    };
    ccb.on_message = [this](const SecureMessage& m) {
        post(ev::SecureReceived{m});
    };
    ccb.on_channel_changed = [this](const ChannelInfo& info) {
        post(ev::ChannelChanged{info});
    };
    channel_.set_callbacks(std::move(ccb));

    TransferCallbacks tcb;
    tcb.on_incoming_offer = [this](const TransferJobInfo& job) {
        post(ev::OfferReceived{job});
    };
    tcb.on_progress = [this](u64 id, u64 done, u64 total) {
        post(ev::JobProgress{id, done, total});
    };
    tcb.on_state_changed = [this](const TransferJobInfo& job) {
        post(ev::JobChanged{job});
    };
    transfer_.set_callbacks(std::move(tcb));
}

SessionCoordinator::~SessionCoordinator() {
    stop();
}

void SessionCoordinator::start() {
    if (running_) return;
    LOG_INFO("Starting session, node " + utils::to_hex(node_id_) + " (" + cfg_.display_name + ")");

    queue_.reset();
    running_ = true;
    last_expiry_ms_ = utils::steady_ms();
    dispatcher_ = std::thread([this] { dispatcher_loop(); });

    try {
        transfer_.start();
        broadcast_.set_transfer_port(transfer_.listen_port());
        broadcast_.start();
    } catch (...) {
        stop();
        throw;
    }
}

void SessionCoordinator::stop() {
    if (!running_.exchange(false)) return;
    LOG_INFO("Stopping session");

    // Owners announce their channel closes while the transport is still up
    channel_.shutdown();
    broadcast_.stop();
    transfer_.stop();

    queue_.close();
    if (dispatcher_.joinable()) dispatcher_.join();

    std::lock_guard<std::mutex> lk(tables_mutex_);
    peers_.clear();
    peer_heard_ms_.clear();
    channels_.clear();
    jobs_.clear();
}

void SessionCoordinator::add_sink(std::shared_ptr<UiSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

std::vector<std::shared_ptr<UiSink>> SessionCoordinator::sinks() const {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    return sinks_;
}

void SessionCoordinator::post(SessionEvent ev) {
    if (!queue_.push(std::move(ev))) {
        LOG_DEBUG("Session stopped, event dropped");
    }
}

// ============================================================
// Dispatcher
// ============================================================

void SessionCoordinator::dispatcher_loop() {
    while (true) {
        SessionEvent ev;
        bool got = queue_.pop_for(ev, DISPATCH_TICK_MS);
        if (got) {
            try {
                dispatch(ev);
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Event handling failed: ") + e.what());
            }
        } else if (queue_.closed()) {
            break;
        }

        u64 now = utils::steady_ms();
        if (now - last_expiry_ms_ >= (u64)DISPATCH_TICK_MS) {
            last_expiry_ms_ = now;
            expire_peers();
        }
    }
}

void SessionCoordinator::dispatch(const SessionEvent& ev) {
    namespace e = session_event;

    std::visit(overloaded{
        [&](const e::PeerSeen& p) {
            bool changed;
            {
                std::lock_guard<std::mutex> lk(tables_mutex_);
                bool is_new = peers_.find(p.frame.node_id) == peers_.end();
                Peer& peer = peers_[p.frame.node_id];
                changed = is_new || peer.ip != p.ip || peer.name != p.frame.display_name ||
                          peer.transfer_port != p.frame.transfer_port;
                peer.node_id          = p.frame.node_id;
                peer.ip               = p.ip;
                peer.discovery_port   = p.frame.discovery_port;
                peer.transfer_port    = p.frame.transfer_port;
                peer.name             = p.frame.display_name;
                peer.last_seen_ms     = utils::now_ms();
                peer.protocol_version = p.version;
                peer_heard_ms_[p.frame.node_id] = utils::steady_ms();
            }
            if (changed) {
                LOG_INFO("Peer " + p.frame.display_name + " at " + p.ip);
                publish_peers();
            }
        },
        [&](const e::ChatReceived& c) {
            std::string name;
            {
                std::lock_guard<std::mutex> lk(tables_mutex_);
                auto it = peers_.find(c.msg.sender_id);
                name = it != peers_.end() ? it->second.name : utils::to_hex(c.msg.sender_id);
            }
            for (auto& s : sinks()) s->on_chat(c.msg, name);
        },
        [&](const e::SecureReceived& m) {
            for (auto& s : sinks()) s->on_secure_chat(m.msg);
        },
        [&](const e::ChannelChanged& c) {
            {
                std::lock_guard<std::mutex> lk(tables_mutex_);
                if (c.info.state == ChannelState::CLOSED) {
                    channels_.erase(c.info.channel_id);
                } else {
                    channels_[c.info.channel_id] = c.info;
                }
            }
            for (auto& s : sinks()) s->on_channel_event(c.info);
        },
        [&](const e::JoinFailed& j) {
            notify(notification_kind(j.error),
                   std::string("Join failed: ") + join_error_name(j.error), 0);
        },
        [&](const e::OfferReceived& o) {
            {
                std::lock_guard<std::mutex> lk(tables_mutex_);
                jobs_[o.job.job_id] = o.job;
            }
            for (auto& s : sinks()) s->on_transfer_offer(o.job);
        },
        [&](const e::JobProgress& p) {
            {
                std::lock_guard<std::mutex> lk(tables_mutex_);
                auto it = jobs_.find(p.job_id);
                if (it != jobs_.end()) it->second.bytes_done = p.done;
            }
            for (auto& s : sinks()) s->on_progress(p.job_id, p.done, p.total);
        },
        [&](const e::JobChanged& j) {
            bool terminal = is_terminal(j.job.state);
            {
                std::lock_guard<std::mutex> lk(tables_mutex_);
                if (terminal) {
                    jobs_.erase(j.job.job_id);
                } else {
                    jobs_[j.job.job_id] = j.job;
                }
            }
            for (auto& s : sinks()) s->on_job_changed(j.job);
            if (terminal) {
                std::string msg = "Transfer " + utils::to_hex(j.job.job_id) + " " +
                                  job_state_name(j.job.state);
                if (j.job.state == JobState::FAILED) {
                    msg += std::string(" (") + transfer_error_name(j.job.error) + ")";
                }
                notify(notification_kind(j.job), msg, j.job.job_id);
            }
        },
        [&](const e::NetworkChanged& n) {
            std::string msg = n.up
                ? "Network now on " + n.current.name + " (" + n.current.address + ")"
                : "Network interface " + n.previous.name + " went away";
            notify("network.changed", msg, 0);
        },
    }, ev);
}

void SessionCoordinator::expire_peers() {
    u64 now = utils::steady_ms();
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(tables_mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (now - peer_heard_ms_[it->first] > (u64)cfg_.peer_timeout_ms) {
                LOG_INFO("Peer " + it->second.name + " (" + it->second.ip + ") timed out");
                peer_heard_ms_.erase(it->first);
                it = peers_.erase(it);
                changed = true;
            } else {
                ++it;
            }
        }
    }
    if (changed) publish_peers();
}

void SessionCoordinator::publish_peers() {
    std::vector<Peer> list = peers();
    for (auto& s : sinks()) s->on_peers_changed(list);
}

void SessionCoordinator::notify(const std::string& kind, const std::string& message, u64 ref_id) {
    Notification n{kind, message, ref_id};
    for (auto& s : sinks()) s->on_notification(n);
}

// ============================================================
// Queries
// ============================================================

std::vector<Peer> SessionCoordinator::peers() const {
    std::vector<Peer> out;
    {
        std::lock_guard<std::mutex> lk(tables_mutex_);
        out.reserve(peers_.size());
        for (auto& kv : peers_) out.push_back(kv.second);
    }
    std::stable_sort(out.begin(), out.end(), [](const Peer& a, const Peer& b) {
        return a.last_seen_ms > b.last_seen_ms;
    });
    return out;
}

std::vector<ChannelInfo> SessionCoordinator::channels() const {
    std::lock_guard<std::mutex> lk(tables_mutex_);
    std::vector<ChannelInfo> out;
    for (auto& kv : channels_) out.push_back(kv.second);
    return out;
}

std::vector<TransferJobInfo> SessionCoordinator::jobs() const {
    std::lock_guard<std::mutex> lk(tables_mutex_);
    std::vector<TransferJobInfo> out;
    for (auto& kv : jobs_) out.push_back(kv.second);
    return out;
}

// ============================================================
// Commands
// ============================================================

u64 SessionCoordinator::send_chat(const std::string& text) {
    return broadcast_.send(text);
}

std::pair<u64, std::string> SessionCoordinator::create_channel() {
    return channel_.create_channel();
}

std::pair<u64, std::string> SessionCoordinator::create_channel(const std::string& pin) {
    return channel_.create_channel(pin);
}

JoinResult SessionCoordinator::join_channel(const std::string& pin) {
    JoinResult r = channel_.join_channel(pin);
    if (!r.ok()) post(session_event::JoinFailed{r.error});
    return r;
}

std::string SessionCoordinator::regenerate_pin(u64 channel_id) {
    return channel_.regenerate_pin(channel_id);
}

u64 SessionCoordinator::send_secure(u64 channel_id, const std::string& text) {
    return channel_.send(channel_id, text);
}

void SessionCoordinator::close_channel(u64 channel_id) {
    channel_.close_channel(channel_id);
}

u64 SessionCoordinator::offer_files(u64 peer_id, const std::vector<std::string>& paths) {
    Peer peer;
    {
        std::lock_guard<std::mutex> lk(tables_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            throw std::invalid_argument("Unknown peer " + utils::to_hex(peer_id));
        }
        peer = it->second;
    }
    if (peer.transfer_port == 0) {
        throw std::invalid_argument("Peer " + peer.name + " accepts no transfers");
    }
    return transfer_.offer(peer.ip, peer.transfer_port, paths, peer.node_id, peer.name);
}

bool SessionCoordinator::accept_offer(u64 job_id) {
    return transfer_.accept(job_id);
}

bool SessionCoordinator::reject_offer(u64 job_id) {
    return transfer_.reject(job_id);
}

bool SessionCoordinator::cancel_transfer(u64 job_id) {
    return transfer_.cancel(job_id);
}
