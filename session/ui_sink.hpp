#pragma once

// ============================================================
// ui_sink.hpp -- What the session reports to its front ends
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../channel/secure_channel.hpp"
#include "../transfer/transfer_engine.hpp"
#include <string>
#include <vector>

struct Peer {
    u64         node_id{0};
    std::string ip;
    u16         discovery_port{0};
    u16         transfer_port{0};
    std::string name;
    u64         last_seen_ms{0};
    u8          protocol_version{0};
};

// One per terminal job outcome, failed join or network change.
// `kind` is stable, e.g. "transfer.failed.checksum_mismatch".
struct Notification {
    std::string kind;
    std::string message;
    u64         ref_id{0};   // job or channel id when there is one
};

// All callbacks run on the coordinator's dispatcher thread.
// Defaults do nothing, so a sink overrides only what it shows.
class UiSink {
public:
    virtual ~UiSink() = default;

    virtual void on_peers_changed(const std::vector<Peer>&) {}
    virtual void on_chat(const ChatMessageFrame&, const std::string& /*sender_name*/) {}
    virtual void on_secure_chat(const SecureMessage&) {}
    virtual void on_channel_event(const ChannelInfo&) {}
    virtual void on_transfer_offer(const TransferJobInfo&) {}
    virtual void on_progress(u64 /*job_id*/, u64 /*done*/, u64 /*total*/) {}
    virtual void on_job_changed(const TransferJobInfo&) {}
    virtual void on_notification(const Notification&) {}
};
