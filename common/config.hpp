#pragma once

// ============================================================
// config.hpp -- Runtime configuration for one LanLink node
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "utils.hpp"
#include <string>
#include <stdexcept>

struct LanConfig {
    std::string display_name       = "lanlink";

    // Network
    u16         discovery_port     = DEFAULT_DISCOVERY_PORT;
    u16         transfer_port      = DEFAULT_TRANSFER_PORT;  // 0 = ephemeral (tests)
    std::string transfer_bind_ip   = "0.0.0.0";
    std::string interface_name;     // empty = first active non-loopback IPv4
    std::string broadcast_addr;     // empty = interface broadcast address

    // Files
    std::string download_dir       = "downloads";
    std::string temp_dir;           // empty = <download_dir>/.lanlink-tmp
    u32         chunk_size         = DEFAULT_CHUNK_SIZE;
    bool        use_compress       = true;
    int         bundle_slots       = 2;

    // Timing (milliseconds)
    int         announce_interval_ms = 2000;
    int         peer_timeout_ms      = 30000;
    int         join_timeout_ms      = 3000;
    int         offer_timeout_ms     = 120000;
    int         progress_interval_ms = 150;
    int         connect_attempts     = 20;
    int         connect_retry_ms     = 100;
    int         stall_timeout_ms     = 30000;  // longest wait inside one frame

    // Secure channels
    int         pin_digits         = 8;
    int         kdf_iterations     = 100000;
    int         join_max_failures  = 3;
    int         join_lockout_ms    = 10000;

    std::string effective_temp_dir() const {
        if (!temp_dir.empty()) return temp_dir;
        return download_dir + "/.lanlink-tmp";
    }
};

// Throws std::invalid_argument naming the first bad field
inline void validate_config(const LanConfig& c) {
    auto fail = [](const std::string& what) {
        throw std::invalid_argument("Invalid configuration: " + what);
    };
    if (c.display_name.empty() || c.display_name.size() > 64) fail("display name must be 1-64 bytes");
    if (!utils::validate_port(c.discovery_port)) fail("discovery port");
    if (!c.transfer_bind_ip.empty() && !utils::validate_ip(c.transfer_bind_ip)) fail("transfer bind ip");
    if (!c.broadcast_addr.empty() && !utils::validate_ip(c.broadcast_addr)) fail("broadcast address");
    if (!utils::validate_path(c.download_dir)) fail("download dir");
    if (c.chunk_size < 4096 || c.chunk_size > LANLINK_MAX_PAYLOAD - 1024) fail("chunk size");
    if (c.bundle_slots < 1) fail("bundle slots must be >= 1");
    if (c.announce_interval_ms < 10) fail("announce interval");
    if (c.peer_timeout_ms <= c.announce_interval_ms) fail("peer timeout must exceed announce interval");
    if (c.join_timeout_ms < 10) fail("join timeout");
    if (c.offer_timeout_ms < 10) fail("offer timeout");
    if (c.progress_interval_ms < 0) fail("progress interval");
    if (c.connect_attempts < 1 || c.connect_retry_ms < 0) fail("connect retry");
    if (c.stall_timeout_ms < 10) fail("stall timeout");
    if (c.pin_digits < 4 || c.pin_digits > 16) fail("pin digits must be 4-16");
    if (c.kdf_iterations < 1) fail("kdf iterations");
    if (c.join_max_failures < 1 || c.join_lockout_ms < 0) fail("join lockout");
}
