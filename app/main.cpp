// ============================================================
// app/main.cpp -- LanLink console node
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/config.hpp"
#include "../session/session_coordinator.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

static std::atomic<bool> g_quit{false};

static void sig_handler(int /*sig*/) {
    g_quit = true;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "\nOptions:\n"
        << "  --name NAME        display name announced to peers (default: lanlink)\n"
        << "  --udp-port N       discovery / chat port (default: 3000)\n"
        << "  --tcp-port N       file transfer port (default: 3001, 0 = any)\n"
        << "  --iface NAME       use this network interface only\n"
        << "  --broadcast IP     send broadcasts to IP instead of the interface's\n"
        << "  --download-dir D   where received files go (default: ./downloads)\n"
        << "  --temp-dir D       partial downloads (default: <download-dir>/.lanlink-tmp)\n"
        << "  --chunk-kb N       transfer chunk size in KB (default: 256)\n"
        << "  --no-compress      disable chunk compression\n"
        << "  --peer-timeout N   seconds of silence before a peer is dropped (default: 30)\n"
        << "  --log-file PATH    also write the log to PATH\n"
        << "  --verbose          enable debug logging\n"
        << "  --quiet            no log output (chat and prompts still print)\n"
        << "\nType /help at the prompt for commands.\n";
}

static void print_help() {
    std::cout
        << "  /peers                      list peers on the LAN\n"
        << "  /say TEXT                   broadcast a chat message (plain text also works)\n"
        << "  /create [PIN]               open a secure channel, prints its PIN\n"
        << "  /join PIN                   join a secure channel\n"
        << "  /regen CHANNEL              new PIN for a channel you own\n"
        << "  /secure CHANNEL TEXT        encrypted message to a channel\n"
        << "  /close CHANNEL              close or leave a channel\n"
        << "  /channels                   list channels\n"
        << "  /offer PEER FILE [FILE...]  send files (PEER = number from /peers or node id)\n"
        << "  /accept JOB | /reject JOB   answer an incoming offer\n"
        << "  /cancel JOB                 cancel a transfer\n"
        << "  /jobs                       list active transfers\n"
        << "  /exit                       quit\n";
}

// ---- Console front end ----

class ConsoleSink : public UiSink {
public:
    void on_peers_changed(const std::vector<Peer>& peers) override {
        print("* " + std::to_string(peers.size()) + " peer(s) online");
    }

    void on_chat(const ChatMessageFrame& msg, const std::string& sender_name) override {
        print("<" + sender_name + "> " + msg.text);
    }

    void on_secure_chat(const SecureMessage& msg) override {
        print("[" + utils::to_hex(msg.channel_id) + "] <" + utils::to_hex(msg.sender_id) + "> " +
              msg.text);
    }

    void on_channel_event(const ChannelInfo& info) override {
        print("* channel " + utils::to_hex(info.channel_id) + " " + channel_state_name(info.state) +
              ", " + std::to_string(info.members.size()) + " member(s)");
    }

    void on_transfer_offer(const TransferJobInfo& job) override {
        std::string line = "* " + job.peer_name + " offers " + std::to_string(job.entries.size()) +
                           " file(s), " + utils::format_bytes(job.total_bytes) +
                           " -- /accept " + utils::to_hex(job.job_id);
        for (auto& e : job.entries) line += "\n    " + e.name + " (" + utils::format_bytes(e.size) + ")";
        print(line);
    }

    void on_progress(u64 job_id, u64 done, u64 total) override {
        print("  " + utils::to_hex(job_id) + " " + utils::format_percent(done, total) + " (" +
              utils::format_bytes(done) + " / " + utils::format_bytes(total) + ")");
    }

    void on_notification(const Notification& n) override {
        print("! " + n.kind + ": " + n.message);
    }

private:
    void print(const std::string& line) {
        std::lock_guard<std::mutex> lk(mutex_);
        std::cout << line << std::endl;
    }

    std::mutex mutex_;
};

static bool parse_id(const std::string& s, u64& out) {
    return !s.empty() && utils::parse_hex(s, out);
}

// Peer by 1-based position in /peers, or by node id
static bool resolve_peer(const SessionCoordinator& session, const std::string& ref, u64& out) {
    std::vector<Peer> peers = session.peers();
    char* end = nullptr;
    long idx = std::strtol(ref.c_str(), &end, 10);
    if (end && *end == '\0' && idx >= 1 && (size_t)idx <= peers.size()) {
        out = peers[(size_t)idx - 1].node_id;
        return true;
    }
    return parse_id(ref, out);
}

static void handle_command(SessionCoordinator& session, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    std::string rest;
    std::getline(in >> std::ws, rest);

    if (cmd == "/help") {
        print_help();
    } else if (cmd == "/peers") {
        auto peers = session.peers();
        if (peers.empty()) std::cout << "  (nobody yet)\n";
        for (size_t i = 0; i < peers.size(); ++i) {
            const Peer& p = peers[i];
            std::cout << "  " << (i + 1) << ". " << p.name << "  " << p.ip << ":" << p.transfer_port
                      << "  id " << utils::to_hex(p.node_id) << "\n";
        }
    } else if (cmd == "/say") {
        session.send_chat(rest);
    } else if (cmd == "/create") {
        auto created = rest.empty() ? session.create_channel() : session.create_channel(rest);
        std::cout << "  channel " << utils::to_hex(created.first) << "  PIN " << created.second << "\n";
    } else if (cmd == "/join") {
        JoinResult r = session.join_channel(rest);
        if (r.ok()) std::cout << "  joined channel " << utils::to_hex(r.channel_id) << "\n";
    } else if (cmd == "/regen") {
        u64 id;
        if (!parse_id(rest, id)) throw std::invalid_argument("usage: /regen CHANNEL");
        std::cout << "  new PIN " << session.regenerate_pin(id) << "\n";
    } else if (cmd == "/secure") {
        std::istringstream args(rest);
        std::string ref, text;
        args >> ref;
        std::getline(args >> std::ws, text);
        u64 id;
        if (!parse_id(ref, id) || text.empty()) throw std::invalid_argument("usage: /secure CHANNEL TEXT");
        session.send_secure(id, text);
    } else if (cmd == "/close") {
        u64 id;
        if (!parse_id(rest, id)) throw std::invalid_argument("usage: /close CHANNEL");
        session.close_channel(id);
    } else if (cmd == "/channels") {
        auto list = session.channels();
        if (list.empty()) std::cout << "  (none)\n";
        for (auto& c : list) {
            std::cout << "  " << utils::to_hex(c.channel_id) << "  " << channel_state_name(c.state)
                      << (c.owner ? "  owner  PIN " + c.masked_pin : "") << "  members "
                      << c.members.size() << "\n";
        }
    } else if (cmd == "/offer") {
        std::istringstream args(rest);
        std::string ref, path;
        std::vector<std::string> paths;
        args >> ref;
        while (args >> path) paths.push_back(path);
        u64 peer;
        if (paths.empty() || !resolve_peer(session, ref, peer)) {
            throw std::invalid_argument("usage: /offer PEER FILE [FILE...]");
        }
        std::cout << "  job " << utils::to_hex(session.offer_files(peer, paths)) << "\n";
    } else if (cmd == "/accept" || cmd == "/reject" || cmd == "/cancel") {
        u64 id;
        if (!parse_id(rest, id)) throw std::invalid_argument("usage: " + cmd + " JOB");
        bool ok = cmd == "/accept" ? session.accept_offer(id)
                : cmd == "/reject" ? session.reject_offer(id)
                                   : session.cancel_transfer(id);
        if (!ok) std::cout << "  no such pending job\n";
    } else if (cmd == "/jobs") {
        auto list = session.jobs();
        if (list.empty()) std::cout << "  (none)\n";
        for (auto& j : list) {
            std::cout << "  " << utils::to_hex(j.job_id) << "  "
                      << (j.direction == JobDirection::SEND ? "to " : "from ") << j.peer_name << "  "
                      << job_state_name(j.state) << "  "
                      << utils::format_percent(j.bytes_done, j.total_bytes) << "\n";
        }
    } else if (cmd == "/exit" || cmd == "/quit") {
        g_quit = true;
    } else if (!cmd.empty() && cmd[0] == '/') {
        std::cout << "  unknown command, try /help\n";
    } else {
        session.send_chat(line);
    }
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    LanConfig cfg;
    int udp_port = cfg.discovery_port;
    int tcp_port = cfg.transfer_port;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--name") == 0 && i + 1 < argc) {
            cfg.display_name = argv[++i];
        } else if (std::strcmp(argv[i], "--udp-port") == 0 && i + 1 < argc) {
            udp_port = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--tcp-port") == 0 && i + 1 < argc) {
            tcp_port = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--iface") == 0 && i + 1 < argc) {
            cfg.interface_name = argv[++i];
        } else if (std::strcmp(argv[i], "--broadcast") == 0 && i + 1 < argc) {
            cfg.broadcast_addr = argv[++i];
        } else if (std::strcmp(argv[i], "--download-dir") == 0 && i + 1 < argc) {
            cfg.download_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--temp-dir") == 0 && i + 1 < argc) {
            cfg.temp_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--chunk-kb") == 0 && i + 1 < argc) {
            cfg.chunk_size = (u32)std::atoi(argv[++i]) * 1024;
        } else if (std::strcmp(argv[i], "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(argv[i], "--peer-timeout") == 0 && i + 1 < argc) {
            cfg.peer_timeout_ms = std::atoi(argv[++i]) * 1000;
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            Logger::get().set_level(LogLevel::OFF);
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_port(udp_port)) {
        std::cerr << "ERROR: Invalid UDP port: " << udp_port << "\n";
        return 1;
    }
    if (tcp_port != 0 && !utils::validate_port(tcp_port)) {
        std::cerr << "ERROR: Invalid TCP port: " << tcp_port << "\n";
        return 1;
    }
    cfg.discovery_port = (u16)udp_port;
    cfg.transfer_port  = (u16)tcp_port;

    try {
        validate_config(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    try {
        SessionCoordinator session(cfg);
        session.add_sink(std::make_shared<ConsoleSink>());

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        session.start();
        std::cout << "LanLink node " << utils::to_hex(session.node_id()) << " as '" << cfg.display_name
                  << "', files on port " << session.transfer_port() << ". /help for commands.\n";

        std::string line;
        while (!g_quit) {
            int rc = platform::wait_readable(0, 200);
            if (rc < 0) break;
            if (rc == 0) continue;
            if (!std::getline(std::cin, line)) break;
            try {
                handle_command(session, line);
            } catch (const std::exception& e) {
                std::cout << "  error: " << e.what() << "\n";
            }
        }

        session.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
