#pragma once

// ============================================================
// test_support.hpp -- In-process network and scratch dirs for tests
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/utils.hpp"
#include "../discovery/datagram_transport.hpp"
#include "../discovery/interface_provider.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace testing_support {

namespace fs = std::filesystem;

// ---- Broadcast domain shared by every HubTransport attached to it ----

class HubTransport;

class DatagramHub {
public:
    void attach(HubTransport* ep) {
        std::lock_guard<std::mutex> lk(mutex_);
        endpoints_.insert(ep);
    }

    void detach(HubTransport* ep) {
        std::lock_guard<std::mutex> lk(mutex_);
        endpoints_.erase(ep);
    }

    // Every datagram reaches each endpoint this many times
    void set_copies(int n) { copies_ = n; }

    // Datagrams are silently lost while this is set
    void set_dropping(bool on) { dropping_ = on; }

    inline void deliver(const std::vector<u8>& datagram, const std::string& from_ip);

private:
    std::mutex              mutex_;
    std::set<HubTransport*> endpoints_;
    std::atomic<int>        copies_{1};
    std::atomic<bool>       dropping_{false};
};

// DatagramTransport whose broadcasts land in the receive queue of every
// open endpoint on the same hub, the sender included (like real UDP
// broadcast with loopback). Delivery is always asynchronous.
class HubTransport : public DatagramTransport {
public:
    HubTransport(std::shared_ptr<DatagramHub> hub, std::string ip)
        : hub_(std::move(hub)), ip_(std::move(ip)) {}

    ~HubTransport() override { close(); }

    void open(const InterfaceInfo&, u16, const std::string&) override {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            open_ = true;
            queue_.clear();
        }
        hub_->attach(this);
    }

    void close() override {
        hub_->detach(this);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            open_ = false;
            queue_.clear();
        }
        cv_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lk(mutex_);
        return open_;
    }

    void broadcast(const std::vector<u8>& datagram) override {
        if (!is_open()) throw std::runtime_error("hub transport closed");
        hub_->deliver(datagram, ip_);
    }

    bool receive(std::vector<u8>& out, std::string& from_ip, int timeout_ms) override {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                     [this] { return !open_ || !queue_.empty(); });
        if (!open_ || queue_.empty()) return false;
        out     = std::move(queue_.front().first);
        from_ip = queue_.front().second;
        queue_.pop_front();
        return true;
    }

    void enqueue(const std::vector<u8>& datagram, const std::string& from_ip) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (!open_) return;
            queue_.emplace_back(datagram, from_ip);
        }
        cv_.notify_one();
    }

private:
    std::shared_ptr<DatagramHub> hub_;
    std::string                  ip_;

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    bool                    open_{false};
    std::deque<std::pair<std::vector<u8>, std::string>> queue_;
};

inline void DatagramHub::deliver(const std::vector<u8>& datagram, const std::string& from_ip) {
    if (dropping_) return;
    std::lock_guard<std::mutex> lk(mutex_);
    for (int i = 0; i < copies_; ++i) {
        for (HubTransport* ep : endpoints_) ep->enqueue(datagram, from_ip);
    }
}

inline InterfaceInfo loopback_iface() {
    InterfaceInfo info;
    info.name      = "hub0";
    info.address   = "127.0.0.1";
    info.broadcast = "127.255.255.255";
    return info;
}

// ---- Files ----

class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("lanlink-test-" + utils::to_hex(crypto::random_u64()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str(const std::string& child = "") const {
        return child.empty() ? path_.string() : (path_ / child).string();
    }

private:
    fs::path path_;
};

// Deterministic pseudo-random content (poorly compressible)
inline std::vector<u8> make_bytes(size_t size, u32 seed) {
    std::vector<u8> out(size);
    u32 x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = (u8)x;
    }
    return out;
}

inline void write_file(const fs::path& path, const std::vector<u8>& data) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
}

inline std::vector<u8> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<u8>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline size_t count_files(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return 0;
    size_t n = 0;
    for (auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

// ---- Timing ----

inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 5000) {
    u64 deadline = utils::steady_ms() + (u64)timeout_ms;
    while (utils::steady_ms() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Short timeouts and a cheap KDF so the suite runs in seconds
inline LanConfig test_config(const TempDir& dir, const std::string& name) {
    LanConfig cfg;
    cfg.display_name         = name;
    cfg.transfer_port        = 0;
    cfg.transfer_bind_ip     = "127.0.0.1";
    cfg.download_dir         = dir.str(name + "-downloads");
    cfg.temp_dir             = dir.str(name + "-tmp");
    cfg.chunk_size           = 64 * 1024;
    cfg.announce_interval_ms = 100;
    cfg.peer_timeout_ms      = 1500;
    cfg.join_timeout_ms      = 1500;
    cfg.offer_timeout_ms     = 5000;
    cfg.stall_timeout_ms     = 2000;
    cfg.progress_interval_ms = 0;
    cfg.kdf_iterations       = 1000;
    cfg.join_lockout_ms      = 1000;
    return cfg;
}

} // namespace testing_support
