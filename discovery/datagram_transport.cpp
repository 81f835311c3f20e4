// ============================================================
// datagram_transport.cpp -- UdpBroadcastTransport
// ============================================================

#include "datagram_transport.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"

UdpBroadcastTransport::~UdpBroadcastTransport() {
    close();
}

void UdpBroadcastTransport::open(const InterfaceInfo& iface, u16 port,
                                 const std::string& broadcast_ip) {
    // Bind the wildcard address: a socket bound to a unicast address
    // does not see broadcasts on Linux.
    auto s = std::make_shared<UdpSocket>();
    s->open("0.0.0.0", port);

    std::lock_guard<std::mutex> lk(mutex_);
    sock_      = std::move(s);
    target_ip_ = broadcast_ip.empty() ? iface.broadcast : broadcast_ip;
    port_      = port;
    LOG_INFO("UDP broadcast on " + iface.name + " (" + iface.address + ") -> " +
             target_ip_ + ":" + std::to_string(port_));
}

void UdpBroadcastTransport::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    sock_.reset();
}

bool UdpBroadcastTransport::is_open() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sock_ != nullptr;
}

std::shared_ptr<UdpSocket> UdpBroadcastTransport::socket() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sock_;
}

void UdpBroadcastTransport::broadcast(const std::vector<u8>& datagram) {
    std::shared_ptr<UdpSocket> s;
    std::string target;
    u16 port;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        s      = sock_;
        target = target_ip_;
        port   = port_;
    }
    if (!s) throw std::runtime_error("UDP transport not open");
    s->send_to(target, port, datagram.data(), datagram.size());
}

bool UdpBroadcastTransport::receive(std::vector<u8>& out, std::string& from_ip, int timeout_ms) {
    auto s = socket();
    if (!s) return false;
    u8 buf[LANLINK_MAX_DATAGRAM + 64];
    int n = s->recv_from(buf, sizeof(buf), timeout_ms, from_ip);
    if (n <= 0) return false;
    out.assign(buf, buf + n);
    return true;
}
