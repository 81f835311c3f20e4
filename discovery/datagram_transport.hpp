#pragma once

// ============================================================
// datagram_transport.hpp -- Broadcast datagram seam
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "interface_provider.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;

    // (Re)open on `iface`, listening on `port`; broadcasts go to
    // `broadcast_ip:port`. Throws std::runtime_error on failure.
    virtual void open(const InterfaceInfo& iface, u16 port, const std::string& broadcast_ip) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    // Send one datagram to the broadcast target; throws on error
    virtual void broadcast(const std::vector<u8>& datagram) = 0;

    // Wait up to timeout_ms for one datagram. Returns false on timeout
    // or when the transport is closed.
    virtual bool receive(std::vector<u8>& out, std::string& from_ip, int timeout_ms) = 0;
};

// UDP with SO_BROADCAST. The socket is swapped atomically on reopen so a
// receiver blocked in poll keeps a valid descriptor until it returns.
class UdpBroadcastTransport : public DatagramTransport {
public:
    UdpBroadcastTransport() = default;
    ~UdpBroadcastTransport() override;

    void open(const InterfaceInfo& iface, u16 port, const std::string& broadcast_ip) override;
    void close() override;
    bool is_open() const override;
    void broadcast(const std::vector<u8>& datagram) override;
    bool receive(std::vector<u8>& out, std::string& from_ip, int timeout_ms) override;

private:
    std::shared_ptr<UdpSocket> socket() const;

    mutable std::mutex         mutex_;
    std::shared_ptr<UdpSocket> sock_;
    std::string                target_ip_;
    u16                        port_{0};
};
