#pragma once

// ============================================================
// socket.hpp -- RAII TCP / UDP socket wrappers
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen (port 0 picks an ephemeral port, see local_port())
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 64);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Send a complete encoded frame (header + payload in one writev)
    void write_frame(const Frame& frame);

    // Read next frame. Returns false on clean close (peer disconnected).
    // Throws MalformedFrame on a bad header or payload.
    bool read_frame(Frame& out);

    // Poll for readability: 1 readable, 0 timeout, -1 error
    int wait_readable(int timeout_ms) const;

    // Apply TCP performance tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Half-close: the peer reads EOF once everything already queued arrives
    void shutdown_send();

    // Get peer address as "ip:port" / just the ip
    std::string peer_addr() const;
    std::string peer_ip() const;

    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite). A blocked
    // recv that times out is reported like a clean close.
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};
    std::vector<u8> rx_buf_;

    void apply_socket_opts();
    void send_vec(const u8* hdr, size_t hdr_len, const u8* payload, size_t payload_len);
};

class UdpSocket {
public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Create, enable SO_BROADCAST/SO_REUSEADDR and bind to ip:port
    void open(const std::string& bind_ip, u16 port);

    // Send one datagram; throws on error
    void send_to(const std::string& ip, u16 port, const void* data, size_t len);

    // Wait up to timeout_ms for one datagram. Returns the datagram size,
    // 0 on timeout, and fills from_ip. Throws on socket error.
    int recv_from(void* buf, size_t cap, int timeout_ms, std::string& from_ip);

    bool is_open() const { return fd_ != INVALID_SOCKET_VAL; }
    u16 local_port() const;
    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
