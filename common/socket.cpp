// ============================================================
// socket.cpp -- TcpSocket / UdpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include "codec.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <climits>

#ifndef _WIN32
#  include <sys/uio.h>
#endif

// Buffer size for SO_SNDBUF / SO_RCVBUF = 1 MB
static constexpr int SOCKET_BUF_SIZE = 1 * 1024 * 1024;

static bool parse_ipv4(const std::string& ip, in_addr& out) {
#ifdef _WIN32
    out.s_addr = inet_addr(ip.c_str());
    return out.s_addr != INADDR_NONE || ip == "255.255.255.255";
#else
    return inet_pton(AF_INET, ip.c_str(), &out) == 1;
#endif
}

static std::string ipv4_to_string(const in_addr& a) {
#ifdef _WIN32
    const char* s = inet_ntoa(a);
    return s ? std::string(s) : std::string();
#else
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &a, buf, sizeof(buf))) return std::string();
    return std::string(buf);
#endif
}

static u16 bound_port(socket_t fd) {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (getsockname(fd, (sockaddr*)&addr, &len) != 0) return 0;
    return ntohs(addr.sin_port);
}

// ============================================================
// TcpSocket
// ============================================================

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_), rx_buf_(std::move(o.rx_buf_)) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        rx_buf_ = std::move(o.rx_buf_);
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#endif
}

void TcpSocket::connect(const std::string& ip, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parse_ipv4(ip, addr.sin_addr)) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("connect() failed: " + socket_error_str(last_socket_error()));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (!parse_ipv4(ip, addr.sin_addr)) {
        throw std::runtime_error("Invalid bind address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    sockaddr_in peer{};
#ifdef _WIN32
    int peer_len = sizeof(peer);
#else
    socklen_t peer_len = sizeof(peer);
#endif
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        throw std::runtime_error("accept() failed: " + socket_error_str(last_socket_error()));
    }
    TcpSocket s(client);
    s.tune();
    return s;
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received == 0) return false; // clean close
        if (received < 0) {
            int err = last_socket_error();
#ifndef _WIN32
            if (err == EINTR) continue;
#endif
            if (would_block(err)) {
                // Timeout (SO_RCVTIMEO) - report like a close
                return false;
            }
            throw std::runtime_error("recv() failed: " + socket_error_str(err));
        }
        p += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

void TcpSocket::send_vec(const u8* hdr, size_t hdr_len, const u8* payload, size_t payload_len) {
    if (payload_len == 0 || !payload) {
        send_all(hdr, hdr_len);
        return;
    }
#ifdef _WIN32
    send_all(hdr, hdr_len);
    send_all(payload, payload_len);
#else
    // writev: merge header + payload into one syscall, handle partial sends
    size_t total = hdr_len + payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? hdr_len : payload_len;
            const u8* seg_base = (i == 0) ? hdr : payload;
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<u8*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        ssize_t n = ::writev(fd_, cur, cur_cnt);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("writev failed: " + socket_error_str(errno));
        }
        sent_total += (size_t)n;
    }
#endif
}

void TcpSocket::write_frame(const Frame& frame) {
    FrameType type;
    std::vector<u8> payload = codec::encode_payload(frame, type);

    FrameHeader hdr;
    hdr.magic       = LANLINK_MAGIC;
    hdr.version     = LANLINK_VERSION;
    hdr.frame_type  = (u8)type;
    hdr.reserved    = 0;
    hdr.payload_len = (u32)payload.size();

    u8 hdr_buf[LANLINK_HEADER_LEN];
    proto::encode_header(hdr, hdr_buf);
    send_vec(hdr_buf, LANLINK_HEADER_LEN, payload.data(), payload.size());
}

bool TcpSocket::read_frame(Frame& out) {
    u8 hdr_buf[LANLINK_HEADER_LEN];
    if (!recv_all(hdr_buf, LANLINK_HEADER_LEN)) return false;
    FrameHeader hdr = proto::decode_header(hdr_buf);
    FrameType type = codec::check_header(hdr);

    rx_buf_.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(rx_buf_.data(), hdr.payload_len)) return false;
    }
    out = codec::decode_payload(type, rx_buf_.data(), rx_buf_.size());
    return true;
}

int TcpSocket::wait_readable(int timeout_ms) const {
    if (fd_ == INVALID_SOCKET_VAL) return -1;
    return platform::wait_readable(fd_, timeout_ms);
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

void TcpSocket::shutdown_send() {
    if (fd_ == INVALID_SOCKET_VAL) return;
#ifdef _WIN32
    ::shutdown(fd_, SD_SEND);
#else
    ::shutdown(fd_, SHUT_WR);
#endif
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        std::string ip = ipv4_to_string(peer.sin_addr);
        if (!ip.empty()) return ip + ":" + std::to_string(ntohs(peer.sin_port));
    }
    return "unknown";
}

std::string TcpSocket::peer_ip() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        return ipv4_to_string(peer.sin_addr);
    }
    return std::string();
}

u16 TcpSocket::local_port() const {
    return bound_port(fd_);
}

void TcpSocket::set_recv_timeout_ms(int ms) {
#ifdef _WIN32
    DWORD timeout = (DWORD)ms;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof(timeout));
#else
    struct timeval tv;
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif
}

// ============================================================
// UdpSocket
// ============================================================

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::open(const std::string& bind_ip, u16 port) {
    close();
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket(UDP) failed: " + socket_error_str(last_socket_error()));
    }

    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
    setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#  ifdef SO_REUSEPORT
    setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on));
#  endif
    setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (bind_ip.empty() || bind_ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (!parse_ipv4(bind_ip, addr.sin_addr)) {
        close();
        throw std::runtime_error("Invalid bind address: " + bind_ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        int err = last_socket_error();
        close();
        throw std::runtime_error("bind(UDP " + std::to_string(port) + ") failed: " +
                                 socket_error_str(err));
    }
}

void UdpSocket::send_to(const std::string& ip, u16 port, const void* data, size_t len) {
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("UDP socket not open");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parse_ipv4(ip, addr.sin_addr)) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
#ifdef _WIN32
    int sent = ::sendto(fd_, (const char*)data, (int)len, 0, (sockaddr*)&addr, sizeof(addr));
#else
    ssize_t sent = ::sendto(fd_, data, len, 0, (sockaddr*)&addr, sizeof(addr));
#endif
    if (sent < 0) {
        throw std::runtime_error("sendto() failed: " + socket_error_str(last_socket_error()));
    }
}

int UdpSocket::recv_from(void* buf, size_t cap, int timeout_ms, std::string& from_ip) {
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("UDP socket not open");
    }
    int rc = platform::wait_readable(fd_, timeout_ms);
    if (rc == 0) return 0;
    if (rc < 0) {
        throw std::runtime_error("poll(UDP) failed: " + socket_error_str(last_socket_error()));
    }

    sockaddr_in from{};
#ifdef _WIN32
    int from_len = sizeof(from);
    int n = ::recvfrom(fd_, (char*)buf, (int)cap, 0, (sockaddr*)&from, &from_len);
#else
    socklen_t from_len = sizeof(from);
    ssize_t n = ::recvfrom(fd_, buf, cap, 0, (sockaddr*)&from, &from_len);
#endif
    if (n < 0) {
        int err = last_socket_error();
        if (would_block(err)) return 0;
#ifndef _WIN32
        if (err == EINTR) return 0;
#endif
        throw std::runtime_error("recvfrom() failed: " + socket_error_str(err));
    }
    from_ip = ipv4_to_string(from.sin_addr);
    return (int)n;
}

u16 UdpSocket::local_port() const {
    return bound_port(fd_);
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}
