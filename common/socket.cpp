// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <algorithm>
#include <climits>

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == platform::INVALID_SOCK) {
        throw ConnectionError("socket() failed: " + platform::error_str(platform::last_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != platform::INVALID_SOCK) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept
    : fd_(o.fd_), shut_down_(o.shut_down_.load()) {
    o.fd_ = platform::INVALID_SOCK;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        shut_down_.store(o.shut_down_.load());
        o.fd_ = platform::INVALID_SOCK;
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
    // Prompts and single ack bytes must not sit in Nagle's buffer
    int nodelay = 1;
    int keepalive = 1;
#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
#endif
}

void TcpSocket::connect(const std::string& host, u16 port) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw ConnectionError("Cannot resolve host " + host + ": " + gai_strerror(rc));
    }

    int err = 0;
    bool connected = false;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (::connect(fd_, ai->ai_addr, (int)ai->ai_addrlen) == 0) {
            connected = true;
            break;
        }
        err = platform::last_error();
    }
    ::freeaddrinfo(res);

    if (!connected) {
        throw ConnectionError("connect() to " + host + ":" + service +
                              " failed: " + platform::error_str(err));
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw ConnectionError("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) != 0) {
        throw ConnectionError("bind() to port " + std::to_string(port) +
                              " failed: " + platform::error_str(platform::last_error()));
    }
    if (::listen(fd_, backlog) != 0) {
        throw ConnectionError("listen() failed: " + platform::error_str(platform::last_error()));
    }
}

TcpSocket TcpSocket::accept() {
    for (;;) {
        sockaddr_in peer{};
#ifdef _WIN32
        int peer_len = sizeof(peer);
#else
        socklen_t peer_len = sizeof(peer);
#endif
        socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
        if (client != platform::INVALID_SOCK) {
            TcpSocket s(client);
            s.tune();
            return s;
        }
        int err = platform::last_error();
        if (platform::interrupted(err) && !shut_down_.load()) continue;
        throw ConnectionError("accept() failed: " + platform::error_str(err));
    }
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
                throw ConnectionError("Connection closed during send");
            }
            int err = platform::last_error();
            if (platform::interrupted(err)) continue;
            throw ConnectionError("send() failed: " + platform::error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
#ifdef _WIN32
        int received = ::recv(fd_, static_cast<char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, buf, len, 0);
#endif
        if (received >= 0) return static_cast<size_t>(received);
        int err = platform::last_error();
        if (platform::interrupted(err)) continue;
        throw ConnectionError("recv() failed: " + platform::error_str(err));
    }
}

void TcpSocket::shutdown() {
    if (fd_ != platform::INVALID_SOCK && !shut_down_.exchange(true)) {
        platform::shutdown_socket(fd_);
    }
}

void TcpSocket::close() {
    if (fd_ != platform::INVALID_SOCK) {
        platform::close_socket(fd_);
        fd_ = platform::INVALID_SOCK;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (getsockname(fd_, (sockaddr*)&addr, &len) != 0) {
        throw ConnectionError("getsockname() failed: " + platform::error_str(platform::last_error()));
    }
    return ntohs(addr.sin_port);
}
