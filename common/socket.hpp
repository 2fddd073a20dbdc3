#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>
#include <atomic>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or dotted quad) and connect
    void connect(const std::string& host, u16 port);

    // Server: bind + listen. Port 0 picks an ephemeral port, see local_port().
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 64);

    // Accept one connection (blocking). Throws ConnectionError once the
    // listener has been shut down.
    TcpSocket accept();

    // Send exactly 'len' bytes; throws ConnectionError on error
    void send_all(const void* buf, size_t len);

    // Receive whatever is available (at most 'len', blocking for at least
    // one byte). Returns 0 on clean close.
    size_t recv_some(void* buf, size_t len);

    void tune();

    // Wake every thread blocked on this socket; the descriptor stays open
    // until close() so a concurrent reader never sees a recycled fd.
    void shutdown();

    void close();

    std::string peer_addr() const;
    u16 local_port() const;

private:
    socket_t fd_{platform::INVALID_SOCK};
    std::atomic<bool> shut_down_{false};

    void apply_socket_opts();
};
