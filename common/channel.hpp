#pragma once

// ============================================================
// channel.hpp -- Buffered duplex byte channel over a TcpSocket
//
// The same socket carries newline-terminated text and, between a
// marker and the end of the declared payload, raw transfer bytes.
// Channel keeps a small read-ahead buffer so that bytes read past a
// line or a marker can be handed back (unread) to whoever consumes
// the stream next.
//
// Reads are single-threaded (one reader per connection). Writes may
// come from two threads on the client (foreground input, background
// transfer), so every write takes the write lock; a transfer holds it
// for the whole exchange through WriteGuard.
// ============================================================

#include "platform.hpp"
#include "socket.hpp"
#include <mutex>
#include <string>
#include <vector>

class Channel {
public:
    explicit Channel(TcpSocket sock);

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // ---- Reading ----

    // Read at least one byte (up to len). Returns 0 on clean close.
    size_t read_some(void* buf, size_t len);

    // Read exactly len bytes; throws ConnectionError on close or error.
    void read_exact(void* buf, size_t len);

    // Read one line without its terminator ("\n" or "\r\n").
    // Returns false on clean close before any byte of a new line.
    bool read_line(std::string& line);

    // Push bytes back in front of the read-ahead buffer.
    void unread(const void* data, size_t len);

    size_t buffered() const { return rbuf_.size() - rpos_; }

    // ---- Writing ----

    void write_all(const void* data, size_t len);
    void write_text(const std::string& text) { write_all(text.data(), text.size()); }

    // Holds the write lock for a multi-step exchange. Writes made through
    // the guard skip the lock.
    class WriteGuard {
    public:
        explicit WriteGuard(Channel& ch) : ch_(ch), lock_(ch.write_mutex_) {}

        void write_all(const void* data, size_t len) { ch_.sock_.send_all(data, len); }
        void write_text(const std::string& text) { write_all(text.data(), text.size()); }

        WriteGuard(const WriteGuard&) = delete;
        WriteGuard& operator=(const WriteGuard&) = delete;

    private:
        Channel& ch_;
        std::unique_lock<std::mutex> lock_;
    };

    // ---- Lifetime ----

    // Safe from any thread: wakes a blocked reader/writer.
    void shutdown() { sock_.shutdown(); }
    void close() { sock_.close(); }

    std::string peer_addr() const { return peer_; }

private:
    TcpSocket       sock_;
    std::string     peer_;
    std::vector<u8> rbuf_;
    size_t          rpos_{0};
    std::mutex      write_mutex_;

    // Refill the read-ahead buffer; returns false on clean close.
    bool fill();
};
