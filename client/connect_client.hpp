#pragma once

// ============================================================
// connect_client.hpp -- Client side of a remote shell session
//
// Two threads per session:
//   foreground  reads local lines and forwards them (send_line / run)
//   reader      echoes host output; on a marker it runs the transfer
//               synchronously, so nothing else is processed until the
//               file is done.
// Writes to the socket share the channel's write lock, so a line typed
// during a transfer goes out after it.
// ============================================================

#include "../common/connection.hpp"
#include "../common/protocol.hpp"
#include "../common/transfer.hpp"
#include "console_environment.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct ClientConfig {
    std::filesystem::path     downloads_dir;
    bool                      checksum{false};
    std::chrono::milliseconds progress_interval{5000};

    // ~/Downloads, or ./Downloads without a home directory
    static std::filesystem::path default_downloads_dir();
};

class ConnectClient {
public:
    using PasswordPrompt   = std::function<std::string()>;
    using TransferCallback = std::function<void(TransferDirection, const TransferResult&)>;

    ConnectClient(ClientConfig config, std::ostream& out, PasswordPrompt prompt);
    ~ConnectClient();

    ConnectClient(const ConnectClient&) = delete;
    ConnectClient& operator=(const ConnectClient&) = delete;

    // Resolve, connect, ask for the password and start the reader.
    // Throws ConnectionError.
    void connect(const std::string& host, u16 port);

    // Forward one line. "exit" (any case) ends the session. Returns false
    // once the session is over.
    bool send_line(const std::string& line);

    // Forward lines from 'in' until exit, end of input or disconnect.
    int run(std::istream& in);

    // Orderly shutdown; safe to call more than once
    void disconnect();

    bool connected() const { return connected_.load(); }

    // Called on the reader thread after each transfer
    void set_transfer_callback(TransferCallback cb) { on_transfer_ = std::move(cb); }

    ConsoleEnvironment& environment() { return env_; }

private:
    ClientConfig       config_;
    ConsoleEnvironment env_;
    PasswordPrompt     prompt_;
    TransferCallback   on_transfer_;

    std::unique_ptr<Connection> conn_;
    std::string                 remote_;
    std::thread                 reader_;
    std::atomic<bool>           connected_{false};
    std::atomic<bool>           closing_{false};
    std::mutex                  disconnect_mutex_;

    void reader_loop();
    TransferOptions transfer_options();
    void finish_transfer(TransferDirection dir, const TransferResult& res);
};
