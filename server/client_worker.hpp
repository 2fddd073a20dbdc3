#pragma once

// ============================================================
// client_worker.hpp -- One accepted connection, one thread
//
// Reads command lines, runs them through the dispatcher and switches to
// the transfer exchange when a command asks for it. A failing command is
// reported to the peer and the session goes on; a failing socket ends it.
// ============================================================

#include "../common/connection.hpp"
#include "commands.hpp"
#include "host_config.hpp"
#include "remote_environment.hpp"
#include "worker_state.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

class ClientWorker {
public:
    ClientWorker(TcpSocket sock, const HostConfig& cfg, const CommandDispatcher& dispatcher);

    ClientWorker(const ClientWorker&) = delete;
    ClientWorker& operator=(const ClientWorker&) = delete;

    // Blocks until the worker reaches CLOSED.
    void run();

    // From any thread: wakes the worker so that run() returns. No-op once
    // run() has closed the connection.
    void shutdown();

    WorkerState state() const { return state_.load(); }
    const std::string& peer() const { return peer_; }

private:
    const HostConfig&        cfg_;
    const CommandDispatcher& dispatcher_;
    Connection               conn_;
    RemoteEnvironment        env_;
    std::string              peer_;

    std::mutex close_mutex_;
    bool       closed_{false};

    std::atomic<WorkerState> state_{WorkerState::READING_COMMAND};
    std::string                    line_;
    std::optional<TransferRequest> pending_;

    void fire(WorkerEvent ev);
    void write_prompt();

    void read_command();
    void execute();
    void stream();
};
