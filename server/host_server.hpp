#pragma once

// ============================================================
// host_server.hpp -- Remote shell host
//
// Concurrency model:
//   one acceptor thread per listening port, blocked in accept();
//   one worker thread per accepted connection (ClientWorker::run);
//   one reaper thread per port, joining workers as soon as they finish.
//   stop() shuts the listener and every worker socket down, which
//   unblocks all of them, then joins the threads.
//
// Several HostServers may share one ListenerRegistry; a port belongs to
// the host that started it.
// ============================================================

#include "../common/platform.hpp"
#include "commands.hpp"
#include "host_config.hpp"
#include "listener_registry.hpp"
#include <memory>
#include <mutex>
#include <set>
#include <vector>

class HostServer {
public:
    HostServer(HostConfig config, ListenerRegistry& registry);
    ~HostServer();

    HostServer(const HostServer&) = delete;
    HostServer& operator=(const HostServer&) = delete;

    // Bind and start accepting. Port 0 picks an ephemeral port.
    // Returns the port actually listened on; throws if it is taken.
    u16 start(u16 port);

    // No-op for a port this host does not run
    void stop(u16 port);
    void stop_all();

    size_t active_connections(u16 port) const;
    std::vector<u16> ports() const;

    const HostConfig& config() const { return config_; }

private:
    HostConfig        config_;
    ListenerRegistry& registry_;
    CommandDispatcher dispatcher_;

    mutable std::mutex ports_mutex_;
    std::set<u16>      ports_;

    void accept_loop(std::shared_ptr<Listener> listener);

    // Join workers whose run() has returned, until the port stops
    static void reap_loop(Listener& listener);
};
