#pragma once

// ============================================================
// listener_registry.hpp -- Port -> listener map shared by hosts
//
// One registry per process, handed to every HostServer. At most one
// listener per port; all access goes through a single lock.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "client_worker.hpp"
#include <atomic>
#include <condition_variable>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// A worker thread and the worker it runs
struct WorkerSlot {
    std::shared_ptr<ClientWorker> worker;
    std::thread                   thread;
    std::atomic<bool>             finished{false};
};

// One listening port: acceptor socket, acceptor thread, live workers and
// the reaper that joins them as they finish
struct Listener {
    u16               port{0};
    TcpSocket         sock;
    std::thread       acceptor;
    std::thread       reaper;
    std::atomic<bool> stopping{false};

    // Guards 'workers'; a slot's 'finished' flips under it, with a notify
    std::mutex                              workers_mutex;
    std::condition_variable                 workers_cv;
    std::list<std::unique_ptr<WorkerSlot>>  workers;
};

class ListenerRegistry {
public:
    ListenerRegistry() = default;

    ListenerRegistry(const ListenerRegistry&) = delete;
    ListenerRegistry& operator=(const ListenerRegistry&) = delete;

    // False if the port already has a listener
    bool add(std::shared_ptr<Listener> listener);

    // Removes and returns the listener; nullptr if absent
    std::shared_ptr<Listener> remove(u16 port);

    std::shared_ptr<Listener> find(u16 port) const;

    bool contains(u16 port) const { return find(port) != nullptr; }

    std::vector<u16> ports() const;

private:
    mutable std::mutex mutex_;
    std::map<u16, std::shared_ptr<Listener>> listeners_;
};
