// ============================================================
// host_server.cpp -- Acceptor loops and worker threads
// ============================================================

#include "host_server.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <chrono>
#include <thread>

HostServer::HostServer(HostConfig config, ListenerRegistry& registry)
    : config_(std::move(config))
    , registry_(registry)
    , dispatcher_(config_.transfer.overwrite)
{}

HostServer::~HostServer() {
    stop_all();
}

u16 HostServer::start(u16 port) {
    if (port != 0 && registry_.contains(port)) {
        throw ConnectionError("Port " + std::to_string(port) + " is already in use by a host");
    }

    auto listener = std::make_shared<Listener>();
    listener->sock.bind_and_listen(config_.listen_ip, port);
    listener->port = listener->sock.local_port();

    if (!registry_.add(listener)) {
        throw ConnectionError("Port " + std::to_string(listener->port) +
                              " is already in use by a host");
    }
    {
        std::lock_guard<std::mutex> lk(ports_mutex_);
        ports_.insert(listener->port);
    }

    listener->reaper = std::thread([listener] { reap_loop(*listener); });
    listener->acceptor = std::thread([this, listener] { accept_loop(listener); });

    LOG_INFO("rshell host listening on " + config_.listen_ip + ":" +
             std::to_string(listener->port) + " (root " + config_.root_dir +
             (config_.password.empty() ? ", unencrypted)" : ", encrypted)"));
    return listener->port;
}

void HostServer::accept_loop(std::shared_ptr<Listener> listener) {
    while (!listener->stopping.load()) {
        std::shared_ptr<ClientWorker> worker;
        try {
            TcpSocket sock = listener->sock.accept();
            worker = std::make_shared<ClientWorker>(std::move(sock), config_, dispatcher_);
        } catch (const ConnectionError& e) {
            if (listener->stopping.load()) break;
            LOG_ERROR("accept on port " + std::to_string(listener->port) + ": " + e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        } catch (const std::exception& e) {
            LOG_ERROR("Cannot set up session: " + std::string(e.what()));
            continue;
        }

        std::lock_guard<std::mutex> lk(listener->workers_mutex);
        if (listener->stopping.load()) {
            worker->shutdown();
            break;
        }
        listener->workers.push_back(std::make_unique<WorkerSlot>());
        WorkerSlot* slot = listener->workers.back().get();
        Listener* owner = listener.get();
        slot->worker = worker;
        slot->thread = std::thread([owner, slot] {
            try {
                slot->worker->run();
            } catch (const std::exception& e) {
                LOG_ERROR("Worker " + slot->worker->peer() + ": " + e.what());
            }
            std::lock_guard<std::mutex> done(owner->workers_mutex);
            slot->finished.store(true);
            owner->workers_cv.notify_all();
        });
    }
}

void HostServer::reap_loop(Listener& listener) {
    std::unique_lock<std::mutex> lk(listener.workers_mutex);
    for (;;) {
        listener.workers_cv.wait(lk, [&listener] {
            if (listener.stopping.load()) return true;
            for (auto& slot : listener.workers) {
                if (slot->finished.load()) return true;
            }
            return false;
        });
        // A finished worker only has to return from its thread function
        for (auto it = listener.workers.begin(); it != listener.workers.end();) {
            if ((*it)->finished.load()) {
                if ((*it)->thread.joinable()) (*it)->thread.join();
                it = listener.workers.erase(it);
            } else {
                ++it;
            }
        }
        if (listener.stopping.load()) return;
    }
}

void HostServer::stop(u16 port) {
    {
        std::lock_guard<std::mutex> lk(ports_mutex_);
        if (ports_.erase(port) == 0) return;
    }
    auto listener = registry_.remove(port);
    if (!listener) return;

    listener->stopping.store(true);
    listener->sock.shutdown();
    if (listener->acceptor.joinable()) listener->acceptor.join();
    listener->sock.close();

    // The acceptor is gone, so the worker list can no longer grow
    {
        std::lock_guard<std::mutex> lk(listener->workers_mutex);
        for (auto& slot : listener->workers) slot->worker->shutdown();
    }
    listener->workers_cv.notify_all();
    if (listener->reaper.joinable()) listener->reaper.join();

    for (auto& slot : listener->workers) {
        if (slot->thread.joinable()) slot->thread.join();
    }
    listener->workers.clear();

    LOG_INFO("rshell host on port " + std::to_string(port) + " stopped");
}

void HostServer::stop_all() {
    for (u16 port : ports()) stop(port);
}

size_t HostServer::active_connections(u16 port) const {
    {
        std::lock_guard<std::mutex> lk(ports_mutex_);
        if (!ports_.count(port)) return 0;
    }
    auto listener = registry_.find(port);
    if (!listener) return 0;
    std::lock_guard<std::mutex> lk(listener->workers_mutex);
    size_t n = 0;
    for (auto& slot : listener->workers) {
        if (!slot->finished.load()) ++n;
    }
    return n;
}

std::vector<u16> HostServer::ports() const {
    std::lock_guard<std::mutex> lk(ports_mutex_);
    return std::vector<u16>(ports_.begin(), ports_.end());
}
