// ============================================================
// listener_registry.cpp
// ============================================================

#include "listener_registry.hpp"

bool ListenerRegistry::add(std::shared_ptr<Listener> listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    u16 port = listener->port;
    return listeners_.emplace(port, std::move(listener)).second;
}

std::shared_ptr<Listener> ListenerRegistry::remove(u16 port) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = listeners_.find(port);
    if (it == listeners_.end()) return nullptr;
    auto l = std::move(it->second);
    listeners_.erase(it);
    return l;
}

std::shared_ptr<Listener> ListenerRegistry::find(u16 port) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = listeners_.find(port);
    return it == listeners_.end() ? nullptr : it->second;
}

std::vector<u16> ListenerRegistry::ports() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<u16> out;
    for (auto& kv : listeners_) out.push_back(kv.first);
    return out;
}
