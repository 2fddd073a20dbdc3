#pragma once

// ============================================================
// remote_environment.hpp -- Environment whose output goes to the peer
// ============================================================

#include "../common/connection.hpp"
#include "../common/environment.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>

class RemoteEnvironment : public Environment {
public:
    RemoteEnvironment(Connection& conn, std::filesystem::path root);

    void writeln(const std::string& text) override;
    void write(const char* chars, size_t offset, size_t len) override;

    std::filesystem::path current_path() const override;
    void set_current_path(const std::filesystem::path& path) override;

    bool is_connected() const override { return connected_.load(); }
    Connection* connection() override { return connected_.load() ? &conn_ : nullptr; }

    void mark_disconnected() { connected_.store(false); }

private:
    Connection&           conn_;
    mutable std::mutex    path_mutex_;
    std::filesystem::path cwd_;
    std::atomic<bool>     connected_{true};
};
