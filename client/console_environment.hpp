#pragma once

// ============================================================
// console_environment.hpp -- Environment of the local client
//
// Output goes to a local stream; the background reader and the
// foreground loop both write here, so every write takes the lock.
// ============================================================

#include "../common/environment.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>
#include <ostream>

class ConsoleEnvironment : public Environment {
public:
    explicit ConsoleEnvironment(std::ostream& out);

    void writeln(const std::string& text) override;
    void write(const char* chars, size_t offset, size_t len) override;

    std::filesystem::path current_path() const override;
    void set_current_path(const std::filesystem::path& path) override;

    bool is_connected() const override { return conn_.load() != nullptr; }
    Connection* connection() override { return conn_.load(); }

    void attach(Connection* conn) { conn_.store(conn); }
    void detach() { conn_.store(nullptr); }

private:
    std::ostream&             out_;
    std::mutex                out_mutex_;
    mutable std::mutex        path_mutex_;
    std::filesystem::path     cwd_;
    std::atomic<Connection*>  conn_{nullptr};
};
