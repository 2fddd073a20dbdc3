// ============================================================
// remote_environment.cpp
// ============================================================

#include "remote_environment.hpp"

RemoteEnvironment::RemoteEnvironment(Connection& conn, std::filesystem::path root)
    : conn_(conn), cwd_(std::move(root))
{}

void RemoteEnvironment::writeln(const std::string& text) {
    conn_.channel().write_text(text + "\n");
}

void RemoteEnvironment::write(const char* chars, size_t offset, size_t len) {
    conn_.channel().write_all(chars + offset, len);
}

std::filesystem::path RemoteEnvironment::current_path() const {
    std::lock_guard<std::mutex> lk(path_mutex_);
    return cwd_;
}

void RemoteEnvironment::set_current_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lk(path_mutex_);
    cwd_ = path;
}
