// ============================================================
// console_environment.cpp
// ============================================================

#include "console_environment.hpp"
#include <system_error>

ConsoleEnvironment::ConsoleEnvironment(std::ostream& out)
    : out_(out)
{
    std::error_code ec;
    cwd_ = std::filesystem::current_path(ec);
}

void ConsoleEnvironment::writeln(const std::string& text) {
    std::lock_guard<std::mutex> lk(out_mutex_);
    out_ << text << "\n";
    out_.flush();
}

void ConsoleEnvironment::write(const char* chars, size_t offset, size_t len) {
    std::lock_guard<std::mutex> lk(out_mutex_);
    out_.write(chars + offset, (std::streamsize)len);
    out_.flush();
}

std::filesystem::path ConsoleEnvironment::current_path() const {
    std::lock_guard<std::mutex> lk(path_mutex_);
    return cwd_;
}

void ConsoleEnvironment::set_current_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lk(path_mutex_);
    cwd_ = path;
}
