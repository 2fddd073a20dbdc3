#pragma once

// ============================================================
// environment.hpp -- What a command sees of the shell it runs in
// ============================================================

#include <filesystem>
#include <string>

class Connection;

class Environment {
public:
    virtual ~Environment() = default;

    virtual void writeln(const std::string& text) = 0;
    virtual void write(const char* chars, size_t offset, size_t len) = 0;

    virtual std::filesystem::path current_path() const = 0;
    virtual void set_current_path(const std::filesystem::path& path) = 0;

    virtual bool is_connected() const = 0;
    // nullptr when is_connected() is false
    virtual Connection* connection() = 0;
};
