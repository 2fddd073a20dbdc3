#pragma once

// ============================================================
// file_io.hpp -- Transfer sources and destinations on disk
// ============================================================

#include "platform.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace file_io {

// A regular file mapped read-only and handed out front to back in
// transfer-sized chunks. Opening anything else throws ResourceError.
class ChunkSource {
public:
    explicit ChunkSource(const std::string& path);
    ~ChunkSource();

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    u64 size() const { return size_; }

    // Next run of at most 'max' bytes; false once the file is exhausted.
    bool next(const u8*& data, size_t& len, size_t max);

private:
    std::string path_;
    const u8*   base_{nullptr};
    u64         size_{0};
    u64         pos_{0};

#ifdef _WIN32
    HANDLE file_{INVALID_HANDLE_VALUE};
    HANDLE mapping_{nullptr};
#else
    int fd_{-1};
#endif

    void release();
};

// Sequential destination writer. Every failure throws ResourceError;
// bytes already written stay on disk.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Create/truncate the file, creating parent directories first.
    void open(const std::string& path);

    void write(const void* data, size_t len);

    void close();

    bool is_open() const;
    u64 written() const { return written_; }

private:
    std::string path_;
    u64 written_{0};

#ifdef _WIN32
    HANDLE file_{INVALID_HANDLE_VALUE};
#else
    int fd_{-1};
#endif
};

// A bare file name: not "." or "..", no separators, no drive colon.
bool is_safe_file_name(const std::string& name);

// 'a/b/c' where every component is a safe file name.
bool is_safe_relative_path(const std::string& path);

// Regular files below 'dir', as sorted '/'-separated paths relative to it.
std::vector<std::string> list_files(const fs::path& dir);

// Resolve 'path' against 'cwd' when relative; result is normalized.
fs::path resolve(const fs::path& cwd, const std::string& path);

} // namespace file_io
