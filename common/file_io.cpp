// ============================================================
// file_io.cpp -- Transfer sources and destinations on disk
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstring>
#include <system_error>

#ifndef _WIN32
#  include <fcntl.h>
#  include <sys/mman.h>
#  include <sys/stat.h>
#endif

namespace file_io {

// ============================================================
// ChunkSource
// ============================================================

ChunkSource::ChunkSource(const std::string& path) : path_(path) {
#ifdef _WIN32
    file_ = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                        FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (file_ == INVALID_HANDLE_VALUE) throw ResourceError("Cannot open " + path);

    BY_HANDLE_FILE_INFORMATION info{};
    if (!GetFileInformationByHandle(file_, &info) ||
        (info.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY)) {
        release();
        throw ResourceError("Not a regular file: " + path);
    }
    size_ = ((u64)info.nFileSizeHigh << 32) | info.nFileSizeLow;
    if (size_ == 0) return;

    mapping_ = CreateFileMappingA(file_, nullptr, PAGE_READONLY, 0, 0, nullptr);
    if (mapping_) base_ = static_cast<const u8*>(MapViewOfFile(mapping_, FILE_MAP_READ, 0, 0, 0));
    if (!base_) {
        release();
        throw ResourceError("Cannot map " + path);
    }
#else
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) throw ResourceError("Cannot open " + path + ": " + std::strerror(errno));

    struct stat st{};
    if (fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode)) {
        release();
        throw ResourceError("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;
    if (size_ == 0) return;

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        release();
        throw ResourceError("Cannot map " + path + ": " + std::strerror(err));
    }
    // Read once, front to back
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    base_ = static_cast<const u8*>(p);
#endif
}

ChunkSource::~ChunkSource() {
    release();
}

bool ChunkSource::next(const u8*& data, size_t& len, size_t max) {
    if (pos_ >= size_) return false;
    len  = (size_t)std::min<u64>(size_ - pos_, max);
    data = base_ + pos_;
    pos_ += len;
    return true;
}

void ChunkSource::release() {
#ifdef _WIN32
    if (base_) UnmapViewOfFile(base_);
    if (mapping_) CloseHandle(mapping_);
    if (file_ != INVALID_HANDLE_VALUE) CloseHandle(file_);
    mapping_ = nullptr;
    file_ = INVALID_HANDLE_VALUE;
#else
    if (base_) munmap(const_cast<u8*>(base_), (size_t)size_);
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
#endif
    base_ = nullptr;
}

// ============================================================
// FileWriter
// ============================================================

FileWriter::~FileWriter() {
    close();
}

bool FileWriter::is_open() const {
#ifdef _WIN32
    return file_ != INVALID_HANDLE_VALUE;
#else
    return fd_ >= 0;
#endif
}

void FileWriter::open(const std::string& path) {
    close();
    path_ = path;
    written_ = 0;

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) throw ResourceError("Cannot create directories for " + path + ": " + ec.message());

#ifdef _WIN32
    file_ = CreateFileA(path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                        FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file_ == INVALID_HANDLE_VALUE) throw ResourceError("Cannot create " + path);
#else
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) throw ResourceError("Cannot create " + path + ": " + std::strerror(errno));
#endif
}

void FileWriter::write(const void* data, size_t len) {
    if (!is_open()) throw ResourceError("Write to closed file: " + path_);
    const u8* p = static_cast<const u8*>(data);
    while (len > 0) {
#ifdef _WIN32
        DWORD n = 0;
        if (!WriteFile(file_, p, (DWORD)std::min<size_t>(len, 1u << 30), &n, nullptr) || n == 0) {
            throw ResourceError("Write failed: " + path_);
        }
#else
        ssize_t n = ::write(fd_, p, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ResourceError("Write failed: " + path_ + ": " + std::strerror(errno));
        }
#endif
        p += n;
        len -= (size_t)n;
        written_ += (u64)n;
    }
}

void FileWriter::close() {
#ifdef _WIN32
    if (file_ != INVALID_HANDLE_VALUE) CloseHandle(file_);
    file_ = INVALID_HANDLE_VALUE;
#else
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
#endif
}

// ============================================================
// Names and paths
// ============================================================

bool is_safe_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of(std::string("/\\:\0", 4)) == std::string::npos;
}

bool is_safe_relative_path(const std::string& path) {
    for (const std::string& part : utils::split(path, '/')) {
        if (!is_safe_file_name(part)) return false;
    }
    return true;
}

std::vector<std::string> list_files(const fs::path& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
    if (ec) throw ResourceError("Cannot list " + dir.string() + ": " + ec.message());
    for (; it != end; it.increment(ec)) {
        if (ec) throw ResourceError("Cannot list " + dir.string() + ": " + ec.message());
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            out.push_back(it->path().lexically_relative(dir).generic_string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

fs::path resolve(const fs::path& cwd, const std::string& path) {
    fs::path p(path);
    if (p.is_relative()) p = cwd / p;
    return p.lexically_normal();
}

} // namespace file_io
