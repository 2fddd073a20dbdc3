// ============================================================
// transfer.cpp -- File and directory transfer, both roles
// ============================================================

#include "transfer.hpp"
#include "channel_decoder.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "hash.hpp"
#include "logger.hpp"
#include "protocol_io.hpp"
#include "utils.hpp"
#include <algorithm>
#include <memory>
#include <system_error>
#include <vector>

const char* transfer_status_str(TransferStatus s) {
    switch (s) {
        case TransferStatus::OK:                return "ok";
        case TransferStatus::REFUSED:           return "refused";
        case TransferStatus::ABORTED:           return "aborted";
        case TransferStatus::PROTOCOL_ERROR:    return "protocol error";
        case TransferStatus::RESOURCE_ERROR:    return "resource error";
        case TransferStatus::CHECKSUM_MISMATCH: return "checksum mismatch";
    }
    return "unknown";
}

namespace transfer {

const char* const FAILED_MESSAGE = "Transfer ended with errors, possibly wrong password.";

// Command text that may precede an ack byte before the peer noticed the
// exchange; beyond this the peer is not following the protocol.
static constexpr size_t MAX_STRAY_TEXT = 64 * 1024;

static TransferResult make_result(TransferStatus status, const std::string& path,
                                  u64 bytes, const std::string& message) {
    TransferResult r;
    r.status  = status;
    r.path    = path;
    r.bytes   = bytes;
    r.files   = status == TransferStatus::OK ? 1 : 0;
    r.message = message;
    if (status != TransferStatus::OK && status != TransferStatus::REFUSED) {
        Logger::get().transfer_error(path + ": " + message);
    }
    return r;
}

// Lines the peer typed just before it saw our marker arrive ahead of its
// first ack. They are collected and handed back to the channel when the
// exchange is over, so they still run as commands afterwards.
class StrayText {
public:
    explicit StrayText(Channel& ch) : ch_(ch) {}
    ~StrayText() { ch_.unread(text_.data(), text_.size()); }

    StrayText(const StrayText&) = delete;
    StrayText& operator=(const StrayText&) = delete;

    void add(u8 b) {
        if (text_.size() >= MAX_STRAY_TEXT) {
            throw ConnectionError("No acknowledgment from " + ch_.peer_addr());
        }
        text_.push_back((char)b);
    }

private:
    Channel&    ch_;
    std::string text_;
};

static AckCode read_ack(Channel& ch, StrayText& stray) {
    for (;;) {
        u8 b = 0;
        ch.read_exact(&b, 1);
        if (b == (u8)AckCode::ACCEPT) return AckCode::ACCEPT;
        if (b == (u8)AckCode::REFUSE) return AckCode::REFUSE;
        stray.add(b);
    }
}

static void write_ack(Channel::WriteGuard& out, AckCode code) {
    u8 b = (u8)code;
    out.write_all(&b, 1);
}

static void write_block(Channel::WriteGuard& out, const std::string& text) {
    auto block = proto::encode_block(text);
    out.write_all(block.data(), block.size());
}

static std::string read_block(Channel& ch) {
    proto::HeaderBlock block{};
    ch.read_exact(block.data(), block.size());
    return proto::decode_block(block);
}

// Per-file results of a directory folded into one
class DirectoryTally {
public:
    DirectoryTally(std::string path, size_t expected)
        : path_(std::move(path)), expected_(expected) {}

    void add(const TransferResult& r) {
        bytes_ += r.bytes;
        files_ += r.files;
        if (r.ok()) return;
        if (failed_++ == 0) {
            status_ = r.status;
            first_failure_ = r.message;
        }
    }

    TransferResult result(const std::string& verb, const std::string& name) const {
        TransferResult r;
        r.status = status_;
        r.path   = path_;
        r.bytes  = bytes_;
        r.files  = files_;
        r.message = verb + " directory " + name + " (" + std::to_string(files_) + " of " +
                    std::to_string(expected_) + " files, " + utils::format_bytes(bytes_) + ").";
        if (failed_ > 0) {
            r.message += " " + std::to_string(failed_) + " failed, first: " + first_failure_;
        }
        return r;
    }

private:
    std::string    path_;
    size_t         expected_;
    u64            bytes_{0};
    size_t         files_{0};
    size_t         failed_{0};
    TransferStatus status_{TransferStatus::OK};
    std::string    first_failure_;
};

// ============================================================
// Sender
// ============================================================

// One file exchange, write lock already held
static TransferResult send_one(Connection& conn, Channel::WriteGuard& out, StrayText& stray,
                               const fs::path& source, const std::string& name,
                               const TransferOptions& opts) {
    Channel& ch = conn.channel();
    const std::string path = source.string();
    crypto::CipherStream* cipher = conn.encryptor();

    out.write_text(RSHELL_TRANSFER_MARKER);

    std::unique_ptr<file_io::ChunkSource> src;
    proto::SizeHeader header;
    try {
        if (name.size() > RSHELL_HEADER_BLOCK_SIZE) {
            throw ResourceError("Name does not fit the header block: " + name);
        }
        src = std::make_unique<file_io::ChunkSource>(path);
        header.size = src->size();
        header.checksum = opts.checksum;
        if (cipher) {
            header.iv = crypto::random_iv();
            header.has_iv = true;
        }
    } catch (const std::runtime_error& e) {
        // Empty name block: tells the receiver there is nothing coming
        write_block(out, "");
        return make_result(TransferStatus::RESOURCE_ERROR, path, 0, e.what());
    }

    write_block(out, name);
    if (read_ack(ch, stray) != AckCode::ACCEPT) {
        return make_result(TransferStatus::REFUSED, path, 0, "Receiver refused " + name + ".");
    }

    write_block(out, proto::format_size_header(header));
    if (read_ack(ch, stray) != AckCode::ACCEPT) {
        return make_result(TransferStatus::REFUSED, path, 0,
                           "Receiver refused " + name + " (" + utils::format_bytes(header.size) + ").");
    }

    LOG_DEBUG("Sending " + path + " (" + std::to_string(header.size) + " bytes) to " +
              ch.peer_addr());

    // A cipher failure past this point leaves the receiver waiting for
    // bytes that never come: it escapes and ends the session.
    if (cipher) cipher->begin(header.iv);
    hash::StreamHasher64 hasher;
    ProgressTracker progress(header.size, opts.progress_interval, opts.progress_sink);
    progress.start();

    const u8* chunk = nullptr;
    size_t n = 0;
    while (src->next(chunk, n, RSHELL_CHUNK_SIZE)) {
        if (opts.checksum) hasher.update(chunk, n);
        if (cipher) {
            std::vector<u8> enc = cipher->update(chunk, 0, n);
            out.write_all(enc.data(), enc.size());
        } else {
            out.write_all(chunk, n);
        }
        progress.add(n);
    }
    if (cipher) {
        std::vector<u8> tail = cipher->do_final();
        if (!tail.empty()) out.write_all(tail.data(), tail.size());
    }
    if (opts.checksum) {
        u8 trailer[RSHELL_CHECKSUM_LEN];
        proto::encode_u64(hasher.digest(), trailer);
        out.write_all(trailer, sizeof(trailer));
    }
    progress.stop();

    return make_result(TransferStatus::OK, path, header.size,
                       "Sent " + name + " (" + utils::format_bytes(header.size) + ").");
}

static TransferResult send_directory(Connection& conn, Channel::WriteGuard& out,
                                     StrayText& stray, const fs::path& source,
                                     const TransferOptions& opts) {
    Channel& ch = conn.channel();
    const std::string path = source.string();
    const std::string dir_name = source.filename().string();

    out.write_text(RSHELL_TRANSFER_MARKER);

    std::vector<std::string> files;
    try {
        if (!file_io::is_safe_file_name(dir_name)) {
            throw ResourceError("Cannot send " + path + " as a directory");
        }
        files = file_io::list_files(source);
    } catch (const ResourceError& e) {
        write_block(out, "");
        return make_result(TransferStatus::RESOURCE_ERROR, path, 0, e.what());
    }

    write_block(out, dir_name + RSHELL_DIR_SUFFIX);
    if (read_ack(ch, stray) != AckCode::ACCEPT) {
        return make_result(TransferStatus::REFUSED, path, 0,
                           "Receiver refused directory " + dir_name + ".");
    }
    proto::SizeHeader count;
    count.size = files.size();
    write_block(out, proto::format_size_header(count));
    if (read_ack(ch, stray) != AckCode::ACCEPT) {
        return make_result(TransferStatus::REFUSED, path, 0,
                           "Receiver refused directory " + dir_name + ".");
    }

    LOG_DEBUG("Sending directory " + path + " (" + std::to_string(files.size()) + " files) to " +
              ch.peer_addr());

    DirectoryTally tally(path, files.size());
    for (const std::string& rel : files) {
        tally.add(send_one(conn, out, stray, source / fs::path(rel), dir_name + "/" + rel, opts));
    }
    return tally.result("Sent", dir_name);
}

TransferResult send_path(Connection& conn, const fs::path& source, const TransferOptions& opts) {
    Channel& ch = conn.channel();
    Channel::WriteGuard out(ch);
    StrayText stray(ch);

    fs::path src = source;
    if (!src.has_filename() && src.has_parent_path()) src = src.parent_path();

    std::error_code ec;
    if (fs::is_directory(src, ec)) return send_directory(conn, out, stray, src, opts);
    return send_one(conn, out, stray, src, src.filename().string(), opts);
}

// ============================================================
// Receiver
// ============================================================

// One file exchange after its name block, write lock already held.
// 'name' is a validated name relative to 'dest_dir'.
static TransferResult receive_one(Connection& conn, Channel::WriteGuard& out,
                                  const fs::path& dest_dir, const std::string& name,
                                  const TransferOptions& opts) {
    Channel& ch = conn.channel();
    const fs::path dest = dest_dir / fs::path(name);
    const std::string dest_str = dest.string();

    std::error_code ec;
    if (opts.overwrite == OverwritePolicy::REFUSE && fs::exists(dest, ec)) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::REFUSED, dest_str, 0,
                           "File " + dest_str + " already exists.");
    }
    write_ack(out, AckCode::ACCEPT);

    proto::SizeHeader header;
    if (!proto::parse_size_header(read_block(ch), header)) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::PROTOCOL_ERROR, dest_str, 0,
                           "Malformed size header for " + name + ".");
    }

    file_io::FileWriter writer;
    try {
        writer.open(dest_str);
    } catch (const ResourceError& e) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::RESOURCE_ERROR, dest_str, 0, e.what());
    }
    write_ack(out, AckCode::ACCEPT);

    LOG_DEBUG("Receiving " + name + " (" + std::to_string(header.size) + " bytes) from " +
              ch.peer_addr());

    // Payload is decrypted only when both ends encrypt; otherwise it is
    // stored as it arrives, which a mismatched password also produces.
    crypto::CipherStream* cipher = header.has_iv ? conn.decryptor() : nullptr;
    if (header.has_iv != (conn.decryptor() != nullptr)) {
        LOG_WARN("Encryption settings differ from " + ch.peer_addr() + "; storing " + name +
                 " as received");
    }

    std::string decode_error;
    std::string write_error;
    hash::StreamHasher64 hasher;
    u64 written = 0;

    if (cipher) {
        try {
            cipher->begin(header.iv);
        } catch (const std::runtime_error& e) {
            decode_error = e.what();
        }
    }

    // Writes at most the bytes still owed against the declared size. Once
    // a write fails the rest is only counted, so the payload is still
    // consumed and the text channel stays in step.
    auto sink = [&](const u8* data, size_t len) {
        size_t n = (size_t)std::min<u64>(header.size - written, len);
        if (n == 0) return;
        if (header.checksum) hasher.update(data, n);
        written += n;
        if (!write_error.empty()) return;
        try {
            writer.write(data, n);
        } catch (const ResourceError& e) {
            write_error = e.what();
        }
    };

    ProgressTracker progress(header.size, opts.progress_interval, opts.progress_sink);
    progress.start();

    std::vector<u8> buf(RSHELL_CHUNK_SIZE);
    u64 remaining = header.size;
    try {
        while (remaining > 0) {
            size_t n = (size_t)std::min<u64>(remaining, RSHELL_CHUNK_SIZE);
            ch.read_exact(buf.data(), n);
            remaining -= n;
            progress.add(n);
            if (!decode_error.empty()) continue;   // drain only
            if (!cipher) {
                sink(buf.data(), n);
                continue;
            }
            try {
                std::vector<u8> dec = cipher->update(buf.data(), 0, n);
                sink(dec.data(), dec.size());
            } catch (const std::runtime_error& e) {
                decode_error = e.what();
            }
        }
        if (cipher && decode_error.empty()) {
            try {
                std::vector<u8> tail = cipher->do_final();
                sink(tail.data(), tail.size());
            } catch (const std::runtime_error& e) {
                decode_error = e.what();
            }
        }

        u8 trailer[RSHELL_CHECKSUM_LEN];
        if (header.checksum) ch.read_exact(trailer, sizeof(trailer));
        progress.stop();
        writer.close();

        if (!decode_error.empty()) {
            return make_result(TransferStatus::ABORTED, dest_str, writer.written(),
                               std::string(FAILED_MESSAGE) + " (" + decode_error + ")");
        }
        if (!write_error.empty()) {
            return make_result(TransferStatus::RESOURCE_ERROR, dest_str, writer.written(),
                               write_error);
        }
        if (header.checksum && proto::decode_u64(trailer) != hasher.digest()) {
            return make_result(TransferStatus::CHECKSUM_MISMATCH, dest_str, written,
                               std::string(FAILED_MESSAGE) + " (checksum mismatch)");
        }
    } catch (const ConnectionError& e) {
        progress.stop();
        writer.close();
        Logger::get().transfer_error(dest_str + ": " + e.what());
        throw;
    }

    return make_result(TransferStatus::OK, dest_str, written,
                       "Received " + name + " (" + utils::format_bytes(written) + ") into " +
                       dest_str + ".");
}

static TransferResult receive_directory(Connection& conn, Channel::WriteGuard& out,
                                        const fs::path& dest_dir, const std::string& dir_name,
                                        const TransferOptions& opts) {
    Channel& ch = conn.channel();
    if (!file_io::is_safe_file_name(dir_name)) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::REFUSED, dir_name, 0,
                           "Refused unsafe directory name: " + dir_name);
    }

    const fs::path dest = dest_dir / dir_name;
    const std::string dest_str = dest.string();
    std::error_code ec;
    if (fs::exists(dest, ec)) {
        if (!fs::is_directory(dest, ec)) {
            write_ack(out, AckCode::REFUSE);
            return make_result(TransferStatus::REFUSED, dest_str, 0,
                               dest_str + " exists and is not a directory.");
        }
        if (opts.overwrite == OverwritePolicy::REFUSE) {
            write_ack(out, AckCode::REFUSE);
            return make_result(TransferStatus::REFUSED, dest_str, 0,
                               "Directory " + dest_str + " already exists.");
        }
    }
    write_ack(out, AckCode::ACCEPT);

    proto::SizeHeader count;
    if (!proto::parse_size_header(read_block(ch), count) || count.checksum || count.has_iv) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::PROTOCOL_ERROR, dest_str, 0,
                           "Malformed file count for " + dir_name + ".");
    }
    fs::create_directories(dest, ec);
    if (ec) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::RESOURCE_ERROR, dest_str, 0,
                           "Cannot create " + dest_str + ": " + ec.message());
    }
    write_ack(out, AckCode::ACCEPT);

    const std::string prefix = dir_name + "/";
    DirectoryTally tally(dest_str, (size_t)count.size);
    std::string preceding;
    for (u64 i = 0; i < count.size; ++i) {
        if (!expect_marker(ch, preceding)) {
            throw ConnectionError("Connection closed by " + ch.peer_addr() + " during " + dest_str);
        }
        const std::string entry = read_block(ch);
        if (entry.empty()) {
            tally.add(make_result(TransferStatus::ABORTED, dest_str, 0,
                                  "Sender could not open a file in " + dir_name + "."));
        } else if (entry.compare(0, prefix.size(), prefix) != 0 ||
                   !file_io::is_safe_relative_path(entry)) {
            write_ack(out, AckCode::REFUSE);
            tally.add(make_result(TransferStatus::REFUSED, entry, 0,
                                  "Refused unsafe file name: " + entry));
        } else {
            tally.add(receive_one(conn, out, dest_dir, entry, opts));
        }
    }
    ch.unread(preceding.data(), preceding.size());
    return tally.result("Received", dir_name);
}

TransferResult receive_path(Connection& conn, const fs::path& dest_dir,
                            const TransferOptions& opts) {
    Channel& ch = conn.channel();
    Channel::WriteGuard out(ch);

    const std::string name = read_block(ch);
    if (name.empty()) {
        return make_result(TransferStatus::ABORTED, "", 0,
                           "Sender could not open the requested file.");
    }
    if (name.back() == RSHELL_DIR_SUFFIX) {
        return receive_directory(conn, out, dest_dir, name.substr(0, name.size() - 1), opts);
    }
    if (!file_io::is_safe_file_name(name)) {
        write_ack(out, AckCode::REFUSE);
        return make_result(TransferStatus::REFUSED, name, 0, "Refused unsafe file name: " + name);
    }
    return receive_one(conn, out, dest_dir, name, opts);
}

// ============================================================
// Upload request and marker search
// ============================================================

void request_upload(Connection& conn, const std::string& client_path) {
    Channel::WriteGuard out(conn.channel());
    out.write_text(RSHELL_UPLOAD_MARKER);
    write_block(out, client_path);
}

std::string read_upload_request(Connection& conn) {
    return read_block(conn.channel());
}

bool expect_marker(Channel& ch, std::string& preceding) {
    ChannelDecoder decoder;
    std::vector<ChannelDecoder::Event> events;
    u8 buf[4096];

    for (;;) {
        size_t n = ch.read_some(buf, sizeof(buf));
        if (n == 0) return false;

        events.clear();
        size_t used = decoder.feed(buf, n, events);
        ch.unread(buf + used, n - used);

        for (auto& ev : events) {
            switch (ev.type) {
                case ChannelDecoder::EventType::TEXT:
                    preceding += ev.text;
                    break;
                case ChannelDecoder::EventType::TRANSFER:
                    return true;
                case ChannelDecoder::EventType::UPLOAD_REQUEST:
                    throw ProtocolError("Unexpected upload request from " + ch.peer_addr());
            }
        }
    }
}

} // namespace transfer
