#pragma once

// ============================================================
// transfer.hpp -- Moving files over an open connection
//
// Exchange for one file (sender -> receiver, either direction):
//   marker | name block | <ack> | size block | <ack> | payload [| xxh3]
//
// The payload is streamed in RSHELL_CHUNK_SIZE chunks through the
// connection's cipher, under a fresh IV named in the size block, with no
// per-chunk acknowledgment. The receiver never writes more than the
// declared size.
//
// A directory is one exchange whose name ends in '/' and whose size block
// counts the files, followed by one file exchange per regular file below
// it, named "<dir>/<relative path>".
//
// ConnectionError escapes from every call here: the connection is gone
// and the caller ends the session. Everything else is a TransferResult.
// ============================================================

#include "connection.hpp"
#include "progress.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

enum class OverwritePolicy {
    REFUSE,
    OVERWRITE,
};

struct TransferOptions {
    bool checksum{false};
    OverwritePolicy overwrite{OverwritePolicy::REFUSE};
    std::chrono::milliseconds progress_interval{5000};
    ProgressTracker::Sink progress_sink;
};

enum class TransferStatus {
    OK,
    REFUSED,
    ABORTED,
    PROTOCOL_ERROR,
    RESOURCE_ERROR,
    CHECKSUM_MISMATCH,
};

const char* transfer_status_str(TransferStatus s);

struct TransferResult {
    TransferStatus status{TransferStatus::OK};
    u64            bytes{0};
    size_t         files{0};   // files completed
    std::string    path;
    std::string    message;

    bool ok() const { return status == TransferStatus::OK; }
};

namespace transfer {

// Reported when the stream is cut or the payload does not decode.
extern const char* const FAILED_MESSAGE;

// Stream a file or a directory tree to the peer, starting with the
// transfer marker. Holds the channel's write lock throughout.
TransferResult send_path(Connection& conn, const fs::path& source,
                         const TransferOptions& opts);

// Receive one file or directory into 'dest_dir'. The first transfer
// marker has already been consumed.
TransferResult receive_path(Connection& conn, const fs::path& dest_dir,
                            const TransferOptions& opts);

// Host side: ask the client to upload 'client_path'.
void request_upload(Connection& conn, const std::string& client_path);

// Client side: read the path block that follows an upload marker.
std::string read_upload_request(Connection& conn);

// Read until the transfer marker. Text seen before it is returned in
// 'preceding' so the caller can put it back once the exchange is over.
// Returns false if the peer closed first.
bool expect_marker(Channel& ch, std::string& preceding);

} // namespace transfer
