#pragma once

// protocol.hpp -- Wire constants for the rshell command/transfer channel

#include "platform.hpp"
#include <string>

// The command channel is plain newline-terminated text. A transfer is
// announced by writing one of the markers below straight into that text
// stream; everything after the marker belongs to the transfer exchange
// until the declared payload size has been streamed.

// Sender -> receiver: "a file follows" (name block, size block, payload)
static const std::string RSHELL_TRANSFER_MARKER = "\x10#RSHELL-TRANSFER#\x10";
// Host -> client: "send me this file" (followed by one path block)
static const std::string RSHELL_UPLOAD_MARKER   = "\x10#RSHELL-UPLOAD#\x10";

// Name, size and upload-path blocks are fixed-size, NUL padded.
static constexpr size_t RSHELL_HEADER_BLOCK_SIZE = 1024;
// Payload is streamed in chunks of this size; the final chunk carries
// whatever remains.
static constexpr size_t RSHELL_CHUNK_SIZE        = 1024;

// Single-byte replies from the receiver after the name and size blocks.
enum class AckCode : u8 {
    ACCEPT = 0,
    REFUSE = 1,
};

// Size block: "<decimal size>[;xxh3][;iv=<32 hex digits>]".
// "xxh3" switches on the 8-byte payload trailer; "iv=" carries the
// per-transfer IV of an encrypted payload.
static const std::string RSHELL_CHECKSUM_TAG = "xxh3";
static const std::string RSHELL_IV_TAG       = "iv=";
static constexpr size_t  RSHELL_CHECKSUM_LEN = 8;
static constexpr size_t  RSHELL_IV_LEN       = 16;

// A name block ending in '/' announces a directory. Its size block holds
// the number of files that follow, each as a complete transfer exchange
// named by its path relative to the directory's parent. No payload.
static constexpr char RSHELL_DIR_SUFFIX = '/';

enum class TransferDirection : u8 {
    DOWNLOAD = 0,   // host -> client
    UPLOAD   = 1,   // client -> host
};

inline const char* direction_str(TransferDirection d) {
    return d == TransferDirection::DOWNLOAD ? "download" : "upload";
}
