#pragma once

// ============================================================
// protocol_io.hpp -- Header block encoding and byte-order helpers
// ============================================================

#include "protocol.hpp"
#include "utils.hpp"
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

using HeaderBlock = std::array<u8, RSHELL_HEADER_BLOCK_SIZE>;

inline u64 hton64(u64 v) {
#if defined(_WIN32)
    return (((u64)htonl((u32)(v & 0xFFFFFFFFull))) << 32) | htonl((u32)(v >> 32));
#else
    return htobe64(v);
#endif
}

inline u64 ntoh64(u64 v) {
#if defined(_WIN32)
    return (((u64)ntohl((u32)(v & 0xFFFFFFFFull))) << 32) | ntohl((u32)(v >> 32));
#else
    return be64toh(v);
#endif
}

inline void encode_u64(u64 v, u8 out[8]) {
    u64 be = hton64(v);
    std::memcpy(out, &be, 8);
}

inline u64 decode_u64(const u8 in[8]) {
    u64 be;
    std::memcpy(&be, in, 8);
    return ntoh64(be);
}

// ---- Fixed-size text blocks ----

// Text longer than the block is truncated; the rest is NUL padding.
inline HeaderBlock encode_block(const std::string& text) {
    HeaderBlock block{};
    size_t n = text.size() < block.size() ? text.size() : block.size();
    std::memcpy(block.data(), text.data(), n);
    return block;
}

// Strip NUL padding and surrounding whitespace/control bytes.
inline std::string trim_block(const u8* data, size_t len) {
    size_t begin = 0;
    size_t end   = len;
    while (begin < end && data[begin] <= ' ') ++begin;
    while (end > begin && data[end - 1] <= ' ') --end;
    return std::string(reinterpret_cast<const char*>(data) + begin, end - begin);
}

inline std::string decode_block(const HeaderBlock& block) {
    return trim_block(block.data(), block.size());
}

// ---- Size block ----

struct SizeHeader {
    u64  size{0};
    bool checksum{false};
    bool has_iv{false};
    std::array<u8, RSHELL_IV_LEN> iv{};
};

inline std::string format_size_header(const SizeHeader& h) {
    std::string s = std::to_string(h.size);
    if (h.checksum) s += ";" + RSHELL_CHECKSUM_TAG;
    if (h.has_iv) s += ";" + RSHELL_IV_TAG + utils::to_hex(h.iv.data(), h.iv.size());
    return s;
}

// Returns false unless the size is a plain decimal that fits in 64 bits
// and every tag is known.
inline bool parse_size_header(const std::string& text, SizeHeader& out) {
    out = SizeHeader{};
    std::vector<std::string> fields = utils::split(text, ';');

    const std::string& digits = fields[0];
    if (digits.empty() || digits.size() > 20) return false;
    u64 value = 0;
    for (char c : digits) {
        if (!std::isdigit((unsigned char)c)) return false;
        u64 d = (u64)(c - '0');
        if (value > (UINT64_MAX - d) / 10) return false;
        value = value * 10 + d;
    }
    out.size = value;

    for (size_t i = 1; i < fields.size(); ++i) {
        const std::string& f = fields[i];
        if (f == RSHELL_CHECKSUM_TAG) {
            out.checksum = true;
        } else if (f.compare(0, RSHELL_IV_TAG.size(), RSHELL_IV_TAG) == 0) {
            if (!utils::from_hex(f.substr(RSHELL_IV_TAG.size()), out.iv.data(), out.iv.size())) {
                return false;
            }
            out.has_iv = true;
        } else {
            return false;
        }
    }
    return true;
}

} // namespace proto
