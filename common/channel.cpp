// ============================================================
// channel.cpp -- Channel implementation
// ============================================================

#include "channel.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>

static constexpr size_t READ_AHEAD = 4096;
// A command line longer than this is a broken or hostile peer
static constexpr size_t MAX_LINE_LEN = 64 * 1024;

Channel::Channel(TcpSocket sock)
    : sock_(std::move(sock))
{
    peer_ = sock_.peer_addr();
}

bool Channel::fill() {
    if (rpos_ == rbuf_.size()) {
        rbuf_.clear();
        rpos_ = 0;
    }
    size_t old = rbuf_.size();
    rbuf_.resize(old + READ_AHEAD);
    size_t n = sock_.recv_some(rbuf_.data() + old, READ_AHEAD);
    rbuf_.resize(old + n);
    return n > 0;
}

size_t Channel::read_some(void* buf, size_t len) {
    if (len == 0) return 0;
    if (buffered() == 0) {
        // Nothing read ahead: go straight to the socket
        return sock_.recv_some(buf, len);
    }
    size_t n = std::min(len, buffered());
    std::memcpy(buf, rbuf_.data() + rpos_, n);
    rpos_ += n;
    return n;
}

void Channel::read_exact(void* buf, size_t len) {
    u8* p = static_cast<u8*>(buf);
    while (len > 0) {
        size_t n = read_some(p, len);
        if (n == 0) {
            throw ConnectionError("Connection closed by " + peer_);
        }
        p += n;
        len -= n;
    }
}

bool Channel::read_line(std::string& line) {
    line.clear();
    for (;;) {
        auto begin = rbuf_.begin() + (std::ptrdiff_t)rpos_;
        auto nl = std::find(begin, rbuf_.end(), (u8)'\n');
        if (nl != rbuf_.end()) {
            line.append(begin, nl);
            rpos_ = (size_t)(nl - rbuf_.begin()) + 1;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        line.append(begin, rbuf_.end());
        rpos_ = rbuf_.size();
        if (line.size() > MAX_LINE_LEN) {
            throw ConnectionError("Line from " + peer_ + " exceeds " +
                                  std::to_string(MAX_LINE_LEN) + " bytes");
        }
        if (!fill()) {
            if (line.empty()) return false;
            // Peer closed after a final unterminated line
            if (line.back() == '\r') line.pop_back();
            return true;
        }
    }
}

void Channel::unread(const void* data, size_t len) {
    if (len == 0) return;
    const u8* p = static_cast<const u8*>(data);
    if (rpos_ >= len) {
        rpos_ -= len;
        std::memcpy(rbuf_.data() + rpos_, p, len);
        return;
    }
    std::vector<u8> merged;
    merged.reserve(len + buffered());
    merged.insert(merged.end(), p, p + len);
    merged.insert(merged.end(), rbuf_.begin() + (std::ptrdiff_t)rpos_, rbuf_.end());
    rbuf_.swap(merged);
    rpos_ = 0;
}

void Channel::write_all(const void* data, size_t len) {
    std::lock_guard<std::mutex> lk(write_mutex_);
    sock_.send_all(data, len);
}
