#pragma once

// ============================================================
// platform.hpp -- Socket API differences between Winsock and POSIX
//
// Everything above this header sees one socket handle type and the
// small set of calls in namespace platform.
// ============================================================

#include <cstdint>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#  include <windows.h>
   using socket_t = SOCKET;
#else
#  include <arpa/inet.h>
#  include <errno.h>
#  include <netdb.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <signal.h>
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <unistd.h>
#  include <cstring>
   using socket_t = int;
#endif

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

namespace platform {

#ifdef _WIN32
constexpr socket_t INVALID_SOCK = INVALID_SOCKET;

inline int  close_socket(socket_t s)    { return closesocket(s); }
inline int  shutdown_socket(socket_t s) { return ::shutdown(s, SD_BOTH); }
inline int  last_error()                { return WSAGetLastError(); }
inline bool interrupted(int err)        { return err == WSAEINTR; }

inline std::string error_str(int err) {
    char buf[256] = {0};
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, err, 0, buf, sizeof(buf), nullptr);
    std::string s = buf;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
    return s;
}
#else
constexpr socket_t INVALID_SOCK = -1;

inline int  close_socket(socket_t s)    { return ::close(s); }
inline int  shutdown_socket(socket_t s) { return ::shutdown(s, SHUT_RDWR); }
inline int  last_error()                { return errno; }
inline bool interrupted(int err)        { return err == EINTR; }

inline std::string error_str(int err) { return std::strerror(err); }
#endif

// Process-wide network setup for the lifetime of main()
class Guard {
public:
    Guard() {
#ifdef _WIN32
        WSADATA wsa;
        int rc = WSAStartup(MAKEWORD(2, 2), &wsa);
        if (rc != 0) throw std::runtime_error("WSAStartup failed: " + std::to_string(rc));
#else
        // A peer that vanishes mid-send must surface as EPIPE
        ::signal(SIGPIPE, SIG_IGN);
#endif
    }

    ~Guard() {
#ifdef _WIN32
        WSACleanup();
#endif
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
};

} // namespace platform
