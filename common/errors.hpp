#pragma once

// ============================================================
// errors.hpp -- Exception taxonomy for the remote shell
//
//   ConnectionError  socket closed/reset; ends the whole session
//   ProtocolError    malformed transfer header; ends only the transfer
//   ResourceError    destination cannot be created or written
//
// A wrong password has no exception of its own: it is not detectable
// and shows up as one of the above (or a checksum mismatch).
// ============================================================

#include <stdexcept>
#include <string>

class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {}
};

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& msg) : std::runtime_error(msg) {}
};
