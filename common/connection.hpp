#pragma once

// ============================================================
// connection.hpp -- One live remote-shell connection
//
// The channel plus the cipher pair keyed from the shared password.
// Without a password both ciphers are absent and payloads travel raw.
// Owned by exactly one worker (host) or session (client).
// ============================================================

#include "channel.hpp"
#include "cipher.hpp"
#include <memory>
#include <string>

class Connection {
public:
    Connection(TcpSocket sock, const std::string& password);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Channel& channel() { return channel_; }

    crypto::CipherStream* encryptor() { return encrypt_.get(); }
    crypto::CipherStream* decryptor() { return decrypt_.get(); }
    bool encrypted() const { return encrypt_ != nullptr; }

    std::string peer_addr() const { return channel_.peer_addr(); }

private:
    Channel channel_;
    std::unique_ptr<crypto::CipherStream> encrypt_;
    std::unique_ptr<crypto::CipherStream> decrypt_;
};
