// ============================================================
// connection.cpp
// ============================================================

#include "connection.hpp"

Connection::Connection(TcpSocket sock, const std::string& password)
    : channel_(std::move(sock))
{
    if (password.empty()) return;
    crypto::Key key = crypto::key_from_hash(crypto::password_hash(password));
    encrypt_ = std::make_unique<crypto::CipherStream>(crypto::CipherStream::Mode::ENCRYPT, key);
    decrypt_ = std::make_unique<crypto::CipherStream>(crypto::CipherStream::Mode::DECRYPT, key);
}
