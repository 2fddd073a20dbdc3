#pragma once

// ============================================================
// cipher.hpp -- Password-keyed stream cipher for transfer payloads
//
// AES-256-CTR through OpenSSL EVP: output length equals input length,
// so the declared file size is also the ciphertext size. Every transfer
// runs under its own random IV, which the sender announces in the size
// block; a stream must be started with begin() before update().
// A wrong password is not detected; it produces garbage plaintext.
// ============================================================

#include "platform.hpp"
#include <array>
#include <string>
#include <vector>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace crypto {

using Key = std::array<u8, 32>;
using Iv  = std::array<u8, 16>;

// Lowercase hex SHA-256 of the password
std::string password_hash(const std::string& password);

// The 32 raw bytes behind a hex password hash
Key key_from_hash(const std::string& hex_hash);

// Fresh IV from the OpenSSL CSPRNG
Iv random_iv();

class CipherStream {
public:
    enum class Mode { ENCRYPT, DECRYPT };

    CipherStream(Mode mode, const Key& key);
    ~CipherStream();

    CipherStream(const CipherStream&) = delete;
    CipherStream& operator=(const CipherStream&) = delete;

    // Start one transfer under 'iv'. Restarts a stream left unfinished.
    void begin(const Iv& iv);

    // Transform data[offset, offset+len). May hold back a partial block.
    std::vector<u8> update(const u8* data, size_t offset, size_t len);

    // Flush held-back bytes and end the transfer; begin() is required
    // before the next update().
    std::vector<u8> do_final();

    Mode mode() const { return mode_; }
    bool active() const { return active_; }

private:
    Mode            mode_;
    Key             key_;
    EVP_CIPHER_CTX* ctx_{nullptr};
    bool            active_{false};
};

} // namespace crypto
