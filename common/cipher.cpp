// ============================================================
// cipher.cpp -- OpenSSL EVP implementation of CipherStream
// ============================================================

#include "cipher.hpp"
#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace crypto {

std::string password_hash(const std::string& password) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digest_len = 0;
    if (EVP_Digest(password.data(), password.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return utils::to_hex(digest, digest_len);
}

Key key_from_hash(const std::string& hex_hash) {
    Key key{};
    if (hex_hash.size() != key.size() * 2) {
        throw std::invalid_argument("Password hash must be 64 hex digits");
    }
    if (!utils::from_hex(hex_hash, key.data(), key.size())) {
        throw std::invalid_argument("Password hash is not hex");
    }
    return key;
}

Iv random_iv() {
    Iv iv{};
    if (RAND_bytes(iv.data(), (int)iv.size()) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return iv;
}

CipherStream::CipherStream(Mode mode, const Key& key)
    : mode_(mode), key_(key)
{
    ctx_ = EVP_CIPHER_CTX_new();
    if (!ctx_) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
}

CipherStream::~CipherStream() {
    if (ctx_) EVP_CIPHER_CTX_free(ctx_);
}

void CipherStream::begin(const Iv& iv) {
    active_ = false;
    int rc = mode_ == Mode::ENCRYPT
        ? EVP_EncryptInit_ex(ctx_, EVP_aes_256_ctr(), nullptr, key_.data(), iv.data())
        : EVP_DecryptInit_ex(ctx_, EVP_aes_256_ctr(), nullptr, key_.data(), iv.data());
    if (rc != 1) throw std::runtime_error("Cipher initialization failed");
    active_ = true;
}

std::vector<u8> CipherStream::update(const u8* data, size_t offset, size_t len) {
    if (!active_) throw std::logic_error("Cipher stream used before begin()");
    std::vector<u8> out(len + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    int rc = mode_ == Mode::ENCRYPT
        ? EVP_EncryptUpdate(ctx_, out.data(), &out_len, data + offset, (int)len)
        : EVP_DecryptUpdate(ctx_, out.data(), &out_len, data + offset, (int)len);
    if (rc != 1) throw std::runtime_error("Cipher update failed");
    out.resize((size_t)out_len);
    return out;
}

std::vector<u8> CipherStream::do_final() {
    if (!active_) throw std::logic_error("Cipher stream finished twice");
    active_ = false;
    std::vector<u8> out(EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    int rc = mode_ == Mode::ENCRYPT
        ? EVP_EncryptFinal_ex(ctx_, out.data(), &out_len)
        : EVP_DecryptFinal_ex(ctx_, out.data(), &out_len);
    if (rc != 1) throw std::runtime_error("Cipher finalization failed");
    out.resize((size_t)out_len);
    return out;
}

} // namespace crypto
