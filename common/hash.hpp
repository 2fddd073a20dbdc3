#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrapper for the optional payload checksum
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <stdexcept>

#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

// Streaming xxh3_64 over the plaintext of one transfer
class StreamHasher64 {
public:
    StreamHasher64() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher64() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher64(const StreamHasher64&) = delete;
    StreamHasher64& operator=(const StreamHasher64&) = delete;

    void reset() {
        XXH3_64bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_64bits_update(state_, data, len);
    }

    u64 digest() const {
        return (u64)XXH3_64bits_digest(state_);
    }

private:
    XXH3_state_t* state_;
};

} // namespace hash
