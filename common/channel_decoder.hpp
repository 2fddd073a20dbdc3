#pragma once

// ============================================================
// channel_decoder.hpp -- Splits the incoming byte stream into text and
// transfer markers
//
// Markers are written into the text stream as plain bytes, so a single
// read may end in the middle of one. The decoder keeps the bytes that
// could still be the start of a marker and only releases them as text
// once they no longer can be. Feeding stops right after a complete
// marker; the caller owns the remaining bytes of that read (they are the
// beginning of the transfer exchange).
// ============================================================

#include "platform.hpp"
#include <string>
#include <utility>
#include <vector>

class ChannelDecoder {
public:
    enum class EventType {
        TEXT,
        TRANSFER,        // RSHELL_TRANSFER_MARKER
        UPLOAD_REQUEST,  // RSHELL_UPLOAD_MARKER
    };

    struct Event {
        EventType   type;
        std::string text;  // TEXT only
    };

    ChannelDecoder();

    // Consume bytes up to and including the first complete marker.
    // Appends events to 'out' and returns how many bytes were consumed;
    // a return value below 'len' means a marker ended at that position.
    size_t feed(const u8* data, size_t len, std::vector<Event>& out);

    // Release held-back bytes as text (peer closed, nothing more comes).
    void flush(std::vector<Event>& out);

    size_t pending() const { return pending_.size(); }

private:
    std::vector<std::pair<std::string, EventType>> markers_;
    std::string pending_;

    bool is_marker_prefix(const std::string& s) const;
    const std::pair<std::string, EventType>* match(const std::string& s) const;
};
