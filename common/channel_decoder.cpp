// ============================================================
// channel_decoder.cpp
// ============================================================

#include "channel_decoder.hpp"
#include "protocol.hpp"

ChannelDecoder::ChannelDecoder() {
    markers_.emplace_back(RSHELL_TRANSFER_MARKER, EventType::TRANSFER);
    markers_.emplace_back(RSHELL_UPLOAD_MARKER,   EventType::UPLOAD_REQUEST);
}

bool ChannelDecoder::is_marker_prefix(const std::string& s) const {
    for (auto& m : markers_) {
        if (s.size() < m.first.size() && m.first.compare(0, s.size(), s) == 0) {
            return true;
        }
    }
    return false;
}

const std::pair<std::string, ChannelDecoder::EventType>*
ChannelDecoder::match(const std::string& s) const {
    for (auto& m : markers_) {
        if (s == m.first) return &m;
    }
    return nullptr;
}

size_t ChannelDecoder::feed(const u8* data, size_t len, std::vector<Event>& out) {
    std::string text;

    for (size_t i = 0; i < len; ++i) {
        pending_.push_back((char)data[i]);

        if (const auto* m = match(pending_)) {
            if (!text.empty()) out.push_back({EventType::TEXT, std::move(text)});
            out.push_back({m->second, std::string()});
            pending_.clear();
            return i + 1;
        }
        if (is_marker_prefix(pending_)) continue;

        // Release the longest head that cannot start a marker and keep
        // the tail that still might.
        size_t k = 1;
        for (; k < pending_.size(); ++k) {
            if (is_marker_prefix(pending_.substr(k))) break;
        }
        text.append(pending_, 0, k);
        pending_.erase(0, k);
    }

    if (!text.empty()) out.push_back({EventType::TEXT, std::move(text)});
    return len;
}

void ChannelDecoder::flush(std::vector<Event>& out) {
    if (pending_.empty()) return;
    out.push_back({EventType::TEXT, pending_});
    pending_.clear();
}
