#include "../common/channel_decoder.hpp"
#include "../common/protocol.hpp"

#include <iostream>
#include <string>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

struct Decoded {
    std::string text;
    int transfers{0};
    int uploads{0};
    std::string after;   // bytes handed back after the first marker
};

// Feed 'parts' in order, stopping the decoder at the first marker the way
// the reader does, and collect what comes out.
static Decoded run_parts(const std::vector<std::string>& parts) {
    ChannelDecoder decoder;
    Decoded d;
    bool stopped = false;
    for (auto& part : parts) {
        if (stopped) {
            d.after += part;
            continue;
        }
        std::vector<ChannelDecoder::Event> events;
        size_t used = decoder.feed(reinterpret_cast<const u8*>(part.data()), part.size(), events);
        for (auto& ev : events) {
            if (ev.type == ChannelDecoder::EventType::TEXT) d.text += ev.text;
            if (ev.type == ChannelDecoder::EventType::TRANSFER) d.transfers++;
            if (ev.type == ChannelDecoder::EventType::UPLOAD_REQUEST) d.uploads++;
        }
        if (used < part.size() || d.transfers + d.uploads > 0) {
            d.after += part.substr(used);
            stopped = d.transfers + d.uploads > 0;
        }
    }
    if (!stopped) {
        std::vector<ChannelDecoder::Event> events;
        decoder.flush(events);
        for (auto& ev : events) d.text += ev.text;
    }
    return d;
}

static bool test_plain_text_passes_through() {
    Decoded d = run_parts({"hello\n", "/home/user> "});
    TEST_ASSERT(d.text == "hello\n/home/user> ", "text changed: " << d.text);
    TEST_ASSERT(d.transfers == 0 && d.uploads == 0, "phantom marker");
    return true;
}

static bool test_marker_split_at_every_point() {
    const std::string before = "Downloading...\n";
    const std::string after  = std::string("report.txt") + std::string(4, '\0');
    const std::string stream = before + RSHELL_TRANSFER_MARKER + after;

    for (size_t split = 0; split <= stream.size(); ++split) {
        Decoded d = run_parts({stream.substr(0, split), stream.substr(split)});
        TEST_ASSERT(d.transfers == 1, "marker missed at split " << split);
        TEST_ASSERT(d.text == before, "text wrong at split " << split << ": " << d.text);
        TEST_ASSERT(d.after == after, "leftover wrong at split " << split);
    }
    return true;
}

static bool test_marker_one_byte_at_a_time() {
    const std::string stream = "x" + RSHELL_UPLOAD_MARKER + "/tmp/a";
    std::vector<std::string> parts;
    for (char c : stream) parts.push_back(std::string(1, c));

    Decoded d = run_parts(parts);
    TEST_ASSERT(d.uploads == 1, "upload marker missed");
    TEST_ASSERT(d.text == "x", "text wrong: " << d.text);
    TEST_ASSERT(d.after == "/tmp/a", "leftover wrong: " << d.after);
    return true;
}

static bool test_false_prefix_is_released() {
    // Shares the marker's first bytes, then diverges
    const std::string almost = "\x10#RSHELL-TRANSFX";
    Decoded d = run_parts({almost.substr(0, 5), almost.substr(5), "done\n"});
    TEST_ASSERT(d.transfers == 0, "false prefix taken for a marker");
    TEST_ASSERT(d.text == almost + "done\n", "bytes lost around false prefix");
    return true;
}

static bool test_prefix_restart_inside_false_prefix() {
    // A failed match whose tail starts the real marker
    const std::string stream = "\x10#RS" + RSHELL_TRANSFER_MARKER + "Z";
    for (size_t split = 0; split <= stream.size(); ++split) {
        Decoded d = run_parts({stream.substr(0, split), stream.substr(split)});
        TEST_ASSERT(d.transfers == 1, "marker missed at split " << split);
        TEST_ASSERT(d.text == "\x10#RS", "text wrong at split " << split);
        TEST_ASSERT(d.after == "Z", "leftover wrong at split " << split);
    }
    return true;
}

static bool test_flush_on_close() {
    ChannelDecoder decoder;
    std::vector<ChannelDecoder::Event> events;
    const std::string tail = "bye\x10#RSH";
    decoder.feed(reinterpret_cast<const u8*>(tail.data()), tail.size(), events);
    TEST_ASSERT(decoder.pending() == 5, "expected 5 held bytes, got " << decoder.pending());
    decoder.flush(events);
    std::string text;
    for (auto& ev : events) text += ev.text;
    TEST_ASSERT(text == tail, "flush lost bytes");
    TEST_ASSERT(decoder.pending() == 0, "flush kept bytes");
    return true;
}

int main() {
    std::cout << "--- ChannelDecoder tests ---" << std::endl;

    if (test_plain_text_passes_through())        std::cout << "PASS: plain text" << std::endl;
    if (test_marker_split_at_every_point())      std::cout << "PASS: split marker" << std::endl;
    if (test_marker_one_byte_at_a_time())        std::cout << "PASS: byte-wise marker" << std::endl;
    if (test_false_prefix_is_released())         std::cout << "PASS: false prefix" << std::endl;
    if (test_prefix_restart_inside_false_prefix()) std::cout << "PASS: overlapping prefix" << std::endl;
    if (test_flush_on_close())                   std::cout << "PASS: flush" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
