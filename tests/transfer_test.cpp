#include "../common/transfer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static std::vector<uint8_t> read_all_bytes(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return {};
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static bool write_random_file(const fs::path& p, size_t bytes, uint32_t seed) {
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    for (size_t i = 0; i < bytes; ++i) out.put((char)dist(rng));
    out.flush();
    return static_cast<bool>(out);
}

// Both ends of one loopback TCP connection
struct LinkedPair {
    std::unique_ptr<Connection> sender;
    std::unique_ptr<Connection> receiver;
};

static LinkedPair make_pair(const std::string& sender_pw, const std::string& receiver_pw) {
    TcpSocket listener;
    listener.bind_and_listen("127.0.0.1", 0);
    TcpSocket client;
    client.connect("127.0.0.1", listener.local_port());
    TcpSocket accepted = listener.accept();

    LinkedPair p;
    p.sender   = std::make_unique<Connection>(std::move(client), sender_pw);
    p.receiver = std::make_unique<Connection>(std::move(accepted), receiver_pw);
    return p;
}

struct Outcome {
    TransferResult sent;
    TransferResult received;
    bool marker_seen{false};
    std::string preceding;
};

// Run sender and receiver concurrently over 'pair'
static Outcome run_transfer(LinkedPair& pair, const fs::path& source, const fs::path& dest_dir,
                            const TransferOptions& send_opts, const TransferOptions& recv_opts) {
    Outcome o;
    std::thread sender([&] {
        o.sent = transfer::send_path(*pair.sender, source, send_opts);
    });
    o.marker_seen = transfer::expect_marker(pair.receiver->channel(), o.preceding);
    if (o.marker_seen) {
        o.received = transfer::receive_path(*pair.receiver, dest_dir, recv_opts);
    }
    sender.join();
    return o;
}

static fs::path fresh_dir(const fs::path& workdir, const std::string& name) {
    fs::path d = workdir / name;
    std::error_code ec;
    fs::remove_all(d, ec);
    fs::create_directories(d);
    return d;
}

static bool test_plain_5000_bytes(const fs::path& workdir) {
    fs::path src = workdir / "plain.bin";
    TEST_ASSERT(write_random_file(src, 5000, 1), "cannot write source");
    fs::path out = fresh_dir(workdir, "plain_out");

    LinkedPair pair = make_pair("", "");
    TransferOptions opts;
    Outcome o = run_transfer(pair, src, out, opts, opts);

    TEST_ASSERT(o.marker_seen, "marker not seen");
    TEST_ASSERT(o.sent.ok(), "send failed: " << o.sent.message);
    TEST_ASSERT(o.received.ok(), "receive failed: " << o.received.message);
    TEST_ASSERT(o.received.bytes == 5000, "wrong byte count " << o.received.bytes);
    TEST_ASSERT(read_all_bytes(out / "plain.bin") == read_all_bytes(src), "content differs");
    return true;
}

static bool test_encrypted_sizes(const fs::path& workdir) {
    for (size_t size : {0u, 1u, 1023u, 1024u, 1025u, 4096u, 5000u}) {
        fs::path src = workdir / ("enc_" + std::to_string(size) + ".bin");
        TEST_ASSERT(write_random_file(src, size, (uint32_t)size), "cannot write source");
        fs::path out = fresh_dir(workdir, "enc_out_" + std::to_string(size));

        LinkedPair pair = make_pair("hunter2", "hunter2");
        TransferOptions opts;
        Outcome o = run_transfer(pair, src, out, opts, opts);

        TEST_ASSERT(o.received.ok(), "size " << size << ": " << o.received.message);
        TEST_ASSERT(fs::file_size(out / src.filename()) == size, "size " << size << " truncated/padded");
        TEST_ASSERT(read_all_bytes(out / src.filename()) == read_all_bytes(src),
                    "size " << size << ": decrypt(encrypt(x)) != x");
    }
    return true;
}

static bool test_checksum_mode(const fs::path& workdir) {
    fs::path src = workdir / "sum.bin";
    TEST_ASSERT(write_random_file(src, 3000, 5), "cannot write source");

    TransferOptions strict;
    strict.checksum = true;
    TransferOptions recv;

    LinkedPair good = make_pair("pw", "pw");
    Outcome o = run_transfer(good, src, fresh_dir(workdir, "sum_ok"), strict, recv);
    TEST_ASSERT(o.received.ok(), "checksum transfer failed: " << o.received.message);

    LinkedPair bad = make_pair("pw", "other");
    o = run_transfer(bad, src, fresh_dir(workdir, "sum_bad"), strict, recv);
    TEST_ASSERT(o.received.status == TransferStatus::CHECKSUM_MISMATCH,
                "wrong password not caught: " << transfer_status_str(o.received.status));
    TEST_ASSERT(o.received.bytes == 3000, "mismatched file not fully written");
    return true;
}

static bool test_refuse_existing_keeps_channel(const fs::path& workdir) {
    fs::path src = workdir / "exists.txt";
    TEST_ASSERT(write_random_file(src, 100, 9), "cannot write source");
    fs::path out = fresh_dir(workdir, "exists_out");
    { std::ofstream(out / "exists.txt") << "keep me"; }

    LinkedPair pair = make_pair("", "");
    TransferOptions opts;
    Outcome o = run_transfer(pair, src, out, opts, opts);

    TEST_ASSERT(o.sent.status == TransferStatus::REFUSED, "sender not refused");
    TEST_ASSERT(o.received.status == TransferStatus::REFUSED, "receiver did not refuse");
    std::vector<uint8_t> kept = read_all_bytes(out / "exists.txt");
    TEST_ASSERT(std::string(kept.begin(), kept.end()) == "keep me", "existing file replaced");

    // The text channel is still in step
    pair.sender->channel().write_text("still here\n");
    std::string line;
    TEST_ASSERT(pair.receiver->channel().read_line(line) && line == "still here",
                "channel out of step after refusal: " << line);

    TransferOptions overwrite;
    overwrite.overwrite = OverwritePolicy::OVERWRITE;
    o = run_transfer(pair, src, out, opts, overwrite);
    TEST_ASSERT(o.received.ok(), "overwrite refused: " << o.received.message);
    TEST_ASSERT(read_all_bytes(out / "exists.txt") == read_all_bytes(src), "not overwritten");
    return true;
}

static bool test_missing_source(const fs::path& workdir) {
    LinkedPair pair = make_pair("", "");
    TransferOptions opts;
    Outcome o = run_transfer(pair, workdir / "does_not_exist.bin", fresh_dir(workdir, "missing"),
                             opts, opts);
    TEST_ASSERT(o.sent.status == TransferStatus::RESOURCE_ERROR, "sender did not report missing file");
    TEST_ASSERT(o.received.status == TransferStatus::ABORTED, "receiver did not see empty name");
    return true;
}

static bool test_uncreatable_destination(const fs::path& workdir) {
    fs::path src = workdir / "nowhere.bin";
    TEST_ASSERT(write_random_file(src, 2000, 4), "cannot write source");
    fs::path blocker = workdir / "blocker";
    { std::ofstream(blocker) << "x"; }

    LinkedPair pair = make_pair("", "");
    TransferOptions opts;
    Outcome o = run_transfer(pair, src, blocker / "sub", opts, opts);
    TEST_ASSERT(o.received.status == TransferStatus::RESOURCE_ERROR,
                "receiver status " << transfer_status_str(o.received.status));
    TEST_ASSERT(o.sent.status == TransferStatus::REFUSED, "sender kept streaming");
    return true;
}

static bool test_text_before_marker_kept(const fs::path& workdir) {
    fs::path src = workdir / "after_text.bin";
    TEST_ASSERT(write_random_file(src, 10, 2), "cannot write source");

    LinkedPair pair = make_pair("", "");
    pair.sender->channel().write_text("typed early\n");
    TransferOptions opts;
    Outcome o = run_transfer(pair, src, fresh_dir(workdir, "after_text"), opts, opts);
    TEST_ASSERT(o.received.ok(), "transfer after text failed");
    TEST_ASSERT(o.preceding == "typed early\n", "preceding text lost: " << o.preceding);
    return true;
}

static bool test_directory_tree(const fs::path& workdir) {
    fs::path album = fresh_dir(workdir, "album");
    fs::create_directories(album / "sub" / "deeper");
    TEST_ASSERT(write_random_file(album / "a.bin", 3000, 21), "cannot write a.bin");
    TEST_ASSERT(write_random_file(album / "sub" / "b.bin", 1, 22), "cannot write b.bin");
    TEST_ASSERT(write_random_file(album / "sub" / "deeper" / "v1..2.txt", 1500, 23),
                "cannot write v1..2.txt");
    fs::path out = fresh_dir(workdir, "album_out");

    LinkedPair pair = make_pair("pw", "pw");
    TransferOptions opts;
    opts.checksum = true;
    Outcome o = run_transfer(pair, album, out, opts, TransferOptions());

    TEST_ASSERT(o.sent.ok(), "directory send failed: " << o.sent.message);
    TEST_ASSERT(o.received.ok(), "directory receive failed: " << o.received.message);
    TEST_ASSERT(o.sent.files == 3 && o.received.files == 3, "file count " << o.received.files);
    TEST_ASSERT(o.received.bytes == 4501, "byte total " << o.received.bytes);
    for (const char* rel : {"a.bin", "sub/b.bin", "sub/deeper/v1..2.txt"}) {
        TEST_ASSERT(read_all_bytes(out / "album" / rel) == read_all_bytes(album / rel),
                    rel << " differs");
    }

    // Second copy into the same place is refused as a whole, channel intact
    o = run_transfer(pair, album, out, opts, TransferOptions());
    TEST_ASSERT(o.received.status == TransferStatus::REFUSED, "existing directory not refused");
    TEST_ASSERT(o.sent.status == TransferStatus::REFUSED, "sender not told of refusal");
    pair.sender->channel().write_text("next\n");
    std::string line;
    TEST_ASSERT(pair.receiver->channel().read_line(line) && line == "next",
                "channel out of step after directory refusal");

    // With overwrite the tree is merged, including into existing subdirectories
    TransferOptions overwrite;
    overwrite.overwrite = OverwritePolicy::OVERWRITE;
    o = run_transfer(pair, album, out, opts, overwrite);
    TEST_ASSERT(o.received.ok() && o.received.files == 3, "overwrite of tree failed");
    return true;
}

static bool test_directory_onto_file(const fs::path& workdir) {
    fs::path dir = fresh_dir(workdir, "clash");
    TEST_ASSERT(write_random_file(dir / "x.bin", 10, 31), "cannot write source");
    fs::path out = fresh_dir(workdir, "clash_out");
    { std::ofstream(out / "clash") << "a file"; }

    LinkedPair pair = make_pair("", "");
    TransferOptions overwrite;
    overwrite.overwrite = OverwritePolicy::OVERWRITE;
    Outcome o = run_transfer(pair, dir, out, overwrite, overwrite);
    TEST_ASSERT(o.received.status == TransferStatus::REFUSED, "directory replaced a file");
    TEST_ASSERT(fs::is_regular_file(out / "clash"), "existing file touched");
    return true;
}

// The receiver has no password, so it stores the ciphertext as sent
static std::vector<uint8_t> encrypted_copy(const fs::path& src, const fs::path& out) {
    LinkedPair pair = make_pair("secret", "");
    TransferOptions opts;
    Outcome o = run_transfer(pair, src, out, opts, opts);
    if (!o.received.ok()) return {};
    return read_all_bytes(out / src.filename());
}

static bool test_keystream_differs_per_transfer(const fs::path& workdir) {
    fs::path src = workdir / "repeat.bin";
    TEST_ASSERT(write_random_file(src, 4096, 41), "cannot write source");
    std::vector<uint8_t> plain = read_all_bytes(src);

    std::vector<uint8_t> first  = encrypted_copy(src, fresh_dir(workdir, "repeat_1"));
    std::vector<uint8_t> second = encrypted_copy(src, fresh_dir(workdir, "repeat_2"));
    TEST_ASSERT(first.size() == plain.size() && second.size() == plain.size(),
                "ciphertext length differs from plaintext");
    TEST_ASSERT(first != plain, "payload not encrypted");
    TEST_ASSERT(first != second, "same file encrypted identically twice");

    // Same key stream would make c1 ^ c2 == 0 everywhere
    size_t equal = 0;
    for (size_t i = 0; i < plain.size(); ++i) {
        if (first[i] == second[i]) ++equal;
    }
    TEST_ASSERT(equal < plain.size() / 16, "key stream repeated: " << equal << " equal bytes");

    // Both transfers still decrypt on a receiver with the password
    LinkedPair pair = make_pair("secret", "secret");
    TransferOptions opts;
    opts.overwrite = OverwritePolicy::OVERWRITE;
    fs::path out = fresh_dir(workdir, "repeat_ok");
    for (int i = 0; i < 2; ++i) {
        Outcome o = run_transfer(pair, src, out, opts, opts);
        TEST_ASSERT(o.received.ok(), "transfer " << i << ": " << o.received.message);
        TEST_ASSERT(read_all_bytes(out / "repeat.bin") == plain, "transfer " << i << " garbled");
    }
    return true;
}

static bool test_write_failure_drains_payload(const fs::path& workdir) {
    if (!fs::exists("/dev/full")) {
        std::cout << "SKIP: no /dev/full" << std::endl;
        return true;
    }
    fs::path src = workdir / "full.bin";
    TEST_ASSERT(write_random_file(src, 5000, 51), "cannot write source");
    fs::path out = fresh_dir(workdir, "full_out");
    fs::create_symlink("/dev/full", out / "full.bin");

    LinkedPair pair = make_pair("pw", "pw");
    TransferOptions overwrite;
    overwrite.overwrite = OverwritePolicy::OVERWRITE;
    overwrite.checksum = true;
    Outcome o = run_transfer(pair, src, out, overwrite, overwrite);

    TEST_ASSERT(o.sent.ok(), "sender saw the receiver's disk error");
    TEST_ASSERT(o.received.status == TransferStatus::RESOURCE_ERROR,
                "write failure reported as " << transfer_status_str(o.received.status));

    // Payload and trailer were consumed: the next line is plain text
    pair.sender->channel().write_text("after failure\n");
    std::string line;
    TEST_ASSERT(pair.receiver->channel().read_line(line) && line == "after failure",
                "channel out of step after write failure: " << line);
    return true;
}

static bool test_text_typed_before_ack(const fs::path& workdir) {
    fs::path src = workdir / "typed.bin";
    TEST_ASSERT(write_random_file(src, 3000, 61), "cannot write source");
    fs::path out = fresh_dir(workdir, "typed_out");

    LinkedPair pair = make_pair("", "");
    TransferOptions opts;
    TransferResult sent;
    std::thread sender([&] { sent = transfer::send_path(*pair.sender, src, opts); });

    std::string preceding;
    TEST_ASSERT(transfer::expect_marker(pair.receiver->channel(), preceding), "no marker");
    // Lines the receiving side sent before it noticed the transfer
    pair.receiver->channel().write_text("ls\npwd\n");
    TransferResult received = transfer::receive_path(*pair.receiver, out, opts);
    sender.join();

    TEST_ASSERT(sent.ok(), "typed text broke the send: " << sent.message);
    TEST_ASSERT(received.ok(), "typed text broke the receive: " << received.message);
    TEST_ASSERT(read_all_bytes(out / "typed.bin") == read_all_bytes(src), "content differs");

    std::string line;
    TEST_ASSERT(pair.sender->channel().read_line(line) && line == "ls", "first line lost: " << line);
    TEST_ASSERT(pair.sender->channel().read_line(line) && line == "pwd", "second line lost: " << line);
    return true;
}

static void write_block(Channel& ch, const std::string& text) {
    proto::HeaderBlock block = proto::encode_block(text);
    ch.write_all(block.data(), block.size());
}

static bool test_connection_lost_mid_payload(const fs::path& workdir) {
    fs::path out = fresh_dir(workdir, "cut_out");
    LinkedPair pair = make_pair("", "");

    // A sender that announces 5000 bytes and hangs up after 2000
    std::thread sender([&] {
        Channel& ch = pair.sender->channel();
        u8 ack = 0xFF;
        try {
            ch.write_text(RSHELL_TRANSFER_MARKER);
            write_block(ch, "cut.bin");
            ch.read_exact(&ack, 1);
            write_block(ch, "5000");
            ch.read_exact(&ack, 1);
            std::vector<u8> part(2000, 0x5A);
            ch.write_all(part.data(), part.size());
        } catch (const ConnectionError&) {
        }
        ch.shutdown();
    });

    std::string preceding;
    TEST_ASSERT(transfer::expect_marker(pair.receiver->channel(), preceding), "no marker");
    bool lost = false;
    try {
        transfer::receive_path(*pair.receiver, out, TransferOptions());
    } catch (const ConnectionError&) {
        lost = true;
    }
    sender.join();

    TEST_ASSERT(lost, "cut stream did not end the session");
    TEST_ASSERT(fs::exists(out / "cut.bin"), "partial file removed");
    TEST_ASSERT(fs::file_size(out / "cut.bin") == 2000, "partial size " << fs::file_size(out / "cut.bin"));
    return true;
}

int main() {
    platform::Guard platform_guard;
    Logger::get().set_transfer_error_log("");
    const fs::path workdir = fs::temp_directory_path() / "rshell_transfer_tests";
    std::error_code ec;
    fs::remove_all(workdir, ec);
    fs::create_directories(workdir, ec);

    std::cout << "--- Transfer tests (" << workdir << ") ---" << std::endl;

    if (test_plain_5000_bytes(workdir))              std::cout << "PASS: plain 5000 bytes" << std::endl;
    if (test_encrypted_sizes(workdir))               std::cout << "PASS: encrypted sizes" << std::endl;
    if (test_checksum_mode(workdir))                 std::cout << "PASS: checksum mode" << std::endl;
    if (test_refuse_existing_keeps_channel(workdir)) std::cout << "PASS: refuse existing" << std::endl;
    if (test_missing_source(workdir))                std::cout << "PASS: missing source" << std::endl;
    if (test_uncreatable_destination(workdir))       std::cout << "PASS: uncreatable destination" << std::endl;
    if (test_text_before_marker_kept(workdir))       std::cout << "PASS: text before marker" << std::endl;
    if (test_directory_tree(workdir))                std::cout << "PASS: directory tree" << std::endl;
    if (test_directory_onto_file(workdir))           std::cout << "PASS: directory onto file" << std::endl;
    if (test_keystream_differs_per_transfer(workdir)) std::cout << "PASS: fresh key stream per transfer" << std::endl;
    if (test_write_failure_drains_payload(workdir))  std::cout << "PASS: write failure drains payload" << std::endl;
    if (test_text_typed_before_ack(workdir))         std::cout << "PASS: text typed before ack" << std::endl;
    if (test_connection_lost_mid_payload(workdir))   std::cout << "PASS: connection lost mid payload" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
