// ============================================================
// connect_client.cpp -- Client session: input relay and reader thread
// ============================================================

#include "connect_client.hpp"
#include "../common/channel_decoder.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/protocol.hpp"
#include "../common/utils.hpp"
#include <cstdlib>
#include <stdexcept>
#include <vector>

std::filesystem::path ClientConfig::default_downloads_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home && *home) return std::filesystem::path(home) / "Downloads";
    return std::filesystem::path("Downloads");
}

ConnectClient::ConnectClient(ClientConfig config, std::ostream& out, PasswordPrompt prompt)
    : config_(std::move(config))
    , env_(out)
    , prompt_(std::move(prompt))
{
    if (config_.downloads_dir.empty()) {
        config_.downloads_dir = ClientConfig::default_downloads_dir();
    }
}

ConnectClient::~ConnectClient() {
    disconnect();
}

void ConnectClient::connect(const std::string& host, u16 port) {
    if (conn_) throw std::logic_error("Already connected to " + remote_);

    TcpSocket sock;
    sock.connect(host, port);

    std::string pw = prompt_ ? prompt_() : std::string();
    conn_ = std::make_unique<Connection>(std::move(sock), pw);
    remote_ = host + ":" + std::to_string(port);
    closing_.store(false);
    connected_.store(true);
    env_.attach(conn_.get());

    LOG_INFO("Connected to " + remote_ + (conn_->encrypted() ? " (encrypted)" : ""));
    reader_ = std::thread(&ConnectClient::reader_loop, this);
}

TransferOptions ConnectClient::transfer_options() {
    TransferOptions opts;
    opts.checksum = config_.checksum;
    opts.progress_interval = config_.progress_interval;
    // Downloads replace older copies in the downloads directory
    opts.overwrite = OverwritePolicy::OVERWRITE;
    opts.progress_sink = [this](const std::string& line) {
        env_.writeln("  " + line);
    };
    return opts;
}

void ConnectClient::finish_transfer(TransferDirection dir, const TransferResult& res) {
    env_.writeln(res.message);
    if (res.ok()) {
        LOG_INFO(std::string(direction_str(dir)) + " " + res.path + " (" +
                 std::to_string(res.bytes) + " bytes) done");
    } else {
        LOG_WARN(std::string(direction_str(dir)) + " " + transfer_status_str(res.status) +
                 ": " + res.message);
    }
    if (on_transfer_) on_transfer_(dir, res);
}

void ConnectClient::reader_loop() {
    Channel& ch = conn_->channel();
    ChannelDecoder decoder;
    std::vector<ChannelDecoder::Event> events;
    u8 buf[4096];
    bool in_transfer = false;

    try {
        for (;;) {
            size_t n = ch.read_some(buf, sizeof(buf));
            events.clear();
            if (n == 0) {
                decoder.flush(events);
                for (auto& ev : events) env_.write(ev.text.data(), 0, ev.text.size());
                if (!closing_.load()) env_.writeln("Connection closed by " + remote_ + ".");
                break;
            }

            // Bytes after a marker belong to the transfer
            size_t used = decoder.feed(buf, n, events);
            ch.unread(buf + used, n - used);

            for (auto& ev : events) {
                switch (ev.type) {
                    case ChannelDecoder::EventType::TEXT:
                        env_.write(ev.text.data(), 0, ev.text.size());
                        break;
                    case ChannelDecoder::EventType::TRANSFER: {
                        in_transfer = true;
                        TransferResult res = transfer::receive_path(
                            *conn_, config_.downloads_dir, transfer_options());
                        in_transfer = false;
                        finish_transfer(TransferDirection::DOWNLOAD, res);
                        break;
                    }
                    case ChannelDecoder::EventType::UPLOAD_REQUEST: {
                        in_transfer = true;
                        std::string requested = transfer::read_upload_request(*conn_);
                        auto source = file_io::resolve(env_.current_path(), requested);
                        TransferResult res = transfer::send_path(*conn_, source, transfer_options());
                        in_transfer = false;
                        finish_transfer(TransferDirection::UPLOAD, res);
                        break;
                    }
                }
            }
        }
    } catch (const ConnectionError& e) {
        if (!closing_.load()) {
            env_.writeln(std::string("Connection lost: ") + e.what());
            if (in_transfer) env_.writeln(transfer::FAILED_MESSAGE);
        }
        LOG_DEBUG("reader: " + std::string(e.what()));
    } catch (const std::exception& e) {
        // Transfer exchange out of step: the session cannot continue
        env_.writeln(std::string("Session error: ") + e.what());
        Logger::get().transfer_error(remote_ + ": " + e.what());
        ch.shutdown();
    }

    connected_.store(false);
}

bool ConnectClient::send_line(const std::string& line) {
    if (!conn_ || !connected_.load()) return false;

    if (utils::to_lower(utils::trim(line)) == "exit") {
        try {
            conn_->channel().write_text("exit\n");
        } catch (const ConnectionError& e) {
            LOG_DEBUG("exit not delivered: " + std::string(e.what()));
        }
        disconnect();
        return false;
    }

    // Ack bytes never travel inside a command line
    std::string text;
    text.reserve(line.size() + 1);
    for (char c : line) {
        if (c != (char)AckCode::ACCEPT && c != (char)AckCode::REFUSE) text.push_back(c);
    }
    text.push_back('\n');

    try {
        conn_->channel().write_text(text);
        return true;
    } catch (const ConnectionError& e) {
        env_.writeln(std::string("Connection lost: ") + e.what());
        disconnect();
        return false;
    }
}

int ConnectClient::run(std::istream& in) {
    std::string line;
    while (connected_.load() && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!send_line(line)) break;
    }
    disconnect();
    return 0;
}

void ConnectClient::disconnect() {
    std::lock_guard<std::mutex> lk(disconnect_mutex_);
    if (!conn_) return;

    closing_.store(true);
    conn_->channel().shutdown();
    if (reader_.joinable()) reader_.join();
    conn_->channel().close();

    env_.detach();
    conn_.reset();
    connected_.store(false);

    env_.writeln("Disconnected from " + remote_ + ".");
    LOG_INFO("Disconnected from " + remote_);
}
