// ============================================================
// server/main.cpp -- rshell host entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/password.hpp"
#include "../common/utils.hpp"
#include "host_server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_stop{false};

static void sig_handler(int /*sig*/) {
    g_stop.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <port> [<port>...] [options]\n"
        << "\n"
        << "  port             TCP port to listen on (several may be given)\n"
        << "\nOptions:\n"
        << "  --root DIR       starting directory of each session (default: current)\n"
        << "  --ip IP          address to listen on (default: 0.0.0.0)\n"
        << "  --no-encrypt     do not ask for a password; payloads travel unencrypted\n"
        << "  --overwrite      uploads replace existing files without \"upload -o\"\n"
        << "  --checksum       append an xxh3 checksum to every download\n"
        << "  --progress-s N   seconds between progress log lines (default: 5)\n"
        << "  --log FILE       also write the log to FILE\n"
        << "  --verbose        enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " 9000 --root /srv/share\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    HostConfig cfg;
    std::vector<u16> ports;
    bool encrypt = true;
    std::string log_file;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            cfg.root_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--ip") == 0 && i + 1 < argc) {
            cfg.listen_ip = argv[++i];
        } else if (std::strcmp(argv[i], "--no-encrypt") == 0) {
            encrypt = false;
        } else if (std::strcmp(argv[i], "--overwrite") == 0) {
            cfg.transfer.overwrite = OverwritePolicy::OVERWRITE;
        } else if (std::strcmp(argv[i], "--checksum") == 0) {
            cfg.transfer.checksum = true;
        } else if (std::strcmp(argv[i], "--progress-s") == 0 && i + 1 < argc) {
            int s = std::atoi(argv[++i]);
            if (s < 1) {
                std::cerr << "ERROR: --progress-s must be at least 1\n";
                return 1;
            }
            cfg.transfer.progress_interval = std::chrono::seconds(s);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (argv[i][0] != '-') {
            u16 port = 0;
            if (!utils::parse_port(argv[i], port)) {
                std::cerr << "ERROR: Invalid port: " << argv[i] << "\n";
                return 1;
            }
            ports.push_back(port);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (ports.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }

    std::error_code ec;
    if (cfg.root_dir.empty()) cfg.root_dir = std::filesystem::current_path(ec).string();
    std::filesystem::path root = std::filesystem::absolute(cfg.root_dir, ec);
    if (ec || !std::filesystem::is_directory(root, ec)) {
        std::cerr << "ERROR: Not a directory: " << cfg.root_dir << "\n";
        return 1;
    }
    cfg.root_dir = root.lexically_normal().string();

    if (!log_file.empty()) Logger::get().set_log_file(log_file);

    if (encrypt) {
        cfg.password = password::prompt("Encryption password: ");
        if (cfg.password.empty()) {
            LOG_WARN("Empty password: payloads will not be encrypted");
        }
    }

    try {
        ListenerRegistry registry;
        HostServer host(std::move(cfg), registry);
        for (u16 port : ports) host.start(port);

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        while (!g_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOG_INFO("Shutting down");
        host.stop_all();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
