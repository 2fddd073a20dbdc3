// ============================================================
// client/main.cpp -- rshell_connect entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/password.hpp"
#include "../common/utils.hpp"
#include "connect_client.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <host> <port> [options]\n"
        << "\n"
        << "  host            rshell host name or IP address\n"
        << "  port            TCP port (e.g. 9000)\n"
        << "\nOptions:\n"
        << "  --downloads DIR where downloaded files go (default: ~/Downloads)\n"
        << "  --checksum      append an xxh3 checksum to every upload\n"
        << "  --progress-s N  seconds between progress lines (default: 5)\n"
        << "  --log FILE      write the log to FILE\n"
        << "  --verbose       enable debug logging\n"
        << "\nAn empty password means transfers are not encrypted; it must\n"
        << "match the password the host was started with.\n"
        << "\nExample:\n"
        << "  " << prog << " 192.168.1.1 9000 --downloads /tmp/in\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string host = argv[1];
    u16 port = 0;
    if (!utils::parse_port(argv[2], port)) {
        std::cerr << "ERROR: Invalid port: " << argv[2] << "\n";
        return 1;
    }

    ClientConfig cfg;
    std::string log_file;

    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--downloads") == 0 && i + 1 < argc) {
            cfg.downloads_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--checksum") == 0) {
            cfg.checksum = true;
        } else if (std::strcmp(argv[i], "--progress-s") == 0 && i + 1 < argc) {
            int s = std::atoi(argv[++i]);
            if (s < 1) {
                std::cerr << "ERROR: --progress-s must be at least 1\n";
                return 1;
            }
            cfg.progress_interval = std::chrono::seconds(s);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // stdout belongs to the remote shell
    Logger::get().set_console(false);
    if (!log_file.empty()) Logger::get().set_log_file(log_file);

    try {
        ConnectClient client(cfg, std::cout, [] {
            return password::prompt("Decryption password: ");
        });
        client.connect(host, port);
        return client.run(std::cin);
    } catch (const ConnectionError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
