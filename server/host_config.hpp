#pragma once

// ============================================================
// host_config.hpp -- Settings shared by every listener of one host
// ============================================================

#include "../common/transfer.hpp"
#include <string>

struct HostConfig {
    std::string     listen_ip{"0.0.0.0"};
    std::string     root_dir;          // starting directory of each session
    std::string     password;          // empty: payloads are not encrypted
    TransferOptions transfer;          // checksum, upload overwrite default, progress interval
};
