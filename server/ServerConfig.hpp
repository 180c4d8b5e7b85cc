#pragma once

#include <chrono>
#include <string>
#include "../probe/Prober.hpp"

namespace net_watch::server
{
    struct ServerConfig
    {
        int port = 5000;
        std::string db_path = "devices.db";
        std::chrono::milliseconds probe_timeout = probe::DEFAULT_PROBE_TIMEOUT;
        probe::ProbeMethod probe_method = probe::ProbeMethod::Auto;
        size_t request_workers = 4;
        bool seed_defaults = true;
        std::string import_path;
        std::string tls_cert;
        std::string tls_key;
        bool verbose = false;
        bool show_help = false;
    };

    // Throws std::invalid_argument with a user-facing message.
    ServerConfig ParseArgs(int argc, const char *const *argv);

    std::string Usage(const std::string &program);
}
