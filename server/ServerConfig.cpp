#include "ServerConfig.hpp"

#include <sstream>
#include <stdexcept>

namespace net_watch::server
{
    namespace
    {
        long ParseNumber(const std::string &flag, const std::string &value)
        {
            size_t used = 0;
            long number = 0;
            try
            {
                number = std::stol(value, &used);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            }
            if (used != value.size())
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            return number;
        }
    }

    ServerConfig ParseArgs(int argc, const char *const *argv)
    {
        ServerConfig config;

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            auto next = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument(a + " requires a value");
                return argv[++i];
            };

            if (a == "--help" || a == "-h")
            {
                config.show_help = true;
            }
            else if (a == "--port")
            {
                long port = ParseNumber(a, next());
                if (port < 1 || port > 65535)
                    throw std::invalid_argument("--port must be within 1..65535");
                config.port = static_cast<int>(port);
            }
            else if (a == "--db")
            {
                config.db_path = next();
                if (config.db_path.empty())
                    throw std::invalid_argument("--db must not be empty");
            }
            else if (a == "--timeout-ms")
            {
                long ms = ParseNumber(a, next());
                if (ms <= 0)
                    throw std::invalid_argument("--timeout-ms must be positive");
                config.probe_timeout = std::chrono::milliseconds(ms);
            }
            else if (a == "--probe")
            {
                config.probe_method = probe::ParseProbeMethod(next());
            }
            else if (a == "--workers")
            {
                long workers = ParseNumber(a, next());
                if (workers < 1 || workers > 256)
                    throw std::invalid_argument("--workers must be within 1..256");
                config.request_workers = static_cast<size_t>(workers);
            }
            else if (a == "--no-seed")
            {
                config.seed_defaults = false;
            }
            else if (a == "--import")
            {
                config.import_path = next();
            }
            else if (a == "--tls-cert")
            {
                config.tls_cert = next();
            }
            else if (a == "--tls-key")
            {
                config.tls_key = next();
            }
            else if (a == "--verbose" || a == "-v")
            {
                config.verbose = true;
            }
            else
            {
                throw std::invalid_argument("Unknown option '" + a + "'");
            }
        }

        if (config.tls_cert.empty() != config.tls_key.empty())
        {
            throw std::invalid_argument("--tls-cert and --tls-key must be given together");
        }

        return config;
    }

    std::string Usage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "  --port <n>          HTTP port (default 5000)\n"
            << "  --db <path>         SQLite database (default devices.db)\n"
            << "  --timeout-ms <n>    per-probe timeout (default 1200)\n"
            << "  --probe <method>    auto | icmp | ping (default auto)\n"
            << "  --workers <n>       request worker threads (default 4)\n"
            << "  --no-seed           start a fresh database empty\n"
            << "  --import <file>     merge devices from a JSON array at startup\n"
            << "  --tls-cert <pem>    serve HTTPS with this certificate\n"
            << "  --tls-key <pem>     private key for --tls-cert\n"
            << "  --verbose           log every probe outcome\n";
        return out.str();
    }
}
