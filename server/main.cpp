#include "NetworkCore.hpp"
#include "Registry.hpp"
#include "Router.hpp"
#include "ServerConfig.hpp"
#include "Worker.hpp"
#include "../common/Log.hpp"
#include "../probe/ProbeCoordinator.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <vector>

namespace
{
    net_watch::server::NetworkCore *g_server = nullptr;

    void HandleSignal(int)
    {
        if (g_server)
            g_server->Stop();
    }
}

int main(int argc, char *argv[])
{
    using namespace net_watch;

    server::ServerConfig config;
    try
    {
        config = server::ParseArgs(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n\n" << server::Usage(argv[0]);
        return 1;
    }

    if (config.show_help)
    {
        std::cout << server::Usage(argv[0]);
        return 0;
    }

    common::VerboseLogging() = config.verbose;

    try
    {
        server::SqliteDeviceStore store(config.db_path);
        server::Registry registry(store);
        registry.Open(config.seed_defaults);

        if (!config.import_path.empty())
            registry.Import(config.import_path);

        std::unique_ptr<probe::Prober> prober = probe::MakeProber(config.probe_method);
        common::LogInfo("Main", std::string("Probe method ") + probe::ProbeMethodName(config.probe_method) +
                                    " resolved to '" + prober->Name() + "', timeout " +
                                    std::to_string(config.probe_timeout.count()) + "ms");

        probe::ProbeCoordinator coordinator(*prober, config.probe_timeout);
        server::Router router(registry, coordinator);

        server::NetworkCore server(config.port, config.tls_cert, config.tls_key);

        std::vector<std::unique_ptr<server::Worker>> workers;
        for (size_t i = 0; i < config.request_workers; ++i)
        {
            workers.push_back(std::make_unique<server::Worker>(router));
            server.AddWorker(workers.back().get());
            workers.back()->Start();
        }

        server.Init();

        g_server = &server;
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);
        std::signal(SIGPIPE, SIG_IGN);

        server.Run();

        g_server = nullptr;
        for (auto &worker : workers)
            worker->Stop();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
