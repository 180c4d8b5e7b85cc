#pragma once

#include <string>
#include "Registry.hpp"
#include "../common/protocol.hpp"
#include "../probe/ProbeCoordinator.hpp"

namespace net_watch::server
{
    // Maps HTTP requests onto registry operations and probe rounds.
    class Router
    {
    public:
        Router(Registry &registry, probe::ProbeCoordinator &coordinator);

        protocol::Response Handle(const protocol::Request &request);

    private:
        protocol::Response ListDevices();
        protocol::Response CreateDevice(const protocol::Request &request);
        protocol::Response DeleteDevice(const std::string &id);
        protocol::Response Status();
        protocol::Response ExportDevices();

        Registry &m_registry;
        probe::ProbeCoordinator &m_coordinator;
    };
}
