#include "Prober.hpp"
#include "IcmpDatagramProber.hpp"
#include "SystemPingProber.hpp"
#include "../common/Log.hpp"

#include <stdexcept>

namespace net_watch::probe
{
    const char *ProbeStatusName(ProbeStatus status)
    {
        switch (status)
        {
        case ProbeStatus::Reachable: return "reachable";
        case ProbeStatus::Unreachable: return "unreachable";
        case ProbeStatus::TimedOut: return "timed_out";
        case ProbeStatus::InvalidAddress: return "invalid_address";
        case ProbeStatus::ToolError: return "tool_error";
        }
        return "unknown";
    }

    ProbeMethod ParseProbeMethod(const std::string &text)
    {
        if (text == "auto")
            return ProbeMethod::Auto;
        if (text == "icmp")
            return ProbeMethod::IcmpDatagram;
        if (text == "ping")
            return ProbeMethod::SystemPing;
        throw std::invalid_argument("Unknown probe method '" + text + "' (expected auto, icmp or ping)");
    }

    const char *ProbeMethodName(ProbeMethod method)
    {
        switch (method)
        {
        case ProbeMethod::Auto: return "auto";
        case ProbeMethod::IcmpDatagram: return "icmp";
        case ProbeMethod::SystemPing: return "ping";
        }
        return "unknown";
    }

    std::unique_ptr<Prober> MakeProber(ProbeMethod method)
    {
        switch (method)
        {
        case ProbeMethod::IcmpDatagram:
            if (!IcmpDatagramProber::IsSupported())
            {
                common::LogError("Prober", "ICMP datagram sockets are not permitted for this user "
                                           "(see net.ipv4.ping_group_range); probes will report offline");
            }
            return std::make_unique<IcmpDatagramProber>();

        case ProbeMethod::SystemPing:
            return std::make_unique<SystemPingProber>(CurrentPlatform());

        case ProbeMethod::Auto:
            break;
        }

        if (IcmpDatagramProber::IsSupported())
            return std::make_unique<IcmpDatagramProber>();

        common::LogInfo("Prober", "ICMP datagram socket unavailable, using the system ping utility");
        return std::make_unique<SystemPingProber>(CurrentPlatform());
    }
}
