#pragma once

#include <atomic>
#include <cstdint>
#include "Prober.hpp"

namespace net_watch::probe
{
    // One ICMP echo over a Linux "ping socket" (SOCK_DGRAM/IPPROTO_ICMP),
    // which needs no raw-socket capability. IPv4 literals only.
    class IcmpDatagramProber : public Prober
    {
    public:
        IcmpDatagramProber();

        static bool IsSupported();

        ProbeOutcome Probe(const std::string &address, std::chrono::milliseconds timeout) override;
        const char *Name() const override { return "icmp"; }

    private:
        std::atomic<uint16_t> m_next_sequence;
    };
}
