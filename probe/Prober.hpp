#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace net_watch::probe
{
    inline constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{1200};

    enum class ProbeStatus
    {
        Reachable,
        Unreachable,
        TimedOut,
        InvalidAddress,
        ToolError
    };

    const char *ProbeStatusName(ProbeStatus status);

    // Result of one reachability check. There is no error variant: every
    // failure mode is a status, and only Reachable counts as online.
    struct ProbeOutcome
    {
        ProbeStatus status = ProbeStatus::Unreachable;
        std::string detail;

        bool Online() const { return status == ProbeStatus::Reachable; }

        static ProbeOutcome Up() { return {ProbeStatus::Reachable, ""}; }
        static ProbeOutcome Down(ProbeStatus status, std::string detail)
        {
            return {status, std::move(detail)};
        }
    };

    // A single-shot reachability check. Implementations must not throw and
    // must return within roughly `timeout`.
    class Prober
    {
    public:
        virtual ~Prober() = default;
        virtual ProbeOutcome Probe(const std::string &address, std::chrono::milliseconds timeout) = 0;
        virtual const char *Name() const = 0;
    };

    enum class ProbeMethod
    {
        Auto,
        IcmpDatagram,
        SystemPing
    };

    ProbeMethod ParseProbeMethod(const std::string &text);
    const char *ProbeMethodName(ProbeMethod method);

    // Selects the probing strategy once at startup. Auto prefers the
    // unprivileged ICMP socket and falls back to the platform ping tool.
    std::unique_ptr<Prober> MakeProber(ProbeMethod method);
}
