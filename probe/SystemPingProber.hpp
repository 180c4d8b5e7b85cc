#pragma once

#include <string>
#include <vector>
#include "Prober.hpp"

namespace net_watch::probe
{
    enum class PlatformFamily
    {
        Linux,
        Bsd, // macOS and the BSDs share ping's flag set
        Windows
    };

    PlatformFamily CurrentPlatform();

    // argv for a single echo against `address`, including argv[0].
    std::vector<std::string> BuildPingArguments(PlatformFamily platform,
                                                const std::string &executable,
                                                const std::string &address,
                                                std::chrono::milliseconds timeout);

    // Runs the platform ping utility once. Exit status 0 means online. The
    // child is killed if it outlives timeout + grace.
    class SystemPingProber : public Prober
    {
    public:
        explicit SystemPingProber(PlatformFamily platform,
                                  std::string executable = "ping",
                                  std::chrono::milliseconds grace = std::chrono::milliseconds(500));

        ProbeOutcome Probe(const std::string &address, std::chrono::milliseconds timeout) override;
        const char *Name() const override { return "ping"; }

    private:
        PlatformFamily m_platform;
        std::string m_executable;
        std::chrono::milliseconds m_grace;
    };
}
