#pragma once

#include <chrono>
#include "Prober.hpp"
#include "../common/Device.hpp"

namespace net_watch::probe
{
    // Runs one probe round: every device probed once on a bounded pool,
    // results gathered in completion order, then sorted by
    // (Unicode-lowercased name, ip).
    class ProbeCoordinator
    {
    public:
        static constexpr size_t MIN_WIDTH = 4;
        static constexpr size_t MAX_WIDTH = 64;

        // `prober` is shared by all pool threads and must be thread-safe.
        explicit ProbeCoordinator(Prober &prober, std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT);

        common::ProbeReport Run(const common::DeviceList &devices);

        static size_t WidthFor(size_t device_count);
        static void SortReport(common::ProbeReport &report);

    private:
        common::ProbeResult ProbeOne(const common::Device &device);

        Prober &m_prober;
        std::chrono::milliseconds m_timeout;
    };
}
