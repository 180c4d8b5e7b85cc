#include "ProbeCoordinator.hpp"
#include "WorkerPool.hpp"
#include "../common/Log.hpp"

#include <algorithm>
#include <mutex>
#include <tuple>
#include <utility>

#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace net_watch::probe
{
    namespace
    {
        // Full Unicode lowercase mapping, locale independent. UTF-8 byte
        // order equals code point order, so keys compare as plain strings.
        std::string Lowercase(const std::string &utf8)
        {
            std::string out;
            icu::UnicodeString::fromUTF8(utf8).toLower(icu::Locale::getRoot()).toUTF8String(out);
            return out;
        }
    }

    ProbeCoordinator::ProbeCoordinator(Prober &prober, std::chrono::milliseconds timeout)
        : m_prober(prober), m_timeout(timeout)
    {
    }

    size_t ProbeCoordinator::WidthFor(size_t device_count)
    {
        return std::clamp(device_count, MIN_WIDTH, MAX_WIDTH);
    }

    void ProbeCoordinator::SortReport(common::ProbeReport &report)
    {
        std::vector<std::pair<std::string, common::ProbeResult>> keyed;
        keyed.reserve(report.size());
        for (auto &result : report)
            keyed.emplace_back(Lowercase(result.name), std::move(result));

        std::sort(keyed.begin(), keyed.end(), [](const auto &a, const auto &b)
                  { return std::tie(a.first, a.second.ip, a.second.device_id) <
                           std::tie(b.first, b.second.ip, b.second.device_id); });

        report.clear();
        for (auto &entry : keyed)
            report.push_back(std::move(entry.second));
    }

    common::ProbeResult ProbeCoordinator::ProbeOne(const common::Device &device)
    {
        common::ProbeResult result{device.id, device.name, device.ip, false};
        try
        {
            ProbeOutcome outcome = m_prober.Probe(device.ip, m_timeout);
            result.online = outcome.Online();
            common::LogDebug("Coordinator", device.name + " (" + device.ip + "): " +
                                                ProbeStatusName(outcome.status) +
                                                (outcome.detail.empty() ? "" : " - " + outcome.detail));
        }
        catch (const std::exception &e)
        {
            result.online = false;
            common::LogError("Coordinator", "Probe of " + device.ip + " failed: " + e.what());
        }
        catch (...)
        {
            result.online = false;
            common::LogError("Coordinator", "Probe of " + device.ip + " failed with a non-standard exception");
        }
        return result;
    }

    common::ProbeReport ProbeCoordinator::Run(const common::DeviceList &devices)
    {
        common::ProbeReport report;
        if (devices.empty())
            return report;

        report.reserve(devices.size());
        std::mutex report_mutex;

        {
            WorkerPool pool(WidthFor(devices.size()));
            for (const auto &device : devices)
            {
                pool.Submit([this, &device, &report, &report_mutex]()
                            {
                                common::ProbeResult result = ProbeOne(device);
                                std::lock_guard<std::mutex> lock(report_mutex);
                                report.push_back(std::move(result));
                            });
            }
            pool.Wait();
        }

        SortReport(report);

        size_t online = std::count_if(report.begin(), report.end(), [](const common::ProbeResult &r)
                                      { return r.online; });
        common::LogDebug("Coordinator", "Round complete: " + std::to_string(online) + "/" +
                                            std::to_string(report.size()) + " online");
        return report;
    }
}
