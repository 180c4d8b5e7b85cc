#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "probe/ProbeCoordinator.hpp"
#include "TestSupport.hpp"

using namespace net_watch;

TEST(ProbeCoordinator, EmptyListGivesEmptyReportWithoutProbing)
{
    test::ScriptedProber prober;
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run({});

    EXPECT_TRUE(report.empty());
    EXPECT_EQ(0, prober.calls.load());
}

TEST(ProbeCoordinator, WidthIsClampedBetweenFourAndSixtyFour)
{
    EXPECT_EQ(4u, probe::ProbeCoordinator::WidthFor(1));
    EXPECT_EQ(4u, probe::ProbeCoordinator::WidthFor(4));
    EXPECT_EQ(17u, probe::ProbeCoordinator::WidthFor(17));
    EXPECT_EQ(64u, probe::ProbeCoordinator::WidthFor(64));
    EXPECT_EQ(64u, probe::ProbeCoordinator::WidthFor(200));
}

TEST(ProbeCoordinator, DnsScenarioSortsByLowercaseName)
{
    common::DeviceList devices = {
        {"g", "Google DNS", "8.8.8.8"},
        {"c", "Cloudflare DNS", "1.1.1.1"}};
    test::ScriptedProber prober({{"1.1.1.1", true}, {"8.8.8.8", false}});
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run(devices);

    ASSERT_EQ(2u, report.size());
    EXPECT_EQ((common::ProbeResult{"c", "Cloudflare DNS", "1.1.1.1", true}), report[0]);
    EXPECT_EQ((common::ProbeResult{"g", "Google DNS", "8.8.8.8", false}), report[1]);
}

TEST(ProbeCoordinator, OrderIgnoresCaseAndBreaksTiesByIp)
{
    common::DeviceList devices = {
        {"1", "beta", "10.0.0.2"},
        {"2", "Alpha", "10.0.0.9"},
        {"3", "alpha", "10.0.0.1"},
        {"4", "ALPHA", "10.0.0.5"}};
    test::ScriptedProber prober;
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run(devices);

    ASSERT_EQ(4u, report.size());
    EXPECT_EQ("10.0.0.1", report[0].ip);
    EXPECT_EQ("10.0.0.5", report[1].ip);
    EXPECT_EQ("10.0.0.9", report[2].ip);
    EXPECT_EQ("beta", report[3].name);
}

TEST(ProbeCoordinator, OneResultPerDeviceMatchedById)
{
    common::DeviceList devices = test::NumberedDevices(37);
    std::map<std::string, bool> online;
    for (size_t i = 0; i < devices.size(); i += 3)
        online[devices[i].ip] = true;
    test::ScriptedProber prober(online);
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run(devices);

    ASSERT_EQ(devices.size(), report.size());
    std::set<std::string> ids;
    for (const auto &r : report)
        ids.insert(r.device_id);
    EXPECT_EQ(devices.size(), ids.size());

    for (const auto &d : devices)
    {
        auto it = std::find_if(report.begin(), report.end(), [&d](const common::ProbeResult &r)
                               { return r.device_id == d.id; });
        ASSERT_NE(report.end(), it);
        EXPECT_EQ(d.name, it->name);
        EXPECT_EQ(d.ip, it->ip);
        EXPECT_EQ(online.count(d.ip) > 0, it->online);
    }
}

TEST(ProbeCoordinator, RepeatedRoundsAreIdentical)
{
    common::DeviceList devices = test::NumberedDevices(50);
    std::reverse(devices.begin(), devices.end());
    test::ScriptedProber prober({{"10.0.0.7", true}, {"10.0.0.21", true}}, std::chrono::milliseconds(2));
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport first = coordinator.Run(devices);
    common::ProbeReport second = coordinator.Run(devices);

    EXPECT_EQ(first, second);
}

TEST(ProbeCoordinator, NeverExceedsSixtyFourProbesInFlight)
{
    common::DeviceList devices = test::NumberedDevices(200);
    test::ScriptedProber prober({}, std::chrono::milliseconds(20));
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run(devices);

    EXPECT_EQ(200u, report.size());
    EXPECT_EQ(200, prober.calls.load());
    EXPECT_LE(prober.max_in_flight.load(), 64);
    EXPECT_GT(prober.max_in_flight.load(), 1);
}

TEST(ProbeCoordinator, SmallListUsesAtMostFourSlots)
{
    common::DeviceList devices = test::NumberedDevices(3);
    test::ScriptedProber prober({}, std::chrono::milliseconds(20));
    probe::ProbeCoordinator coordinator(prober);

    coordinator.Run(devices);

    EXPECT_LE(prober.max_in_flight.load(), 4);
}

TEST(ProbeCoordinator, ThrowingProbeIsReportedOfflineWithoutAbortingRound)
{
    common::DeviceList devices = {
        {"a", "a", "10.0.0.1"},
        {"b", "b", "10.0.0.2"},
        {"c", "c", "10.0.0.3"}};
    test::ThrowingProber prober("10.0.0.2");
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run(devices);

    ASSERT_EQ(3u, report.size());
    EXPECT_TRUE(report[0].online);
    EXPECT_FALSE(report[1].online);
    EXPECT_TRUE(report[2].online);
}

TEST(ProbeCoordinator, NonStandardExceptionIsReportedOffline)
{
    common::DeviceList devices = {
        {"a", "a", "10.0.0.1"},
        {"b", "b", "10.0.0.2"},
        {"c", "c", "10.0.0.3"}};
    test::ThrowingProber prober("10.0.0.2", true);
    probe::ProbeCoordinator coordinator(prober);

    common::ProbeReport report = coordinator.Run(devices);

    ASSERT_EQ(3u, report.size());
    EXPECT_TRUE(report[0].online);
    EXPECT_EQ("b", report[1].device_id);
    EXPECT_FALSE(report[1].online);
    EXPECT_TRUE(report[2].online);
}

TEST(ProbeCoordinator, NonAsciiNamesSortByUnicodeLowercase)
{
    // UTF-8 for "Écran", "échelle", "ÉCHO"; lowercased they all sort after "zebra"
    common::ProbeReport report = {
        {"1", "\xC3\x89" "cran", "10.0.0.1", false},
        {"2", "\xC3\xA9" "chelle", "10.0.0.2", false},
        {"3", "zebra", "10.0.0.3", false},
        {"4", "\xC3\x89" "CHO", "10.0.0.4", false}};

    probe::ProbeCoordinator::SortReport(report);

    ASSERT_EQ(4u, report.size());
    EXPECT_EQ("3", report[0].device_id);
    EXPECT_EQ("2", report[1].device_id);
    EXPECT_EQ("4", report[2].device_id);
    EXPECT_EQ("1", report[3].device_id);
}

TEST(ProbeCoordinator, RoundTakesAboutOneTimeoutPerWave)
{
    common::DeviceList devices = test::NumberedDevices(8);
    test::ScriptedProber prober({}, std::chrono::milliseconds(100));
    probe::ProbeCoordinator coordinator(prober);

    auto start = std::chrono::steady_clock::now();
    coordinator.Run(devices);
    auto elapsed = std::chrono::steady_clock::now() - start;

    // 8 devices on 8 slots: one wave, not eight sequential probes
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
}
