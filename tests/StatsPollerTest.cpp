#include <gtest/gtest.h>
#include "core/StatsHistory.hpp"
#include "core/StatsPoller.hpp"
#include "FakeTransport.hpp"

using namespace axe_fleet;
using common::DeviceType;
using core::PollResult;
using core::StatsPoller;
using test_support::BitaxeInfo;
using test_support::FakeTransport;
using test_support::MakeDevice;
using test_support::NerdQaxeInfo;

namespace
{
    PollResult Ok(const std::string &id, DeviceType type, double ghs, double temp, double watts)
    {
        PollResult r;
        r.device = MakeDevice(id, "10.0.0.1", type);
        common::StatsSnapshot s;
        s.device_id = id;
        s.hashrate_ghs = ghs;
        s.temperature_c = temp;
        s.power_w = watts;
        r.snapshot = s;
        return r;
    }

    PollResult Down(const std::string &id, DeviceType type)
    {
        PollResult r;
        r.device = MakeDevice(id, "10.0.0.1", type);
        r.error = common::DeviceError{common::ErrorKind::Unreachable, "timeout"};
        return r;
    }
}

TEST(StatsPollerTest, ResultsFollowInputOrderAndFailuresStayIsolated)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->SetInfo("10.0.0.2", BitaxeInfo("a", "aa:00:00:00:00:01", 50.0, 500.0));
    transport->SetInfo("10.0.0.4", NerdQaxeInfo("c", "aa:00:00:00:00:03", 65.0, 4800.0));

    core::DeviceRegistry registry;
    auto a = MakeDevice("a", "10.0.0.2");
    auto b = MakeDevice("b", "10.0.0.3");
    auto c = MakeDevice("c", "10.0.0.4", DeviceType::NerdQaxePlus);
    a.last_seen = common::Clock::now() - std::chrono::hours(1);
    registry.Merge(a);

    StatsPoller poller(transport, 4, &registry);
    auto results = poller.Poll({a, b, c}, std::chrono::milliseconds(200));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].device.id, "a");
    EXPECT_EQ(results[1].device.id, "b");
    EXPECT_EQ(results[2].device.id, "c");

    ASSERT_TRUE(results[0].Ok());
    EXPECT_DOUBLE_EQ(results[0].snapshot->hashrate_ghs, 500.0);
    EXPECT_EQ(results[0].snapshot->device_id, "a");

    EXPECT_FALSE(results[1].Ok());
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_EQ(results[1].error->kind, common::ErrorKind::Unreachable);

    ASSERT_TRUE(results[2].Ok());
    EXPECT_DOUBLE_EQ(results[2].snapshot->temperature_c, 65.0);

    // A successful poll counts as a sighting.
    EXPECT_GT(registry.Get("a")->last_seen, a.last_seen);
}

TEST(StatsPollerTest, UnexpectedTransportExceptionKeepsTheDevice)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->SetInfo("10.0.0.2", BitaxeInfo("a", "aa:00:00:00:00:01"));
    transport->SetFaulty("10.0.0.3");

    StatsPoller poller(transport, 2);
    auto results = poller.Poll({MakeDevice("a", "10.0.0.2"), MakeDevice("b", "10.0.0.3")},
                               std::chrono::milliseconds(200));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].Ok());
    EXPECT_EQ(results[1].device.id, "b");
    EXPECT_EQ(results[1].device.ip_address, "10.0.0.3");
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_EQ(results[1].error->kind, common::ErrorKind::MalformedResponse);
}

TEST(StatsPollerTest, FailedPollsMarkStatusWithoutRemovingDevices)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->SetInfo("10.0.0.2", BitaxeInfo("a", "aa:00:00:00:00:01"));
    transport->Script("10.0.0.4", "GET", "/api/system/info", {{200, "<html>"}});

    core::DeviceRegistry registry;
    auto a = MakeDevice("a", "10.0.0.2");
    auto b = MakeDevice("b", "10.0.0.3");
    auto c = MakeDevice("c", "10.0.0.4");
    a.status = common::DeviceStatus::Offline;
    for (const auto &d : {a, b, c})
        registry.Merge(d);

    StatsPoller poller(transport, 3, &registry);
    poller.Poll(registry.List(), std::chrono::milliseconds(200));

    EXPECT_EQ(registry.Size(), 3u);
    EXPECT_EQ(registry.Get("a")->status, common::DeviceStatus::Online);
    EXPECT_EQ(registry.Get("b")->status, common::DeviceStatus::Offline);
    EXPECT_EQ(registry.Get("c")->status, common::DeviceStatus::Error);
    EXPECT_EQ(registry.List(*core::ParseFilter("online")).size(), 1u);
}

TEST(StatsPollerTest, WorkerLimitBoundsConcurrentRequests)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->SetDelay(std::chrono::milliseconds(20));

    std::vector<common::Device> devices;
    for (int i = 0; i < 12; ++i)
    {
        const std::string ip = "10.0.1." + std::to_string(i + 1);
        transport->SetInfo(ip, BitaxeInfo("d" + std::to_string(i), ""));
        devices.push_back(MakeDevice("d" + std::to_string(i), ip));
    }

    StatsPoller poller(transport, 3);
    auto results = poller.Poll(devices, std::chrono::milliseconds(500));

    EXPECT_EQ(results.size(), 12u);
    EXPECT_LE(transport->MaxInFlight(), 3u);
    EXPECT_EQ(transport->Calls(), 12u);
}

TEST(StatsPollerTest, CancelledPollReportsEveryDevice)
{
    auto transport = std::make_shared<FakeTransport>();
    std::atomic<bool> cancel{true};

    StatsPoller poller(transport, 2);
    auto results = poller.Poll({MakeDevice("a", "10.0.0.2"), MakeDevice("b", "10.0.0.3")},
                               std::chrono::milliseconds(100), &cancel);

    ASSERT_EQ(results.size(), 2u);
    for (const auto &r : results)
    {
        ASSERT_TRUE(r.error.has_value());
        EXPECT_EQ(r.error->kind, common::ErrorKind::Cancelled);
    }
    EXPECT_EQ(transport->Calls(), 0u);
}

TEST(SwarmSummaryTest, AggregatesRespondingDevicesOnly)
{
    std::vector<PollResult> results = {
        Ok("a", DeviceType::Bitaxe, 500.0, 55.0, 15.0),
        Ok("b", DeviceType::NerdQaxePlus, 4800.0, 85.0, 75.0),
        Down("c", DeviceType::Bitaxe),
    };

    auto s = core::Summarize(results);
    EXPECT_EQ(s.total_devices, 3u);
    EXPECT_EQ(s.healthy, 1u);
    EXPECT_EQ(s.unhealthy, 1u);
    EXPECT_EQ(s.unreachable, 1u);
    EXPECT_DOUBLE_EQ(s.total_hashrate_ghs, 5300.0);
    EXPECT_DOUBLE_EQ(s.total_power_w, 90.0);
    EXPECT_DOUBLE_EQ(s.average_temperature_c, 70.0);
    EXPECT_NEAR(s.average_efficiency, 5300.0 / 90.0, 1e-9);
}

TEST(SwarmSummaryTest, EmptyFleetHasZeroAverages)
{
    auto s = core::Summarize({});
    EXPECT_EQ(s.total_devices, 0u);
    EXPECT_DOUBLE_EQ(s.average_temperature_c, 0.0);
    EXPECT_DOUBLE_EQ(s.average_efficiency, 0.0);
}

TEST(SwarmSummaryTest, GroupsByTypeInCanonicalOrder)
{
    std::vector<PollResult> results = {
        Ok("n", DeviceType::NerdQaxePlus, 4800.0, 60.0, 75.0),
        Ok("a", DeviceType::Bitaxe, 500.0, 55.0, 15.0),
        Down("b", DeviceType::Bitaxe),
    };

    auto groups = core::SummarizeByType(results);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].device_type, DeviceType::Bitaxe);
    EXPECT_EQ(groups[0].summary.total_devices, 2u);
    EXPECT_EQ(groups[0].summary.unreachable, 1u);
    EXPECT_EQ(groups[1].device_type, DeviceType::NerdQaxePlus);
}

TEST(StatsHistoryTest, KeepsNewestSnapshotsAndAveragesThem)
{
    core::StatsHistory history(3);
    for (double ghs : {100.0, 200.0, 300.0, 400.0})
    {
        common::StatsSnapshot s;
        s.device_id = "a";
        s.hashrate_ghs = ghs;
        history.Record(s);
    }

    auto kept = history.Get("a");
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_DOUBLE_EQ(kept.front().hashrate_ghs, 200.0);
    EXPECT_DOUBLE_EQ(history.Latest("a")->hashrate_ghs, 400.0);
    EXPECT_DOUBLE_EQ(*history.BaselineHashrate("a"), 300.0);
    EXPECT_FALSE(history.BaselineHashrate("b").has_value());

    history.Forget("a");
    EXPECT_TRUE(history.Get("a").empty());
}
