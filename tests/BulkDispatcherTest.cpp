#include <gtest/gtest.h>
#include "core/BulkDispatcher.hpp"
#include "FakeTransport.hpp"
#include <map>
#include <mutex>

using namespace axe_fleet;
using common::ErrorKind;
using common::FleetError;
using core::BulkDispatcher;
using core::Command;
using core::CommandKind;
using core::DispatchOptions;
using core::TargetState;
using nlohmann::json;
using test_support::FakeTransport;
using test_support::MakeDevice;

namespace
{
    DispatchOptions Confirmed(std::size_t parallel = 1)
    {
        DispatchOptions o;
        o.confirmed = true;
        o.max_parallel = parallel;
        o.timeout = std::chrono::milliseconds(200);
        return o;
    }
}

TEST(BulkDispatcherTest, OneResultPerTargetInTargetOrder)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->AcceptWrites("10.0.0.2");
    transport->AcceptWrites("10.0.0.4");

    std::vector<common::Device> targets = {
        MakeDevice("a", "10.0.0.2"),
        MakeDevice("b", "10.0.0.3"),
        MakeDevice("c", "10.0.0.4"),
    };

    BulkDispatcher dispatcher(transport);
    auto report = dispatcher.Dispatch(targets, Command::Restart(), Confirmed(3));

    EXPECT_FALSE(report.confirmation_required);
    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results[0].device_id, "a");
    EXPECT_EQ(report.results[1].device_id, "b");
    EXPECT_EQ(report.results[2].device_id, "c");

    EXPECT_TRUE(report.results[0].success);
    EXPECT_FALSE(report.results[1].success);
    ASSERT_TRUE(report.results[1].error.has_value());
    EXPECT_EQ(report.results[1].error->kind, ErrorKind::Unreachable);
    EXPECT_EQ(report.results[1].ip_address, "10.0.0.3");
    EXPECT_TRUE(report.results[2].success);

    EXPECT_EQ(report.Succeeded(), 2u);
    EXPECT_EQ(report.Failed(), 1u);
}

TEST(BulkDispatcherTest, UnexpectedTransportExceptionStaysWithItsTarget)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->AcceptWrites("10.0.0.2");
    transport->AcceptWrites("10.0.0.4");
    transport->SetFaulty("10.0.0.3");

    std::vector<common::Device> targets = {
        MakeDevice("a", "10.0.0.2"),
        MakeDevice("b", "10.0.0.3"),
        MakeDevice("c", "10.0.0.4"),
    };

    BulkDispatcher dispatcher(transport);
    auto report = dispatcher.Dispatch(targets, Command::Restart(), Confirmed(3));

    ASSERT_EQ(report.results.size(), 3u);
    EXPECT_EQ(report.results[0].device_id, "a");
    EXPECT_EQ(report.results[1].device_id, "b");
    EXPECT_EQ(report.results[2].device_id, "c");

    EXPECT_FALSE(report.results[1].success);
    EXPECT_EQ(report.results[1].ip_address, "10.0.0.3");
    ASSERT_TRUE(report.results[1].error.has_value());
    EXPECT_EQ(report.results[1].error->kind, ErrorKind::MalformedResponse);
    EXPECT_EQ(report.Succeeded(), 2u);
}

TEST(BulkDispatcherTest, BitcoinAddressGetsPerDeviceWorkerSuffix)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->AcceptWrites("10.0.0.2");
    transport->AcceptWrites("10.0.0.4");

    std::vector<common::Device> targets = {
        MakeDevice("bitaxe", "10.0.0.2"),
        MakeDevice("nerdqaxe4", "10.0.0.4", common::DeviceType::NerdQaxePlus),
    };

    BulkDispatcher dispatcher(transport);
    auto report = dispatcher.Dispatch(targets, Command::UpdateBitcoinAddress("bc1qX"), Confirmed());
    EXPECT_EQ(report.Succeeded(), 2u);

    auto first = transport->RequestsTo("10.0.0.2");
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].method, "PATCH");
    EXPECT_EQ(json::parse(first[0].body)["stratumUser"], "bc1qX.bitaxe");

    auto second = transport->RequestsTo("10.0.0.4");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(json::parse(second[0].body)["stratumUser"], "bc1qX.nerdqaxe4");

    EXPECT_EQ(core::BuildPayload(Command::UpdateBitcoinAddress("bc1qX"), targets[1])["stratumUser"],
              "bc1qX.nerdqaxe4");
}

TEST(BulkDispatcherTest, UnconfirmedDestructiveCommandSendsNothing)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->AcceptWrites("10.0.0.2");

    BulkDispatcher dispatcher(transport);
    DispatchOptions options;
    auto report = dispatcher.Dispatch({MakeDevice("a", "10.0.0.2"), MakeDevice("b", "10.0.0.3")},
                                      Command::SetFanSpeed(80), options);

    EXPECT_TRUE(report.confirmation_required);
    EXPECT_EQ(report.targets.size(), 2u);
    EXPECT_TRUE(report.results.empty());
    EXPECT_EQ(transport->Calls(), 0u);
}

TEST(BulkDispatcherTest, ReadOnlyCommandNeedsNoConfirmation)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->Script("10.0.0.2", "GET", "/api/system/wifi/scan",
                      {{200, R"({"networks":[{"ssid":"miners","rssi":-55,"channel":11,"authmode":"WPA2"}]})"}});

    BulkDispatcher dispatcher(transport);
    auto report = dispatcher.Dispatch({MakeDevice("a", "10.0.0.2")}, Command::WifiScan());

    ASSERT_EQ(report.results.size(), 1u);
    ASSERT_TRUE(report.results[0].success);
    ASSERT_TRUE(report.results[0].detail.has_value());
    const auto &networks = *report.results[0].detail;
    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0]["ssid"], "miners");
    EXPECT_EQ(networks[0]["rssi"], -55);
}

TEST(BulkDispatcherTest, ParallelismLimitIsRespected)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->SetDelay(std::chrono::milliseconds(20));

    std::vector<common::Device> targets;
    for (int i = 0; i < 8; ++i)
    {
        const std::string ip = "10.0.2." + std::to_string(i + 1);
        transport->AcceptWrites(ip);
        targets.push_back(MakeDevice("m" + std::to_string(i), ip));
    }

    BulkDispatcher dispatcher(transport);
    auto report = dispatcher.Dispatch(targets, Command::Restart(), Confirmed(2));

    EXPECT_EQ(report.Succeeded(), 8u);
    EXPECT_LE(transport->MaxInFlight(), 2u);
    EXPECT_EQ(transport->Calls(), 8u);
}

TEST(BulkDispatcherTest, InvalidCommandsFailBeforeAnyRequest)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->AcceptWrites("10.0.0.2");
    BulkDispatcher dispatcher(transport);
    const std::vector<common::Device> targets = {MakeDevice("a", "10.0.0.2")};

    auto expect_invalid = [&](const Command &command, const DispatchOptions &options)
    {
        try
        {
            dispatcher.Dispatch(targets, command, options);
            ADD_FAILURE() << "accepted " << core::ToString(command.kind);
        }
        catch (const FleetError &e)
        {
            EXPECT_EQ(e.Kind(), ErrorKind::ValidationError);
        }
    };

    expect_invalid(Command::UpdateBitcoinAddress("bc1qX.worker"), Confirmed());
    expect_invalid(Command::UpdateBitcoinAddress(""), Confirmed());
    expect_invalid(Command::SetFanSpeed(101), Confirmed());
    expect_invalid(Command::UpdateSettings(api::SystemUpdate{}), Confirmed());
    expect_invalid(Command::UpdateFirmware("ftp://example.com/fw.bin"), Confirmed());
    expect_invalid(Command::Restart(), Confirmed(0));

    EXPECT_EQ(transport->Calls(), 0u);
}

TEST(BulkDispatcherTest, DuplicateTargetsAreRejected)
{
    auto transport = std::make_shared<FakeTransport>();
    BulkDispatcher dispatcher(transport);

    EXPECT_THROW(dispatcher.Dispatch({MakeDevice("a", "10.0.0.2"), MakeDevice("a", "10.0.0.2")},
                                     Command::WifiScan()),
                 FleetError);
    EXPECT_EQ(transport->Calls(), 0u);
}

TEST(BulkDispatcherTest, CancelledTargetsReportCancelled)
{
    auto transport = std::make_shared<FakeTransport>();
    std::atomic<bool> cancel{true};

    auto options = Confirmed();
    options.cancel = &cancel;

    BulkDispatcher dispatcher(transport);
    auto report = dispatcher.Dispatch({MakeDevice("a", "10.0.0.2"), MakeDevice("b", "10.0.0.3")},
                                      Command::Restart(), options);

    ASSERT_EQ(report.results.size(), 2u);
    for (const auto &r : report.results)
    {
        EXPECT_FALSE(r.success);
        ASSERT_TRUE(r.error.has_value());
        EXPECT_EQ(r.error->kind, ErrorKind::Cancelled);
    }
    EXPECT_EQ(transport->Calls(), 0u);
}

TEST(BulkDispatcherTest, ObserverSeesEachTargetProgress)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->AcceptWrites("10.0.0.2");

    std::mutex mutex;
    std::map<std::string, std::vector<TargetState>> seen;

    auto options = Confirmed(2);
    options.observer = [&](const std::string &id, TargetState state)
    {
        std::lock_guard<std::mutex> lock(mutex);
        seen[id].push_back(state);
    };

    BulkDispatcher dispatcher(transport);
    dispatcher.Dispatch({MakeDevice("ok", "10.0.0.2"), MakeDevice("down", "10.0.0.3")}, Command::Restart(), options);

    const std::vector<TargetState> succeeded = {TargetState::Pending, TargetState::InFlight, TargetState::Succeeded};
    const std::vector<TargetState> failed = {TargetState::Pending, TargetState::InFlight, TargetState::Failed};
    EXPECT_EQ(seen["ok"], succeeded);
    EXPECT_EQ(seen["down"], failed);
}

TEST(BulkDispatcherTest, CommandNamesParseLeniently)
{
    EXPECT_EQ(core::ParseCommandKind("restart"), CommandKind::Restart);
    EXPECT_EQ(core::ParseCommandKind("SET_FAN_SPEED"), CommandKind::SetFanSpeed);
    EXPECT_EQ(core::ParseCommandKind("update-axeos"), CommandKind::UpdateAxeOs);
    EXPECT_FALSE(core::ParseCommandKind("factory-reset").has_value());

    EXPECT_TRUE(Command::Restart().IsDestructive());
    EXPECT_FALSE(Command::WifiScan().IsDestructive());
    EXPECT_EQ(BulkDispatcher::DefaultParallelism(Command::WifiScan()), common::BULK_PARALLEL_READ_ONLY);
}

TEST(BulkDispatcherTest, ParallelismMustBePositiveWholeNumber)
{
    EXPECT_EQ(core::ParseParallelism("1"), 1u);
    EXPECT_EQ(core::ParseParallelism("16"), 16u);

    for (const char *bad : {"-1", "0", "", "2.5", "abc", " 3", "99999999999999999999"})
    {
        try
        {
            core::ParseParallelism(bad);
            ADD_FAILURE() << "accepted '" << bad << "'";
        }
        catch (const FleetError &e)
        {
            EXPECT_EQ(e.Kind(), ErrorKind::ValidationError) << bad;
        }
    }
}
