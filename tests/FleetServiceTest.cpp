#include <gtest/gtest.h>
#include "core/FleetService.hpp"
#include "common/FleetError.hpp"
#include "FakeTransport.hpp"
#include <filesystem>
#include <functional>

using namespace axe_fleet;
using common::ErrorKind;
using common::FleetError;
using core::CommandKind;
using core::FleetService;
using nlohmann::json;
using test_support::BitaxeInfo;
using test_support::FakeTransport;
using test_support::NerdQaxeInfo;

namespace
{
    ErrorKind KindOf(const std::function<void()> &fn)
    {
        try
        {
            fn();
        }
        catch (const FleetError &e)
        {
            return e.Kind();
        }
        ADD_FAILURE() << "no FleetError thrown";
        return ErrorKind::Cancelled;
    }

    class FleetServiceTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            m_dir = (std::filesystem::path(::testing::TempDir()) / "axefleet-service" / info->name()).string();
            std::filesystem::remove_all(m_dir);

            transport = std::make_shared<FakeTransport>();
            transport->SetInfo("192.0.2.3", BitaxeInfo("bitaxe", "aa:00:00:00:00:03", 55.0, 500.0));
            transport->SetInfo("192.0.2.5", NerdQaxeInfo("nerdqaxe4", "aa:00:00:00:00:05", 62.0, 4800.0));
            transport->AcceptWrites("192.0.2.3");
            transport->AcceptWrites("192.0.2.5");
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove_all(m_dir, ec);
        }

        common::FleetConfig Config() const
        {
            common::FleetConfig config;
            config.cache_dir = m_dir;
            config.mdns_enabled = false;
            config.probe_timeout = std::chrono::milliseconds(200);
            config.stats_timeout = std::chrono::milliseconds(200);
            config.control_timeout = std::chrono::milliseconds(200);
            config.scan_workers = 4;
            config.poll_workers = 4;
            return config;
        }

        static core::DiscoverRequest TestNet()
        {
            core::DiscoverRequest request;
            request.network = "192.0.2.0/29";
            request.timeout = std::chrono::seconds(10);
            request.mdns = false;
            return request;
        }

        std::shared_ptr<FakeTransport> transport;
        std::string m_dir;
    };
}

TEST_F(FleetServiceTest, DiscoverPopulatesRegistryAndCache)
{
    {
        FleetService service(Config(), transport);
        auto response = service.Discover(TestNet());

        EXPECT_EQ(response.devices.size(), 2u);
        EXPECT_EQ(response.summary.found_scan, 2u);
        EXPECT_EQ(service.List().size(), 2u);
        EXPECT_EQ(service.List("nerdqaxe-family").size(), 1u);
    }

    // A fresh instance starts from the cache alone.
    FleetService reloaded(Config(), transport);
    auto devices = reloaded.List();
    ASSERT_EQ(devices.size(), 2u);
    for (const auto &d : devices)
        EXPECT_EQ(d.source, common::DeviceSource::Cache);
    EXPECT_TRUE(reloaded.Registry().Get("bitaxe").has_value());
}

TEST_F(FleetServiceTest, CachedDevicesAreProbedFirst)
{
    {
        FleetService service(Config(), transport);
        service.Discover(TestNet());
    }

    FleetService reloaded(Config(), transport);
    auto response = reloaded.Discover(TestNet());
    EXPECT_EQ(response.summary.found_cache, 2u);
    EXPECT_EQ(response.summary.found_scan, 0u);
    EXPECT_EQ(reloaded.List().size(), 2u);
}

TEST_F(FleetServiceTest, DiscoverRejectsBadRequests)
{
    FleetService service(Config(), transport);

    auto zero = TestNet();
    zero.timeout = std::chrono::seconds(0);
    EXPECT_EQ(KindOf([&]
                     { service.Discover(zero); }),
              ErrorKind::ValidationError);

    auto huge = TestNet();
    huge.network = "10.0.0.0/16";
    EXPECT_EQ(KindOf([&]
                     { service.Discover(huge); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(transport->Calls(), 0u);
}

TEST_F(FleetServiceTest, StatsForFleetAndSingleDevice)
{
    FleetService service(Config(), transport);
    service.Discover(TestNet());

    auto all = service.Stats();
    ASSERT_EQ(all.results.size(), 2u);
    EXPECT_EQ(all.summary.healthy, 2u);
    EXPECT_DOUBLE_EQ(all.summary.total_hashrate_ghs, 5300.0);
    EXPECT_EQ(all.by_type.size(), 2u);

    auto one = service.Stats(std::string("nerdqaxe4"));
    ASSERT_EQ(one.results.size(), 1u);
    EXPECT_EQ(one.results[0].device.id, "nerdqaxe4");
    EXPECT_EQ(service.History().Get("nerdqaxe4").size(), 2u);

    EXPECT_EQ(KindOf([&]
                     { service.Stats(std::string("missing")); }),
              ErrorKind::NotFound);
}

TEST_F(FleetServiceTest, ControlSendsOneCommandWithoutConfirmation)
{
    FleetService service(Config(), transport);
    service.Discover(TestNet());
    const auto before = transport->RequestsTo("192.0.2.3").size();

    core::ControlRequest request;
    request.target = "bitaxe";
    request.action = CommandKind::SetFanSpeed;
    request.payload = json(75);

    auto result = service.Control(request);
    EXPECT_TRUE(result.success);

    auto requests = transport->RequestsTo("192.0.2.3");
    ASSERT_EQ(requests.size(), before + 1);
    EXPECT_EQ(requests.back().method, "PATCH");
    EXPECT_EQ(json::parse(requests.back().body)["fanspeed"], 75);

    request.target = "ghost";
    EXPECT_EQ(KindOf([&]
                     { service.Control(request); }),
              ErrorKind::NotFound);

    request.target = "bitaxe";
    request.payload = json(150);
    EXPECT_EQ(KindOf([&]
                     { service.Control(request); }),
              ErrorKind::ValidationError);
}

TEST_F(FleetServiceTest, BulkNeedsConfirmationForDestructiveCommands)
{
    FleetService service(Config(), transport);
    service.Discover(TestNet());
    const auto calls = transport->Calls();

    core::BulkRequest request;
    request.action = CommandKind::UpdateBitcoinAddress;
    request.payload = json("bc1qX");

    auto dry = service.Bulk(request);
    EXPECT_TRUE(dry.confirmation_required);
    EXPECT_EQ(dry.targets.size(), 2u);
    EXPECT_EQ(transport->Calls(), calls);

    request.confirm = true;
    request.filter = "bitaxe";
    auto report = service.Bulk(request);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_TRUE(report.results[0].success);
    EXPECT_EQ(json::parse(transport->RequestsTo("192.0.2.3").back().body)["stratumUser"], "bc1qX.bitaxe");

    request.filter = "antminer";
    EXPECT_EQ(KindOf([&]
                     { service.Bulk(request); }),
              ErrorKind::ValidationError);
}

TEST_F(FleetServiceTest, ForgetRemovesDeviceEverywhere)
{
    {
        FleetService service(Config(), transport);
        service.Discover(TestNet());
        service.Stats();

        EXPECT_TRUE(service.Forget("192.0.2.3"));
        EXPECT_FALSE(service.Forget("192.0.2.3"));
        EXPECT_FALSE(service.Registry().Get("bitaxe").has_value());
        EXPECT_TRUE(service.History().Get("bitaxe").empty());
    }

    FleetService reloaded(Config(), transport);
    auto devices = reloaded.List();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "nerdqaxe4");
}

TEST_F(FleetServiceTest, CacheDirectorySwitchComparesWholePaths)
{
    const auto lab = (std::filesystem::path(m_dir) / "axefleet-lab").string();
    const auto primary = (std::filesystem::path(m_dir) / "axefleet").string();

    auto config = Config();
    config.cache_dir = lab;
    {
        FleetService service(config, transport);
        auto request = TestNet();
        request.cache_dir = primary;
        service.Discover(request);
    }

    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(primary) / common::CACHE_FILE_NAME));

    config.cache_dir = primary;
    FleetService reloaded(config, transport);
    EXPECT_EQ(reloaded.List().size(), 2u);

    config.cache_dir = lab;
    FleetService untouched(config, transport);
    EXPECT_TRUE(untouched.List().empty());
}

TEST_F(FleetServiceTest, UnreachableDevicesStayListedAsOffline)
{
    {
        FleetService service(Config(), transport);
        service.Discover(TestNet());
        transport->SetUnreachable("192.0.2.5");

        auto stats = service.Stats();
        EXPECT_EQ(stats.summary.unreachable, 1u);
        EXPECT_EQ(service.List().size(), 2u);
        ASSERT_EQ(service.List("offline").size(), 1u);
        EXPECT_EQ(service.List("offline")[0].id, "nerdqaxe4");
        EXPECT_EQ(service.List("online").size(), 1u);

        core::BulkRequest request;
        request.action = CommandKind::Restart;
        request.confirm = true;
        auto report = service.Bulk(request);
        ASSERT_EQ(report.results.size(), 1u);
        EXPECT_EQ(report.results[0].device_id, "bitaxe");
        EXPECT_TRUE(report.results[0].success);
    }

    FleetService reloaded(Config(), transport);
    auto device = reloaded.Registry().Get("nerdqaxe4");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->status, common::DeviceStatus::Offline);
}

TEST_F(FleetServiceTest, WorksWithoutCacheDirectory)
{
    auto config = Config();
    config.cache_dir.reset();

    FleetService service(config, transport);
    service.Discover(TestNet());
    EXPECT_EQ(service.List().size(), 2u);
    EXPECT_FALSE(service.SaveCache());
}

TEST(MakeCommandTest, PayloadMustMatchTheAction)
{
    EXPECT_EQ(core::MakeCommand(CommandKind::Restart, std::nullopt).kind, CommandKind::Restart);
    EXPECT_EQ(core::MakeCommand(CommandKind::SetFanSpeed, json(40)).fan_speed_pct, 40);
    EXPECT_EQ(core::MakeCommand(CommandKind::UpdateFirmware, json("https://example.com/fw.bin")).url,
              "https://example.com/fw.bin");

    auto settings = core::MakeCommand(CommandKind::UpdateSettings, json{{"frequency", 525}});
    EXPECT_EQ(settings.settings.frequency_mhz, std::optional<int>(525));

    EXPECT_EQ(KindOf([]
                     { core::MakeCommand(CommandKind::SetFanSpeed, std::nullopt); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(KindOf([]
                     { core::MakeCommand(CommandKind::SetFanSpeed, json("fast")); }),
              ErrorKind::ValidationError);
    EXPECT_EQ(KindOf([]
                     { core::MakeCommand(CommandKind::UpdateBitcoinAddress, json(12)); }),
              ErrorKind::ValidationError);
}
