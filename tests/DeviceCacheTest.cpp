#include <gtest/gtest.h>
#include "core/DeviceCache.hpp"
#include "common/FleetConfig.hpp"
#include "FakeTransport.hpp"
#include <filesystem>
#include <sqlite3.h>

using namespace axe_fleet;
using axe_fleet::test_support::MakeDevice;
using core::DeviceCache;

namespace
{
    class DeviceCacheTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            m_dir = (std::filesystem::path(::testing::TempDir()) / "axefleet-cache" / info->name()).string();
            std::filesystem::remove_all(m_dir);
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove_all(m_dir, ec);
        }

        void Exec(const std::string &sql)
        {
            sqlite3 *db = nullptr;
            ASSERT_EQ(sqlite3_open((std::filesystem::path(m_dir) / common::CACHE_FILE_NAME).c_str(), &db), SQLITE_OK);
            char *err = nullptr;
            const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
            const std::string message = err ? err : "";
            sqlite3_free(err);
            sqlite3_close(db);
            ASSERT_EQ(rc, SQLITE_OK) << message;
        }

        std::string m_dir;
    };
}

TEST_F(DeviceCacheTest, SaveThenLoadKeepsDevices)
{
    const auto now = common::Clock::now();
    auto a = MakeDevice("bitaxe", "192.168.1.20", common::DeviceType::BitaxeUltra, "aa:bb:cc:00:11:22");
    a.firmware_version = "v2.4.2";
    auto b = MakeDevice("nerdqaxe4", "192.168.1.21", common::DeviceType::NerdQaxePlus);

    {
        DeviceCache cache(m_dir);
        ASSERT_TRUE(cache.Open());
        ASSERT_TRUE(cache.Save({a, b}, now));
    }

    DeviceCache cache(m_dir);
    auto entries = cache.Load(now, common::CACHE_TTL);
    ASSERT_EQ(entries.size(), 2u);

    const auto &loaded = entries[0].device.id == "bitaxe" ? entries[0].device : entries[1].device;
    EXPECT_EQ(loaded.ip_address, "192.168.1.20");
    EXPECT_EQ(loaded.device_type, common::DeviceType::BitaxeUltra);
    EXPECT_EQ(loaded.mac_address, std::optional<std::string>("aa:bb:cc:00:11:22"));
    EXPECT_EQ(loaded.firmware_version, "v2.4.2");
    EXPECT_EQ(loaded.source, common::DeviceSource::Cache);
    EXPECT_EQ(common::ToUnixMillis(loaded.last_seen), common::ToUnixMillis(a.last_seen));
}

TEST_F(DeviceCacheTest, SaveReplacesPreviousContents)
{
    const auto now = common::Clock::now();
    DeviceCache cache(m_dir);
    ASSERT_TRUE(cache.Save({MakeDevice("a", "10.0.0.2"), MakeDevice("b", "10.0.0.3")}, now));
    ASSERT_TRUE(cache.Save({MakeDevice("c", "10.0.0.4")}, now));

    auto entries = cache.Load(now, common::CACHE_TTL);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].device.id, "c");
}

TEST_F(DeviceCacheTest, EntriesOlderThanTtlAreSkipped)
{
    const auto now = common::Clock::now();
    DeviceCache cache(m_dir);
    ASSERT_TRUE(cache.Save({MakeDevice("old", "10.0.0.2")}, now - std::chrono::hours(24 * 8)));

    EXPECT_TRUE(cache.Load(now, common::CACHE_TTL).empty());
    EXPECT_EQ(cache.Load(now, std::chrono::hours(24 * 30)).size(), 1u);
}

TEST_F(DeviceCacheTest, UnknownColumnsAreIgnored)
{
    const auto now = common::Clock::now();
    {
        DeviceCache cache(m_dir);
        ASSERT_TRUE(cache.Save({MakeDevice("bitaxe", "10.0.0.2")}, now));
    }
    Exec("ALTER TABLE cache_entries ADD COLUMN pool_url TEXT DEFAULT 'stratum+tcp://example';");

    DeviceCache cache(m_dir);
    auto entries = cache.Load(now, common::CACHE_TTL);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].device.id, "bitaxe");
}

TEST_F(DeviceCacheTest, StatusIsPersisted)
{
    const auto now = common::Clock::now();
    auto down = MakeDevice("down", "10.0.0.2");
    down.status = common::DeviceStatus::Offline;
    {
        DeviceCache cache(m_dir);
        ASSERT_TRUE(cache.Save({down, MakeDevice("up", "10.0.0.3")}, now));
    }

    DeviceCache cache(m_dir);
    auto entries = cache.Load(now, common::CACHE_TTL);
    ASSERT_EQ(entries.size(), 2u);
    for (const auto &e : entries)
    {
        const auto expected = e.device.id == "down" ? common::DeviceStatus::Offline : common::DeviceStatus::Online;
        EXPECT_EQ(e.device.status, expected) << e.device.id;
    }
}

TEST_F(DeviceCacheTest, TableWithoutStatusColumnIsUpgraded)
{
    std::filesystem::create_directories(m_dir);
    Exec("CREATE TABLE cache_entries (id TEXT PRIMARY KEY NOT NULL, ip_address TEXT NOT NULL, "
         "mac_address TEXT, device_type TEXT NOT NULL DEFAULT 'unknown', source TEXT NOT NULL DEFAULT 'scan', "
         "hostname TEXT DEFAULT '', asic_model TEXT DEFAULT '', firmware_version TEXT DEFAULT '', "
         "last_seen_ms INTEGER NOT NULL DEFAULT 0, discovered_at_ms INTEGER NOT NULL DEFAULT 0, "
         "written_at_ms INTEGER NOT NULL DEFAULT 0);");

    const auto now = common::Clock::now();
    Exec("INSERT INTO cache_entries (id, ip_address, written_at_ms) VALUES ('old', '10.0.0.7', " +
         std::to_string(common::ToUnixMillis(now)) + ");");

    DeviceCache cache(m_dir);
    auto entries = cache.Load(now, common::CACHE_TTL);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].device.status, common::DeviceStatus::Online);

    auto down = MakeDevice("down", "10.0.0.2");
    down.status = common::DeviceStatus::Offline;
    ASSERT_TRUE(cache.Save({down}, now));
    entries = cache.Load(now, common::CACHE_TTL);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].device.status, common::DeviceStatus::Offline);
}

TEST_F(DeviceCacheTest, MissingDatabaseLoadsEmpty)
{
    DeviceCache cache(m_dir);
    EXPECT_TRUE(cache.Load(common::Clock::now(), common::CACHE_TTL).empty());
    EXPECT_TRUE(std::filesystem::exists(cache.Path()));
}
