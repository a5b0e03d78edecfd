#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace axe_fleet::common
{
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class DeviceType
    {
        Bitaxe,
        BitaxeUltra,
        NerdQaxe,
        NerdQaxePlus,
        Unknown
    };

    enum class DeviceSource
    {
        Mdns,
        Scan,
        Cache
    };

    // Online until a poll fails. Offline when the device cannot be reached,
    // Error when it answers with something unusable.
    enum class DeviceStatus
    {
        Online,
        Offline,
        Error
    };

    struct Device
    {
        std::string id;
        std::string ip_address;
        std::optional<std::string> mac_address;
        DeviceType device_type = DeviceType::Unknown;
        DeviceSource source = DeviceSource::Scan;
        DeviceStatus status = DeviceStatus::Online;
        TimePoint last_seen{};
        TimePoint discovered_at{};

        std::string hostname;
        std::string asic_model;
        std::string firmware_version;
    };

    struct StatsSnapshot
    {
        std::string device_id;
        TimePoint captured_at{};

        double hashrate_ghs = 0.0;
        double temperature_c = 0.0;
        double power_w = 0.0;
        int fan_speed_pct = 0;
        std::uint64_t uptime_s = 0;

        std::uint64_t shares_accepted = 0;
        std::uint64_t shares_rejected = 0;
        double voltage_mv = 0.0;
        int frequency_mhz = 0;
        std::string pool_url;
        std::optional<int> wifi_rssi;
        std::optional<std::string> best_difficulty;
    };

    const char *ToString(DeviceType type);
    const char *ToString(DeviceSource source);
    const char *ToString(DeviceStatus status);

    std::optional<DeviceType> ParseDeviceType(const std::string &name);
    std::optional<DeviceSource> ParseDeviceSource(const std::string &name);
    std::optional<DeviceStatus> ParseDeviceStatus(const std::string &name);
    const std::vector<DeviceType> &AllDeviceTypes();

    bool IsBitaxeFamily(DeviceType type);
    bool IsNerdQaxeFamily(DeviceType type);

    // Lower-case, ':'-separated. Empty or all-zero addresses normalize to nullopt.
    std::optional<std::string> NormalizeMac(const std::string &mac);

    std::int64_t ToUnixMillis(TimePoint tp);
    TimePoint FromUnixMillis(std::int64_t ms);
}
