#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/Device.hpp"

namespace axe_fleet::api
{
    // Subset of GET /api/system/info that the fleet core understands. Bitaxe
    // and NerdQaxe firmwares share most keys; absent keys keep their defaults.
    struct SystemInfo
    {
        std::string asic_model;
        std::string device_model;
        std::string board_version;
        std::string firmware_version;
        std::string mac_address;
        std::string hostname;

        std::optional<std::string> ssid;
        std::optional<std::string> wifi_status;
        std::optional<int> wifi_rssi;

        std::string pool_url;
        std::uint16_t pool_port = 0;
        std::string pool_user;

        int frequency_mhz = 0;
        double voltage_mv = 0.0;
        int fan_speed_pct = 0;
        double temperature_c = 0.0;
        double power_w = 0.0;
        double hashrate_ghs = 0.0;
        std::uint64_t uptime_s = 0;
        std::uint64_t shares_accepted = 0;
        std::uint64_t shares_rejected = 0;
        std::optional<std::string> best_difficulty;
        std::optional<std::string> running_partition;
    };

    // Throws FleetError(MalformedResponse) if the body is not a JSON object.
    SystemInfo ParseSystemInfo(const std::string &body);
    SystemInfo ParseSystemInfo(const nlohmann::json &j);

    // deviceModel present         -> NerdQaxe / NerdQaxePlus
    // ASICModel + hostname        -> Bitaxe / BitaxeUltra (BM1366)
    // anything else               -> Unknown
    common::DeviceType ClassifyDeviceType(const nlohmann::json &j);

    common::Device ToDevice(const SystemInfo &info,
                            common::DeviceType type,
                            const std::string &address,
                            common::DeviceSource source,
                            common::TimePoint seen_at);

    common::StatsSnapshot ToSnapshot(const SystemInfo &info,
                                     const std::string &device_id,
                                     common::TimePoint captured_at);

    // Body of PATCH /api/system. Only set fields are serialized.
    struct SystemUpdate
    {
        std::optional<std::string> hostname;
        std::optional<std::string> ssid;
        std::optional<std::string> wifi_password;
        std::optional<std::string> pool_url;
        std::optional<std::uint16_t> pool_port;
        std::optional<std::string> pool_user;
        std::optional<int> frequency_mhz;
        std::optional<int> core_voltage_mv;
        std::optional<int> fan_speed_pct;
        std::optional<bool> auto_fan_speed;

        bool Empty() const;
        nlohmann::json ToJson() const;

        // Accepts AxeOS key names plus the legacy poolurl/poolport/pooluser/
        // frequencyvalue/voltagevalue/password aliases. Unknown keys and
        // wrongly typed values throw FleetError(ValidationError).
        static SystemUpdate FromJson(const nlohmann::json &j);
    };

    struct WifiNetwork
    {
        std::string ssid;
        int rssi = 0;
        int channel = 0;
        std::string auth;
    };

    // Accepts {"networks": [...]} or a bare array.
    std::vector<WifiNetwork> ParseWifiScan(const std::string &body);
}
