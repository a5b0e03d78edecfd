#include "AxeOsModels.hpp"
#include "../common/FleetError.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace axe_fleet::api
{
    using nlohmann::json;
    using common::ErrorKind;
    using common::FleetError;

    namespace
    {
        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        // Firmwares disagree on whether numbers are sent as numbers or strings.
        std::optional<double> NumberField(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end())
                return std::nullopt;
            if (it->is_number())
                return it->get<double>();
            if (it->is_string())
            {
                const std::string &s = it->get_ref<const std::string &>();
                char *end = nullptr;
                const double v = std::strtod(s.c_str(), &end);
                if (end != s.c_str())
                    return v;
            }
            return std::nullopt;
        }

        std::optional<std::string> StringField(const json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            if (it->is_string())
                return it->get<std::string>();
            if (it->is_number_integer())
                return std::to_string(it->get<long long>());
            if (it->is_number())
                return it->dump();
            return std::nullopt;
        }

        // Negative or out-of-range values count as missing.
        template <typename T>
        T Whole(const json &j, const char *key, T fallback = T{})
        {
            auto v = NumberField(j, key);
            if (!v || *v < 0.0)
                return fallback;
            const double rounded = std::round(*v);
            if (!(rounded < static_cast<double>(std::numeric_limits<T>::max()) + 1.0))
                return fallback;
            return static_cast<T>(rounded);
        }

        const json &RequireValue(const json &j, const std::string &key)
        {
            if (j.is_null())
                throw FleetError(ErrorKind::ValidationError, "Setting '" + key + "' has no value");
            return j;
        }

        std::string ExpectString(const json &j, const std::string &key)
        {
            if (!RequireValue(j, key).is_string())
                throw FleetError(ErrorKind::ValidationError, "Setting '" + key + "' must be a string");
            return j.get<std::string>();
        }

        long long ExpectInteger(const json &j, const std::string &key, long long lo, long long hi)
        {
            RequireValue(j, key);
            double v = 0.0;
            if (j.is_number())
                v = j.get<double>();
            else if (j.is_string())
            {
                const std::string &s = j.get_ref<const std::string &>();
                char *end = nullptr;
                v = std::strtod(s.c_str(), &end);
                if (end == s.c_str() || *end != '\0')
                    throw FleetError(ErrorKind::ValidationError, "Setting '" + key + "' must be a number");
            }
            else
                throw FleetError(ErrorKind::ValidationError, "Setting '" + key + "' must be a number");

            const long long rounded = std::llround(v);
            if (rounded < lo || rounded > hi)
            {
                throw FleetError(ErrorKind::ValidationError,
                                 "Setting '" + key + "' must be between " + std::to_string(lo) +
                                     " and " + std::to_string(hi));
            }
            return rounded;
        }

        bool ExpectFlag(const json &j, const std::string &key)
        {
            RequireValue(j, key);
            if (j.is_boolean())
                return j.get<bool>();
            if (j.is_number_integer())
            {
                const auto v = j.get<long long>();
                if (v == 0 || v == 1)
                    return v == 1;
            }
            throw FleetError(ErrorKind::ValidationError, "Setting '" + key + "' must be true/false or 0/1");
        }
    }

    SystemInfo ParseSystemInfo(const std::string &body)
    {
        json j;
        try
        {
            j = json::parse(body);
        }
        catch (const json::parse_error &e)
        {
            throw FleetError(ErrorKind::MalformedResponse, std::string("Invalid JSON from device: ") + e.what());
        }
        return ParseSystemInfo(j);
    }

    SystemInfo ParseSystemInfo(const json &j)
    {
        if (!j.is_object())
            throw FleetError(ErrorKind::MalformedResponse, "Device info is not a JSON object");

        SystemInfo info;
        info.asic_model = StringField(j, "ASICModel").value_or("");
        info.device_model = StringField(j, "deviceModel").value_or("");
        info.board_version = StringField(j, "boardVersion").value_or("");
        info.firmware_version = StringField(j, "version").value_or("");
        info.mac_address = StringField(j, "macAddr").value_or("");
        info.hostname = StringField(j, "hostname").value_or("");

        info.ssid = StringField(j, "ssid");
        info.wifi_status = StringField(j, "wifiStatus");
        if (auto rssi = NumberField(j, "wifiRSSI"))
            info.wifi_rssi = static_cast<int>(std::lround(*rssi));

        info.pool_url = StringField(j, "stratumURL").value_or("");
        info.pool_port = Whole<std::uint16_t>(j, "stratumPort");
        info.pool_user = StringField(j, "stratumUser").value_or("");

        info.frequency_mhz = Whole<int>(j, "frequency");
        info.voltage_mv = NumberField(j, "voltage").value_or(0.0);
        info.fan_speed_pct = Whole<int>(j, "fanspeed");
        info.temperature_c = NumberField(j, "temp").value_or(0.0);
        info.power_w = NumberField(j, "power").value_or(0.0);
        info.hashrate_ghs = NumberField(j, "hashRate").value_or(0.0);
        info.uptime_s = Whole<std::uint64_t>(j, "uptimeSeconds");
        info.shares_accepted = Whole<std::uint64_t>(j, "sharesAccepted");
        info.shares_rejected = Whole<std::uint64_t>(j, "sharesRejected");
        info.best_difficulty = StringField(j, "bestDiff");
        info.running_partition = StringField(j, "runningPartition");
        return info;
    }

    common::DeviceType ClassifyDeviceType(const json &j)
    {
        using common::DeviceType;

        if (!j.is_object())
            return DeviceType::Unknown;

        if (j.contains("deviceModel"))
        {
            const std::string model = Lower(StringField(j, "deviceModel").value_or(""));
            if (model.find("++") != std::string::npos || model.find("plus") != std::string::npos)
                return DeviceType::NerdQaxePlus;
            return DeviceType::NerdQaxe;
        }

        if (j.contains("ASICModel") && j.contains("hostname"))
        {
            const std::string asic = Lower(StringField(j, "ASICModel").value_or(""));
            if (asic.find("bm1366") != std::string::npos)
                return DeviceType::BitaxeUltra;
            return DeviceType::Bitaxe;
        }

        return DeviceType::Unknown;
    }

    common::Device ToDevice(const SystemInfo &info,
                            common::DeviceType type,
                            const std::string &address,
                            common::DeviceSource source,
                            common::TimePoint seen_at)
    {
        common::Device d;
        d.id = info.hostname.empty() ? address : info.hostname;
        d.ip_address = address;
        d.mac_address = common::NormalizeMac(info.mac_address);
        d.device_type = type;
        d.source = source;
        d.last_seen = seen_at;
        d.discovered_at = seen_at;
        d.hostname = info.hostname;
        d.asic_model = info.asic_model;
        d.firmware_version = info.firmware_version;
        return d;
    }

    common::StatsSnapshot ToSnapshot(const SystemInfo &info,
                                     const std::string &device_id,
                                     common::TimePoint captured_at)
    {
        common::StatsSnapshot s;
        s.device_id = device_id;
        s.captured_at = captured_at;
        s.hashrate_ghs = info.hashrate_ghs;
        s.temperature_c = info.temperature_c;
        s.power_w = info.power_w;
        s.fan_speed_pct = info.fan_speed_pct;
        s.uptime_s = info.uptime_s;
        s.shares_accepted = info.shares_accepted;
        s.shares_rejected = info.shares_rejected;
        s.voltage_mv = info.voltage_mv;
        s.frequency_mhz = info.frequency_mhz;
        if (!info.pool_url.empty())
        {
            s.pool_url = info.pool_url;
            if (info.pool_port != 0)
                s.pool_url += ":" + std::to_string(info.pool_port);
        }
        s.wifi_rssi = info.wifi_rssi;
        s.best_difficulty = info.best_difficulty;
        return s;
    }

    bool SystemUpdate::Empty() const
    {
        return !hostname && !ssid && !wifi_password && !pool_url && !pool_port && !pool_user &&
               !frequency_mhz && !core_voltage_mv && !fan_speed_pct && !auto_fan_speed;
    }

    json SystemUpdate::ToJson() const
    {
        json j = json::object();
        if (hostname)
            j["hostname"] = *hostname;
        if (ssid)
            j["ssid"] = *ssid;
        if (wifi_password)
            j["wifiPass"] = *wifi_password;
        if (pool_url)
            j["stratumURL"] = *pool_url;
        if (pool_port)
            j["stratumPort"] = *pool_port;
        if (pool_user)
            j["stratumUser"] = *pool_user;
        if (frequency_mhz)
            j["frequency"] = *frequency_mhz;
        if (core_voltage_mv)
            j["coreVoltage"] = *core_voltage_mv;
        if (auto_fan_speed)
            j["autofanspeed"] = *auto_fan_speed ? 1 : 0;
        if (fan_speed_pct)
            j["fanspeed"] = *fan_speed_pct;
        return j;
    }

    SystemUpdate SystemUpdate::FromJson(const json &j)
    {
        if (!j.is_object())
            throw FleetError(ErrorKind::ValidationError, "Settings payload must be a JSON object");

        SystemUpdate u;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            const std::string &key = it.key();
            const json &v = it.value();

            if (key == "hostname")
            {
                u.hostname = ExpectString(v, key);
                if (u.hostname->empty())
                    throw FleetError(ErrorKind::ValidationError, "Hostname must not be empty");
            }
            else if (key == "ssid")
                u.ssid = ExpectString(v, key);
            else if (key == "wifiPass" || key == "password")
                u.wifi_password = ExpectString(v, key);
            else if (key == "stratumURL" || key == "poolurl")
                u.pool_url = ExpectString(v, key);
            else if (key == "stratumPort" || key == "poolport")
                u.pool_port = static_cast<std::uint16_t>(ExpectInteger(v, key, 1, 65535));
            else if (key == "stratumUser" || key == "pooluser")
                u.pool_user = ExpectString(v, key);
            else if (key == "frequency" || key == "frequencyvalue")
                u.frequency_mhz = static_cast<int>(ExpectInteger(v, key, 1, 2000));
            else if (key == "coreVoltage" || key == "voltagevalue")
                u.core_voltage_mv = static_cast<int>(ExpectInteger(v, key, 1, 2000));
            else if (key == "fanspeed")
                u.fan_speed_pct = static_cast<int>(ExpectInteger(v, key, 0, 100));
            else if (key == "autofanspeed")
                u.auto_fan_speed = ExpectFlag(v, key);
            else
                throw FleetError(ErrorKind::ValidationError, "Unknown setting: " + key);
        }

        if (u.Empty())
            throw FleetError(ErrorKind::ValidationError, "Settings payload is empty");
        return u;
    }

    std::vector<WifiNetwork> ParseWifiScan(const std::string &body)
    {
        json j;
        try
        {
            j = json::parse(body);
        }
        catch (const json::parse_error &e)
        {
            throw FleetError(ErrorKind::MalformedResponse, std::string("Invalid WiFi scan JSON: ") + e.what());
        }

        const json *list = &j;
        if (j.is_object())
        {
            auto it = j.find("networks");
            if (it == j.end())
                throw FleetError(ErrorKind::MalformedResponse, "WiFi scan response has no 'networks'");
            list = &*it;
        }
        if (!list->is_array())
            throw FleetError(ErrorKind::MalformedResponse, "WiFi scan 'networks' is not an array");

        std::vector<WifiNetwork> networks;
        for (const auto &entry : *list)
        {
            if (!entry.is_object())
                continue;
            WifiNetwork n;
            n.ssid = StringField(entry, "ssid").value_or("");
            n.rssi = static_cast<int>(std::lround(NumberField(entry, "rssi").value_or(0.0)));
            n.channel = Whole<int>(entry, "channel");
            n.auth = StringField(entry, "authmode").value_or(StringField(entry, "encryption").value_or(""));
            networks.push_back(std::move(n));
        }
        return networks;
    }
}
