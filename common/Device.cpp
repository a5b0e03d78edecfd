#include "Device.hpp"
#include <algorithm>
#include <cctype>

namespace axe_fleet::common
{
    const char *ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::Bitaxe:
            return "bitaxe";
        case DeviceType::BitaxeUltra:
            return "bitaxe-ultra";
        case DeviceType::NerdQaxe:
            return "nerdqaxe";
        case DeviceType::NerdQaxePlus:
            return "nerdqaxe-plus";
        case DeviceType::Unknown:
            return "unknown";
        }
        return "unknown";
    }

    const char *ToString(DeviceSource source)
    {
        switch (source)
        {
        case DeviceSource::Mdns:
            return "mdns";
        case DeviceSource::Scan:
            return "scan";
        case DeviceSource::Cache:
            return "cache";
        }
        return "scan";
    }

    const char *ToString(DeviceStatus status)
    {
        switch (status)
        {
        case DeviceStatus::Online:
            return "online";
        case DeviceStatus::Offline:
            return "offline";
        case DeviceStatus::Error:
            return "error";
        }
        return "online";
    }

    static std::string Lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        std::replace(s.begin(), s.end(), '_', '-');
        return s;
    }

    std::optional<DeviceType> ParseDeviceType(const std::string &name)
    {
        const std::string n = Lower(name);
        for (DeviceType t : AllDeviceTypes())
        {
            if (n == ToString(t))
                return t;
        }
        if (n == "nerdqaxe++")
            return DeviceType::NerdQaxePlus;
        return std::nullopt;
    }

    std::optional<DeviceSource> ParseDeviceSource(const std::string &name)
    {
        const std::string n = Lower(name);
        if (n == "mdns")
            return DeviceSource::Mdns;
        if (n == "scan")
            return DeviceSource::Scan;
        if (n == "cache")
            return DeviceSource::Cache;
        return std::nullopt;
    }

    std::optional<DeviceStatus> ParseDeviceStatus(const std::string &name)
    {
        const std::string n = Lower(name);
        if (n == "online")
            return DeviceStatus::Online;
        if (n == "offline")
            return DeviceStatus::Offline;
        if (n == "error")
            return DeviceStatus::Error;
        return std::nullopt;
    }

    const std::vector<DeviceType> &AllDeviceTypes()
    {
        static const std::vector<DeviceType> types = {
            DeviceType::Bitaxe,
            DeviceType::BitaxeUltra,
            DeviceType::NerdQaxe,
            DeviceType::NerdQaxePlus,
            DeviceType::Unknown};
        return types;
    }

    bool IsBitaxeFamily(DeviceType type)
    {
        return type == DeviceType::Bitaxe || type == DeviceType::BitaxeUltra;
    }

    bool IsNerdQaxeFamily(DeviceType type)
    {
        return type == DeviceType::NerdQaxe || type == DeviceType::NerdQaxePlus;
    }

    std::optional<std::string> NormalizeMac(const std::string &mac)
    {
        std::string out;
        out.reserve(mac.size());
        bool any_nonzero = false;
        for (char c : mac)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
                continue;
            char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (l == '-')
                l = ':';
            if (std::isxdigit(static_cast<unsigned char>(l)) && l != '0')
                any_nonzero = true;
            out.push_back(l);
        }
        if (out.empty() || !any_nonzero)
            return std::nullopt;
        return out;
    }

    std::int64_t ToUnixMillis(TimePoint tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    TimePoint FromUnixMillis(std::int64_t ms)
    {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
    }
}
