#include "DeviceFilter.hpp"
#include "../common/FleetError.hpp"
#include "../discovery/NetworkScanner.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace axe_fleet::core
{
    using common::DeviceType;
    using common::ErrorKind;
    using common::FleetError;

    namespace
    {
        std::string Trim(const std::string &s)
        {
            const auto first = s.find_first_not_of(" \t");
            if (first == std::string::npos)
                return "";
            const auto last = s.find_last_not_of(" \t");
            return s.substr(first, last - first + 1);
        }

        std::vector<std::string> SplitList(const std::string &text)
        {
            std::vector<std::string> items;
            std::stringstream ss(text);
            std::string item;
            while (std::getline(ss, item, ','))
            {
                item = Trim(item);
                if (item.empty())
                    throw FleetError(ErrorKind::ValidationError, "Empty entry in filter: " + text);
                items.push_back(item);
            }
            return items;
        }

        template <typename Set>
        std::string Join(const Set &items)
        {
            std::string out;
            for (const auto &item : items)
            {
                if (!out.empty())
                    out += ",";
                out += item;
            }
            return out;
        }
    }

    std::string DeviceTypeFilter::Describe() const
    {
        std::vector<std::string> names;
        for (auto t : m_types)
            names.push_back(common::ToString(t));
        return "type=" + Join(names);
    }

    std::string IpAddressFilter::Describe() const
    {
        return "ip=" + Join(m_addresses);
    }

    std::shared_ptr<DeviceFilter> ParseFilter(const std::string &text)
    {
        std::string lower = Trim(text);
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lower.empty() || lower == "all")
            return std::make_shared<AllDevicesFilter>();

        if (auto status = common::ParseDeviceStatus(lower))
            return std::make_shared<DeviceStatusFilter>(*status);

        const auto items = SplitList(lower);

        if (std::isdigit(static_cast<unsigned char>(items.front()[0])))
        {
            std::set<std::string> addresses;
            for (const auto &item : items)
            {
                auto parsed = discovery::ParseIpv4(item);
                if (!parsed)
                    throw FleetError(ErrorKind::ValidationError, "Invalid IP address in filter: " + item);
                addresses.insert(discovery::FormatIpv4(*parsed));
            }
            return std::make_shared<IpAddressFilter>(std::move(addresses));
        }

        std::set<DeviceType> types;
        for (const auto &item : items)
        {
            if (item == "bitaxe-family")
            {
                for (auto t : common::AllDeviceTypes())
                    if (common::IsBitaxeFamily(t))
                        types.insert(t);
            }
            else if (item == "nerdqaxe-family")
            {
                for (auto t : common::AllDeviceTypes())
                    if (common::IsNerdQaxeFamily(t))
                        types.insert(t);
            }
            else if (auto t = common::ParseDeviceType(item))
            {
                types.insert(*t);
            }
            else
            {
                throw FleetError(ErrorKind::ValidationError, "Unknown device type in filter: " + item);
            }
        }
        return std::make_shared<DeviceTypeFilter>(std::move(types));
    }
}
