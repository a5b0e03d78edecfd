#include "NetworkScanner.hpp"
#include "../common/FleetConfig.hpp"
#include "../common/FleetError.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace axe_fleet::discovery
{
    using common::ErrorKind;
    using common::FleetError;

    std::uint32_t Ipv4Network::Netmask() const
    {
        if (prefix == 0)
            return 0;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    std::uint32_t Ipv4Network::Broadcast() const
    {
        return network | ~Netmask();
    }

    std::uint64_t Ipv4Network::AddressCount() const
    {
        return std::uint64_t{1} << (32 - prefix);
    }

    bool Ipv4Network::Contains(std::uint32_t address) const
    {
        return (address & Netmask()) == network;
    }

    std::string Ipv4Network::ToString() const
    {
        return FormatIpv4(network) + "/" + std::to_string(prefix);
    }

    std::optional<std::uint32_t> ParseIpv4(const std::string &text)
    {
        std::uint32_t result = 0;
        int octets = 0;
        std::size_t pos = 0;

        while (octets < 4)
        {
            std::size_t start = pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
                ++pos;
            const std::size_t len = pos - start;
            if (len == 0 || len > 3)
                return std::nullopt;

            const int value = std::stoi(text.substr(start, len));
            if (value > 255)
                return std::nullopt;
            result = (result << 8) | static_cast<std::uint32_t>(value);
            ++octets;

            if (octets < 4)
            {
                if (pos >= text.size() || text[pos] != '.')
                    return std::nullopt;
                ++pos;
            }
        }

        if (pos != text.size())
            return std::nullopt;
        return result;
    }

    std::string FormatIpv4(std::uint32_t address)
    {
        return std::to_string((address >> 24) & 0xFF) + "." +
               std::to_string((address >> 16) & 0xFF) + "." +
               std::to_string((address >> 8) & 0xFF) + "." +
               std::to_string(address & 0xFF);
    }

    Ipv4Network ParseCidr(const std::string &text)
    {
        const auto slash = text.find('/');
        if (slash == std::string::npos)
            throw FleetError(ErrorKind::ValidationError, "Network must be in CIDR form (a.b.c.d/n): " + text);

        auto address = ParseIpv4(text.substr(0, slash));
        if (!address)
            throw FleetError(ErrorKind::ValidationError, "Invalid network address: " + text);

        const std::string prefix_str = text.substr(slash + 1);
        if (prefix_str.empty() || prefix_str.size() > 2 ||
            !std::all_of(prefix_str.begin(), prefix_str.end(), [](unsigned char c)
                         { return std::isdigit(c); }))
            throw FleetError(ErrorKind::ValidationError, "Invalid prefix length: " + text);

        const int prefix = std::stoi(prefix_str);
        if (prefix > 32)
            throw FleetError(ErrorKind::ValidationError, "Invalid prefix length: " + text);

        Ipv4Network net;
        net.prefix = static_cast<std::uint8_t>(prefix);
        net.network = *address & net.Netmask();
        return net;
    }

    std::vector<std::string> EnumerateHosts(const Ipv4Network &net)
    {
        std::vector<std::string> hosts;
        if (net.AddressCount() > common::MAX_SCAN_HOSTS)
            throw FleetError(ErrorKind::ValidationError,
                             net.ToString() + " is larger than the " + std::to_string(common::MAX_SCAN_HOSTS) +
                                 " addresses a scan may cover");

        std::uint64_t first = net.network;
        std::uint64_t last = net.Broadcast();
        if (net.prefix <= 30)
        {
            ++first;
            --last;
        }

        hosts.reserve(static_cast<std::size_t>(last - first + 1));
        for (std::uint64_t a = first; a <= last; ++a)
            hosts.push_back(FormatIpv4(static_cast<std::uint32_t>(a)));
        return hosts;
    }

    std::optional<LocalInterface> NetworkScanner::DefaultInterface()
    {
        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
            Tins::NetworkInterface::Info info = iface.info();

            auto address = ParseIpv4(info.ip_addr.to_string());
            auto mask = ParseIpv4(info.netmask.to_string());
            if (!address || !mask || *address == 0)
                return std::nullopt;

            std::uint8_t prefix = 0;
            for (std::uint32_t m = *mask; m & 0x80000000u; m <<= 1)
                ++prefix;

            LocalInterface local;
            local.name = iface.name();
            local.address = info.ip_addr.to_string();
            local.network.prefix = prefix;
            local.network.network = *address & local.network.Netmask();
            return local;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] Could not query default interface: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    Ipv4Network NetworkScanner::NarrowForScan(const Ipv4Network &net, std::uint32_t local_address)
    {
        if (net.AddressCount() <= common::MAX_SCAN_HOSTS)
            return net;

        Ipv4Network narrowed;
        narrowed.prefix = 24;
        narrowed.network = local_address & narrowed.Netmask();
        return narrowed;
    }

    std::optional<Ipv4Network> NetworkScanner::AutoDetectNetwork()
    {
        auto local = DefaultInterface();
        if (!local)
            return std::nullopt;

        auto address = ParseIpv4(local->address);
        Ipv4Network net = NarrowForScan(local->network, *address);
        if (net.prefix != local->network.prefix)
        {
            std::cout << "[Scanner] " << local->network.ToString() << " on " << local->name
                      << " is too large, scanning " << net.ToString() << "\n";
        }
        return net;
    }

    std::vector<ArpNeighbor> NetworkScanner::ReadSystemArpTable(const std::string &device, const std::string &path)
    {
        std::vector<ArpNeighbor> results;
        std::ifstream arpFile(path);
        if (!arpFile.is_open())
            return results;

        std::string line;
        std::getline(arpFile, line);
        while (std::getline(arpFile, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            // 0x0 marks an incomplete entry.
            if (flags == "0x0" || mac == "00:00:00:00:00:00")
                continue;
            if (!device.empty() && dev != device)
                continue;

            results.push_back({ip, mac, dev});
        }
        return results;
    }
}
