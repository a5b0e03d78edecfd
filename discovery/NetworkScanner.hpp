#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace axe_fleet::discovery
{
    // Addresses are held in host byte order.
    struct Ipv4Network
    {
        std::uint32_t network = 0;
        std::uint8_t prefix = 32;

        std::uint32_t Netmask() const;
        std::uint32_t Broadcast() const;
        std::uint64_t AddressCount() const;
        bool Contains(std::uint32_t address) const;
        std::string ToString() const;
    };

    struct LocalInterface
    {
        std::string name;
        std::string address;
        Ipv4Network network;
    };

    struct ArpNeighbor
    {
        std::string ip;
        std::string mac;
        std::string device;
    };

    std::optional<std::uint32_t> ParseIpv4(const std::string &text);
    std::string FormatIpv4(std::uint32_t address);

    // "a.b.c.d/n"; host bits are cleared. Throws FleetError(ValidationError).
    Ipv4Network ParseCidr(const std::string &text);

    // Usable hosts of the network: network and broadcast addresses are left
    // out for prefixes up to /30.
    std::vector<std::string> EnumerateHosts(const Ipv4Network &net);

    class NetworkScanner
    {
    public:
        // Default route interface via libtins; nullopt if there is none.
        static std::optional<LocalInterface> DefaultInterface();

        // Interface network, narrowed to the /24 around the local address
        // when it holds more than MAX_SCAN_HOSTS addresses.
        static std::optional<Ipv4Network> AutoDetectNetwork();
        static Ipv4Network NarrowForScan(const Ipv4Network &net, std::uint32_t local_address);

        // Complete entries from the kernel neighbour table. An empty device
        // name matches every interface.
        static std::vector<ArpNeighbor> ReadSystemArpTable(const std::string &device = "",
                                                           const std::string &path = "/proc/net/arp");
    };
}
