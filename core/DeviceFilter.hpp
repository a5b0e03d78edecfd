#pragma once

#include <memory>
#include <set>
#include <string>
#include "../common/Device.hpp"

namespace axe_fleet::core
{
    class DeviceFilter
    {
    public:
        virtual ~DeviceFilter() = default;
        virtual bool IsMatch(const common::Device &device) const = 0;
        virtual std::string Describe() const = 0;
    };

    class AllDevicesFilter : public DeviceFilter
    {
    public:
        bool IsMatch(const common::Device &) const override { return true; }
        std::string Describe() const override { return "all"; }
    };

    class DeviceTypeFilter : public DeviceFilter
    {
    public:
        explicit DeviceTypeFilter(std::set<common::DeviceType> types) : m_types(std::move(types)) {}

        bool IsMatch(const common::Device &device) const override
        {
            return m_types.count(device.device_type) > 0;
        }
        std::string Describe() const override;

    private:
        std::set<common::DeviceType> m_types;
    };

    class IpAddressFilter : public DeviceFilter
    {
    public:
        explicit IpAddressFilter(std::set<std::string> addresses) : m_addresses(std::move(addresses)) {}

        bool IsMatch(const common::Device &device) const override
        {
            return m_addresses.count(device.ip_address) > 0;
        }
        std::string Describe() const override;

    private:
        std::set<std::string> m_addresses;
    };

    class DeviceStatusFilter : public DeviceFilter
    {
    public:
        explicit DeviceStatusFilter(common::DeviceStatus status) : m_status(status) {}

        bool IsMatch(const common::Device &device) const override { return device.status == m_status; }
        std::string Describe() const override { return std::string("status=") + common::ToString(m_status); }

    private:
        common::DeviceStatus m_status;
    };

    // "all" (or empty), a status ("online", "offline", "error"), a comma-separated list of device types
    // ("bitaxe-ultra,nerdqaxe"), the families "bitaxe-family" and
    // "nerdqaxe-family", or a comma-separated list of IPv4 addresses.
    // Throws FleetError(ValidationError).
    std::shared_ptr<DeviceFilter> ParseFilter(const std::string &text);
}
