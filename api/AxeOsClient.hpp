#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "AxeOsModels.hpp"
#include "HttpTransport.hpp"

namespace axe_fleet::api
{
    // Client side of the AxeOS REST API. Every call names the device by
    // address ("10.0.0.5", "host:8080", "https://host") and throws FleetError:
    // Unreachable, MalformedResponse, DeviceRejected (non-2xx) or
    // ValidationError (checked before anything is sent).
    class AxeOsClient
    {
    public:
        struct Identity
        {
            SystemInfo info;
            common::DeviceType type = common::DeviceType::Unknown;
        };

        AxeOsClient(std::shared_ptr<HttpTransport> transport, std::chrono::milliseconds timeout);

        Identity Identify(const std::string &address);
        SystemInfo GetSystemInfo(const std::string &address);

        void UpdateSystem(const std::string &address, const SystemUpdate &update);
        void SetFanSpeed(const std::string &address, int percent);
        void Restart(const std::string &address);
        void UpdateFirmware(const std::string &address, const std::string &firmware_url);
        void UpdateAxeOs(const std::string &address, const std::string &www_url);
        std::vector<WifiNetwork> ScanWifi(const std::string &address);

        std::chrono::milliseconds Timeout() const { return m_timeout; }

        static void ValidateFanSpeed(int percent);
        static void ValidateUpdateUrl(const std::string &url);

    private:
        HttpResponse Call(const std::string &method,
                          const std::string &address,
                          const std::string &target,
                          const std::string &body = "");

        std::shared_ptr<HttpTransport> m_transport;
        std::chrono::milliseconds m_timeout;
    };
}
