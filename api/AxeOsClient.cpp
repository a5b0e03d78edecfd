#include "AxeOsClient.hpp"
#include "../common/FleetError.hpp"

namespace axe_fleet::api
{
    using nlohmann::json;
    using common::ErrorKind;
    using common::FleetError;

    namespace
    {
        constexpr const char *INFO_PATH = "/api/system/info";
        constexpr const char *SYSTEM_PATH = "/api/system";
        constexpr const char *RESTART_PATH = "/api/system/restart";
        constexpr const char *OTA_PATH = "/api/system/OTA";
        constexpr const char *OTA_WWW_PATH = "/api/system/OTAWWW";
        constexpr const char *WIFI_SCAN_PATH = "/api/system/wifi/scan";

        constexpr std::size_t MAX_ERROR_BODY = 200;
    }

    AxeOsClient::AxeOsClient(std::shared_ptr<HttpTransport> transport, std::chrono::milliseconds timeout)
        : m_transport(std::move(transport)), m_timeout(timeout)
    {
    }

    HttpResponse AxeOsClient::Call(const std::string &method,
                                   const std::string &address,
                                   const std::string &target,
                                   const std::string &body)
    {
        HttpRequest req;
        req.method = method;
        req.endpoint = ParseEndpoint(address);
        req.target = target;
        req.body = body;
        req.timeout = m_timeout;

        HttpResponse res = m_transport->Send(req);
        if (!res.Ok())
        {
            std::string detail = res.body.substr(0, MAX_ERROR_BODY);
            throw FleetError(ErrorKind::DeviceRejected,
                             method + " " + target + " on " + address + " returned HTTP " +
                                 std::to_string(res.status) + (detail.empty() ? "" : ": " + detail));
        }
        return res;
    }

    AxeOsClient::Identity AxeOsClient::Identify(const std::string &address)
    {
        HttpResponse res = Call("GET", address, INFO_PATH);

        json j;
        try
        {
            j = json::parse(res.body);
        }
        catch (const json::parse_error &e)
        {
            throw FleetError(ErrorKind::MalformedResponse,
                             "Invalid JSON from " + address + ": " + e.what());
        }

        Identity id;
        id.info = ParseSystemInfo(j);
        id.type = ClassifyDeviceType(j);
        return id;
    }

    SystemInfo AxeOsClient::GetSystemInfo(const std::string &address)
    {
        return Identify(address).info;
    }

    void AxeOsClient::UpdateSystem(const std::string &address, const SystemUpdate &update)
    {
        if (update.Empty())
            throw FleetError(ErrorKind::ValidationError, "Nothing to update");
        Call("PATCH", address, SYSTEM_PATH, update.ToJson().dump());
    }

    void AxeOsClient::ValidateFanSpeed(int percent)
    {
        if (percent < 0 || percent > 100)
            throw FleetError(ErrorKind::ValidationError,
                             "Fan speed must be between 0 and 100 percent, got " + std::to_string(percent));
    }

    void AxeOsClient::ValidateUpdateUrl(const std::string &url)
    {
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)
            throw FleetError(ErrorKind::ValidationError, "Update URL must start with http:// or https://: " + url);
        if (url.find_first_of(" \t\r\n") != std::string::npos)
            throw FleetError(ErrorKind::ValidationError, "Update URL must not contain whitespace");
    }

    void AxeOsClient::SetFanSpeed(const std::string &address, int percent)
    {
        ValidateFanSpeed(percent);

        // Manual speed only sticks with the automatic fan curve switched off.
        SystemUpdate update;
        update.auto_fan_speed = false;
        update.fan_speed_pct = percent;
        UpdateSystem(address, update);
    }

    void AxeOsClient::Restart(const std::string &address)
    {
        Call("POST", address, RESTART_PATH);
    }

    void AxeOsClient::UpdateFirmware(const std::string &address, const std::string &firmware_url)
    {
        ValidateUpdateUrl(firmware_url);
        Call("POST", address, OTA_PATH, json{{"url", firmware_url}}.dump());
    }

    void AxeOsClient::UpdateAxeOs(const std::string &address, const std::string &www_url)
    {
        ValidateUpdateUrl(www_url);
        Call("POST", address, OTA_WWW_PATH, json{{"url", www_url}}.dump());
    }

    std::vector<WifiNetwork> AxeOsClient::ScanWifi(const std::string &address)
    {
        return ParseWifiScan(Call("GET", address, WIFI_SCAN_PATH).body);
    }
}
