#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace axe_fleet::api
{
    struct DeviceEndpoint
    {
        bool tls = false;
        std::string host;
        std::uint16_t port = 80;

        std::string BaseUrl() const;
    };

    // Accepts "10.0.0.5", "bitaxe.local:8080", "http://10.0.0.5", "https://host:8443".
    // Throws FleetError(ValidationError) on anything else.
    DeviceEndpoint ParseEndpoint(const std::string &address);

    struct HttpRequest
    {
        std::string method;
        DeviceEndpoint endpoint;
        std::string target;
        std::string body;
        std::chrono::milliseconds timeout{0};
    };

    struct HttpResponse
    {
        int status = 0;
        std::string body;

        bool Ok() const { return status >= 200 && status < 300; }
    };

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Throws FleetError(Unreachable) on resolve/connect/IO failure or timeout.
        virtual HttpResponse Send(const HttpRequest &request) = 0;
    };

    class BeastTransport : public HttpTransport
    {
    public:
        HttpResponse Send(const HttpRequest &request) override;
    };
}
