#include "HttpTransport.hpp"
#include "../common/FleetConfig.hpp"
#include "../common/FleetError.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace axe_fleet::api
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = net::ip::tcp;

    using common::ErrorKind;
    using common::FleetError;

    std::string DeviceEndpoint::BaseUrl() const
    {
        std::string url = tls ? "https://" : "http://";
        url += host;
        const std::uint16_t default_port = tls ? common::AXEOS_HTTPS_PORT : common::AXEOS_HTTP_PORT;
        if (port != default_port)
            url += ":" + std::to_string(port);
        return url;
    }

    static bool IsHostChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_';
    }

    DeviceEndpoint ParseEndpoint(const std::string &address)
    {
        auto begin = std::find_if_not(address.begin(), address.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(address.rbegin(), address.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        std::string rest = (begin < end) ? std::string(begin, end) : std::string();

        if (rest.empty())
            throw FleetError(ErrorKind::ValidationError, "Empty device address");

        DeviceEndpoint ep;
        ep.port = common::AXEOS_HTTP_PORT;

        std::string lower = rest;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lower.rfind("https://", 0) == 0)
        {
            ep.tls = true;
            ep.port = common::AXEOS_HTTPS_PORT;
            rest = rest.substr(8);
        }
        else if (lower.rfind("http://", 0) == 0)
        {
            rest = rest.substr(7);
        }
        else if (lower.find("://") != std::string::npos)
        {
            throw FleetError(ErrorKind::ValidationError, "Unsupported scheme in device address: " + address);
        }

        while (!rest.empty() && rest.back() == '/')
            rest.pop_back();

        if (rest.find('/') != std::string::npos)
            throw FleetError(ErrorKind::ValidationError, "Device address must not contain a path: " + address);

        const auto colon = rest.find(':');
        std::string host = rest.substr(0, colon);
        if (colon != std::string::npos)
        {
            const std::string port_str = rest.substr(colon + 1);
            if (port_str.empty() || port_str.size() > 5 ||
                !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c)
                             { return std::isdigit(c); }))
                throw FleetError(ErrorKind::ValidationError, "Invalid port in device address: " + address);

            const unsigned long port = std::stoul(port_str);
            if (port == 0 || port > 65535)
                throw FleetError(ErrorKind::ValidationError, "Invalid port in device address: " + address);
            ep.port = static_cast<std::uint16_t>(port);
        }

        if (host.empty() || !std::all_of(host.begin(), host.end(), IsHostChar))
            throw FleetError(ErrorKind::ValidationError, "Invalid device address: " + address);

        ep.host = host;
        return ep;
    }

    static http::verb ToVerb(const std::string &method)
    {
        if (method == "GET")
            return http::verb::get;
        if (method == "POST")
            return http::verb::post;
        if (method == "PATCH")
            return http::verb::patch;
        if (method == "PUT")
            return http::verb::put;
        throw FleetError(ErrorKind::ValidationError, "Unsupported HTTP method: " + method);
    }

    static void Check(const beast::error_code &ec, const char *step, const HttpRequest &req)
    {
        if (!ec)
            return;
        throw FleetError(ErrorKind::Unreachable,
                         std::string(step) + " " + req.endpoint.BaseUrl() + req.target + " failed: " + ec.message());
    }

    // Beast only applies stream timeouts to asynchronous operations, so every
    // step is started async and driven to completion on a private io_context.
    template <typename Stream, typename Lowest>
    static http::response<http::string_body> Exchange(net::io_context &ioc,
                                                      Stream &stream,
                                                      Lowest &lowest,
                                                      const http::request<http::string_body> &request,
                                                      std::chrono::steady_clock::time_point deadline,
                                                      const HttpRequest &req)
    {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::response<http::string_body> response;

        lowest.expires_at(deadline);
        http::async_write(stream, request, [&ec](beast::error_code e, std::size_t)
                          { ec = e; });
        ioc.run();
        ioc.restart();
        Check(ec, "write", req);

        lowest.expires_at(deadline);
        http::async_read(stream, buffer, response, [&ec](beast::error_code e, std::size_t)
                         { ec = e; });
        ioc.run();
        ioc.restart();
        Check(ec, "read", req);

        return response;
    }

    static HttpResponse SendOnce(const HttpRequest &req)
    {
        const auto deadline = std::chrono::steady_clock::now() + req.timeout;

        http::request<http::string_body> request{ToVerb(req.method), req.target, 11};
        request.set(http::field::host, req.endpoint.host);
        request.set(http::field::user_agent, common::AXEOS_USER_AGENT);
        request.set(http::field::accept, "application/json");
        if (!req.body.empty())
        {
            request.set(http::field::content_type, "application/json");
            request.body() = req.body;
        }
        request.prepare_payload();

        net::io_context ioc;
        tcp::resolver resolver(ioc);

        beast::error_code ec;
        auto endpoints = resolver.resolve(req.endpoint.host, std::to_string(req.endpoint.port), ec);
        Check(ec, "resolve", req);

        http::response<http::string_body> response;

        if (!req.endpoint.tls)
        {
            beast::tcp_stream stream(ioc);

            stream.expires_at(deadline);
            stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint &)
                                 { ec = e; });
            ioc.run();
            ioc.restart();
            Check(ec, "connect", req);

            response = Exchange(ioc, stream, stream, request, deadline, req);

            beast::error_code shutdown_ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
            if (shutdown_ec && shutdown_ec != beast::errc::not_connected)
                std::cerr << "[Http] Shutdown of " << req.endpoint.BaseUrl() << ": " << shutdown_ec.message() << "\n";
        }
        else
        {
            ssl::context ctx(ssl::context::tls_client);
            // AxeOS builds serve self-signed certificates.
            ctx.set_verify_mode(ssl::verify_none);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), req.endpoint.host.c_str()))
            {
                throw FleetError(ErrorKind::Unreachable,
                                 "Failed to set TLS SNI for " + req.endpoint.host);
            }

            auto &lowest = beast::get_lowest_layer(stream);
            lowest.expires_at(deadline);
            lowest.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint &)
                                 { ec = e; });
            ioc.run();
            ioc.restart();
            Check(ec, "connect", req);

            lowest.expires_at(deadline);
            stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e)
                                   { ec = e; });
            ioc.run();
            ioc.restart();
            Check(ec, "TLS handshake", req);

            response = Exchange(ioc, stream, lowest, request, deadline, req);

            lowest.expires_at(deadline);
            beast::error_code shutdown_ec;
            stream.async_shutdown([&shutdown_ec](beast::error_code e)
                                  { shutdown_ec = e; });
            ioc.run();
            // Embedded TLS stacks routinely close without close_notify.
            if (shutdown_ec && shutdown_ec != net::ssl::error::stream_truncated && shutdown_ec != net::error::eof)
                std::cerr << "[Http] TLS shutdown of " << req.endpoint.BaseUrl() << ": " << shutdown_ec.message() << "\n";
        }

        return HttpResponse{static_cast<int>(response.result_int()), response.body()};
    }

    HttpResponse BeastTransport::Send(const HttpRequest &req)
    {
        try
        {
            return SendOnce(req);
        }
        catch (const boost::system::system_error &e)
        {
            throw FleetError(ErrorKind::Unreachable,
                             req.method + " " + req.endpoint.BaseUrl() + req.target + " failed: " + e.what());
        }
    }
}
