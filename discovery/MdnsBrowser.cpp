#include "MdnsBrowser.hpp"
#include "../common/FleetConfig.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <map>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace axe_fleet::discovery
{
    namespace
    {
        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string StripDot(std::string name)
        {
            while (!name.empty() && name.back() == '.')
                name.pop_back();
            return name;
        }

        std::string FirstLabel(const std::string &name)
        {
            return name.substr(0, name.find('.'));
        }

        std::string HostFromRecord(const std::string &name)
        {
            std::string host = StripDot(name);
            const std::string suffix = ".local";
            if (host.size() > suffix.size() &&
                Lower(host.substr(host.size() - suffix.size())) == suffix)
                host.erase(host.size() - suffix.size());
            return host;
        }

        // TXT rdata: a sequence of length-prefixed "key=value" strings.
        std::map<std::string, std::string> ParseTxt(const std::string &rdata)
        {
            std::map<std::string, std::string> txt;
            std::size_t pos = 0;
            while (pos < rdata.size())
            {
                const std::size_t len = static_cast<unsigned char>(rdata[pos++]);
                if (len == 0 || pos + len > rdata.size())
                    break;
                const std::string entry = rdata.substr(pos, len);
                pos += len;

                const auto eq = entry.find('=');
                if (eq == std::string::npos)
                    txt[entry] = "";
                else
                    txt[entry.substr(0, eq)] = entry.substr(eq + 1);
            }
            return txt;
        }

        // Milliseconds after Start() at which the query is (re)sent.
        constexpr int QUERY_SCHEDULE_MS[] = {0, 1000, 3000};
        constexpr std::size_t QUERY_COUNT = sizeof(QUERY_SCHEDULE_MS) / sizeof(QUERY_SCHEDULE_MS[0]);
    }

    const std::vector<std::string> &DefaultServiceTypes()
    {
        static const std::vector<std::string> types = {
            "_http._tcp.local",
            "_https._tcp.local",
            "_axeos._tcp.local",
            "_bitaxe._tcp.local",
            "_nerdqaxe._tcp.local",
        };
        return types;
    }

    MdnsBrowser::MdnsBrowser(std::vector<std::string> service_types)
        : m_services(std::move(service_types)), m_running(false), m_fd(-1)
    {
    }

    MdnsBrowser::~MdnsBrowser()
    {
        Stop();
    }

    std::vector<std::uint8_t> MdnsBrowser::BuildQuery(const std::vector<std::string> &service_types)
    {
        Tins::DNS dns;
        dns.id(0);
        dns.type(Tins::DNS::QUERY);
        for (const auto &service : service_types)
            dns.add_query(Tins::DNS::query(StripDot(service), Tins::DNS::PTR, Tins::DNS::INTERNET));
        return dns.serialize();
    }

    std::vector<Announcement> MdnsBrowser::ParseResponse(const std::uint8_t *data,
                                                         std::size_t size,
                                                         const std::string &source_ip,
                                                         const std::vector<std::string> &service_types)
    {
        std::vector<Announcement> out;

        Tins::DNS::resources_type records;
        try
        {
            Tins::DNS dns(data, static_cast<std::uint32_t>(size));
            if (dns.type() != Tins::DNS::RESPONSE)
                return out;

            records = dns.answers();
            const auto additional = dns.additional();
            records.insert(records.end(), additional.begin(), additional.end());
        }
        catch (const std::exception &)
        {
            return out;
        }

        std::set<std::string> wanted;
        for (const auto &s : service_types)
            wanted.insert(Lower(StripDot(s)));

        std::vector<std::pair<std::string, std::string>> instances; // instance, service
        std::vector<std::pair<std::string, std::string>> hosts;     // host, address
        std::map<std::string, std::map<std::string, std::string>> txt;

        for (const auto &r : records)
        {
            const std::string name = StripDot(r.dname());
            switch (r.type())
            {
            case Tins::DNS::PTR:
                if (wanted.count(Lower(name)))
                    instances.emplace_back(StripDot(r.data()), name);
                break;
            case Tins::DNS::A:
                hosts.emplace_back(HostFromRecord(name), r.data());
                break;
            case Tins::DNS::TXT:
                txt[Lower(name)] = ParseTxt(r.data());
                break;
            default:
                break;
            }
        }

        for (const auto &[instance, service] : instances)
        {
            Announcement a;
            a.instance = FirstLabel(instance);
            a.service_type = service;

            auto txt_it = txt.find(Lower(instance));
            if (txt_it != txt.end())
                a.txt = txt_it->second;

            for (const auto &[host, address] : hosts)
            {
                if (Lower(host) == Lower(a.instance))
                {
                    a.hostname = host;
                    a.addresses.push_back(address);
                }
            }
            if (a.addresses.empty() && !hosts.empty())
            {
                a.hostname = hosts.front().first;
                for (const auto &[host, address] : hosts)
                {
                    if (host == a.hostname)
                        a.addresses.push_back(address);
                }
            }
            if (a.hostname.empty())
                a.hostname = a.instance;
            if (a.addresses.empty() && !source_ip.empty())
                a.addresses.push_back(source_ip);

            out.push_back(std::move(a));
        }

        // Bare address records, e.g. unsolicited announcements after boot.
        if (instances.empty())
        {
            std::map<std::string, Announcement> by_host;
            for (const auto &[host, address] : hosts)
            {
                Announcement &a = by_host[host];
                a.instance = host;
                a.hostname = host;
                a.addresses.push_back(address);
            }
            for (auto &[host, a] : by_host)
                out.push_back(std::move(a));
        }

        return out;
    }

    bool MdnsBrowser::OpenSocket()
    {
        m_fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (m_fd < 0)
        {
            std::cerr << "[mDNS] socket() failed: " << std::strerror(errno) << "\n";
            return false;
        }

        int yes = 1;
        setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#ifdef SO_REUSEPORT
        setsockopt(m_fd, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(common::MDNS_PORT);

        if (bind(m_fd, (struct sockaddr *)&addr, sizeof(addr)) < 0)
        {
            // Port 5353 is held by another responder: ask from an ephemeral
            // port and rely on legacy unicast replies.
            addr.sin_port = 0;
            if (bind(m_fd, (struct sockaddr *)&addr, sizeof(addr)) < 0)
            {
                std::cerr << "[mDNS] bind() failed: " << std::strerror(errno) << "\n";
                close(m_fd);
                m_fd = -1;
                return false;
            }
        }

        struct ip_mreq mreq;
        std::memset(&mreq, 0, sizeof(mreq));
        inet_pton(AF_INET, common::MDNS_GROUP, &mreq.imr_multiaddr);
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
        if (setsockopt(m_fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0)
            std::cerr << "[mDNS] Could not join " << common::MDNS_GROUP << ": " << std::strerror(errno) << "\n";

        unsigned char ttl = 255;
        setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200000;
        setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, (const char *)&tv, sizeof tv);
        return true;
    }

    void MdnsBrowser::SendQuery()
    {
        const auto packet = BuildQuery(m_services);

        struct sockaddr_in group;
        std::memset(&group, 0, sizeof(group));
        group.sin_family = AF_INET;
        group.sin_port = htons(common::MDNS_PORT);
        inet_pton(AF_INET, common::MDNS_GROUP, &group.sin_addr);

        if (sendto(m_fd, packet.data(), packet.size(), 0, (const struct sockaddr *)&group, sizeof(group)) < 0)
            std::cerr << "[mDNS] Query send failed: " << std::strerror(errno) << "\n";
    }

    void MdnsBrowser::Start(AnnouncementCallback callback)
    {
        if (m_running)
            return;

        m_callback = std::move(callback);
        m_reported.clear();
        if (!OpenSocket())
            return;

        m_running = true;
        m_worker = std::thread(&MdnsBrowser::ReceiveLoop, this);
    }

    void MdnsBrowser::Stop()
    {
        m_running = false;

        if (m_worker.joinable())
            m_worker.join();

        if (m_fd != -1)
        {
            close(m_fd);
            m_fd = -1;
        }
    }

    void MdnsBrowser::ReceiveLoop()
    {
        const auto started = std::chrono::steady_clock::now();
        std::size_t next_query = 0;

        std::uint8_t buffer[9000];
        struct sockaddr_in from;

        while (m_running)
        {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            if (next_query < QUERY_COUNT && elapsed.count() >= QUERY_SCHEDULE_MS[next_query])
            {
                SendQuery();
                ++next_query;
            }

            socklen_t len = sizeof(from);
            ssize_t n = recvfrom(m_fd, buffer, sizeof(buffer), 0, (struct sockaddr *)&from, &len);
            if (n <= 0)
                continue;

            char ip_str[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &from.sin_addr, ip_str, INET_ADDRSTRLEN);

            for (auto &a : ParseResponse(buffer, static_cast<std::size_t>(n), ip_str, m_services))
            {
                std::string key = a.instance + "|" + a.service_type;
                for (const auto &addr : a.addresses)
                    key += "|" + addr;
                if (!m_reported.insert(key).second)
                    continue;

                if (m_callback)
                    m_callback(a);
            }
        }
    }
}
