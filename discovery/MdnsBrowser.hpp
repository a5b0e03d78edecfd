#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "AnnouncementSource.hpp"

namespace axe_fleet::discovery
{
    const std::vector<std::string> &DefaultServiceTypes();

    // Multicast DNS browser: sends PTR queries for the service types to
    // 224.0.0.251:5353 and reports every resolved instance once.
    class MdnsBrowser : public AnnouncementSource
    {
    public:
        explicit MdnsBrowser(std::vector<std::string> service_types = DefaultServiceTypes());
        ~MdnsBrowser() override;

        void Start(AnnouncementCallback callback) override;
        void Stop() override;

        static std::vector<std::uint8_t> BuildQuery(const std::vector<std::string> &service_types);

        // Throws nothing; malformed packets yield no announcements.
        static std::vector<Announcement> ParseResponse(const std::uint8_t *data,
                                                       std::size_t size,
                                                       const std::string &source_ip,
                                                       const std::vector<std::string> &service_types);

    private:
        bool OpenSocket();
        void SendQuery();
        void ReceiveLoop();

        std::vector<std::string> m_services;
        AnnouncementCallback m_callback;
        std::atomic<bool> m_running;
        std::thread m_worker;
        int m_fd;

        std::set<std::string> m_reported;
    };
}
