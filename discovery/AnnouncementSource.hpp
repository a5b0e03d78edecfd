#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace axe_fleet::discovery
{
    // One resolved zero-configuration service announcement.
    struct Announcement
    {
        std::string instance;
        std::string hostname;
        std::vector<std::string> addresses;
        std::uint16_t port = 80;
        std::string service_type;
        std::map<std::string, std::string> txt;
    };

    using AnnouncementCallback = std::function<void(const Announcement &announcement)>;

    class AnnouncementSource
    {
    public:
        virtual ~AnnouncementSource() = default;
        // The callback runs on the source's own thread until Stop() returns.
        virtual void Start(AnnouncementCallback callback) = 0;
        virtual void Stop() = 0;
    };

    // Hostname, service type or TXT hints that suggest an AxeOS web server.
    bool IsPotentialAxeOs(const Announcement &announcement);
}
