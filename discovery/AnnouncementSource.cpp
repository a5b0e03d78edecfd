#include "AnnouncementSource.hpp"
#include <algorithm>
#include <cctype>

namespace axe_fleet::discovery
{
    static std::string Lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static bool Has(const std::string &haystack, const char *needle)
    {
        return haystack.find(needle) != std::string::npos;
    }

    bool IsPotentialAxeOs(const Announcement &announcement)
    {
        const std::string host = Lower(announcement.hostname);
        const std::string instance = Lower(announcement.instance);
        if (Has(host, "axe") || Has(instance, "axe"))
            return true;

        const std::string service = Lower(announcement.service_type);
        if (Has(service, "_axeos._tcp") || Has(service, "_bitaxe._tcp") || Has(service, "_nerdqaxe._tcp"))
            return true;

        for (const auto &[key, value] : announcement.txt)
        {
            const std::string k = Lower(key);
            const std::string v = Lower(value);
            if (Has(k, "model") && (Has(v, "bitaxe") || Has(v, "nerdqaxe")))
                return true;
            if (Has(k, "firmware") && Has(v, "axeos"))
                return true;
        }

        // AxeOS serves plain HTTP on port 80.
        return Has(service, "_http._tcp") && announcement.port == 80;
    }
}
