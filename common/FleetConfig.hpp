#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace axe_fleet::common
{

    inline constexpr std::uint16_t AXEOS_HTTP_PORT = 80;
    inline constexpr std::uint16_t AXEOS_HTTPS_PORT = 443;
    inline constexpr const char *AXEOS_USER_AGENT = "axefleet/0.1";

    inline constexpr std::chrono::milliseconds PROBE_TIMEOUT{2000};
    inline constexpr std::chrono::milliseconds CACHED_PROBE_TIMEOUT{500};
    inline constexpr std::chrono::milliseconds STATS_TIMEOUT{5000};
    inline constexpr std::chrono::milliseconds CONTROL_TIMEOUT{10000};
    inline constexpr std::chrono::seconds DISCOVERY_TIMEOUT{30};
    inline constexpr std::chrono::seconds MDNS_BROWSE_TIMEOUT{5};
    inline constexpr std::chrono::seconds MONITOR_INTERVAL{30};

    inline constexpr std::size_t SCAN_WORKERS = 20;
    inline constexpr std::size_t POLL_WORKERS = 10;
    inline constexpr std::size_t BULK_PARALLEL_DESTRUCTIVE = 1;
    inline constexpr std::size_t BULK_PARALLEL_READ_ONLY = 4;

    // Anything wider than a /23 is narrowed to the interface's /24.
    inline constexpr std::uint32_t MAX_SCAN_HOSTS = 512;

    inline constexpr std::chrono::hours CACHE_TTL{24 * 7};
    inline constexpr std::size_t STATS_HISTORY_CAPACITY = 10;
    inline constexpr double UNHEALTHY_TEMPERATURE_C = 80.0;

    inline constexpr const char *MDNS_GROUP = "224.0.0.251";
    inline constexpr std::uint16_t MDNS_PORT = 5353;

    inline constexpr const char *CACHE_FILE_NAME = "devices.db";
    inline constexpr int CACHE_SCHEMA_VERSION = 2;

    struct FleetConfig
    {
        std::optional<std::string> cache_dir;

        std::chrono::milliseconds probe_timeout = PROBE_TIMEOUT;
        std::chrono::milliseconds stats_timeout = STATS_TIMEOUT;
        std::chrono::milliseconds control_timeout = CONTROL_TIMEOUT;
        std::chrono::seconds discovery_timeout = DISCOVERY_TIMEOUT;

        std::size_t scan_workers = SCAN_WORKERS;
        std::size_t poll_workers = POLL_WORKERS;

        bool mdns_enabled = true;
        std::chrono::hours cache_ttl = CACHE_TTL;
    };

    // $AXEFLEET_CACHE_DIR, then $XDG_CACHE_HOME/axefleet, then $HOME/.cache/axefleet.
    inline std::optional<std::string> DefaultCacheDir()
    {
        if (const char *dir = std::getenv("AXEFLEET_CACHE_DIR"); dir && *dir)
            return std::string(dir);
        if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
            return std::string(xdg) + "/axefleet";
        if (const char *home = std::getenv("HOME"); home && *home)
            return std::string(home) + "/.cache/axefleet";
        return std::nullopt;
    }
}
