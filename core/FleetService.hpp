#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../api/HttpTransport.hpp"
#include "../common/Device.hpp"
#include "../common/FleetConfig.hpp"
#include "../discovery/DiscoveryEngine.hpp"
#include "BulkDispatcher.hpp"
#include "DeviceCache.hpp"
#include "DeviceRegistry.hpp"
#include "FleetMonitor.hpp"
#include "StatsHistory.hpp"
#include "StatsPoller.hpp"

namespace axe_fleet::core
{
    struct DiscoverRequest
    {
        std::optional<std::string> network;
        std::optional<std::chrono::seconds> timeout;
        // Switches the cache to this directory before discovering.
        std::optional<std::string> cache_dir;
        std::optional<bool> mdns;
        bool active_scan = true;
    };

    struct DiscoverResponse
    {
        std::vector<common::Device> devices;
        discovery::DiscoverySummary summary;
    };

    struct StatsResponse
    {
        std::vector<PollResult> results;
        SwarmSummary summary;
        std::vector<TypeSummary> by_type;
    };

    struct MonitorRequest
    {
        std::optional<double> temp_alert_c;
        std::optional<double> hashrate_drop_pct;
        std::optional<std::chrono::seconds> interval;
        AlertCallback on_alert;
        TickCallback on_tick;
    };

    struct ControlRequest
    {
        std::string target;
        CommandKind action = CommandKind::WifiScan;
        // Fan speed (number), settings (object), bitcoin address or update
        // URL (string), depending on the action.
        std::optional<nlohmann::json> payload;
    };

    struct BulkRequest
    {
        CommandKind action = CommandKind::WifiScan;
        std::optional<nlohmann::json> payload;
        std::string filter = "all";
        std::optional<std::size_t> parallelism;
        bool confirm = false;
        const std::atomic<bool> *cancel = nullptr;
        StateObserver observer;
    };

    // Builds the command for an action and its payload.
    // Throws FleetError(ValidationError) on a missing or mistyped payload.
    Command MakeCommand(CommandKind action, const std::optional<nlohmann::json> &payload);

    // The operations a front end calls. Owns the registry, the stats history
    // and the on-disk cache; every device call goes through one transport.
    class FleetService
    {
    public:
        explicit FleetService(common::FleetConfig config,
                              std::shared_ptr<api::HttpTransport> transport = std::make_shared<api::BeastTransport>(),
                              discovery::DiscoveryEngine::SourceFactory source_factory = nullptr);
        ~FleetService();

        FleetService(const FleetService &) = delete;
        FleetService &operator=(const FleetService &) = delete;

        DiscoverResponse Discover(const DiscoverRequest &request = {});

        // filter uses the ParseFilter syntax.
        std::vector<common::Device> List(const std::string &filter = "all") const;

        // One device (by id or IP) or the whole fleet. Unknown device throws
        // FleetError(NotFound).
        StatsResponse Stats(const std::optional<std::string> &device = std::nullopt);

        // Blocks until StopMonitor().
        void Monitor(const MonitorRequest &request);
        void StopMonitor();

        // Single device, no confirmation step.
        BulkOperationResult Control(const ControlRequest &request);

        // Devices currently marked offline are left out of the targets.
        BulkReport Bulk(const BulkRequest &request);

        // Removes the device from the registry, its history and the cache.
        bool Forget(const std::string &id_or_ip);

        // Evicts expired entries, then rewrites the cache.
        bool SaveCache();

        DeviceRegistry &Registry() { return m_registry; }
        StatsHistory &History() { return m_history; }
        const common::FleetConfig &Config() const { return m_config; }

    private:
        void OpenCache(const std::string &dir);
        bool UsesCacheDir(const std::string &dir) const;
        std::vector<std::string> CachedAddresses() const;

        common::FleetConfig m_config;
        std::shared_ptr<api::HttpTransport> m_transport;

        DeviceRegistry m_registry;
        StatsHistory m_history;
        std::unique_ptr<DeviceCache> m_cache;

        StatsPoller m_poller;
        discovery::DiscoveryEngine m_discovery;
        BulkDispatcher m_dispatcher;
        FleetMonitor m_monitor;
    };
}
