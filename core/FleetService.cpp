#include "FleetService.hpp"
#include "../common/FleetError.hpp"
#include "DeviceFilter.hpp"
#include <filesystem>
#include <iostream>
#include <set>
#include <utility>

namespace axe_fleet::core
{
    using common::Device;
    using common::ErrorKind;
    using common::FleetError;
    using nlohmann::json;

    static const json &RequirePayload(CommandKind action, const std::optional<json> &payload)
    {
        if (!payload || payload->is_null())
            throw FleetError(ErrorKind::ValidationError, std::string(ToString(action)) + " needs a payload");
        return *payload;
    }

    static std::string RequireString(CommandKind action, const std::optional<json> &payload)
    {
        const json &p = RequirePayload(action, payload);
        if (!p.is_string())
            throw FleetError(ErrorKind::ValidationError, std::string(ToString(action)) + " payload must be a string");
        return p.get<std::string>();
    }

    Command MakeCommand(CommandKind action, const std::optional<json> &payload)
    {
        switch (action)
        {
        case CommandKind::Restart:
            return Command::Restart();
        case CommandKind::WifiScan:
            return Command::WifiScan();
        case CommandKind::SetFanSpeed:
        {
            const json &p = RequirePayload(action, payload);
            if (!p.is_number_integer())
                throw FleetError(ErrorKind::ValidationError, "Fan speed must be an integer percentage");
            return Command::SetFanSpeed(p.get<int>());
        }
        case CommandKind::UpdateSettings:
            return Command::UpdateSettings(api::SystemUpdate::FromJson(RequirePayload(action, payload)));
        case CommandKind::UpdateBitcoinAddress:
            return Command::UpdateBitcoinAddress(RequireString(action, payload));
        case CommandKind::UpdateFirmware:
            return Command::UpdateFirmware(RequireString(action, payload));
        case CommandKind::UpdateAxeOs:
            return Command::UpdateAxeOs(RequireString(action, payload));
        }
        throw FleetError(ErrorKind::ValidationError, "Unknown action");
    }

    FleetService::FleetService(common::FleetConfig config,
                               std::shared_ptr<api::HttpTransport> transport,
                               discovery::DiscoveryEngine::SourceFactory source_factory)
        : m_config(std::move(config)),
          m_transport(std::move(transport)),
          m_history(common::STATS_HISTORY_CAPACITY),
          m_poller(m_transport, m_config.poll_workers, &m_registry),
          m_discovery(m_transport, &m_registry, std::move(source_factory)),
          m_dispatcher(m_transport),
          m_monitor(m_registry, m_poller, m_history, m_config.stats_timeout)
    {
        if (m_config.cache_dir)
            OpenCache(*m_config.cache_dir);
    }

    FleetService::~FleetService()
    {
        m_monitor.Stop();
    }

    void FleetService::OpenCache(const std::string &dir)
    {
        m_cache = std::make_unique<DeviceCache>(dir);
        if (!m_cache->Open())
        {
            std::cerr << "[Service] Continuing without cache at " << dir << "\n";
            m_cache.reset();
            return;
        }

        const auto entries = m_cache->Load(common::Clock::now(), m_config.cache_ttl);
        for (const auto &entry : entries)
            m_registry.Merge(entry.device);

        if (!entries.empty())
            std::cout << "[Service] Loaded " << entries.size() << " cached device(s) from " << m_cache->Path() << "\n";
    }

    bool FleetService::UsesCacheDir(const std::string &dir) const
    {
        if (!m_cache)
            return false;
        const auto wanted = (std::filesystem::path(dir) / common::CACHE_FILE_NAME).lexically_normal();
        return wanted == std::filesystem::path(m_cache->Path()).lexically_normal();
    }

    std::vector<std::string> FleetService::CachedAddresses() const
    {
        std::vector<std::string> addresses;
        for (const auto &d : m_registry.List())
            addresses.push_back(d.ip_address);
        return addresses;
    }

    DiscoverResponse FleetService::Discover(const DiscoverRequest &request)
    {
        if (request.timeout && request.timeout->count() <= 0)
            throw FleetError(ErrorKind::ValidationError, "Discovery timeout must be positive");

        if (request.cache_dir && !UsesCacheDir(*request.cache_dir))
            OpenCache(*request.cache_dir);

        discovery::DiscoveryOptions options;
        options.network = request.network;
        options.timeout = request.timeout.value_or(m_config.discovery_timeout);
        options.probe_timeout = m_config.probe_timeout;
        options.workers = m_config.scan_workers;
        options.mdns = request.mdns.value_or(m_config.mdns_enabled);
        options.active_scan = request.active_scan;
        options.priority_addresses = CachedAddresses();

        auto stream = m_discovery.Discover(options);

        DiscoverResponse response;
        response.devices = stream->Drain();
        response.summary = stream->Summary();

        SaveCache();
        return response;
    }

    std::vector<Device> FleetService::List(const std::string &filter) const
    {
        return m_registry.List(*ParseFilter(filter));
    }

    StatsResponse FleetService::Stats(const std::optional<std::string> &device)
    {
        std::vector<Device> targets;
        if (device)
        {
            auto found = m_registry.Get(*device);
            if (!found)
                throw FleetError(ErrorKind::NotFound, "Device not found: " + *device);
            targets.push_back(*found);
        }
        else
        {
            targets = m_registry.List();
        }

        StatsResponse response;
        response.results = m_poller.Poll(targets, m_config.stats_timeout);
        for (const auto &r : response.results)
        {
            if (r.Ok())
                m_history.Record(*r.snapshot);
        }
        response.summary = Summarize(response.results);
        response.by_type = SummarizeByType(response.results);

        SaveCache();
        return response;
    }

    void FleetService::Monitor(const MonitorRequest &request)
    {
        Thresholds thresholds;
        thresholds.temp_alert_c = request.temp_alert_c;
        thresholds.hashrate_drop_pct = request.hashrate_drop_pct;

        const auto interval = request.interval.value_or(common::MONITOR_INTERVAL);
        FleetMonitor::Validate(interval, thresholds);

        m_monitor.SetTickCallback(request.on_tick);
        m_monitor.Run(interval, thresholds, request.on_alert);
        SaveCache();
    }

    void FleetService::StopMonitor()
    {
        m_monitor.Stop();
    }

    BulkOperationResult FleetService::Control(const ControlRequest &request)
    {
        const Command command = MakeCommand(request.action, request.payload);
        command.Validate();

        auto device = m_registry.Get(request.target);
        if (!device)
            throw FleetError(ErrorKind::NotFound, "Device not found: " + request.target);

        auto result = m_dispatcher.Execute(*device, command, m_config.control_timeout);
        if (result.success)
            m_registry.Touch(device->id, common::Clock::now());
        return result;
    }

    BulkReport FleetService::Bulk(const BulkRequest &request)
    {
        const Command command = MakeCommand(request.action, request.payload);
        const auto filter = ParseFilter(request.filter);

        DispatchOptions options;
        options.max_parallel = request.parallelism;
        options.confirmed = request.confirm;
        options.timeout = m_config.control_timeout;
        options.cancel = request.cancel;
        options.observer = request.observer;

        std::vector<Device> targets;
        std::size_t offline = 0;
        for (auto &d : m_registry.List(*filter))
        {
            if (d.status == common::DeviceStatus::Offline)
                ++offline;
            else
                targets.push_back(std::move(d));
        }
        if (offline > 0)
            std::cout << "[Service] Skipping " << offline << " offline device(s)\n";

        return m_dispatcher.Dispatch(targets, command, options);
    }

    bool FleetService::Forget(const std::string &id_or_ip)
    {
        auto device = m_registry.Get(id_or_ip);
        if (!device || !m_registry.Deregister(device->id))
            return false;

        m_history.Forget(device->id);
        SaveCache();
        return true;
    }

    bool FleetService::SaveCache()
    {
        const auto now = common::Clock::now();
        const auto evicted = m_registry.EvictExpired(now, m_config.cache_ttl);
        if (evicted > 0)
            std::cout << "[Service] Evicted " << evicted << " stale device(s)\n";

        if (!m_cache)
            return false;
        return m_cache->Save(m_registry.List(), now);
    }
}
