#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "../api/AxeOsClient.hpp"
#include "../common/Device.hpp"
#include "../common/FleetConfig.hpp"
#include "../common/ThreadSafeQueue.hpp"
#include "../core/DeviceRegistry.hpp"
#include "AnnouncementSource.hpp"
#include "NetworkScanner.hpp"

namespace axe_fleet::discovery
{
    struct DiscoveryOptions
    {
        // CIDR to scan; auto-detected from the default interface when empty.
        std::optional<std::string> network;
        std::chrono::milliseconds timeout = common::DISCOVERY_TIMEOUT;
        std::chrono::milliseconds mdns_window = common::MDNS_BROWSE_TIMEOUT;
        std::chrono::milliseconds probe_timeout = common::PROBE_TIMEOUT;
        std::chrono::milliseconds cached_probe_timeout = common::CACHED_PROBE_TIMEOUT;
        std::size_t workers = common::SCAN_WORKERS;

        bool mdns = true;
        bool active_scan = true;
        bool use_arp_table = true;
        std::string arp_table_path = "/proc/net/arp";

        // Probed before anything else, typically the cached addresses.
        std::vector<std::string> priority_addresses;
    };

    struct DiscoverySummary
    {
        std::string network;
        std::size_t addresses_probed = 0;
        std::size_t announcements = 0;
        std::size_t found_mdns = 0;
        std::size_t found_scan = 0;
        std::size_t found_cache = 0;
        std::size_t inserted = 0;
        std::size_t updated = 0;
        std::chrono::milliseconds duration{0};
        bool cancelled = false;

        std::size_t Found() const { return found_mdns + found_scan + found_cache; }
    };

    // Finite, single-pass stream of devices found by the passive (mDNS) and
    // active (probe) producers. Each device is yielded once per IP address and
    // merged into the registry, when one is attached, as it is consumed.
    class DiscoveryStream
    {
    public:
        ~DiscoveryStream();

        DiscoveryStream(const DiscoveryStream &) = delete;
        DiscoveryStream &operator=(const DiscoveryStream &) = delete;

        // Blocks for the next device; nullopt once both producers finished.
        std::optional<common::Device> Next();
        std::vector<common::Device> Drain();

        // Stops scheduling new probes and browsing; requests already in
        // flight finish or time out.
        void Cancel();

        // Complete once Next() has returned nullopt.
        DiscoverySummary Summary() const;

    private:
        friend class DiscoveryEngine;

        DiscoveryStream(std::shared_ptr<api::HttpTransport> transport,
                        core::DeviceRegistry *registry,
                        std::unique_ptr<AnnouncementSource> source,
                        std::optional<Ipv4Network> network,
                        DiscoveryOptions options);

        void Start();
        void ActiveLoop();
        void PassiveLoop();
        void ProducerDone();
        bool Probe(const std::string &address,
                   api::AxeOsClient &client,
                   common::DeviceSource source);
        bool PastDeadline() const;
        void Finish();

        std::shared_ptr<api::HttpTransport> m_transport;
        core::DeviceRegistry *m_registry;
        std::unique_ptr<AnnouncementSource> m_source;
        std::optional<Ipv4Network> m_network;
        DiscoveryOptions m_options;

        common::ThreadSafeQueue<common::Device> m_found;
        std::atomic<bool> m_cancel;
        std::atomic<int> m_producers;
        std::atomic<std::size_t> m_probed;
        std::atomic<std::size_t> m_announcements;

        std::chrono::steady_clock::time_point m_started;
        std::chrono::steady_clock::time_point m_deadline;

        std::thread m_active;
        std::thread m_passive;

        std::set<std::string> m_yielded;
        mutable std::mutex m_summary_mutex;
        DiscoverySummary m_summary;
        bool m_finished = false;
    };

    class DiscoveryEngine
    {
    public:
        using SourceFactory = std::function<std::unique_ptr<AnnouncementSource>()>;

        explicit DiscoveryEngine(std::shared_ptr<api::HttpTransport> transport,
                                 core::DeviceRegistry *registry = nullptr,
                                 SourceFactory source_factory = nullptr);

        // Resolves the network (explicit CIDR or auto-detected) and starts
        // both producers. An invalid or oversized CIDR throws
        // FleetError(ValidationError) before any traffic is sent.
        std::unique_ptr<DiscoveryStream> Discover(const DiscoveryOptions &options);

        // Single-host identity probe.
        std::optional<common::Device> ProbeAddress(const std::string &address,
                                                   std::chrono::milliseconds timeout,
                                                   common::DeviceSource source = common::DeviceSource::Scan);

    private:
        std::shared_ptr<api::HttpTransport> m_transport;
        core::DeviceRegistry *m_registry;
        SourceFactory m_source_factory;
    };
}
