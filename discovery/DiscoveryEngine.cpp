#include "DiscoveryEngine.hpp"
#include "../common/FleetError.hpp"
#include "../common/WorkerPool.hpp"
#include "MdnsBrowser.hpp"
#include <algorithm>
#include <iostream>

namespace axe_fleet::discovery
{
    using common::Device;
    using common::DeviceSource;
    using common::ErrorKind;
    using common::FleetError;
    using SteadyClock = std::chrono::steady_clock;

    DiscoveryStream::DiscoveryStream(std::shared_ptr<api::HttpTransport> transport,
                                     core::DeviceRegistry *registry,
                                     std::unique_ptr<AnnouncementSource> source,
                                     std::optional<Ipv4Network> network,
                                     DiscoveryOptions options)
        : m_transport(std::move(transport)),
          m_registry(registry),
          m_source(std::move(source)),
          m_network(network),
          m_options(std::move(options)),
          m_cancel(false),
          m_producers(0),
          m_probed(0),
          m_announcements(0)
    {
    }

    DiscoveryStream::~DiscoveryStream()
    {
        Cancel();
        if (m_active.joinable())
            m_active.join();
        if (m_passive.joinable())
            m_passive.join();
    }

    void DiscoveryStream::Start()
    {
        m_started = SteadyClock::now();
        m_deadline = m_started + m_options.timeout;
        if (m_network)
            m_summary.network = m_network->ToString();

        const bool run_active = !m_options.priority_addresses.empty() || (m_options.active_scan && m_network);
        const bool run_passive = m_options.mdns && m_source;

        m_producers = (run_active ? 1 : 0) + (run_passive ? 1 : 0);
        if (m_producers == 0)
        {
            m_found.Shutdown();
            return;
        }

        if (run_active)
            m_active = std::thread(&DiscoveryStream::ActiveLoop, this);
        if (run_passive)
            m_passive = std::thread(&DiscoveryStream::PassiveLoop, this);
    }

    bool DiscoveryStream::PastDeadline() const
    {
        return SteadyClock::now() >= m_deadline;
    }

    void DiscoveryStream::ProducerDone()
    {
        if (m_producers.fetch_sub(1) == 1)
            m_found.Shutdown();
    }

    bool DiscoveryStream::Probe(const std::string &address, api::AxeOsClient &client, DeviceSource source)
    {
        ++m_probed;
        try
        {
            auto identity = client.Identify(address);
            m_found.Push(api::ToDevice(identity.info, identity.type, address, source, common::Clock::now()));
            return true;
        }
        catch (const FleetError &)
        {
            // Hosts that do not answer like AxeOS are simply not devices.
            return false;
        }
    }

    void DiscoveryStream::ActiveLoop()
    {
        try
        {
            api::AxeOsClient quick(m_transport, m_options.cached_probe_timeout);
            api::AxeOsClient full(m_transport, m_options.probe_timeout);

            std::vector<std::string> priority;
            for (const auto &address : m_options.priority_addresses)
            {
                if (std::find(priority.begin(), priority.end(), address) == priority.end())
                    priority.push_back(address);
            }

            std::mutex hits_mutex;
            std::set<std::string> hits;

            common::ForEachBounded(priority.size(), m_options.workers, [&](std::size_t i)
                                   {
                                       if (PastDeadline())
                                           return;
                                       if (Probe(priority[i], quick, DeviceSource::Cache))
                                       {
                                           std::lock_guard<std::mutex> lock(hits_mutex);
                                           hits.insert(priority[i]);
                                       } },
                                   nullptr, &m_cancel);

            if (m_options.active_scan && m_network && !m_cancel && !PastDeadline())
            {
                std::set<std::string> seen = hits;
                std::vector<std::string> candidates;

                // Known neighbours first: they are alive and answer quickly.
                if (m_options.use_arp_table)
                {
                    for (const auto &n : NetworkScanner::ReadSystemArpTable("", m_options.arp_table_path))
                    {
                        auto ip = ParseIpv4(n.ip);
                        if (ip && m_network->Contains(*ip) && seen.insert(n.ip).second)
                            candidates.push_back(n.ip);
                    }
                }
                for (auto &host : EnumerateHosts(*m_network))
                {
                    if (seen.insert(host).second)
                        candidates.push_back(std::move(host));
                }

                common::ForEachBounded(candidates.size(), m_options.workers, [&](std::size_t i)
                                       {
                                           if (PastDeadline())
                                               return;
                                           Probe(candidates[i], full, DeviceSource::Scan); },
                                       nullptr, &m_cancel);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Discovery] Active scan aborted: " << e.what() << "\n";
        }
        ProducerDone();
    }

    void DiscoveryStream::PassiveLoop()
    {
        common::ThreadSafeQueue<Announcement> pending;
        try
        {
            m_source->Start([this, &pending](const Announcement &a)
                            {
                                ++m_announcements;
                                if (IsPotentialAxeOs(a))
                                    pending.Push(a); });

            api::AxeOsClient client(m_transport, m_options.probe_timeout);
            std::set<std::string> probed;
            const auto window_end = m_started + std::min(m_options.timeout, m_options.mdns_window);

            while (!m_cancel && SteadyClock::now() < window_end)
            {
                auto a = pending.PopFor(std::chrono::milliseconds(100));
                if (!a)
                    continue;

                for (const auto &address : a->addresses)
                {
                    if (!probed.insert(address).second)
                        continue;
                    if (Probe(address, client, DeviceSource::Mdns))
                        break;
                }
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Discovery] mDNS browse aborted: " << e.what() << "\n";
        }
        m_source->Stop();
        ProducerDone();
    }

    std::optional<Device> DiscoveryStream::Next()
    {
        while (true)
        {
            auto found = m_found.Pop();
            if (!found)
            {
                Finish();
                return std::nullopt;
            }

            if (!m_yielded.insert(found->ip_address).second)
                continue;

            Device result = *found;
            std::lock_guard<std::mutex> lock(m_summary_mutex);
            if (m_registry)
            {
                const auto outcome = m_registry->Merge(*found);
                if (outcome == core::MergeOutcome::Inserted)
                    ++m_summary.inserted;
                else if (outcome == core::MergeOutcome::Updated)
                    ++m_summary.updated;
                if (auto merged = m_registry->Get(found->ip_address))
                    result = *merged;
            }

            switch (found->source)
            {
            case DeviceSource::Mdns:
                ++m_summary.found_mdns;
                break;
            case DeviceSource::Scan:
                ++m_summary.found_scan;
                break;
            case DeviceSource::Cache:
                ++m_summary.found_cache;
                break;
            }
            return result;
        }
    }

    std::vector<Device> DiscoveryStream::Drain()
    {
        std::vector<Device> devices;
        while (auto d = Next())
            devices.push_back(std::move(*d));
        return devices;
    }

    void DiscoveryStream::Cancel()
    {
        m_cancel = true;
    }

    void DiscoveryStream::Finish()
    {
        if (m_active.joinable())
            m_active.join();
        if (m_passive.joinable())
            m_passive.join();

        std::lock_guard<std::mutex> lock(m_summary_mutex);
        if (m_finished)
            return;
        m_finished = true;

        m_summary.addresses_probed = m_probed;
        m_summary.announcements = m_announcements;
        m_summary.cancelled = m_cancel;
        m_summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - m_started);

        std::cout << "[Discovery] Found " << m_summary.Found() << " device(s) (" << m_summary.found_mdns
                  << " mDNS, " << m_summary.found_scan << " scan, " << m_summary.found_cache << " cache) after probing "
                  << m_summary.addresses_probed << " address(es) in " << m_summary.duration.count() << " ms\n";
    }

    DiscoverySummary DiscoveryStream::Summary() const
    {
        std::lock_guard<std::mutex> lock(m_summary_mutex);
        return m_summary;
    }

    DiscoveryEngine::DiscoveryEngine(std::shared_ptr<api::HttpTransport> transport,
                                     core::DeviceRegistry *registry,
                                     SourceFactory source_factory)
        : m_transport(std::move(transport)), m_registry(registry), m_source_factory(std::move(source_factory))
    {
    }

    std::unique_ptr<DiscoveryStream> DiscoveryEngine::Discover(const DiscoveryOptions &options)
    {
        if (options.timeout.count() <= 0)
            throw FleetError(ErrorKind::ValidationError, "Discovery timeout must be positive");
        if (options.workers == 0)
            throw FleetError(ErrorKind::ValidationError, "Discovery needs at least one worker");

        std::optional<Ipv4Network> network;
        if (options.network)
        {
            network = ParseCidr(*options.network);
            if (network->AddressCount() > common::MAX_SCAN_HOSTS)
            {
                throw FleetError(ErrorKind::ValidationError,
                                 network->ToString() + " is larger than the " +
                                     std::to_string(common::MAX_SCAN_HOSTS) + " addresses a scan may cover");
            }
        }
        else if (options.active_scan)
        {
            network = NetworkScanner::AutoDetectNetwork();
            if (!network)
                std::cerr << "[Discovery] Could not detect the local network, probing announced and cached devices only\n";
        }

        std::unique_ptr<AnnouncementSource> source;
        if (options.mdns)
        {
            if (m_source_factory)
                source = m_source_factory();
            else
                source = std::make_unique<MdnsBrowser>();
        }

        if (network && options.active_scan)
            std::cout << "[Discovery] Scanning " << network->ToString() << " with " << options.workers << " workers\n";

        std::unique_ptr<DiscoveryStream> stream(
            new DiscoveryStream(m_transport, m_registry, std::move(source), network, options));
        stream->Start();
        return stream;
    }

    std::optional<Device> DiscoveryEngine::ProbeAddress(const std::string &address,
                                                        std::chrono::milliseconds timeout,
                                                        DeviceSource source)
    {
        api::AxeOsClient client(m_transport, timeout);
        Device device;
        try
        {
            auto identity = client.Identify(address);
            device = api::ToDevice(identity.info, identity.type, address, source, common::Clock::now());
        }
        catch (const FleetError &e)
        {
            if (e.Kind() == ErrorKind::ValidationError)
                throw;
            return std::nullopt;
        }

        if (m_registry)
        {
            m_registry->Merge(device);
            if (auto merged = m_registry->Get(address))
                return merged;
        }
        return device;
    }
}
