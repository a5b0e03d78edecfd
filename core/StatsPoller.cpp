#include "StatsPoller.hpp"
#include "../api/AxeOsClient.hpp"
#include "../common/WorkerPool.hpp"
#include <algorithm>
#include <iostream>
#include <map>

namespace axe_fleet::core
{
    using common::Device;
    using common::DeviceError;
    using common::ErrorKind;
    using common::FleetError;

    SwarmSummary Summarize(const std::vector<PollResult> &results, double unhealthy_temperature_c)
    {
        SwarmSummary s;
        s.total_devices = results.size();

        double temperature_sum = 0.0;
        for (const auto &r : results)
        {
            if (!r.Ok())
            {
                ++s.unreachable;
                continue;
            }

            const auto &snap = *r.snapshot;
            if (snap.temperature_c >= unhealthy_temperature_c)
                ++s.unhealthy;
            else
                ++s.healthy;

            s.total_hashrate_ghs += snap.hashrate_ghs;
            s.total_power_w += snap.power_w;
            temperature_sum += snap.temperature_c;
        }

        if (s.Responding() > 0)
            s.average_temperature_c = temperature_sum / static_cast<double>(s.Responding());
        if (s.total_power_w > 0.0)
            s.average_efficiency = s.total_hashrate_ghs / s.total_power_w;
        return s;
    }

    std::vector<TypeSummary> SummarizeByType(const std::vector<PollResult> &results, double unhealthy_temperature_c)
    {
        std::map<common::DeviceType, std::vector<PollResult>> by_type;
        for (const auto &r : results)
            by_type[r.device.device_type].push_back(r);

        std::vector<TypeSummary> out;
        for (auto type : common::AllDeviceTypes())
        {
            auto it = by_type.find(type);
            if (it == by_type.end())
                continue;
            out.push_back({type, Summarize(it->second, unhealthy_temperature_c)});
        }
        return out;
    }

    StatsPoller::StatsPoller(std::shared_ptr<api::HttpTransport> transport,
                             std::size_t worker_limit,
                             DeviceRegistry *registry)
        : m_transport(std::move(transport)),
          m_worker_limit(std::max<std::size_t>(1, worker_limit)),
          m_registry(registry)
    {
    }

    PollResult StatsPoller::PollOne(const Device &device, std::chrono::milliseconds timeout)
    {
        PollResult result;
        result.device = device;

        api::AxeOsClient client(m_transport, timeout);
        try
        {
            auto info = client.GetSystemInfo(device.ip_address);
            const auto now = common::Clock::now();
            result.snapshot = api::ToSnapshot(info, device.id, now);
            if (m_registry)
                m_registry->Touch(device.id, now);
        }
        catch (const FleetError &e)
        {
            result.error = DeviceError::From(e);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Poller] " << device.id << ": " << e.what() << "\n";
            result.error = DeviceError{ErrorKind::MalformedResponse, e.what()};
        }

        if (result.error && m_registry)
        {
            const auto status = result.error->kind == ErrorKind::Unreachable ? common::DeviceStatus::Offline
                                                                             : common::DeviceStatus::Error;
            m_registry->SetStatus(device.id, status);
        }
        return result;
    }

    std::vector<PollResult> StatsPoller::Poll(const std::vector<Device> &devices,
                                              std::chrono::milliseconds per_request_timeout,
                                              const std::atomic<bool> *cancel)
    {
        std::vector<PollResult> results(devices.size());

        common::ForEachBounded(
            devices.size(),
            std::min(m_worker_limit, devices.size()),
            [&](std::size_t i)
            { results[i] = PollOne(devices[i], per_request_timeout); },
            [&](std::size_t i)
            {
                results[i].device = devices[i];
                results[i].error = DeviceError{ErrorKind::Cancelled, "Poll cancelled before it started"};
            },
            cancel);

        return results;
    }
}
