#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include "../api/HttpTransport.hpp"
#include "../common/Device.hpp"
#include "../common/FleetConfig.hpp"
#include "../common/FleetError.hpp"
#include "DeviceRegistry.hpp"

namespace axe_fleet::core
{
    struct PollResult
    {
        common::Device device;
        std::optional<common::StatsSnapshot> snapshot;
        std::optional<common::DeviceError> error;

        bool Ok() const { return snapshot.has_value(); }
    };

    struct SwarmSummary
    {
        std::size_t total_devices = 0;
        std::size_t healthy = 0;
        std::size_t unhealthy = 0;
        std::size_t unreachable = 0;

        double total_hashrate_ghs = 0.0;
        double total_power_w = 0.0;
        double average_temperature_c = 0.0;
        // GH/s per watt over the responding devices.
        double average_efficiency = 0.0;

        std::size_t Responding() const { return healthy + unhealthy; }
    };

    struct TypeSummary
    {
        common::DeviceType device_type = common::DeviceType::Unknown;
        SwarmSummary summary;
    };

    // Failed polls only count towards unreachable.
    SwarmSummary Summarize(const std::vector<PollResult> &results,
                           double unhealthy_temperature_c = common::UNHEALTHY_TEMPERATURE_C);

    // One entry per device type present, in AllDeviceTypes() order.
    std::vector<TypeSummary> SummarizeByType(const std::vector<PollResult> &results,
                                             double unhealthy_temperature_c = common::UNHEALTHY_TEMPERATURE_C);

    class StatsPoller
    {
    public:
        StatsPoller(std::shared_ptr<api::HttpTransport> transport,
                    std::size_t worker_limit = common::POLL_WORKERS,
                    DeviceRegistry *registry = nullptr);

        // One request per device on at most min(worker_limit, n) threads.
        // Results come back in input order; a failure never affects siblings.
        // Devices not yet started when *cancel is set report Cancelled.
        // With a registry, each answer marks the device online and each
        // failure marks it offline (unreachable) or error.
        std::vector<PollResult> Poll(const std::vector<common::Device> &devices,
                                     std::chrono::milliseconds per_request_timeout,
                                     const std::atomic<bool> *cancel = nullptr);

        PollResult PollOne(const common::Device &device, std::chrono::milliseconds timeout);

    private:
        std::shared_ptr<api::HttpTransport> m_transport;
        std::size_t m_worker_limit;
        DeviceRegistry *m_registry;
    };
}
