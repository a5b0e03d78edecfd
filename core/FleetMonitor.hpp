#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../common/Device.hpp"
#include "../common/FleetConfig.hpp"
#include "DeviceRegistry.hpp"
#include "StatsHistory.hpp"
#include "StatsPoller.hpp"

namespace axe_fleet::core
{
    enum class AlertKind
    {
        Temperature,
        HashrateDrop,
        Offline
    };

    const char *ToString(AlertKind kind);

    struct Thresholds
    {
        std::optional<double> temp_alert_c;
        // Percent drop versus the device's rolling baseline.
        std::optional<double> hashrate_drop_pct;
    };

    struct Alert
    {
        AlertKind kind = AlertKind::Offline;
        std::string device_id;
        std::string ip_address;
        double value = 0.0;
        double threshold = 0.0;
        std::string message;
        common::TimePoint at{};
    };

    using AlertCallback = std::function<void(const Alert &alert)>;
    using TickCallback = std::function<void(std::size_t tick,
                                            const std::vector<PollResult> &results,
                                            const SwarmSummary &summary)>;

    // Periodic poll of every registered device. Alerts are level-triggered:
    // a condition that still holds on the next tick is reported again.
    class FleetMonitor
    {
    public:
        FleetMonitor(DeviceRegistry &registry,
                     StatsPoller &poller,
                     StatsHistory &history,
                     std::chrono::milliseconds per_request_timeout = common::STATS_TIMEOUT);
        ~FleetMonitor();

        FleetMonitor(const FleetMonitor &) = delete;
        FleetMonitor &operator=(const FleetMonitor &) = delete;

        static void Validate(std::chrono::milliseconds interval, const Thresholds &thresholds);

        // Blocks until Stop(). Stop is honoured between ticks only; a Stop()
        // issued before Run() makes it return without ticking.
        void Run(std::chrono::milliseconds interval, const Thresholds &thresholds, AlertCallback on_alert);

        void Start(std::chrono::milliseconds interval, const Thresholds &thresholds, AlertCallback on_alert);
        void Stop();
        bool IsRunning() const { return m_running; }

        void SetTickCallback(TickCallback callback) { m_on_tick = std::move(callback); }

        // Runs one poll-and-evaluate round and returns the alerts it raised.
        std::vector<Alert> Tick(const Thresholds &thresholds);
        std::size_t TickCount() const { return m_ticks; }

        // Alerts for one poll result. baseline is the device's mean hashrate
        // before this result was recorded.
        static std::vector<Alert> Evaluate(const PollResult &result,
                                           std::optional<double> baseline,
                                           const Thresholds &thresholds,
                                           common::TimePoint at);

    private:
        void MonitorLoop(std::chrono::milliseconds interval,
                         const Thresholds &thresholds,
                         const AlertCallback &on_alert);
        void SleepInterval(std::chrono::milliseconds interval);

        DeviceRegistry &m_registry;
        StatsPoller &m_poller;
        StatsHistory &m_history;
        std::chrono::milliseconds m_timeout;

        TickCallback m_on_tick;
        std::atomic<bool> m_running;
        std::atomic<bool> m_stop_requested;
        std::atomic<std::size_t> m_ticks;
        std::thread m_thread;
    };
}
