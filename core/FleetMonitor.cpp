#include "FleetMonitor.hpp"
#include "../common/FleetError.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <utility>

namespace axe_fleet::core
{
    using common::ErrorKind;
    using common::FleetError;

    const char *ToString(AlertKind kind)
    {
        switch (kind)
        {
        case AlertKind::Temperature:
            return "temperature";
        case AlertKind::HashrateDrop:
            return "hashrate-drop";
        case AlertKind::Offline:
            return "offline";
        }
        return "offline";
    }

    static std::string Format(const char *fmt, double a, double b)
    {
        char buf[96];
        std::snprintf(buf, sizeof(buf), fmt, a, b);
        return buf;
    }

    FleetMonitor::FleetMonitor(DeviceRegistry &registry,
                               StatsPoller &poller,
                               StatsHistory &history,
                               std::chrono::milliseconds per_request_timeout)
        : m_registry(registry),
          m_poller(poller),
          m_history(history),
          m_timeout(per_request_timeout),
          m_running(false),
          m_stop_requested(false),
          m_ticks(0)
    {
    }

    FleetMonitor::~FleetMonitor()
    {
        Stop();
    }

    void FleetMonitor::Validate(std::chrono::milliseconds interval, const Thresholds &thresholds)
    {
        if (interval.count() <= 0)
            throw FleetError(ErrorKind::ValidationError, "Monitor interval must be positive");
        if (thresholds.hashrate_drop_pct &&
            (*thresholds.hashrate_drop_pct <= 0.0 || *thresholds.hashrate_drop_pct > 100.0))
            throw FleetError(ErrorKind::ValidationError, "Hashrate drop threshold must be in (0, 100]");
    }

    std::vector<Alert> FleetMonitor::Evaluate(const PollResult &result,
                                              std::optional<double> baseline,
                                              const Thresholds &thresholds,
                                              common::TimePoint at)
    {
        std::vector<Alert> alerts;
        const auto &device = result.device;

        auto make = [&](AlertKind kind, double value, double threshold, std::string message)
        {
            Alert a;
            a.kind = kind;
            a.device_id = device.id;
            a.ip_address = device.ip_address;
            a.value = value;
            a.threshold = threshold;
            a.message = std::move(message);
            a.at = at;
            alerts.push_back(std::move(a));
        };

        if (!result.Ok())
        {
            const std::string reason = result.error ? result.error->message : "no response";
            make(AlertKind::Offline, 0.0, 0.0, device.id + " went offline: " + reason);
            return alerts;
        }

        const auto &snap = *result.snapshot;

        if (thresholds.temp_alert_c && snap.temperature_c > *thresholds.temp_alert_c)
        {
            make(AlertKind::Temperature, snap.temperature_c, *thresholds.temp_alert_c,
                 device.id + Format(" temperature %.1f C above %.1f C", snap.temperature_c, *thresholds.temp_alert_c));
        }

        if (thresholds.hashrate_drop_pct && baseline && *baseline > 0.0)
        {
            const double drop = (*baseline - snap.hashrate_ghs) / *baseline * 100.0;
            if (drop > *thresholds.hashrate_drop_pct)
            {
                make(AlertKind::HashrateDrop, drop, *thresholds.hashrate_drop_pct,
                     device.id + Format(" hashrate dropped %.1f%% (baseline %.2f GH/s)", drop, *baseline));
            }
        }

        return alerts;
    }

    std::vector<Alert> FleetMonitor::Tick(const Thresholds &thresholds)
    {
        const std::size_t tick = ++m_ticks;
        const auto devices = m_registry.Snapshot();

        auto results = m_poller.Poll(devices, m_timeout);
        const auto now = common::Clock::now();

        std::vector<Alert> alerts;
        for (const auto &r : results)
        {
            std::optional<double> baseline;
            if (r.Ok())
            {
                baseline = m_history.BaselineHashrate(r.device.id);
                m_history.Record(*r.snapshot);
            }

            auto raised = Evaluate(r, baseline, thresholds, now);
            alerts.insert(alerts.end(), raised.begin(), raised.end());
        }

        const auto summary = Summarize(results);
        std::cout << "[Monitor] Tick " << tick << ": " << summary.Responding() << "/" << summary.total_devices
                  << " responding, " << alerts.size() << " alert(s)\n";

        if (m_on_tick)
            m_on_tick(tick, results, summary);

        return alerts;
    }

    void FleetMonitor::Run(std::chrono::milliseconds interval, const Thresholds &thresholds, AlertCallback on_alert)
    {
        Validate(interval, thresholds);
        m_running = true;
        // A Stop() that came in before Run() still counts.
        if (m_stop_requested)
            m_running = false;
        MonitorLoop(interval, thresholds, on_alert);
    }

    void FleetMonitor::MonitorLoop(std::chrono::milliseconds interval,
                                   const Thresholds &thresholds,
                                   const AlertCallback &on_alert)
    {
        while (m_running)
        {
            for (const auto &alert : Tick(thresholds))
            {
                std::cerr << "[Monitor] ALERT " << alert.message << "\n";
                if (on_alert)
                    on_alert(alert);
            }
            SleepInterval(interval);
        }

        m_stop_requested = false;
        std::cout << "[Monitor] Stopped after " << m_ticks << " tick(s)\n";
    }

    void FleetMonitor::Start(std::chrono::milliseconds interval, const Thresholds &thresholds, AlertCallback on_alert)
    {
        if (m_running)
            return;
        Validate(interval, thresholds);
        m_stop_requested = false;
        m_running = true;
        m_thread = std::thread([this, interval, thresholds, cb = std::move(on_alert)]()
                               { MonitorLoop(interval, thresholds, cb); });
    }

    void FleetMonitor::Stop()
    {
        m_stop_requested = true;
        m_running = false;
        if (m_thread.joinable())
            m_thread.join();
    }

    void FleetMonitor::SleepInterval(std::chrono::milliseconds interval)
    {
        const auto step = std::chrono::milliseconds(100);
        auto remaining = interval;

        while (remaining.count() > 0)
        {
            if (!m_running)
                return;
            const auto slice = std::min(step, remaining);
            std::this_thread::sleep_for(slice);
            remaining -= slice;
        }
    }
}
