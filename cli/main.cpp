#include "../core/FleetService.hpp"
#include "../common/FleetError.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace axe_fleet;

namespace
{
    std::atomic<bool> g_interrupted{false};

    void OnSignal(int)
    {
        g_interrupted = true;
    }

    void PrintUsage()
    {
        std::cout << "Usage: axefleet [--cache-dir DIR] <command> [args]\n"
                  << "  discover [--network CIDR] [--timeout SEC] [--no-mdns] [--no-scan]\n"
                  << "  list [FILTER]\n"
                  << "  stats [DEVICE]\n"
                  << "  monitor [--temp-alert C] [--hashrate-alert PCT] [--interval SEC]\n"
                  << "  control DEVICE ACTION [PAYLOAD]\n"
                  << "  bulk ACTION [PAYLOAD] [--filter FILTER] [--parallel N] [--yes]\n"
                  << "  forget DEVICE\n"
                  << "Actions: restart, set-fan-speed, update-settings, update-bitcoin-address,\n"
                  << "         update-firmware, update-axeos, wifi-scan\n"
                  << "Filters: all, online, offline, error, TYPE[,TYPE], bitaxe-family,\n"
                  << "         nerdqaxe-family, IP[,IP]\n";
    }

    // Bare words (URLs, addresses) are taken as JSON strings.
    nlohmann::json ParsePayload(const std::string &text)
    {
        try
        {
            return nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &)
        {
            return nlohmann::json(text);
        }
    }

    core::CommandKind ParseAction(const std::string &name)
    {
        auto kind = core::ParseCommandKind(name);
        if (!kind)
            throw common::FleetError(common::ErrorKind::ValidationError, "Unknown action: " + name);
        return *kind;
    }

    std::string NextArg(const std::vector<std::string> &args, std::size_t &i)
    {
        if (i + 1 >= args.size())
            throw common::FleetError(common::ErrorKind::ValidationError, "Missing value for " + args[i]);
        return args[++i];
    }

    double ToNumber(const std::string &flag, const std::string &value)
    {
        try
        {
            return std::stod(value);
        }
        catch (const std::exception &)
        {
            throw common::FleetError(common::ErrorKind::ValidationError, "Invalid number for " + flag + ": " + value);
        }
    }

    void PrintDevice(const common::Device &d)
    {
        std::printf("%-20s %-16s %-14s %-8s %-8s %s\n",
                    d.id.c_str(),
                    d.ip_address.c_str(),
                    common::ToString(d.device_type),
                    common::ToString(d.status),
                    common::ToString(d.source),
                    d.firmware_version.c_str());
    }

    void PrintSummary(const core::SwarmSummary &s)
    {
        std::printf("%zu device(s): %zu healthy, %zu hot, %zu unreachable\n",
                    s.total_devices, s.healthy, s.unhealthy, s.unreachable);
        std::printf("hashrate %.2f GH/s, power %.1f W, avg temp %.1f C, %.2f GH/W\n",
                    s.total_hashrate_ghs, s.total_power_w, s.average_temperature_c, s.average_efficiency);
    }

    void PrintReport(const core::BulkReport &report)
    {
        if (report.confirmation_required)
        {
            std::cout << core::ToString(report.command) << " would be sent to:\n";
            for (const auto &d : report.targets)
                PrintDevice(d);
            std::cout << "Re-run with --yes to execute.\n";
            return;
        }

        for (const auto &r : report.results)
        {
            std::cout << (r.success ? "ok    " : "FAILED") << " " << r.device_id << " (" << r.ip_address << ")";
            if (r.error)
                std::cout << ": " << common::ToString(r.error->kind) << ": " << r.error->message;
            std::cout << "\n";
            if (r.detail)
                std::cout << "       " << r.detail->dump() << "\n";
        }
        std::cout << report.Succeeded() << " succeeded, " << report.Failed() << " failed\n";
    }

    int Run(const std::vector<std::string> &all)
    {
        common::FleetConfig config;
        config.cache_dir = common::DefaultCacheDir();

        std::vector<std::string> args;
        for (std::size_t i = 0; i < all.size(); ++i)
        {
            if (all[i] == "--cache-dir")
                config.cache_dir = NextArg(all, i);
            else
                args.push_back(all[i]);
        }

        if (args.empty() || args[0] == "help" || args[0] == "--help")
        {
            PrintUsage();
            return args.empty() ? 1 : 0;
        }

        core::FleetService service(config);
        const std::string &command = args[0];

        if (command == "discover")
        {
            core::DiscoverRequest request;
            for (std::size_t i = 1; i < args.size(); ++i)
            {
                if (args[i] == "--network")
                    request.network = NextArg(args, i);
                else if (args[i] == "--timeout")
                    request.timeout = std::chrono::seconds(static_cast<long>(ToNumber(args[i], NextArg(args, i))));
                else if (args[i] == "--no-mdns")
                    request.mdns = false;
                else if (args[i] == "--no-scan")
                    request.active_scan = false;
                else
                    throw common::FleetError(common::ErrorKind::ValidationError, "Unknown option: " + args[i]);
            }

            auto response = service.Discover(request);
            for (const auto &d : response.devices)
                PrintDevice(d);
            std::cout << response.summary.Found() << " device(s) found on " << response.summary.network << "\n";
            return 0;
        }

        if (command == "list")
        {
            for (const auto &d : service.List(args.size() > 1 ? args[1] : "all"))
                PrintDevice(d);
            return 0;
        }

        if (command == "stats")
        {
            std::optional<std::string> device;
            if (args.size() > 1)
                device = args[1];

            auto response = service.Stats(device);
            for (const auto &r : response.results)
            {
                if (r.Ok())
                    std::printf("%-20s %8.2f GH/s %6.1f C %6.1f W fan %3d%%\n",
                                r.device.id.c_str(), r.snapshot->hashrate_ghs, r.snapshot->temperature_c,
                                r.snapshot->power_w, r.snapshot->fan_speed_pct);
                else
                    std::printf("%-20s unreachable: %s\n", r.device.id.c_str(), r.error->message.c_str());
            }
            PrintSummary(response.summary);
            return 0;
        }

        if (command == "monitor")
        {
            core::MonitorRequest request;
            for (std::size_t i = 1; i < args.size(); ++i)
            {
                if (args[i] == "--temp-alert")
                    request.temp_alert_c = ToNumber(args[i], NextArg(args, i));
                else if (args[i] == "--hashrate-alert")
                    request.hashrate_drop_pct = ToNumber(args[i], NextArg(args, i));
                else if (args[i] == "--interval")
                    request.interval = std::chrono::seconds(static_cast<long>(ToNumber(args[i], NextArg(args, i))));
                else
                    throw common::FleetError(common::ErrorKind::ValidationError, "Unknown option: " + args[i]);
            }
            request.on_tick = [](std::size_t, const std::vector<core::PollResult> &, const core::SwarmSummary &s)
            { PrintSummary(s); };

            std::thread watcher([&service]()
                                {
                while (!g_interrupted)
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                service.StopMonitor(); });

            try
            {
                service.Monitor(request);
            }
            catch (...)
            {
                g_interrupted = true;
                watcher.join();
                throw;
            }
            g_interrupted = true;
            watcher.join();
            return 0;
        }

        if (command == "control")
        {
            if (args.size() < 3)
            {
                PrintUsage();
                return 1;
            }

            core::ControlRequest request;
            request.target = args[1];
            request.action = ParseAction(args[2]);
            if (args.size() > 3)
                request.payload = ParsePayload(args[3]);

            core::BulkReport report;
            report.command = request.action;
            report.results.push_back(service.Control(request));
            PrintReport(report);
            return report.Failed() == 0 ? 0 : 2;
        }

        if (command == "bulk")
        {
            if (args.size() < 2)
            {
                PrintUsage();
                return 1;
            }

            core::BulkRequest request;
            request.action = ParseAction(args[1]);
            request.cancel = &g_interrupted;
            for (std::size_t i = 2; i < args.size(); ++i)
            {
                if (args[i] == "--filter")
                    request.filter = NextArg(args, i);
                else if (args[i] == "--parallel")
                    request.parallelism = core::ParseParallelism(NextArg(args, i));
                else if (args[i] == "--yes")
                    request.confirm = true;
                else if (!request.payload)
                    request.payload = ParsePayload(args[i]);
                else
                    throw common::FleetError(common::ErrorKind::ValidationError, "Unexpected argument: " + args[i]);
            }

            auto report = service.Bulk(request);
            PrintReport(report);
            return report.Failed() == 0 ? 0 : 2;
        }

        if (command == "forget")
        {
            if (args.size() < 2)
            {
                PrintUsage();
                return 1;
            }
            if (!service.Forget(args[1]))
            {
                std::cerr << "Device not found: " << args[1] << "\n";
                return 1;
            }
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        PrintUsage();
        return 1;
    }
}

int main(int argc, char *argv[])
{
    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    try
    {
        return Run(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const common::FleetError &e)
    {
        std::cerr << "[axefleet] " << common::ToString(e.Kind()) << ": " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[axefleet] " << e.what() << "\n";
        return 1;
    }
}
