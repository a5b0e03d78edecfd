#include "BulkDispatcher.hpp"
#include "../api/AxeOsClient.hpp"
#include "../common/WorkerPool.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <set>

namespace axe_fleet::core
{
    using common::Device;
    using common::DeviceError;
    using common::ErrorKind;
    using common::FleetError;
    using nlohmann::json;

    const char *ToString(CommandKind kind)
    {
        switch (kind)
        {
        case CommandKind::Restart:
            return "restart";
        case CommandKind::SetFanSpeed:
            return "set-fan-speed";
        case CommandKind::UpdateSettings:
            return "update-settings";
        case CommandKind::UpdateBitcoinAddress:
            return "update-bitcoin-address";
        case CommandKind::UpdateFirmware:
            return "update-firmware";
        case CommandKind::UpdateAxeOs:
            return "update-axeos";
        case CommandKind::WifiScan:
            return "wifi-scan";
        }
        return "unknown";
    }

    std::optional<CommandKind> ParseCommandKind(const std::string &name)
    {
        std::string n = name;
        std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c)
                       { return static_cast<char>(c == '_' ? '-' : std::tolower(c)); });

        for (auto kind : {CommandKind::Restart, CommandKind::SetFanSpeed, CommandKind::UpdateSettings,
                          CommandKind::UpdateBitcoinAddress, CommandKind::UpdateFirmware,
                          CommandKind::UpdateAxeOs, CommandKind::WifiScan})
        {
            if (n == ToString(kind))
                return kind;
        }
        return std::nullopt;
    }

    std::size_t ParseParallelism(const std::string &text)
    {
        const bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                         { return std::isdigit(c) != 0; });
        if (digits && text.size() <= 6)
        {
            const auto value = static_cast<std::size_t>(std::stoul(text));
            if (value >= 1)
                return value;
        }
        throw FleetError(ErrorKind::ValidationError, "Parallelism must be a whole number of at least 1: " + text);
    }

    const char *ToString(TargetState state)
    {
        switch (state)
        {
        case TargetState::Pending:
            return "pending";
        case TargetState::InFlight:
            return "in-flight";
        case TargetState::Succeeded:
            return "succeeded";
        case TargetState::Failed:
            return "failed";
        }
        return "pending";
    }

    Command Command::Restart()
    {
        Command c;
        c.kind = CommandKind::Restart;
        return c;
    }

    Command Command::SetFanSpeed(int percent)
    {
        Command c;
        c.kind = CommandKind::SetFanSpeed;
        c.fan_speed_pct = percent;
        return c;
    }

    Command Command::UpdateSettings(api::SystemUpdate settings)
    {
        Command c;
        c.kind = CommandKind::UpdateSettings;
        c.settings = std::move(settings);
        return c;
    }

    Command Command::UpdateBitcoinAddress(std::string base_address)
    {
        Command c;
        c.kind = CommandKind::UpdateBitcoinAddress;
        c.bitcoin_address = std::move(base_address);
        return c;
    }

    Command Command::UpdateFirmware(std::string firmware_url)
    {
        Command c;
        c.kind = CommandKind::UpdateFirmware;
        c.url = std::move(firmware_url);
        return c;
    }

    Command Command::UpdateAxeOs(std::string www_url)
    {
        Command c;
        c.kind = CommandKind::UpdateAxeOs;
        c.url = std::move(www_url);
        return c;
    }

    Command Command::WifiScan()
    {
        Command c;
        c.kind = CommandKind::WifiScan;
        return c;
    }

    void Command::Validate() const
    {
        switch (kind)
        {
        case CommandKind::SetFanSpeed:
            api::AxeOsClient::ValidateFanSpeed(fan_speed_pct);
            break;
        case CommandKind::UpdateSettings:
            if (settings.Empty())
                throw FleetError(ErrorKind::ValidationError, "No settings to update");
            break;
        case CommandKind::UpdateBitcoinAddress:
            if (bitcoin_address.empty())
                throw FleetError(ErrorKind::ValidationError, "Bitcoin address is empty");
            // A '.' would mean a worker suffix is already present.
            if (!std::all_of(bitcoin_address.begin(), bitcoin_address.end(), [](unsigned char c)
                             { return std::isalnum(c); }))
                throw FleetError(ErrorKind::ValidationError,
                                 "Bitcoin address must be a bare address without worker suffix: " + bitcoin_address);
            break;
        case CommandKind::UpdateFirmware:
        case CommandKind::UpdateAxeOs:
            api::AxeOsClient::ValidateUpdateUrl(url);
            break;
        case CommandKind::Restart:
        case CommandKind::WifiScan:
            break;
        }
    }

    std::optional<api::SystemUpdate> BuildUpdate(const Command &command, const Device &device)
    {
        switch (command.kind)
        {
        case CommandKind::SetFanSpeed:
        {
            api::SystemUpdate u;
            u.auto_fan_speed = false;
            u.fan_speed_pct = command.fan_speed_pct;
            return u;
        }
        case CommandKind::UpdateSettings:
            return command.settings;
        case CommandKind::UpdateBitcoinAddress:
        {
            api::SystemUpdate u;
            u.pool_user = command.bitcoin_address + "." + device.id;
            return u;
        }
        default:
            return std::nullopt;
        }
    }

    json BuildPayload(const Command &command, const Device &device)
    {
        if (auto update = BuildUpdate(command, device))
            return update->ToJson();
        if (command.kind == CommandKind::UpdateFirmware || command.kind == CommandKind::UpdateAxeOs)
            return json{{"url", command.url}};
        return nullptr;
    }

    std::size_t BulkReport::Succeeded() const
    {
        return static_cast<std::size_t>(std::count_if(results.begin(), results.end(), [](const auto &r)
                                                      { return r.success; }));
    }

    std::size_t BulkReport::Failed() const
    {
        return results.size() - Succeeded();
    }

    BulkDispatcher::BulkDispatcher(std::shared_ptr<api::HttpTransport> transport)
        : m_transport(std::move(transport))
    {
    }

    std::size_t BulkDispatcher::DefaultParallelism(const Command &command)
    {
        return command.IsDestructive() ? common::BULK_PARALLEL_DESTRUCTIVE : common::BULK_PARALLEL_READ_ONLY;
    }

    BulkOperationResult BulkDispatcher::Execute(const Device &target,
                                                const Command &command,
                                                std::chrono::milliseconds timeout)
    {
        BulkOperationResult result;
        result.device_id = target.id;
        result.ip_address = target.ip_address;

        api::AxeOsClient client(m_transport, timeout);
        try
        {
            switch (command.kind)
            {
            case CommandKind::Restart:
                client.Restart(target.ip_address);
                break;
            case CommandKind::SetFanSpeed:
            case CommandKind::UpdateSettings:
            case CommandKind::UpdateBitcoinAddress:
                client.UpdateSystem(target.ip_address, *BuildUpdate(command, target));
                break;
            case CommandKind::UpdateFirmware:
                client.UpdateFirmware(target.ip_address, command.url);
                break;
            case CommandKind::UpdateAxeOs:
                client.UpdateAxeOs(target.ip_address, command.url);
                break;
            case CommandKind::WifiScan:
            {
                json networks = json::array();
                for (const auto &n : client.ScanWifi(target.ip_address))
                    networks.push_back({{"ssid", n.ssid}, {"rssi", n.rssi}, {"channel", n.channel}, {"auth", n.auth}});
                result.detail = std::move(networks);
                break;
            }
            }
            result.success = true;
        }
        catch (const FleetError &e)
        {
            result.error = DeviceError::From(e);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Bulk] " << target.id << ": " << e.what() << "\n";
            result.error = DeviceError{ErrorKind::MalformedResponse, e.what()};
        }
        return result;
    }

    BulkReport BulkDispatcher::Dispatch(const std::vector<Device> &targets,
                                        const Command &command,
                                        const DispatchOptions &options)
    {
        command.Validate();

        const std::size_t max_parallel = options.max_parallel.value_or(DefaultParallelism(command));
        if (max_parallel == 0)
            throw FleetError(ErrorKind::ValidationError, "Parallelism must be at least 1");

        std::set<std::string> ids;
        for (const auto &t : targets)
        {
            if (!ids.insert(t.id).second)
                throw FleetError(ErrorKind::ValidationError, "Device targeted twice: " + t.id);
        }

        BulkReport report;
        report.command = command.kind;
        report.targets = targets;

        if (command.IsDestructive() && !options.confirmed)
        {
            report.confirmation_required = true;
            std::cout << "[Bulk] " << ToString(command.kind) << " on " << targets.size()
                      << " device(s) needs confirmation, nothing was sent\n";
            return report;
        }

        auto notify = [&options](const std::string &id, TargetState state)
        {
            if (options.observer)
                options.observer(id, state);
        };

        for (const auto &t : targets)
            notify(t.id, TargetState::Pending);

        std::mutex accumulator_mutex;
        std::map<std::string, BulkOperationResult> accumulator;

        auto record = [&](BulkOperationResult result)
        {
            notify(result.device_id, result.success ? TargetState::Succeeded : TargetState::Failed);
            std::lock_guard<std::mutex> lock(accumulator_mutex);
            accumulator[result.device_id] = std::move(result);
        };

        common::ForEachBounded(
            targets.size(),
            max_parallel,
            [&](std::size_t i)
            {
                notify(targets[i].id, TargetState::InFlight);
                record(Execute(targets[i], command, options.timeout));
            },
            [&](std::size_t i)
            {
                BulkOperationResult cancelled;
                cancelled.device_id = targets[i].id;
                cancelled.ip_address = targets[i].ip_address;
                cancelled.error = DeviceError{ErrorKind::Cancelled, "Cancelled before the request was sent"};
                record(std::move(cancelled));
            },
            options.cancel);

        report.results.reserve(targets.size());
        for (const auto &t : targets)
            report.results.push_back(accumulator[t.id]);

        std::cout << "[Bulk] " << ToString(command.kind) << " finished: " << report.Succeeded()
                  << " succeeded, " << report.Failed() << " failed\n";
        return report;
    }
}
