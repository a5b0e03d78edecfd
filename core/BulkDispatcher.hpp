#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../api/AxeOsModels.hpp"
#include "../api/HttpTransport.hpp"
#include "../common/Device.hpp"
#include "../common/FleetConfig.hpp"
#include "../common/FleetError.hpp"

namespace axe_fleet::core
{
    enum class CommandKind
    {
        Restart,
        SetFanSpeed,
        UpdateSettings,
        UpdateBitcoinAddress,
        UpdateFirmware,
        UpdateAxeOs,
        WifiScan
    };

    const char *ToString(CommandKind kind);
    std::optional<CommandKind> ParseCommandKind(const std::string &name);

    // A positive whole number of concurrent requests.
    // Throws FleetError(ValidationError) on anything else.
    std::size_t ParseParallelism(const std::string &text);

    struct Command
    {
        CommandKind kind = CommandKind::WifiScan;
        int fan_speed_pct = 0;
        api::SystemUpdate settings;
        std::string bitcoin_address;
        std::string url;

        static Command Restart();
        static Command SetFanSpeed(int percent);
        static Command UpdateSettings(api::SystemUpdate settings);
        static Command UpdateBitcoinAddress(std::string base_address);
        static Command UpdateFirmware(std::string firmware_url);
        static Command UpdateAxeOs(std::string www_url);
        static Command WifiScan();

        // Everything except WifiScan changes device state.
        bool IsDestructive() const { return kind != CommandKind::WifiScan; }

        // Throws FleetError(ValidationError).
        void Validate() const;
    };

    // PATCH /api/system body for the settings-style commands; nullopt for the
    // others. UpdateBitcoinAddress yields stratumUser = base + "." + device.id.
    std::optional<api::SystemUpdate> BuildUpdate(const Command &command, const common::Device &device);

    // JSON body the device would receive (null for body-less requests).
    nlohmann::json BuildPayload(const Command &command, const common::Device &device);

    enum class TargetState
    {
        Pending,
        InFlight,
        Succeeded,
        Failed
    };

    const char *ToString(TargetState state);

    struct BulkOperationResult
    {
        std::string device_id;
        std::string ip_address;
        bool success = false;
        std::optional<common::DeviceError> error;
        // Command output, e.g. the networks of a WiFi scan.
        std::optional<nlohmann::json> detail;
    };

    struct BulkReport
    {
        CommandKind command = CommandKind::WifiScan;
        // Set when a destructive command was not confirmed. Nothing was sent
        // and results is empty; targets lists what would have been touched.
        bool confirmation_required = false;
        std::vector<common::Device> targets;
        std::vector<BulkOperationResult> results;

        std::size_t Succeeded() const;
        std::size_t Failed() const;
    };

    using StateObserver = std::function<void(const std::string &device_id, TargetState state)>;

    struct DispatchOptions
    {
        // Defaults to DefaultParallelism(command).
        std::optional<std::size_t> max_parallel;
        bool confirmed = false;
        std::chrono::milliseconds timeout = common::CONTROL_TIMEOUT;
        const std::atomic<bool> *cancel = nullptr;
        // Called from worker threads.
        StateObserver observer;
    };

    class BulkDispatcher
    {
    public:
        explicit BulkDispatcher(std::shared_ptr<api::HttpTransport> transport);

        // One result per target, in target order. Targets not started when
        // *cancel is set fail with Cancelled. Command and option validation
        // happens before any request is sent.
        BulkReport Dispatch(const std::vector<common::Device> &targets,
                            const Command &command,
                            const DispatchOptions &options = {});

        // Runs one command against one device without confirmation checks.
        BulkOperationResult Execute(const common::Device &target,
                                    const Command &command,
                                    std::chrono::milliseconds timeout);

        static std::size_t DefaultParallelism(const Command &command);

    private:
        std::shared_ptr<api::HttpTransport> m_transport;
    };
}
