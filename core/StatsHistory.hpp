#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../common/Device.hpp"
#include "../common/FleetConfig.hpp"

namespace axe_fleet::core
{
    // Last N snapshots per device, oldest first. In memory only.
    class StatsHistory
    {
    public:
        explicit StatsHistory(std::size_t capacity = common::STATS_HISTORY_CAPACITY);

        void Record(const common::StatsSnapshot &snapshot);

        std::vector<common::StatsSnapshot> Get(const std::string &device_id) const;
        std::optional<common::StatsSnapshot> Latest(const std::string &device_id) const;

        // Mean hashrate of the retained snapshots.
        std::optional<double> BaselineHashrate(const std::string &device_id) const;

        void Forget(const std::string &device_id);
        std::size_t Capacity() const { return m_capacity; }

    private:
        std::size_t m_capacity;
        mutable std::mutex m_mutex;
        std::map<std::string, std::deque<common::StatsSnapshot>> m_history;
    };
}
