#include "StatsHistory.hpp"
#include <algorithm>

namespace axe_fleet::core
{
    StatsHistory::StatsHistory(std::size_t capacity)
        : m_capacity(std::max<std::size_t>(1, capacity))
    {
    }

    void StatsHistory::Record(const common::StatsSnapshot &snapshot)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &entries = m_history[snapshot.device_id];
        entries.push_back(snapshot);
        while (entries.size() > m_capacity)
            entries.pop_front();
    }

    std::vector<common::StatsSnapshot> StatsHistory::Get(const std::string &device_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_history.find(device_id);
        if (it == m_history.end())
            return {};
        return {it->second.begin(), it->second.end()};
    }

    std::optional<common::StatsSnapshot> StatsHistory::Latest(const std::string &device_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_history.find(device_id);
        if (it == m_history.end() || it->second.empty())
            return std::nullopt;
        return it->second.back();
    }

    std::optional<double> StatsHistory::BaselineHashrate(const std::string &device_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_history.find(device_id);
        if (it == m_history.end() || it->second.empty())
            return std::nullopt;

        double sum = 0.0;
        for (const auto &s : it->second)
            sum += s.hashrate_ghs;
        return sum / static_cast<double>(it->second.size());
    }

    void StatsHistory::Forget(const std::string &device_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.erase(device_id);
    }
}
