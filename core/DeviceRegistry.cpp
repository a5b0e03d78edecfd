#include "DeviceRegistry.hpp"
#include <algorithm>

namespace axe_fleet::core
{
    using common::Device;

    const char *ToString(MergeOutcome outcome)
    {
        switch (outcome)
        {
        case MergeOutcome::Inserted:
            return "inserted";
        case MergeOutcome::Updated:
            return "updated";
        case MergeOutcome::Unchanged:
            return "unchanged";
        }
        return "unchanged";
    }

    static bool SameState(const Device &a, const Device &b)
    {
        return a.id == b.id && a.ip_address == b.ip_address && a.mac_address == b.mac_address &&
               a.device_type == b.device_type && a.source == b.source && a.status == b.status &&
               a.last_seen == b.last_seen &&
               a.discovered_at == b.discovered_at && a.hostname == b.hostname &&
               a.asic_model == b.asic_model && a.firmware_version == b.firmware_version;
    }

    DeviceRegistry::Table::iterator DeviceRegistry::FindLocked(const std::string &id_or_ip)
    {
        auto it = m_devices.find(id_or_ip);
        if (it != m_devices.end())
            return it;
        return std::find_if(m_devices.begin(), m_devices.end(), [&](const auto &entry)
                            { return entry.second.ip_address == id_or_ip; });
    }

    DeviceRegistry::Table::const_iterator DeviceRegistry::FindLocked(const std::string &id_or_ip) const
    {
        auto it = m_devices.find(id_or_ip);
        if (it != m_devices.end())
            return it;
        return std::find_if(m_devices.begin(), m_devices.end(), [&](const auto &entry)
                            { return entry.second.ip_address == id_or_ip; });
    }

    std::string DeviceRegistry::UniqueIdLocked(const std::string &wanted) const
    {
        if (m_devices.count(wanted) == 0)
            return wanted;
        for (int n = 2;; ++n)
        {
            std::string id = wanted + "-" + std::to_string(n);
            if (m_devices.count(id) == 0)
                return id;
        }
    }

    MergeOutcome DeviceRegistry::Merge(const Device &raw)
    {
        Device candidate = raw;
        candidate.mac_address = candidate.mac_address ? common::NormalizeMac(*candidate.mac_address) : std::nullopt;

        std::lock_guard<std::mutex> lock(m_mutex);

        auto match = m_devices.end();
        if (candidate.mac_address)
        {
            match = std::find_if(m_devices.begin(), m_devices.end(), [&](const auto &entry)
                                 { return entry.second.mac_address == candidate.mac_address; });
        }

        auto at_same_ip = std::find_if(m_devices.begin(), m_devices.end(), [&](const auto &entry)
                                       { return entry.second.ip_address == candidate.ip_address; });

        if (match == m_devices.end() && at_same_ip != m_devices.end())
        {
            // Same address without a conflicting MAC is the same unit.
            const auto &existing_mac = at_same_ip->second.mac_address;
            if (!candidate.mac_address || !existing_mac)
                match = at_same_ip;
        }

        // Whoever else still holds this address has been superseded.
        if (at_same_ip != m_devices.end() && at_same_ip != match)
            m_devices.erase(at_same_ip);

        if (match == m_devices.end())
        {
            Device inserted = candidate;
            inserted.id = UniqueIdLocked(candidate.id.empty() ? candidate.ip_address : candidate.id);
            if (inserted.discovered_at == common::TimePoint{})
                inserted.discovered_at = inserted.last_seen;
            m_devices.emplace(inserted.id, std::move(inserted));
            return MergeOutcome::Inserted;
        }

        Device &existing = match->second;
        const Device before = existing;

        existing.ip_address = candidate.ip_address;
        if (candidate.mac_address)
            existing.mac_address = candidate.mac_address;
        existing.device_type = candidate.device_type;
        existing.source = candidate.source;
        existing.status = candidate.status;
        existing.last_seen = std::max(existing.last_seen, candidate.last_seen);
        if (!candidate.hostname.empty())
            existing.hostname = candidate.hostname;
        if (!candidate.asic_model.empty())
            existing.asic_model = candidate.asic_model;
        if (!candidate.firmware_version.empty())
            existing.firmware_version = candidate.firmware_version;

        return SameState(before, existing) ? MergeOutcome::Unchanged : MergeOutcome::Updated;
    }

    std::vector<Device> DeviceRegistry::List() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Device> out;
        out.reserve(m_devices.size());
        for (const auto &entry : m_devices)
            out.push_back(entry.second);
        return out;
    }

    std::vector<Device> DeviceRegistry::List(const DeviceFilter &filter) const
    {
        std::vector<Device> out;
        for (auto &d : List())
        {
            if (filter.IsMatch(d))
                out.push_back(std::move(d));
        }
        return out;
    }

    std::optional<Device> DeviceRegistry::Get(const std::string &id_or_ip) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = FindLocked(id_or_ip);
        if (it == m_devices.end())
            return std::nullopt;
        return it->second;
    }

    std::size_t DeviceRegistry::EvictExpired(common::TimePoint now, common::Clock::duration ttl)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t removed = 0;
        for (auto it = m_devices.begin(); it != m_devices.end();)
        {
            if (now - it->second.last_seen > ttl)
            {
                it = m_devices.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    bool DeviceRegistry::Deregister(const std::string &id_or_ip)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = FindLocked(id_or_ip);
        if (it == m_devices.end())
            return false;
        m_devices.erase(it);
        return true;
    }

    bool DeviceRegistry::Touch(const std::string &id_or_ip, common::TimePoint seen_at)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = FindLocked(id_or_ip);
        if (it == m_devices.end())
            return false;
        it->second.last_seen = std::max(it->second.last_seen, seen_at);
        it->second.status = common::DeviceStatus::Online;
        return true;
    }

    bool DeviceRegistry::SetStatus(const std::string &id_or_ip, common::DeviceStatus status)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = FindLocked(id_or_ip);
        if (it == m_devices.end())
            return false;
        it->second.status = status;
        return true;
    }

    std::size_t DeviceRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    void DeviceRegistry::Clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_devices.clear();
    }
}
