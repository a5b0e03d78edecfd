#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../common/Device.hpp"
#include "DeviceFilter.hpp"

namespace axe_fleet::core
{
    enum class MergeOutcome
    {
        Inserted,
        Updated,
        Unchanged
    };

    const char *ToString(MergeOutcome outcome);

    // Table of known devices keyed by id. At most one entry per IP address;
    // entries are matched on MAC when known, otherwise on IP. Every method
    // is safe to call from several threads.
    class DeviceRegistry
    {
    public:
        MergeOutcome Merge(const common::Device &candidate);

        // Ordered by id.
        std::vector<common::Device> List() const;
        std::vector<common::Device> List(const DeviceFilter &filter) const;

        // Looks up by id first, then by IP address.
        std::optional<common::Device> Get(const std::string &id_or_ip) const;

        // Drops entries whose last_seen is more than ttl before now.
        std::size_t EvictExpired(common::TimePoint now, common::Clock::duration ttl);

        bool Deregister(const std::string &id_or_ip);

        // Records a successful contact and marks the device online;
        // last_seen never moves backwards.
        bool Touch(const std::string &id_or_ip, common::TimePoint seen_at);

        // Failed contacts only change the status, the entry stays.
        bool SetStatus(const std::string &id_or_ip, common::DeviceStatus status);

        std::vector<common::Device> Snapshot() const { return List(); }
        std::size_t Size() const;
        void Clear();

    private:
        using Table = std::map<std::string, common::Device>;

        Table::iterator FindLocked(const std::string &id_or_ip);
        Table::const_iterator FindLocked(const std::string &id_or_ip) const;
        std::string UniqueIdLocked(const std::string &wanted) const;

        mutable std::mutex m_mutex;
        Table m_devices;
    };
}
