#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "../common/Device.hpp"

namespace axe_fleet::core
{
    struct CacheEntry
    {
        common::Device device;
        common::TimePoint written_at{};
    };

    // devices.db inside the cache directory. The cache is advisory: every
    // failure is logged and reported as false / an empty load.
    class DeviceCache
    {
    private:
        std::string m_dir;
        std::string m_path;
        sqlite3 *m_db;
        std::mutex m_mutex;

        bool OpenLocked();
        bool ExecLocked(const char *sql);
        bool MigrateLocked();

    public:
        explicit DeviceCache(const std::string &cache_dir);
        ~DeviceCache();

        DeviceCache(const DeviceCache &) = delete;
        DeviceCache &operator=(const DeviceCache &) = delete;

        bool Open();
        void Close();

        // Entries written more than ttl before now are skipped. Columns are
        // looked up by name, so rows from newer schemas still load.
        std::vector<CacheEntry> Load(common::TimePoint now, common::Clock::duration ttl);

        // Replaces the whole table in one transaction.
        bool Save(const std::vector<common::Device> &devices, common::TimePoint written_at);

        const std::string &Path() const { return m_path; }
    };
}
