#include "DeviceCache.hpp"
#include "../common/FleetConfig.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace axe_fleet::core
{
    using common::Device;

    namespace
    {
        const char *SQL_SCHEMA =
            "CREATE TABLE IF NOT EXISTS cache_entries ("
            "id TEXT PRIMARY KEY NOT NULL, "
            "ip_address TEXT NOT NULL, "
            "mac_address TEXT, "
            "device_type TEXT NOT NULL DEFAULT 'unknown', "
            "source TEXT NOT NULL DEFAULT 'scan', "
            "status TEXT NOT NULL DEFAULT 'online', "
            "hostname TEXT DEFAULT '', "
            "asic_model TEXT DEFAULT '', "
            "firmware_version TEXT DEFAULT '', "
            "last_seen_ms INTEGER NOT NULL DEFAULT 0, "
            "discovered_at_ms INTEGER NOT NULL DEFAULT 0, "
            "written_at_ms INTEGER NOT NULL DEFAULT 0"
            ");";

        const char *SQL_INSERT =
            "INSERT INTO cache_entries (id, ip_address, mac_address, device_type, source, hostname, "
            "asic_model, firmware_version, last_seen_ms, discovered_at_ms, written_at_ms, status) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

        // Columns added after the first schema, with their definitions.
        const std::pair<const char *, const char *> ADDED_COLUMNS[] = {
            {"status", "TEXT NOT NULL DEFAULT 'online'"},
        };

        class Row
        {
        public:
            Row(sqlite3_stmt *stmt, const std::map<std::string, int> &columns)
                : m_stmt(stmt), m_columns(columns) {}

            std::optional<std::string> Text(const char *name) const
            {
                auto it = m_columns.find(name);
                if (it == m_columns.end() || sqlite3_column_type(m_stmt, it->second) == SQLITE_NULL)
                    return std::nullopt;
                const unsigned char *text = sqlite3_column_text(m_stmt, it->second);
                return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
            }

            std::int64_t Int(const char *name) const
            {
                auto it = m_columns.find(name);
                if (it == m_columns.end())
                    return 0;
                return sqlite3_column_int64(m_stmt, it->second);
            }

        private:
            sqlite3_stmt *m_stmt;
            const std::map<std::string, int> &m_columns;
        };
    }

    DeviceCache::DeviceCache(const std::string &cache_dir)
        : m_dir(cache_dir),
          m_path((std::filesystem::path(cache_dir) / common::CACHE_FILE_NAME).string()),
          m_db(nullptr)
    {
    }

    DeviceCache::~DeviceCache()
    {
        Close();
    }

    bool DeviceCache::ExecLocked(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[Cache] SQL error: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool DeviceCache::Open()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return OpenLocked();
    }

    bool DeviceCache::OpenLocked()
    {
        if (m_db)
            return true;

        std::error_code ec;
        std::filesystem::create_directories(m_dir, ec);
        if (ec)
        {
            std::cerr << "[Cache] Cannot create " << m_dir << ": " << ec.message() << "\n";
            return false;
        }

        if (sqlite3_open(m_path.c_str(), &m_db) != SQLITE_OK)
        {
            std::cerr << "[Cache] Open failed: " << sqlite3_errmsg(m_db) << "\n";
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }

        sqlite3_busy_timeout(m_db, 2000);
        if (!ExecLocked(SQL_SCHEMA) || !MigrateLocked())
        {
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        return true;
    }

    bool DeviceCache::MigrateLocked()
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, "PRAGMA table_info(cache_entries);", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Cache] Schema check failed: " << sqlite3_errmsg(m_db) << "\n";
            return false;
        }

        std::set<std::string> present;
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            const unsigned char *name = sqlite3_column_text(stmt, 1);
            if (name)
                present.insert(reinterpret_cast<const char *>(name));
        }
        sqlite3_finalize(stmt);

        for (const auto &column : ADDED_COLUMNS)
        {
            if (present.count(column.first) > 0)
                continue;
            const std::string sql = std::string("ALTER TABLE cache_entries ADD COLUMN ") + column.first + " " +
                                    column.second + ";";
            if (!ExecLocked(sql.c_str()))
                return false;
            std::cout << "[Cache] Added column " << column.first << "\n";
        }
        return true;
    }

    void DeviceCache::Close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db)
        {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    std::vector<CacheEntry> DeviceCache::Load(common::TimePoint now, common::Clock::duration ttl)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<CacheEntry> entries;
        if (!OpenLocked())
            return entries;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT * FROM cache_entries;", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Cache] Read failed: " << sqlite3_errmsg(m_db) << "\n";
            return entries;
        }

        std::map<std::string, int> columns;
        for (int i = 0; i < sqlite3_column_count(stmt); ++i)
            columns[sqlite3_column_name(stmt, i)] = i;

        std::size_t expired = 0;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            Row row(stmt, columns);

            CacheEntry entry;
            entry.written_at = common::FromUnixMillis(row.Int("written_at_ms"));
            if (now - entry.written_at > ttl)
            {
                ++expired;
                continue;
            }

            Device &d = entry.device;
            d.id = row.Text("id").value_or("");
            d.ip_address = row.Text("ip_address").value_or("");
            if (d.id.empty() || d.ip_address.empty())
                continue;

            if (auto mac = row.Text("mac_address"))
                d.mac_address = common::NormalizeMac(*mac);
            d.device_type = common::ParseDeviceType(row.Text("device_type").value_or(""))
                                .value_or(common::DeviceType::Unknown);
            d.source = common::DeviceSource::Cache;
            d.status = common::ParseDeviceStatus(row.Text("status").value_or(""))
                           .value_or(common::DeviceStatus::Online);
            d.hostname = row.Text("hostname").value_or("");
            d.asic_model = row.Text("asic_model").value_or("");
            d.firmware_version = row.Text("firmware_version").value_or("");
            d.last_seen = common::FromUnixMillis(row.Int("last_seen_ms"));
            d.discovered_at = common::FromUnixMillis(row.Int("discovered_at_ms"));

            entries.push_back(std::move(entry));
        }
        if (rc != SQLITE_DONE)
            std::cerr << "[Cache] Read stopped early: " << sqlite3_errmsg(m_db) << "\n";
        sqlite3_finalize(stmt);

        if (expired > 0)
            std::cout << "[Cache] Skipped " << expired << " expired entries\n";
        return entries;
    }

    bool DeviceCache::Save(const std::vector<Device> &devices, common::TimePoint written_at)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!OpenLocked())
            return false;

        if (!ExecLocked("BEGIN IMMEDIATE;"))
            return false;

        bool ok = ExecLocked("DELETE FROM cache_entries;");

        sqlite3_stmt *stmt = nullptr;
        if (ok && sqlite3_prepare_v2(m_db, SQL_INSERT, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Cache] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
            ok = false;
        }

        const std::int64_t written_ms = common::ToUnixMillis(written_at);
        for (std::size_t i = 0; ok && i < devices.size(); ++i)
        {
            const Device &d = devices[i];
            sqlite3_bind_text(stmt, 1, d.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, d.ip_address.c_str(), -1, SQLITE_TRANSIENT);
            if (d.mac_address)
                sqlite3_bind_text(stmt, 3, d.mac_address->c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(stmt, 3);
            sqlite3_bind_text(stmt, 4, common::ToString(d.device_type), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 5, common::ToString(d.source), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 6, d.hostname.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 7, d.asic_model.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 8, d.firmware_version.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 9, common::ToUnixMillis(d.last_seen));
            sqlite3_bind_int64(stmt, 10, common::ToUnixMillis(d.discovered_at));
            sqlite3_bind_int64(stmt, 11, written_ms);
            sqlite3_bind_text(stmt, 12, common::ToString(d.status), -1, SQLITE_STATIC);

            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                std::cerr << "[Cache] Insert of " << d.id << " failed: " << sqlite3_errmsg(m_db) << "\n";
                ok = false;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        if (stmt)
            sqlite3_finalize(stmt);

        if (ok)
        {
            const std::string pragma = "PRAGMA user_version = " + std::to_string(common::CACHE_SCHEMA_VERSION) + ";";
            ok = ExecLocked(pragma.c_str());
        }

        if (!ok)
        {
            ExecLocked("ROLLBACK;");
            return false;
        }
        return ExecLocked("COMMIT;");
    }
}
