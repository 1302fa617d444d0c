#include "SqliteDeviceStorage.hpp"
#include "../common/Log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace netsweep::storage
{
    namespace
    {
        const std::string kTag = "DB";

        bool IsPlainIdentifier(const std::string &name)
        {
            return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c)
                                                { return std::isalnum(c) || c == '_'; });
        }

        std::int64_t ToEpochMs(core::Clock::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        }

        core::Clock::time_point FromEpochMs(std::int64_t ms)
        {
            return core::Clock::time_point(std::chrono::duration_cast<core::Clock::duration>(std::chrono::milliseconds(ms)));
        }

        std::string ColumnText(sqlite3_stmt *stmt, int col)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
            return text ? std::string(text) : std::string();
        }
    }

    SqliteDeviceStorage::SqliteDeviceStorage(std::string devicesTable)
        : db_(nullptr), table_(std::move(devicesTable))
    {
        if (!IsPlainIdentifier(table_))
            throw std::invalid_argument("invalid device table name '" + table_ + "'");
    }

    SqliteDeviceStorage::~SqliteDeviceStorage()
    {
        Close();
    }

    bool SqliteDeviceStorage::Open(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            common::LogError(kTag, "Open failed: " + std::string(sqlite3_errmsg(db_)));
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        Exec("PRAGMA journal_mode=WAL;");
        sqlite3_busy_timeout(db_, 2000);

        std::string schema =
            "CREATE TABLE IF NOT EXISTS " + table_ + " ("
            "ip_address TEXT PRIMARY KEY NOT NULL, "
            "name TEXT NOT NULL, "
            "type TEXT NOT NULL DEFAULT 'Unknown', "
            "mac_address TEXT NOT NULL DEFAULT 'Unknown', "
            "is_online INTEGER NOT NULL DEFAULT 0, "
            "last_seen_ms INTEGER NOT NULL DEFAULT 0, "
            "response_time_ms INTEGER NOT NULL DEFAULT 0"
            ");"

            "CREATE TABLE IF NOT EXISTS app_settings ("
            "key TEXT PRIMARY KEY NOT NULL, "
            "value TEXT NOT NULL"
            ");";

        if (!Exec(schema.c_str()))
        {
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        common::LogDebug(kTag, "Opened " + db_path + " (" + table_ + ")");
        return true;
    }

    void SqliteDeviceStorage::Close()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool SqliteDeviceStorage::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            common::LogError(kTag, "SQL error: " + std::string(err_msg ? err_msg : "unknown"));
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    std::vector<core::Device> SqliteDeviceStorage::LoadDevices()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<core::Device> devices;
        if (!db_)
            return devices;

        std::string sql = "SELECT ip_address, name, type, mac_address, is_online, last_seen_ms, response_time_ms FROM " +
                          table_ + " ORDER BY ip_address;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            common::LogError(kTag, "Load failed: " + std::string(sqlite3_errmsg(db_)));
            return devices;
        }

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            core::Device d;
            d.address = ColumnText(stmt, 0);
            d.name = ColumnText(stmt, 1);
            d.type = ColumnText(stmt, 2);
            d.mac_address = ColumnText(stmt, 3);
            d.is_online = sqlite3_column_int(stmt, 4) != 0;
            d.last_seen = FromEpochMs(sqlite3_column_int64(stmt, 5));
            d.response_time = std::chrono::milliseconds(sqlite3_column_int64(stmt, 6));
            devices.push_back(d);
        }
        sqlite3_finalize(stmt);

        common::LogDebug(kTag, "Loaded " + std::to_string(devices.size()) + " devices from " + table_);
        return devices;
    }

    bool SqliteDeviceStorage::SaveDevices(const std::vector<core::Device> &devices)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        if (!Exec("BEGIN IMMEDIATE;"))
            return false;

        std::string clear = "DELETE FROM " + table_ + ";";
        if (!Exec(clear.c_str()))
        {
            Exec("ROLLBACK;");
            return false;
        }

        std::string sql = "INSERT OR REPLACE INTO " + table_ +
                          " (ip_address, name, type, mac_address, is_online, last_seen_ms, response_time_ms)"
                          " VALUES (?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            common::LogError(kTag, "Save failed: " + std::string(sqlite3_errmsg(db_)));
            Exec("ROLLBACK;");
            return false;
        }

        bool ok = true;
        for (const auto &d : devices)
        {
            if (d.address.empty())
                continue;

            sqlite3_bind_text(stmt, 1, d.address.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, d.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, d.type.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, d.mac_address.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 5, d.is_online ? 1 : 0);
            sqlite3_bind_int64(stmt, 6, ToEpochMs(d.last_seen));
            sqlite3_bind_int64(stmt, 7, d.response_time.count());

            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                common::LogError(kTag, "Insert failed for " + d.address + ": " + sqlite3_errmsg(db_));
                ok = false;
                break;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);

        if (!ok)
        {
            Exec("ROLLBACK;");
            return false;
        }
        return Exec("COMMIT;");
    }

    Settings SqliteDeviceStorage::LoadSettings()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        Settings settings;
        if (!db_)
            return settings;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT key, value FROM app_settings;", -1, &stmt, nullptr) != SQLITE_OK)
            return settings;

        while (sqlite3_step(stmt) == SQLITE_ROW)
            settings[ColumnText(stmt, 0)] = ColumnText(stmt, 1);
        sqlite3_finalize(stmt);
        return settings;
    }

    bool SqliteDeviceStorage::SaveSettings(const Settings &settings)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        if (!Exec("BEGIN IMMEDIATE;"))
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO app_settings (key, value) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK)
        {
            Exec("ROLLBACK;");
            return false;
        }

        bool ok = true;
        for (const auto &[key, value] : settings)
        {
            sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                ok = false;
                break;
            }
            sqlite3_reset(stmt);
        }
        sqlite3_finalize(stmt);

        if (!ok)
        {
            common::LogError(kTag, "Settings save failed: " + std::string(sqlite3_errmsg(db_)));
            Exec("ROLLBACK;");
            return false;
        }
        return Exec("COMMIT;");
    }
}
