#pragma once

#include <mutex>
#include <sqlite3.h>
#include "DeviceStorage.hpp"

namespace netsweep::storage
{
    /*
     * Devices and settings in one SQLite file. Several stores may share a
     * file under different device table names (the agent keeps the scan
     * roster apart from the user's known devices).
     *
     * Failures are logged and reported through the return values; nothing
     * here throws once Open has been called.
     */
    class SqliteDeviceStorage : public DeviceStorage
    {
    public:
        explicit SqliteDeviceStorage(std::string devicesTable = "known_devices");
        ~SqliteDeviceStorage() override;

        SqliteDeviceStorage(const SqliteDeviceStorage &) = delete;
        SqliteDeviceStorage &operator=(const SqliteDeviceStorage &) = delete;

        // ":memory:" works for tests.
        bool Open(const std::string &db_path);
        void Close();
        bool IsOpen() const { return db_ != nullptr; }

        std::vector<core::Device> LoadDevices() override;
        bool SaveDevices(const std::vector<core::Device> &devices) override;

        Settings LoadSettings() override;
        bool SaveSettings(const Settings &settings) override;

    private:
        bool Exec(const char *sql);

        sqlite3 *db_;
        std::mutex db_mutex_;
        std::string table_;
    };
}
