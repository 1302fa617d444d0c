#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include "DeviceStorage.hpp"
#include "../common/EventChannel.hpp"

namespace netsweep::storage
{
    inline constexpr const char *kLastConnectedDeviceKey = "LastConnectedDeviceIp";

    /*
     * The user's own list of devices worth remembering, keyed by IPv4 address
     * and persisted on every change. Loaded from storage on first use.
     */
    class KnownDeviceService
    {
    public:
        explicit KnownDeviceService(std::shared_ptr<DeviceStorage> storage);

        std::vector<core::Device> GetDevices();
        bool AddDevice(const core::Device &device);
        bool RemoveDevice(const std::string &address);
        bool UpdateDevice(const core::Device &device);
        std::optional<core::Device> GetDeviceByIp(const std::string &address);
        std::vector<std::string> GetKnownDeviceIps();

        bool SetLastConnectedDevice(const std::string &address);
        std::string GetLastConnectedDevice();

        common::EventChannel<std::string> status_changed;
        common::EventChannel<core::Device> device_added;
        common::EventChannel<core::Device> device_removed;

    private:
        void EnsureLoadedLocked();
        bool SaveDevicesLocked();
        bool SaveLastConnectedLocked();

        std::shared_ptr<DeviceStorage> m_storage;

        std::mutex m_mutex;
        std::vector<core::Device> m_devices;
        std::string m_lastConnected;
        bool m_loaded = false;
    };
}
