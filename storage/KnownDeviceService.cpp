#include "KnownDeviceService.hpp"
#include "../common/Log.hpp"
#include <algorithm>
#include <stdexcept>

namespace netsweep::storage
{
    namespace
    {
        const std::string kTag = "Known";
    }

    KnownDeviceService::KnownDeviceService(std::shared_ptr<DeviceStorage> storage)
        : m_storage(std::move(storage))
    {
        if (!m_storage)
            throw std::invalid_argument("KnownDeviceService requires a storage backend");
    }

    void KnownDeviceService::EnsureLoadedLocked()
    {
        if (m_loaded)
            return;

        m_devices = m_storage->LoadDevices();

        auto settings = m_storage->LoadSettings();
        auto it = settings.find(kLastConnectedDeviceKey);
        if (it != settings.end())
            m_lastConnected = it->second;

        m_loaded = true;
        common::LogInfo(kTag, "Loaded " + std::to_string(m_devices.size()) + " persisted devices");
    }

    bool KnownDeviceService::SaveDevicesLocked()
    {
        bool ok = m_storage->SaveDevices(m_devices);
        if (!ok)
            common::LogWarn(kTag, "Failed to persist known devices");
        return ok;
    }

    bool KnownDeviceService::SaveLastConnectedLocked()
    {
        Settings settings;
        settings[kLastConnectedDeviceKey] = m_lastConnected;
        return m_storage->SaveSettings(settings);
    }

    std::vector<core::Device> KnownDeviceService::GetDevices()
    {
        status_changed.Emit("Loading saved devices...");

        std::vector<core::Device> copy;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            EnsureLoadedLocked();
            copy = m_devices;
        }

        status_changed.Emit("Loaded " + std::to_string(copy.size()) + " saved devices");
        return copy;
    }

    bool KnownDeviceService::AddDevice(const core::Device &device)
    {
        if (device.address.empty())
        {
            common::LogWarn(kTag, "Cannot add a device without an address");
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            EnsureLoadedLocked();

            auto it = std::find_if(m_devices.begin(), m_devices.end(),
                                   [&](const core::Device &d) { return d.address == device.address; });
            if (it != m_devices.end())
            {
                common::LogWarn(kTag, "Device with IP " + device.address + " already exists in known devices");
                return false;
            }

            m_devices.push_back(device);
            SaveDevicesLocked();
        }

        device_added.Emit(device);
        status_changed.Emit("Device " + device.name + " added to known devices");
        return true;
    }

    bool KnownDeviceService::RemoveDevice(const std::string &address)
    {
        core::Device removed;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            EnsureLoadedLocked();

            auto it = std::find_if(m_devices.begin(), m_devices.end(),
                                   [&](const core::Device &d) { return d.address == address; });
            if (it == m_devices.end())
            {
                common::LogWarn(kTag, "Device with IP " + address + " not found in known devices");
                return false;
            }

            removed = *it;
            m_devices.erase(it);

            if (m_lastConnected == address)
            {
                m_lastConnected.clear();
                SaveLastConnectedLocked();
            }
            SaveDevicesLocked();
        }

        device_removed.Emit(removed);
        status_changed.Emit("Device " + removed.name + " removed from known devices");
        return true;
    }

    bool KnownDeviceService::UpdateDevice(const core::Device &device)
    {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            EnsureLoadedLocked();

            auto it = std::find_if(m_devices.begin(), m_devices.end(),
                                   [&](const core::Device &d) { return d.address == device.address; });
            if (it == m_devices.end())
            {
                common::LogWarn(kTag, "Device with IP " + device.address + " not found for update");
                return false;
            }

            *it = device;
            name = it->name;
            common::LogDebug(kTag, "Updated device in known devices: " + name + " (" + device.address + ")");
            SaveDevicesLocked();
        }

        status_changed.Emit("Device " + name + " updated");
        return true;
    }

    std::optional<core::Device> KnownDeviceService::GetDeviceByIp(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        EnsureLoadedLocked();

        for (const auto &d : m_devices)
        {
            if (d.address == address)
                return d;
        }
        return std::nullopt;
    }

    std::vector<std::string> KnownDeviceService::GetKnownDeviceIps()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        EnsureLoadedLocked();

        std::vector<std::string> ips;
        ips.reserve(m_devices.size());
        for (const auto &d : m_devices)
            ips.push_back(d.address);
        return ips;
    }

    bool KnownDeviceService::SetLastConnectedDevice(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        EnsureLoadedLocked();

        m_lastConnected = address;
        common::LogDebug(kTag, "Set last connected device to " + address);
        return SaveLastConnectedLocked();
    }

    std::string KnownDeviceService::GetLastConnectedDevice()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        EnsureLoadedLocked();
        return m_lastConnected;
    }
}
