#include "DeviceRegistry.hpp"
#include "../common/Ipv4.hpp"
#include <algorithm>

namespace netsweep::core
{
    std::vector<Device> DeviceRegistry::Snapshot() const
    {
        std::vector<Device> devices;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            devices.reserve(m_devices.size());
            for (const auto &pair : m_devices)
                devices.push_back(pair.second);
        }

        std::sort(devices.begin(), devices.end(), [](const Device &a, const Device &b)
                  {
            auto ka = common::Ipv4ToHostOrder(a.address);
            auto kb = common::Ipv4ToHostOrder(b.address);
            if (ka && kb)
                return *ka < *kb;
            if (ka != kb)
                return ka.has_value();
            return a.address < b.address; });
        return devices;
    }

    std::optional<Device> DeviceRegistry::FindByAddress(const std::string &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(address);
        if (it == m_devices.end())
            return std::nullopt;
        return it->second;
    }

    void DeviceRegistry::Merge(Device &existing, const Device &update)
    {
        existing.name = update.name;
        existing.type = update.type;
        existing.is_online = update.is_online;
        existing.response_time = update.is_online ? update.response_time : std::chrono::milliseconds(0);
        existing.last_seen = std::max(existing.last_seen, update.last_seen);

        // A transient lookup failure must not clobber a MAC we already know.
        if (IsKnownMac(update.mac_address))
            existing.mac_address = update.mac_address;
    }

    Device DeviceRegistry::Upsert(const Device &device)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(device.address);
        if (it == m_devices.end())
        {
            Device stored = device;
            if (!stored.is_online)
                stored.response_time = std::chrono::milliseconds(0);
            if (stored.mac_address.empty())
                stored.mac_address = kUnknown;
            if (stored.type.empty())
                stored.type = kUnknown;
            m_devices.emplace(stored.address, stored);
            return stored;
        }

        Merge(it->second, device);
        return it->second;
    }

    void DeviceRegistry::MarkAllOffline()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto &pair : m_devices)
        {
            pair.second.is_online = false;
            pair.second.response_time = std::chrono::milliseconds(0);
        }
    }

    std::optional<Device> DeviceRegistry::MarkOffline(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(address);
        if (it == m_devices.end())
            return std::nullopt;

        it->second.is_online = false;
        it->second.response_time = std::chrono::milliseconds(0);
        return it->second;
    }

    bool DeviceRegistry::Remove(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.erase(address) > 0;
    }

    void DeviceRegistry::Load(const std::vector<Device> &devices)
    {
        for (const auto &device : devices)
        {
            if (device.address.empty())
                continue;
            Upsert(device);
        }
    }

    void DeviceRegistry::Clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_devices.clear();
    }

    std::size_t DeviceRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    std::size_t DeviceRegistry::OnlineCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(std::count_if(m_devices.begin(), m_devices.end(),
                                                      [](const auto &pair)
                                                      { return pair.second.is_online; }));
    }
}
