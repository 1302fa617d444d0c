#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "Device.hpp"

namespace netsweep::core
{
    // Sole owner of the roster. Every call takes the lock for its own
    // duration only; callers receive copies, never references.
    class DeviceRegistry
    {
    public:
        std::vector<Device> Snapshot() const;
        std::optional<Device> FindByAddress(const std::string &address) const;

        // Inserts, or merges into the existing entry. Returns the stored result.
        Device Upsert(const Device &device);

        void MarkAllOffline();
        std::optional<Device> MarkOffline(const std::string &address);

        bool Remove(const std::string &address);
        void Load(const std::vector<Device> &devices);
        void Clear();

        std::size_t Size() const;
        std::size_t OnlineCount() const;

    private:
        static void Merge(Device &existing, const Device &update);

        mutable std::mutex m_mutex;
        std::unordered_map<std::string, Device> m_devices;
    };
}
