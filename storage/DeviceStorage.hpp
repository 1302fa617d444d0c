#pragma once

#include <map>
#include <string>
#include <vector>
#include "../core/Device.hpp"

namespace netsweep::storage
{
    using Settings = std::map<std::string, std::string>;

    class DeviceStorage
    {
    public:
        virtual ~DeviceStorage() = default;

        // Empty on a missing or unreadable store.
        virtual std::vector<core::Device> LoadDevices() = 0;
        // Replaces the stored set.
        virtual bool SaveDevices(const std::vector<core::Device> &devices) = 0;

        virtual Settings LoadSettings() = 0;
        // Writes the given keys; keys not mentioned keep their stored value.
        virtual bool SaveSettings(const Settings &settings) = 0;
    };
}
