#pragma once

#include <chrono>
#include <string>

namespace netsweep::core
{
    inline constexpr const char *kUnknown = "Unknown";

    using Clock = std::chrono::system_clock;

    struct Device
    {
        std::string address;
        std::string name;
        std::string type = kUnknown;
        std::string mac_address = kUnknown;
        bool is_online = false;
        Clock::time_point last_seen{};
        std::chrono::milliseconds response_time{0};
    };

    // "DEVICE_<lastOctet>", used when reverse lookup fails.
    std::string PlaceholderName(const std::string &address);

    bool IsKnownMac(const std::string &mac);

    // Local time, "YYYY-MM-DD HH:MM:SS".
    std::string FormatTime(Clock::time_point tp);
}
