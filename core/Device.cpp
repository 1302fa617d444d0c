#include "Device.hpp"
#include "../common/Ipv4.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace netsweep::core
{
    std::string PlaceholderName(const std::string &address)
    {
        return "DEVICE_" + common::LastOctet(address);
    }

    bool IsKnownMac(const std::string &mac)
    {
        return !mac.empty() && mac != kUnknown;
    }

    std::string FormatTime(Clock::time_point tp)
    {
        std::time_t t = Clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&t, &local);
        std::ostringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
}
