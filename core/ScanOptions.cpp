#include "ScanOptions.hpp"
#include <algorithm>
#include <utility>

namespace netsweep::core
{
    std::vector<std::string> NormalizeScanOptions(ScanOptions &options)
    {
        std::vector<std::string> fixes;

        if (options.max_concurrent_connections < 1)
        {
            fixes.push_back("max_concurrent_connections raised to 1");
            options.max_concurrent_connections = 1;
        }
        if (options.devices_before_throttle < 1)
        {
            fixes.push_back("devices_before_throttle raised to 1");
            options.devices_before_throttle = 1;
        }

        int start = std::clamp(options.start_octet, 1, 254);
        int end = std::clamp(options.end_octet, 1, 254);
        if (start != options.start_octet || end != options.end_octet)
            fixes.push_back("address range clamped to 1..254");
        if (start > end)
        {
            std::swap(start, end);
            fixes.push_back("start_octet and end_octet swapped");
        }
        options.start_octet = start;
        options.end_octet = end;

        if (options.scan_interval < std::chrono::milliseconds(1))
        {
            fixes.push_back("scan_interval raised to 1 minute");
            options.scan_interval = std::chrono::minutes(1);
        }
        if (options.ping_timeout < std::chrono::milliseconds(1))
        {
            fixes.push_back("ping_timeout reset to 2000 ms");
            options.ping_timeout = std::chrono::milliseconds(2000);
        }
        if (options.network_throttle_delay.count() < 0)
        {
            fixes.push_back("network_throttle_delay reset to 0");
            options.network_throttle_delay = std::chrono::milliseconds(0);
        }
        if (options.probe_settle_delay.count() < 0)
            options.probe_settle_delay = std::chrono::milliseconds(0);

        return fixes;
    }
}
