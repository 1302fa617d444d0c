#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netsweep::core
{
    struct ScanOptions
    {
        std::chrono::milliseconds scan_interval{std::chrono::minutes(5)};
        int max_concurrent_connections = 20;
        std::chrono::milliseconds ping_timeout{2000};
        int start_octet = 1;
        int end_octet = 254;
        std::chrono::milliseconds network_throttle_delay{50};
        int devices_before_throttle = 10;
        bool enable_continuous_scanning = true;

        // Pause between a successful ping and the neighbour-table lookup so
        // the kernel has a chance to record the host's MAC.
        std::chrono::milliseconds probe_settle_delay{25};
    };

    // Clamps out-of-range values in place; returns one line per correction.
    std::vector<std::string> NormalizeScanOptions(ScanOptions &options);
}
