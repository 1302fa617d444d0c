#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace netsweep::detection
{
    using PortDescriptions = std::vector<std::pair<int, std::string>>;

    // Ports probed by the port based detectors. Lists are probed in order.
    struct PortDetectionOptions
    {
        std::vector<int> custom_iot_ports{5000, 8000, 8080, 8443};
        std::vector<int> standard_http_ports{80, 443};

        PortDescriptions service_endpoints{
            {8974, "IoT Service Endpoint 3"},
            {8975, "IoT Service Endpoint 1"},
            {12050, "IoT Service Endpoint 2"}};

        PortDescriptions windows_service_ports{
            {3389, "Remote Desktop Protocol"},
            {5985, "WinRM HTTP"},
            {5986, "WinRM HTTPS"},
            {445, "SMB"},
            {139, "NetBIOS"},
            {135, "RPC"}};

        int ssh_port = 22;

        // HTTP ports spoken to over TLS.
        std::vector<int> tls_ports{443, 8443};

        std::chrono::milliseconds port_connection_timeout{1000};

        // How long an SSDP search listens for answers, and how long its result is reused.
        std::chrono::milliseconds ssdp_search_window{2000};
        std::chrono::milliseconds ssdp_cache_ttl{30000};
    };
}
