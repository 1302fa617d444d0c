#include "WindowsServicesDetector.hpp"
#include "../common/Log.hpp"
#include "../net/TcpProbe.hpp"

namespace netsweep::detection
{
    std::string DescribeWindowsService(int port, const std::string &service)
    {
        bool likelyServer = (port == 3389 || port == 5985 || port == 5986);
        return std::string(likelyServer ? "Windows Server (" : "Windows Client (") + service + ")";
    }

    std::optional<std::string> WindowsServicesDetector::Classify(const std::string &address)
    {
        for (const auto &[port, service] : m_options.windows_service_ports)
        {
            if (!net::IsPortOpen(address, port, m_options.port_connection_timeout))
                continue;

            std::string type = DescribeWindowsService(port, service);
            common::LogInfo("Detect", "Device type detected via Windows services: " + type);
            return type;
        }
        return std::nullopt;
    }
}
