#include "ServiceEndpointDetector.hpp"
#include "../common/Log.hpp"
#include "../net/TcpProbe.hpp"

namespace netsweep::detection
{
    std::optional<std::string> ServiceEndpointDetector::Classify(const std::string &address)
    {
        for (const auto &[port, description] : m_options.service_endpoints)
        {
            if (net::IsPortOpen(address, port, m_options.port_connection_timeout))
            {
                common::LogInfo("Detect", "Service endpoint detected on " + address + ":" + std::to_string(port) + " - " + description);
                return description;
            }
        }
        return std::nullopt;
    }
}
