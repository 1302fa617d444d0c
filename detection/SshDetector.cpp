#include "SshDetector.hpp"
#include "../common/Log.hpp"
#include "../net/TcpProbe.hpp"
#include <algorithm>
#include <cctype>

namespace netsweep::detection
{
    std::optional<std::string> ParseSshBanner(const std::string &banner)
    {
        std::string lower = banner;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower.find("ubuntu") != std::string::npos)
            return "Ubuntu Linux (SSH)";
        if (lower.find("debian") != std::string::npos)
            return "Debian Linux (SSH)";
        if (lower.find("raspbian") != std::string::npos)
            return "Raspberry Pi (SSH)";
        if (lower.find("openssh") != std::string::npos)
            return "Linux/Unix (SSH)";
        if (lower.find("ssh") != std::string::npos)
            return "Unknown (SSH)";
        return std::nullopt;
    }

    std::optional<std::string> SshDetector::Classify(const std::string &address)
    {
        net::TcpProbe probe;
        if (!probe.Connect(address, m_options.ssh_port, m_options.port_connection_timeout))
            return std::nullopt;

        std::string banner = probe.ReceiveSome(256);
        if (banner.empty())
            return std::nullopt;

        auto type = ParseSshBanner(banner);
        if (type)
            common::LogInfo("Detect", "Device type detected via SSH: " + *type);
        return type;
    }
}
