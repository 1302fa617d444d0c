#pragma once

#include "DeviceTypeDetector.hpp"
#include "PortDetectionOptions.hpp"

namespace netsweep::detection
{
    // "Windows Server (Remote Desktop Protocol)" for RDP/WinRM,
    // "Windows Client (SMB)" for SMB, NetBIOS and RPC.
    std::string DescribeWindowsService(int port, const std::string &service);

    class WindowsServicesDetector : public DeviceTypeDetector
    {
    public:
        explicit WindowsServicesDetector(PortDetectionOptions options) : m_options(std::move(options)) {}

        int Priority() const override { return 30; }
        std::string Name() const override { return "WindowsServices"; }
        std::optional<std::string> Classify(const std::string &address) override;

    private:
        PortDetectionOptions m_options;
    };
}
