#pragma once

#include "DeviceTypeDetector.hpp"
#include "PortDetectionOptions.hpp"

namespace netsweep::detection
{
    // Maps an SSH identification string to a distribution label.
    std::optional<std::string> ParseSshBanner(const std::string &banner);

    class SshDetector : public DeviceTypeDetector
    {
    public:
        explicit SshDetector(PortDetectionOptions options) : m_options(std::move(options)) {}

        int Priority() const override { return 40; }
        std::string Name() const override { return "SSH"; }
        std::optional<std::string> Classify(const std::string &address) override;

    private:
        PortDetectionOptions m_options;
    };
}
